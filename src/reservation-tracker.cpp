// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: LGPL-3.0-or-later
//
// This program is free software: you can redistribute it and/or modify it under
// the terms of the GNU Lesser General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT ANY
// WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
// PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License along
// with this program (see COPYING). If not, see <https://www.gnu.org/licenses/>.
//

#include "reservation-tracker.h"

namespace amoemu {

void reservation_tracker::reserve(uint64_t paddr) noexcept {
    m_paddr = paddr;
}

bool reservation_tracker::consume(uint64_t paddr) noexcept {
    const bool matched = m_paddr.has_value() && *m_paddr == paddr;
    m_paddr.reset(); // Must clear reservation, regardless of failure
    return matched;
}

void reservation_tracker::invalidate() noexcept {
    m_paddr.reset();
}

} // namespace amoemu
