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

#ifndef RESERVATION_TRACKER_H
#define RESERVATION_TRACKER_H

/// \file
/// \brief Load-reserved/store-conditional reservation state.

#include <cstdint>
#include <optional>

namespace amoemu {

/// \brief Tracks the address reserved by the last emulated load-reserved
/// \details State machine Empty -> Reserved(address) -> Empty. Starts Empty.
class reservation_tracker {
public:
    /// \brief Records a reservation, replacing any previous one
    /// \param paddr Address read by the load-reserved
    void reserve(uint64_t paddr) noexcept;

    /// \brief Consumes the reservation on behalf of a store-conditional
    /// \param paddr Address written by the store-conditional
    /// \returns True if there was a reservation for exactly \p paddr
    /// \details The tracker is Empty afterwards, whether or not the addresses matched.
    bool consume(uint64_t paddr) noexcept;

    /// \brief Drops any reservation
    void invalidate() noexcept;

    bool is_reserved() const noexcept {
        return m_paddr.has_value();
    }

    /// \brief Returns the reserved address, if any
    std::optional<uint64_t> get_reserved_address() const noexcept {
        return m_paddr;
    }

private:
    std::optional<uint64_t> m_paddr;
};

} // namespace amoemu

#endif
