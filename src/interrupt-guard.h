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

#ifndef INTERRUPT_GUARD_H
#define INTERRUPT_GUARD_H

/// \file
/// \brief Critical section that keeps interrupts masked while in scope.

#include "i-interrupt-control.h"

namespace amoemu {

/// \brief Masks interrupts on construction and restores the previous state when the scope is exited
/// \details The previous state is restored on every exit path, including exceptions propagating out
/// of the guarded code. This is the only atomicity mechanism of the emulator: it keeps other trap
/// handlers on the same hart from observing a read-modify-write half done. It does nothing against
/// other harts accessing the same memory.
template <typename INTERRUPT_CONTROL>
class interrupt_guard {
public:
    explicit interrupt_guard(i_interrupt_control<INTERRUPT_CONTROL> &ic) :
        m_ic(ic),
        m_saved(ic.disable_interrupts()) {}

    /// \brief Restores the interrupt state in effect when the guard was created
    ~interrupt_guard() {
        m_ic.restore_interrupts(m_saved);
    }

    interrupt_guard(const interrupt_guard &) = delete;
    interrupt_guard &operator=(const interrupt_guard &) = delete;
    interrupt_guard(interrupt_guard &&) = delete;
    interrupt_guard &operator=(interrupt_guard &&) = delete;

private:
    i_interrupt_control<INTERRUPT_CONTROL> &m_ic; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    typename i_interrupt_control<INTERRUPT_CONTROL>::saved_state m_saved;
};

} // namespace amoemu

#endif
