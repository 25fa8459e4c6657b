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

#ifndef I_INTERRUPT_CONTROL_H
#define I_INTERRUPT_CONTROL_H

/// \file
/// \brief Interrupt control interface.

namespace amoemu {

/// \brief Type an interrupt controller uses to remember the state it must restore
/// \details Must be specialized for each class deriving from i_interrupt_control.
template <typename INTERRUPT_CONTROL>
struct i_interrupt_control_saved_state {};
template <typename INTERRUPT_CONTROL>
using i_interrupt_control_saved_state_t = typename i_interrupt_control_saved_state<INTERRUPT_CONTROL>::type;

/// \class i_interrupt_control
/// \brief Interface for masking and unmasking interrupts on the current hart.
/// \tparam DERIVED Derived class implementing the interface. (An example of CRTP.)
template <typename DERIVED>
class i_interrupt_control { // CRTP
    i_interrupt_control() = default;
    friend DERIVED;

    /// \brief Returns object cast as the derived class
    DERIVED &derived() {
        return *static_cast<DERIVED *>(this);
    }

public:
    using saved_state = i_interrupt_control_saved_state_t<DERIVED>;

    /// \brief Masks all maskable interrupts.
    /// \returns State that must later be passed to restore_interrupts().
    /// \details May throw if the platform refuses, in which case interrupts are unchanged.
    saved_state disable_interrupts() {
        return derived().do_disable_interrupts();
    }

    /// \brief Puts back the interrupt state saved by disable_interrupts().
    /// \param state State returned by the matching disable_interrupts() call.
    void restore_interrupts(const saved_state &state) noexcept {
        derived().do_restore_interrupts(state);
    }
};

} // namespace amoemu

#endif
