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

#ifndef MSTATUS_INTERRUPT_CONTROL_H
#define MSTATUS_INTERRUPT_CONTROL_H

/// \file
/// \brief Interrupt control through the machine-mode status register of a RISC-V hart.

#ifndef __riscv
#error "mstatus-interrupt-control.h can only be used when targeting RISC-V"
#endif

#include <cstdint>

#include "i-interrupt-control.h"
#include "riscv-constants.h"

namespace amoemu {

class mstatus_interrupt_control;

template <>
struct i_interrupt_control_saved_state<mstatus_interrupt_control> {
    using type = unsigned long; ///< Value of mstatus before MIE was cleared
};

/// \brief Masks machine-mode interrupts by clearing mstatus.MIE
class mstatus_interrupt_control : public i_interrupt_control<mstatus_interrupt_control> {
    // Allow interface to access private methods
    friend i_interrupt_control<mstatus_interrupt_control>;

    static unsigned long do_disable_interrupts() {
        unsigned long prev = 0;
        // NOLINTNEXTLINE(hicpp-no-assembler)
        asm volatile("csrrci %0, mstatus, %1" : "=r"(prev) : "i"(MSTATUS_MIE_MASK) : "memory");
        return prev;
    }

    static void do_restore_interrupts(unsigned long prev) noexcept {
        if ((prev & MSTATUS_MIE_MASK) != 0) {
            // NOLINTNEXTLINE(hicpp-no-assembler)
            asm volatile("csrsi mstatus, %0" : : "i"(MSTATUS_MIE_MASK) : "memory");
        }
    }
};

} // namespace amoemu

#endif
