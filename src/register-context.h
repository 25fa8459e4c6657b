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

#ifndef REGISTER_CONTEXT_H
#define REGISTER_CONTEXT_H

#include <array>
#include <cstdint>

#include "riscv-constants.h"

/// \file
/// \brief Saved hart state handed to the trap handler

namespace amoemu {

/// \brief Registers saved by the runtime when the trap was taken
/// \details The trap handler has exclusive access to this structure for the duration of one trap
/// and keeps no reference to it afterwards. On RV32 harts, each slot holds the 32-bit register value
/// zero-extended to 64 bits.
struct register_context {
    std::array<uint64_t, X_REG_COUNT> x{}; ///< General-purpose registers
    uint64_t pc{};                         ///< Program counter of the faulting instruction
    uint64_t mcause{};                     ///< Trap cause
    uint64_t mstatus{};                    ///< Status at trap time
    uint64_t mtval{};                      ///< Trap value (faulting instruction bits on some cores)

    /// \brief Reads from general-purpose register.
    /// \param i Register index.
    /// \returns Register value, always 0 for x0.
    uint64_t read_x(uint32_t i) const {
        if (i == 0) {
            return 0;
        }
        return x[i];
    }

    /// \brief Writes to general-purpose register.
    /// \param i Register index.
    /// \param val New register value.
    /// \details Writes to x0 are discarded.
    void write_x(uint32_t i, uint64_t val) {
        if (i != 0) {
            x[i] = val;
        }
    }

    bool operator==(const register_context &other) const = default;
};

} // namespace amoemu

#endif
