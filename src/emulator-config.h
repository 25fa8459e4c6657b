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

#ifndef EMULATOR_CONFIG_H
#define EMULATOR_CONFIG_H

#include <cstdint>

#include "compiler-defines.h"

namespace amoemu {

/// \brief Atomic extension emulator configuration
struct emulator_config {
    int xlen{AMOEMU_NATIVE_XLEN};  ///< Register width of the hart, 32 or 64
    bool emulate_misaligned{};     ///< Emulate accesses that are not naturally aligned instead of forwarding them
    bool use_mtval_insn{};         ///< Take the faulting instruction from mtval when it is non-zero

    /// \brief Mask that truncates a value to xlen bits
    uint64_t get_xlen_mask() const {
        return xlen == 32 ? UINT64_C(0xffffffff) : ~UINT64_C(0);
    }
};

/// \brief Returns the default configuration for the current target
emulator_config get_default_emulator_config();

/// \brief Checks a configuration
/// \details Throws std::invalid_argument describing the first problem found.
void validate_emulator_config(const emulator_config &c);

} // namespace amoemu

#endif
