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

#include "emulator-config.h"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "riscv-constants.h"

namespace amoemu {

emulator_config get_default_emulator_config() {
    return emulator_config{};
}

void validate_emulator_config(const emulator_config &c) {
    if (c.xlen != XLEN && c.xlen != XLEN_32) {
        throw std::invalid_argument{"xlen must be 32 or 64 (got " + std::to_string(c.xlen) + ")"};
    }
    // Addresses in registers are dereferenced directly, so they must fit in a pointer
    if (c.xlen > static_cast<int>(sizeof(uintptr_t) * 8)) {
        throw std::invalid_argument{"xlen " + std::to_string(c.xlen) + " is wider than a pointer on this target"};
    }
}

} // namespace amoemu
