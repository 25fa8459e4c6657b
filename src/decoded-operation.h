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

#ifndef DECODED_OPERATION_H
#define DECODED_OPERATION_H

/// \file
/// \brief Result of decoding an instruction word.

#include <cstdint>
#include <variant>

namespace amoemu {

/// \brief Width of the memory access performed by an atomic instruction
enum class access_width : uint8_t {
    word = 4,       ///< .w forms, 32 bits
    doubleword = 8, ///< .d forms, 64 bits (RV64 only)
};

/// \brief Read-modify-write performed by an atomic memory operation
enum class amo_kind : uint8_t { swap, add, xor_, and_, or_, min, max, minu, maxu };

/// \brief lr.w / lr.d
struct load_reserved {
    access_width width{access_width::word};
    uint32_t rd{};
    uint32_t rs1{};
    bool aq{};
    bool rl{};

    bool operator==(const load_reserved &) const = default;
};

/// \brief sc.w / sc.d
struct store_conditional {
    access_width width{access_width::word};
    uint32_t rd{};
    uint32_t rs1{};
    uint32_t rs2{};
    bool aq{};
    bool rl{};

    bool operator==(const store_conditional &) const = default;
};

/// \brief amo<kind>.w / amo<kind>.d
struct amo_operation {
    amo_kind kind{amo_kind::swap};
    access_width width{access_width::word};
    uint32_t rd{};
    uint32_t rs1{};
    uint32_t rs2{};
    bool aq{};
    bool rl{};

    bool operator==(const amo_operation &) const = default;
};

/// \brief Anything that is not an atomic instruction this hart can emulate
struct unsupported_operation {
    uint32_t insn{};

    bool operator==(const unsupported_operation &) const = default;
};

using decoded_operation = std::variant<unsupported_operation, load_reserved, store_conditional, amo_operation>;

/// \brief Returns true if the decoded operation can be emulated
static inline bool is_supported(const decoded_operation &op) {
    return !std::holds_alternative<unsupported_operation>(op);
}

} // namespace amoemu

#endif
