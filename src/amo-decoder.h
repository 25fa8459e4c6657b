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

#ifndef AMO_DECODER_H
#define AMO_DECODER_H

/// \file
/// \brief Atomic extension instruction decoder.

#include <cstdint>

#include "decoded-operation.h"
#include "riscv-constants.h"

namespace amoemu {

/// \brief Obtains the opcode field from an instruction.
/// \param insn Instruction.
static inline uint32_t insn_get_opcode(uint32_t insn) {
    return insn & INSN_OPCODE_MASK;
}

/// \brief Obtains the RD field from an instruction.
/// \param insn Instruction.
static inline uint32_t insn_get_rd(uint32_t insn) {
    return (insn >> 7) & INSN_REG_MASK;
}

/// \brief Obtains the funct3 field from an instruction.
/// \param insn Instruction.
static inline uint32_t insn_get_funct3(uint32_t insn) {
    return (insn >> 12) & 0b111;
}

/// \brief Obtains the RS1 field from an instruction.
/// \param insn Instruction.
static inline uint32_t insn_get_rs1(uint32_t insn) {
    return (insn >> 15) & INSN_REG_MASK;
}

/// \brief Obtains the RS2 field from an instruction.
/// \param insn Instruction.
static inline uint32_t insn_get_rs2(uint32_t insn) {
    return (insn >> 20) & INSN_REG_MASK;
}

/// \brief Obtains the 5 most significant bits of the funct7 field from an instruction.
/// \param insn Instruction.
static inline uint32_t insn_get_funct7_sr2(uint32_t insn) {
    return insn >> 27;
}

/// \brief Decodes an instruction word.
/// \param insn Instruction word, with the upper 16 bits zero for compressed instructions.
/// \param xlen Register width of the hart (32 or 64). The .d forms are only recognized when it is 64.
/// \returns The decoded operation, or unsupported_operation for anything outside the atomic extension.
/// \details Never fails and never touches memory.
decoded_operation decode_insn(uint32_t insn, int xlen);

/// \brief Returns the assembler mnemonic of a decoded operation (e.g., "amoadd.w")
const char *get_operation_name(const decoded_operation &op);

} // namespace amoemu

#endif
