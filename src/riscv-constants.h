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

#ifndef RISCV_CONSTANTS_H
#define RISCV_CONSTANTS_H

#include <cstdint>

/// \file
/// \brief RISC-V constants used by the atomic extension emulator

namespace amoemu {

enum RISCV_constants {
    XLEN = 64,    ///< Maximum XLEN
    XLEN_32 = 32, ///< XLEN of RV32 harts
};

enum REG_COUNT { X_REG_COUNT = 32 };

enum MCAUSE_constants : uint64_t {
    MCAUSE_INSN_ADDRESS_MISALIGNED = 0x0,      ///< Instruction address misaligned
    MCAUSE_INSN_ACCESS_FAULT = 0x1,            ///< Instruction access fault
    MCAUSE_ILLEGAL_INSN = 0x2,                 ///< Illegal instruction
    MCAUSE_BREAKPOINT = 0x3,                   ///< Breakpoint
    MCAUSE_LOAD_ADDRESS_MISALIGNED = 0x4,      ///< Load address misaligned
    MCAUSE_LOAD_ACCESS_FAULT = 0x5,            ///< Load access fault
    MCAUSE_STORE_AMO_ADDRESS_MISALIGNED = 0x6, ///< Store/AMO address misaligned
    MCAUSE_STORE_AMO_ACCESS_FAULT = 0x7,       ///< Store/AMO access fault
    MCAUSE_USER_ECALL = 0x8,                   ///< Environment call from U-mode
    MCAUSE_SUPERVISOR_ECALL = 0x9,             ///< Environment call from S-mode
    MCAUSE_MACHINE_ECALL = 0xb,                ///< Environment call from M-mode
    MCAUSE_FETCH_PAGE_FAULT = 0xc,             ///< Instruction page fault
    MCAUSE_LOAD_PAGE_FAULT = 0xd,              ///< Load page fault
    MCAUSE_STORE_AMO_PAGE_FAULT = 0xf,         ///< Store/AMO page fault

    MCAUSE_INTERRUPT_FLAG = UINT64_C(1) << (XLEN - 1) ///< Interrupt flag (RV64 position)
};

enum MSTATUS_shifts {
    MSTATUS_MIE_SHIFT = 3,
};

enum MSTATUS_masks : uint64_t {
    MSTATUS_MIE_MASK = UINT64_C(1) << MSTATUS_MIE_SHIFT,
};

/// \brief Instruction field masks and lengths
enum insn_constants : uint32_t {
    INSN_OPCODE_MASK = 0b1111111,
    INSN_REG_MASK = 0b11111,
    INSN_LENGTH_MASK = 0b11, ///< Low bits of the first parcel are 0b11 for 32-bit instructions
    INSN_COMPRESSED_LENGTH = 2,
    INSN_LENGTH = 4,
};

/// \brief Major opcode of the atomic extension
enum insn_opcode : uint32_t { AMO = 0b0101111 };

/// \brief funct3 of atomic instructions selects the access width
enum insn_AMO_funct3 : uint32_t { AMO_W = 0b010, AMO_D = 0b011 };

/// \brief The result of insn >> 27 (5 most significant bits of funct7) can be
/// used to identify the atomic operation
enum insn_AMO_funct7_sr2 : uint32_t {
    AMOADD = 0b00000,
    AMOSWAP = 0b00001,
    LR = 0b00010,
    SC = 0b00011,
    AMOXOR = 0b00100,
    AMOOR = 0b01000,
    AMOAND = 0b01100,
    AMOMIN = 0b10000,
    AMOMAX = 0b10100,
    AMOMINU = 0b11000,
    AMOMAXU = 0b11100
};

/// \brief Shifts of the ordering bits of atomic instructions
enum insn_AMO_shifts : uint32_t { AMO_RL_SHIFT = 25, AMO_AQ_SHIFT = 26 };

/// \brief Value written to rd by a store-conditional that failed
enum SC_constants : uint64_t { SC_SUCCESS = 0, SC_FAILURE = 1 };

} // namespace amoemu

#endif
