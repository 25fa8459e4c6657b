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

#ifndef INSTRUCTION_FETCHER_H
#define INSTRUCTION_FETCHER_H

/// \file
/// \brief Reads the faulting instruction from program memory.

#include <cstdint>

#include "compiler-defines.h"
#include "i-memory-access.h"
#include "riscv-constants.h"

namespace amoemu {

/// \brief Returns true if the first parcel of an instruction belongs to a 32-bit encoding
static inline bool insn_is_uncompressed(uint16_t parcel) {
    return (parcel & INSN_LENGTH_MASK) == INSN_LENGTH_MASK;
}

/// \brief Loads the instruction at pc.
/// \tparam MEMORY Class of memory accessor object.
/// \param m Memory accessor object.
/// \param pc Address of the instruction. Only 2-byte alignment is assumed.
/// \returns The instruction word. For compressed instructions, only the low 16 bits are set.
/// \details The instruction is read one 16-bit parcel at a time. The second parcel is only read for
/// 32-bit encodings, so a compressed instruction sitting in the last 2 bytes of a memory region
/// never causes an access past its end.
template <typename MEMORY>
static FORCE_INLINE uint32_t fetch_insn(const i_memory_access<MEMORY> &m, uint64_t pc) {
    const auto lo = m.template read_memory<uint16_t>(pc);
    if (unlikely(!insn_is_uncompressed(lo))) {
        return lo;
    }
    const auto hi = m.template read_memory<uint16_t>(pc + INSN_COMPRESSED_LENGTH);
    return static_cast<uint32_t>(lo) | (static_cast<uint32_t>(hi) << 16);
}

} // namespace amoemu

#endif
