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

#ifndef DIRECT_MEMORY_ACCESS_H
#define DIRECT_MEMORY_ACCESS_H

/// \file
/// \brief Memory access through the address space of the running program.

#include <cstdint>
#include <cstring>

#include "i-memory-access.h"

namespace amoemu {

/// \brief Accesses program memory directly through pointers
/// \details Addresses held in the saved registers are addresses of the running program,
/// so this is the accessor used by the trap entry point. Words are copied with memcpy, which keeps
/// accesses free of strict aliasing issues and tolerates instruction parcels that are only 2-byte aligned.
class direct_memory_access : public i_memory_access<direct_memory_access> {
    // Allow interface to access private methods
    friend i_memory_access<direct_memory_access>;

    static void *cast_addr_to_ptr(uint64_t paddr) {
        // NOLINTNEXTLINE(performance-no-int-to-ptr,cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<void *>(static_cast<uintptr_t>(paddr));
    }

    template <MemoryWord T>
    T do_read_memory(uint64_t paddr) const {
        T val{};
        memcpy(&val, cast_addr_to_ptr(paddr), sizeof(T));
        return val;
    }

    template <MemoryWord T>
    void do_write_memory(uint64_t paddr, T val) {
        memcpy(cast_addr_to_ptr(paddr), &val, sizeof(T));
    }
};

} // namespace amoemu

#endif
