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

#ifndef I_MEMORY_ACCESS_H
#define I_MEMORY_ACCESS_H

/// \file
/// \brief Memory access interface.

#include <cstdint>

#include "meta.h"

namespace amoemu {

/// \class i_memory_access
/// \brief Interface for program memory access.
/// \tparam DERIVED Derived class implementing the interface. (An example of CRTP.)
/// \details The fetcher and the emulator only touch program memory through this interface.
/// Accesses are plain, non-atomic loads and stores of naturally sized words.
/// Implementations must never be reentered from within an access.
template <typename DERIVED>
class i_memory_access { // CRTP
    i_memory_access() = default;
    friend DERIVED;

    /// \brief Returns object cast as the derived class
    DERIVED &derived() {
        return *static_cast<DERIVED *>(this);
    }

    /// \brief Returns object cast as the derived class
    const DERIVED &derived() const {
        return *static_cast<const DERIVED *>(this);
    }

public:
    /// \brief Reads a word from memory.
    /// \tparam T Type of word to read.
    /// \param paddr Address of the word.
    /// \returns Word value.
    template <MemoryWord T>
    T read_memory(uint64_t paddr) const {
        return derived().template do_read_memory<T>(paddr);
    }

    /// \brief Writes a word to memory.
    /// \tparam T Type of word to write.
    /// \param paddr Address of the word.
    /// \param val Value to write.
    template <MemoryWord T>
    void write_memory(uint64_t paddr, T val) {
        derived().template do_write_memory<T>(paddr, val);
    }
};

} // namespace amoemu

#endif
