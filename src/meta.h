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

#ifndef META_H
#define META_H

#include <cstdint>
#include <type_traits>

/// \file
/// \brief Metaprogramming helpers shared by the emulator

namespace amoemu {

/// \brief Builds a visitor out of a set of lambdas
template <class... Ts>
struct overloads : Ts... {
    using Ts::operator()...;
};

/// \brief Integral types that fit in a register and can be accessed in memory by an AMO
template <typename T>
concept AmoWord = std::is_integral_v<T> && (sizeof(T) == sizeof(uint32_t) || sizeof(T) == sizeof(uint64_t));

/// \brief Integral types a memory accessor can read or write
template <typename T>
concept MemoryWord = std::is_integral_v<T> && (sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

} // namespace amoemu

#endif
