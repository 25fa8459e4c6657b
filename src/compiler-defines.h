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

#ifndef COMPILER_DEFINES_H
#define COMPILER_DEFINES_H

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#ifndef CODE_COVERAGE
#define FORCE_INLINE __attribute__((always_inline)) inline
#else
#define FORCE_INLINE inline
#endif

#define likely(x) __builtin_expect((x), 1)
#define unlikely(x) __builtin_expect((x), 0)

#if defined(__riscv)
#define AMOEMU_TARGET_RISCV 1
#if __riscv_xlen == 64
#define AMOEMU_NATIVE_XLEN 64
#else
#define AMOEMU_NATIVE_XLEN 32
#endif
#elif defined(__LP64__) || defined(_LP64)
#define AMOEMU_NATIVE_XLEN 64
#else
#define AMOEMU_NATIVE_XLEN 32
#endif

// NOLINTEND(cppcoreguidelines-macro-usage)

#endif
