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

#ifndef PLATFORM_INTERRUPT_CONTROL_H
#define PLATFORM_INTERRUPT_CONTROL_H

/// \file
/// \brief Selects the interrupt controller used by the trap entry point.

#include "compiler-defines.h"

#if defined(AMOEMU_TARGET_RISCV) && !defined(AMOEMU_HOSTED)
#include "mstatus-interrupt-control.h"
#else
#include "signal-interrupt-control.h"
#endif

namespace amoemu {

#if defined(AMOEMU_TARGET_RISCV) && !defined(AMOEMU_HOSTED)
using platform_interrupt_control = mstatus_interrupt_control;
#else
using platform_interrupt_control = signal_interrupt_control;
#endif

} // namespace amoemu

#endif
