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

#ifndef AMOEMU_C_API_H // NOLINTBEGIN
#define AMOEMU_C_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// -----------------------------------------------------------------------------
// API definitions
// -----------------------------------------------------------------------------

#ifndef AMOEMU_API
#define AMOEMU_API __attribute__((visibility("default")))
#endif

/// \brief Register-sized integer of the running program.
typedef uintptr_t amoemu_reg;

/// \brief Error codes returned by the setup functions of the C API.
typedef enum amoemu_error {
    AMOEMU_ERROR_OK = 0,
    AMOEMU_ERROR_INVALID_ARGUMENT = -1,
    AMOEMU_ERROR_DOMAIN_ERROR = -2,
    AMOEMU_ERROR_LOGIC_ERROR = -3,
    AMOEMU_ERROR_SYSTEM_ERROR = -4,
    AMOEMU_ERROR_RUNTIME_ERROR = -5,
    AMOEMU_ERROR_BAD_ALLOC = -6,
    AMOEMU_ERROR_EXCEPTION = -7,
    AMOEMU_ERROR_UNKNOWN = -8,
} amoemu_error;

/// \brief What happened to a trap given to amoemu_handle_trap().
typedef enum amoemu_outcome {
    AMOEMU_OUTCOME_RESUMED,   ///< Atomic instruction emulated, frame pc advanced past it
    AMOEMU_OUTCOME_FORWARDED, ///< Not claimed, the registered exception handler was called
    AMOEMU_OUTCOME_UNHANDLED, ///< Not claimed and there is no handler to call
} amoemu_outcome;

/// \brief Registers saved by the trap vector.
/// \details The layout is fixed so assembly trap vectors can fill it directly.
typedef struct amoemu_trap_frame {
    amoemu_reg x[32];   ///< General-purpose registers (x[0] is ignored and never written)
    amoemu_reg pc;      ///< Address of the faulting instruction (mepc)
    amoemu_reg mcause;  ///< Trap cause
    amoemu_reg mstatus; ///< Status at trap time
    amoemu_reg mtval;   ///< Trap value
} amoemu_trap_frame;

/// \brief Emulator configuration.
typedef struct amoemu_config {
    int32_t xlen;            ///< Register width of the hart, 32 or 64
    bool emulate_misaligned; ///< Emulate misaligned accesses instead of forwarding them
    bool use_mtval_insn;     ///< Take the faulting instruction from mtval when it is non-zero
} amoemu_config;

/// \brief Handler receiving the traps the emulator does not claim.
/// \param mcause Trap cause.
/// \param frame Saved registers, unmodified.
/// \param context Pointer given to amoemu_init().
typedef void (*amoemu_exception_handler)(amoemu_reg mcause, amoemu_trap_frame *frame, void *context);

// -----------------------------------------------------------------------------
// API functions
// -----------------------------------------------------------------------------

/// \brief Returns the error message set by the last failed setup function.
/// \returns A C string, empty if the last call succeeded.
/// \details The string is stored in thread-local storage and remains valid until the next call.
AMOEMU_API const char *amoemu_get_last_error_message(void);

/// \brief Obtains the default configuration for the current target.
/// \param config Receives the configuration.
/// \returns 0 for success, non zero code for error.
AMOEMU_API amoemu_error amoemu_get_default_config(amoemu_config *config);

/// \brief Initializes the emulator.
/// \param config Configuration, or NULL for the default one.
/// \param handler Handler for traps that are not claimed, or NULL.
/// \param context Opaque pointer passed back to the handler.
/// \returns 0 for success, non zero code for error.
/// \details Must be called once at startup, before the trap vector is installed.
/// Resets the LR/SC reservation.
AMOEMU_API amoemu_error amoemu_init(const amoemu_config *config, amoemu_exception_handler handler, void *context);

/// \brief Handles a trap. Meant to be called from the trap vector with interrupts masked by the hardware.
/// \param frame Saved registers.
/// \returns Outcome of the trap.
/// \details On AMOEMU_OUTCOME_RESUMED, the frame holds the result of the emulated instruction and the pc
/// of the next instruction; the trap vector restores it and returns from the trap.
/// Otherwise the frame is untouched by the emulator.
/// Traps taken before amoemu_init() are never claimed.
AMOEMU_API amoemu_outcome amoemu_handle_trap(amoemu_trap_frame *frame);

/// \brief Drops the LR/SC reservation.
/// \details Call on every context switch.
AMOEMU_API void amoemu_invalidate_reservation(void);

/// \brief Sets the level of log messages.
/// \param level One of "trace", "debug", "info", "warning", "error", "fatal".
/// \returns 0 for success, non zero code for error.
AMOEMU_API amoemu_error amoemu_set_log_level(const char *level);

#ifdef __cplusplus
}
#endif

#endif // NOLINTEND
