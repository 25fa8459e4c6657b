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

#ifndef TRAP_DISPATCHER_H
#define TRAP_DISPATCHER_H

/// \file
/// \brief Trap entry point: claims illegal-instruction traps caused by atomic instructions.

#include <cstdint>
#include <variant>

#include "amo-decoder.h"
#include "amo-emulator.h"
#include "decoded-operation.h"
#include "emulator-config.h"
#include "i-interrupt-control.h"
#include "i-memory-access.h"
#include "instruction-fetcher.h"
#include "register-context.h"
#include "reservation-tracker.h"
#include "riscv-constants.h"
#include "slog.h"

namespace amoemu {

/// \brief The trap was claimed and emulated; execution continues at new_pc
struct resume {
    uint64_t new_pc{};

    bool operator==(const resume &) const = default;
};

/// \brief The trap was not claimed and belongs to the user's exception handler
struct forward {
    bool operator==(const forward &) const = default;
};

using dispatch_outcome = std::variant<forward, resume>;

/// \brief Handler receiving the traps that are not claimed
/// \param mcause Trap cause.
/// \param ctx Saved registers, exactly as they were when the trap was taken.
/// \param user_context Pointer given when the handler was registered.
using exception_handler = void (*)(uint64_t mcause, register_context &ctx, void *user_context);

/// \brief Decodes, emulates and resumes past atomic instructions that trapped as illegal
/// \tparam MEMORY Class of memory accessor object.
/// \tparam INTERRUPT_CONTROL Class of interrupt controller object.
/// \details The dispatcher owns the LR/SC reservation, so the reservation lives exactly as long as the
/// dispatcher. It must not be reentered: the runtime calls it from the trap vector, once per trap.
/// The trap path logs through SLOG, which writes to std::clog and is not async-signal-safe. Hosted
/// builds that deliver traps as signals must be configured with AMOEMU_DISABLE_LOGGING.
template <typename MEMORY, typename INTERRUPT_CONTROL>
class trap_dispatcher {
public:
    /// \brief Constructor
    /// \param c Configuration. Throws std::invalid_argument if it is invalid.
    /// \param m Program memory.
    /// \param ic Interrupt controller.
    trap_dispatcher(const emulator_config &c, i_memory_access<MEMORY> &m, i_interrupt_control<INTERRUPT_CONTROL> &ic) :
        m_config(validated(c)),
        m_m(m),
        m_emulator(m_config, m, ic, m_reservation) {}

    trap_dispatcher(const trap_dispatcher &) = delete;
    trap_dispatcher &operator=(const trap_dispatcher &) = delete;
    trap_dispatcher(trap_dispatcher &&) = delete;
    trap_dispatcher &operator=(trap_dispatcher &&) = delete;
    ~trap_dispatcher() = default;

    /// \brief Registers the handler for traps that are not claimed
    /// \param handler Handler function, or nullptr to remove it.
    /// \param user_context Opaque pointer passed back to the handler.
    void set_exception_handler(exception_handler handler, void *user_context) noexcept {
        m_handler = handler;
        m_handler_context = user_context;
    }

    /// \brief Classifies a trap and emulates the faulting instruction when it is an atomic one.
    /// \param ctx Saved registers. On resume, rd holds the result; the pc is left untouched.
    /// On forward, ctx is unmodified.
    /// \returns resume with the address of the next instruction, or forward.
    dispatch_outcome dispatch(register_context &ctx) {
        if (ctx.mcause != MCAUSE_ILLEGAL_INSN) {
            return forward_trap(ctx, "not an illegal instruction");
        }
        const uint32_t insn = get_faulting_insn(ctx);
        const auto op = decode_insn(insn, m_config.xlen);
        if (!is_supported(op)) {
            return forward_trap(ctx, "not an atomic instruction");
        }
        switch (m_emulator.emulate(op, ctx)) {
            case emulate_status::success:
                SLOG(trace) << "emulated " << get_operation_name(op) << " at pc 0x" << std::hex << ctx.pc;
                return resume{(ctx.pc + INSN_LENGTH) & m_config.get_xlen_mask()};
            case emulate_status::misaligned:
                SLOG(warning) << get_operation_name(op) << " at pc 0x" << std::hex << ctx.pc
                              << " accesses a misaligned address, not emulated";
                return forward_trap(ctx, "misaligned atomic access");
            case emulate_status::unsupported:
                break;
        }
        return forward_trap(ctx, "not an atomic instruction");
    }

    /// \brief Handles a trap from start to finish.
    /// \param ctx Saved registers.
    /// \returns The outcome of dispatch().
    /// \details On resume, the pc in ctx is advanced past the emulated instruction. On forward, the
    /// registered exception handler, if any, is called with the unmodified ctx.
    /// If the instruction cannot be fetched or emulated, the reservation is dropped before the
    /// exception propagates, exactly as for a forwarded trap.
    dispatch_outcome handle_trap(register_context &ctx) {
        dispatch_outcome outcome;
        try {
            outcome = dispatch(ctx);
        } catch (...) {
            m_reservation.invalidate();
            throw;
        }
        if (const auto *r = std::get_if<resume>(&outcome); r != nullptr) {
            ctx.pc = r->new_pc;
        } else if (m_handler != nullptr) {
            m_handler(ctx.mcause, ctx, m_handler_context);
        } else {
            SLOG(warning) << "no exception handler registered for trap with mcause 0x" << std::hex << ctx.mcause;
        }
        return outcome;
    }

    /// \brief Drops the LR/SC reservation
    /// \details The runtime calls this on context switches, so a store-conditional in the next
    /// context cannot succeed on a reservation taken by the previous one.
    void invalidate_reservation() noexcept {
        m_reservation.invalidate();
    }

    const reservation_tracker &get_reservation() const noexcept {
        return m_reservation;
    }

    const emulator_config &get_config() const noexcept {
        return m_config;
    }

private:
    static const emulator_config &validated(const emulator_config &c) {
        validate_emulator_config(c);
        return c;
    }

    uint32_t get_faulting_insn(const register_context &ctx) const {
        if (m_config.use_mtval_insn && ctx.mtval != 0) {
            return static_cast<uint32_t>(ctx.mtval);
        }
        return fetch_insn(m_m, ctx.pc);
    }

    dispatch_outcome forward_trap(const register_context &ctx, const char *reason) {
        // Another trap between an LR and its SC breaks the reservation
        m_reservation.invalidate();
        SLOG(debug) << "forwarding trap with mcause 0x" << std::hex << ctx.mcause << " at pc 0x" << ctx.pc << ": "
                    << reason;
        return forward{};
    }

    emulator_config m_config;
    const i_memory_access<MEMORY> &m_m; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    reservation_tracker m_reservation;
    amo_emulator<MEMORY, INTERRUPT_CONTROL> m_emulator;
    exception_handler m_handler{nullptr};
    void *m_handler_context{nullptr};
};

} // namespace amoemu

#endif
