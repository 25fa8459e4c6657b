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

#include "amoemu-c-api.h"

#include <cstdint>
#include <exception>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <variant>

#include "direct-memory-access.h"
#include "emulator-config.h"
#include "platform-interrupt-control.h"
#include "register-context.h"
#include "riscv-constants.h"
#include "slog.h"
#include "trap-dispatcher.h"

static_assert(sizeof(amoemu_reg) * 8 >= AMOEMU_NATIVE_XLEN, "amoemu_reg cannot hold a register");
static_assert(sizeof(amoemu_trap_frame::x) / sizeof(amoemu_reg) == amoemu::X_REG_COUNT);

namespace {

using c_api_dispatcher = amoemu::trap_dispatcher<amoemu::direct_memory_access, amoemu::platform_interrupt_control>;

/// \brief Process-wide state behind the C API
struct c_api_state {
    amoemu::direct_memory_access memory;
    amoemu::platform_interrupt_control interrupts;
    std::optional<c_api_dispatcher> dispatcher;
    amoemu_exception_handler handler{nullptr};
    void *context{nullptr};
    amoemu_trap_frame *frame{nullptr}; ///< Frame of the trap being handled, if any
};

c_api_state &get_state() {
    static c_api_state state;
    return state;
}

std::string &get_last_err_msg_storage() {
    static thread_local std::string last_err_msg;
    return last_err_msg;
}

amoemu_error amoemu_result_failure() try { throw; } catch (const std::exception &e) {
    try {
        get_last_err_msg_storage() = e.what();
        throw;
    } catch (const std::invalid_argument &ex) {
        return AMOEMU_ERROR_INVALID_ARGUMENT;
    } catch (const std::domain_error &ex) {
        return AMOEMU_ERROR_DOMAIN_ERROR;
    } catch (const std::logic_error &ex) {
        return AMOEMU_ERROR_LOGIC_ERROR;
    } catch (const std::system_error &ex) {
        return AMOEMU_ERROR_SYSTEM_ERROR;
    } catch (const std::runtime_error &ex) {
        return AMOEMU_ERROR_RUNTIME_ERROR;
    } catch (const std::bad_alloc &ex) {
        return AMOEMU_ERROR_BAD_ALLOC;
    } catch (const std::exception &e) {
        return AMOEMU_ERROR_EXCEPTION;
    }
} catch (...) {
    try {
        get_last_err_msg_storage() = std::string("unknown error");
    } catch (...) {
        // Failed to allocate string, last resort is to set an empty error.
        get_last_err_msg_storage().clear();
    }
    return AMOEMU_ERROR_UNKNOWN;
}

amoemu_error amoemu_result_success() {
    get_last_err_msg_storage().clear();
    return AMOEMU_ERROR_OK;
}

amoemu::emulator_config convert_from_c(const amoemu_config &c) {
    amoemu::emulator_config config;
    config.xlen = c.xlen;
    config.emulate_misaligned = c.emulate_misaligned;
    config.use_mtval_insn = c.use_mtval_insn;
    return config;
}

amoemu_config convert_to_c(const amoemu::emulator_config &c) {
    amoemu_config config{};
    config.xlen = c.xlen;
    config.emulate_misaligned = c.emulate_misaligned;
    config.use_mtval_insn = c.use_mtval_insn;
    return config;
}

amoemu::register_context convert_from_c(const amoemu_trap_frame &frame) {
    amoemu::register_context ctx;
    for (int i = 1; i < amoemu::X_REG_COUNT; ++i) {
        ctx.x[i] = frame.x[i];
    }
    ctx.pc = frame.pc;
    ctx.mcause = frame.mcause;
    ctx.mstatus = frame.mstatus;
    ctx.mtval = frame.mtval;
    return ctx;
}

void convert_to_c(const amoemu::register_context &ctx, amoemu_trap_frame *frame) {
    for (int i = 1; i < amoemu::X_REG_COUNT; ++i) {
        frame->x[i] = static_cast<amoemu_reg>(ctx.x[i]);
    }
    frame->pc = static_cast<amoemu_reg>(ctx.pc);
}

/// \brief Bridges the dispatcher's exception handler to the handler registered through the C API
void forward_to_c_handler(uint64_t mcause, amoemu::register_context & /*ctx*/, void *user_context) {
    auto *state = static_cast<c_api_state *>(user_context);
    state->handler(static_cast<amoemu_reg>(mcause), state->frame, state->context);
}

amoemu_outcome forward_unclaimed(const c_api_state &state, amoemu_trap_frame *frame) {
    if (state.handler == nullptr) {
        return AMOEMU_OUTCOME_UNHANDLED;
    }
    state.handler(frame->mcause, frame, state.context);
    return AMOEMU_OUTCOME_FORWARDED;
}

} // namespace

const char *amoemu_get_last_error_message() {
    return get_last_err_msg_storage().c_str();
}

amoemu_error amoemu_get_default_config(amoemu_config *config) try {
    if (config == nullptr) {
        throw std::invalid_argument("invalid config output");
    }
    *config = convert_to_c(amoemu::get_default_emulator_config());
    return amoemu_result_success();
} catch (...) {
    return amoemu_result_failure();
}

amoemu_error amoemu_init(const amoemu_config *config, amoemu_exception_handler handler, void *context) try {
    const auto c = (config != nullptr) ? convert_from_c(*config) : amoemu::get_default_emulator_config();
    // Validate before touching the current dispatcher, so a bad config leaves it in place
    amoemu::validate_emulator_config(c);
    auto &state = get_state();
    state.dispatcher.reset();
    state.dispatcher.emplace(c, state.memory, state.interrupts);
    state.handler = handler;
    state.context = context;
    state.frame = nullptr;
    state.dispatcher->set_exception_handler((handler != nullptr) ? forward_to_c_handler : nullptr, &state);
    SLOG(info) << "atomic extension emulation enabled for RV" << c.xlen
               << (c.emulate_misaligned ? ", misaligned accesses emulated" : "")
               << (c.use_mtval_insn ? ", instruction taken from mtval" : "");
    return amoemu_result_success();
} catch (...) {
    return amoemu_result_failure();
}

amoemu_outcome amoemu_handle_trap(amoemu_trap_frame *frame) {
    if (frame == nullptr) {
        return AMOEMU_OUTCOME_UNHANDLED;
    }
    auto &state = get_state();
    if (!state.dispatcher) {
        return forward_unclaimed(state, frame);
    }
    try {
        auto ctx = convert_from_c(*frame);
        state.frame = frame;
        const auto outcome = state.dispatcher->handle_trap(ctx);
        state.frame = nullptr;
        if (std::holds_alternative<amoemu::resume>(outcome)) {
            convert_to_c(ctx, frame);
            return AMOEMU_OUTCOME_RESUMED;
        }
        return (state.handler != nullptr) ? AMOEMU_OUTCOME_FORWARDED : AMOEMU_OUTCOME_UNHANDLED;
    } catch (...) {
        state.frame = nullptr;
        std::ignore = amoemu_result_failure();
        SLOG(error) << "unable to handle trap: " << amoemu_get_last_error_message();
        // The frame was not touched, so the trap still belongs to the user
        return forward_unclaimed(state, frame);
    }
}

void amoemu_invalidate_reservation() {
    auto &state = get_state();
    if (state.dispatcher) {
        state.dispatcher->invalidate_reservation();
    }
}

amoemu_error amoemu_set_log_level(const char *level) try {
    slog::log_level(slog::level_operation::set, slog::from_string(level));
    return amoemu_result_success();
} catch (...) {
    return amoemu_result_failure();
}
