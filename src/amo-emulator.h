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

#ifndef AMO_EMULATOR_H
#define AMO_EMULATOR_H

/// \file
/// \brief Emulation of atomic extension instructions with plain loads and stores.
/// \details \{
/// This code assumes the host's byte-ordering is the same as RISC-V's.
///
/// Every read-modify-write sequence runs inside an interrupt_guard, so no other trap on the same
/// hart can observe or change the memory word (or the reservation) half way through.
/// The acquire and release bits are ignored: with a single hart and interrupts masked, the
/// sequence is already ordered with respect to everything that can observe it.
/// \}

#include <cstdint>
#include <type_traits>
#include <variant>

#include "compiler-defines.h"
#include "decoded-operation.h"
#include "emulator-config.h"
#include "i-interrupt-control.h"
#include "i-memory-access.h"
#include "interrupt-guard.h"
#include "meta.h"
#include "register-context.h"
#include "reservation-tracker.h"
#include "riscv-constants.h"

namespace amoemu {

static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__, "code assumes little-endian byte ordering");

/// \brief Emulation outcome
enum class emulate_status : uint8_t {
    success,     ///< Instruction emulated, registers and memory updated
    misaligned,  ///< Address not naturally aligned, nothing was changed
    unsupported, ///< Not an atomic instruction, nothing was changed
};

/// \brief Executes decoded atomic instructions against a register context and program memory
/// \tparam MEMORY Class of memory accessor object.
/// \tparam INTERRUPT_CONTROL Class of interrupt controller object.
template <typename MEMORY, typename INTERRUPT_CONTROL>
class amo_emulator {
public:
    /// \brief Constructor
    /// \param c Configuration, already validated.
    /// \param m Program memory.
    /// \param ic Interrupt controller for the critical sections.
    /// \param reservation LR/SC reservation shared by all emulations.
    amo_emulator(const emulator_config &c, i_memory_access<MEMORY> &m, i_interrupt_control<INTERRUPT_CONTROL> &ic,
        reservation_tracker &reservation) :
        m_xlen_mask(c.get_xlen_mask()),
        m_emulate_misaligned(c.emulate_misaligned),
        m_m(m),
        m_ic(ic),
        m_reservation(reservation) {}

    amo_emulator(const amo_emulator &) = delete;
    amo_emulator &operator=(const amo_emulator &) = delete;
    amo_emulator(amo_emulator &&) = delete;
    amo_emulator &operator=(amo_emulator &&) = delete;
    ~amo_emulator() = default;

    /// \brief Emulates one decoded instruction.
    /// \param op Decoded instruction.
    /// \param ctx Saved registers. Only rd is modified, and only on success.
    /// \returns Emulation outcome.
    emulate_status emulate(const decoded_operation &op, register_context &ctx) {
        return std::visit(overloads{
                              [](const unsupported_operation &) { return emulate_status::unsupported; },
                              [&](const load_reserved &lr) {
                                  if (lr.width == access_width::word) {
                                      return execute_LR<int32_t>(lr, ctx);
                                  }
                                  return execute_LR<int64_t>(lr, ctx);
                              },
                              [&](const store_conditional &sc) {
                                  if (sc.width == access_width::word) {
                                      return execute_SC<int32_t>(sc, ctx);
                                  }
                                  return execute_SC<int64_t>(sc, ctx);
                              },
                              [&](const amo_operation &amo) {
                                  if (amo.width == access_width::word) {
                                      return execute_AMO_kind<int32_t>(amo, ctx);
                                  }
                                  return execute_AMO_kind<int64_t>(amo, ctx);
                              },
                          },
            op);
    }

private:
    template <AmoWord T>
    bool is_aligned(uint64_t vaddr) const {
        return m_emulate_misaligned || (vaddr & (sizeof(T) - 1)) == 0;
    }

    uint64_t read_address(const register_context &ctx, uint32_t rs1) const {
        return ctx.read_x(rs1) & m_xlen_mask;
    }

    void write_rd(register_context &ctx, uint32_t rd, uint64_t val) const {
        ctx.write_x(rd, val & m_xlen_mask);
    }

    /// \brief Execute the LR instruction.
    /// \tparam T Signed type of the memory word.
    template <AmoWord T>
    FORCE_INLINE emulate_status execute_LR(const load_reserved &lr, register_context &ctx) {
        const uint64_t vaddr = read_address(ctx, lr.rs1);
        if (unlikely(!is_aligned<T>(vaddr))) {
            return emulate_status::misaligned;
        }
        T val = 0;
        {
            const interrupt_guard<INTERRUPT_CONTROL> guard{m_ic};
            val = m_m.template read_memory<T>(vaddr);
            m_reservation.reserve(vaddr);
        }
        // Conversion from the signed word sign-extends it to 64 bits
        write_rd(ctx, lr.rd, static_cast<uint64_t>(val));
        return emulate_status::success;
    }

    /// \brief Execute the SC instruction.
    /// \tparam T Signed type of the memory word.
    template <AmoWord T>
    FORCE_INLINE emulate_status execute_SC(const store_conditional &sc, register_context &ctx) {
        const uint64_t vaddr = read_address(ctx, sc.rs1);
        if (unlikely(!is_aligned<T>(vaddr))) {
            return emulate_status::misaligned;
        }
        uint64_t val = SC_FAILURE;
        {
            const interrupt_guard<INTERRUPT_CONTROL> guard{m_ic};
            if (m_reservation.consume(vaddr)) {
                m_m.template write_memory<T>(vaddr, static_cast<T>(ctx.read_x(sc.rs2)));
                val = SC_SUCCESS;
            }
        }
        write_rd(ctx, sc.rd, val);
        return emulate_status::success;
    }

    /// \brief Execute an AMO instruction.
    /// \tparam T Signed type of the memory word.
    /// \param f Function computing the value to store from the memory value and the rs2 value.
    template <AmoWord T, typename F>
    FORCE_INLINE emulate_status execute_AMO(const amo_operation &amo, register_context &ctx, const F &f) {
        const uint64_t vaddr = read_address(ctx, amo.rs1);
        if (unlikely(!is_aligned<T>(vaddr))) {
            return emulate_status::misaligned;
        }
        // rs2 is read before rd is written, they may be the same register
        const T valr = static_cast<T>(ctx.read_x(amo.rs2));
        T valm = 0;
        {
            const interrupt_guard<INTERRUPT_CONTROL> guard{m_ic};
            // Any atomic other than the store-conditional closing an LR/SC pair breaks the reservation
            m_reservation.invalidate();
            valm = m_m.template read_memory<T>(vaddr);
            m_m.template write_memory<T>(vaddr, f(valm, valr));
        }
        write_rd(ctx, amo.rd, static_cast<uint64_t>(valm));
        return emulate_status::success;
    }

    template <AmoWord T>
    emulate_status execute_AMO_kind(const amo_operation &amo, register_context &ctx) {
        using U = std::make_unsigned_t<T>;
        switch (amo.kind) {
            case amo_kind::swap:
                return execute_AMO<T>(amo, ctx, [](T /*valm*/, T valr) -> T { return valr; });
            case amo_kind::add:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T {
                    T val = 0;
                    __builtin_add_overflow(valm, valr, &val);
                    return val;
                });
            case amo_kind::xor_:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T { return valm ^ valr; });
            case amo_kind::and_:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T { return valm & valr; });
            case amo_kind::or_:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T { return valm | valr; });
            case amo_kind::min:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T {
                    if (valm < valr) {
                        return valm;
                    }
                    return valr;
                });
            case amo_kind::max:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T {
                    if (valm > valr) {
                        return valm;
                    }
                    return valr;
                });
            case amo_kind::minu:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T {
                    if (static_cast<U>(valm) < static_cast<U>(valr)) {
                        return valm;
                    }
                    return valr;
                });
            case amo_kind::maxu:
                return execute_AMO<T>(amo, ctx, [](T valm, T valr) -> T {
                    if (static_cast<U>(valm) > static_cast<U>(valr)) {
                        return valm;
                    }
                    return valr;
                });
        }
        return emulate_status::unsupported;
    }

    uint64_t m_xlen_mask;
    bool m_emulate_misaligned;
    i_memory_access<MEMORY> &m_m;                // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    i_interrupt_control<INTERRUPT_CONTROL> &m_ic; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    reservation_tracker &m_reservation;          // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace amoemu

#endif
