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

#include "amo-decoder.h"

#include <cstdint>
#include <optional>
#include <variant>

#include "meta.h"
#include "riscv-constants.h"

namespace amoemu {

static std::optional<access_width> decode_width(uint32_t insn, int xlen) {
    switch (static_cast<insn_AMO_funct3>(insn_get_funct3(insn))) {
        case insn_AMO_funct3::AMO_W:
            return access_width::word;
        case insn_AMO_funct3::AMO_D:
            if (xlen == XLEN) {
                return access_width::doubleword;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

static std::optional<amo_kind> decode_amo_kind(uint32_t insn) {
    switch (static_cast<insn_AMO_funct7_sr2>(insn_get_funct7_sr2(insn))) {
        case insn_AMO_funct7_sr2::AMOADD:
            return amo_kind::add;
        case insn_AMO_funct7_sr2::AMOSWAP:
            return amo_kind::swap;
        case insn_AMO_funct7_sr2::AMOXOR:
            return amo_kind::xor_;
        case insn_AMO_funct7_sr2::AMOOR:
            return amo_kind::or_;
        case insn_AMO_funct7_sr2::AMOAND:
            return amo_kind::and_;
        case insn_AMO_funct7_sr2::AMOMIN:
            return amo_kind::min;
        case insn_AMO_funct7_sr2::AMOMAX:
            return amo_kind::max;
        case insn_AMO_funct7_sr2::AMOMINU:
            return amo_kind::minu;
        case insn_AMO_funct7_sr2::AMOMAXU:
            return amo_kind::maxu;
        case insn_AMO_funct7_sr2::LR:
        case insn_AMO_funct7_sr2::SC:
            break;
    }
    return std::nullopt;
}

decoded_operation decode_insn(uint32_t insn, int xlen) {
    if (insn_get_opcode(insn) != insn_opcode::AMO) {
        return unsupported_operation{insn};
    }
    const auto width = decode_width(insn, xlen);
    if (!width) {
        return unsupported_operation{insn};
    }
    const uint32_t rd = insn_get_rd(insn);
    const uint32_t rs1 = insn_get_rs1(insn);
    const uint32_t rs2 = insn_get_rs2(insn);
    const bool aq = ((insn >> AMO_AQ_SHIFT) & 1) != 0;
    const bool rl = ((insn >> AMO_RL_SHIFT) & 1) != 0;
    const uint32_t funct5 = insn_get_funct7_sr2(insn);
    if (funct5 == insn_AMO_funct7_sr2::LR) {
        // The rs2 field of LR is reserved and must be zero
        if (rs2 != 0) {
            return unsupported_operation{insn};
        }
        return load_reserved{*width, rd, rs1, aq, rl};
    }
    if (funct5 == insn_AMO_funct7_sr2::SC) {
        return store_conditional{*width, rd, rs1, rs2, aq, rl};
    }
    const auto kind = decode_amo_kind(insn);
    if (!kind) {
        return unsupported_operation{insn};
    }
    return amo_operation{*kind, *width, rd, rs1, rs2, aq, rl};
}

static const char *get_amo_name(amo_kind kind, access_width width) {
    const bool w = (width == access_width::word);
    switch (kind) {
        case amo_kind::swap:
            return w ? "amoswap.w" : "amoswap.d";
        case amo_kind::add:
            return w ? "amoadd.w" : "amoadd.d";
        case amo_kind::xor_:
            return w ? "amoxor.w" : "amoxor.d";
        case amo_kind::and_:
            return w ? "amoand.w" : "amoand.d";
        case amo_kind::or_:
            return w ? "amoor.w" : "amoor.d";
        case amo_kind::min:
            return w ? "amomin.w" : "amomin.d";
        case amo_kind::max:
            return w ? "amomax.w" : "amomax.d";
        case amo_kind::minu:
            return w ? "amominu.w" : "amominu.d";
        case amo_kind::maxu:
            return w ? "amomaxu.w" : "amomaxu.d";
    }
    return "amo?";
}

const char *get_operation_name(const decoded_operation &op) {
    return std::visit(overloads{
                          [](const unsupported_operation &) { return "unsupported"; },
                          [](const load_reserved &lr) { return lr.width == access_width::word ? "lr.w" : "lr.d"; },
                          [](const store_conditional &sc) {
                              return sc.width == access_width::word ? "sc.w" : "sc.d";
                          },
                          [](const amo_operation &amo) { return get_amo_name(amo.kind, amo.width); },
                      },
        op);
}

} // namespace amoemu
