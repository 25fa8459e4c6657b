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

#define BOOST_TEST_MODULE AMO emulator C API test // NOLINT(cppcoreguidelines-macro-usage)
#define BOOST_TEST_NO_OLD_TOOLS

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

#include <array>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <iostream>
#include <sstream>
#include <string>

#include <pthread.h>

#include <amoemu-c-api.h>
#include <riscv-constants.h>
#include <slog.h>

#include "test-utils.h"

// NOLINTBEGIN(cppcoreguidelines-avoid-do-while,cppcoreguidelines-pro-type-reinterpret-cast)

// NOLINTNEXTLINE
#define BOOST_AUTO_TEST_CASE_NOLINT(...) BOOST_AUTO_TEST_CASE(__VA_ARGS__)
// NOLINTNEXTLINE
#define BOOST_FIXTURE_TEST_CASE_NOLINT(...) BOOST_FIXTURE_TEST_CASE(__VA_ARGS__)

namespace {

constexpr uint32_t RD = 12;
constexpr uint32_t RS1 = 10;
constexpr uint32_t RS2 = 11;

struct forwarded_trap {
    int calls{0};
    amoemu_reg mcause{0};
    amoemu_trap_frame *frame{nullptr};
};

void record_forward(amoemu_reg mcause, amoemu_trap_frame *frame, void *context) {
    auto *f = static_cast<forwarded_trap *>(context);
    ++f->calls;
    f->mcause = mcause;
    f->frame = frame;
}

bool same_frame(const amoemu_trap_frame &a, const amoemu_trap_frame &b) {
    return memcmp(&a, &b, sizeof(amoemu_trap_frame)) == 0;
}

} // namespace

// The emulator state is process-wide, so this must run before any amoemu_init()
BOOST_AUTO_TEST_CASE_NOLINT(handle_trap_before_init_test) {
    std::array<uint32_t, 2> code{encode_amo_w(amoemu::AMOADD, RD, RS1, RS2), NOP_INSN};
    amoemu_trap_frame frame{};
    frame.pc = reinterpret_cast<amoemu_reg>(code.data());
    frame.mcause = amoemu::MCAUSE_ILLEGAL_INSN;
    const auto before = frame;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_UNHANDLED);
    BOOST_CHECK(same_frame(frame, before));
}

BOOST_AUTO_TEST_CASE_NOLINT(handle_trap_null_frame_test) {
    BOOST_CHECK_EQUAL(amoemu_handle_trap(nullptr), AMOEMU_OUTCOME_UNHANDLED);
}

BOOST_AUTO_TEST_CASE_NOLINT(get_default_config_basic_test) {
    amoemu_config config{};
    BOOST_CHECK_EQUAL(amoemu_get_default_config(&config), AMOEMU_ERROR_OK);
    BOOST_CHECK_EQUAL(std::string(amoemu_get_last_error_message()), std::string(""));
    BOOST_CHECK_EQUAL(config.xlen, static_cast<int32_t>(sizeof(void *) * 8));
    BOOST_CHECK(!config.emulate_misaligned);
    BOOST_CHECK(!config.use_mtval_insn);
}

BOOST_AUTO_TEST_CASE_NOLINT(get_default_config_null_test) {
    BOOST_CHECK_EQUAL(amoemu_get_default_config(nullptr), AMOEMU_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string(amoemu_get_last_error_message()), std::string("invalid config output"));
}

BOOST_AUTO_TEST_CASE_NOLINT(init_invalid_xlen_test) {
    amoemu_config config{};
    BOOST_REQUIRE_EQUAL(amoemu_get_default_config(&config), AMOEMU_ERROR_OK);
    config.xlen = 16;
    BOOST_CHECK_EQUAL(amoemu_init(&config, nullptr, nullptr), AMOEMU_ERROR_INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(std::string(amoemu_get_last_error_message()), std::string("xlen must be 32 or 64 (got 16)"));
    BOOST_CHECK_EQUAL(amoemu_init(nullptr, nullptr, nullptr), AMOEMU_ERROR_OK);
    BOOST_CHECK_EQUAL(std::string(amoemu_get_last_error_message()), std::string(""));
}

BOOST_AUTO_TEST_CASE_NOLINT(set_log_level_test) {
    BOOST_CHECK_EQUAL(amoemu_set_log_level("debug"), AMOEMU_ERROR_OK);
    BOOST_CHECK_EQUAL(amoemu_set_log_level("loud"), AMOEMU_ERROR_DOMAIN_ERROR);
    BOOST_CHECK_EQUAL(std::string(amoemu_get_last_error_message()),
        std::string("unknown log severity level 'loud'"));
    BOOST_CHECK_EQUAL(amoemu_set_log_level(nullptr), AMOEMU_ERROR_DOMAIN_ERROR);
    BOOST_CHECK_EQUAL(amoemu_set_log_level("error"), AMOEMU_ERROR_OK);
}

BOOST_AUTO_TEST_CASE_NOLINT(log_line_keeps_stream_flags_test) {
    std::ostringstream out;
    auto *const saved_buf = std::clog.rdbuf(out.rdbuf());
    const auto saved_flags = std::clog.flags();
    std::clog.setf(std::ios_base::boolalpha | std::ios_base::showbase);
    const slog::scoped_log_level level{slog::severity_level::info};
    SLOG(info) << "pc 0x" << std::hex << 255;
    const auto flags = std::clog.flags();
    std::clog << true << ' ' << 255;
    std::clog.flags(saved_flags);
    std::clog.rdbuf(saved_buf);
    BOOST_CHECK((flags & std::ios_base::boolalpha) != 0);
    BOOST_CHECK((flags & std::ios_base::showbase) != 0);
    BOOST_CHECK((flags & std::ios_base::basefield) != std::ios_base::hex);
    BOOST_CHECK(out.str().ends_with("true 255"));
}

class c_api_fixture {
public:
    c_api_fixture() {
        BOOST_REQUIRE_EQUAL(amoemu_set_log_level("error"), AMOEMU_ERROR_OK);
        BOOST_REQUIRE_EQUAL(amoemu_init(nullptr, record_forward, &_forwarded), AMOEMU_ERROR_OK);
        _code.fill(NOP_INSN);
    }

    ~c_api_fixture() = default;

    c_api_fixture(const c_api_fixture &other) = delete;
    c_api_fixture(c_api_fixture &&other) noexcept = delete;
    c_api_fixture &operator=(const c_api_fixture &other) = delete;
    c_api_fixture &operator=(c_api_fixture &&other) noexcept = delete;

protected:
    // Illegal-instruction trap on the instruction at _code[index], with rs1 pointing to _word
    amoemu_trap_frame make_frame(uint32_t insn, size_t index = 0) {
        _code.at(index) = insn;
        amoemu_trap_frame frame{};
        for (int i = 1; i < amoemu::X_REG_COUNT; ++i) {
            frame.x[i] = 0x1000 + i;
        }
        frame.x[RS1] = reinterpret_cast<amoemu_reg>(&_word);
        frame.pc = reinterpret_cast<amoemu_reg>(&_code.at(index));
        frame.mcause = amoemu::MCAUSE_ILLEGAL_INSN;
        return frame;
    }

    forwarded_trap _forwarded;
    std::array<uint32_t, 4> _code{};
    alignas(8) uint32_t _word{0};
};

BOOST_FIXTURE_TEST_CASE_NOLINT(amoadd_w_end_to_end_test, c_api_fixture) {
    _word = 5;
    auto frame = make_frame(encode_amo_w(amoemu::AMOADD, RD, RS1, RS2));
    frame.x[RS2] = 3;
    auto expected = frame;
    expected.x[RD] = 5;
    expected.pc += 4;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_CHECK(same_frame(frame, expected));
    BOOST_CHECK_EQUAL(_word, UINT32_C(8));
    BOOST_CHECK_EQUAL(_forwarded.calls, 0);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(signal_mask_restored_test, c_api_fixture) {
    sigset_t before{};
    sigset_t after{};
    BOOST_REQUIRE_EQUAL(pthread_sigmask(SIG_BLOCK, nullptr, &before), 0);
    auto frame = make_frame(encode_amo_w(amoemu::AMOSWAP, RD, RS1, RS2));
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_REQUIRE_EQUAL(pthread_sigmask(SIG_BLOCK, nullptr, &after), 0);
    for (const int sig : {SIGINT, SIGALRM, SIGUSR1, SIGTERM}) {
        BOOST_CHECK_EQUAL(sigismember(&after, sig), sigismember(&before, sig));
    }
}

BOOST_FIXTURE_TEST_CASE_NOLINT(non_atomic_is_forwarded_to_handler_test, c_api_fixture) {
    auto frame = make_frame(NOP_INSN);
    const auto before = frame;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_FORWARDED);
    BOOST_CHECK(same_frame(frame, before));
    BOOST_CHECK_EQUAL(_forwarded.calls, 1);
    BOOST_CHECK_EQUAL(_forwarded.mcause, static_cast<amoemu_reg>(amoemu::MCAUSE_ILLEGAL_INSN));
    BOOST_CHECK(_forwarded.frame == &frame);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(other_cause_is_forwarded_to_handler_test, c_api_fixture) {
    auto frame = make_frame(encode_amo_w(amoemu::AMOADD, RD, RS1, RS2));
    frame.mcause = amoemu::MCAUSE_BREAKPOINT;
    const auto before = frame;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_FORWARDED);
    BOOST_CHECK(same_frame(frame, before));
    BOOST_CHECK_EQUAL(_forwarded.mcause, static_cast<amoemu_reg>(amoemu::MCAUSE_BREAKPOINT));
    BOOST_CHECK_EQUAL(_word, UINT32_C(0));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(no_handler_is_unhandled_test, c_api_fixture) {
    BOOST_REQUIRE_EQUAL(amoemu_init(nullptr, nullptr, nullptr), AMOEMU_ERROR_OK);
    auto frame = make_frame(NOP_INSN);
    const auto before = frame;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_UNHANDLED);
    BOOST_CHECK(same_frame(frame, before));
    BOOST_CHECK_EQUAL(_forwarded.calls, 0);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(lr_sc_end_to_end_test, c_api_fixture) {
    _word = 7;
    auto frame = make_frame(encode_lr_w(RD, RS1), 0);
    _code.at(1) = encode_sc_w(13, RS1, RS2);
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_CHECK_EQUAL(frame.x[RD], static_cast<amoemu_reg>(7));
    BOOST_CHECK_EQUAL(frame.pc, reinterpret_cast<amoemu_reg>(&_code.at(1)));
    frame.x[RS2] = 9;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_CHECK_EQUAL(frame.x[13], static_cast<amoemu_reg>(0));
    BOOST_CHECK_EQUAL(_word, UINT32_C(9));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(invalidate_reservation_test, c_api_fixture) {
    _word = 7;
    auto frame = make_frame(encode_lr_w(RD, RS1), 0);
    _code.at(1) = encode_sc_w(13, RS1, RS2);
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    amoemu_invalidate_reservation();
    frame.x[RS2] = 9;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_CHECK_EQUAL(frame.x[13], static_cast<amoemu_reg>(1));
    BOOST_CHECK_EQUAL(_word, UINT32_C(7));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(init_resets_reservation_test, c_api_fixture) {
    auto frame = make_frame(encode_lr_w(RD, RS1), 0);
    _code.at(1) = encode_sc_w(13, RS1, RS2);
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_REQUIRE_EQUAL(amoemu_init(nullptr, record_forward, &_forwarded), AMOEMU_ERROR_OK);
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_CHECK_EQUAL(frame.x[13], static_cast<amoemu_reg>(1));
}

BOOST_FIXTURE_TEST_CASE_NOLINT(misaligned_is_forwarded_test, c_api_fixture) {
    auto frame = make_frame(encode_amo_w(amoemu::AMOADD, RD, RS1, RS2));
    frame.x[RS1] += 2;
    const auto before = frame;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_FORWARDED);
    BOOST_CHECK(same_frame(frame, before));
    BOOST_CHECK_EQUAL(_forwarded.calls, 1);
}

BOOST_FIXTURE_TEST_CASE_NOLINT(mtval_insn_source_test, c_api_fixture) {
    amoemu_config config{};
    BOOST_REQUIRE_EQUAL(amoemu_get_default_config(&config), AMOEMU_ERROR_OK);
    config.use_mtval_insn = true;
    BOOST_REQUIRE_EQUAL(amoemu_init(&config, record_forward, &_forwarded), AMOEMU_ERROR_OK);
    _word = 0x0f;
    auto frame = make_frame(NOP_INSN);
    frame.mtval = encode_amo_w(amoemu::AMOAND, RD, RS1, RS2);
    frame.x[RS2] = 0x3c;
    BOOST_CHECK_EQUAL(amoemu_handle_trap(&frame), AMOEMU_OUTCOME_RESUMED);
    BOOST_CHECK_EQUAL(frame.x[RD], static_cast<amoemu_reg>(0x0f));
    BOOST_CHECK_EQUAL(_word, UINT32_C(0x0c));
}

// NOLINTEND(cppcoreguidelines-avoid-do-while,cppcoreguidelines-pro-type-reinterpret-cast)
