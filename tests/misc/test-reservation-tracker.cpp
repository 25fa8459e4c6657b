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

#define BOOST_TEST_MODULE Reservation tracker test // NOLINT(cppcoreguidelines-macro-usage)
#define BOOST_TEST_NO_OLD_TOOLS

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

#include <cstdint>

#include <reservation-tracker.h>

// NOLINTBEGIN(cppcoreguidelines-avoid-do-while)

// NOLINTNEXTLINE
#define BOOST_AUTO_TEST_CASE_NOLINT(...) BOOST_AUTO_TEST_CASE(__VA_ARGS__)

BOOST_AUTO_TEST_CASE_NOLINT(starts_empty_test) {
    const amoemu::reservation_tracker r;
    BOOST_CHECK(!r.is_reserved());
    BOOST_CHECK(!r.get_reserved_address().has_value());
}

BOOST_AUTO_TEST_CASE_NOLINT(consume_without_reservation_fails_test) {
    amoemu::reservation_tracker r;
    BOOST_CHECK(!r.consume(0x1000));
    BOOST_CHECK(!r.is_reserved());
}

BOOST_AUTO_TEST_CASE_NOLINT(consume_matching_address_succeeds_once_test) {
    amoemu::reservation_tracker r;
    r.reserve(0x1000);
    BOOST_CHECK(r.is_reserved());
    BOOST_CHECK_EQUAL(r.get_reserved_address().value_or(0), UINT64_C(0x1000));
    BOOST_CHECK(r.consume(0x1000));
    BOOST_CHECK(!r.is_reserved());
    BOOST_CHECK(!r.consume(0x1000));
}

BOOST_AUTO_TEST_CASE_NOLINT(consume_other_address_fails_and_clears_test) {
    amoemu::reservation_tracker r;
    r.reserve(0x1000);
    BOOST_CHECK(!r.consume(0x1004));
    BOOST_CHECK(!r.is_reserved());
    BOOST_CHECK(!r.consume(0x1000));
}

BOOST_AUTO_TEST_CASE_NOLINT(reserve_replaces_previous_test) {
    amoemu::reservation_tracker r;
    r.reserve(0x1000);
    r.reserve(0x2000);
    BOOST_CHECK_EQUAL(r.get_reserved_address().value_or(0), UINT64_C(0x2000));
    BOOST_CHECK(!r.consume(0x1000));
    r.reserve(0x1000);
    r.reserve(0x2000);
    BOOST_CHECK(r.consume(0x2000));
}

BOOST_AUTO_TEST_CASE_NOLINT(invalidate_test) {
    amoemu::reservation_tracker r;
    r.invalidate();
    BOOST_CHECK(!r.is_reserved());
    r.reserve(0x1000);
    r.invalidate();
    BOOST_CHECK(!r.is_reserved());
    BOOST_CHECK(!r.consume(0x1000));
}

BOOST_AUTO_TEST_CASE_NOLINT(address_zero_is_a_valid_reservation_test) {
    amoemu::reservation_tracker r;
    r.reserve(0);
    BOOST_CHECK(r.is_reserved());
    BOOST_CHECK(r.consume(0));
}

// NOLINTEND(cppcoreguidelines-avoid-do-while)
