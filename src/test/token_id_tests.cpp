// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_tokenledger.h"

#include "../tokenledger/identification.hpp"
#include "../tokenledger/token_id.hpp"

#include <cstdint>
#include <limits>
#include <random>
#include <unordered_set>

#include <boost/test/unit_test.hpp>

using namespace tokenledger;

BOOST_FIXTURE_TEST_SUITE(token_id_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(pack_unpack)
{
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t edges[] = {0, 1, 2, 100, 0x8000000000000000ull, max - 1, max};
    for (const auto l : edges)
        for (const auto i : edges) {
            const auto t = make_token_id(l, i);
            BOOST_CHECK_EQUAL(token_location(t), l);
            BOOST_CHECK_EQUAL(token_item(t), i);
        }

    std::mt19937_64 rng(20260101);
    for (int n = 0; n < 1000; ++n) {
        const auto l = rng(), i = rng();
        const auto t = make_token_id(l, i);
        BOOST_CHECK_EQUAL(token_location(t), l);
        BOOST_CHECK_EQUAL(token_item(t), i);
    }
}

BOOST_AUTO_TEST_CASE(layout)
{
    BOOST_CHECK(make_token_id(0, 0) == 0);
    BOOST_CHECK(make_token_id(0, 7) == 7);
    BOOST_CHECK(make_token_id(1, 0) == token_id_t(1) << 64);
    BOOST_CHECK(make_token_id(100, 1) != make_token_id(1, 100));
    BOOST_CHECK(make_token_id(100, 1) < make_token_id(101, 0));
}

BOOST_AUTO_TEST_CASE(decimal_rendering)
{
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    BOOST_CHECK_EQUAL(to_string(make_token_id(0, 0)), "0");
    BOOST_CHECK_EQUAL(to_string(make_token_id(0, 42)), "42");
    BOOST_CHECK_EQUAL(to_string(make_token_id(1, 0)), "18446744073709551616");
    BOOST_CHECK_EQUAL(to_string(make_token_id(max, max)), "340282366920938463463374607431768211455");
}

BOOST_AUTO_TEST_CASE(display_and_parse)
{
    BOOST_CHECK_EQUAL(to_display_string(make_token_id(100, 1)), "100:1");
    BOOST_CHECK(parse_token_id("100:1") == make_token_id(100, 1));
    BOOST_CHECK(parse_token_id("0:0") == 0);
    BOOST_CHECK(parse_token_id("18446744073709551615:18446744073709551615") == make_token_id(UINT64_MAX, UINT64_MAX));

    const auto t = make_token_id(123456789, 987654321);
    BOOST_CHECK(parse_token_id(to_display_string(t)) == t);
}

BOOST_AUTO_TEST_CASE(parse_rejects_malformed)
{
    for (const char* s : {"", "100", ":1", "100:", "a:1", "1:b", "-1:1", "1:-1", "1:2:3", " 1:2", "18446744073709551616:0"})
        BOOST_CHECK_EXCEPTION(parse_token_id(s), LedgerError, has_kind(ErrorKind::invalid_arg));
}

BOOST_AUTO_TEST_CASE(hashing)
{
    std::unordered_set<token_id_t, token_id_hash> ids;
    for (std::uint64_t l = 0; l < 16; ++l)
        for (std::uint64_t i = 0; i < 16; ++i)
            ids.insert(make_token_id(l, i));
    BOOST_CHECK_EQUAL(ids.size(), 256u);
    BOOST_CHECK(ids.count(make_token_id(3, 4)));
    BOOST_CHECK(!ids.count(make_token_id(16, 0)));
}

BOOST_AUTO_TEST_CASE(object_ids)
{
    const auto a = new_object_id();
    const auto b = new_object_id();
    BOOST_CHECK(a != null_object_id);
    BOOST_CHECK(a < b);

    BOOST_CHECK(parse_object_id("17") == object_id_t{17});
    BOOST_CHECK_EXCEPTION(parse_object_id("0"), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EXCEPTION(parse_object_id("x"), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EXCEPTION(parse_u64("99999999999999999999", "amount"), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EQUAL(parse_u64("18446744073709551615", "amount"), UINT64_MAX);
}

BOOST_AUTO_TEST_SUITE_END()
