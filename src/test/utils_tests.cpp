// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_tokenledger.h"

#include "../utils/checked_math.hpp"
#include "../utils/lock_proof.hpp"
#include "../utils/scope_exit.hpp"
#include "../utils/string.hpp"

#include <cstdint>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

namespace {

struct Guarded {
    mutable std::shared_mutex mutex;
    int value = 0;

    using write_lock_proof = utils::write_lock_proof<&Guarded::mutex>;
    using read_lock_proof = utils::read_lock_proof<&Guarded::mutex>;

    void set(int v, write_lock_proof) { value = v; }
    int get(read_lock_proof) const { return value; }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(utils_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(checked_math)
{
    using utils::math::checked_add;
    using utils::math::checked_sub;

    BOOST_CHECK(checked_add<std::uint64_t>(2, 3) == 5u);
    BOOST_CHECK(checked_add<std::uint64_t>(UINT64_MAX - 1, 1) == UINT64_MAX);
    BOOST_CHECK(!checked_add<std::uint64_t>(UINT64_MAX, 1));
    BOOST_CHECK(!checked_add<std::uint64_t>(UINT64_MAX / 2 + 1, UINT64_MAX / 2 + 1));
    BOOST_CHECK(checked_sub<std::uint64_t>(5, 5) == 0u);
    BOOST_CHECK(!checked_sub<std::uint64_t>(4, 5));
    static_assert(!utils::math::checked_sub<unsigned>(0, 1));
}

BOOST_AUTO_TEST_CASE(strings)
{
    BOOST_CHECK_EQUAL(utils::abbreviate_for_display("alice"), "alice");
    const std::string long_address(50, 'x');
    const auto shortened = utils::abbreviate_for_display(long_address.substr(0, 10) + std::string(30, 'y') + "0123456789");
    BOOST_CHECK_EQUAL(shortened.size(), 37u);
    BOOST_CHECK(shortened.starts_with("xxxxxxxxxxyyyyyyy..."));
    BOOST_CHECK(shortened.ends_with("...yyyyyyy0123456789"));
    BOOST_CHECK_EQUAL(utils::abbreviate_for_display(std::string(40, 'z')).size(), 40u);

    BOOST_CHECK(utils::split("", ',').empty());
    const auto fields = utils::split("1,,3,", ',');
    BOOST_REQUIRE_EQUAL(fields.size(), 4u);
    BOOST_CHECK_EQUAL(fields[0], "1");
    BOOST_CHECK_EQUAL(fields[1], "");
    BOOST_CHECK_EQUAL(fields[2], "3");
    BOOST_CHECK_EQUAL(fields[3], "");
    BOOST_CHECK_EQUAL(utils::split("single", ',').size(), 1u);

    BOOST_CHECK_EQUAL(utils::trim("  \t a b \n"), "a b");
    BOOST_CHECK_EQUAL(utils::trim(" \r\n "), "");
}

BOOST_AUTO_TEST_CASE(lock_proofs)
{
    Guarded g;
    {
        std::unique_lock lock(g.mutex);
        g.set(7, {g, lock});
        const Guarded::write_lock_proof proof{g, lock};
        BOOST_CHECK_EQUAL(g.get(proof), 7); // a write proof is good for reading too
        const Guarded::read_lock_proof exclusive{g, lock};
        BOOST_CHECK_EQUAL(g.get(exclusive), 7);
    }
    std::shared_lock lock(g.mutex);
    const Guarded::read_lock_proof shared{g, lock};
    BOOST_CHECK_EQUAL(g.get(shared), 7);
}

BOOST_AUTO_TEST_CASE(on_exception_exit_runs_only_when_unwinding)
{
    int runs = 0;
    {
        utils::on_exception_exit guard([&] { ++runs; });
    }
    BOOST_CHECK_EQUAL(runs, 0);

    BOOST_CHECK_THROW(
        {
            utils::on_exception_exit guard([&] { ++runs; });
            throw std::runtime_error("boom");
        },
        std::runtime_error);
    BOOST_CHECK_EQUAL(runs, 1);

    BOOST_CHECK_THROW(
        {
            utils::on_exception_exit guard([&] { ++runs; });
            guard.release();
            throw std::runtime_error("boom");
        },
        std::runtime_error);
    BOOST_CHECK_EQUAL(runs, 1);

    // a guard created during unwinding only fires for a new exception
    try {
        struct Unwinder {
            int& runs;
            ~Unwinder()
            {
                utils::on_exception_exit guard([&] { ++runs; });
            }
        } unwinder{runs};
        throw std::runtime_error("outer");
    } catch (const std::runtime_error&) {
    }
    BOOST_CHECK_EQUAL(runs, 1);

    // a throwing handler doesn't replace the original exception
    BOOST_CHECK_THROW(
        {
            utils::on_exception_exit guard([] { throw std::logic_error("from handler"); });
            throw std::runtime_error("original");
        },
        std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
