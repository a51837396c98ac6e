// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_tokenledger.h"

#include <boost/test/unit_test.hpp>

using namespace tokenledger;

namespace {

const token_id_t T1 = make_token_id(100, 1);
const token_id_t T2 = make_token_id(100, 2);

} // namespace

BOOST_FIXTURE_TEST_SUITE(balance_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(accessors)
{
    auto b = ledger.mint_balance(alice, cap, collection, T1, 100);
    BOOST_CHECK_EQUAL(b.value(), 100u);
    BOOST_CHECK(b.token_id() == T1);
    BOOST_CHECK(b.collection_id() == collection.id());
    BOOST_CHECK(b.is_live());
    BOOST_CHECK(b.id() != null_object_id);
    ledger.burn(alice, collection, std::move(b));
}

BOOST_AUTO_TEST_CASE(split)
{
    auto b = ledger.mint_balance(alice, cap, collection, T1, 100);
    auto part = b.split(30);
    BOOST_CHECK_EQUAL(b.value(), 70u);
    BOOST_CHECK_EQUAL(part.value(), 30u);
    BOOST_CHECK(part.token_id() == T1);
    BOOST_CHECK(part.collection_id() == collection.id());
    BOOST_CHECK(part.id() != b.id());
    // supply is not affected, and neither are there any events
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 100u);
    BOOST_CHECK_EQUAL(recorder.events.size(), 1u);

    // all of it
    auto rest = b.split(70);
    BOOST_CHECK_EQUAL(b.value(), 0u);
    BOOST_CHECK(b.is_live());
    BOOST_CHECK_EQUAL(rest.value(), 70u);

    BalanceRecord::destroy_zero(std::move(b));
    ledger.burn(alice, collection, std::move(part));
    ledger.burn(alice, collection, std::move(rest));
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 0u);
}

BOOST_AUTO_TEST_CASE(split_failures)
{
    auto b = ledger.mint_balance(alice, cap, collection, T1, 100);
    BOOST_CHECK_EXCEPTION((void)b.split(0), LedgerError, has_kind(ErrorKind::zero_amount));
    BOOST_CHECK_EXCEPTION((void)b.split(101), LedgerError, has_kind(ErrorKind::insufficient_balance));
    BOOST_CHECK_EQUAL(b.value(), 100u);

    auto z = BalanceRecord::zero(collection.id(), T1);
    // zero amount is checked first
    BOOST_CHECK_EXCEPTION((void)z.split(0), LedgerError, has_kind(ErrorKind::zero_amount));
    BOOST_CHECK_EXCEPTION((void)z.split(1), LedgerError, has_kind(ErrorKind::insufficient_balance));

    BalanceRecord::destroy_zero(std::move(z));
    ledger.burn(alice, collection, std::move(b));
}

BOOST_AUTO_TEST_CASE(join)
{
    auto a = ledger.mint_balance(alice, cap, collection, T1, 60);
    auto b = ledger.mint_balance(alice, cap, collection, T1, 40);
    const auto a_id = a.id();
    a.join(std::move(b));
    BOOST_CHECK_EQUAL(a.value(), 100u);
    BOOST_CHECK(a.id() == a_id);
    BOOST_CHECK(!b.is_live());
    BOOST_CHECK_EQUAL(b.value(), 0u);
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 100u);

    // a consumed record can't be joined again for any effect, nor burned
    BOOST_CHECK_EXCEPTION(ledger.burn(alice, collection, std::move(b)), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 100u);

    ledger.burn(alice, collection, std::move(a));
}

BOOST_AUTO_TEST_CASE(join_failures_leave_both_untouched)
{
    auto a = ledger.mint_balance(alice, cap, collection, T1, 10);
    auto b = ledger.mint_balance(alice, cap, collection, T2, 20);
    BOOST_CHECK_EXCEPTION(a.join(std::move(b)), LedgerError, has_kind(ErrorKind::wrong_token_id));
    BOOST_CHECK_EQUAL(a.value(), 10u);
    BOOST_CHECK_EQUAL(b.value(), 20u);
    BOOST_CHECK(a.is_live());
    BOOST_CHECK(b.is_live());

    auto other_cap = ledger.create_collection(bob);
    auto& other = ledger.collection(other_cap.collection_id());
    auto c = ledger.mint_balance(bob, other_cap, other, T1, 5);
    // collection is checked before token type
    BOOST_CHECK_EXCEPTION(a.join(std::move(c)), LedgerError, has_kind(ErrorKind::wrong_collection));
    BOOST_CHECK_EXCEPTION(b.join(std::move(c)), LedgerError, has_kind(ErrorKind::wrong_collection));
    BOOST_CHECK_EQUAL(a.value(), 10u);
    BOOST_CHECK_EQUAL(c.value(), 5u);
    BOOST_CHECK(c.is_live());

    BOOST_CHECK_EXCEPTION(a.join(std::move(a)), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EQUAL(a.value(), 10u);

    ledger.burn(alice, collection, std::move(a));
    ledger.burn(alice, collection, std::move(b));
    ledger.burn(bob, other, std::move(c));
}

BOOST_AUTO_TEST_CASE(split_join_inverse)
{
    auto b = ledger.mint_balance(alice, cap, collection, T1, 1000);
    for (const amount_t k : {1u, 7u, 500u, 999u, 1000u}) {
        auto part = b.split(k);
        b.join(std::move(part));
        BOOST_CHECK_EQUAL(b.value(), 1000u);
    }

    // operand order doesn't matter
    auto x = b.split(300);
    auto y = b.split(200);
    x.join(std::move(y));
    auto p = b.split(300);
    auto q = b.split(200);
    q.join(std::move(p));
    BOOST_CHECK_EQUAL(x.value(), q.value());
    BOOST_CHECK_EQUAL(b.value(), 0u);
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 1000u);

    b.join(std::move(x));
    b.join(std::move(q));
    BOOST_CHECK_EQUAL(b.value(), 1000u);
    ledger.burn(alice, collection, std::move(b));
}

BOOST_AUTO_TEST_CASE(zero_and_destroy_zero)
{
    auto z = BalanceRecord::zero(collection.id(), T1);
    BOOST_CHECK_EQUAL(z.value(), 0u);
    BOOST_CHECK(z.is_live());
    BOOST_CHECK(z.token_id() == T1);
    BOOST_CHECK(z.collection_id() == collection.id());
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 0u);
    BalanceRecord::destroy_zero(std::move(z));
    BOOST_CHECK(!z.is_live());
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 0u);
    BOOST_CHECK(recorder.events.empty());
}

BOOST_AUTO_TEST_CASE(destroy_zero_needs_empty)
{
    auto b = ledger.mint_balance(alice, cap, collection, T1, 1);
    BOOST_CHECK_EXCEPTION(BalanceRecord::destroy_zero(std::move(b)), LedgerError, has_kind(ErrorKind::insufficient_balance));
    BOOST_CHECK(b.is_live());
    BOOST_CHECK_EQUAL(b.value(), 1u);
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 1u);
    ledger.burn(alice, collection, std::move(b));
}

BOOST_AUTO_TEST_CASE(zero_as_join_accumulator)
{
    auto acc = BalanceRecord::zero(collection.id(), T1);
    for (amount_t a = 1; a <= 10; ++a)
        acc.join(ledger.mint_balance(alice, cap, collection, T1, a));
    BOOST_CHECK_EQUAL(acc.value(), 55u);
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 55u);
    BOOST_CHECK_EQUAL(ledger.burn(alice, collection, std::move(acc)), 55u);
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 0u);
}

BOOST_AUTO_TEST_CASE(consumed_records_take_nothing_in)
{
    auto a = ledger.mint_balance(alice, cap, collection, T1, 100);
    auto c = std::move(a);
    auto part = c.split(30);

    // moved from: neither a target nor a source of tokens
    BOOST_CHECK_EXCEPTION(a.join(std::move(part)), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK(part.is_live());
    BOOST_CHECK_EQUAL(part.value(), 30u);
    BOOST_CHECK(!a.is_live());
    BOOST_CHECK_EQUAL(a.value(), 0u);
    BOOST_CHECK_EXCEPTION((void)a.split(1), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EXCEPTION(part.join(std::move(a)), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EXCEPTION(BalanceRecord::destroy_zero(std::move(a)), LedgerError, has_kind(ErrorKind::invalid_arg));

    // burned
    auto burned = c.split(10);
    ledger.burn(alice, collection, std::move(burned));
    BOOST_CHECK_EXCEPTION(burned.join(std::move(part)), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EXCEPTION((void)burned.split(1), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EQUAL(part.value(), 30u);

    // joined into another
    auto joined = c.split(5);
    part.join(std::move(joined));
    BOOST_CHECK_EXCEPTION(joined.join(std::move(part)), LedgerError, has_kind(ErrorKind::invalid_arg));
    BOOST_CHECK_EXCEPTION((void)joined.split(1), LedgerError, has_kind(ErrorKind::invalid_arg));

    // supply still matches the live records
    BOOST_CHECK_EQUAL(c.value() + part.value(), 90u);
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 90u);
    ledger.burn(alice, collection, std::move(c));
    ledger.burn(alice, collection, std::move(part));
    BOOST_CHECK_EQUAL(collection.total_supply(T1), 0u);
}

BOOST_AUTO_TEST_CASE(move_semantics)
{
    auto a = ledger.mint_balance(alice, cap, collection, T1, 10);
    const auto id = a.id();
    BalanceRecord b = std::move(a);
    BOOST_CHECK(!a.is_live());
    BOOST_CHECK_EQUAL(a.value(), 0u);
    BOOST_CHECK(b.is_live());
    BOOST_CHECK_EQUAL(b.value(), 10u);
    BOOST_CHECK(b.id() == id);

    auto c = BalanceRecord::zero(collection.id(), T1);
    c = std::move(b);
    BOOST_CHECK_EQUAL(c.value(), 10u);
    BOOST_CHECK(!b.is_live());
    ledger.burn(alice, collection, std::move(c));
}

BOOST_AUTO_TEST_SUITE_END()
