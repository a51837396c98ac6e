// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_tokenledger.h"

#include <algorithm>

#include <boost/test/unit_test.hpp>

using namespace tokenledger;

namespace {

const token_id_t T1 = make_token_id(5, 1);
const token_id_t T2 = make_token_id(5, 2);

} // namespace

BOOST_FIXTURE_TEST_SUITE(wallet_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(deposit_and_withdraw)
{
    Wallet w("carol");
    BOOST_CHECK_EQUAL(w.owner(), "carol");
    BOOST_CHECK_EQUAL(w.balances_count(), 0u);

    auto b = ledger.mint_balance(alice, cap, collection, T1, 10);
    const auto id = b.id();
    w.deposit(std::move(b));
    BOOST_CHECK(!b.is_live());
    BOOST_CHECK_EQUAL(w.balances_count(), 1u);
    BOOST_REQUIRE(w.find(id));
    BOOST_CHECK_EQUAL(w.balance(id).value(), 10u);

    // consumed records are no holdings
    BOOST_CHECK_EXCEPTION(w.deposit(std::move(b)), LedgerError, has_kind(ErrorKind::invalid_arg));

    auto out = w.withdraw(id);
    BOOST_CHECK(out.is_live());
    BOOST_CHECK_EQUAL(out.value(), 10u);
    BOOST_CHECK(!w.find(id));
    BOOST_CHECK_EXCEPTION(w.withdraw(id), LedgerError, has_kind(ErrorKind::not_found));
    BOOST_CHECK_EXCEPTION(w.balance(id), LedgerError, has_kind(ErrorKind::not_found));

    ledger.burn(alice, collection, std::move(out));
}

BOOST_AUTO_TEST_CASE(balance_of_sums_matching_records)
{
    auto& w = wallets.wallet("alice");
    ledger.mint(alice, cap, collection, T1, 10, "alice");
    ledger.mint(alice, cap, collection, T1, 15, "alice");
    ledger.mint(alice, cap, collection, T2, 1, "alice");
    w.deposit(BalanceRecord::zero(collection.id(), T1));

    const auto other_cap = ledger.create_collection(bob);
    ledger.mint(bob, other_cap, ledger.collection(other_cap.collection_id()), T1, 100, "alice");

    BOOST_CHECK_EQUAL(w.balances_count(), 5u);
    BOOST_CHECK_EQUAL(w.balance_of(collection.id(), T1), 25u);
    BOOST_CHECK_EQUAL(w.balance_of(collection.id(), T2), 1u);
    BOOST_CHECK_EQUAL(w.balance_of(other_cap.collection_id(), T1), 100u);
    BOOST_CHECK_EQUAL(w.balance_of(other_cap.collection_id(), T2), 0u);

    // ids in creation order
    const auto ids = w.balance_ids();
    BOOST_CHECK(std::is_sorted(ids.begin(), ids.end()));
}

BOOST_AUTO_TEST_CASE(caps)
{
    Wallet w("carol");
    BOOST_CHECK(!w.find_cap(collection.id()));
    w.deposit_cap(std::move(cap));
    BOOST_REQUIRE(w.find_cap(collection.id()));
    BOOST_CHECK(w.find_cap(collection.id())->collection_id() == collection.id());
    BOOST_REQUIRE_EQUAL(w.cap_collection_ids().size(), 1u);

    // the moved-from one is worthless
    BOOST_CHECK_EXCEPTION(w.deposit_cap(std::move(cap)), LedgerError, has_kind(ErrorKind::invalid_arg));

    auto c = w.withdraw_cap(collection.id());
    BOOST_CHECK(c);
    BOOST_CHECK(!w.find_cap(collection.id()));
    BOOST_CHECK_EXCEPTION(w.withdraw_cap(collection.id()), LedgerError, has_kind(ErrorKind::not_found));
}

BOOST_AUTO_TEST_CASE(directory)
{
    BOOST_CHECK(wallets.owners().empty());
    BOOST_CHECK(!wallets.find_wallet("bob"));
    BOOST_CHECK_EXCEPTION(wallets.wallet(""), LedgerError, has_kind(ErrorKind::invalid_arg));

    ledger.mint(alice, cap, collection, T1, 7, "bob");
    ledger.mint(alice, cap, collection, T1, 3, "alice");
    ledger.transfer_cap(alice, std::move(cap), "dave");

    const auto owners = wallets.owners();
    BOOST_REQUIRE_EQUAL(owners.size(), 3u);
    BOOST_CHECK_EQUAL(owners[0], "alice");
    BOOST_CHECK_EQUAL(owners[1], "bob");
    BOOST_CHECK_EQUAL(owners[2], "dave");
    BOOST_CHECK(&wallets.wallet("bob") == wallets.find_wallet("bob"));

    BOOST_CHECK_EQUAL(wallets.total_held(collection.id(), T1), 10u);
    BOOST_CHECK_EQUAL(wallets.total_held(collection.id(), T1), collection.total_supply(T1));
    BOOST_CHECK(wallets.find_wallet("dave")->find_cap(collection.id()));
}

BOOST_AUTO_TEST_SUITE_END()
