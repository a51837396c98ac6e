// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_WALLET_HPP_INCLUDED
#define TOKENLEDGER_WALLET_HPP_INCLUDED

#include <map>
#include <vector>

#include "balance.hpp"
#include "collection_cap.hpp"
#include "custody.hpp"
#include "identification.hpp"

namespace tokenledger {

// Everything owned by one address: balance records keyed by their id, and collection caps. Not thread-safe.
class Wallet {
public:
   explicit Wallet( address_t owner ) noexcept;
   ~Wallet();

   Wallet( const Wallet & ) = delete;
   Wallet &operator=( const Wallet & ) = delete;

   [[nodiscard]] const address_t &owner() const noexcept { return owner_; }

   // Throws LedgerError(invalid_arg) for a record that is not live
   void deposit( BalanceRecord &&balance );

   // Throw LedgerError(not_found) if no record with that id is held here
   BalanceRecord withdraw( object_id_t balance_id );
   BalanceRecord &balance( object_id_t balance_id );

   const BalanceRecord *find( object_id_t balance_id ) const noexcept;

   std::vector< object_id_t > balance_ids() const;
   std::size_t balances_count() const noexcept { return balances_.size(); }

   // The sum over all records held here of the given collection and token type
   amount_t balance_of( collection_id_t collection, token_id_t token_id ) const noexcept;

   // Throws LedgerError(invalid_arg) for a moved-from cap
   void deposit_cap( CollectionCap &&cap );

   // Throws LedgerError(not_found) if no cap of that collection is held here
   CollectionCap withdraw_cap( collection_id_t collection );

   const CollectionCap *find_cap( collection_id_t collection ) const noexcept;

   std::vector< collection_id_t > cap_collection_ids() const;

private:
   const address_t owner_;
   std::map< object_id_t, BalanceRecord > balances_;   // only live records
   std::vector< CollectionCap > caps_;
};

// In-memory Custody: an address -> Wallet directory, with wallets being created on first delivery to (or lookup of) an address. Not thread-safe.
class WalletDirectory final : public Custody {
public:
   Wallet &wallet( const address_t &owner );
   const Wallet *find_wallet( const address_t &owner ) const noexcept;

   // sorted
   std::vector< address_t > owners() const;

   // Over all wallets, see Wallet::balance_of(). Together with the Collection's total supply this audits conservation.
   amount_t total_held( collection_id_t collection, token_id_t token_id ) const noexcept;

private:
   std::map< address_t, Wallet > wallets_;

   void do_take_ownership( const address_t &owner, BalanceRecord &&balance ) override;
   void do_take_ownership( const address_t &owner, CollectionCap &&cap ) override;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_WALLET_HPP_INCLUDED
