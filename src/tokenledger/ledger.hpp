// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_LEDGER_HPP_INCLUDED
#define TOKENLEDGER_LEDGER_HPP_INCLUDED

#include <memory>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "balance.hpp"
#include "collection.hpp"
#include "collection_cap.hpp"
#include "custody.hpp"
#include "events.hpp"
#include "identification.hpp"
#include "token_id.hpp"

namespace tokenledger {

// The entry points of all ledger operations that involve more than a single BalanceRecord: collection creation, mint, burn, transfer and their batch variants.
// Each unit operation first validates everything it can, throwing LedgerError with nothing changed, and only then mutates, and finally emits its audit event to
// the registered observers. A Collection's supply changes and the emission of the corresponding events are serialized on that Collection's mutex.
//
// Batch operations are sequences of unit operations applied in input order: a failure part-way through leaves the already applied ones in effect.
class Ledger {
public:
   // Minted and transferred balances, as well as transferred caps, are delivered to the custody, which must outlive the Ledger
   explicit Ledger( Custody &custody ) noexcept;

   Ledger( const Ledger & ) = delete;
   Ledger &operator=( const Ledger & ) = delete;

   // Creates a Collection together with its one and only cap, which is returned for the sender of ctx to keep or hand over
   [[nodiscard]] CollectionCap create_collection( const TxContext &ctx );

   // Throw LedgerError(not_found) for an unknown id
   Collection &collection( collection_id_t id ) { return lookup_collection( id ); }
   const Collection &collection( collection_id_t id ) const { return lookup_collection( id ); }

   bool has_collection( collection_id_t id ) const;
   std::vector< collection_id_t > collection_ids() const;   // sorted

   // Throws LedgerError(wrong_collection) if cap isn't the collection's, LedgerError(zero_amount) for 0 amount.
   // Emits MintEvent{ collection, token_id, ctx.sender, amount }.
   [[nodiscard]] BalanceRecord mint_balance( const TxContext &ctx, const CollectionCap &cap, Collection &collection, token_id_t token_id, amount_t amount );

   // mint_balance() delivering the new record to recipient, no further event. If the custody refuses the record, it gets burned again.
   void mint( const TxContext &ctx, const CollectionCap &cap, Collection &collection, token_id_t token_id, amount_t amount, const address_t &recipient );

   // Throws LedgerError(invalid_arg) before minting anything if the spans are empty or differ in length
   void batch_mint( const TxContext &ctx,
                    const CollectionCap &cap,
                    Collection &collection,
                    std::span< const token_id_t > token_ids,
                    std::span< const amount_t > amounts,
                    const address_t &recipient );

   // Consumes the record, whatever its amount, and returns the amount burned. Throws LedgerError(wrong_collection) if the record isn't of the collection.
   // Emits BurnEvent{ collection, token_id, ctx.sender, amount }.
   amount_t burn( const TxContext &ctx, Collection &collection, BalanceRecord &&balance );

   // On failure the records burned so far are left consumed (not live) in the span
   void batch_burn( const TxContext &ctx, Collection &collection, std::span< BalanceRecord > balances );

   // Delivers the record to recipient, then emits TransferEvent{ collection, token_id, ctx.sender, recipient, amount }. If the custody refuses the record, it is
   // left untouched and nothing is emitted.
   void transfer( const TxContext &ctx, BalanceRecord &&balance, const address_t &recipient );

   // split() and transfer() as one unit: if the transfer fails, the part is joined back
   void split_and_transfer( const TxContext &ctx, BalanceRecord &balance, amount_t amount, const address_t &recipient );

   void batch_transfer( const TxContext &ctx, std::span< BalanceRecord > balances, const address_t &recipient );

   // Hands the admin authority of a collection over to recipient. No audit event, as no tokens move.
   void transfer_cap( const TxContext &ctx, CollectionCap &&cap, const address_t &recipient );

   void add_events_observer( EventsObserver &o );
   void remove_events_observer( EventsObserver &o );

private:
   Custody &custody_;

   mutable std::shared_mutex collections_mutex_;
   std::unordered_map< collection_id_t, std::unique_ptr< Collection > > collections_;   // protected by collections_mutex_, never shrinks

   mutable std::shared_mutex observers_mutex_;
   std::vector< EventsObserver * > observers_;   // protected by observers_mutex_

   Collection &lookup_collection( collection_id_t id ) const;
   void emit( const LedgerEvent &event ) const;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_LEDGER_HPP_INCLUDED
