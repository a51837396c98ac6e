// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_INDEXER_HPP_INCLUDED
#define TOKENLEDGER_INDEXER_HPP_INCLUDED

#include <cstddef>
#include <mutex>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "../utils/enum.hpp"

#include "collection.hpp"
#include "events.hpp"

namespace tokenledger {

// An off-ledger view of the total supplies, built solely from audit events: mints add, burns subtract, transfers don't change anything.
// Thread-safe.
class SupplyIndexer final : public EventsObserver {
public:
   struct Discrepancy {
      token_id_t token_id;
      amount_t indexed;
      amount_t recorded;   // by the Collection

      bool operator==( const Discrepancy &rhs ) const = default;
   };

   amount_t total_supply( collection_id_t collection, token_id_t token_id ) const;

   std::size_t events_processed() const;

   // Events that could not be applied as they would have brought an indexed supply out of the u64 range
   std::size_t inconsistent_events() const;

   // Every token type of the collection for which the indexed supply and the one recorded by the collection differ, in ascending token id order.
   // Empty means both paths agree.
   std::vector< Discrepancy > verify_against( const Collection &collection ) const;

   void replay( std::span< const LedgerEvent > events );
   void reset();

private:
   using key_t = std::pair< collection_id_t, token_id_t >;

   struct key_hash {
      std::size_t operator()( const key_t &key ) const noexcept
      {
         std::size_t seed = token_id_hash{}( key.second );
         boost::hash_combine( seed, utils::to_underlying( key.first ) );
         return seed;
      }
   };

   mutable std::mutex mutex_;
   std::unordered_map< key_t, amount_t, key_hash > supply_;   // no zero entries
   std::size_t events_processed_ = 0;
   std::size_t inconsistent_events_ = 0;

   void process_ledger_event( const LedgerEvent &event ) override;
   void apply( const LedgerEvent &event );   // with mutex_ locked
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_INDEXER_HPP_INCLUDED
