// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <set>

#include "../utils/checked_math.hpp"

#include "log.hpp"
#include "indexer.hpp"

namespace tokenledger {

amount_t SupplyIndexer::total_supply( const collection_id_t collection, const token_id_t token_id ) const
{
   std::lock_guard lock( mutex_ );
   const auto it = supply_.find( { collection, token_id } );
   return it == supply_.end() ? 0 : it->second;
}

std::size_t SupplyIndexer::events_processed() const
{
   std::lock_guard lock( mutex_ );
   return events_processed_;
}

std::size_t SupplyIndexer::inconsistent_events() const
{
   std::lock_guard lock( mutex_ );
   return inconsistent_events_;
}

std::vector< SupplyIndexer::Discrepancy > SupplyIndexer::verify_against( const Collection &collection ) const
{
   // the union of the token types known to either side
   std::set< token_id_t > token_ids;
   const auto recorded_ids = collection.token_ids();
   token_ids.insert( recorded_ids.begin(), recorded_ids.end() );
   {
      std::lock_guard lock( mutex_ );
      for ( const auto &[ key, s ] : supply_ )
         if ( key.first == collection.id() )
            token_ids.insert( key.second );
   }

   std::vector< Discrepancy > result;
   for ( const auto t : token_ids ) {
      const auto indexed = total_supply( collection.id(), t );
      const auto recorded = collection.total_supply( t );
      if ( indexed != recorded ) {
         LogPrint( LogCategory::events, "Supply discrepancy for token %1% in collection %2%: indexed %3%, recorded %4%\n", to_display_string( t ), collection.id(), indexed, recorded );
         result.push_back( { t, indexed, recorded } );
      }
   }
   return result;
}

void SupplyIndexer::replay( const std::span< const LedgerEvent > events )
{
   std::lock_guard lock( mutex_ );
   for ( const auto &e : events )
      apply( e );
}

void SupplyIndexer::reset()
{
   std::lock_guard lock( mutex_ );
   supply_.clear();
   events_processed_ = 0;
   inconsistent_events_ = 0;
}

void SupplyIndexer::process_ledger_event( const LedgerEvent &event )
{
   std::lock_guard lock( mutex_ );
   apply( event );
}

void SupplyIndexer::apply( const LedgerEvent &event )
{
   ++events_processed_;
   if ( const auto *const mint = std::get_if< MintEvent >( &event ) ) {
      const key_t key{ mint->collection, mint->token_id };
      const auto it = supply_.find( key );
      const auto increased = utils::math::checked_add( it == supply_.end() ? amount_t( 0 ) : it->second, mint->amount );
      if ( increased && *increased )
         supply_.insert_or_assign( key, *increased );
      else if ( !increased ) {
         ++inconsistent_events_;
         LogPrint( LogCategory::events, "Indexer cannot apply %1%: supply would overflow\n", mint->summary() );
      }
   }
   else if ( const auto *const burn = std::get_if< BurnEvent >( &event ) ) {
      const auto it = supply_.find( { burn->collection, burn->token_id } );
      const auto decreased = utils::math::checked_sub( it == supply_.end() ? amount_t( 0 ) : it->second, burn->amount );
      if ( !decreased ) {
         ++inconsistent_events_;
         LogPrint( LogCategory::events, "Indexer cannot apply %1%: more than the indexed supply burned\n", burn->summary() );
      }
      else if ( *decreased )
         it->second = *decreased;
      else if ( it != supply_.end() )
         supply_.erase( it );
   }
   // transfers move tokens around without changing any supply
}

}   // namespace tokenledger
