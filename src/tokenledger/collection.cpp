// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <mutex>

#include "../utils/checked_math.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "collection.hpp"

namespace tokenledger {

void Collection::authorize( const CollectionCap &cap ) const
{
   if ( cap.collection_id() != id_ )
      throw LedgerError( ErrorKind::wrong_collection,
                         strprintf( "Capability %1% is for collection %2%, not for collection %3%", cap.id(), cap.collection_id(), id_ ) );
}

amount_t Collection::total_supply( const token_id_t token_id ) const
{
   std::shared_lock lock( mutex_ );
   return total_supply( token_id, { *this, lock } );
}

amount_t Collection::total_supply( const token_id_t token_id, read_lock_proof ) const noexcept
{
   const auto it = supply_.find( token_id );
   return it == supply_.end() ? 0 : it->second;
}

std::vector< token_id_t > Collection::token_ids() const
{
   std::vector< token_id_t > ids;
   {
      std::shared_lock lock( mutex_ );
      ids.reserve( supply_.size() );
      for ( const auto &[ t, s ] : supply_ )
         ids.push_back( t );
   }
   std::sort( ids.begin(), ids.end() );
   return ids;
}

void Collection::increase_supply( const token_id_t token_id, const amount_t delta, write_lock_proof wlp )
{
   const auto current = total_supply( token_id, wlp );
   const auto increased = utils::math::checked_add( current, delta );
   if ( !increased )
      throw_invariant_violation( strprintf( "Supply overflow in collection %1% for token %2%: %3% + %4% exceeds the 64-bit range",
                                            id_,
                                            to_display_string( token_id ),
                                            current,
                                            delta ) );
   if ( *increased )
      supply_[ token_id ] = *increased;
   LogPrint( LogCategory::supply, "Supply of token %1% in collection %2% increased by %3% to %4%\n", to_display_string( token_id ), id_, delta, *increased );
}

void Collection::decrease_supply( const token_id_t token_id, const amount_t delta, write_lock_proof wlp )
{
   const auto current = total_supply( token_id, wlp );
   const auto decreased = utils::math::checked_sub( current, delta );
   if ( !decreased )
      throw_invariant_violation( strprintf( "Supply underflow in collection %1% for token %2%: cannot take %3% out of %4%, a balance escaped supply tracking",
                                            id_,
                                            to_display_string( token_id ),
                                            delta,
                                            current ) );
   if ( *decreased )
      supply_[ token_id ] = *decreased;
   else
      supply_.erase( token_id );
   LogPrint( LogCategory::supply, "Supply of token %1% in collection %2% decreased by %3% to %4%\n", to_display_string( token_id ), id_, delta, *decreased );
}

void Collection::set_metadata( const CollectionCap &cap, const token_id_t token_id, metadata_t data )
{
   authorize( cap );
   const auto size = data.size();
   std::unique_lock lock( mutex_ );
   metadata_.insert_or_assign( token_id, std::move( data ) );
   LogPrint( LogCategory::metadata, "Metadata of token %1% in collection %2% set, %3% bytes\n", to_display_string( token_id ), id_, size );
}

Collection::metadata_t Collection::get_metadata( const token_id_t token_id ) const
{
   std::shared_lock lock( mutex_ );
   const auto it = metadata_.find( token_id );
   if ( it == metadata_.end() )
      throw LedgerError( ErrorKind::not_found, strprintf( "No metadata for token %1% in collection %2%", to_display_string( token_id ), id_ ) );
   return it->second;
}

bool Collection::has_metadata( const token_id_t token_id ) const
{
   std::shared_lock lock( mutex_ );
   return metadata_.contains( token_id );
}

std::vector< token_id_t > Collection::metadata_token_ids() const
{
   std::vector< token_id_t > ids;
   {
      std::shared_lock lock( mutex_ );
      ids.reserve( metadata_.size() );
      for ( const auto &[ t, m ] : metadata_ )
         ids.push_back( t );
   }
   std::sort( ids.begin(), ids.end() );
   return ids;
}

}   // namespace tokenledger
