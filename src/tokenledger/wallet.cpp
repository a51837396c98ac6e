// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>

#include "../utils/string.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "wallet.hpp"

namespace tokenledger {

Wallet::Wallet( address_t owner ) noexcept
   : owner_( std::move( owner ) )
{}

Wallet::~Wallet()
{
   // the holdings are not leaking, they just go away together with the whole ledger
   for ( auto &[ id, b ] : balances_ ) {
      if ( b.value() )
         LogPrint( LogCategory::balance, "Wallet of %1% closed while still holding balance %2% (%3% of token %4% in collection %5%)\n",
                   utils::abbreviate_for_display( owner_ ),
                   id,
                   b.value(),
                   to_display_string( b.token_id() ),
                   b.collection_id() );
      b.retire();
   }
}

void Wallet::deposit( BalanceRecord &&balance )
{
   if ( !balance.is_live() )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "Balance %1% is no longer live, cannot be deposited to %2%", balance.id(), owner_ ) );
   const auto id = balance.id();
   const auto [ it, inserted ] = balances_.try_emplace( id, std::move( balance ) );
   if ( !inserted )
      throw_invariant_violation( strprintf( "Balance %1% deposited to %2% twice", id, owner_ ) );
}

BalanceRecord Wallet::withdraw( const object_id_t balance_id )
{
   const auto it = balances_.find( balance_id );
   if ( it == balances_.end() )
      throw LedgerError( ErrorKind::not_found, strprintf( "%1% holds no balance %2%", owner_, balance_id ) );
   BalanceRecord b = std::move( it->second );
   balances_.erase( it );
   return b;
}

BalanceRecord &Wallet::balance( const object_id_t balance_id )
{
   const auto it = balances_.find( balance_id );
   if ( it == balances_.end() )
      throw LedgerError( ErrorKind::not_found, strprintf( "%1% holds no balance %2%", owner_, balance_id ) );
   return it->second;
}

const BalanceRecord *Wallet::find( const object_id_t balance_id ) const noexcept
{
   const auto it = balances_.find( balance_id );
   return it == balances_.end() ? nullptr : &it->second;
}

std::vector< object_id_t > Wallet::balance_ids() const
{
   std::vector< object_id_t > ids;
   ids.reserve( balances_.size() );
   for ( const auto &[ id, b ] : balances_ )
      ids.push_back( id );
   return ids;
}

amount_t Wallet::balance_of( const collection_id_t collection, const token_id_t token_id ) const noexcept
{
   amount_t sum = 0;   // can't overflow as long as supply doesn't
   for ( const auto &[ id, b ] : balances_ )
      if ( b.collection_id() == collection && b.token_id() == token_id )
         sum += b.value();
   return sum;
}

void Wallet::deposit_cap( CollectionCap &&cap )
{
   if ( !cap )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "An empty capability cannot be deposited to %1%", owner_ ) );
   caps_.push_back( std::move( cap ) );
}

CollectionCap Wallet::withdraw_cap( const collection_id_t collection )
{
   const auto it = std::ranges::find( caps_, collection, &CollectionCap::collection_id );
   if ( it == caps_.end() )
      throw LedgerError( ErrorKind::not_found, strprintf( "%1% holds no capability of collection %2%", owner_, collection ) );
   CollectionCap cap = std::move( *it );
   caps_.erase( it );
   return cap;
}

const CollectionCap *Wallet::find_cap( const collection_id_t collection ) const noexcept
{
   const auto it = std::ranges::find( caps_, collection, &CollectionCap::collection_id );
   return it == caps_.end() ? nullptr : &*it;
}

std::vector< collection_id_t > Wallet::cap_collection_ids() const
{
   std::vector< collection_id_t > ids;
   ids.reserve( caps_.size() );
   for ( const auto &c : caps_ )
      ids.push_back( c.collection_id() );
   return ids;
}

Wallet &WalletDirectory::wallet( const address_t &owner )
{
   if ( owner.empty() )
      throw LedgerError( ErrorKind::invalid_arg, "Empty address" );
   return wallets_.try_emplace( owner, owner ).first->second;
}

const Wallet *WalletDirectory::find_wallet( const address_t &owner ) const noexcept
{
   const auto it = wallets_.find( owner );
   return it == wallets_.end() ? nullptr : &it->second;
}

std::vector< address_t > WalletDirectory::owners() const
{
   std::vector< address_t > result;
   result.reserve( wallets_.size() );
   for ( const auto &[ a, w ] : wallets_ )
      result.push_back( a );
   return result;
}

amount_t WalletDirectory::total_held( const collection_id_t collection, const token_id_t token_id ) const noexcept
{
   amount_t sum = 0;
   for ( const auto &[ a, w ] : wallets_ )
      sum += w.balance_of( collection, token_id );
   return sum;
}

void WalletDirectory::do_take_ownership( const address_t &owner, BalanceRecord &&balance )
{
   auto &w = wallet( owner );
   LogPrint( LogCategory::balance, "Balance %1% (%2% of token %3%) now owned by %4%\n",
             balance.id(),
             balance.value(),
             to_display_string( balance.token_id() ),
             utils::abbreviate_for_display( owner ) );
   w.deposit( std::move( balance ) );
}

void WalletDirectory::do_take_ownership( const address_t &owner, CollectionCap &&cap )
{
   auto &w = wallet( owner );
   LogPrint( LogCategory::ledger, "Capability %1% of collection %2% now owned by %3%\n", cap.id(), cap.collection_id(), utils::abbreviate_for_display( owner ) );
   w.deposit_cap( std::move( cap ) );
}

}   // namespace tokenledger
