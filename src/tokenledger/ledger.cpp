// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <mutex>

#include "../utils/scope_exit.hpp"
#include "../utils/string.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "ledger.hpp"

namespace tokenledger {

namespace {

void validate_recipient( const address_t &recipient )
{
   if ( recipient.empty() )
      throw LedgerError( ErrorKind::invalid_arg, "Recipient address cannot be empty" );
}

void validate_live( const BalanceRecord &balance )
{
   if ( !balance.is_live() )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "Balance %1% has already been consumed", balance.id() ) );
}

}   // namespace

Ledger::Ledger( Custody &custody ) noexcept
   : custody_( custody )
{}

CollectionCap Ledger::create_collection( const TxContext &ctx )
{
   const auto id = new_object_id();
   std::unique_ptr< Collection > c( new Collection( id ) );
   CollectionCap cap( id );
   {
      std::unique_lock lock( collections_mutex_ );
      collections_.emplace( id, std::move( c ) );
   }
   LogPrint( LogCategory::ledger, "Collection %1% created by %2%, capability %3%\n", id, utils::abbreviate_for_display( ctx.sender ), cap.id() );
   return cap;
}

Collection &Ledger::lookup_collection( const collection_id_t id ) const
{
   std::shared_lock lock( collections_mutex_ );
   const auto it = collections_.find( id );
   if ( it == collections_.end() )
      throw LedgerError( ErrorKind::not_found, strprintf( "No collection with id %1%", id ) );
   return *it->second;   // never erased, so the reference stays valid after unlocking
}

bool Ledger::has_collection( const collection_id_t id ) const
{
   std::shared_lock lock( collections_mutex_ );
   return collections_.contains( id );
}

std::vector< collection_id_t > Ledger::collection_ids() const
{
   std::vector< collection_id_t > ids;
   {
      std::shared_lock lock( collections_mutex_ );
      ids.reserve( collections_.size() );
      for ( const auto &[ id, c ] : collections_ )
         ids.push_back( id );
   }
   std::ranges::sort( ids );
   return ids;
}

BalanceRecord Ledger::mint_balance( const TxContext &ctx, const CollectionCap &cap, Collection &collection, const token_id_t token_id, const amount_t amount )
{
   collection.authorize( cap );
   if ( !amount )
      throw LedgerError( ErrorKind::zero_amount, strprintf( "Cannot mint a zero amount of token %1% in collection %2%", to_display_string( token_id ), collection.id() ) );

   std::unique_lock lock( collection.mutex_ );
   collection.increase_supply( token_id, amount, { collection, lock } );   // may throw, with nothing changed
   BalanceRecord b( collection.id(), token_id, amount );
   LogPrint( LogCategory::ledger, "Minted %1% of token %2% in collection %3% into balance %4%\n", amount, to_display_string( token_id ), collection.id(), b.id() );
   emit( MintEvent{ collection.id(), token_id, ctx.sender, amount } );
   return b;
}

void Ledger::mint( const TxContext &ctx,
                   const CollectionCap &cap,
                   Collection &collection,
                   const token_id_t token_id,
                   const amount_t amount,
                   const address_t &recipient )
{
   validate_recipient( recipient );
   auto b = mint_balance( ctx, cap, collection, token_id, amount );
   // a record the custody refused must not escape supply tracking
   utils::on_exception_exit revert( [ & ] { burn( ctx, collection, std::move( b ) ); } );
   custody_.take_ownership( recipient, std::move( b ) );
}

void Ledger::batch_mint( const TxContext &ctx,
                         const CollectionCap &cap,
                         Collection &collection,
                         const std::span< const token_id_t > token_ids,
                         const std::span< const amount_t > amounts,
                         const address_t &recipient )
{
   if ( token_ids.empty() )
      throw LedgerError( ErrorKind::invalid_arg, "Nothing to mint" );
   if ( token_ids.size() != amounts.size() )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "%1% token ids but %2% amounts given for a batch mint", token_ids.size(), amounts.size() ) );
   validate_recipient( recipient );

   LogPrint( LogCategory::ledger, "Batch minting %1% token types in collection %2%\n", token_ids.size(), collection.id() );
   for ( std::size_t i = 0; i < token_ids.size(); ++i )
      mint( ctx, cap, collection, token_ids[ i ], amounts[ i ], recipient );
}

amount_t Ledger::burn( const TxContext &ctx, Collection &collection, BalanceRecord &&balance )
{
   if ( balance.collection_id() != collection.id() )
      throw LedgerError( ErrorKind::wrong_collection,
                         strprintf( "Balance %1% is of collection %2%, cannot be burned in collection %3%", balance.id(), balance.collection_id(), collection.id() ) );
   validate_live( balance );

   const auto token_id = balance.token_id();
   const auto amount = balance.value();
   std::unique_lock lock( collection.mutex_ );
   collection.decrease_supply( token_id, amount, { collection, lock } );   // may throw, with nothing changed
   balance.retire();
   LogPrint( LogCategory::ledger, "Burned balance %1%: %2% of token %3% in collection %4%\n", balance.id(), amount, to_display_string( token_id ), collection.id() );
   emit( BurnEvent{ collection.id(), token_id, ctx.sender, amount } );
   return amount;
}

void Ledger::batch_burn( const TxContext &ctx, Collection &collection, const std::span< BalanceRecord > balances )
{
   LogPrint( LogCategory::ledger, "Batch burning %1% balances in collection %2%\n", balances.size(), collection.id() );
   for ( auto &b : balances )
      burn( ctx, collection, std::move( b ) );
}

void Ledger::transfer( const TxContext &ctx, BalanceRecord &&balance, const address_t &recipient )
{
   validate_live( balance );
   validate_recipient( recipient );

   TransferEvent event{ balance.collection_id(), balance.token_id(), ctx.sender, recipient, balance.value() };
   custody_.take_ownership( recipient, std::move( balance ) );
   emit( event );
}

void Ledger::split_and_transfer( const TxContext &ctx, BalanceRecord &balance, const amount_t amount, const address_t &recipient )
{
   validate_recipient( recipient );
   auto part = balance.split( amount );
   // the custody either takes the part over or leaves it untouched
   utils::on_exception_exit rejoin( [ & ] { balance.join( std::move( part ) ); } );
   transfer( ctx, std::move( part ), recipient );
}

void Ledger::batch_transfer( const TxContext &ctx, const std::span< BalanceRecord > balances, const address_t &recipient )
{
   validate_recipient( recipient );
   for ( auto &b : balances )
      transfer( ctx, std::move( b ), recipient );
}

void Ledger::transfer_cap( const TxContext &ctx, CollectionCap &&cap, const address_t &recipient )
{
   if ( !cap )
      throw LedgerError( ErrorKind::invalid_arg, "Capability has been handed over already" );
   validate_recipient( recipient );
   LogPrint( LogCategory::ledger, "Capability %1% of collection %2% handed over from %3% to %4%\n",
             cap.id(),
             cap.collection_id(),
             utils::abbreviate_for_display( ctx.sender ),
             utils::abbreviate_for_display( recipient ) );
   custody_.take_ownership( recipient, std::move( cap ) );
}

void Ledger::add_events_observer( EventsObserver &o )
{
   std::lock_guard lock( observers_mutex_ );
   if ( std::ranges::find( observers_, &o ) == observers_.end() )
      observers_.push_back( &o );
}

void Ledger::remove_events_observer( EventsObserver &o )
{
   std::lock_guard lock( observers_mutex_ );
   std::erase( observers_, &o );
}

void Ledger::emit( const LedgerEvent &event ) const
{
   // Called only after the operation has been completed SUCCESSFULLY, and for mint and burn with the collection still locked, so that observers see the events of a
   // collection in the very order its supply changed.
   LogPrint( LogCategory::events, "Event %1%\n", summary( event ) );
   std::shared_lock lock( observers_mutex_ );
   for ( auto *const o : observers_ )
      o->notify_ledger_event( event );
}

}   // namespace tokenledger
