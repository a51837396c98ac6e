// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <utility>

#include "../utils/checked_math.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "balance.hpp"

namespace tokenledger {

BalanceRecord::BalanceRecord( const collection_id_t collection, const token_id_t token_id, const amount_t amount ) noexcept
   : id_( new_object_id() )
   , collection_( collection )
   , token_id_( token_id )
   , amount_( amount )
{}

BalanceRecord::BalanceRecord( BalanceRecord &&other ) noexcept
   : id_( other.id_ )
   , collection_( other.collection_ )
   , token_id_( other.token_id_ )
   , amount_( std::exchange( other.amount_, 0 ) )
   , live_( std::exchange( other.live_, false ) )
{}

BalanceRecord &BalanceRecord::operator=( BalanceRecord &&rhs ) noexcept
{
   if ( this != &rhs ) {
      report_if_escaping();
      id_ = rhs.id_;
      collection_ = rhs.collection_;
      token_id_ = rhs.token_id_;
      amount_ = std::exchange( rhs.amount_, 0 );
      live_ = std::exchange( rhs.live_, false );
   }
   return *this;
}

BalanceRecord::~BalanceRecord()
{
   report_if_escaping();
}

void BalanceRecord::report_if_escaping() const noexcept
{
   if ( live_ && amount_ )
      try {
         LogPrintf( "FATAL: balance %1% holding %2% of token %3% in collection %4% destroyed without burn or join, escaped supply tracking\n",
                    id_,
                    amount_,
                    to_display_string( token_id_ ),
                    collection_ );
      }
      catch ( ... ) {
      }
}

void BalanceRecord::retire() noexcept
{
   amount_ = 0;
   live_ = false;
}

BalanceRecord BalanceRecord::zero( const collection_id_t collection, const token_id_t token_id )
{
   BalanceRecord b( collection, token_id, 0 );
   LogPrint( LogCategory::balance, "Empty balance %1% of token %2% in collection %3% created\n", b.id(), to_display_string( token_id ), collection );
   return b;
}

void BalanceRecord::destroy_zero( BalanceRecord &&balance )
{
   if ( !balance.live_ )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "Balance %1% has already been consumed", balance.id_ ) );
   if ( balance.amount_ )
      throw LedgerError( ErrorKind::insufficient_balance,
                         strprintf( "Only an empty balance can be destroyed, balance %1% still holds %2%", balance.id_, balance.amount_ ) );
   LogPrint( LogCategory::balance, "Empty balance %1% destroyed\n", balance.id_ );
   balance.retire();
}

BalanceRecord BalanceRecord::split( const amount_t amount )
{
   if ( !live_ )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "Balance %1% has already been consumed, nothing can be split off it", id_ ) );
   if ( !amount )
      throw LedgerError( ErrorKind::zero_amount, strprintf( "Cannot split a zero amount off balance %1%", id_ ) );
   if ( amount > amount_ )
      throw LedgerError( ErrorKind::insufficient_balance, strprintf( "Cannot split %1% off balance %2% holding only %3%", amount, id_, amount_ ) );

   BalanceRecord part( collection_, token_id_, amount );
   amount_ -= amount;
   LogPrint( LogCategory::balance, "Balance %1% split into %2% (%3% left) and new balance %4% (%5%)\n", id_, amount_ + amount, amount_, part.id(), amount );
   return part;
}

void BalanceRecord::join( BalanceRecord &&other )
{
   if ( &other == this )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "Balance %1% cannot be joined with itself", id_ ) );
   if ( !live_ || !other.live_ )
      throw LedgerError( ErrorKind::invalid_arg,
                         strprintf( "Cannot join balance %1% into balance %2%, %3% has already been consumed", other.id_, id_, live_ ? other.id_ : id_ ) );
   if ( other.collection_ != collection_ )
      throw LedgerError( ErrorKind::wrong_collection,
                         strprintf( "Cannot join balance %1% of collection %2% into balance %3% of collection %4%", other.id_, other.collection_, id_, collection_ ) );
   if ( other.token_id_ != token_id_ )
      throw LedgerError( ErrorKind::wrong_token_id,
                         strprintf( "Cannot join balance %1% of token %2% into balance %3% of token %4%",
                                    other.id_,
                                    to_display_string( other.token_id_ ),
                                    id_,
                                    to_display_string( token_id_ ) ) );

   const auto joined = utils::math::checked_add( amount_, other.amount_ );
   if ( !joined )
      throw_invariant_violation( strprintf( "Joining balance %1% (%2%) into balance %3% (%4%) overflows, more than the total supply can be", other.id_, other.amount_, id_, amount_ ) );

   LogPrint( LogCategory::balance, "Balance %1% (%2%) joined into balance %3% (%4%)\n", other.id_, other.amount_, id_, amount_ );
   amount_ = *joined;
   other.retire();
}

}   // namespace tokenledger
