// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../utils/string.hpp"

#include "log.hpp"
#include "events.hpp"

namespace tokenledger {

std::string MintEvent::summary() const
{
   return strprintf( "%1%: %2% of token %3% in collection %4% to %5%", name(), amount, to_display_string( token_id ), collection, utils::abbreviate_for_display( to ) );
}

std::string BurnEvent::summary() const
{
   return strprintf( "%1%: %2% of token %3% in collection %4% from %5%", name(), amount, to_display_string( token_id ), collection, utils::abbreviate_for_display( from ) );
}

std::string TransferEvent::summary() const
{
   return strprintf( "%1%: %2% of token %3% in collection %4% from %5% to %6%",
                     name(),
                     amount,
                     to_display_string( token_id ),
                     collection,
                     utils::abbreviate_for_display( from ),
                     utils::abbreviate_for_display( to ) );
}

std::string summary( const LedgerEvent &event )
{
   return std::visit( []( const auto &e ) { return e.summary(); }, event );
}

collection_id_t event_collection( const LedgerEvent &event ) noexcept
{
   return std::visit( []( const auto &e ) noexcept { return e.collection; }, event );
}

}   // namespace tokenledger
