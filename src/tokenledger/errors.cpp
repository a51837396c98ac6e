// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "log.hpp"
#include "errors.hpp"

namespace tokenledger {

std::string_view to_string( const ErrorKind kind ) noexcept
{
   switch ( kind ) {
      case ErrorKind::wrong_collection:
         return "WrongCollection";
      case ErrorKind::wrong_token_id:
         return "WrongTokenId";
      case ErrorKind::insufficient_balance:
         return "InsufficientBalance";
      case ErrorKind::invalid_arg:
         return "InvalidArg";
      case ErrorKind::zero_amount:
         return "ZeroAmount";
      case ErrorKind::not_found:
         return "NotFound";
   }
   return "Unknown";
}

void throw_invariant_violation( const std::string &what )
{
   LogPrintf( "FATAL: ledger invariant violation: %s\n", what );
   throw InvariantViolation( what );
}

}   // namespace tokenledger
