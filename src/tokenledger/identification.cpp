// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <atomic>

#include <boost/lexical_cast.hpp>

#include "errors.hpp"
#include "identification.hpp"

namespace tokenledger {

object_id_t new_object_id() noexcept
{
   static std::atomic< object_id_underlying_type > last_id{ 0 };
   return object_id_t{ ++last_id };
}

std::uint64_t parse_u64( const std::string &s, const char *what )
{
   // lexical_cast alone would accept "-1" for an unsigned target and wrap it around
   if ( s.empty() || !std::ranges::all_of( s, []( char c ) { return c >= '0' && c <= '9'; } ) )
      throw LedgerError( ErrorKind::invalid_arg, std::string( "Expected an unsigned decimal number for " ) + what + ", got '" + s + "'" );
   try {
      return boost::lexical_cast< std::uint64_t >( s );
   }
   catch ( const boost::bad_lexical_cast & ) {
      throw LedgerError( ErrorKind::invalid_arg, std::string( "Number too big for " ) + what + ": " + s );
   }
}

object_id_t parse_object_id( const std::string &s )
{
   const object_id_t id{ parse_u64( s, "object id" ) };
   if ( id == null_object_id )
      throw LedgerError( ErrorKind::invalid_arg, "Object id 0 never refers to anything" );
   return id;
}

}   // namespace tokenledger
