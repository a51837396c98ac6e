// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>

#include "errors.hpp"
#include "identification.hpp"
#include "token_id.hpp"

namespace tokenledger {

std::string to_string( token_id_t token_id )
{
   if ( !token_id )
      return "0";
   std::string s;
   while ( token_id ) {
      s.push_back( static_cast< char >( '0' + static_cast< int >( token_id % 10 ) ) );
      token_id /= 10;
   }
   std::ranges::reverse( s );
   return s;
}

std::string to_display_string( const token_id_t token_id )
{
   return std::to_string( token_location( token_id ) ) + ':' + std::to_string( token_item( token_id ) );
}

token_id_t parse_token_id( const std::string &s )
{
   const auto pos = s.find( ':' );
   if ( pos == std::string::npos )
      throw LedgerError( ErrorKind::invalid_arg, "Token id must be given as location:item, got '" + s + "'" );
   return make_token_id( parse_u64( s.substr( 0, pos ), "token location" ), parse_u64( s.substr( pos + 1 ), "token item" ) );
}

}   // namespace tokenledger
