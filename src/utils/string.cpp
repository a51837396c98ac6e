// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <locale>

#include "string.hpp"

namespace utils {

std::string abbreviate_for_display( std::string s )
{
   constexpr auto threshold = 40;
   if ( s.size() > threshold ) {
      constexpr auto edge_length = threshold / 2 - 3;
      s.replace( edge_length, s.size() - 2 * edge_length, "..." );
   }
   return s;
}

std::vector< std::string > split( std::string_view s, const char separator )
{
   std::vector< std::string > fields;
   if ( s.empty() )
      return fields;
   for ( auto pos = s.find( separator ); pos != std::string_view::npos; pos = s.find( separator ) ) {
      fields.emplace_back( s.substr( 0, pos ) );
      s.remove_prefix( pos + 1 );
   }
   fields.emplace_back( s );
   return fields;
}

std::string_view trim( std::string_view s ) noexcept
{
   const auto is_space = []( char c ) { return std::isspace( c, std::locale::classic() ); };
   while ( !s.empty() && is_space( s.front() ) )
      s.remove_prefix( 1 );
   while ( !s.empty() && is_space( s.back() ) )
      s.remove_suffix( 1 );
   return s;
}

}   // namespace utils
