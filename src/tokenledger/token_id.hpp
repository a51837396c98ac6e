// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_TOKEN_ID_HPP_INCLUDED
#define TOKENLEDGER_TOKEN_ID_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/container_hash/hash.hpp>

namespace tokenledger {

// A token type is identified by 128 bits: the upper 64 are the location namespace, the lower 64 the item within that location.
__extension__ typedef unsigned __int128 token_id_t;

inline constexpr token_id_t item_mask = ( token_id_t( 1 ) << 64 ) - 1;

constexpr token_id_t make_token_id( std::uint64_t location_id, std::uint64_t item_id ) noexcept
{
   return ( token_id_t( location_id ) << 64 ) | item_id;
}

constexpr std::uint64_t token_location( token_id_t token_id ) noexcept
{
   return static_cast< std::uint64_t >( token_id >> 64 );
}

constexpr std::uint64_t token_item( token_id_t token_id ) noexcept
{
   return static_cast< std::uint64_t >( token_id & item_mask );
}

static_assert( token_location( make_token_id( 100, 1 ) ) == 100 );
static_assert( token_item( make_token_id( 100, 1 ) ) == 1 );
static_assert( token_item( make_token_id( 0, UINT64_MAX ) ) == UINT64_MAX && token_location( make_token_id( 0, UINT64_MAX ) ) == 0 );

struct token_id_hash {
   std::size_t operator()( token_id_t token_id ) const noexcept
   {
      std::size_t seed = 0;
      boost::hash_combine( seed, token_location( token_id ) );
      boost::hash_combine( seed, token_item( token_id ) );
      return seed;
   }
};

// Decimal rendering of the full 128-bit value
std::string to_string( token_id_t token_id );

// "location:item", which is also what parse_token_id() accepts
std::string to_display_string( token_id_t token_id );

// Throws LedgerError(invalid_arg) for anything other than two unsigned decimal 64-bit numbers separated by a colon
token_id_t parse_token_id( const std::string &s );

}   // namespace tokenledger

#endif   // TOKENLEDGER_TOKEN_ID_HPP_INCLUDED
