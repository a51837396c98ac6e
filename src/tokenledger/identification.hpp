// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_IDENTIFICATION_HPP_INCLUDED
#define TOKENLEDGER_IDENTIFICATION_HPP_INCLUDED

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include "../utils/enum.hpp"

namespace tokenledger {

using object_id_underlying_type = std::uint64_t;

// Opaque unique identifier of every ledger object: collections, caps and balance records alike. The value 0 is never handed out.
enum class object_id_t : object_id_underlying_type {};

using collection_id_t = object_id_t;

inline constexpr object_id_t null_object_id{ 0 };

// Process-wide, strictly increasing. Thread-safe.
object_id_t new_object_id() noexcept;

inline std::ostream &operator<<( std::ostream &os, object_id_t id )
{
   return os << utils::to_underlying( id );
}

using amount_t = std::uint64_t;

using address_t = std::string;

// The transaction on whose behalf an operation runs. sender is the acting identity recorded in audit events as "to" of a mint and "from" of a burn or transfer.
struct TxContext {
   address_t sender;

   explicit TxContext( address_t s )
      : sender( std::move( s ) )
   {}
};

// Strict parsing of driver input: decimal digits only, must fit. Throws LedgerError(invalid_arg), naming `what` in the message.
std::uint64_t parse_u64( const std::string &s, const char *what );
object_id_t parse_object_id( const std::string &s );

}   // namespace tokenledger

#endif   // TOKENLEDGER_IDENTIFICATION_HPP_INCLUDED
