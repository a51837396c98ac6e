// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_COLLECTION_CAP_HPP_INCLUDED
#define TOKENLEDGER_COLLECTION_CAP_HPP_INCLUDED

#include <utility>

#include "identification.hpp"

namespace tokenledger {

class Ledger;

// The admin capability of exactly one Collection: whoever holds it may mint and set metadata there. Only the Ledger can create one, exactly once per Collection, at
// the time of the Collection's creation. It can be handed over (moved) to delegate authority, but never duplicated (not copyable). A moved-from cap authorizes nothing.
class CollectionCap {
public:
   CollectionCap( CollectionCap &&other ) noexcept
      : id_( std::exchange( other.id_, null_object_id ) )
      , collection_( std::exchange( other.collection_, null_object_id ) )
   {}

   CollectionCap &operator=( CollectionCap &&rhs ) noexcept
   {
      if ( this != &rhs ) {
         id_ = std::exchange( rhs.id_, null_object_id );
         collection_ = std::exchange( rhs.collection_, null_object_id );
      }
      return *this;
   }

   CollectionCap( const CollectionCap & ) = delete;
   CollectionCap &operator=( const CollectionCap & ) = delete;

   [[nodiscard]] object_id_t id() const noexcept { return id_; }
   [[nodiscard]] collection_id_t collection_id() const noexcept { return collection_; }

   explicit operator bool() const noexcept { return collection_ != null_object_id; }

private:
   object_id_t id_;
   collection_id_t collection_;   // never changes while the cap is held

   CollectionCap( collection_id_t collection ) noexcept
      : id_( new_object_id() )
      , collection_( collection )
   {}

   friend class Ledger;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_COLLECTION_CAP_HPP_INCLUDED
