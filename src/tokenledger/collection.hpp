// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_COLLECTION_HPP_INCLUDED
#define TOKENLEDGER_COLLECTION_HPP_INCLUDED

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "../utils/lock_proof.hpp"

#include "collection_cap.hpp"
#include "identification.hpp"
#include "token_id.hpp"

namespace tokenledger {

// The shared ledger: the running total supply of every token type (the supply ledger) and the optional metadata blob of every token type (the metadata store).
// Supply changes only through Ledger's mint and burn operations. Collections are created by the Ledger together with their CollectionCap and are never destroyed.
//
// Thread-safe: every mutation is serialized on an internal mutex, queries take it shared.
class Collection {
public:
   using metadata_t = std::vector< unsigned char >;

   Collection( const Collection & ) = delete;
   Collection &operator=( const Collection & ) = delete;

   [[nodiscard]] collection_id_t id() const noexcept { return id_; }

   // 0 for a token type never minted (or fully burned) - absence of supply is not an error
   amount_t total_supply( token_id_t token_id ) const;

   // token types currently having non-zero supply, in ascending order
   std::vector< token_id_t > token_ids() const;

   // Upsert. Throws LedgerError(wrong_collection) if the cap belongs to another collection.
   void set_metadata( const CollectionCap &cap, token_id_t token_id, metadata_t data );

   // Throws LedgerError(not_found) if no metadata was ever set for the token type. Empty metadata is not the same as none.
   metadata_t get_metadata( token_id_t token_id ) const;

   bool has_metadata( token_id_t token_id ) const;

   std::vector< token_id_t > metadata_token_ids() const;

   // Throws LedgerError(wrong_collection) unless the cap is this collection's own
   void authorize( const CollectionCap &cap ) const;

private:
   const collection_id_t id_;

   mutable std::shared_mutex mutex_;
   // All below data members, till the end of this class, are protected by mutex_
   std::unordered_map< token_id_t, amount_t, token_id_hash > supply_;   // no zero entries
   std::unordered_map< token_id_t, metadata_t, token_id_hash > metadata_;

   using read_lock_proof = utils::read_lock_proof< &Collection::mutex_ >;
   using write_lock_proof = utils::write_lock_proof< &Collection::mutex_ >;

   explicit Collection( collection_id_t id ) noexcept
      : id_( id )
   {}

   amount_t total_supply( token_id_t token_id, read_lock_proof ) const noexcept;

   // Both validate first and only then mutate. Overflow and underflow are invariant violations: they throw InvariantViolation, with nothing changed.
   void increase_supply( token_id_t token_id, amount_t delta, write_lock_proof wlp );
   void decrease_supply( token_id_t token_id, amount_t delta, write_lock_proof wlp );

   friend class Ledger;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_COLLECTION_HPP_INCLUDED
