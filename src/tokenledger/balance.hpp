// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_BALANCE_HPP_INCLUDED
#define TOKENLEDGER_BALANCE_HPP_INCLUDED

#include "identification.hpp"
#include "token_id.hpp"

namespace tokenledger {

// An exclusively owned holding of one token type of one collection. Possessing the object is the authority to split, join, transfer or burn it.
//
// Move-only. A record stops being live once it is consumed (joined into another, burned, or destroyed while empty) or moved from; a non-live record holds nothing.
// Records come into existence only through mint, split and zero(), so that the sum of the amounts of the live records of a token type always equals its total supply.
class BalanceRecord {
public:
   // An empty record, e.g. as the initial accumulator for repeated joins. Always succeeds and doesn't touch any supply.
   static BalanceRecord zero( collection_id_t collection, token_id_t token_id );

   // Consumes an empty record. Throws LedgerError(insufficient_balance) if the amount isn't 0, in which case the record is left untouched.
   // Like split() and join(), throws LedgerError(invalid_arg) for a record that isn't live.
   static void destroy_zero( BalanceRecord &&balance );

   // Takes `amount` out of this record into a new one of the same collection and token type.
   // Throws LedgerError(zero_amount) for 0, LedgerError(insufficient_balance) for more than held.
   [[nodiscard]] BalanceRecord split( amount_t amount );

   // Merges other into this one and consumes it. Both must be live (else LedgerError(invalid_arg)), of the same collection (else LedgerError(wrong_collection))
   // and token type (else LedgerError(wrong_token_id)); on failure neither record is changed.
   void join( BalanceRecord &&other );

   [[nodiscard]] object_id_t id() const noexcept { return id_; }
   [[nodiscard]] amount_t value() const noexcept { return amount_; }
   [[nodiscard]] token_id_t token_id() const noexcept { return token_id_; }
   [[nodiscard]] collection_id_t collection_id() const noexcept { return collection_; }
   [[nodiscard]] bool is_live() const noexcept { return live_; }

   BalanceRecord( BalanceRecord &&other ) noexcept;
   BalanceRecord &operator=( BalanceRecord &&rhs ) noexcept;
   BalanceRecord( const BalanceRecord & ) = delete;
   BalanceRecord &operator=( const BalanceRecord & ) = delete;

   ~BalanceRecord();

private:
   object_id_t id_;
   collection_id_t collection_;
   token_id_t token_id_;
   amount_t amount_;
   bool live_ = true;

   BalanceRecord( collection_id_t collection, token_id_t token_id, amount_t amount ) noexcept;

   // Marks as consumed; the amount is accounted for elsewhere from now on
   void retire() noexcept;

   // A live record with a non-zero amount must never just vanish
   void report_if_escaping() const noexcept;

   friend class Ledger;
   friend class Wallet;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_BALANCE_HPP_INCLUDED
