// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_EVENTS_HPP_INCLUDED
#define TOKENLEDGER_EVENTS_HPP_INCLUDED

#include <string>
#include <variant>

#include "identification.hpp"
#include "token_id.hpp"

namespace tokenledger {

// Audit events, emitted by the Ledger once per unit operation, after the operation has fully succeeded. They are sufficient to reconstruct every token type's total
// supply: the sum of MintEvent amounts minus the sum of BurnEvent amounts.

struct MintEvent {
   collection_id_t collection;
   token_id_t token_id;
   address_t to;   // the sender of the minting transaction, not necessarily the recipient of the minted balance
   amount_t amount;

   static constexpr const char *name() noexcept { return "Mint"; }
   std::string summary() const;

   bool operator==( const MintEvent &rhs ) const = default;
};

struct BurnEvent {
   collection_id_t collection;
   token_id_t token_id;
   address_t from;
   amount_t amount;

   static constexpr const char *name() noexcept { return "Burn"; }
   std::string summary() const;

   bool operator==( const BurnEvent &rhs ) const = default;
};

struct TransferEvent {
   collection_id_t collection;
   token_id_t token_id;
   address_t from;
   address_t to;
   amount_t amount;

   static constexpr const char *name() noexcept { return "Transfer"; }
   std::string summary() const;

   bool operator==( const TransferEvent &rhs ) const = default;
};

using LedgerEvent = std::variant< MintEvent, BurnEvent, TransferEvent >;

std::string summary( const LedgerEvent &event );
collection_id_t event_collection( const LedgerEvent &event ) noexcept;

class EventsObserver {
public:
   void notify_ledger_event( const LedgerEvent &event ) { process_ledger_event( event ); }

protected:
   ~EventsObserver() = default;

private:
   // ATTENTION: NO overridden function is allowed to call Ledger::add_events_observer() or Ledger::remove_events_observer(), nor any Ledger operation mutating the
   //            same collection, during its call from the same thread, otherwise it would result in a DEADLOCK! Nor is it allowed to throw: by the time it is
   //            called the operation is already complete and cannot be undone.
   virtual void process_ledger_event( const LedgerEvent &event ) = 0;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_EVENTS_HPP_INCLUDED
