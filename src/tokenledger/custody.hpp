// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_CUSTODY_HPP_INCLUDED
#define TOKENLEDGER_CUSTODY_HPP_INCLUDED

#include "balance.hpp"
#include "collection_cap.hpp"
#include "identification.hpp"

namespace tokenledger {

// Where objects handed to an address end up. The Ledger delivers minted and transferred balances, as well as transferred caps, through this interface, and never
// keeps track of them afterwards.
class Custody {
public:
   void take_ownership( const address_t &owner, BalanceRecord &&balance ) { do_take_ownership( owner, std::move( balance ) ); }
   void take_ownership( const address_t &owner, CollectionCap &&cap ) { do_take_ownership( owner, std::move( cap ) ); }

protected:
   ~Custody() = default;

private:
   // Must either take the object over or throw leaving it untouched
   virtual void do_take_ownership( const address_t &owner, BalanceRecord &&balance ) = 0;
   virtual void do_take_ownership( const address_t &owner, CollectionCap &&cap ) = 0;
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_CUSTODY_HPP_INCLUDED
