// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_SCRIPT_HPP_INCLUDED
#define TOKENLEDGER_SCRIPT_HPP_INCLUDED

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "custody.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "wallet.hpp"

namespace tokenledger {

// Applies a line-based command script to a ledger whose objects are kept in a WalletDirectory. Every line is one transaction of the form
//
//   <sender> <command> [arguments...]
//
// with the sender acting on objects in its own wallet only, which is what ownership means here. Token ids are given as location:item, balances and collections
// by their ids, lists comma-separated, metadata in hex. Empty lines and lines starting with '#' are skipped.
//
//   create                                        new collection, its cap goes to the sender
//   mint <coll> <token> <amount> [recipient]      needs the sender to hold the collection's cap
//   batch-mint <coll> <token,...> <amount,...> [recipient]
//   split <balance> <amount>
//   join <balance> <other-balance>
//   zero <coll> <token>
//   destroy-zero <balance>
//   transfer <balance> <recipient>
//   split-transfer <balance> <amount> <recipient>
//   batch-transfer <balance,...> <recipient>
//   burn <coll> <balance>
//   batch-burn <coll> <balance,...>
//   set-metadata <coll> <token> [hex]
//   get-metadata <coll> <token>
//   supply <coll> <token>
//   balances
//   give-cap <coll> <recipient>
//
// Results, emitted events and errors are written to the output stream. A failing line changes nothing (except for a batch failing part-way) and the script goes on.
class ScriptRunner final : public EventsObserver {
public:
   struct Stats {
      std::size_t lines = 0;   // commands executed, not counting blank and comment lines
      std::size_t failed = 0;
      std::size_t fatal = 0;   // failed due to invariant violations
   };

   ScriptRunner( WalletDirectory &wallets, std::ostream &out );
   ~ScriptRunner();

   Stats run( std::istream &script );

   // Returns whether the line succeeded. Blank and comment lines succeed trivially.
   bool execute_line( const std::string &line );

   [[nodiscard]] const Stats &stats() const noexcept { return stats_; }

   Ledger &ledger() noexcept { return ledger_; }
   WalletDirectory &wallets() noexcept { return wallets_; }

private:
   using args_t = std::vector< std::string >;
   using command_handler_t = void ( ScriptRunner::* )( const TxContext &, const args_t & );

   // Reports every object handed to an address before passing it on to the wallets
   class AnnouncingCustody final : public Custody {
   public:
      AnnouncingCustody( Custody &inner, std::ostream &out ) noexcept
         : inner_( inner )
         , out_( out )
      {}

   private:
      Custody &inner_;
      std::ostream &out_;

      void do_take_ownership( const address_t &owner, BalanceRecord &&balance ) override;
      void do_take_ownership( const address_t &owner, CollectionCap &&cap ) override;
   };

   WalletDirectory &wallets_;
   std::ostream &out_;
   AnnouncingCustody custody_;
   Ledger ledger_;
   Stats stats_;

   void process_ledger_event( const LedgerEvent &event ) override;

   void execute( const std::string &command, const TxContext &ctx, const args_t &args );

   const CollectionCap &held_cap( const TxContext &ctx, collection_id_t collection );

   void create( const TxContext &ctx, const args_t &args );
   void mint( const TxContext &ctx, const args_t &args );
   void batch_mint( const TxContext &ctx, const args_t &args );
   void split( const TxContext &ctx, const args_t &args );
   void join( const TxContext &ctx, const args_t &args );
   void zero( const TxContext &ctx, const args_t &args );
   void destroy_zero( const TxContext &ctx, const args_t &args );
   void transfer( const TxContext &ctx, const args_t &args );
   void split_transfer( const TxContext &ctx, const args_t &args );
   void batch_transfer( const TxContext &ctx, const args_t &args );
   void burn( const TxContext &ctx, const args_t &args );
   void batch_burn( const TxContext &ctx, const args_t &args );
   void set_metadata( const TxContext &ctx, const args_t &args );
   void get_metadata( const TxContext &ctx, const args_t &args );
   void supply( const TxContext &ctx, const args_t &args );
   void balances( const TxContext &ctx, const args_t &args );
   void give_cap( const TxContext &ctx, const args_t &args );
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_SCRIPT_HPP_INCLUDED
