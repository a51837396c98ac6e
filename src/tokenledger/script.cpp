// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <iterator>
#include <map>

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include "../utils/scope_exit.hpp"
#include "../utils/string.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "script.hpp"

namespace tokenledger {

namespace {

void require_args( const std::vector< std::string > &args, const std::size_t min, const std::size_t max, const char *usage )
{
   if ( args.size() < min || args.size() > max )
      throw LedgerError( ErrorKind::invalid_arg, std::string( "Usage: " ) + usage );
}

std::vector< object_id_t > parse_id_list( const std::string &s )
{
   std::vector< object_id_t > ids;
   for ( const auto &f : utils::split( s, ',' ) )
      ids.push_back( parse_object_id( f ) );
   return ids;
}

Collection::metadata_t parse_hex( const std::string &s )
{
   Collection::metadata_t data;
   try {
      boost::algorithm::unhex( s.begin(), s.end(), std::back_inserter( data ) );
   }
   catch ( const boost::algorithm::hex_decode_error & ) {
      throw LedgerError( ErrorKind::invalid_arg, "Metadata must be given as an even number of hex digits, got '" + s + "'" );
   }
   return data;
}

std::string to_hex( const Collection::metadata_t &data )
{
   std::string s;
   boost::algorithm::hex( data.begin(), data.end(), std::back_inserter( s ) );
   return s;
}

}   // namespace

void ScriptRunner::AnnouncingCustody::do_take_ownership( const address_t &owner, BalanceRecord &&balance )
{
   const auto id = balance.id();
   const auto amount = balance.value();
   const auto token_id = balance.token_id();
   const auto collection = balance.collection_id();
   inner_.take_ownership( owner, std::move( balance ) );
   out_ << "balance " << id << " (" << amount << " of token " << to_display_string( token_id ) << " in collection " << collection << ") now owned by " << owner << '\n';
}

void ScriptRunner::AnnouncingCustody::do_take_ownership( const address_t &owner, CollectionCap &&cap )
{
   const auto collection = cap.collection_id();
   inner_.take_ownership( owner, std::move( cap ) );
   out_ << "capability of collection " << collection << " now owned by " << owner << '\n';
}

ScriptRunner::ScriptRunner( WalletDirectory &wallets, std::ostream &out )
   : wallets_( wallets )
   , out_( out )
   , custody_( wallets, out )
   , ledger_( custody_ )
{
   ledger_.add_events_observer( *this );
}

ScriptRunner::~ScriptRunner()
{
   ledger_.remove_events_observer( *this );
}

ScriptRunner::Stats ScriptRunner::run( std::istream &script )
{
   std::string line;
   while ( std::getline( script, line ) )
      execute_line( line );
   LogPrint( LogCategory::ledger, "Script done: %1% commands, %2% failed, %3% of them fatally\n", stats_.lines, stats_.failed, stats_.fatal );
   return stats_;
}

bool ScriptRunner::execute_line( const std::string &line )
{
   const std::string content( utils::trim( line ) );
   if ( content.empty() || content.front() == '#' )
      return true;

   std::vector< std::string > tokens;
   boost::algorithm::split( tokens, content, boost::algorithm::is_space(), boost::algorithm::token_compress_on );
   ++stats_.lines;
   try {
      if ( tokens.size() < 2 )
         throw LedgerError( ErrorKind::invalid_arg, "Expected <sender> <command> [arguments...], got '" + content + "'" );
      const TxContext ctx( tokens[ 0 ] );
      execute( tokens[ 1 ], ctx, args_t( tokens.begin() + 2, tokens.end() ) );
      return true;
   }
   catch ( const LedgerError &e ) {
      out_ << "error: " << e.what() << '\n';
   }
   catch ( const InvariantViolation &e ) {
      ++stats_.fatal;
      out_ << "fatal: " << e.what() << '\n';
   }
   ++stats_.failed;
   return false;
}

void ScriptRunner::execute( const std::string &command, const TxContext &ctx, const args_t &args )
{
   static const std::map< std::string, command_handler_t > handlers{
     { "create", &ScriptRunner::create },
     { "mint", &ScriptRunner::mint },
     { "batch-mint", &ScriptRunner::batch_mint },
     { "split", &ScriptRunner::split },
     { "join", &ScriptRunner::join },
     { "zero", &ScriptRunner::zero },
     { "destroy-zero", &ScriptRunner::destroy_zero },
     { "transfer", &ScriptRunner::transfer },
     { "split-transfer", &ScriptRunner::split_transfer },
     { "batch-transfer", &ScriptRunner::batch_transfer },
     { "burn", &ScriptRunner::burn },
     { "batch-burn", &ScriptRunner::batch_burn },
     { "set-metadata", &ScriptRunner::set_metadata },
     { "get-metadata", &ScriptRunner::get_metadata },
     { "supply", &ScriptRunner::supply },
     { "balances", &ScriptRunner::balances },
     { "give-cap", &ScriptRunner::give_cap },
   };

   const auto it = handlers.find( command );
   if ( it == handlers.end() )
      throw LedgerError( ErrorKind::invalid_arg, "Unknown command: " + command );
   LogPrint( LogCategory::ledger, "Executing %1% for %2%\n", command, utils::abbreviate_for_display( ctx.sender ) );
   ( this->*it->second )( ctx, args );
}

void ScriptRunner::process_ledger_event( const LedgerEvent &event )
{
   out_ << "event " << summary( event ) << '\n';
}

const CollectionCap &ScriptRunner::held_cap( const TxContext &ctx, const collection_id_t collection )
{
   const auto *const cap = wallets_.wallet( ctx.sender ).find_cap( collection );
   if ( !cap )
      throw LedgerError( ErrorKind::not_found, strprintf( "%1% holds no capability of collection %2%", ctx.sender, collection ) );
   return *cap;
}

void ScriptRunner::create( const TxContext &ctx, const args_t &args )
{
   require_args( args, 0, 0, "<sender> create" );
   auto cap = ledger_.create_collection( ctx );
   out_ << "collection " << cap.collection_id() << " created\n";
   custody_.take_ownership( ctx.sender, std::move( cap ) );
}

void ScriptRunner::mint( const TxContext &ctx, const args_t &args )
{
   require_args( args, 3, 4, "<sender> mint <collection> <location:item> <amount> [recipient]" );
   const auto collection = parse_object_id( args[ 0 ] );
   const auto token_id = parse_token_id( args[ 1 ] );
   const auto amount = parse_u64( args[ 2 ], "amount" );
   const auto &recipient = args.size() > 3 ? args[ 3 ] : ctx.sender;
   ledger_.mint( ctx, held_cap( ctx, collection ), ledger_.collection( collection ), token_id, amount, recipient );
}

void ScriptRunner::batch_mint( const TxContext &ctx, const args_t &args )
{
   require_args( args, 3, 4, "<sender> batch-mint <collection> <location:item,...> <amount,...> [recipient]" );
   const auto collection = parse_object_id( args[ 0 ] );
   std::vector< token_id_t > token_ids;
   for ( const auto &t : utils::split( args[ 1 ], ',' ) )
      token_ids.push_back( parse_token_id( t ) );
   std::vector< amount_t > amounts;
   for ( const auto &a : utils::split( args[ 2 ], ',' ) )
      amounts.push_back( parse_u64( a, "amount" ) );
   const auto &recipient = args.size() > 3 ? args[ 3 ] : ctx.sender;
   ledger_.batch_mint( ctx, held_cap( ctx, collection ), ledger_.collection( collection ), token_ids, amounts, recipient );
}

void ScriptRunner::split( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> split <balance> <amount>" );
   const auto id = parse_object_id( args[ 0 ] );
   const auto amount = parse_u64( args[ 1 ], "amount" );
   auto &w = wallets_.wallet( ctx.sender );
   auto part = w.balance( id ).split( amount );
   const auto part_id = part.id();
   w.deposit( std::move( part ) );
   out_ << "balance " << id << " split, new balance " << part_id << " holds " << amount << '\n';
}

void ScriptRunner::join( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> join <balance> <other-balance>" );
   const auto id = parse_object_id( args[ 0 ] );
   const auto other_id = parse_object_id( args[ 1 ] );
   if ( id == other_id )
      throw LedgerError( ErrorKind::invalid_arg, strprintf( "Balance %1% cannot be joined with itself", id ) );
   auto &w = wallets_.wallet( ctx.sender );
   auto &target = w.balance( id );
   auto other = w.withdraw( other_id );
   utils::on_exception_exit restore( [ & ] {
      if ( other.is_live() )
         w.deposit( std::move( other ) );
   } );
   target.join( std::move( other ) );
   out_ << "balance " << other_id << " joined into balance " << id << ", which now holds " << target.value() << '\n';
}

void ScriptRunner::zero( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> zero <collection> <location:item>" );
   auto b = BalanceRecord::zero( parse_object_id( args[ 0 ] ), parse_token_id( args[ 1 ] ) );
   const auto id = b.id();
   wallets_.wallet( ctx.sender ).deposit( std::move( b ) );
   out_ << "empty balance " << id << " created\n";
}

void ScriptRunner::destroy_zero( const TxContext &ctx, const args_t &args )
{
   require_args( args, 1, 1, "<sender> destroy-zero <balance>" );
   const auto id = parse_object_id( args[ 0 ] );
   auto &w = wallets_.wallet( ctx.sender );
   auto b = w.withdraw( id );
   utils::on_exception_exit restore( [ & ] {
      if ( b.is_live() )
         w.deposit( std::move( b ) );
   } );
   BalanceRecord::destroy_zero( std::move( b ) );
   out_ << "empty balance " << id << " destroyed\n";
}

void ScriptRunner::transfer( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> transfer <balance> <recipient>" );
   const auto id = parse_object_id( args[ 0 ] );
   auto &w = wallets_.wallet( ctx.sender );
   auto b = w.withdraw( id );
   utils::on_exception_exit restore( [ & ] {
      if ( b.is_live() )
         w.deposit( std::move( b ) );
   } );
   ledger_.transfer( ctx, std::move( b ), args[ 1 ] );
}

void ScriptRunner::split_transfer( const TxContext &ctx, const args_t &args )
{
   require_args( args, 3, 3, "<sender> split-transfer <balance> <amount> <recipient>" );
   const auto id = parse_object_id( args[ 0 ] );
   const auto amount = parse_u64( args[ 1 ], "amount" );
   ledger_.split_and_transfer( ctx, wallets_.wallet( ctx.sender ).balance( id ), amount, args[ 2 ] );
}

void ScriptRunner::batch_transfer( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> batch-transfer <balance,...> <recipient>" );
   const auto ids = parse_id_list( args[ 0 ] );
   auto &w = wallets_.wallet( ctx.sender );
   std::vector< BalanceRecord > records;
   records.reserve( ids.size() );
   // whatever hasn't been transferred goes back
   utils::on_exception_exit restore( [ & ] {
      for ( auto &b : records )
         if ( b.is_live() )
            w.deposit( std::move( b ) );
   } );
   for ( const auto id : ids )
      records.push_back( w.withdraw( id ) );
   ledger_.batch_transfer( ctx, records, args[ 1 ] );
}

void ScriptRunner::burn( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> burn <collection> <balance>" );
   auto &collection = ledger_.collection( parse_object_id( args[ 0 ] ) );
   const auto id = parse_object_id( args[ 1 ] );
   auto &w = wallets_.wallet( ctx.sender );
   auto b = w.withdraw( id );
   utils::on_exception_exit restore( [ & ] {
      if ( b.is_live() )
         w.deposit( std::move( b ) );
   } );
   const auto amount = ledger_.burn( ctx, collection, std::move( b ) );
   out_ << "balance " << id << " burned, " << amount << " taken out of supply\n";
}

void ScriptRunner::batch_burn( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> batch-burn <collection> <balance,...>" );
   auto &collection = ledger_.collection( parse_object_id( args[ 0 ] ) );
   const auto ids = parse_id_list( args[ 1 ] );
   auto &w = wallets_.wallet( ctx.sender );
   std::vector< BalanceRecord > records;
   records.reserve( ids.size() );
   utils::on_exception_exit restore( [ & ] {
      for ( auto &b : records )
         if ( b.is_live() )
            w.deposit( std::move( b ) );
   } );
   for ( const auto id : ids )
      records.push_back( w.withdraw( id ) );
   ledger_.batch_burn( ctx, collection, records );
   out_ << records.size() << " balances burned\n";
}

void ScriptRunner::set_metadata( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 3, "<sender> set-metadata <collection> <location:item> [hex]" );
   const auto collection = parse_object_id( args[ 0 ] );
   const auto token_id = parse_token_id( args[ 1 ] );
   auto data = args.size() > 2 ? parse_hex( args[ 2 ] ) : Collection::metadata_t{};
   const auto size = data.size();
   ledger_.collection( collection ).set_metadata( held_cap( ctx, collection ), token_id, std::move( data ) );
   out_ << "metadata of token " << to_display_string( token_id ) << " in collection " << collection << " set, " << size << " bytes\n";
}

void ScriptRunner::get_metadata( const TxContext &, const args_t &args )
{
   require_args( args, 2, 2, "<sender> get-metadata <collection> <location:item>" );
   const auto collection = parse_object_id( args[ 0 ] );
   const auto token_id = parse_token_id( args[ 1 ] );
   const auto data = ledger_.collection( collection ).get_metadata( token_id );
   out_ << "metadata of token " << to_display_string( token_id ) << " in collection " << collection << ": " << to_hex( data ) << '\n';
}

void ScriptRunner::supply( const TxContext &, const args_t &args )
{
   require_args( args, 2, 2, "<sender> supply <collection> <location:item>" );
   const auto collection = parse_object_id( args[ 0 ] );
   const auto token_id = parse_token_id( args[ 1 ] );
   out_ << "supply of token " << to_display_string( token_id ) << " in collection " << collection << ": " << ledger_.collection( collection ).total_supply( token_id )
        << '\n';
}

void ScriptRunner::balances( const TxContext &ctx, const args_t &args )
{
   require_args( args, 0, 0, "<sender> balances" );
   const auto *const w = wallets_.find_wallet( ctx.sender );
   if ( !w || ( !w->balances_count() && w->cap_collection_ids().empty() ) ) {
      out_ << ctx.sender << " holds nothing\n";
      return;
   }
   for ( const auto id : w->balance_ids() ) {
      const auto &b = *w->find( id );
      out_ << "balance " << id << ": " << b.value() << " of token " << to_display_string( b.token_id() ) << " in collection " << b.collection_id() << '\n';
   }
   for ( const auto c : w->cap_collection_ids() )
      out_ << "capability of collection " << c << '\n';
}

void ScriptRunner::give_cap( const TxContext &ctx, const args_t &args )
{
   require_args( args, 2, 2, "<sender> give-cap <collection> <recipient>" );
   const auto collection = parse_object_id( args[ 0 ] );
   auto &w = wallets_.wallet( ctx.sender );
   auto cap = w.withdraw_cap( collection );
   utils::on_exception_exit restore( [ & ] {
      if ( cap )
         w.deposit_cap( std::move( cap ) );
   } );
   ledger_.transfer_cap( ctx, std::move( cap ), args[ 1 ] );
}

}   // namespace tokenledger
