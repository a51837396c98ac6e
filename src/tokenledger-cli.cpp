// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "utils/args.hpp"
#include "tokenledger/config.hpp"
#include "tokenledger/log.hpp"
#include "tokenledger/script.hpp"
#include "tokenledger/wallet.hpp"

namespace {

void print_usage()
{
   std::cout << "Usage: tokenledger-cli [options]\n"
                "\n"
                "Reads a ledger command script from -script=<file>, or from standard input, and applies it line by line.\n"
                "\n"
                "Options:\n"
                "  -conf=<file>        Read options from <file> as well (name=value lines)\n"
                "  -script=<file>      Command script to run\n"
                "  -debug=<category>   Log a category: ledger, supply, metadata, balance, events, config, all\n"
                "  -printtoconsole     Log to standard output\n"
                "  -logfile=<file>     Log to <file>\n"
                "  -logtimestamps      Prepend timestamps to log lines (default: 1)\n";
}

int app_main( int argc, char *argv[] )
{
   utils::ArgsManager args;
   args.parse_parameters( argc, argv );
   if ( args.is_arg_set( "-?" ) || args.is_arg_set( "-h" ) || args.is_arg_set( "-help" ) ) {
      print_usage();
      return EXIT_SUCCESS;
   }
   if ( args.is_arg_set( "-conf" ) )
      args.read_config_file( args.get_arg( "-conf", "" ) );

   const auto config = tokenledger::LedgerConfig::from_args( args );
   tokenledger::init_logging( config.log );
   for ( const auto &c : config.unknown_debug_categories )
      tokenledger::LogPrintf( "Unsupported logging category -debug=%s\n", c );
   tokenledger::LogPrint( tokenledger::LogCategory::config, "Script: %s\n", config.script_path.empty() ? "<stdin>" : config.script_path );

   tokenledger::WalletDirectory wallets;
   tokenledger::ScriptRunner runner( wallets, std::cout );
   tokenledger::ScriptRunner::Stats stats;
   if ( config.script_path.empty() )
      stats = runner.run( std::cin );
   else {
      std::ifstream script( config.script_path );
      if ( !script )
         throw std::invalid_argument( "Cannot open script file: " + config.script_path );
      stats = runner.run( script );
   }

   std::cout << stats.lines << " commands, " << stats.failed << " failed\n";
   return stats.fatal ? 2 : EXIT_SUCCESS;
}

}   // namespace

int main( int argc, char *argv[] )
{
   try {
      const int ret = app_main( argc, argv );
      tokenledger::shutdown_logging();
      return ret;
   }
   catch ( const std::exception &e ) {
      std::cerr << "Error: " << e.what() << '\n';
      tokenledger::shutdown_logging();
      return EXIT_FAILURE;
   }
}
