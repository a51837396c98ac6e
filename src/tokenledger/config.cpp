// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../utils/enum.hpp"

#include "config.hpp"

namespace tokenledger {

LedgerConfig LedgerConfig::from_args( const utils::ArgsManager &args )
{
   LedgerConfig config;
   config.log.print_to_console = args.get_bool_arg( "-printtoconsole", false );
   config.log.log_timestamps = args.get_bool_arg( "-logtimestamps", true );
   config.log.log_file = args.get_arg( "-logfile", "" );
   config.script_path = args.get_arg( "-script", "" );

   for ( const auto &name : args.get_args( "-debug" ) ) {
      // a bare -debug means all
      const auto category = name.empty() ? std::optional( LogCategory::all ) : parse_log_category( name );
      if ( !category )
         config.unknown_debug_categories.push_back( name );
      else if ( *category == LogCategory::none )
         config.log.categories = 0;
      else
         config.log.categories |= utils::to_underlying( *category );
   }
   return config;
}

}   // namespace tokenledger
