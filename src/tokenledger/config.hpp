// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_CONFIG_HPP_INCLUDED
#define TOKENLEDGER_CONFIG_HPP_INCLUDED

#include <string>
#include <vector>

#include "../utils/args.hpp"

#include "log.hpp"

namespace tokenledger {

// Options understood by tokenledger:
//   -debug=<category>   enable a log category (ledger, supply, metadata, balance, events, config, all), repeatable; -nodebug disables all
//   -printtoconsole     log to stdout instead of the log file
//   -logtimestamps      prepend timestamps to log lines (default: 1)
//   -logfile=<path>     log file (default: none)
//   -script=<path>      command script to run (default: stdin)
//   -conf=<path>        config file with name=value lines, read by the driver
struct LedgerConfig {
   LogOptions log;
   std::string script_path;
   std::vector< std::string > unknown_debug_categories;

   // Throws std::invalid_argument for malformed boolean option values
   static LedgerConfig from_args( const utils::ArgsManager &args );
};

}   // namespace tokenledger

#endif   // TOKENLEDGER_CONFIG_HPP_INCLUDED
