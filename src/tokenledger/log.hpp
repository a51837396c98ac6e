// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_LOG_HPP_INCLUDED
#define TOKENLEDGER_LOG_HPP_INCLUDED

#include <optional>
#include <string>
#include <string_view>

#include <boost/format.hpp>

namespace tokenledger {

enum class LogCategory : unsigned {
   none = 0,
   ledger = 1u << 0,     // collection creation, cap handling
   supply = 1u << 1,     // every supply ledger change
   metadata = 1u << 2,
   balance = 1u << 3,    // split/join/zero/destroy_zero
   events = 1u << 4,     // audit event emission and indexing
   config = 1u << 5,
   all = ( 1u << 6 ) - 1
};

struct LogOptions {
   bool print_to_console = false;   // if set, the log file is not written to
   bool log_timestamps = true;
   std::string log_file;   // empty means no file
   unsigned categories = 0;   // mask of LogCategory bits
};

// (Re)configures the sinks and the enabled categories. With the default LogOptions nothing gets written anywhere.
void init_logging( const LogOptions &options );
void shutdown_logging() noexcept;

bool log_accept_category( LogCategory category ) noexcept;
void enable_log_category( LogCategory category, bool enable ) noexcept;

// Accepts the category names as used with -debug=<category>, plus "all" and "none"
std::optional< LogCategory > parse_log_category( std::string_view name ) noexcept;
std::string_view log_category_name( LogCategory category ) noexcept;

// Writes the string to the configured sink, returns the number of characters written
int log_print_str( const std::string &str );

template < typename... Args >
std::string strprintf( const std::string &fmt, const Args &...args )
{
   try {
      boost::format f( fmt );
      return ( f % ... % args ).str();
   }
   catch ( const boost::io::format_error &e ) {
      return "Error \"" + std::string( e.what() ) + "\" while formatting log message: " + fmt;
   }
}

template < typename... Args >
int LogPrintf( const std::string &fmt, const Args &...args )
{
   return log_print_str( strprintf( fmt, args... ) );
}

template < typename... Args >
int LogPrint( LogCategory category, const std::string &fmt, const Args &...args )
{
   if ( !log_accept_category( category ) )
      return 0;
   return log_print_str( strprintf( fmt, args... ) );
}

}   // namespace tokenledger

#endif   // TOKENLEDGER_LOG_HPP_INCLUDED
