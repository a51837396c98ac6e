// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <atomic>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include "../utils/enum.hpp"

#include "log.hpp"

namespace tokenledger {

namespace {

constexpr std::array< std::pair< std::string_view, LogCategory >, 6 > category_names{ {
  { "ledger", LogCategory::ledger },
  { "supply", LogCategory::supply },
  { "metadata", LogCategory::metadata },
  { "balance", LogCategory::balance },
  { "events", LogCategory::events },
  { "config", LogCategory::config },
} };

std::atomic< unsigned > enabled_categories{ 0 };

// All of the below is protected by the mutex. Function-local statics, so that logging from destructors of other statics at shutdown stays safe.
struct LogState {
   std::mutex mutex;
   std::FILE *file = nullptr;
   bool print_to_console = false;
   bool log_timestamps = true;
   bool started_new_line = true;
};

LogState &log_state()
{
   static auto *const state = new LogState;   // intentionally leaked
   return *state;
}

// @return The current timestamp in the format: 2009-01-03 18:15:05
std::string get_timestamp()
{
   const std::time_t now = std::time( nullptr );
   std::tm tm{};
   gmtime_r( &now, &tm );
   char buf[ 32 ];
   const auto n = std::strftime( buf, sizeof buf, "%Y-%m-%d %H:%M:%S", &tm );
   return std::string( buf, n );
}

std::FILE *open_log_file( const std::string &path )
{
   const boost::filesystem::path log_path( path );
   if ( log_path.has_parent_path() )
      boost::filesystem::create_directories( log_path.parent_path() );
   std::FILE *const f = std::fopen( log_path.string().c_str(), "a" );
   if ( f )
      std::setbuf( f, nullptr );   // unbuffered
   else
      std::fprintf( stderr, "Failed to open log file: %s\n", log_path.string().c_str() );
   return f;
}

}   // namespace

void init_logging( const LogOptions &options )
{
   auto &s = log_state();
   std::FILE *const new_file = options.print_to_console || options.log_file.empty() ? nullptr : open_log_file( options.log_file );
   std::lock_guard lock( s.mutex );
   if ( s.file )
      std::fclose( s.file );
   s.file = new_file;
   s.print_to_console = options.print_to_console;
   s.log_timestamps = options.log_timestamps;
   s.started_new_line = true;
   enabled_categories = options.categories;
}

void shutdown_logging() noexcept
{
   auto &s = log_state();
   std::lock_guard lock( s.mutex );
   if ( s.file ) {
      std::fclose( s.file );
      s.file = nullptr;
   }
   s.print_to_console = false;
}

bool log_accept_category( const LogCategory category ) noexcept
{
   return utils::has_flag( enabled_categories.load( std::memory_order_relaxed ), category ) && category != LogCategory::none;
}

void enable_log_category( const LogCategory category, const bool enable ) noexcept
{
   if ( enable )
      enabled_categories |= utils::to_underlying( category );
   else
      enabled_categories &= ~utils::to_underlying( category );
}

std::optional< LogCategory > parse_log_category( const std::string_view name ) noexcept
{
   if ( name == "all" || name == "1" )
      return LogCategory::all;
   if ( name == "none" || name == "0" )
      return LogCategory::none;
   for ( const auto &[ n, c ] : category_names )
      if ( n == name )
         return c;
   return {};
}

std::string_view log_category_name( const LogCategory category ) noexcept
{
   for ( const auto &[ n, c ] : category_names )
      if ( c == category )
         return n;
   return category == LogCategory::all ? "all" : "none";
}

int log_print_str( const std::string &str )
{
   auto &s = log_state();
   std::lock_guard lock( s.mutex );
   std::FILE *const out = s.print_to_console ? stdout : s.file;
   if ( !out )
      return 0;

   int ret = 0;
   if ( s.log_timestamps && s.started_new_line )
      ret += std::fprintf( out, "%s ", get_timestamp().c_str() );
   s.started_new_line = !str.empty() && str.back() == '\n';
   ret += static_cast< int >( std::fwrite( str.data(), 1, str.size(), out ) );
   if ( out == stdout )
      std::fflush( stdout );
   return ret;
}

}   // namespace tokenledger
