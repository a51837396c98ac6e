// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fstream>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "string.hpp"
#include "args.hpp"

namespace utils {

static bool interpret_bool( const std::string &value )
{
   if ( value.empty() )
      return true;
   try {
      return boost::lexical_cast< long long >( value ) != 0;
   }
   catch ( const boost::bad_lexical_cast & ) {
      throw std::invalid_argument( "Not a boolean option value: '" + value + "'" );
   }
}

void ArgsManager::interpret_negative_setting( std::string &name, std::string &value )
{
   // -nofoo means -foo=0, and -nofoo=0 means -foo=1
   if ( name.compare( 0, 3, "-no" ) == 0 && name.size() > 3 ) {
      name = '-' + name.substr( 3 );
      value = interpret_bool( value ) ? "0" : "1";
   }
}

void ArgsManager::parse_parameters( const int argc, const char *const argv[] )
{
   std::lock_guard lock( mutex_ );
   args_.clear();
   for ( int i = 1; i < argc; ++i ) {
      std::string name( argv[ i ] );
      std::string value;
      if ( const auto pos = name.find( '=' ); pos != std::string::npos ) {
         value = name.substr( pos + 1 );
         name.erase( pos );
      }
      if ( name.empty() || name.front() != '-' )
         throw std::invalid_argument( "Unexpected command line token (options must start with '-'): " + std::string( argv[ i ] ) );
      // --foo is the same as -foo
      if ( name.size() > 2 && name[ 1 ] == '-' )
         name.erase( 0, 1 );
      interpret_negative_setting( name, value );
      args_[ name ].push_back( std::move( value ) );
   }
}

void ArgsManager::read_config_stream( std::istream &is )
{
   std::map< std::string, std::vector< std::string > > from_config;
   std::string line;
   int line_number = 0;
   while ( std::getline( is, line ) ) {
      ++line_number;
      const auto content = trim( std::string_view( line ).substr( 0, line.find( '#' ) ) );
      if ( content.empty() )
         continue;
      const auto pos = content.find( '=' );
      if ( pos == std::string_view::npos )
         throw std::invalid_argument( "Config line " + std::to_string( line_number ) + " is not of the form name=value" );
      std::string name = '-' + std::string( trim( content.substr( 0, pos ) ) );
      std::string value( trim( content.substr( pos + 1 ) ) );
      interpret_negative_setting( name, value );
      from_config[ name ].push_back( std::move( value ) );
   }

   std::lock_guard lock( mutex_ );
   for ( auto &[ name, values ] : from_config )
      args_.try_emplace( name, std::move( values ) );   // the command line wins
}

void ArgsManager::read_config_file( const std::string &path )
{
   std::ifstream file( path );
   if ( !file )
      throw std::invalid_argument( "Cannot open config file: " + path );
   read_config_stream( file );
}

bool ArgsManager::is_arg_set( const std::string &name ) const
{
   std::lock_guard lock( mutex_ );
   return args_.contains( name );
}

std::string ArgsManager::get_arg( const std::string &name, const std::string &default_value ) const
{
   std::lock_guard lock( mutex_ );
   const auto it = args_.find( name );
   if ( it == args_.end() || it->second.empty() )
      return default_value;
   return it->second.back();
}

bool ArgsManager::get_bool_arg( const std::string &name, const bool default_value ) const
{
   if ( !is_arg_set( name ) )
      return default_value;
   return interpret_bool( get_arg( name, {} ) );
}

std::vector< std::string > ArgsManager::get_args( const std::string &name ) const
{
   std::lock_guard lock( mutex_ );
   const auto it = args_.find( name );
   return it == args_.end() ? std::vector< std::string >{} : it->second;
}

}   // namespace utils
