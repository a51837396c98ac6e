// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_ARGS_HPP_INCLUDED
#define TOKENLEDGER_UTILS_ARGS_HPP_INCLUDED

#include <istream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

// Command-line and config-file options of the form -name=value. All names are stored with their leading dash, e.g. "-debug".
// A bare -name means "1", and -noname means "0". Repeated options are all kept, in order: get_arg() returns the last one, get_args() all of them.
class ArgsManager {
public:
   // Throws std::invalid_argument on a non-option token, i.e. one not starting with '-'.
   void parse_parameters( int argc, const char *const argv[] );

   // Reads name=value lines, ignoring blank lines and '#' comments. Options already given on the command line are not overridden.
   void read_config_stream( std::istream &is );
   void read_config_file( const std::string &path );

   bool is_arg_set( const std::string &name ) const;
   std::string get_arg( const std::string &name, const std::string &default_value ) const;
   bool get_bool_arg( const std::string &name, bool default_value ) const;
   std::vector< std::string > get_args( const std::string &name ) const;

private:
   mutable std::mutex mutex_;
   std::map< std::string, std::vector< std::string > > args_;   // protected by mutex_

   static void interpret_negative_setting( std::string &name, std::string &value );
};

}   // namespace utils

#endif   // TOKENLEDGER_UTILS_ARGS_HPP_INCLUDED
