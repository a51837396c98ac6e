// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_SCOPE_EXIT_HPP_INCLUDED
#define TOKENLEDGER_UTILS_SCOPE_EXIT_HPP_INCLUDED

#include <exception>
#include <utility>
#include <type_traits>

#include <boost/version.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include "../tokenledger/log.hpp"

namespace utils {

// Runs f only if the scope is being left due to an exception. The exception keeps propagating afterwards.
template < typename F >
#if BOOST_VERSION >= 108500
[[deprecated( "Remove this and replace all usages with boost::scope::scope_fail now that it is available in this project" )]]
#endif
class on_exception_exit {
public:
   explicit on_exception_exit( F f ) noexcept( std::is_nothrow_move_constructible_v< F > )
      : num_uncaught_exceptions_at_construction_( std::uncaught_exceptions() )
      , f_( std::move( f ) )
   {}

   // After this, f won't be run at all
   void release() noexcept { released_ = true; }

   ~on_exception_exit()
   {
      if ( !released_ && std::uncaught_exceptions() > num_uncaught_exceptions_at_construction_ )
         try {
            f_();
         }
         catch ( ... ) {
            // there is already an exception in flight, this one can only be reported
            try {
               tokenledger::LogPrintf( "Exception in ~on_exception_exit(): %s\n", boost::current_exception_diagnostic_information() );
            }
            catch ( ... ) {
            }
         }
   }

   on_exception_exit( const on_exception_exit & ) = delete;
   on_exception_exit( on_exception_exit && ) = delete;
   void operator=( const on_exception_exit & ) = delete;
   void operator=( on_exception_exit && ) = delete;

private:
   const int num_uncaught_exceptions_at_construction_;
   F f_;
   bool released_ = false;
};

template < typename F >
on_exception_exit( F ) -> on_exception_exit< F >;

}   // namespace utils

#endif   // TOKENLEDGER_UTILS_SCOPE_EXIT_HPP_INCLUDED
