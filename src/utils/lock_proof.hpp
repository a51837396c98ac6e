// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_LOCK_PROOF_HPP_INCLUDED
#define TOKENLEDGER_UTILS_LOCK_PROOF_HPP_INCLUDED

#include <cassert>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include "traits.hpp"

// Lock proofs are cheap tag objects passed to member functions that touch mutex-protected state. They can only be constructed from a lock object that actually holds
// the expected mutex of the expected object, so a function taking one as a parameter cannot be called without the proper locking in place.

namespace utils {

template < class M >
concept mutex = requires( M &m ) {
   m.lock();
   m.unlock();
};

template < auto MutexMemberPtr >
concept mutex_member_ptr = is_member_ptr_v< MutexMemberPtr > && mutex< typename is_member_ptr< MutexMemberPtr >::data_type >;

namespace detail {

template < auto MutexMemberPtr, class Lock >
void verify_lock( const typename is_member_ptr< MutexMemberPtr >::class_type &c, const Lock &lock, const char *proof_name )
{
   assert( lock.owns_lock() );
   assert( lock.mutex() == &( c.*MutexMemberPtr ) );
   if ( !lock.owns_lock() )
      throw std::logic_error( std::string( proof_name ) + ": supplied lock is not actually locked!" );
   if ( lock.mutex() != &( c.*MutexMemberPtr ) )
      throw std::logic_error( std::string( proof_name ) + ": supplied lock does not lock the mutex of the given object!" );
}

}   // namespace detail

template < auto MutexMemberPtr >
   requires mutex_member_ptr< MutexMemberPtr >
class write_lock_proof {
   using class_type = typename is_member_ptr< MutexMemberPtr >::class_type;
   using mutex_type = typename is_member_ptr< MutexMemberPtr >::data_type;

public:
   // the lock parameter is a non-const reference so that temporary objects cannot be passed
   // ATTENTION: intentionally non-explicit
   write_lock_proof( class_type &c, std::unique_lock< mutex_type > &lock ) { detail::verify_lock< MutexMemberPtr >( c, lock, "write_lock_proof" ); }
};

template < auto MutexMemberPtr >
   requires mutex_member_ptr< MutexMemberPtr >
class read_lock_proof {
   using class_type = typename is_member_ptr< MutexMemberPtr >::class_type;
   using mutex_type = typename is_member_ptr< MutexMemberPtr >::data_type;

public:
   // ATTENTION: all constructors are intentionally non-explicit

   read_lock_proof( const class_type &c, std::shared_lock< mutex_type > &lock ) { detail::verify_lock< MutexMemberPtr >( c, lock, "read_lock_proof" ); }

   // exclusive ownership is good for reading as well
   read_lock_proof( const class_type &c, std::unique_lock< mutex_type > &lock ) { detail::verify_lock< MutexMemberPtr >( c, lock, "read_lock_proof" ); }

   read_lock_proof( write_lock_proof< MutexMemberPtr > ) noexcept {}
};

}   // namespace utils

#endif   // TOKENLEDGER_UTILS_LOCK_PROOF_HPP_INCLUDED
