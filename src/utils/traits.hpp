// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_TRAITS_HPP_INCLUDED
#define TOKENLEDGER_UTILS_TRAITS_HPP_INCLUDED

#include <type_traits>

namespace utils {

// Decomposes a pointer to data member, given as a non-type template argument, into its class and member types.
template < auto >
struct is_member_ptr : std::false_type {};

template < typename T, class C, T C::*Mmp >
struct is_member_ptr< Mmp > : std::true_type {
   using class_type = C;
   using data_type = T;
};

template < auto Mmp >
inline constexpr bool is_member_ptr_v = is_member_ptr< Mmp >::value;

}   // namespace utils

#endif   // TOKENLEDGER_UTILS_TRAITS_HPP_INCLUDED
