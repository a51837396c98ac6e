// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_ENUM_HPP_INCLUDED
#define TOKENLEDGER_UTILS_ENUM_HPP_INCLUDED

#include <type_traits>

namespace utils {

template < typename E >
concept Enum = std::is_enum_v< E >;

// TODO C++23: remove and replace usages with std::to_underlying()
constexpr auto to_underlying( Enum auto e ) noexcept
{
   return static_cast< std::underlying_type_t< decltype( e ) > >( e );
}

// For flag-style enums whose enumerators are disjoint bits
template < Enum E >
constexpr bool has_flag( std::underlying_type_t< E > mask, E flag ) noexcept
{
   return ( mask & to_underlying( flag ) ) == to_underlying( flag );
}

}   // namespace utils

#endif   // TOKENLEDGER_UTILS_ENUM_HPP_INCLUDED
