// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_CHECKED_MATH_HPP_INCLUDED
#define TOKENLEDGER_UTILS_CHECKED_MATH_HPP_INCLUDED

#include <concepts>
#include <limits>
#include <optional>

namespace utils::math {

// Unsigned arithmetic that refuses to wrap around. An empty result means the mathematical result is not representable in T, and the caller decides what that means.

template < std::unsigned_integral T >
[[nodiscard]] constexpr std::optional< T > checked_add( T a, T b ) noexcept
{
   if ( b > std::numeric_limits< T >::max() - a )
      return {};
   return a + b;
}

template < std::unsigned_integral T >
[[nodiscard]] constexpr std::optional< T > checked_sub( T a, T b ) noexcept
{
   if ( b > a )
      return {};
   return a - b;
}

}   // namespace utils::math

#endif   // TOKENLEDGER_UTILS_CHECKED_MATH_HPP_INCLUDED
