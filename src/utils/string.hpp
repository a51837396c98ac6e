// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_UTILS_STRING_HPP_INCLUDED
#define TOKENLEDGER_UTILS_STRING_HPP_INCLUDED

#include <string>
#include <string_view>
#include <vector>

namespace utils {

// Shortens very long strings (e.g. addresses) by replacing their middle part with "..."
std::string abbreviate_for_display( std::string s );

// Splits on every occurrence of the separator; an empty input yields an empty vector, empty fields in between are kept.
std::vector< std::string > split( std::string_view s, char separator );

std::string_view trim( std::string_view s ) noexcept;

}   // namespace utils

#endif   // TOKENLEDGER_UTILS_STRING_HPP_INCLUDED
