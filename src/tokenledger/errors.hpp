// Copyright (c) 2026 The tokenledger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENLEDGER_ERRORS_HPP_INCLUDED
#define TOKENLEDGER_ERRORS_HPP_INCLUDED

#include <stdexcept>
#include <string>
#include <string_view>

namespace tokenledger {

enum class ErrorKind {
   wrong_collection,
   wrong_token_id,
   insufficient_balance,
   invalid_arg,
   zero_amount,
   not_found
};

std::string_view to_string( ErrorKind kind ) noexcept;

// A precondition failure caused by the caller's input. Thrown before anything gets mutated.
class LedgerError : public std::runtime_error {
public:
   LedgerError( ErrorKind kind, const std::string &what )
      : std::runtime_error( std::string( to_string( kind ) ) + ": " + what )
      , kind_( kind )
   {}

   [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
   ErrorKind kind_;
};

// Supply ledger and balance amounts have fallen out of lock-step (or are about to), which can only be the result of a defect somewhere, never of bad input.
class InvariantViolation : public std::logic_error {
public:
   using std::logic_error::logic_error;
};

// Logs the violation unconditionally, with a FATAL: prefix, then throws InvariantViolation
[[noreturn]] void throw_invariant_violation( const std::string &what );

}   // namespace tokenledger

#endif   // TOKENLEDGER_ERRORS_HPP_INCLUDED
