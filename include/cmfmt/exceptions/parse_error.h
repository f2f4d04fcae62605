/***
 * Name: cmfmt::exceptions::ParseError
 * Purpose: Fatal listfile parse failure (unbalanced parens, unterminated literals,
 *   unexpected tokens).
 * Inputs: Message, location of the offending token, observed and expected spellings
 * Outputs: Exception object; what() reads "<msg> (expected <x>, got <y>)"
 * Theory of Operation: Keeps the location fields separately so the driver can
 *   print a file:line:col header and a caret under the offending column.
 */
#pragma once

#include <string>

#include "cmfmt/exceptions/cmfmt_exception.h"
#include "lexer/SourceLocation.h"

namespace cmfmt {
namespace exceptions {

class ParseError : public CmfmtException {
 public:
  ParseError(const std::string& msg, lex::SourceLocation where, std::string observed,
             std::string expected);

  const lex::SourceLocation& location() const noexcept { return location_; }
  const std::string& observed() const noexcept { return observed_; }
  const std::string& expected() const noexcept { return expected_; }

 private:
  lex::SourceLocation location_;
  std::string observed_;
  std::string expected_;
};

}  // namespace exceptions
}  // namespace cmfmt
