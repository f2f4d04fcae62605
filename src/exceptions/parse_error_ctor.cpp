/***
 * Name: cmfmt::exceptions::ParseError::ParseError
 * Purpose: Build a parse error with location and observed/expected token info.
 * Inputs:
 *   - msg: short description ("unbalanced parenthesis", ...)
 *   - where: location of the offending token (end of input for exhaustion)
 *   - observed/expected: token kind or spelling seen vs. required
 * Outputs: Exception whose what() includes the expectation
 */
#include "cmfmt/exceptions/parse_error.h"

#include <utility>

namespace cmfmt::exceptions {

static std::string compose(const std::string& msg, const std::string& observed, const std::string& expected) {
  if (expected.empty() && observed.empty()) { return msg; }
  std::string out = msg;
  out += " (";
  if (!expected.empty()) {
    out += "expected ";
    out += expected;
    if (!observed.empty()) { out += ", "; }
  }
  if (!observed.empty()) {
    out += "got ";
    out += observed;
  }
  out += ")";
  return out;
}

ParseError::ParseError(const std::string& msg, lex::SourceLocation where, std::string observed,
                       std::string expected)
    : CmfmtException(compose(msg, observed, expected)),
      location_(std::move(where)),
      observed_(std::move(observed)),
      expected_(std::move(expected)) {}

}  // namespace cmfmt::exceptions
