/***
 * Name: cmfmt::exceptions::GrammarError
 * Purpose: Internal invariant violation inside the argument parsers (a dispatched
 *   sub-parser consumed nothing, or a keyword was dispatched to the wrong table).
 * Inputs: Same as ParseError
 * Outputs: Exception object
 * Theory of Operation: Indicates a defect in a command grammar table rather than
 *   bad user input; still fatal for the file being parsed.
 */
#pragma once

#include "cmfmt/exceptions/parse_error.h"

namespace cmfmt {
namespace exceptions {

class GrammarError : public ParseError {
 public:
  using ParseError::ParseError;
};

}  // namespace exceptions
}  // namespace cmfmt
