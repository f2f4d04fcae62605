/***
 * Name: cmfmt::grammar::NArgs (impl)
 * Purpose: Arity predicates and textual form.
 */
#include "grammar/NArgs.h"

#include "cmfmt/support/parse.h"

namespace cmfmt::grammar {

bool NArgs::isFull(const int consumed) const {
  switch (kind) {
    case Kind::Exact:
      return consumed >= count;
    case Kind::ZeroOrOne:
      return consumed >= 1;
    case Kind::ZeroOrMore:
    case Kind::OneOrMore:
      return false;
  }
  return false;
}

std::string NArgs::str() const {
  switch (kind) {
    case Kind::Exact:
      return std::to_string(count);
    case Kind::ZeroOrOne:
      return "?";
    case Kind::ZeroOrMore:
      return "*";
    case Kind::OneOrMore:
      return "+";
  }
  return "*";
}

std::optional<NArgs> NArgs::parse(const std::string_view text) {
  if (text == "*") { return ZeroOrMore(); }
  if (text == "+") { return OneOrMore(); }
  if (text == "?") { return ZeroOrOne(); }
  int value = 0;
  if (!support::ParseIntLiteralStrict(text, value) || value < 0) {
    return std::nullopt;
  }
  return Exactly(value);
}

} // namespace cmfmt::grammar
