/***
 * Name: cmfmt::parse::ParseGrammar
 * Purpose: Interpret a grammar descriptor against the token cursor.
 */
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

cst::NodePtr ParseGrammar(TokenCursor& cursor, const grammar::ArgSpec& spec, const BreakStack& breakstack) {
  switch (spec.kind) {
    case grammar::GrammarKind::Standard:
      return ParseStandardArgs(cursor, spec, breakstack);
    case grammar::GrammarKind::Positional:
      return ParsePositionalGroup(cursor, spec.positional(), breakstack, spec.sortable);
    case grammar::GrammarKind::Conditional:
      return ParseConditionalGroup(cursor, breakstack);
  }
  return ParseStandardArgs(cursor, spec, breakstack);
}

} // namespace cmfmt::parse
