/***
 * Name: cmfmt::parse::ParsePositionalGroup
 * Purpose: Consume a run of positional arguments bounded by an arity.
 * Inputs:
 *   - spec: arity and the flags recognized in this run
 *   - breakstack: enclosing break predicates
 *   - sortable: default annotation, overridden by a leading tag comment
 * Theory of Operation:
 *   Stops once the arity is satisfied. A breakstack match stops the run
 *   unless the arity is an exact count and the token is not ')': an exact
 *   group then swallows a value spelled like an enclosing keyword, e.g.
 *   install(TARGETS t RUNTIME COMPONENT runtime).
 */
#include "lexer/TokenClass.h"
#include "parser/ArgParsers.h"

#include <algorithm>

namespace cmfmt::parse {

using TK = lex::TokenKind;

cst::NodePtr ParsePositionalGroup(TokenCursor& cursor, const grammar::PositionalSpec& spec,
                                  const BreakStack& breakstack, const bool sortable) {
  auto tree = cst::Node::Make(cst::NodeKind::PargGroup);
  tree->payload = cst::PargGroupInfo{spec, sortable};
  int consumed = 0;

  while (!cursor.empty() && lex::isWhitespace(cursor.peek().kind)) {
    tree->append(cursor.pop());
  }

  if (!cursor.empty()) {
    const std::string tag = GetTag(cursor.peek());
    if (tag == "sortable" || tag == "sort") {
      tree->setSortable(true);
    } else if (tag == "unsortable" || tag == "unsort") {
      tree->setSortable(false);
    }
  }

  while (!cursor.empty()) {
    if (spec.npargs.isFull(consumed)) { break; }

    const lex::Token& tok = cursor.peek();
    if (breakstack.shouldBreak(tok)) {
      if (!spec.npargs.isExact() || tok.kind == TK::RightParen) { break; }
    }

    if (tok.kind == TK::LeftParen) {
      tree->append(ParseParenGroup(cursor));
      continue;
    }

    if (lex::isWhitespace(tok.kind)) {
      tree->append(cursor.pop());
      continue;
    }

    if (lex::isComment(tok.kind)) {
      tree->append(ConsumeComment(cursor));
      continue;
    }

    const auto word = NormalizedWord(tok);
    const bool isFlag = word && std::find(spec.flags.begin(), spec.flags.end(), *word) != spec.flags.end();
    auto child = cst::Node::Make(isFlag ? cst::NodeKind::Flag : cst::NodeKind::Argument);
    child->append(cursor.pop());
    ConsumeTrailingComment(cursor, *child);
    tree->append(std::move(child));
    ++consumed;
  }
  return tree;
}

} // namespace cmfmt::parse
