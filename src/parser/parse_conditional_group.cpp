/***
 * Name: cmfmt::parse::ParseConditionalGroup
 * Purpose: Parse boolean expressions of if()/while() into a flat ARGGROUP.
 * Theory of Operation:
 *   AND and OR are keywords whose body is another conditional group parsed
 *   under this scope's breakstack plus AND/OR, so `A AND B OR C` yields
 *   sibling keyword groups rather than a nested tree. '(' opens a
 *   parenthetical group; other runs are `+` positional groups that know the
 *   conditional operators as flags.
 */
#include "cmfmt/exceptions/grammar_error.h"
#include "grammar/ConditionalFlags.h"
#include "lexer/TokenClass.h"
#include "parser/ArgParsers.h"

#include <algorithm>

namespace cmfmt::parse {

using TK = lex::TokenKind;

cst::NodePtr ParseConditionalGroup(TokenCursor& cursor, const BreakStack& breakstack) {
  auto tree = cst::Node::Make(cst::NodeKind::ArgGroup);
  auto& info = std::get<cst::ArgTreeInfo>(tree->payload);
  info.conditional = true;

  while (!cursor.empty() && lex::isWhitespace(cursor.peek().kind)) {
    tree->append(cursor.pop());
  }

  const auto& keywords = grammar::ConditionalKeywords();
  const BreakStack childBreakstack = breakstack.extended(Breaker::Keywords(keywords));
  const grammar::PositionalSpec atoms{grammar::NArgs::OneOrMore(), grammar::ConditionalFlags()};
  const grammar::ArgSpec nested = grammar::Conditional();

  while (!cursor.empty()) {
    const lex::Token& tok = cursor.peek();
    if (breakstack.shouldBreak(tok)) { break; }

    if (lex::isWhitespace(tok.kind)) {
      tree->append(cursor.pop());
      continue;
    }

    if (lex::isComment(tok.kind)) {
      auto comment = cst::Node::Make(cst::NodeKind::Comment);
      comment->append(cursor.pop());
      tree->append(std::move(comment));
      continue;
    }

    if (tok.kind == TK::LeftParen) {
      tree->append(ParseParenGroup(cursor));
      continue;
    }

    const std::size_t before = cursor.remaining();
    const lex::Token head = tok;
    const auto word = NormalizedWord(head);
    if (word && std::find(keywords.begin(), keywords.end(), *word) != keywords.end()) {
      auto subtree = ParseKeywordGroup(cursor, *word, nested, childBreakstack);
      if (cursor.remaining() >= before) {
        throw exceptions::GrammarError("argument parser consumed no tokens", head.location(), head.text,
                                       "keyword body");
      }
      info.kwargGroups.push_back(tree->append(std::move(subtree)));
      continue;
    }

    auto subtree = ParsePositionalGroup(cursor, atoms, childBreakstack);
    if (cursor.remaining() >= before) {
      throw exceptions::GrammarError("argument parser consumed no tokens", head.location(), head.text,
                                     "conditional operand");
    }
    info.pargGroups.push_back(tree->append(std::move(subtree)));
  }
  return tree;
}

} // namespace cmfmt::parse
