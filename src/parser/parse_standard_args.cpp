/***
 * Name: cmfmt::parse::ParseStandardArgs
 * Purpose: Parse `cmd(parg... KEYWORD kwarg... FLAG...)` style argument lists.
 * Theory of Operation:
 *   Starts out positional. A word matching the keyword table dispatches to
 *   a keyword group whose breakstack adds every keyword and flag of this
 *   scope; anything else starts a positional group that breaks on keywords
 *   only, so flags become FLAG children there. Each dispatch must consume.
 */
#include <vector>

#include "cmfmt/exceptions/grammar_error.h"
#include "lexer/TokenClass.h"
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

cst::NodePtr ParseStandardArgs(TokenCursor& cursor, const grammar::ArgSpec& spec, const BreakStack& breakstack) {
  auto tree = cst::Node::Make(cst::NodeKind::ArgGroup);
  auto& info = std::get<cst::ArgTreeInfo>(tree->payload);

  while (!cursor.empty() && lex::isWhitespace(cursor.peek().kind)) {
    tree->append(cursor.pop());
  }

  std::vector<std::string> keywords = spec.keywordNames();
  std::vector<std::string> keywordsAndFlags = keywords;
  keywordsAndFlags.insert(keywordsAndFlags.end(), spec.flags.begin(), spec.flags.end());
  const BreakStack kwargBreakstack = breakstack.extended(Breaker::Keywords(keywordsAndFlags));
  const BreakStack positionalBreakstack = breakstack.extended(Breaker::Keywords(keywords));
  const grammar::PositionalSpec positional = spec.positional();

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

    const std::size_t before = cursor.remaining();
    const lex::Token head = tok;
    const auto word = NormalizedWord(head);
    const grammar::ArgSpec* body = word ? spec.findKeyword(*word) : nullptr;
    cst::NodePtr subtree;
    bool isKeyword = false;
    if (body != nullptr) {
      subtree = ParseKeywordGroup(cursor, *word, *body, kwargBreakstack);
      isKeyword = true;
    } else {
      subtree = ParsePositionalGroup(cursor, positional, positionalBreakstack);
    }

    if (cursor.remaining() >= before) {
      throw exceptions::GrammarError("argument parser consumed no tokens", head.location(), head.text,
                                     isKeyword ? "keyword body" : "positional argument");
    }
    const std::size_t idx = tree->append(std::move(subtree));
    (isKeyword ? info.kwargGroups : info.pargGroups).push_back(idx);
  }
  return tree;
}

} // namespace cmfmt::parse
