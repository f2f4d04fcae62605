/***
 * Name: cmfmt::parse::ParseKeywordGroup
 * Purpose: Parse `KEYWORD value...` into a KWARGGROUP.
 * Inputs:
 *   - word: normalized keyword the caller dispatched on
 *   - body: the keyword's own grammar
 * Outputs:
 *   - KWARGGROUP with a KEYWORD child and, if anything was consumed, a body
 */
#include "cmfmt/exceptions/grammar_error.h"
#include "lexer/TokenClass.h"
#include "parser/ArgParsers.h"

namespace cmfmt::parse {

cst::NodePtr ParseKeywordGroup(TokenCursor& cursor, const std::string& word, const grammar::ArgSpec& body,
                               const BreakStack& breakstack) {
  const lex::Token& head = cursor.peek();
  const auto normalized = NormalizedWord(head);
  if (!normalized || *normalized != word) {
    throw exceptions::GrammarError("keyword dispatched to the wrong parser", head.location(), head.text, word);
  }

  auto tree = cst::Node::Make(cst::NodeKind::KwargGroup);
  auto keyword = cst::Node::Make(cst::NodeKind::Keyword);
  keyword->append(cursor.pop());
  const std::size_t keywordIdx = tree->append(std::move(keyword));

  while (!cursor.empty() && lex::isWhitespace(cursor.peek().kind)) {
    tree->append(cursor.pop());
  }

  const std::size_t before = cursor.remaining();
  auto subtree = ParseGrammar(cursor, body, breakstack);
  std::optional<std::size_t> bodyIdx;
  if (cursor.remaining() < before) {
    bodyIdx = tree->append(std::move(subtree));
  }
  tree->payload = cst::KwargGroupInfo{keywordIdx, bodyIdx};
  return tree;
}

} // namespace cmfmt::parse
