/***
 * Name: cmfmt::parse argument parsers
 * Purpose: Recursive-descent builders for command argument lists.
 * Inputs:
 *   - cursor: shared token cursor, consumed from the front
 *   - grammar descriptor(s) for the current scope
 *   - breakstack: predicates inherited from enclosing scopes
 * Outputs:
 *   - cst::Node subtrees (ARGGROUP, PARGGROUP, KWARGGROUP, PARENGROUP,
 *     COMMENT); every consumed token lands in exactly one subtree
 * Theory of Operation:
 *   ParseGrammar() is the single interpreter of grammar::ArgSpec. A standard
 *   argument list alternates positional groups and keyword groups; keyword
 *   groups recurse through ParseGrammar() on the keyword's own descriptor.
 *   Parenthetical groups switch to the conditional grammar under a fresh
 *   breakstack. Every parser either consumes tokens or yields because the
 *   breakstack or its arity told it to.
 */
#pragma once

#include <optional>
#include <string>

#include "cst/Node.h"
#include "grammar/ArgSpec.h"
#include "parser/BreakStack.h"
#include "parser/TokenCursor.h"

namespace cmfmt::parse {

// Upper-cased spelling for WORD tokens, nullopt otherwise
std::optional<std::string> NormalizedWord(const lex::Token& tok);

// Directive tag of a "# cmf: <tag>" style comment, lower-cased; empty if none
std::string GetTag(const lex::Token& tok);

// Consume a comment block (consecutive line comments) into a COMMENT node
cst::NodePtr ConsumeComment(TokenCursor& cursor);

// Attach a same-line comment (and its leading blanks) to `parent`, if present
void ConsumeTrailingComment(TokenCursor& cursor, cst::Node& parent);

cst::NodePtr ParseGrammar(TokenCursor& cursor, const grammar::ArgSpec& spec, const BreakStack& breakstack);

cst::NodePtr ParseStandardArgs(TokenCursor& cursor, const grammar::ArgSpec& spec, const BreakStack& breakstack);

cst::NodePtr ParsePositionalGroup(TokenCursor& cursor, const grammar::PositionalSpec& spec,
                                  const BreakStack& breakstack, bool sortable = false);

cst::NodePtr ParseKeywordGroup(TokenCursor& cursor, const std::string& word, const grammar::ArgSpec& body,
                               const BreakStack& breakstack);

cst::NodePtr ParseParenGroup(TokenCursor& cursor);

cst::NodePtr ParseConditionalGroup(TokenCursor& cursor, const BreakStack& breakstack);

} // namespace cmfmt::parse
