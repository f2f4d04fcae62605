/***
 * Name: cmfmt::cst::Node
 * Purpose: Concrete syntax tree node: a kind tag, ordered children and a
 *   per-kind payload.
 * Inputs:
 *   - Built once by the parser; children are tokens or owned sub-nodes.
 * Outputs:
 *   - Lossless token sequence (collectTokens/reconstruct) and structural
 *     views for the layout engine, the printer and lint checks.
 * Theory of Operation:
 *   Children keep every whitespace and comment token at the depth it was
 *   encountered. Views such as positionalGroups() are index lists into the
 *   same children vector, so the tree has a single owner per node and no
 *   back-references. The only mutation after construction is setSortable().
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cst/NodeKind.h"
#include "grammar/PositionalSpec.h"
#include "lexer/Token.h"

namespace cmfmt::cst {

struct Node;
using NodePtr = std::unique_ptr<Node>;
using Child = std::variant<lex::Token, NodePtr>;

struct PargGroupInfo {
  grammar::PositionalSpec spec{};
  bool sortable{false};
};

struct KwargGroupInfo {
  std::size_t keyword{0};            // index of the KEYWORD child
  std::optional<std::size_t> body{}; // index of the value subtree, if any
};

struct ArgTreeInfo {
  bool conditional{false};
  std::vector<std::size_t> pargGroups{};
  std::vector<std::size_t> kwargGroups{};
};

struct StatementInfo {
  std::string command{};          // case-folded command name
  std::optional<std::size_t> args{}; // index of the ARGGROUP child
};

using Payload = std::variant<std::monostate, PargGroupInfo, KwargGroupInfo, ArgTreeInfo, StatementInfo>;

struct Node {
  NodeKind kind;
  std::vector<Child> children{};
  Payload payload{};

  explicit Node(const NodeKind k) : kind(k) {}

  static NodePtr Make(NodeKind k);

  // Append a child; returns its index
  std::size_t append(lex::Token tok);
  std::size_t append(NodePtr child);

  std::size_t size() const { return children.size(); }
  const Node* childNode(std::size_t index) const;
  Node* childNode(std::size_t index);
  const lex::Token* childToken(std::size_t index) const;
  std::vector<const Node*> childNodes() const;

  // ARGGROUP views
  std::vector<const Node*> positionalGroups() const;
  std::vector<const Node*> keywordGroups() const;
  bool isConditional() const;

  // KWARGGROUP views
  const Node* keyword() const;
  const Node* body() const;

  // PARGGROUP views
  bool sortable() const;
  void setSortable(bool value);
  const grammar::PositionalSpec* positionalSpec() const;

  // STATEMENT views
  const std::string& command() const;
  const Node* arguments() const;

  // Lossless token access
  void collectTokens(std::vector<const lex::Token*>& out) const;
  std::string reconstruct() const;
  const lex::Token* firstToken() const;
  const lex::Token* firstSemanticToken() const;
};

} // namespace cmfmt::cst
