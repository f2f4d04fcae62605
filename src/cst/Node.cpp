/***
 * Name: cmfmt::cst::Node (impl)
 * Purpose: Child management, structural views and lossless token walks.
 */
#include "cst/Node.h"

#include "lexer/TokenClass.h"

namespace cmfmt::cst {

namespace {
const std::string kNoCommand{};
} // namespace

const char* to_string(const NodeKind kind) {
  using enum NodeKind;
  switch (kind) {
    case Body: return "BODY";
    case Statement: return "STATEMENT";
    case FunName: return "FUNNAME";
    case FlowControl: return "FLOWCONTROL";
    case OnOffSwitch: return "ONOFFSWITCH";
    case ArgGroup: return "ARGGROUP";
    case KwargGroup: return "KWARGGROUP";
    case PargGroup: return "PARGGROUP";
    case ParenGroup: return "PARENGROUP";
    case Keyword: return "KEYWORD";
    case Argument: return "ARGUMENT";
    case Flag: return "FLAG";
    case Comment: return "COMMENT";
    case LParen: return "LPAREN";
    case RParen: return "RPAREN";
  }
  return "UNKNOWN";
}

NodePtr Node::Make(const NodeKind k) {
  auto node = std::make_unique<Node>(k);
  switch (k) {
    case NodeKind::PargGroup: node->payload = PargGroupInfo{}; break;
    case NodeKind::KwargGroup: node->payload = KwargGroupInfo{}; break;
    case NodeKind::ArgGroup: node->payload = ArgTreeInfo{}; break;
    case NodeKind::Statement: node->payload = StatementInfo{}; break;
    default: break;
  }
  return node;
}

std::size_t Node::append(lex::Token tok) {
  children.emplace_back(std::move(tok));
  return children.size() - 1;
}

std::size_t Node::append(NodePtr child) {
  children.emplace_back(std::move(child));
  return children.size() - 1;
}

const Node* Node::childNode(const std::size_t index) const {
  if (index >= children.size()) { return nullptr; }
  const auto* p = std::get_if<NodePtr>(&children[index]);
  return p ? p->get() : nullptr;
}

Node* Node::childNode(const std::size_t index) {
  if (index >= children.size()) { return nullptr; }
  auto* p = std::get_if<NodePtr>(&children[index]);
  return p ? p->get() : nullptr;
}

const lex::Token* Node::childToken(const std::size_t index) const {
  if (index >= children.size()) { return nullptr; }
  return std::get_if<lex::Token>(&children[index]);
}

std::vector<const Node*> Node::childNodes() const {
  std::vector<const Node*> out;
  for (const auto& c : children) {
    if (const auto* p = std::get_if<NodePtr>(&c)) { out.push_back(p->get()); }
  }
  return out;
}

std::vector<const Node*> Node::positionalGroups() const {
  std::vector<const Node*> out;
  if (const auto* info = std::get_if<ArgTreeInfo>(&payload)) {
    for (const auto idx : info->pargGroups) { out.push_back(childNode(idx)); }
  }
  return out;
}

std::vector<const Node*> Node::keywordGroups() const {
  std::vector<const Node*> out;
  if (const auto* info = std::get_if<ArgTreeInfo>(&payload)) {
    for (const auto idx : info->kwargGroups) { out.push_back(childNode(idx)); }
  }
  return out;
}

bool Node::isConditional() const {
  const auto* info = std::get_if<ArgTreeInfo>(&payload);
  return info != nullptr && info->conditional;
}

const Node* Node::keyword() const {
  const auto* info = std::get_if<KwargGroupInfo>(&payload);
  return info ? childNode(info->keyword) : nullptr;
}

const Node* Node::body() const {
  const auto* info = std::get_if<KwargGroupInfo>(&payload);
  if (info == nullptr || !info->body) { return nullptr; }
  return childNode(*info->body);
}

bool Node::sortable() const {
  const auto* info = std::get_if<PargGroupInfo>(&payload);
  return info != nullptr && info->sortable;
}

void Node::setSortable(const bool value) {
  if (auto* info = std::get_if<PargGroupInfo>(&payload)) { info->sortable = value; }
}

const grammar::PositionalSpec* Node::positionalSpec() const {
  const auto* info = std::get_if<PargGroupInfo>(&payload);
  return info ? &info->spec : nullptr;
}

const std::string& Node::command() const {
  const auto* info = std::get_if<StatementInfo>(&payload);
  return info ? info->command : kNoCommand;
}

const Node* Node::arguments() const {
  const auto* info = std::get_if<StatementInfo>(&payload);
  if (info == nullptr || !info->args) { return nullptr; }
  return childNode(*info->args);
}

void Node::collectTokens(std::vector<const lex::Token*>& out) const {
  for (const auto& c : children) {
    if (const auto* tok = std::get_if<lex::Token>(&c)) {
      out.push_back(tok);
    } else {
      std::get<NodePtr>(c)->collectTokens(out);
    }
  }
}

std::string Node::reconstruct() const {
  std::vector<const lex::Token*> toks;
  collectTokens(toks);
  std::string out;
  for (const auto* t : toks) { out += t->text; }
  return out;
}

const lex::Token* Node::firstToken() const {
  for (const auto& c : children) {
    if (const auto* tok = std::get_if<lex::Token>(&c)) { return tok; }
    if (const auto* found = std::get<NodePtr>(c)->firstToken()) { return found; }
  }
  return nullptr;
}

const lex::Token* Node::firstSemanticToken() const {
  std::vector<const lex::Token*> toks;
  collectTokens(toks);
  for (const auto* t : toks) {
    if (lex::isSemantic(t->kind)) { return t; }
  }
  return nullptr;
}

} // namespace cmfmt::cst
