/***
 * Name: cmfmt::obs::TreePrinter (impl)
 */
#include "observability/TreePrinter.h"

#include "lexer/TokenClass.h"

namespace cmfmt::obs {

namespace {

std::string escaped(const std::string& text) {
  std::string out;
  for (const char c : text) {
    switch (c) {
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

bool isLeaf(const cst::NodeKind k) {
  using enum cst::NodeKind;
  return k == FunName || k == Keyword || k == Argument || k == Flag || k == LParen || k == RParen ||
         k == OnOffSwitch;
}

} // namespace

std::string TreePrinter::print(const cst::Node& root) {
  ss_.str("");
  ss_.clear();
  depth_ = 0;
  node(root);
  return ss_.str();
}

void TreePrinter::line(const std::string& s) {
  ss_ << std::string(static_cast<std::size_t>(depth_) * 2, ' ') << s << '\n';
}

void TreePrinter::token(const lex::Token& t) {
  if (!showWhitespace_ && lex::isWhitespace(t.kind)) { return; }
  line(std::string("<") + lex::to_string(t.kind) + "> \"" + escaped(t.text) + "\"");
}

void TreePrinter::node(const cst::Node& n) {
  std::string head = cst::to_string(n.kind);
  if (isLeaf(n.kind) || n.kind == cst::NodeKind::Comment) {
    if (const auto* first = n.firstToken()) { head += " " + escaped(first->text); }
  }
  if (n.kind == cst::NodeKind::Statement) {
    head += " " + n.command();
  }
  if (const auto* spec = n.positionalSpec()) {
    head += " npargs=" + spec->npargs.str();
    if (n.sortable()) { head += " sortable"; }
  }
  if (n.isConditional()) { head += " conditional"; }
  line(head);

  ++depth_;
  for (std::size_t i = 0; i < n.size(); ++i) {
    if (const auto* child = n.childNode(i)) {
      node(*child);
      continue;
    }
    const auto* tok = n.childToken(i);
    // A leaf's own spelling is already in its heading
    if (tok == nullptr || ((isLeaf(n.kind) || n.kind == cst::NodeKind::Comment) && !showWhitespace_)) { continue; }
    token(*tok);
  }
  --depth_;
}

} // namespace cmfmt::obs
