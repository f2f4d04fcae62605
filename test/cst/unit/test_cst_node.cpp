/***
 * Name: test_cst_node
 * Purpose: Node construction, structural views, lossless reconstruction and geometry.
 */
#include <gtest/gtest.h>
#include "cst/GeometrySummary.h"
#include "cst/Node.h"

using namespace cmfmt;

static lex::Token tok(lex::TokenKind kind, const std::string& text, int line = 1, int col = 1) {
  lex::Token t;
  t.kind = kind;
  t.text = text;
  t.file = "node.cmake";
  t.line = line;
  t.col = col;
  return t;
}

TEST(CstNode, MakeInitializesPayloadByKind) {
  EXPECT_TRUE(std::holds_alternative<cst::ArgTreeInfo>(cst::Node::Make(cst::NodeKind::ArgGroup)->payload));
  EXPECT_TRUE(std::holds_alternative<cst::PargGroupInfo>(cst::Node::Make(cst::NodeKind::PargGroup)->payload));
  EXPECT_TRUE(std::holds_alternative<cst::KwargGroupInfo>(cst::Node::Make(cst::NodeKind::KwargGroup)->payload));
  EXPECT_TRUE(std::holds_alternative<cst::StatementInfo>(cst::Node::Make(cst::NodeKind::Statement)->payload));
  EXPECT_TRUE(std::holds_alternative<std::monostate>(cst::Node::Make(cst::NodeKind::Comment)->payload));
}

TEST(CstNode, ChildAccessAndReconstruct) {
  auto group = cst::Node::Make(cst::NodeKind::PargGroup);
  auto arg = cst::Node::Make(cst::NodeKind::Argument);
  arg->append(tok(lex::TokenKind::Word, "a"));
  EXPECT_EQ(group->append(tok(lex::TokenKind::Whitespace, " ")), 0u);
  EXPECT_EQ(group->append(std::move(arg)), 1u);

  EXPECT_EQ(group->size(), 2u);
  EXPECT_EQ(group->childNode(0), nullptr);
  ASSERT_NE(group->childToken(0), nullptr);
  EXPECT_EQ(group->childToken(0)->text, " ");
  ASSERT_NE(group->childNode(1), nullptr);
  EXPECT_EQ(group->childNode(1)->kind, cst::NodeKind::Argument);
  EXPECT_EQ(group->childNode(5), nullptr);
  EXPECT_EQ(group->childNodes().size(), 1u);

  EXPECT_EQ(group->reconstruct(), " a");
  EXPECT_EQ(group->firstToken()->text, " ");
  EXPECT_EQ(group->firstSemanticToken()->text, "a");
}

TEST(CstNode, SortableOnlyOnPositionalGroups) {
  auto group = cst::Node::Make(cst::NodeKind::PargGroup);
  EXPECT_FALSE(group->sortable());
  group->setSortable(true);
  EXPECT_TRUE(group->sortable());
  ASSERT_NE(group->positionalSpec(), nullptr);

  auto other = cst::Node::Make(cst::NodeKind::Argument);
  other->setSortable(true);
  EXPECT_FALSE(other->sortable());
  EXPECT_EQ(other->positionalSpec(), nullptr);
}

TEST(CstNode, KeywordGroupViews) {
  auto kw = cst::Node::Make(cst::NodeKind::KwargGroup);
  auto keyword = cst::Node::Make(cst::NodeKind::Keyword);
  keyword->append(tok(lex::TokenKind::Word, "SOURCES"));
  const auto kIdx = kw->append(std::move(keyword));
  kw->payload = cst::KwargGroupInfo{kIdx, std::nullopt};
  ASSERT_NE(kw->keyword(), nullptr);
  EXPECT_EQ(kw->keyword()->reconstruct(), "SOURCES");
  EXPECT_EQ(kw->body(), nullptr);
}

TEST(CstNode, NodeKindNames) {
  EXPECT_STREQ(cst::to_string(cst::NodeKind::KwargGroup), "KWARGGROUP");
  EXPECT_STREQ(cst::to_string(cst::NodeKind::FlowControl), "FLOWCONTROL");
  EXPECT_STREQ(cst::to_string(cst::NodeKind::OnOffSwitch), "ONOFFSWITCH");
}

TEST(CstGeometry, CountsNodesAndDepth) {
  auto body = cst::Node::Make(cst::NodeKind::Body);
  auto statement = cst::Node::Make(cst::NodeKind::Statement);
  auto name = cst::Node::Make(cst::NodeKind::FunName);
  name->append(tok(lex::TokenKind::Word, "x"));
  statement->append(std::move(name));
  body->append(tok(lex::TokenKind::Newline, "\n"));
  body->append(std::move(statement));

  const auto g = cst::ComputeGeometry(*body);
  EXPECT_EQ(g.nodes, 3u);
  EXPECT_EQ(g.maxDepth, 3u);

  const auto single = cst::ComputeGeometry(*cst::Node::Make(cst::NodeKind::Body));
  EXPECT_EQ(single.nodes, 1u);
  EXPECT_EQ(single.maxDepth, 1u);
}
