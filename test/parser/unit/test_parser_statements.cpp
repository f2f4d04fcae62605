/***
 * Name: test_parser_statements
 * Purpose: File-level parsing: statements, comments, switches and flow-control blocks.
 */
#include <gtest/gtest.h>
#include "cmfmt/exceptions/parse_error.h"
#include "grammar/CommandRegistry.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace cmfmt;

static const grammar::CommandRegistry& registry() {
  static const grammar::CommandRegistry reg = [] {
    auto r = grammar::CommandRegistry::WithBuiltins();
    r.add("cmd", grammar::Standard(grammar::NArgs::ZeroOrMore(),
                                   {{"FOO", grammar::Positional(grammar::NArgs::ZeroOrMore())}}));
    return r;
  }();
  return reg;
}

static cst::NodePtr parseText(const std::string& src) {
  lex::Lexer L; L.pushString(src, "test.cmake");
  parse::Parser P(L, registry());
  return P.parseFile();
}

static std::vector<const cst::Node*> statementsOf(const cst::Node& body) {
  std::vector<const cst::Node*> out;
  for (const auto* child : body.childNodes()) {
    if (child->kind == cst::NodeKind::Statement) out.push_back(child);
  }
  return out;
}

static std::vector<std::string> argumentTexts(const cst::Node& group) {
  std::vector<std::string> out;
  for (const auto* child : group.childNodes()) {
    if (child->kind == cst::NodeKind::Argument) out.push_back(child->firstToken()->text);
  }
  return out;
}

TEST(ParserStatements, SingleStatement) {
  auto body = parseText("add_library(foo STATIC a.cpp)\n");
  ASSERT_EQ(body->kind, cst::NodeKind::Body);
  ASSERT_EQ(body->size(), 2u);
  const auto* st = body->childNode(0);
  ASSERT_NE(st, nullptr);
  EXPECT_EQ(st->kind, cst::NodeKind::Statement);
  EXPECT_EQ(st->command(), "add_library");
  ASSERT_NE(st->arguments(), nullptr);
  EXPECT_EQ(st->arguments()->kind, cst::NodeKind::ArgGroup);
  const auto children = st->childNodes();
  EXPECT_EQ(children.front()->kind, cst::NodeKind::FunName);
  EXPECT_EQ(children.back()->kind, cst::NodeKind::RParen);
  EXPECT_EQ(body->childToken(1)->kind, lex::TokenKind::Newline);
}

TEST(ParserStatements, KeywordPrecedence) {
  auto body = parseText("cmd(a b FOO c d)");
  const auto* args = statementsOf(*body)[0]->arguments();
  ASSERT_EQ(args->positionalGroups().size(), 1u);
  ASSERT_EQ(args->keywordGroups().size(), 1u);
  EXPECT_EQ(argumentTexts(*args->positionalGroups()[0]), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(args->keywordGroups()[0]->keyword()->reconstruct(), "FOO");
  EXPECT_EQ(argumentTexts(*args->keywordGroups()[0]->body()), (std::vector<std::string>{"c", "d"}));
}

TEST(ParserStatements, KeywordsMatchCaseInsensitively) {
  auto body = parseText("TARGET_LINK_LIBRARIES(app public foo private bar)\n");
  const auto* st = statementsOf(*body)[0];
  EXPECT_EQ(st->command(), "target_link_libraries");
  EXPECT_EQ(st->arguments()->keywordGroups().size(), 2u);
}

TEST(ParserStatements, QuotedKeywordSpellingIsPositional) {
  auto body = parseText("cmd(\"FOO\" x)");
  const auto* args = statementsOf(*body)[0]->arguments();
  EXPECT_EQ(args->keywordGroups().size(), 0u);
  EXPECT_EQ(args->positionalGroups().size(), 1u);
}

TEST(ParserStatements, NestedKeywordTable) {
  auto body = parseText("set(VAR a b CACHE STRING \"doc\" FORCE)\n");
  const auto* args = statementsOf(*body)[0]->arguments();
  ASSERT_EQ(args->keywordGroups().size(), 1u);
  const auto* cache = args->keywordGroups()[0]->body();
  ASSERT_NE(cache, nullptr);
  const auto groups = cache->positionalGroups();
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(argumentTexts(*groups[0]), (std::vector<std::string>{"STRING", "\"doc\""}));
  EXPECT_EQ(groups[1]->childNodes()[0]->kind, cst::NodeKind::Flag);
}

TEST(ParserStatements, ExactKeywordArityTakesKeywordSpelling) {
  auto body = parseText("install(TARGETS t COMPONENT RUNTIME)\n");
  const auto kwargs = statementsOf(*body)[0]->arguments()->keywordGroups();
  ASSERT_EQ(kwargs.size(), 2u);
  EXPECT_EQ(kwargs[1]->keyword()->reconstruct(), "COMPONENT");
  EXPECT_EQ(argumentTexts(*kwargs[1]->body()), (std::vector<std::string>{"RUNTIME"}));
}

TEST(ParserStatements, ArtifactOptionsAndSharedKeywords) {
  auto body = parseText("install(TARGETS t RUNTIME NAMELINK_SKIP DESTINATION bin)\n");
  const auto kwargs = statementsOf(*body)[0]->arguments()->keywordGroups();
  ASSERT_EQ(kwargs.size(), 3u);
  EXPECT_EQ(kwargs[1]->keyword()->reconstruct(), "RUNTIME");
  ASSERT_NE(kwargs[1]->body(), nullptr);
  EXPECT_NE(kwargs[1]->body()->reconstruct().find("NAMELINK_SKIP"), std::string::npos);
  EXPECT_EQ(kwargs[2]->keyword()->reconstruct(), "DESTINATION");
  EXPECT_EQ(argumentTexts(*kwargs[2]->body()), (std::vector<std::string>{"bin"}));
}

TEST(ParserStatements, ConditionalWithParens) {
  auto body = parseText("if(A AND (B OR C))\nendif()\n");
  const auto* block = body->childNode(0);
  ASSERT_EQ(block->kind, cst::NodeKind::FlowControl);
  const auto* opener = block->childNode(0);
  const auto* args = opener->arguments();
  ASSERT_TRUE(args->isConditional());
  const auto kwargs = args->keywordGroups();
  ASSERT_EQ(kwargs.size(), 1u);
  const auto* andBody = kwargs[0]->body();
  ASSERT_NE(andBody, nullptr);
  const auto inner = andBody->childNodes();
  ASSERT_EQ(inner.size(), 1u);
  EXPECT_EQ(inner[0]->kind, cst::NodeKind::ParenGroup);
  EXPECT_EQ(inner[0]->reconstruct(), "(B OR C)");
}

TEST(ParserStatements, FlowControlBlocks) {
  const std::string src =
      "function(f x)\n"
      "  foreach(item IN LISTS x)\n"
      "    if(item)\n"
      "      break()\n"
      "    elseif(other)\n"
      "    else()\n"
      "    endif()\n"
      "  endforeach()\n"
      "endfunction()\n";
  auto body = parseText(src);
  ASSERT_EQ(body->childNodes().size(), 1u);
  const auto* fn = body->childNode(0);
  ASSERT_EQ(fn->kind, cst::NodeKind::FlowControl);
  EXPECT_EQ(fn->childNode(0)->command(), "function");
  EXPECT_EQ(fn->childNode(2)->command(), "endfunction");
  const auto* fnBody = fn->childNode(1);
  ASSERT_EQ(fnBody->kind, cst::NodeKind::Body);
  const auto* loop = fnBody->childNodes()[0];
  ASSERT_EQ(loop->kind, cst::NodeKind::FlowControl);
  const auto* cond = loop->childNode(1)->childNodes()[0];
  ASSERT_EQ(cond->kind, cst::NodeKind::FlowControl);
  // elseif/else stay plain statements inside the if body
  const auto inner = statementsOf(*cond->childNode(1));
  ASSERT_EQ(inner.size(), 3u);
  EXPECT_EQ(inner[0]->command(), "break");
  EXPECT_EQ(inner[1]->command(), "elseif");
  EXPECT_EQ(inner[2]->command(), "else");
  EXPECT_EQ(body->reconstruct(), src);
}

TEST(ParserStatements, UpperCaseBlockClosers) {
  auto body = parseText("IF(A)\nENDIF()\n");
  ASSERT_EQ(body->childNode(0)->kind, cst::NodeKind::FlowControl);
  EXPECT_EQ(body->childNode(0)->childNode(2)->command(), "endif");
}

TEST(ParserStatements, CommentsGlueAcrossLines) {
  auto body = parseText("# one\n  # two\n\n# three\nx()\n");
  const auto nodes = body->childNodes();
  ASSERT_EQ(nodes.size(), 3u);
  EXPECT_EQ(nodes[0]->kind, cst::NodeKind::Comment);
  EXPECT_EQ(nodes[0]->reconstruct(), "# one\n  # two");
  EXPECT_EQ(nodes[1]->kind, cst::NodeKind::Comment);
  EXPECT_EQ(nodes[1]->reconstruct(), "# three");
  EXPECT_EQ(nodes[2]->kind, cst::NodeKind::Statement);
}

TEST(ParserStatements, TrailingCommentBelongsToStatement) {
  auto body = parseText("x()  # note\ny()\n");
  const auto st = statementsOf(*body);
  ASSERT_EQ(st.size(), 2u);
  EXPECT_EQ(st[0]->reconstruct(), "x()  # note");
}

TEST(ParserStatements, FormatSwitches) {
  auto body = parseText("# cmake-format: off\nx()\n# cmake-format: on\n");
  const auto nodes = body->childNodes();
  ASSERT_EQ(nodes.size(), 3u);
  EXPECT_EQ(nodes[0]->kind, cst::NodeKind::OnOffSwitch);
  EXPECT_EQ(nodes[1]->kind, cst::NodeKind::Statement);
  EXPECT_EQ(nodes[2]->kind, cst::NodeKind::OnOffSwitch);
  EXPECT_EQ(nodes[2]->firstToken()->kind, lex::TokenKind::FormatOn);
}

TEST(ParserStatements, ByteOrderMarkStaysInBody) {
  auto body = parseText("\xEF\xBB\xBFproject(x)\n");
  ASSERT_NE(body->childToken(0), nullptr);
  EXPECT_EQ(body->childToken(0)->kind, lex::TokenKind::ByteOrderMark);
  EXPECT_EQ(statementsOf(*body)[0]->command(), "project");
}

TEST(ParserStatements, SpaceBeforeParenAndLeftovers) {
  const std::string src = "option (A \"doc\" OFF # default\n)\n";
  auto body = parseText(src);
  EXPECT_EQ(statementsOf(*body)[0]->command(), "option");
  EXPECT_EQ(body->reconstruct(), src);
}

TEST(ParserErrors, UnterminatedBlock) {
  try {
    (void)parseText("if(A)\nmessage(x)\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.expected(), "endif()");
    EXPECT_EQ(e.observed(), "end of input");
    EXPECT_EQ(e.location().line, 3);
  }
}

TEST(ParserErrors, UnexpectedTopLevelToken) {
  try {
    (void)parseText("x()\n)\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.expected(), "command name");
    EXPECT_EQ(e.location().line, 2);
    EXPECT_EQ(e.location().col, 1);
  }
}

TEST(ParserErrors, MissingLeftParen) {
  try {
    (void)parseText("message STATUS\n");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.expected(), "LeftParen");
    EXPECT_EQ(e.observed(), "Word 'STATUS'");
  }
}

TEST(ParserErrors, UnbalancedParenAtEndOfInput) {
  try {
    (void)parseText("cmd(a (b c)");
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.observed(), "end of input");
    EXPECT_EQ(e.expected(), "RightParen");
    EXPECT_EQ(e.location().col, 12);
  }
}

TEST(ParserErrors, ArgumentsToZeroArityCommand) {
  EXPECT_THROW((void)parseText("break(x)\n"), exceptions::ParseError);
}

TEST(ParserBlocks, BlockCloserTable) {
  EXPECT_EQ(parse::Parser::blockCloser("if"), "endif");
  EXPECT_EQ(parse::Parser::blockCloser("foreach"), "endforeach");
  EXPECT_EQ(parse::Parser::blockCloser("block"), "endblock");
  EXPECT_EQ(parse::Parser::blockCloser("message"), "");
}

namespace {
class VectorStream : public lex::ITokenStream {
 public:
  explicit VectorStream(std::vector<lex::Token> toks) : toks_(std::move(toks)) {}
  const lex::Token& peek(std::size_t k) override {
    return pos_ + k < toks_.size() ? toks_[pos_ + k] : toks_.back();
  }
  lex::Token next() override { return pos_ < toks_.size() ? toks_[pos_++] : toks_.back(); }

 private:
  std::vector<lex::Token> toks_;
  std::size_t pos_{0};
};
} // namespace

TEST(ParserStreams, ReadsAnyTokenStreamFromItsFront) {
  lex::Lexer L; L.pushString("# lead\nset(x 1) # t\n", "stream.cmake");
  VectorStream stream(L.tokens());
  (void)stream.next(); // "# lead" is already consumed by the caller
  parse::Parser P(stream, registry());
  auto body = P.parseFile();
  EXPECT_EQ(body->reconstruct(), "\nset(x 1) # t\n");
  ASSERT_EQ(statementsOf(*body).size(), 1u);
  EXPECT_EQ(stream.peek(0).kind, lex::TokenKind::End);
}
