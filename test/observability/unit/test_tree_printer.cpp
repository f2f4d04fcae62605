/***
 * Name: test_tree_printer
 * Purpose: Outline form of a parsed listfile, with and without raw tokens.
 */
#include <gtest/gtest.h>
#include "grammar/CommandRegistry.h"
#include "lexer/Lexer.h"
#include "observability/TreePrinter.h"
#include "parser/Parser.h"

using namespace cmfmt;

static cst::NodePtr parseText(const char* src) {
  static const grammar::CommandRegistry reg = [] {
    auto r = grammar::CommandRegistry::WithBuiltins();
    r.add("cmd", grammar::Standard(grammar::NArgs::ZeroOrMore(),
                                   {{"FOO", grammar::Positional(grammar::NArgs::ZeroOrMore(), {}, true)}}));
    return r;
  }();
  lex::Lexer L; L.pushString(src, "print_test.cmake");
  parse::Parser P(L, reg);
  return P.parseFile();
}

TEST(ObservabilityTreePrinter, Outline) {
  auto body = parseText("# lead\ncmd(a FOO b)\n");
  const auto out = obs::TreePrinter().print(*body);
  EXPECT_EQ(out.rfind("BODY\n", 0), 0u);
  EXPECT_NE(out.find("\n  COMMENT # lead\n"), std::string::npos);
  EXPECT_NE(out.find("\n  STATEMENT cmd\n"), std::string::npos);
  EXPECT_NE(out.find("\n    FUNNAME cmd\n"), std::string::npos);
  EXPECT_NE(out.find("\n    LPAREN (\n"), std::string::npos);
  EXPECT_NE(out.find("\n    ARGGROUP\n"), std::string::npos);
  EXPECT_NE(out.find("PARGGROUP npargs=*\n"), std::string::npos);
  EXPECT_NE(out.find("KWARGGROUP\n"), std::string::npos);
  EXPECT_NE(out.find("KEYWORD FOO\n"), std::string::npos);
  EXPECT_NE(out.find("PARGGROUP npargs=* sortable\n"), std::string::npos);
  EXPECT_NE(out.find("ARGUMENT b\n"), std::string::npos);
  EXPECT_EQ(out.find("<Newline>"), std::string::npos);
  EXPECT_EQ(out.find("<Whitespace>"), std::string::npos);
}

TEST(ObservabilityTreePrinter, ShowWhitespaceListsRawTokens) {
  auto body = parseText("if(A AND B)\nendif()\n");
  const auto out = obs::TreePrinter(true).print(*body);
  EXPECT_NE(out.find("FLOWCONTROL\n"), std::string::npos);
  EXPECT_NE(out.find("STATEMENT if\n"), std::string::npos);
  EXPECT_NE(out.find("ARGGROUP conditional\n"), std::string::npos);
  EXPECT_NE(out.find("STATEMENT endif\n"), std::string::npos);
  EXPECT_NE(out.find("<Newline> \"\\n\""), std::string::npos);
  EXPECT_NE(out.find("<Whitespace> \" \""), std::string::npos);
}
