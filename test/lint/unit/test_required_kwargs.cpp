/***
 * Name: test_required_kwargs
 * Purpose: Missing required keyword detection on parsed statements.
 */
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include "config/ConfigLoader.h"
#include "diag/DiagnosticIds.h"
#include "lexer/Lexer.h"
#include "lint/CheckRequiredKwargs.h"
#include "lint/Linter.h"
#include "parser/Parser.h"

using namespace cmfmt;

static cst::NodePtr parseWith(const std::string& src, const grammar::CommandRegistry& reg) {
  lex::Lexer L; L.pushString(src, "lint.cmake");
  parse::Parser P(L, reg);
  return P.parseFile();
}

static const cst::Node& firstStatement(const cst::Node& body) {
  for (const auto* child : body.childNodes()) {
    if (child->kind == cst::NodeKind::Statement) return *child;
  }
  throw std::runtime_error("no statement");
}

TEST(RequiredKwargs, ReportsMissingSorted) {
  auto reg = grammar::CommandRegistry::WithBuiltins();
  reg.add("gen", grammar::Standard(grammar::NArgs::ZeroOrMore(),
                                   {{"OUT", grammar::Positional(grammar::NArgs::Exactly(1))},
                                    {"DEPENDS", grammar::Positional(grammar::NArgs::ZeroOrMore())},
                                    {"BYPRODUCTS", grammar::Positional(grammar::NArgs::ZeroOrMore())}}));
  auto body = parseWith("gen(x.in\n    DEPENDS y)\n", reg);
  const auto* args = firstStatement(*body).arguments();
  ASSERT_NE(args, nullptr);

  diag::DiagnosticSink sink;
  std::map<std::string, std::string> required{{"OUT", "E1125"}, {"DEPENDS", "E1125"}, {"BYPRODUCTS", "E1125"}};
  lint::CheckRequiredKwargs(*args, sink, required);

  EXPECT_EQ(required.count("DEPENDS"), 0u);
  ASSERT_EQ(sink.size(), 2u);
  EXPECT_EQ(sink.diagnostics()[0].message, "Missing required keyword argument: BYPRODUCTS");
  EXPECT_EQ(sink.diagnostics()[1].message, "Missing required keyword argument: OUT");
  for (const auto& d : sink.diagnostics()) {
    EXPECT_EQ(d.file, "lint.cmake");
    EXPECT_EQ(d.line, 1);
    EXPECT_EQ(d.col, 5);
  }
}

TEST(RequiredKwargs, KeywordCaseDoesNotMatter) {
  auto reg = grammar::CommandRegistry::WithBuiltins();
  auto body = parseWith("cmake_minimum_required(version 3.20)\n", reg);
  diag::DiagnosticSink sink;
  std::map<std::string, std::string> required{{"VERSION", "E1125"}};
  lint::CheckRequiredKwargs(*firstStatement(*body).arguments(), sink, required);
  EXPECT_TRUE(sink.empty());
  EXPECT_TRUE(required.empty());
}

TEST(Linter, BuiltinRequirement) {
  const auto reg = grammar::CommandRegistry::WithBuiltins();
  auto body = parseWith("cmake_minimum_required(FATAL_ERROR)\nproject(demo)\n", reg);
  diag::DiagnosticSink sink;
  lint::Linter linter(reg, sink);
  EXPECT_EQ(linter.run(*body), 1u);
  ASSERT_EQ(sink.size(), 1u);
  const auto& d = sink.diagnostics()[0];
  EXPECT_EQ(d.id, std::string(diag::kMissingRequiredKwarg));
  EXPECT_EQ(d.message, "Missing required keyword argument: VERSION");
  EXPECT_EQ(d.line, 1);
  EXPECT_EQ(d.col, 24);
}

TEST(Linter, SatisfiedRequirementIsQuiet) {
  const auto reg = grammar::CommandRegistry::WithBuiltins();
  auto body = parseWith("cmake_minimum_required(VERSION 3.5 FATAL_ERROR)\n", reg);
  diag::DiagnosticSink sink;
  EXPECT_EQ(lint::Linter(reg, sink).run(*body), 0u);
}

TEST(Linter, EntersFlowControl) {
  const auto reg = grammar::CommandRegistry::WithBuiltins();
  auto body = parseWith(
      "if(WIN32)\n"
      "  foreach(x a b)\n"
      "    cmake_minimum_required(FATAL_ERROR)\n"
      "  endforeach()\n"
      "endif()\n",
      reg);
  diag::DiagnosticSink sink;
  EXPECT_EQ(lint::Linter(reg, sink).run(*body), 1u);
  ASSERT_EQ(sink.size(), 1u);
  EXPECT_EQ(sink.diagnostics()[0].line, 3);
}

TEST(Linter, RequirementsFromConfiguration) {
  diag::DiagnosticSink cfgSink;
  const auto cfg = config::LoadConfigString(
      "additional_commands = {'gen': {'kwargs': {'OUT': 1, 'IN': '+'}, 'required': ['OUT', 'IN']}}\n",
      "cfg.py", cfgSink);
  ASSERT_TRUE(cfgSink.empty());
  const auto reg = config::BuildRegistry(cfg);
  auto body = parseWith("gen(IN a b)\ngen(OUT o IN i)\n", reg);
  diag::DiagnosticSink sink;
  EXPECT_EQ(lint::Linter(reg, sink).run(*body), 1u);
  ASSERT_EQ(sink.size(), 1u);
  EXPECT_EQ(sink.diagnostics()[0].message, "Missing required keyword argument: OUT");
  EXPECT_EQ(sink.diagnostics()[0].line, 1);
}
