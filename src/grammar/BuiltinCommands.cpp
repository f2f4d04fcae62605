/***
 * Name: cmfmt::grammar::RegisterBuiltinCommands
 * Purpose: Populate a registry with the built-in listfile command grammars.
 * Theory of Operation:
 *   Control-flow commands whose arguments are boolean expressions use the
 *   conditional grammar. Block openers and their closers get positional
 *   grammars. Project commands list their keywords and flags so the parser
 *   can split argument lists into keyword groups.
 */
#include "grammar/CommandRegistry.h"

namespace cmfmt::grammar {

namespace {

using N = NArgs;

ArgSpec Any() { return Positional(N::ZeroOrMore()); }
ArgSpec Many() { return Positional(N::OneOrMore()); }
ArgSpec One() { return Positional(N::Exactly(1)); }
ArgSpec Maybe() { return Positional(N::ZeroOrOne()); }

void registerControlFlow(CommandRegistry& r) {
  for (const char* name : {"if", "elseif", "else", "endif", "while", "endwhile"}) {
    r.add(name, Conditional());
  }
  r.add("foreach", Standard(N::OneOrMore(), {{"IN", Standard(N::ZeroOrMore(),
                                                             {{"LISTS", Any()}, {"ITEMS", Any()}, {"ZIP_LISTS", Any()}})},
                                             {"RANGE", Positional(N::OneOrMore())}}));
  for (const char* name : {"endforeach", "endfunction", "endmacro", "endblock"}) {
    r.add(name, Positional(N::ZeroOrMore()));
  }
  r.add("function", Positional(N::OneOrMore()));
  r.add("macro", Positional(N::OneOrMore()));
  r.add("block", Standard(N::ZeroOrMore(), {{"SCOPE_FOR", Positional(N::OneOrMore(), {"POLICIES", "VARIABLES"})},
                                            {"PROPAGATE", Any()}}));
  r.add("break", Positional(N::Exactly(0)));
  r.add("continue", Positional(N::Exactly(0)));
  r.add("return", Standard(N::Exactly(0), {{"PROPAGATE", Any()}}));
}

void registerTargets(CommandRegistry& r) {
  r.add("add_executable", Standard(N::OneOrMore(), {}, {"WIN32", "MACOSX_BUNDLE", "EXCLUDE_FROM_ALL", "IMPORTED", "GLOBAL"}));
  ArgSpec lib = Standard(N::OneOrMore(), {{"ALIAS", One()}},
                         {"STATIC", "SHARED", "MODULE", "OBJECT", "INTERFACE", "UNKNOWN", "EXCLUDE_FROM_ALL",
                          "IMPORTED", "GLOBAL"});
  r.add("add_library", std::move(lib));
  r.add("add_subdirectory", Standard(N::OneOrMore(), {}, {"EXCLUDE_FROM_ALL", "SYSTEM"}));
  r.add("add_test", Standard(N::ZeroOrMore(), {{"NAME", One()},
                                               {"COMMAND", Many()},
                                               {"CONFIGURATIONS", Any()},
                                               {"WORKING_DIRECTORY", One()}},
                             {"COMMAND_EXPAND_LISTS"}));
  r.add("add_custom_target",
        Standard(N::OneOrMore(), {{"COMMAND", Many()},
                                  {"DEPENDS", Any()},
                                  {"BYPRODUCTS", Any()},
                                  {"WORKING_DIRECTORY", One()},
                                  {"COMMENT", One()},
                                  {"JOB_POOL", One()},
                                  {"SOURCES", Any()}},
                 {"ALL", "VERBATIM", "USES_TERMINAL", "COMMAND_EXPAND_LISTS"}));
  r.add("add_custom_command",
        Standard(N::ZeroOrMore(), {{"OUTPUT", Many()},
                                   {"TARGET", One()},
                                   {"COMMAND", Many()},
                                   {"MAIN_DEPENDENCY", One()},
                                   {"DEPENDS", Any()},
                                   {"BYPRODUCTS", Any()},
                                   {"IMPLICIT_DEPENDS", Any()},
                                   {"WORKING_DIRECTORY", One()},
                                   {"COMMENT", One()},
                                   {"DEPFILE", One()},
                                   {"JOB_POOL", One()}},
                 {"PRE_BUILD", "PRE_LINK", "POST_BUILD", "APPEND", "VERBATIM", "USES_TERMINAL",
                  "COMMAND_EXPAND_LISTS"}));

  const ArgSpec scoped = Standard(N::OneOrMore(), {{"PUBLIC", Any()}, {"PRIVATE", Any()}, {"INTERFACE", Any()}});
  r.add("target_compile_definitions", scoped);
  r.add("target_compile_options", Standard(N::OneOrMore(), {{"PUBLIC", Any()}, {"PRIVATE", Any()}, {"INTERFACE", Any()}},
                                           {"BEFORE"}));
  r.add("target_include_directories",
        Standard(N::OneOrMore(), {{"PUBLIC", Any()}, {"PRIVATE", Any()}, {"INTERFACE", Any()}},
                 {"SYSTEM", "BEFORE", "AFTER"}));
  r.add("target_link_libraries",
        Standard(N::OneOrMore(), {{"PUBLIC", Any()},
                                  {"PRIVATE", Any()},
                                  {"INTERFACE", Any()},
                                  {"LINK_PUBLIC", Any()},
                                  {"LINK_PRIVATE", Any()},
                                  {"LINK_INTERFACE_LIBRARIES", Any()}}));
  r.add("target_sources", scoped);
  r.add("set_target_properties", Standard(N::OneOrMore(), {{"PROPERTIES", Many()}}));
  r.add("set_property", Standard(N::ZeroOrMore(), {{"TARGET", Any()},
                                                   {"SOURCE", Any()},
                                                   {"INSTALL", Any()},
                                                   {"TEST", Any()},
                                                   {"CACHE", Any()},
                                                   {"DIRECTORY", Maybe()},
                                                   {"PROPERTY", Many()}},
                                 {"GLOBAL", "APPEND", "APPEND_STRING"}));
}

void registerInstall(CommandRegistry& r) {
  // Options shared with install() itself break out to the enclosing level,
  // so an artifact body only carries the namelink options.
  const ArgSpec artifact = Standard(N::ZeroOrMore(), {{"NAMELINK_COMPONENT", One()}},
                                    {"NAMELINK_ONLY", "NAMELINK_SKIP"});
  ArgSpec install = Standard(N::ZeroOrMore(), {{"TARGETS", Many()},
                                               {"FILES", Many()},
                                               {"PROGRAMS", Many()},
                                               {"DIRECTORY", Many()},
                                               {"SCRIPT", One()},
                                               {"CODE", One()},
                                               {"EXPORT", One()},
                                               {"EXPORT_ANDROID_MK", One()},
                                               {"ARCHIVE", artifact},
                                               {"LIBRARY", artifact},
                                               {"RUNTIME", artifact},
                                               {"OBJECTS", artifact},
                                               {"FRAMEWORK", artifact},
                                               {"BUNDLE", artifact},
                                               {"PRIVATE_HEADER", artifact},
                                               {"PUBLIC_HEADER", artifact},
                                               {"RESOURCE", artifact},
                                               {"INCLUDES", Any()},
                                               {"DESTINATION", One()},
                                               {"PERMISSIONS", Many()},
                                               {"CONFIGURATIONS", Many()},
                                               {"COMPONENT", One()},
                                               {"RENAME", One()},
                                               {"NAMESPACE", One()},
                                               {"FILE", One()},
                                               {"FILES_MATCHING", Any()},
                                               {"PATTERN", Many()},
                                               {"REGEX", Many()}},
                             {"OPTIONAL", "EXCLUDE_FROM_ALL", "USE_SOURCE_PERMISSIONS", "MESSAGE_NEVER"});
  r.add("install", std::move(install));
}

void registerProject(CommandRegistry& r) {
  ArgSpec minimum = Standard(N::ZeroOrMore(), {{"VERSION", One()}}, {"FATAL_ERROR"});
  Require(minimum, {"VERSION"});
  r.add("cmake_minimum_required", std::move(minimum));
  r.add("project", Standard(N::OneOrMore(), {{"VERSION", One()},
                                             {"DESCRIPTION", One()},
                                             {"HOMEPAGE_URL", One()},
                                             {"LANGUAGES", Many()}}));
  r.add("configure_file", Standard(N::Exactly(2), {{"NEWLINE_STYLE", One()}, {"FILE_PERMISSIONS", Many()}},
                                   {"COPYONLY", "ESCAPE_QUOTES", "NO_SOURCE_PERMISSIONS",
                                    "USE_SOURCE_PERMISSIONS"}));
  r.add("execute_process", Standard(N::ZeroOrMore(), {{"COMMAND", Many()},
                                                      {"WORKING_DIRECTORY", One()},
                                                      {"TIMEOUT", One()},
                                                      {"RESULT_VARIABLE", One()},
                                                      {"RESULTS_VARIABLE", One()},
                                                      {"OUTPUT_VARIABLE", One()},
                                                      {"ERROR_VARIABLE", One()},
                                                      {"INPUT_FILE", One()},
                                                      {"OUTPUT_FILE", One()},
                                                      {"ERROR_FILE", One()},
                                                      {"COMMAND_ECHO", One()},
                                                      {"ENCODING", One()}},
                                    {"OUTPUT_QUIET", "ERROR_QUIET", "OUTPUT_STRIP_TRAILING_WHITESPACE",
                                     "ERROR_STRIP_TRAILING_WHITESPACE", "ECHO_OUTPUT_VARIABLE",
                                     "ECHO_ERROR_VARIABLE"}));
  r.add("find_package", Standard(N::OneOrMore(), {{"COMPONENTS", Many()},
                                                  {"OPTIONAL_COMPONENTS", Many()},
                                                  {"NAMES", Many()},
                                                  {"CONFIGS", Many()},
                                                  {"HINTS", Many()},
                                                  {"PATHS", Many()},
                                                  {"PATH_SUFFIXES", Many()}},
                                 {"EXACT", "QUIET", "MODULE", "CONFIG", "NO_MODULE", "REQUIRED", "NO_POLICY_SCOPE",
                                  "GLOBAL", "NO_DEFAULT_PATH"}));
  r.add("include", Standard(N::OneOrMore(), {{"RESULT_VARIABLE", One()}}, {"OPTIONAL", "NO_POLICY_SCOPE"}));
  r.add("include_directories", Standard(N::OneOrMore(), {}, {"AFTER", "BEFORE", "SYSTEM"}));
  r.add("link_directories", Standard(N::OneOrMore(), {}, {"AFTER", "BEFORE"}));
  r.add("list", Positional(N::OneOrMore(), {"APPEND", "PREPEND", "INSERT", "REMOVE_ITEM", "REMOVE_AT",
                                            "REMOVE_DUPLICATES", "LENGTH", "GET", "JOIN", "FIND", "SUBLIST",
                                            "FILTER", "TRANSFORM", "REVERSE", "SORT", "POP_BACK", "POP_FRONT"}));
  r.add("message", Positional(N::OneOrMore(), {"FATAL_ERROR", "SEND_ERROR", "WARNING", "AUTHOR_WARNING",
                                               "DEPRECATION", "NOTICE", "STATUS", "VERBOSE", "DEBUG", "TRACE",
                                               "CHECK_START", "CHECK_PASS", "CHECK_FAIL"}));
  r.add("option", Positional(N::Exactly(3)));
  r.add("set", Standard(N::OneOrMore(), {{"CACHE", Standard(N::Exactly(2), {}, {"FORCE"})}}, {"PARENT_SCOPE"}));
  r.add("unset", Standard(N::Exactly(1), {}, {"CACHE", "PARENT_SCOPE"}));
}

} // namespace

void RegisterBuiltinCommands(CommandRegistry& registry) {
  registerControlFlow(registry);
  registerTargets(registry);
  registerInstall(registry);
  registerProject(registry);
}

} // namespace cmfmt::grammar
