/***
 * Name: cmfmt::grammar conditional vocabulary (impl)
 */
#include "grammar/ConditionalFlags.h"

namespace cmfmt::grammar {

const std::vector<std::string>& ConditionalFlags() {
  static const std::vector<std::string> kFlags{
      "COMMAND",          "DEFINED",         "EQUAL",         "EXISTS",
      "GREATER",          "GREATER_EQUAL",   "IN_LIST",       "IS_ABSOLUTE",
      "IS_DIRECTORY",     "IS_NEWER_THAN",   "IS_SYMLINK",    "LESS",
      "LESS_EQUAL",       "MATCHES",         "NOT",           "POLICY",
      "STREQUAL",         "STRGREATER",      "STRGREATER_EQUAL", "STRLESS",
      "STRLESS_EQUAL",    "TARGET",          "TEST",          "VERSION_EQUAL",
      "VERSION_GREATER",  "VERSION_GREATER_EQUAL", "VERSION_LESS", "VERSION_LESS_EQUAL"};
  return kFlags;
}

const std::vector<std::string>& ConditionalKeywords() {
  static const std::vector<std::string> kKeywords{"AND", "OR"};
  return kKeywords;
}

} // namespace cmfmt::grammar
