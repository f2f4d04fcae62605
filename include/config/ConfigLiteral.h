/***
 * Name: cmfmt::config::ConfigLiteral
 * Purpose: Value model of the configuration file (Python-like literals).
 * Inputs:
 *   - ParseConfigLiteral(text): None, True/False, integers, quoted or
 *     r-prefixed strings, [lists], (tuples as lists) and {'key': value} dicts
 * Outputs:
 *   - Tagged value; render() writes it back in the same syntax
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmfmt::config {

struct ConfigLiteral {
  enum class Kind { None, Bool, Int, String, List, Dict };

  Kind kind{Kind::None};
  bool boolean{false};
  long integer{0};
  std::string text{};
  std::vector<ConfigLiteral> items{};                          // List
  std::vector<std::pair<std::string, ConfigLiteral>> entries{}; // Dict, in source order

  static ConfigLiteral None() { return ConfigLiteral{}; }
  static ConfigLiteral Bool(bool v);
  static ConfigLiteral Int(long v);
  static ConfigLiteral String(std::string v);
  static ConfigLiteral List(std::vector<ConfigLiteral> v);
  static ConfigLiteral StringList(const std::vector<std::string>& v);

  bool isNone() const { return kind == Kind::None; }
  const ConfigLiteral* find(std::string_view key) const; // Dict lookup
  std::string render() const;

  bool operator==(const ConfigLiteral& other) const;
};

const char* to_string(ConfigLiteral::Kind kind);

// Throws ConfigError on malformed input
ConfigLiteral ParseConfigLiteral(std::string_view text);

} // namespace cmfmt::config
