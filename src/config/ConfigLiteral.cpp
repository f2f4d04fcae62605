/***
 * Name: cmfmt::config::ConfigLiteral (impl)
 * Purpose: Parse and render configuration literals.
 */
#include "config/ConfigLiteral.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "cmfmt/exceptions/config_error.h"
#include "cmfmt/support/parse.h"

namespace cmfmt::config {

ConfigLiteral ConfigLiteral::Bool(const bool v) {
  ConfigLiteral out;
  out.kind = Kind::Bool;
  out.boolean = v;
  return out;
}

ConfigLiteral ConfigLiteral::Int(const long v) {
  ConfigLiteral out;
  out.kind = Kind::Int;
  out.integer = v;
  return out;
}

ConfigLiteral ConfigLiteral::String(std::string v) {
  ConfigLiteral out;
  out.kind = Kind::String;
  out.text = std::move(v);
  return out;
}

ConfigLiteral ConfigLiteral::List(std::vector<ConfigLiteral> v) {
  ConfigLiteral out;
  out.kind = Kind::List;
  out.items = std::move(v);
  return out;
}

ConfigLiteral ConfigLiteral::StringList(const std::vector<std::string>& v) {
  std::vector<ConfigLiteral> items;
  items.reserve(v.size());
  for (const auto& s : v) { items.push_back(String(s)); }
  return List(std::move(items));
}

const ConfigLiteral* ConfigLiteral::find(const std::string_view key) const {
  for (const auto& [k, v] : entries) {
    if (k == key) { return &v; }
  }
  return nullptr;
}

bool ConfigLiteral::operator==(const ConfigLiteral& other) const {
  if (kind != other.kind) { return false; }
  switch (kind) {
    case Kind::None: return true;
    case Kind::Bool: return boolean == other.boolean;
    case Kind::Int: return integer == other.integer;
    case Kind::String: return text == other.text;
    case Kind::List: return items == other.items;
    case Kind::Dict: return entries == other.entries;
  }
  return false;
}

const char* to_string(const ConfigLiteral::Kind kind) {
  switch (kind) {
    case ConfigLiteral::Kind::None: return "None";
    case ConfigLiteral::Kind::Bool: return "bool";
    case ConfigLiteral::Kind::Int: return "int";
    case ConfigLiteral::Kind::String: return "string";
    case ConfigLiteral::Kind::List: return "list";
    case ConfigLiteral::Kind::Dict: return "dict";
  }
  return "None";
}

static std::string quote(const std::string& s) {
  std::string out = "'";
  for (const char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '\'': out += "\\'"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('\'');
  return out;
}

std::string ConfigLiteral::render() const {
  std::ostringstream os;
  switch (kind) {
    case Kind::None: os << "None"; break;
    case Kind::Bool: os << (boolean ? "True" : "False"); break;
    case Kind::Int: os << integer; break;
    case Kind::String: os << quote(text); break;
    case Kind::List: {
      os << '[';
      for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) { os << ", "; }
        os << items[i].render();
      }
      os << ']';
      break;
    }
    case Kind::Dict: {
      os << '{';
      for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) { os << ", "; }
        os << quote(entries[i].first) << ": " << entries[i].second.render();
      }
      os << '}';
      break;
    }
  }
  return os.str();
}

namespace {

class LiteralReader {
 public:
  explicit LiteralReader(std::string_view text) : text_(text) {}

  ConfigLiteral readAll() {
    ConfigLiteral value = readValue();
    skipSpace();
    if (pos_ != text_.size()) { fail("unexpected trailing text"); }
    return value;
  }

 private:
  std::string_view text_;
  std::size_t pos_{0};

  [[noreturn]] void fail(const std::string& what) const {
    throw exceptions::ConfigError("malformed value '" + std::string(text_) + "': " + what + " at offset " +
                                  std::to_string(pos_));
  }

  void skipSpace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) { ++pos_; }
  }

  bool consume(const char c) {
    skipSpace();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  ConfigLiteral readValue() {
    skipSpace();
    if (pos_ >= text_.size()) { fail("missing value"); }
    const char c = text_[pos_];
    if (c == '[') { return readSequence(']'); }
    if (c == '(') { return readSequence(')'); }
    if (c == '{') { return readDict(); }
    if (c == '\'' || c == '"') { return ConfigLiteral::String(readString(false)); }
    if ((c == 'r' || c == 'R') && pos_ + 1 < text_.size() && (text_[pos_ + 1] == '\'' || text_[pos_ + 1] == '"')) {
      ++pos_;
      return ConfigLiteral::String(readString(true));
    }
    if (c == '-' || c == '+' || std::isdigit(static_cast<unsigned char>(c)) != 0) { return readInt(); }
    const std::string word = readWord();
    if (word == "None") { return ConfigLiteral::None(); }
    if (word == "True") { return ConfigLiteral::Bool(true); }
    if (word == "False") { return ConfigLiteral::Bool(false); }
    fail("unknown literal '" + word + "'");
  }

  std::string readWord() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() &&
           (std::isalnum(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '_')) {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  ConfigLiteral readInt() {
    const std::size_t start = pos_;
    if (text_[pos_] == '-' || text_[pos_] == '+') { ++pos_; }
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) { ++pos_; }
    int value = 0;
    std::string err;
    if (!support::ParseIntLiteralStrict(text_.substr(start, pos_ - start), value, &err)) {
      fail("bad integer (" + err + ")");
    }
    return ConfigLiteral::Int(value);
  }

  std::string readString(const bool raw) {
    const char quoteChar = text_[pos_++];
    std::string out;
    while (pos_ < text_.size() && text_[pos_] != quoteChar) {
      char c = text_[pos_++];
      if (c == '\\' && pos_ < text_.size()) {
        const char e = text_[pos_++];
        if (raw) {
          out.push_back(c);
          out.push_back(e);
          continue;
        }
        switch (e) {
          case 'n': c = '\n'; break;
          case 't': c = '\t'; break;
          case 'r': c = '\r'; break;
          default: c = e; break;
        }
      }
      out.push_back(c);
    }
    if (pos_ >= text_.size()) { fail("unterminated string"); }
    ++pos_; // closing quote
    return out;
  }

  ConfigLiteral readSequence(const char close) {
    ++pos_;
    std::vector<ConfigLiteral> items;
    if (consume(close)) { return ConfigLiteral::List(std::move(items)); }
    for (;;) {
      items.push_back(readValue());
      if (consume(close)) { break; }
      if (!consume(',')) { fail(std::string("expected ',' or '") + close + "'"); }
      if (consume(close)) { break; }
    }
    return ConfigLiteral::List(std::move(items));
  }

  ConfigLiteral readDict() {
    ++pos_;
    ConfigLiteral out;
    out.kind = ConfigLiteral::Kind::Dict;
    if (consume('}')) { return out; }
    for (;;) {
      const ConfigLiteral key = readValue();
      if (key.kind != ConfigLiteral::Kind::String) { fail("dict keys must be strings"); }
      if (!consume(':')) { fail("expected ':'"); }
      ConfigLiteral value = readValue();
      auto it = std::find_if(out.entries.begin(), out.entries.end(),
                             [&key](const auto& entry) { return entry.first == key.text; });
      if (it != out.entries.end()) {
        it->second = std::move(value); // later duplicates win
      } else {
        out.entries.emplace_back(key.text, std::move(value));
      }
      if (consume('}')) { break; }
      if (!consume(',')) { fail("expected ',' or '}'"); }
      if (consume('}')) { break; }
    }
    return out;
  }
};

} // namespace

ConfigLiteral ParseConfigLiteral(const std::string_view text) {
  LiteralReader reader(text);
  return reader.readAll();
}

} // namespace cmfmt::config
