/***
 * Name: cmfmt::obs::Metrics (impl)
 * Purpose: Stage timing and the two summary formats.
 */
#include "observability/Metrics.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace cmfmt::obs {

namespace {

constexpr double kUsPerMs = 1000.0;
constexpr uint64_t kDeepNesting = 32U;
constexpr uint64_t kLargeFileTokens = 100000U;
constexpr std::size_t kStageColumn = 10;
constexpr std::size_t kCounterColumn = 22;

std::string millis(const uint64_t us) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << static_cast<double>(us) / kUsPerMs;
  return oss.str();
}

std::string lowered(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string padded(const std::string& s, const std::size_t width) {
  return s.size() >= width ? s + " " : s + std::string(width - s.size(), ' ');
}

// "parse.statements" -> {"parse", "statements"}; keys without a dot go under "misc"
std::map<std::string, std::map<std::string, uint64_t>> grouped(const std::map<std::string, uint64_t>& counters) {
  std::map<std::string, std::map<std::string, uint64_t>> out;
  for (const auto& [key, value] : counters) {
    const auto dot = key.find('.');
    if (dot == std::string::npos) {
      out["misc"][key] = value;
    } else {
      out[key.substr(0, dot)][key.substr(dot + 1)] = value;
    }
  }
  return out;
}

} // namespace

void Metrics::start(const std::string& name) {
  running_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  const auto it = running_.find(name);
  if (it == running_.end()) { return; }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - it->second);
  durations_us_[name] += static_cast<uint64_t>(elapsed.count());
  running_.erase(it);
}

void Metrics::addTreeGeometry(const TreeGeometry g) {
  if (!geom_) {
    geom_ = g;
    return;
  }
  geom_->nodes += g.nodes;
  geom_->maxDepth = std::max(geom_->maxDepth, g.maxDepth);
}

uint64_t Metrics::counter(const std::string& key) const {
  const auto it = counters_.find(key);
  return it == counters_.end() ? 0 : it->second;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "cmfmt metrics\n";
  if (!durations_us_.empty()) {
    oss << "  stages:\n";
    for (const auto& [stage, us] : durations_us_) {
      oss << "    " << padded(stage, kStageColumn) << millis(us) << " ms\n";
    }
  }
  if (geom_) {
    oss << "  cst: " << geom_->nodes << " nodes, depth " << geom_->maxDepth << "\n";
  }
  if (!counters_.empty()) {
    oss << "  counters:\n";
    for (const auto& [key, value] : counters_) {
      oss << "    " << padded(key, kCounterColumn) << value << "\n";
    }
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n  \"durations_ms\": {";
  const char* sep = "";
  for (const auto& [stage, us] : durations_us_) {
    oss << sep << "\n    \"" << lowered(stage) << "\": " << millis(us);
    sep = ",";
  }
  oss << "\n  }";

  if (geom_) {
    oss << ",\n  \"cst\": { \"nodes\": " << geom_->nodes << ", \"max_depth\": " << geom_->maxDepth << " }";
  }

  const auto groups = grouped(counters_);
  if (!groups.empty()) {
    oss << ",\n  \"counters\": {";
    sep = "";
    for (const auto& [group, values] : groups) {
      oss << sep << "\n    \"" << group << "\": {";
      const char* inner = " ";
      for (const auto& [name, value] : values) {
        oss << inner << "\"" << name << "\": " << value;
        inner = ", ";
      }
      oss << " }";
      sep = ",";
    }
    oss << "\n  }";
  }

  const auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    sep = "";
    for (const auto& h : hs) {
      oss << sep << "\"" << h << "\"";
      sep = ", ";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  if (counter("lint.diagnostics") > 0) { out.emplace_back("lint_diagnostics_present"); }
  if (geom_ && geom_->maxDepth > kDeepNesting) { out.emplace_back("deep_nesting"); }
  if (counter("lex.tokens") > kLargeFileTokens) { out.emplace_back("large_input"); }
  return out;
}

} // namespace cmfmt::obs
