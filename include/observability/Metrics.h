/***
 * Name: cmfmt::obs::Metrics
 * Purpose: Collect per-stage timings, counters and CST geometry.
 * Inputs:
 *   - Stage timers (Lex, Parse, Lint), usually through a Metrics::Stage guard
 *   - Dotted counters ("lex.tokens", "parse.statements", ...) and tree
 *     geometry recorded by the driver
 * Outputs:
 *   - Human-readable text and JSON summaries
 * Theory of Operation:
 *   Durations accumulate in microseconds per stage name, so a stage timed
 *   once per input file reports the total over all files. In JSON, counters
 *   are grouped by the part of their key before the first '.'.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cmfmt::obs {

struct TreeGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  // Times one stage for the lifetime of the guard
  class Stage {
   public:
    Stage(Metrics& metrics, std::string name) : metrics_(metrics), name_(std::move(name)) { metrics_.start(name_); }
    ~Stage() { metrics_.stop(name_); }
    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

   private:
    Metrics& metrics_;
    std::string name_;
  };

  void start(const std::string& name);
  void stop(const std::string& name);

  // Keeps the deepest tree seen and sums node counts across files
  void addTreeGeometry(TreeGeometry g);
  const std::optional<TreeGeometry>& treeGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  uint64_t counter(const std::string& key) const;
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& durations() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;

  // Short machine-readable observations derived from the counters
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> running_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<TreeGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
};

} // namespace cmfmt::obs
