/***
 * Name: pyrite::obs::Metrics
 * Purpose: Collect per-stage timings, counters and AST geometry for a parse.
 * Inputs:
 *   - Calls to start/stop timers for named stages ("lex", "parse").
 *   - Counters (tokens, lex_errors, parse_errors) and gauges.
 *   - AST summary values recorded after a successful parse.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to microseconds. Geometry is a small struct. Formatting is
 *   performed on demand; keys are emitted in sorted order.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace pyrite::obs {

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
  uint64_t statements{0};
  uint64_t maxBlockDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  // Accumulated duration of a stopped stage, 0 when never timed
  uint64_t durationMicros(const std::string& name) const;

  void setAstGeometry(AstGeometry g) { geom_ = g; }
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }

  std::string summaryText() const;
  std::string summaryJson() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<AstGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

// Times one stage for the lifetime of the object; no-op without metrics
class ScopedStage {
 public:
  ScopedStage(Metrics* metrics, std::string name) : metrics_(metrics), name_(std::move(name)) {
    if (metrics_ != nullptr) metrics_->start(name_);
  }
  ~ScopedStage() {
    if (metrics_ != nullptr) metrics_->stop(name_);
  }
  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;
  ScopedStage(ScopedStage&&) = delete;
  ScopedStage& operator=(ScopedStage&&) = delete;

 private:
  Metrics* metrics_;
  std::string name_;
};

} // namespace pyrite::obs
