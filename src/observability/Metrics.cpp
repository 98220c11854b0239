/***
 * Name: pyrite::obs::Metrics (impl)
 * Purpose: Implement simple timing and formatting.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace pyrite::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;

std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

void appendDurations(std::ostringstream& oss, const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    // JSON uses lowercase stage keys for stability
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

void appendAst(std::ostringstream& oss, const std::optional<AstGeometry>& geom) {
  if (!geom) { return; }
  oss << ",\n  \"ast\": { \"nodes\": " << geom->nodes << ", \"max_depth\": " << geom->maxDepth
      << ", \"statements\": " << geom->statements << ", \"max_block_depth\": " << geom->maxBlockDepth << " }";
}

void appendKeyValueObject(std::ostringstream& oss, const std::map<std::string, uint64_t>& values, int indent) {
  const std::string pad(static_cast<size_t>(indent), ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}
} // namespace

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

uint64_t Metrics::durationMicros(const std::string& name) const {
  auto iter = durations_us_.find(name);
  return iter == durations_us_.end() ? 0 : iter->second;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  for (const auto& [key, val] : counters_) {
    oss << "  " << key << ": " << val << "\n";
  }
  if (geom_) {
    oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth
        << ", statements=" << geom_->statements << ", max_block_depth=" << geom_->maxBlockDepth << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  appendAst(oss, geom_);
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendKeyValueObject(oss, counters_, kIndent4);
    oss << "\n  }";
  }
  if (!gauges_.empty()) {
    oss << ",\n  \"gauges\": {";
    appendKeyValueObject(oss, gauges_, kIndent4);
    oss << "\n  }";
  }
  oss << "\n}\n";
  return oss.str();
}

} // namespace pyrite::obs
