/***
 * Name: test_metrics
 * Purpose: Stage timers, counters, geometry and both summary formats.
 */
#include <gtest/gtest.h>
#include <string>
#include "observability/Metrics.h"
#include "parser/Parser.h"

using namespace pyrite;

TEST(Metrics, TextSummary) {
  obs::Metrics metrics;
  metrics.setCounter("tokens", 5);
  metrics.incCounter("tokens");
  metrics.setAstGeometry(obs::AstGeometry{4, 3, 1, 1});
  EXPECT_EQ(
      "== Metrics ==\n"
      "  tokens: 6\n"
      "  AST: nodes=4, max_depth=3, statements=1, max_block_depth=1\n",
      metrics.summaryText());
}

TEST(Metrics, JsonSummary) {
  obs::Metrics metrics;
  metrics.setCounter("tokens", 5);
  metrics.setGauge("depth", 2);
  metrics.setAstGeometry(obs::AstGeometry{4, 3, 1, 1});
  EXPECT_EQ(
      "{\n"
      "  \"durations_ms\": {\n"
      "  },\n"
      "  \"ast\": { \"nodes\": 4, \"max_depth\": 3, \"statements\": 1, \"max_block_depth\": 1 },\n"
      "  \"counters\": {\n"
      "    \"tokens\": 5\n"
      "  },\n"
      "  \"gauges\": {\n"
      "    \"depth\": 2\n"
      "  }\n"
      "}\n",
      metrics.summaryJson());
}

TEST(Metrics, StageTiming) {
  obs::Metrics metrics;
  metrics.stop("never-started");
  EXPECT_EQ(0u, metrics.durationMicros("never-started"));
  {
    obs::ScopedStage stage(&metrics, "Lex");
  }
  const std::string text = metrics.summaryText();
  EXPECT_NE(std::string::npos, text.find("  Lex: "));
  EXPECT_NE(std::string::npos, text.find(" ms\n"));
  EXPECT_NE(std::string::npos, metrics.summaryJson().find("\"lex\": "));
}

TEST(Metrics, ScopedStageWithoutSink) {
  EXPECT_NO_THROW({ obs::ScopedStage stage(nullptr, "parse"); });
}

TEST(Metrics, RecordedByParseSource) {
  obs::Metrics metrics;
  auto r = parse::parseSource("x = 1\n", "m.py", {}, {}, &metrics);
  ASSERT_TRUE(r.ok());
  const auto& counters = metrics.counters();
  ASSERT_EQ(1u, counters.count("tokens"));
  EXPECT_GT(counters.at("tokens"), 0u);
  EXPECT_EQ(0u, counters.at("lex_errors"));
  EXPECT_EQ(0u, counters.at("parse_errors"));
  ASSERT_TRUE(metrics.astGeometry().has_value());
  EXPECT_EQ(4u, metrics.astGeometry()->nodes);
  EXPECT_EQ(6u, metrics.gauges().at("source_bytes"));
  EXPECT_NE(std::string::npos, metrics.summaryText().find("  parse: "));
}

TEST(Metrics, ErrorsCountedWithoutGeometry) {
  obs::Metrics metrics;
  auto r = parse::parseSource("x = $\ny = = 2\n", "m.py", {}, {}, &metrics);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(1u, metrics.counters().at("lex_errors"));
  EXPECT_GE(metrics.counters().at("parse_errors"), 1u);
  EXPECT_FALSE(metrics.astGeometry().has_value());
}
