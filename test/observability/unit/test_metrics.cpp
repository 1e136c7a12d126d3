/***
 * Name: test_metrics
 * Purpose: Validate metrics summaries, stage accumulation and derived hints.
 */
#include <gtest/gtest.h>
#include <string>
#include "observability/Metrics.h"

using namespace puretop;

TEST(ObservabilityMetrics, StopWithoutStartIsIgnored) {
  obs::Metrics m;
  m.stop("Parse");
  EXPECT_TRUE(m.durationsUs().empty());
}

TEST(ObservabilityMetrics, StagesAccumulateUnderOneKey) {
  obs::Metrics m;
  m.start("Lex");
  m.stop("Lex");
  m.start("Lex");
  m.stop("Lex");
  EXPECT_EQ(m.durationsUs().size(), 1u);
  EXPECT_EQ(m.durationsUs().count("Lex"), 1u);
}

TEST(ObservabilityMetrics, JsonSections) {
  obs::Metrics m;
  m.start("Parse");
  m.stop("Parse");
  m.setAstGeometry({12, 4});
  m.setOptimizerStat("pure_annotated", 2);
  m.incOptimizerBreakdown("pure_toplevel", "eligible", 3);
  m.incCounter("pure.denylisted", 1);
  m.setGauge("denylist.size", 32);
  const auto js = m.summaryJson();
  EXPECT_NE(js.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(js.find("\"parse\""), std::string::npos);
  EXPECT_NE(js.find("\"ast\": { \"nodes\": 12, \"max_depth\": 4 }"), std::string::npos);
  EXPECT_NE(js.find("\"optimizer\""), std::string::npos);
  EXPECT_NE(js.find("\"pure_annotated\": 2"), std::string::npos);
  EXPECT_NE(js.find("\"optimizer_breakdown\""), std::string::npos);
  EXPECT_NE(js.find("\"pure_toplevel\""), std::string::npos);
  EXPECT_NE(js.find("\"eligible\": 3"), std::string::npos);
  EXPECT_NE(js.find("\"counters\""), std::string::npos);
  EXPECT_NE(js.find("\"gauges\""), std::string::npos);
  EXPECT_NE(js.find("\"denylist.size\": 32"), std::string::npos);
  EXPECT_NE(js.find("\"hints\": [\"pure_effective\", \"helpers_denylisted\"]"), std::string::npos);
  EXPECT_EQ(js.front(), '{');
}

TEST(ObservabilityMetrics, EmptySectionsAreOmitted) {
  const obs::Metrics m;
  const auto js = m.summaryJson();
  EXPECT_EQ(js.find("\"ast\""), std::string::npos);
  EXPECT_EQ(js.find("\"optimizer\""), std::string::npos);
  EXPECT_EQ(js.find("\"hints\""), std::string::npos);
}

TEST(ObservabilityMetrics, TextSummary) {
  obs::Metrics m;
  m.start("Emit");
  m.stop("Emit");
  m.setAstGeometry({5, 3});
  m.setOptimizerStat("pure_annotated", 1);
  m.incCounter("emit.bytes", 40);
  const auto txt = m.summaryText();
  EXPECT_EQ(txt.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(txt.find("  Emit: "), std::string::npos);
  EXPECT_NE(txt.find("AST: nodes=5, max_depth=3"), std::string::npos);
  EXPECT_NE(txt.find("optimizer.pure_annotated: 1"), std::string::npos);
  EXPECT_NE(txt.find("emit.bytes: 40"), std::string::npos);
}

TEST(ObservabilityMetrics, Hints) {
  obs::Metrics m;
  EXPECT_TRUE(m.hints().empty());
  m.setOptimizerStat("pure_annotated", 0);
  m.setCounter("driver.failed_inputs", 1);
  const auto hs = m.hints();
  ASSERT_EQ(hs.size(), 2u);
  EXPECT_EQ(hs[0], "pure_no_effect");
  EXPECT_EQ(hs[1], "inputs_failed");
}
