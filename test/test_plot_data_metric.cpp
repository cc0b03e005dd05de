#include "PlotDataMetric.hpp"
#include "gtest/gtest.h"

#include <cmath>
#include <stdexcept>

static PlotMetadata timeVoltage() {
  PlotMetadata meta;
  meta.xAxisLabel = "Time";
  meta.leftYAxisLabel = "Voltage";
  return meta;
}

static ExtractedPlotData plotOf(const NameToCoordinates& series, const PlotMetadata& meta = timeVoltage()) {
  std::vector<DataSeries> list;
  for (const auto& [name, coords]: series) list.push_back(DataSeries::fromCoordinates(name, coords));
  return {meta, list};
}

/// Predicting the ground truth exactly is a perfect score
TEST(PlotDataMetricTest, Identity) {
  const PlotDataMetric metric;
  const std::vector<ExtractedPlotData> plots{
      plotOf({{"A", {{0, 0}, {10, 10}}}}),
      plotOf({{"x", {{0, 3}, {1, 7}, {2, 4}, {3, 9}}}, {"y", {{-5, -1}, {5, 1}}}}),
  };
  EXPECT_DOUBLE_EQ(metric.score(plots, plots), 1.0);

  const auto breakdowns = metric.evaluatePlots(plots, plots);
  ASSERT_EQ(breakdowns.size(), 2u);
  EXPECT_DOUBLE_EQ(breakdowns[0].metadataScore, 1.0);
  EXPECT_DOUBLE_EQ(breakdowns[0].matches.matchFraction, 1.0);
  EXPECT_DOUBLE_EQ(breakdowns[0].numerical.score, 1.0);
  EXPECT_EQ(breakdowns[1].plotIndex, 1u);
  EXPECT_EQ(breakdowns[1].numerical.evaluatedCount, 2);
}

/// Flat line against a rising one: the numerical part falls to the cutoff
TEST(PlotDataMetricTest, HardCutoff) {
  const PlotDataMetric metric;
  const auto b = metric.scorePlot(plotOf({{"A", {{0, 5}, {10, 5}}}}), plotOf({{"A", {{0, 0}, {10, 10}}}}));
  EXPECT_DOUBLE_EQ(b.metadataScore, 1.0);
  EXPECT_DOUBLE_EQ(b.matches.matchFraction, 1.0);
  EXPECT_NEAR(b.numerical.avgRmse, std::sqrt(0.1), 1e-9);
  EXPECT_DOUBLE_EQ(b.numerical.score, 0.0);
  EXPECT_NEAR(b.plotScore, 0.4, 1e-12);
}

TEST(PlotDataMetricTest, EmptyLists) {
  const PlotDataMetric metric;
  const std::vector<ExtractedPlotData> plots{plotOf({{"A", {{0, 0}, {10, 10}}}})};
  EXPECT_DOUBLE_EQ(metric.score({}, plots), 0.0);
  EXPECT_DOUBLE_EQ(metric.score(plots, {}), 0.0);

  const MetricResult r = metric.evaluate({}, plots);
  EXPECT_FALSE(r.comparable);
  EXPECT_EQ(r.scale, MetricScale::BOUNDED);
  EXPECT_FALSE(r.diagnostics.empty());
}

TEST(PlotDataMetricTest, PartialSeriesMatch) {
  const PlotDataMetric metric;
  const auto b = metric.scorePlot(plotOf({{"a", {{0, 0}, {1, 1}}}, {"b", {{0, 1}, {1, 0}}}}),
                                  plotOf({{"a", {{0, 0}, {1, 1}}}, {"c", {{0, 1}, {1, 0}}}}));
  EXPECT_DOUBLE_EQ(b.matches.matchFraction, 0.5);
  EXPECT_DOUBLE_EQ(b.numerical.score, 1.0);
  EXPECT_NEAR(b.plotScore, 0.2 + 0.2 * 0.5 + 0.6, 1e-12);
}

/// Subplots pair by position; the extra subplot is not scored
TEST(PlotDataMetricTest, LengthMismatch) {
  const PlotDataMetric metric;
  const auto good = plotOf({{"A", {{0, 0}, {10, 10}}}});
  const auto other = plotOf({{"B", {{0, 0}, {10, 10}}}}, PlotMetadata());
  EXPECT_EQ(metric.evaluatePlots({good, other}, {good}).size(), 1u);
  EXPECT_DOUBLE_EQ(metric.score({good, other}, {good}), 1.0);
  // Swapped order: positional pairing sees a different subplot
  EXPECT_DOUBLE_EQ(metric.score({other, good}, {good, other}), 0.0);
}

TEST(PlotDataMetricTest, CustomWeights) {
  CompositeMetricConfig config;
  config.weights = MetricWeights{1.0, 0.0, 0.0};
  const PlotDataMetric metric(config);
  PlotMetadata wrong = timeVoltage();
  wrong.leftYAxisLabel = "Current";
  const std::vector<ExtractedPlotData> preds{plotOf({{"A", {{0, 5}, {10, 5}}}}, wrong)};
  const std::vector<ExtractedPlotData> refs{plotOf({{"A", {{0, 0}, {10, 10}}}})};
  EXPECT_DOUBLE_EQ(metric.score(preds, refs), 0.5);
}

TEST(PlotDataMetricTest, PluggableMatcher) {
  const std::vector<ExtractedPlotData> preds{plotOf({{"efficiency", {{0, 0}, {10, 10}}}})};
  const std::vector<ExtractedPlotData> refs{plotOf({{"Efficiency %", {{0, 0}, {10, 10}}}})};

  const PlotDataMetric exact;
  EXPECT_NEAR(exact.score(preds, refs), 0.2, 1e-12);

  const PlotDataMetric fuzzy(CompositeMetricConfig(), std::make_unique<FuzzySeriesMatcher>(0.7));
  EXPECT_EQ(fuzzy.getMatcher().strategy(), MatchStrategy::FUZZY);
  EXPECT_DOUBLE_EQ(fuzzy.score(preds, refs), 1.0);

  EXPECT_THROW(PlotDataMetric(CompositeMetricConfig(), nullptr), std::invalid_argument);
}

/// Skipped series are reported next to the score
TEST(PlotDataMetricTest, SkipCountsSurface) {
  const PlotDataMetric metric;
  const std::vector<ExtractedPlotData> preds{plotOf({{"A", {{0, 0}, {10, 10}}}, {"flat", {{0, 1}, {1, 1}}}})};
  const std::vector<ExtractedPlotData> refs{plotOf({{"A", {{0, 0}, {10, 10}}}, {"flat", {{0, 1}, {1, 1}}}})};

  std::vector<PlotScoreBreakdown> breakdowns;
  const MetricResult r = metric.evaluate(preds, refs, breakdowns);
  ASSERT_TRUE(r.comparable);
  EXPECT_EQ(r.scale, MetricScale::BOUNDED);
  EXPECT_DOUBLE_EQ(r.value, 1.0);
  EXPECT_EQ(r.evaluatedSeries, 1);
  EXPECT_EQ(r.skippedSeries, 1);
  EXPECT_EQ(r.skipHistogram.at(SkipReason::ZERO_RANGE), 1);
  ASSERT_EQ(breakdowns.size(), 1u);
  EXPECT_EQ(breakdowns[0].numerical.outcomes.size(), 2u);
}
