#include "NearestNeighborMetric.hpp"
#include "gtest/gtest.h"

#include <algorithm>
#include <cmath>

static constexpr double kTol = 1e-12;

TEST(NearestNeighborTest, IdenticalIsZero) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates d{{"a", {{0, 0}, {3, 7}, {10, 10}}}, {"b", {{-4, 2}, {6, -8}}}};
  const auto s = metric.score(d, d);
  ASSERT_TRUE(s.has_value());
  EXPECT_NEAR(*s, 0.0, kTol);
}

/// Distances are measured in units of the reference axis ranges
TEST(NearestNeighborTest, RmseAndMae) {
  const NameToCoordinates refs{{"a", {{0, 0}, {10, 10}}}};
  const NameToCoordinates preds{{"a", {{0, 1}, {10, 7}}}};

  const NearestNeighborPointMetric rmse;
  ASSERT_TRUE(rmse.score(preds, refs).has_value());
  EXPECT_NEAR(*rmse.score(preds, refs), std::sqrt((0.01 + 0.09) / 2.0), kTol);

  const NearestNeighborPointMetric mae(NearestNeighborConfig{ErrorMetric::MAE, 1e-8});
  ASSERT_TRUE(mae.score(preds, refs).has_value());
  EXPECT_NEAR(*mae.score(preds, refs), 0.2, kTol);
}

/// The scale comes from the second argument only, so swapping arguments changes the value
TEST(NearestNeighborTest, Asymmetric) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates small{{"a", {{0, 0}, {1, 1}}}};
  const NameToCoordinates large{{"a", {{0, 0}, {10, 10}}}};
  const auto forward = metric.score(small, large);
  const auto backward = metric.score(large, small);
  ASSERT_TRUE(forward.has_value());
  ASSERT_TRUE(backward.has_value());
  EXPECT_NEAR(*forward, 0.1, kTol);
  EXPECT_NEAR(*backward, 9.0, kTol);
  EXPECT_NE(*forward, *backward);
}

TEST(NearestNeighborTest, SeriesAveraged) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates refs{{"a", {{0, 0}, {10, 10}}}, {"b", {{0, 0}, {10, 10}}}};
  const NameToCoordinates preds{{"a", {{0, 0}}}, {"b", {{0, 1}}}};
  EXPECT_NEAR(*metric.score(preds, refs), 0.05, kTol);
}

TEST(NearestNeighborTest, NoCommonSeries) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates refs{{"a", {{0, 0}, {1, 1}}}};
  const NameToCoordinates preds{{"z", {{0, 0}}}};
  EXPECT_FALSE(metric.score(preds, refs).has_value());

  const MetricResult r = metric.evaluate(preds, refs);
  EXPECT_FALSE(r.comparable);
  EXPECT_EQ(r.scale, MetricScale::UNBOUNDED);
  EXPECT_NE(std::find(r.diagnostics.begin(), r.diagnostics.end(), "missing series: a"), r.diagnostics.end());
}

/// Missing reference series are reported, the common ones still score
TEST(NearestNeighborTest, MissingSeriesDiagnostic) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates refs{{"a", {{0, 0}, {1, 1}}}, {"b", {{0, 0}, {1, 1}}}, {"c", {{0, 0}, {1, 1}}}};
  const NameToCoordinates preds{{"a", {{0, 0}, {1, 1}}}};

  EXPECT_EQ(NearestNeighborPointMetric::missingSeries(preds, refs), (std::vector<std::string>{"b", "c"}));
  const MetricResult r = metric.evaluate(preds, refs);
  ASSERT_TRUE(r.comparable);
  EXPECT_EQ(r.evaluatedSeries, 1);
  EXPECT_EQ(r.diagnostics, (std::vector<std::string>{"missing series: b", "missing series: c"}));
}

/// An empty predicted series counts as error 0, an empty reference series is skipped
TEST(NearestNeighborTest, EmptySeries) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates refs{{"a", {{0, 0}, {10, 10}}}, {"b", {{0, 0}, {10, 10}}}, {"c", {}}};
  const NameToCoordinates preds{{"a", {}}, {"b", {{0, 1}}}, {"c", {{5, 5}}}};

  const MetricResult r = metric.evaluate(preds, refs);
  ASSERT_TRUE(r.comparable);
  EXPECT_EQ(r.evaluatedSeries, 2);
  EXPECT_EQ(r.skippedSeries, 1);
  EXPECT_EQ(r.skipHistogram.at(SkipReason::EMPTY_SERIES), 1);
  EXPECT_NEAR(r.value, 0.05, kTol);

  const NameToCoordinates onlyEmpty{{"c", {}}};
  EXPECT_FALSE(metric.score(preds, onlyEmpty).has_value());
}

/// A degenerate reference axis is floored at the epsilon instead of dividing by zero
TEST(NearestNeighborTest, DegenerateScale) {
  const NearestNeighborPointMetric metric;
  const NameToCoordinates refs{{"a", {{5, 5}}}};
  const AxisScale scale = metric.computeScale(refs);
  EXPECT_DOUBLE_EQ(scale.xRange, 1e-8);
  EXPECT_DOUBLE_EQ(scale.yRange, 1e-8);

  const auto same = metric.score(NameToCoordinates{{"a", {{5, 5}}}}, refs);
  ASSERT_TRUE(same.has_value());
  EXPECT_NEAR(*same, 0.0, kTol);

  const auto off = metric.score(NameToCoordinates{{"a", {{5, 6}}}}, refs);
  ASSERT_TRUE(off.has_value());
  EXPECT_TRUE(std::isfinite(*off));
  EXPECT_GT(*off, 1.0);
}

TEST(NearestNeighborTest, SimpleDigitizationOverload) {
  const NearestNeighborPointMetric metric;
  const SimpleDigitization refs(NameToCoordinates{{"a", {{0, 0}, {10, 10}}}}, std::string("Title"));
  const SimpleDigitization preds(NameToCoordinates{{"a", {{0, 1}}}});
  const MetricResult r = metric.evaluate(preds, refs);
  ASSERT_TRUE(r.comparable);
  EXPECT_EQ(r.scale, MetricScale::UNBOUNDED);
  EXPECT_NEAR(r.value, 0.1, kTol);
}

/// Small offsets on a wide axis range are not lost to single precision
TEST(NearestNeighborTest, LargeRangeKeepsDoublePrecision) {
  const NameToCoordinates refs{{"a", {{0, 0}, {1e6, 1e6}}}};
  const NameToCoordinates preds{{"a", {{1e6, 1e6 + 0.05}}}};

  const NearestNeighborPointMetric rmse;
  const auto r = rmse.score(preds, refs);
  ASSERT_TRUE(r.has_value());
  EXPECT_GT(*r, 0.0);
  EXPECT_NEAR(*r, 5e-8, 1e-15);

  const NearestNeighborPointMetric mae(NearestNeighborConfig{ErrorMetric::MAE, 1e-8});
  const NameToCoordinates near{{"a", {{0.7, 0}}}};
  const NameToCoordinates wide{{"a", {{0, 0}, {1e3, 1e3}}}};
  const auto m = mae.score(near, wide);
  ASSERT_TRUE(m.has_value());
  EXPECT_NEAR(*m, 7e-4, 1e-15);
}
