#include "PlotModel.hpp"
#include "gtest/gtest.h"

#include <limits>
#include <stdexcept>

/// Non-finite coordinates are rejected, negative ones are ordinary plot data
TEST(PlotModelTest, DataPointValidation) {
  EXPECT_THROW(DataPoint(std::numeric_limits<double>::quiet_NaN(), 1.0, "a"), std::invalid_argument);
  EXPECT_THROW(DataPoint(1.0, std::numeric_limits<double>::infinity(), "a"), std::invalid_argument);
  const DataPoint p(-3.5, -0.25, "a", AxisSide::RIGHT);
  EXPECT_DOUBLE_EQ(p.getX(), -3.5);
  EXPECT_DOUBLE_EQ(p.getY(), -0.25);
  EXPECT_EQ(p.getSeriesName(), "a");
  EXPECT_EQ(p.getAxis(), AxisSide::RIGHT);
}

TEST(PlotModelTest, SeriesRejectsForeignPoint) {
  std::vector<DataPoint> points{DataPoint(0, 0, "a"), DataPoint(1, 1, "b")};
  EXPECT_THROW(DataSeries("a", points), std::invalid_argument);
}

TEST(PlotModelTest, SeriesFromCoordinates) {
  const auto s = DataSeries::fromCoordinates("voltage", {{0, 1}, {2, 3}}, AxisSide::RIGHT);
  ASSERT_EQ(s.size(), 2u);
  EXPECT_EQ(s.getPoints()[1].getSeriesName(), "voltage");
  EXPECT_EQ(s.getPoints()[1].getAxis(), AxisSide::RIGHT);
  EXPECT_EQ(s.getColor(), "unknown");
  EXPECT_EQ(s.getMarkerStyle(), "unknown");
  const auto coords = s.toCoordinates();
  EXPECT_DOUBLE_EQ(coords[1][0], 2.0);
  EXPECT_DOUBLE_EQ(coords[1][1], 3.0);
}

TEST(PlotModelTest, DuplicateSeriesNames) {
  std::vector<DataSeries> series{DataSeries::fromCoordinates("a", {{0, 0}}),
                                 DataSeries::fromCoordinates("a", {{1, 1}})};
  EXPECT_THROW(ExtractedPlotData(PlotMetadata(), series), std::invalid_argument);
}

/// Right-axis metadata only survives on dual-axis plots
TEST(PlotModelTest, SingleAxisDropsRightAxisMetadata) {
  PlotMetadata meta;
  meta.xAxisLabel = "Time";
  meta.rightYAxisLabel = "Pressure";
  meta.rightYAxisUnit = "bar";

  const ExtractedPlotData single(meta, {});
  EXPECT_TRUE(single.getMetadata().rightYAxisLabel.empty());
  EXPECT_TRUE(single.getMetadata().rightYAxisUnit.empty());
  EXPECT_EQ(single.getMetadata().xAxisLabel, "Time");

  meta.isDualAxis = true;
  const ExtractedPlotData dual(meta, {});
  EXPECT_EQ(dual.getMetadata().rightYAxisLabel, "Pressure");
  EXPECT_EQ(dual.getMetadata().rightYAxisUnit, "bar");
}

TEST(PlotModelTest, PlotLookup) {
  const ExtractedPlotData plot(PlotMetadata(), {DataSeries::fromCoordinates("b", {{0, 0}, {1, 1}}),
                                                DataSeries::fromCoordinates("a", {{2, 2}})});
  ASSERT_NE(plot.findSeries("a"), nullptr);
  EXPECT_EQ(plot.findSeries("a")->size(), 1u);
  EXPECT_EQ(plot.findSeries("c"), nullptr);
  EXPECT_EQ(plot.getSeriesNames(), (std::set<std::string>{"a", "b"}));
  EXPECT_EQ(plot.totalPointCount(), 3u);
}

TEST(PlotModelTest, SimpleDigitizationValidation) {
  NameToCoordinates coords{{"a", {{0.0, std::numeric_limits<double>::quiet_NaN()}}}};
  EXPECT_THROW(SimpleDigitization{coords}, std::invalid_argument);
}

/// simple -> structured -> simple keeps coordinates and labels
TEST(PlotModelTest, SimpleDigitizationConversion) {
  const SimpleDigitization simple({{"a", {{0, 1}, {2, 3}}}, {"b", {}}}, std::string("Title"),
                                  std::string("Time"), std::string("s"), std::nullopt, std::string("V"));
  const ExtractedPlotData plot = simple.toExtractedPlotData();
  EXPECT_FALSE(plot.getMetadata().isDualAxis);
  EXPECT_EQ(plot.getMetadata().plotTitle, "Title");
  EXPECT_EQ(plot.getMetadata().xAxisLabel, "Time");
  EXPECT_EQ(plot.getMetadata().xAxisUnit, "s");
  EXPECT_TRUE(plot.getMetadata().leftYAxisLabel.empty());
  EXPECT_EQ(plot.getMetadata().leftYAxisUnit, "V");
  ASSERT_NE(plot.findSeries("a"), nullptr);
  EXPECT_EQ(plot.findSeries("a")->getAxis(), AxisSide::LEFT);
  EXPECT_TRUE(plot.findSeries("b")->empty());

  const SimpleDigitization back = SimpleDigitization::fromExtractedPlotData(plot);
  EXPECT_EQ(back.getNameToCoordinates(), simple.getNameToCoordinates());
  EXPECT_EQ(back.getTitle(), simple.getTitle());
  EXPECT_FALSE(back.getYLeftAxisLabel().has_value());
}

TEST(PlotModelTest, AxisNames) {
  EXPECT_EQ(parseAxisSide("left"), AxisSide::LEFT);
  EXPECT_EQ(parseAxisSide(" Right "), AxisSide::RIGHT);
  EXPECT_THROW(parseAxisSide("top"), std::invalid_argument);
}
