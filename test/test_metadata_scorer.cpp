#include "MetadataScorer.hpp"
#include "gtest/gtest.h"

static PlotMetadata labels(const std::string& x, const std::string& y) {
  PlotMetadata meta;
  meta.xAxisLabel = x;
  meta.leftYAxisLabel = y;
  return meta;
}

TEST(MetadataScorerTest, BothLabelsAgree) {
  EXPECT_DOUBLE_EQ(scoreMetadata(labels("Time", "Voltage"), labels(" time", "VOLTAGE ")), 1.0);
}

TEST(MetadataScorerTest, OneLabelAgrees) {
  EXPECT_DOUBLE_EQ(scoreMetadata(labels("Time", "Current"), labels("Time", "Voltage")), 0.5);
}

/// Two empty labels are not an agreement
TEST(MetadataScorerTest, EmptyLabelsEarnNothing) {
  EXPECT_DOUBLE_EQ(scoreMetadata(labels("", ""), labels("", "")), 0.0);
  EXPECT_DOUBLE_EQ(scoreMetadata(labels("  ", "Voltage"), labels("", "Voltage")), 0.5);
}

TEST(MetadataScorerTest, UnitsAndTitleIgnored) {
  PlotMetadata pred = labels("Time", "Voltage");
  PlotMetadata ref = labels("Time", "Voltage");
  pred.xAxisUnit = "s";
  ref.xAxisUnit = "ms";
  pred.plotTitle = "A";
  ref.plotTitle = "B";
  EXPECT_DOUBLE_EQ(scoreMetadata(pred, ref), 1.0);
}

/// Case folding covers ASCII letters only
TEST(MetadataScorerTest, NonAsciiCaseNotFolded) {
  EXPECT_DOUBLE_EQ(scoreMetadata(labels("\u0394t", "Voltage"), labels("\u03b4t", "voltage")), 0.5);
  EXPECT_DOUBLE_EQ(scoreMetadata(labels("\u0394t", "Voltage"), labels(" \u0394t", "voltage")), 1.0);
}
