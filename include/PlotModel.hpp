//
// Project: DIGI_SCORE
// File: PlotModel.hpp
//
// Value types shared by predicted and reference digitizations.
// All of them validate on construction and are read-only afterwards.
//

#pragma once

#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "CommonTypes.hpp"

// One [x, y] pair as emitted by extractors and ground-truth files
using Coordinate = std::array<double, 2>;
using NameToCoordinates = std::map<std::string, std::vector<Coordinate>>;

/**
 * @class DataPoint
 * @brief A single digitized (x, y) sample of a named series.
 * @throws std::invalid_argument on non-finite coordinates.
 */
class DataPoint {
    double x_;
    double y_;
    std::string seriesName_;
    AxisSide axis_;

public:
    DataPoint(double x, double y, std::string seriesName, AxisSide axis = AxisSide::LEFT);

    [[nodiscard]] double getX() const { return x_; }
    [[nodiscard]] double getY() const { return y_; }
    [[nodiscard]] const std::string& getSeriesName() const { return seriesName_; }
    [[nodiscard]] AxisSide getAxis() const { return axis_; }
};

/**
 * @class DataSeries
 * @brief One named trace of a plot. Point order carries no meaning.
 * @details Every point must name this series; a mismatch is rejected.
 */
class DataSeries {
    std::string name_;
    std::vector<DataPoint> points_;
    AxisSide axis_;
    std::string color_;
    std::string markerStyle_;

public:
    DataSeries(std::string name, std::vector<DataPoint> points, AxisSide axis = AxisSide::LEFT,
               std::string color = "unknown", std::string markerStyle = "unknown");

    /**
     * @brief Build a series from raw [x, y] pairs, stamping the series name and axis on each point.
     */
    static DataSeries fromCoordinates(const std::string& name, const std::vector<Coordinate>& coords,
                                      AxisSide axis = AxisSide::LEFT);

    [[nodiscard]] const std::string& getName() const { return name_; }
    [[nodiscard]] const std::vector<DataPoint>& getPoints() const { return points_; }
    [[nodiscard]] AxisSide getAxis() const { return axis_; }
    [[nodiscard]] const std::string& getColor() const { return color_; }
    [[nodiscard]] const std::string& getMarkerStyle() const { return markerStyle_; }
    [[nodiscard]] bool empty() const { return points_.empty(); }
    [[nodiscard]] size_t size() const { return points_.size(); }

    [[nodiscard]] std::vector<Coordinate> toCoordinates() const;
};

/**
 * @struct PlotMetadata
 * @brief Axis labels/units and title of one subplot.
 * Right-axis fields only carry meaning when isDualAxis is true.
 */
struct PlotMetadata {
    std::string xAxisLabel;
    std::string xAxisUnit;
    std::string leftYAxisLabel;
    std::string leftYAxisUnit;
    std::string rightYAxisLabel;
    std::string rightYAxisUnit;
    std::string plotTitle;
    bool isDualAxis = false;
};

/**
 * @class ExtractedPlotData
 * @brief One subplot: metadata, series keyed by name, free-text takeaways.
 * @details
 *   - Duplicate series names are rejected (std::invalid_argument).
 *   - For single-axis plots any right-axis metadata is dropped, so the stored
 *     metadata always satisfies the single/dual axis invariant.
 */
class ExtractedPlotData {
    PlotMetadata metadata_;
    std::map<std::string, DataSeries> dataSeries_;
    std::vector<std::string> technicalTakeaways_;

public:
    ExtractedPlotData(PlotMetadata metadata, std::vector<DataSeries> series,
                      std::vector<std::string> technicalTakeaways = {});

    [[nodiscard]] const PlotMetadata& getMetadata() const { return metadata_; }
    [[nodiscard]] const std::map<std::string, DataSeries>& getDataSeries() const { return dataSeries_; }
    [[nodiscard]] const std::vector<std::string>& getTechnicalTakeaways() const { return technicalTakeaways_; }

    // nullptr if no series carries this name
    [[nodiscard]] const DataSeries* findSeries(const std::string& name) const;
    [[nodiscard]] std::set<std::string> getSeriesNames() const;
    [[nodiscard]] size_t totalPointCount() const;
};

/**
 * @class SimpleDigitization
 * @brief Low-ceremony digitization: series name -> [x, y] list plus flat optional labels.
 */
class SimpleDigitization {
    NameToCoordinates nameToCoordinates_;
    std::optional<std::string> title_;
    std::optional<std::string> xAxisLabel_;
    std::optional<std::string> xAxisUnit_;
    std::optional<std::string> yLeftAxisLabel_;
    std::optional<std::string> yLeftAxisUnit_;

public:
    explicit SimpleDigitization(NameToCoordinates nameToCoordinates,
                                std::optional<std::string> title = std::nullopt,
                                std::optional<std::string> xAxisLabel = std::nullopt,
                                std::optional<std::string> xAxisUnit = std::nullopt,
                                std::optional<std::string> yLeftAxisLabel = std::nullopt,
                                std::optional<std::string> yLeftAxisUnit = std::nullopt);

    /**
     * @brief Flatten a structured subplot into the simple shape (axis and styling are dropped).
     */
    static SimpleDigitization fromExtractedPlotData(const ExtractedPlotData& plot);

    /**
     * @brief Lift into the structured shape: left axis, single-axis metadata, no takeaways.
     */
    [[nodiscard]] ExtractedPlotData toExtractedPlotData() const;

    [[nodiscard]] const NameToCoordinates& getNameToCoordinates() const { return nameToCoordinates_; }
    [[nodiscard]] const std::optional<std::string>& getTitle() const { return title_; }
    [[nodiscard]] const std::optional<std::string>& getXAxisLabel() const { return xAxisLabel_; }
    [[nodiscard]] const std::optional<std::string>& getXAxisUnit() const { return xAxisUnit_; }
    [[nodiscard]] const std::optional<std::string>& getYLeftAxisLabel() const { return yLeftAxisLabel_; }
    [[nodiscard]] const std::optional<std::string>& getYLeftAxisUnit() const { return yLeftAxisUnit_; }
};
