//
// Project: DIGI_SCORE
// File: PlotModel.cpp
//

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "PlotModel.hpp"

namespace {

void requireFinite(const double value, const char* component, const std::string& seriesName) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << "Non-finite " << component << " coordinate (" << value << ") in series \"" << seriesName << "\"";
        throw std::invalid_argument(oss.str());
    }
}

} // namespace

DataPoint::DataPoint(const double x, const double y, std::string seriesName, const AxisSide axis)
    : x_(x), y_(y), seriesName_(std::move(seriesName)), axis_(axis) {
    requireFinite(x_, "x", seriesName_);
    requireFinite(y_, "y", seriesName_);
}

DataSeries::DataSeries(std::string name, std::vector<DataPoint> points, const AxisSide axis,
                       std::string color, std::string markerStyle)
    : name_(std::move(name)),
      points_(std::move(points)),
      axis_(axis),
      color_(std::move(color)),
      markerStyle_(std::move(markerStyle)) {
    for (const auto& p: points_) {
        if (p.getSeriesName() != name_) {
            throw std::invalid_argument("Point labelled \"" + p.getSeriesName() +
                                        "\" cannot belong to series \"" + name_ + "\"");
        }
    }
}

DataSeries DataSeries::fromCoordinates(const std::string& name, const std::vector<Coordinate>& coords,
                                       const AxisSide axis) {
    std::vector<DataPoint> points;
    points.reserve(coords.size());
    for (const auto& c: coords) {
        points.emplace_back(c[0], c[1], name, axis);
    }
    return {name, std::move(points), axis};
}

std::vector<Coordinate> DataSeries::toCoordinates() const {
    std::vector<Coordinate> coords;
    coords.reserve(points_.size());
    for (const auto& p: points_) {
        coords.push_back({p.getX(), p.getY()});
    }
    return coords;
}

ExtractedPlotData::ExtractedPlotData(PlotMetadata metadata, std::vector<DataSeries> series,
                                     std::vector<std::string> technicalTakeaways)
    : metadata_(std::move(metadata)), technicalTakeaways_(std::move(technicalTakeaways)) {
    if (!metadata_.isDualAxis && (!metadata_.rightYAxisLabel.empty() || !metadata_.rightYAxisUnit.empty())) {
        LOG_DEBUG("Dropping right-axis metadata \"" << metadata_.rightYAxisLabel
            << "\" of a single-axis plot.");
        metadata_.rightYAxisLabel.clear();
        metadata_.rightYAxisUnit.clear();
    }
    for (auto& s: series) {
        std::string name = s.getName();
        if (!dataSeries_.emplace(name, std::move(s)).second) {
            throw std::invalid_argument("Duplicate series name in one plot: \"" + name + "\"");
        }
    }
}

const DataSeries* ExtractedPlotData::findSeries(const std::string& name) const {
    const auto it = dataSeries_.find(name);
    return it == dataSeries_.end() ? nullptr : &it->second;
}

std::set<std::string> ExtractedPlotData::getSeriesNames() const {
    std::set<std::string> names;
    for (const auto& [name, series]: dataSeries_) names.insert(name);
    return names;
}

size_t ExtractedPlotData::totalPointCount() const {
    size_t total = 0;
    for (const auto& [name, series]: dataSeries_) total += series.size();
    return total;
}

SimpleDigitization::SimpleDigitization(NameToCoordinates nameToCoordinates,
                                       std::optional<std::string> title,
                                       std::optional<std::string> xAxisLabel,
                                       std::optional<std::string> xAxisUnit,
                                       std::optional<std::string> yLeftAxisLabel,
                                       std::optional<std::string> yLeftAxisUnit)
    : nameToCoordinates_(std::move(nameToCoordinates)),
      title_(std::move(title)),
      xAxisLabel_(std::move(xAxisLabel)),
      xAxisUnit_(std::move(xAxisUnit)),
      yLeftAxisLabel_(std::move(yLeftAxisLabel)),
      yLeftAxisUnit_(std::move(yLeftAxisUnit)) {
    for (const auto& [name, coords]: nameToCoordinates_) {
        for (const auto& c: coords) {
            requireFinite(c[0], "x", name);
            requireFinite(c[1], "y", name);
        }
    }
}

SimpleDigitization SimpleDigitization::fromExtractedPlotData(const ExtractedPlotData& plot) {
    NameToCoordinates coords;
    for (const auto& [name, series]: plot.getDataSeries()) {
        coords[name] = series.toCoordinates();
    }
    const PlotMetadata& meta = plot.getMetadata();
    auto orNull = [](const std::string& s) -> std::optional<std::string> {
        if (s.empty()) return std::nullopt;
        return s;
    };
    return SimpleDigitization(std::move(coords), orNull(meta.plotTitle), orNull(meta.xAxisLabel),
                              orNull(meta.xAxisUnit), orNull(meta.leftYAxisLabel), orNull(meta.leftYAxisUnit));
}

ExtractedPlotData SimpleDigitization::toExtractedPlotData() const {
    PlotMetadata meta;
    meta.plotTitle = title_.value_or("");
    meta.xAxisLabel = xAxisLabel_.value_or("");
    meta.xAxisUnit = xAxisUnit_.value_or("");
    meta.leftYAxisLabel = yLeftAxisLabel_.value_or("");
    meta.leftYAxisUnit = yLeftAxisUnit_.value_or("");
    meta.isDualAxis = false;

    std::vector<DataSeries> series;
    series.reserve(nameToCoordinates_.size());
    for (const auto& [name, coords]: nameToCoordinates_) {
        series.push_back(DataSeries::fromCoordinates(name, coords, AxisSide::LEFT));
    }
    return {std::move(meta), std::move(series)};
}
