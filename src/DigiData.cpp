//
// Project: DIGI_SCORE
// File: DigiData.cpp
//

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "CommonTypes.hpp"
#include "DigiData.hpp"

std::optional<std::string> DigiData::optionalString(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    // JSON null and missing keys both read as "absent"
    if (!value || !value.IsScalar()) return std::nullopt;
    return value.as<std::string>();
}

std::vector<Coordinate> DigiData::parseCoordinateList(const YAML::Node& node, const std::string& seriesName) {
    std::vector<Coordinate> coords;
    if (!node || node.IsNull()) return coords;
    if (!node.IsSequence()) {
        throw std::invalid_argument("Coordinates of series \"" + seriesName + "\" are not a list");
    }
    coords.reserve(node.size());
    for (const auto& pair: node) {
        if (!pair.IsSequence() || pair.size() != 2) {
            std::ostringstream oss;
            oss << "Coordinate #" << coords.size() << " of series \"" << seriesName
                << "\" must be an [x, y] pair";
            throw std::invalid_argument(oss.str());
        }
        coords.push_back({pair[0].as<double>(), pair[1].as<double>()});
    }
    return coords;
}

ExtractedPlotData DigiData::parseGroundTruthSubplot(const YAML::Node& node) {
    PlotMetadata meta;
    meta.xAxisLabel = optionalString(node, "x_label").value_or("");
    meta.leftYAxisLabel = optionalString(node, "y_label").value_or("");
    meta.isDualAxis = false;

    std::vector<DataSeries> series;
    for (const auto& kv: node["coordinates"]) {
        const auto name = kv.first.as<std::string>();
        series.push_back(DataSeries::fromCoordinates(name, parseCoordinateList(kv.second, name), AxisSide::LEFT));
    }
    return {std::move(meta), std::move(series)};
}

ExtractedPlotData DigiData::parseStructuredSubplot(const YAML::Node& node) {
    PlotMetadata meta;
    if (const YAML::Node m = node["metadata"]; m && m.IsMap()) {
        meta.xAxisLabel = optionalString(m, "x_axis_label").value_or("");
        meta.xAxisUnit = optionalString(m, "x_axis_unit").value_or("");
        meta.leftYAxisLabel = optionalString(m, "left_y_axis_label").value_or("");
        meta.leftYAxisUnit = optionalString(m, "left_y_axis_unit").value_or("");
        meta.rightYAxisLabel = optionalString(m, "right_y_axis_label").value_or("");
        meta.rightYAxisUnit = optionalString(m, "right_y_axis_unit").value_or("");
        meta.plotTitle = optionalString(m, "plot_title").value_or("");
        meta.isDualAxis = m["is_dual_axis"] ? m["is_dual_axis"].as<bool>(false) : false;
    }

    std::vector<DataSeries> series;
    for (const auto& s: node["data_series"]) {
        const auto name = s["name"].as<std::string>();
        const AxisSide axis = parseAxisSide(optionalString(s, "axis").value_or("left"));

        std::vector<DataPoint> points;
        for (const auto& p: s["points"]) {
            if (p.IsSequence()) {
                // Bare [x, y] pair, inherits the series axis
                if (p.size() != 2) {
                    throw std::invalid_argument("Point #" + std::to_string(points.size()) + " of series \""
                                                + name + "\" must be an [x, y] pair");
                }
                points.emplace_back(p[0].as<double>(), p[1].as<double>(), name, axis);
                continue;
            }
            const AxisSide pointAxis = p["axis"] ? parseAxisSide(p["axis"].as<std::string>()) : axis;
            points.emplace_back(p["x"].as<double>(), p["y"].as<double>(),
                                optionalString(p, "series_name").value_or(name), pointAxis);
        }
        series.emplace_back(name, std::move(points), axis,
                            optionalString(s, "color").value_or("unknown"),
                            optionalString(s, "marker_style").value_or("unknown"));
    }

    std::vector<std::string> takeaways;
    for (const auto& t: node["technical_takeaways"]) {
        takeaways.push_back(t.as<std::string>());
    }
    return {std::move(meta), std::move(series), std::move(takeaways)};
}

SimpleDigitization DigiData::parseSimpleDigitization(const YAML::Node& node) {
    NameToCoordinates coords;
    for (const auto& kv: node["name_to_coordinates"]) {
        const auto name = kv.first.as<std::string>();
        coords[name] = parseCoordinateList(kv.second, name);
    }
    return SimpleDigitization(std::move(coords),
                              optionalString(node, "title"),
                              optionalString(node, "x_axis_label"),
                              optionalString(node, "x_axis_unit"),
                              optionalString(node, "y_left_axis_label"),
                              optionalString(node, "y_left_axis_unit"));
}

ExtractedPlotData DigiData::parseSubplot(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("Subplot entry is not an object");
    }
    if (node["name_to_coordinates"]) return parseSimpleDigitization(node).toExtractedPlotData();
    if (node["coordinates"]) return parseGroundTruthSubplot(node);
    if (node["data_series"] || node["metadata"]) return parseStructuredSubplot(node);
    throw std::invalid_argument("Unrecognized subplot shape (expected name_to_coordinates, coordinates or data_series)");
}

bool DigiData::parsePlotDocument(const YAML::Node& root, std::vector<ExtractedPlotData>& plots) {
    std::vector<ExtractedPlotData> parsed;
    try {
        if (root.IsSequence()) {
            for (const auto& entry: root) parsed.push_back(parseSubplot(entry));
        } else if (root.IsMap() && root["subplots"]) {
            for (const auto& entry: root["subplots"]) parsed.push_back(parseSubplot(entry));
        } else if (root.IsMap()) {
            parsed.push_back(parseSubplot(root));
        } else {
            LOG_ERROR("Plot document is neither a list nor an object.");
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Malformed plot document: " << e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid plot data: " << e.what());
        return false;
    }
    plots = std::move(parsed);
    return true;
}

bool DigiData::loadPlotFile(const std::string& filePath, std::vector<ExtractedPlotData>& plots) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filePath);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Can not read plot file " << filePath << ": " << e.what());
        return false;
    }
    if (!parsePlotDocument(root, plots)) {
        LOG_ERROR("Failed to parse plot file: " << filePath);
        return false;
    }
    LOG_DEBUG("Loaded " << plots.size() << " subplot(s) from " << filePath);
    return true;
}

bool DigiData::loadData(const EvaluationCase& evalCase) {
    predictedPlots.clear();
    referencePlots.clear();

    if (!loadPlotFile(evalCase.groundTruthPath, referencePlots)) {
        LOG_ERROR("Failed to load ground truth: " << evalCase.groundTruthPath);
        return false;
    }
    size_t referenceSeries = 0;
    for (const auto& plot: referencePlots) referenceSeries += plot.getDataSeries().size();
    if (referenceSeries == 0) {
        LOG_ERROR("No data found in ground truth: " << evalCase.groundTruthPath);
        return false;
    }

    if (!loadPlotFile(evalCase.predictionPath, predictedPlots)) {
        LOG_ERROR("Failed to load prediction: " << evalCase.predictionPath);
        return false;
    }
    return true;
}

ValidationReport DigiData::validateExtractedData(const std::vector<ExtractedPlotData>& plots) {
    ValidationReport report;
    report.totalSubplots = plots.size();

    for (size_t subplotIdx = 0; subplotIdx < plots.size(); ++subplotIdx) {
        const ExtractedPlotData& plot = plots[subplotIdx];
        const std::string label = "subplot_" + std::to_string(subplotIdx + 1);

        // Metadata completeness
        if (plot.getMetadata().xAxisLabel.empty()) {
            report.warnings.push_back(label + ": Missing x-axis label");
        }
        if (plot.getMetadata().leftYAxisLabel.empty()) {
            report.warnings.push_back(label + ": Missing left y-axis label");
        }

        if (plot.getDataSeries().empty()) {
            report.errors.push_back(label + ": No data series found");
            report.isValid = false;
            continue;
        }

        size_t seriesIdx = 0;
        for (const auto& [name, series]: plot.getDataSeries()) {
            ++seriesIdx;
            ++report.totalSeries;

            if (name.empty()) {
                report.warnings.push_back(label + ", series " + std::to_string(seriesIdx) + ": Missing series name");
            }
            if (series.empty()) {
                report.errors.push_back(label + ", " + name + ": No data points found");
                report.isValid = false;
                continue;
            }

            std::set<std::pair<double, double>> seen;
            bool duplicate = false, largeX = false, largeY = false;
            for (const auto& p: series.getPoints()) {
                duplicate |= !seen.emplace(p.getX(), p.getY()).second;
                largeX |= std::abs(p.getX()) > 1e6;
                largeY |= std::abs(p.getY()) > 1e6;
            }
            if (duplicate) report.warnings.push_back(label + ", " + name + ": Contains duplicate points");
            if (largeX) report.warnings.push_back(label + ", " + name + ": X values seem unusually large");
            if (largeY) report.warnings.push_back(label + ", " + name + ": Y values seem unusually large");

            report.totalPoints += series.size();
        }
    }

    report.avgPointsPerSeries = static_cast<double>(report.totalPoints) /
                                static_cast<double>(std::max<size_t>(report.totalSeries, 1));
    return report;
}
