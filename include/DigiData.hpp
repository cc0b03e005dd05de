//
// Project: DIGI_SCORE
// File: DigiData.hpp
//
// Loading of predicted and ground-truth digitizations for one evaluation case.
// Files are JSON, read through yaml-cpp (YAML 1.2 is a superset of JSON).
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "DigiConfig.hpp"
#include "MetricResult.hpp"
#include "PlotDataMetric.hpp"
#include "PlotModel.hpp"

/**
 * @struct ValidationReport
 * @brief Consistency/completeness findings for a list of subplots.
 */
struct ValidationReport {
    bool isValid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    size_t totalSubplots = 0;
    size_t totalSeries = 0;
    size_t totalPoints = 0;
    double avgPointsPerSeries = 0.0;
};

/**
 * @struct DigiResult
 * @brief Outcome of one evaluation case.
 */
struct DigiResult {
    std::string caseName;
    bool loaded = false; // false: a file could not be loaded, metric.value stays 0.0
    MetricResult metric;
    std::vector<PlotScoreBreakdown> breakdowns; // composite metric only
    double timeEpoch = 0.0; // seconds spent on the case

    DigiResult() = default;

    void reset() {
        caseName.clear();
        loaded = false;
        metric = MetricResult();
        breakdowns.clear();
        timeEpoch = 0.0;
    }
};

class DigiData {
    // --- Private helpers (static) ---
    // They do not depend on a particular case, they only belong here logically.

    static std::optional<std::string> optionalString(const YAML::Node& node, const char* key);

    /**
     * @brief Parse a [[x, y], ...] list; every pair must have exactly two numbers.
     */
    static std::vector<Coordinate> parseCoordinateList(const YAML::Node& node, const std::string& seriesName);

    // {coordinates: {name: [[x, y], ...]}, x_label, y_label}
    static ExtractedPlotData parseGroundTruthSubplot(const YAML::Node& node);

    // {metadata: {...}, data_series: [{name, points, axis, color, marker_style}], technical_takeaways}
    static ExtractedPlotData parseStructuredSubplot(const YAML::Node& node);

    // Dispatch on the keys present in the node
    static ExtractedPlotData parseSubplot(const YAML::Node& node);

public:
    // Input Data
    std::vector<ExtractedPlotData> predictedPlots;
    std::vector<ExtractedPlotData> referencePlots;

    DigiData() = default;

    /**
     * @brief Load the prediction and the ground truth of a case.
     * @return false if either file cannot be read or parsed, or the ground truth has no series at all.
     */
    bool loadData(const EvaluationCase& evalCase);

    /**
     * @brief Parse {name_to_coordinates, title, x_axis_label, x_axis_unit, y_left_axis_label, y_left_axis_unit}.
     * @throws std::invalid_argument / YAML::Exception on malformed input.
     */
    static SimpleDigitization parseSimpleDigitization(const YAML::Node& node);

    /**
     * @brief Parse a whole document into subplots.
     * @details Accepted roots: a sequence of subplots, a map with a "subplots" sequence, or a single subplot.
     *          Each subplot may be in ground-truth, structured, or simple shape.
     * @return false (with an error logged) on malformed input; plots is left untouched then.
     */
    static bool parsePlotDocument(const YAML::Node& root, std::vector<ExtractedPlotData>& plots);

    static bool loadPlotFile(const std::string& filePath, std::vector<ExtractedPlotData>& plots);

    /**
     * @brief Check subplots for missing labels/names, empty series, duplicate or implausible points.
     */
    static ValidationReport validateExtractedData(const std::vector<ExtractedPlotData>& plots);
};
