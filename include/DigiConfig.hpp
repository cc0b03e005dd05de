//
// Project: DIGI_SCORE
// File: DigiConfig.hpp
//
// Central configuration loaded from config.yaml.
// Sections: execution / algorithm / evaluation
//
// Notes:
//  * All member names use lowerCamelCase.
//  * Every field is optional in YAML; missing keys keep the defaults below.
//  * Unknown enum strings fall back to the default with a warning.
//  * precision must be in (0, 1] and rmseCutoff > 0; invalid values are reset at load time.
//

#pragma once

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "CommonTypes.hpp"
#include "DigiUtils.hpp"
#include "NearestNeighborMetric.hpp"
#include "PlotDataMetric.hpp"

/**
 * @brief One prediction / ground-truth file pair of a batch run.
 */
struct EvaluationCase {
    std::string name;
    std::string predictionPath;
    std::string groundTruthPath;
};

/**
 * @struct DigiConfig
 * @brief The configuration consumed by the batch evaluation.
 */
struct DigiConfig {
    // public:
    // =========================== Execution =================================
    int desiredThreads = -1; // Number of threads (-1 = all available)
    DigiLogLevel logLevel = DigiLogLevel::DIGI_INFO; // console verbosity

    // ============================ Algorithm ================================
    CompositeMetricConfig composite;
    NearestNeighborConfig nearestNeighbor;

    // ============================= Evaluation ==============================
    MetricKind metricKind = MetricKind::COMPOSITE;
    std::vector<EvaluationCase> cases;

private:
    // Helper: parse log level string -> DigiLogLevel
    static DigiLogLevel parseLogLevel(const std::string& levelStr) {
        const std::string s = toLower(levelStr);
        if (s == "debug") return DigiLogLevel::DIGI_DEBUG;
        if (s == "info") return DigiLogLevel::DIGI_INFO;
        if (s == "warning") return DigiLogLevel::DIGI_WARNING;
        if (s == "critical") return DigiLogLevel::DIGI_CRITICAL;
        if (s == "error") return DigiLogLevel::DIGI_ERROR;
        if (s == "silent") return DigiLogLevel::DIGI_SILENT;
        LOG_WARNING("Unknown logLevel: " << levelStr << ", defaulting to INFO.");
        return DigiLogLevel::DIGI_INFO;
    }

    static MatchStrategy parseMatchStrategy(const std::string& str) {
        const std::string s = toLower(str);
        if (s == "exact") return MatchStrategy::EXACT;
        if (s == "fuzzy") return MatchStrategy::FUZZY;
        LOG_WARNING("Unknown matching strategy: " << str << ", defaulting to EXACT.");
        return MatchStrategy::EXACT;
    }

    static ErrorMetric parseErrorMetric(const std::string& str) {
        const std::string s = toLower(str);
        if (s == "rmse") return ErrorMetric::RMSE;
        if (s == "mae") return ErrorMetric::MAE;
        LOG_WARNING("Unknown errorMetric: " << str << ", defaulting to RMSE.");
        return ErrorMetric::RMSE;
    }

    static MetricKind parseMetricKind(const std::string& str) {
        const std::string s = toLower(str);
        if (s == "composite") return MetricKind::COMPOSITE;
        if (s == "nearest_neighbor" || s == "nearestneighbor") return MetricKind::NEAREST_NEIGHBOR;
        LOG_WARNING("Unknown evaluation metric: " << str << ", defaulting to COMPOSITE.");
        return MetricKind::COMPOSITE;
    }

public:
    DigiConfig() = default;

    /**
     * @brief Load configuration from a YAML file.
     * @return false if the file cannot be read or parsed; defaults are kept in that case.
     */
    bool load(const std::string& filename) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(filename);
        } catch (const YAML::Exception& e) {
            LOG_ERROR("YAML parsing error in " << filename << ": " << e.what());
            return false;
        }
        return loadFromNode(root);
    }

    /**
     * @brief Load configuration from an already parsed YAML document.
     *
     * Schema (abridged):
     *   execution:
     *     system: { desiredThreads, logLevel }
     *   algorithm:
     *     composite: { weights: { metadata, series, numerical }, precision, rmseCutoff }
     *     matching: { strategy: EXACT|FUZZY, fuzzyThreshold }
     *     nearestNeighbor: { errorMetric: RMSE|MAE, scaleEpsilon }
     *   evaluation:
     *     metric: COMPOSITE|NEAREST_NEIGHBOR
     *     cases: [ { name, prediction, groundTruth }, ... ]
     */
    bool loadFromNode(const YAML::Node& root) {
        try {
            // -------------------------- execution --------------------------
            if (root["execution"] && root["execution"]["system"]) {
                const YAML::Node sys = root["execution"]["system"];
                desiredThreads = sys["desiredThreads"] ? sys["desiredThreads"].as<int>(desiredThreads) : desiredThreads;
                if (sys["logLevel"]) logLevel = parseLogLevel(sys["logLevel"].as<std::string>());

                // Apply console log level
                DigiLogger::setLevel(logLevel);
            }

            // -------------------------- algorithm --------------------------
            if (root["algorithm"]) {
                const YAML::Node alg = root["algorithm"];

                if (alg["composite"]) {
                    const YAML::Node c = alg["composite"];
                    if (c["weights"]) {
                        const YAML::Node w = c["weights"];
                        MetricWeights& weights = composite.weights;
                        weights.metadata = w["metadata"] ? w["metadata"].as<double>(weights.metadata) : weights.metadata;
                        weights.series = w["series"] ? w["series"].as<double>(weights.series) : weights.series;
                        weights.numerical = w["numerical"] ? w["numerical"].as<double>(weights.numerical) : weights.numerical;
                        if (std::abs(weights.sum() - 1.0) > 1e-6) {
                            LOG_WARNING("Composite weights sum to " << weights.sum()
                                << " instead of 1.0; plot scores may leave [0, 1].");
                        }
                    }
                    CurveSimilarityConfig& curve = composite.curve;
                    curve.precision = c["precision"] ? c["precision"].as<double>(curve.precision) : curve.precision;
                    curve.rmseCutoff = c["rmseCutoff"] ? c["rmseCutoff"].as<double>(curve.rmseCutoff) : curve.rmseCutoff;
                    if (!(curve.precision > 0.0) || curve.precision > 1.0) {
                        LOG_WARNING("precision must be in (0, 1], got " << curve.precision << ". Setting to default 0.1");
                        curve.precision = 0.1;
                    }
                    if (!(curve.rmseCutoff > 0.0)) {
                        LOG_WARNING("rmseCutoff must be strictly positive, got " << curve.rmseCutoff
                            << ". Setting to default 0.1");
                        curve.rmseCutoff = 0.1;
                    }
                }

                if (alg["matching"]) {
                    const YAML::Node m = alg["matching"];
                    MatchingConfig& matching = composite.matching;
                    if (m["strategy"]) matching.strategy = parseMatchStrategy(m["strategy"].as<std::string>());
                    matching.fuzzyThreshold = m["fuzzyThreshold"]
                                                  ? m["fuzzyThreshold"].as<double>(matching.fuzzyThreshold)
                                                  : matching.fuzzyThreshold;
                }

                if (alg["nearestNeighbor"]) {
                    const YAML::Node nn = alg["nearestNeighbor"];
                    if (nn["errorMetric"]) {
                        nearestNeighbor.errorMetric = parseErrorMetric(nn["errorMetric"].as<std::string>());
                    }
                    nearestNeighbor.scaleEpsilon = nn["scaleEpsilon"]
                                                       ? nn["scaleEpsilon"].as<double>(nearestNeighbor.scaleEpsilon)
                                                       : nearestNeighbor.scaleEpsilon;
                }
            } else {
                LOG_WARNING("Config file has no algorithm field, program runs with default parameters");
            }

            // -------------------------- evaluation --------------------------
            if (root["evaluation"]) {
                const YAML::Node eva = root["evaluation"];
                if (eva["metric"]) metricKind = parseMetricKind(eva["metric"].as<std::string>());

                if (eva["cases"]) {
                    cases.clear();
                    for (const auto& c: eva["cases"]) {
                        EvaluationCase ec;
                        ec.predictionPath = c["prediction"] ? c["prediction"].as<std::string>() : "";
                        ec.groundTruthPath = c["groundTruth"] ? c["groundTruth"].as<std::string>() : "";
                        ec.name = c["name"] ? c["name"].as<std::string>() : ec.predictionPath;
                        cases.push_back(ec);
                    }
                }
            } else {
                LOG_INFO("Config has no evaluation field, no cases will be evaluated");
            }
        } catch (const YAML::Exception& e) {
            LOG_ERROR("Invalid configuration value: " << e.what());
            return false;
        }
        return true;
    }

    /**
     * @brief Every case needs both a prediction and a ground-truth path.
     */
    [[nodiscard]] bool validate() const {
        if (cases.empty()) return false;
        return std::all_of(cases.begin(), cases.end(), [](const EvaluationCase& c) {
            return !c.predictionPath.empty() && !c.groundTruthPath.empty();
        });
    }

    /**
     * @brief Print a concise summary of the active settings.
     */
    void printSummary() const {
        LOG_INFO("Metric: " << toString(metricKind) << ", cases: " << cases.size()
            << ", threads: " << desiredThreads);
        if (metricKind == MetricKind::COMPOSITE) {
            LOG_INFO("Weights (metadata/series/numerical): " << composite.weights.metadata << " / "
                << composite.weights.series << " / " << composite.weights.numerical
                << ", precision: " << composite.curve.precision
                << ", rmseCutoff: " << composite.curve.rmseCutoff
                << ", matching: " << toString(composite.matching.strategy));
        } else {
            LOG_INFO("Error metric: " << toString(nearestNeighbor.errorMetric)
                << ", scaleEpsilon: " << nearestNeighbor.scaleEpsilon);
        }
    }
};
