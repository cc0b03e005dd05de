//
// Project: DIGI_SCORE
// File: DigiEvaluator.hpp
//
// Scores one loaded case with the metric selected in the configuration.
//

#pragma once

#include <vector>

#include "DigiConfig.hpp"
#include "DigiData.hpp"

class DigiEvaluator {
public:
    /**
     * @brief Evaluate the loaded prediction of a case against its ground truth.
     * @details
     *   - COMPOSITE: PlotDataMetric over the subplot lists, per-subplot breakdowns kept.
     *   - NEAREST_NEIGHBOR: subplots paired by position, each pair converted to the simple
     *     shape and scored; the mean over comparable pairs is stored.
     *
     * @return true if the case was comparable, false otherwise (result.metric.value is 0.0 then).
     */
    static bool evaluateCase(const DigiData& data, const DigiConfig& config, DigiResult& result);

    /**
     * @brief Mean nearest-neighbor error over positional subplot pairs.
     * @details Pairs that are not comparable are skipped; none comparable -> not comparable.
     */
    static MetricResult evaluateNearestNeighbor(const std::vector<ExtractedPlotData>& preds,
                                                const std::vector<ExtractedPlotData>& refs,
                                                const NearestNeighborConfig& config);
};
