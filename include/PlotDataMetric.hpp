//
// Project: DIGI_SCORE
// File: PlotDataMetric.hpp
//
// Composite plot metric: one 0-1 score for a list of subplots.
//

#pragma once

#include <memory>
#include <vector>

#include "CurveSimilarity.hpp"
#include "MetricResult.hpp"
#include "PlotModel.hpp"
#include "SeriesMatcher.hpp"

/**
 * @brief Weight triple of the composite score.
 * Should sum to 1.0; this is the caller's responsibility and is not enforced.
 */
struct MetricWeights {
    double metadata = 0.2;
    double series = 0.2;
    double numerical = 0.6;

    [[nodiscard]] double sum() const { return metadata + series + numerical; }
};

struct CompositeMetricConfig {
    MetricWeights weights;
    CurveSimilarityConfig curve;
    MatchingConfig matching; // EXACT unless configured otherwise
};

/**
 * @struct PlotScoreBreakdown
 * @brief Per-criterion scores of one positional (predicted, reference) subplot pair.
 */
struct PlotScoreBreakdown {
    size_t plotIndex = 0;
    double metadataScore = 0.0;
    SeriesMatchResult matches;
    NumericalAccuracy numerical;
    double plotScore = 0.0;
};

class PlotDataMetric final : public MetricInterface<std::vector<ExtractedPlotData>> {
    MetricWeights weights_;
    CurveSimilarityScorer curveScorer_;
    std::unique_ptr<SeriesMatcher> matcher_;

public:
    explicit PlotDataMetric(const CompositeMetricConfig& config = CompositeMetricConfig());

    // Use a caller-supplied matching strategy instead of config.matching
    PlotDataMetric(const CompositeMetricConfig& config, std::unique_ptr<SeriesMatcher> matcher);

    /**
     * @brief Score one subplot pair:
     *   plotScore = w.metadata * metadata + w.series * matchFraction + w.numerical * numerical.
     */
    [[nodiscard]] PlotScoreBreakdown scorePlot(const ExtractedPlotData& predicted,
                                               const ExtractedPlotData& reference) const;

    /**
     * @brief Pair preds[i] with refs[i] by position and score each pair.
     * @details Subplot identity is assumed aligned upstream. If the lists differ in
     *          length only the common prefix is scored (a warning is logged).
     */
    [[nodiscard]] std::vector<PlotScoreBreakdown> evaluatePlots(const std::vector<ExtractedPlotData>& preds,
                                                                const std::vector<ExtractedPlotData>& refs) const;

    /**
     * @brief Mean plot score in [0, 1]; 0.0 if either list is empty.
     */
    [[nodiscard]] double score(const std::vector<ExtractedPlotData>& preds,
                               const std::vector<ExtractedPlotData>& refs) const;

    /**
     * @brief Tagged variant of score(): BOUNDED, not comparable when either list is empty.
     */
    [[nodiscard]] MetricResult evaluate(const std::vector<ExtractedPlotData>& preds,
                                        const std::vector<ExtractedPlotData>& refs) const override;

    // Same, also handing back the per-subplot breakdowns (cleared first)
    [[nodiscard]] MetricResult evaluate(const std::vector<ExtractedPlotData>& preds,
                                        const std::vector<ExtractedPlotData>& refs,
                                        std::vector<PlotScoreBreakdown>& breakdowns) const;

    [[nodiscard]] const MetricWeights& getWeights() const { return weights_; }
    [[nodiscard]] const SeriesMatcher& getMatcher() const { return *matcher_; }
};
