//
// Project: DIGI_SCORE
// File: PlotDataMetric.cpp
//

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "MetadataScorer.hpp"
#include "PlotDataMetric.hpp"

PlotDataMetric::PlotDataMetric(const CompositeMetricConfig& config)
    : PlotDataMetric(config, createSeriesMatcher(config.matching)) {}

PlotDataMetric::PlotDataMetric(const CompositeMetricConfig& config, std::unique_ptr<SeriesMatcher> matcher)
    : weights_(config.weights), curveScorer_(config.curve), matcher_(std::move(matcher)) {
    if (!matcher_) {
        throw std::invalid_argument("PlotDataMetric requires a series matcher");
    }
    if (std::abs(weights_.sum() - 1.0) > 1e-6) {
        LOG_DEBUG("Composite weights sum to " << weights_.sum() << ", scores may leave [0, 1].");
    }
}

PlotScoreBreakdown PlotDataMetric::scorePlot(const ExtractedPlotData& predicted,
                                             const ExtractedPlotData& reference) const {
    PlotScoreBreakdown b;
    b.metadataScore = scoreMetadata(predicted.getMetadata(), reference.getMetadata());
    b.matches = matcher_->match(predicted.getSeriesNames(), reference.getSeriesNames());
    b.numerical = curveScorer_.score(predicted, reference, b.matches);
    b.plotScore = weights_.metadata * b.metadataScore
                  + weights_.series * b.matches.matchFraction
                  + weights_.numerical * b.numerical.score;
    return b;
}

std::vector<PlotScoreBreakdown> PlotDataMetric::evaluatePlots(const std::vector<ExtractedPlotData>& preds,
                                                              const std::vector<ExtractedPlotData>& refs) const {
    if (preds.size() != refs.size()) {
        LOG_WARNING("Subplot count differs (predicted " << preds.size() << ", reference " << refs.size()
            << "); only the first " << std::min(preds.size(), refs.size()) << " pairs are scored.");
    }

    std::vector<PlotScoreBreakdown> breakdowns;
    const size_t n = std::min(preds.size(), refs.size());
    breakdowns.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        PlotScoreBreakdown b = scorePlot(preds[i], refs[i]);
        b.plotIndex = i;
        LOG_INFO("Subplot " << i << ": metadata=" << b.metadataScore
            << ", series=" << b.matches.matchFraction
            << ", numerical=" << b.numerical.score
            << " (" << b.numerical.evaluatedCount << " evaluated, " << b.numerical.skippedCount << " skipped)"
            << " -> " << b.plotScore);
        breakdowns.push_back(std::move(b));
    }
    return breakdowns;
}

double PlotDataMetric::score(const std::vector<ExtractedPlotData>& preds,
                             const std::vector<ExtractedPlotData>& refs) const {
    return evaluate(preds, refs).value;
}

MetricResult PlotDataMetric::evaluate(const std::vector<ExtractedPlotData>& preds,
                                      const std::vector<ExtractedPlotData>& refs) const {
    std::vector<PlotScoreBreakdown> breakdowns;
    return evaluate(preds, refs, breakdowns);
}

MetricResult PlotDataMetric::evaluate(const std::vector<ExtractedPlotData>& preds,
                                      const std::vector<ExtractedPlotData>& refs,
                                      std::vector<PlotScoreBreakdown>& breakdowns) const {
    breakdowns.clear();
    if (preds.empty() || refs.empty()) {
        return MetricResult::incomparable(MetricScale::BOUNDED,
                                          preds.empty() ? "no predicted subplots" : "no reference subplots");
    }

    breakdowns = evaluatePlots(preds, refs);
    double sum = 0.0;
    MetricResult result = MetricResult::bounded(0.0);
    for (const auto& b: breakdowns) {
        sum += b.plotScore;
        result.evaluatedSeries += b.numerical.evaluatedCount;
        result.skippedSeries += b.numerical.skippedCount;
        for (const auto& [reason, count]: b.numerical.skipHistogram) result.skipHistogram[reason] += count;
    }
    result.value = sum / static_cast<double>(breakdowns.size());
    return result;
}
