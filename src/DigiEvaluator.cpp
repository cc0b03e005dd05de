//
// Project: DIGI_SCORE
// File: DigiEvaluator.cpp
//

#include <algorithm> // for std::min

#include "DigiEvaluator.hpp"
#include "NearestNeighborMetric.hpp"
#include "PlotDataMetric.hpp"

MetricResult DigiEvaluator::evaluateNearestNeighbor(const std::vector<ExtractedPlotData>& preds,
                                                    const std::vector<ExtractedPlotData>& refs,
                                                    const NearestNeighborConfig& config) {
    if (preds.size() != refs.size()) {
        LOG_WARNING("Subplot count mismatch: " << preds.size() << " predicted vs " << refs.size()
            << " reference. Only the first " << std::min(preds.size(), refs.size()) << " are compared.");
    }

    const NearestNeighborPointMetric metric(config);
    MetricResult total = MetricResult::unbounded(0.0);
    double sum = 0.0;
    int comparablePairs = 0;

    for (size_t i = 0; i < std::min(preds.size(), refs.size()); ++i) {
        const MetricResult r = metric.evaluate(SimpleDigitization::fromExtractedPlotData(preds[i]),
                                               SimpleDigitization::fromExtractedPlotData(refs[i]));
        total.skippedSeries += r.skippedSeries;
        for (const auto& [reason, count]: r.skipHistogram) total.skipHistogram[reason] += count;
        for (const auto& d: r.diagnostics) total.diagnostics.push_back("subplot_" + std::to_string(i + 1) + ": " + d);

        if (!r.comparable) {
            LOG_INFO("subplot_" << i + 1 << ": not comparable");
            continue;
        }
        LOG_INFO("subplot_" << i + 1 << ": " << toString(config.errorMetric) << " = " << r.value);
        total.evaluatedSeries += r.evaluatedSeries;
        sum += r.value;
        ++comparablePairs;
    }

    if (comparablePairs == 0) {
        MetricResult none = MetricResult::incomparable(MetricScale::UNBOUNDED, "no comparable subplot pair");
        none.skippedSeries = total.skippedSeries;
        none.skipHistogram = total.skipHistogram;
        none.diagnostics.insert(none.diagnostics.end(), total.diagnostics.begin(), total.diagnostics.end());
        return none;
    }
    total.value = sum / static_cast<double>(comparablePairs);
    return total;
}

bool DigiEvaluator::evaluateCase(const DigiData& data, const DigiConfig& config, DigiResult& result) {
    LOG_DEBUG("--- Evaluating " << result.caseName << " ---");

    if (config.metricKind == MetricKind::COMPOSITE) {
        const PlotDataMetric metric(config.composite);
        result.metric = metric.evaluate(data.predictedPlots, data.referencePlots, result.breakdowns);
    } else {
        result.breakdowns.clear();
        result.metric = evaluateNearestNeighbor(data.predictedPlots, data.referencePlots, config.nearestNeighbor);
    }

    for (const auto& d: result.metric.diagnostics) {
        LOG_DEBUG(result.caseName << ": " << d);
    }
    if (!result.metric.comparable) {
        LOG_WARNING(YELLOW << result.caseName << ": prediction and ground truth are not comparable." << RESET);
        return false;
    }
    LOG_INFO(result.caseName << ": " << toString(config.metricKind) << " = " << result.metric.value
        << " (" << result.metric.evaluatedSeries << " series evaluated, "
        << result.metric.skippedSeries << " skipped)");
    return true;
}
