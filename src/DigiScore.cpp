//
// Project: DIGI_SCORE
// File: DigiScore.cpp
//

#include "DigiEvaluator.hpp"
#include "DigiScore.hpp"
#include "DigiTimer.hpp"
#include "DigiUtils.hpp"

bool evaluateCase(const DigiConfig& digiConfig, const EvaluationCase& evalCase, DigiResult& digiResult) {
    Timer timer;
    digiResult.reset();
    digiResult.caseName = evalCase.name;

    timer.startTiming(evalCase.name + ": load data");
    DigiData digiData;
    if (!digiData.loadData(evalCase)) {
        timer.endTiming();
        LOG_ERROR("Failed to load case " << evalCase.name << ", scored as 0.0.");
        digiResult.timeEpoch = timer.getTotalElapsedTime();
        return false;
    }
    timer.endTiming();
    digiResult.loaded = true;

    const ValidationReport report = DigiData::validateExtractedData(digiData.predictedPlots);
    for (const auto& w: report.warnings) LOG_DEBUG(evalCase.name << " prediction: " << w);
    for (const auto& e: report.errors) LOG_WARNING(evalCase.name << " prediction: " << e);

    timer.startTiming(evalCase.name + ": score");
    const bool comparable = DigiEvaluator::evaluateCase(digiData, digiConfig, digiResult);
    timer.endTiming();

    digiResult.timeEpoch = timer.getTotalElapsedTime();
    return comparable;
}

std::vector<DigiResult> evaluation(const DigiConfig& digiConfig) {
    const auto& cases = digiConfig.cases;
    std::vector<DigiResult> results(cases.size());

    LOG_INFO("================ Evaluating " << cases.size() << " case(s)... ================");
#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < static_cast<int>(cases.size()); ++i) {
        // Each iteration writes only its own slot
        evaluateCase(digiConfig, cases[i], results[i]);
    }
    return results;
}

BatchSummary summarize(const std::vector<DigiResult>& results, const MetricKind metricKind) {
    BatchSummary summary;
    summary.caseCount = results.size();

    std::vector<double> values;
    values.reserve(results.size());
    for (const auto& r: results) {
        if (!r.loaded) {
            ++summary.failedCount;
        } else if (!r.metric.comparable) {
            ++summary.incomparableCount;
        }

        if (metricKind == MetricKind::COMPOSITE) {
            // 0.0 for failed and incomparable cases
            values.push_back(r.loaded ? r.metric.value : 0.0);
        } else if (r.loaded && r.metric.comparable) {
            values.push_back(r.metric.value);
        }
    }

    summary.scoredCount = values.size();
    summary.mean = meanOf(values);
    summary.stdDev = sampleStdDev(values);
    return summary;
}

void printSummary(const BatchSummary& summary, const MetricKind metricKind) {
    LOG_INFO("================ Summary ================");
    LOG_INFO("Cases: " << summary.caseCount << ", failed: " << summary.failedCount
        << ", incomparable: " << summary.incomparableCount);
    if (summary.scoredCount == 0) {
        LOG_WARNING("No case produced a " << toString(metricKind) << " value.");
        return;
    }
    LOG_INFO(GREEN << toString(metricKind) << " mean: " << summary.mean << ", std: " << summary.stdDev
        << " (over " << summary.scoredCount << " case(s))" << RESET);
}
