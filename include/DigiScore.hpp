//
// Project: DIGI_SCORE
// File: DigiScore.hpp
//
// Batch evaluation over the cases listed in the configuration.
//

#pragma once

#include <vector>

#include "DigiConfig.hpp"
#include "DigiData.hpp"

/**
 * @struct BatchSummary
 * @brief Aggregate over every case of a batch run.
 */
struct BatchSummary {
    size_t caseCount = 0;
    size_t failedCount = 0; // could not be loaded
    size_t incomparableCount = 0; // loaded, but nothing to compare
    size_t scoredCount = 0; // values that entered mean / stdDev
    double mean = 0.0;
    double stdDev = 0.0; // sample standard deviation
};

/**
 * @brief Load and score one case.
 * @details Flow: load prediction and ground truth -> score with the configured metric.
 *          A case that fails to load keeps result.loaded == false and a value of 0.0.
 * @return true if the case was loaded and comparable.
 */
bool evaluateCase(const DigiConfig& digiConfig, const EvaluationCase& evalCase, DigiResult& digiResult);

/**
 * @brief Score every configured case; cases are independent and run in parallel.
 * @return One result per case, in configuration order.
 */
std::vector<DigiResult> evaluation(const DigiConfig& digiConfig);

/**
 * @brief Count, mean and sample standard deviation of the case values.
 * @details For a bounded metric failed and incomparable cases count as 0.0; for an
 *          unbounded metric only comparable cases are aggregated.
 */
BatchSummary summarize(const std::vector<DigiResult>& results, MetricKind metricKind);

void printSummary(const BatchSummary& summary, MetricKind metricKind);
