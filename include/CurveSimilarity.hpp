//
// Project: DIGI_SCORE
// File: CurveSimilarity.hpp
//
// Interpolation-based curve distance between matched series.
//
// Per matched pair:
//   1. joint normalization box over both point sets, mapped into [0,1]x[0,1]
//   2. both curves sorted by x and linearly interpolated on the grid 0, p, 2p, ..., 1
//      (clamped at each curve's own endpoints, no extrapolation)
//   3. rmse over the grid
// numerical score = max(0, 1 - mean(rmse) / rmseCutoff), 0.0 when no pair qualifies.
//

#pragma once

#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "PlotModel.hpp"
#include "SeriesMatcher.hpp"

struct CurveSimilarityConfig {
    double precision = 0.1; // grid step in normalized x, also the minimum x-span of a curve
    double rmseCutoff = 0.1; // average normalized rmse at which the score reaches 0
};

/**
 * @struct SeriesOutcome
 * @brief Tagged per-series result: either an rmse or the reason the series was skipped.
 */
struct SeriesOutcome {
    std::string predictedName;
    std::string referenceName;
    bool evaluated = false;
    double rmse = 0.0; // meaningful only when evaluated
    SkipReason skipReason = SkipReason::EMPTY_SERIES; // meaningful only when !evaluated

    static SeriesOutcome ok(std::string pred, std::string ref, double rmse);
    static SeriesOutcome skipped(std::string pred, std::string ref, SkipReason reason);
};

struct NumericalAccuracy {
    double score = 0.0;
    double avgRmse = 0.0;
    int evaluatedCount = 0;
    int skippedCount = 0;
    std::map<SkipReason, int> skipHistogram;
    std::vector<SeriesOutcome> outcomes;
};

class CurveSimilarityScorer {
    CurveSimilarityConfig config_;
    Eigen::VectorXd grid_;

public:
    /**
     * @throws std::invalid_argument if precision is not in (0, 1] or rmseCutoff is not > 0.
     */
    explicit CurveSimilarityScorer(const CurveSimilarityConfig& config = CurveSimilarityConfig());

    /**
     * @brief Compare one matched pair of series.
     */
    [[nodiscard]] SeriesOutcome compareSeries(const DataSeries& predicted, const DataSeries& reference) const;

    /**
     * @brief Score every matched pair of one subplot and aggregate.
     * @param matches Pairs produced by a SeriesMatcher; names absent from a plot are skipped as empty.
     */
    [[nodiscard]] NumericalAccuracy score(const ExtractedPlotData& predicted, const ExtractedPlotData& reference,
                                          const SeriesMatchResult& matches) const;

    [[nodiscard]] const CurveSimilarityConfig& getConfig() const { return config_; }
    [[nodiscard]] const Eigen::VectorXd& getGrid() const { return grid_; }

    // Grid points i * precision for i = 0 .. floor(1 / precision), plus 1.0 when the last one falls short
    static Eigen::VectorXd buildGrid(double precision);

    /**
     * @brief Piecewise-linear interpolation of (xs, ys) at each query, clamped outside [xs.front(), xs.back()].
     * @pre xs sorted ascending, same size as ys, non-empty.
     */
    static Eigen::VectorXd interpolate(const Eigen::VectorXd& queries, const std::vector<double>& xs,
                                       const std::vector<double>& ys);
};
