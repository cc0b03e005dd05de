//
// Project: DIGI_SCORE
// File: CurveSimilarity.cpp
//

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "CurveSimilarity.hpp"

SeriesOutcome SeriesOutcome::ok(std::string pred, std::string ref, const double rmse) {
    SeriesOutcome o;
    o.predictedName = std::move(pred);
    o.referenceName = std::move(ref);
    o.evaluated = true;
    o.rmse = rmse;
    return o;
}

SeriesOutcome SeriesOutcome::skipped(std::string pred, std::string ref, const SkipReason reason) {
    SeriesOutcome o;
    o.predictedName = std::move(pred);
    o.referenceName = std::move(ref);
    o.evaluated = false;
    o.skipReason = reason;
    return o;
}

CurveSimilarityScorer::CurveSimilarityScorer(const CurveSimilarityConfig& config) : config_(config) {
    if (!(config_.precision > 0.0) || config_.precision > 1.0) {
        throw std::invalid_argument("Curve grid precision must be in (0, 1], got " +
                                    std::to_string(config_.precision));
    }
    if (!(config_.rmseCutoff > 0.0)) {
        throw std::invalid_argument("RMSE cutoff must be strictly positive, got " +
                                    std::to_string(config_.rmseCutoff));
    }
    grid_ = buildGrid(config_.precision);
}

Eigen::VectorXd CurveSimilarityScorer::buildGrid(const double precision) {
    // The small slack keeps 1.0 on the grid despite rounding in 1 / precision
    const auto steps = static_cast<Eigen::Index>(std::floor(1.0 / precision + 1e-9));
    Eigen::VectorXd grid(steps + 1);
    for (Eigen::Index i = 0; i <= steps; ++i) {
        grid(i) = std::min(1.0, static_cast<double>(i) * precision);
    }
    // 1 / precision not integral: close the grid at 1 so the curve tails are sampled
    if (grid(steps) < 1.0 - 1e-9) {
        grid.conservativeResize(steps + 2);
        grid(steps + 1) = 1.0;
    }
    return grid;
}

Eigen::VectorXd CurveSimilarityScorer::interpolate(const Eigen::VectorXd& queries, const std::vector<double>& xs,
                                                   const std::vector<double>& ys) {
    Eigen::VectorXd out(queries.size());
    for (Eigen::Index k = 0; k < queries.size(); ++k) {
        const double q = queries(k);
        if (q <= xs.front()) {
            out(k) = ys.front();
        } else if (q >= xs.back()) {
            out(k) = ys.back();
        } else {
            // xs[j - 1] <= q < xs[j]
            const auto j = static_cast<size_t>(std::upper_bound(xs.begin(), xs.end(), q) - xs.begin());
            const double t = (q - xs[j - 1]) / (xs[j] - xs[j - 1]);
            out(k) = ys[j - 1] + t * (ys[j] - ys[j - 1]);
        }
    }
    return out;
}

SeriesOutcome CurveSimilarityScorer::compareSeries(const DataSeries& predicted, const DataSeries& reference) const {
    const std::string& predName = predicted.getName();
    const std::string& refName = reference.getName();

    if (predicted.empty() || reference.empty()) {
        return SeriesOutcome::skipped(predName, refName, SkipReason::EMPTY_SERIES);
    }

    // Joint normalization box over both point sets
    double xMin = predicted.getPoints().front().getX(), xMax = xMin;
    double yMin = predicted.getPoints().front().getY(), yMax = yMin;
    for (const auto* series: {&predicted, &reference}) {
        for (const auto& p: series->getPoints()) {
            xMin = std::min(xMin, p.getX());
            xMax = std::max(xMax, p.getX());
            yMin = std::min(yMin, p.getY());
            yMax = std::max(yMax, p.getY());
        }
    }
    const double xRange = xMax - xMin;
    const double yRange = yMax - yMin;
    if (xRange == 0.0 || yRange == 0.0) {
        return SeriesOutcome::skipped(predName, refName, SkipReason::ZERO_RANGE);
    }

    // Normalize and sort by x; stable so equal-x points keep their input order
    auto normalizedSorted = [&](const DataSeries& s, std::vector<double>& xs, std::vector<double>& ys) {
        const auto& pts = s.getPoints();
        std::vector<size_t> order(pts.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&pts](const size_t a, const size_t b) { return pts[a].getX() < pts[b].getX(); });
        xs.resize(pts.size());
        ys.resize(pts.size());
        for (size_t i = 0; i < order.size(); ++i) {
            xs[i] = (pts[order[i]].getX() - xMin) / xRange;
            ys[i] = (pts[order[i]].getY() - yMin) / yRange;
        }
    };
    std::vector<double> predX, predY, refX, refY;
    normalizedSorted(predicted, predX, predY);
    normalizedSorted(reference, refX, refY);

    if (predX.back() - predX.front() < config_.precision || refX.back() - refX.front() < config_.precision) {
        return SeriesOutcome::skipped(predName, refName, SkipReason::INSUFFICIENT_X_SPAN);
    }

    const Eigen::VectorXd predOnGrid = interpolate(grid_, predX, predY);
    const Eigen::VectorXd refOnGrid = interpolate(grid_, refX, refY);
    const double rmse = std::sqrt((predOnGrid - refOnGrid).array().square().mean());
    return SeriesOutcome::ok(predName, refName, rmse);
}

NumericalAccuracy CurveSimilarityScorer::score(const ExtractedPlotData& predicted, const ExtractedPlotData& reference,
                                               const SeriesMatchResult& matches) const {
    NumericalAccuracy acc;
    double rmseSum = 0.0;

    for (const auto& [predName, refName]: matches.pairs) {
        const DataSeries* predSeries = predicted.findSeries(predName);
        const DataSeries* refSeries = reference.findSeries(refName);

        SeriesOutcome outcome = (predSeries && refSeries)
                                    ? compareSeries(*predSeries, *refSeries)
                                    : SeriesOutcome::skipped(predName, refName, SkipReason::EMPTY_SERIES);
        if (outcome.evaluated) {
            rmseSum += outcome.rmse;
            ++acc.evaluatedCount;
            LOG_DEBUG("Series \"" << predName << "\" vs \"" << refName << "\": normalized rmse = " << outcome.rmse);
        } else {
            ++acc.skippedCount;
            ++acc.skipHistogram[outcome.skipReason];
            LOG_DEBUG("Series \"" << predName << "\" vs \"" << refName << "\" skipped: "
                << toString(outcome.skipReason));
        }
        acc.outcomes.push_back(std::move(outcome));
    }

    if (acc.evaluatedCount == 0) {
        // Indistinguishable from "everything wrong" by value alone; skippedCount tells them apart
        acc.score = 0.0;
        acc.avgRmse = 0.0;
        return acc;
    }

    acc.avgRmse = rmseSum / static_cast<double>(acc.evaluatedCount);
    acc.score = std::max(0.0, 1.0 - acc.avgRmse / config_.rmseCutoff);
    return acc;
}
