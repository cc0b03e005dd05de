//
// Project: DIGI_SCORE
// File: NearestNeighborMetric.cpp
//

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <sstream>

// pcl
#include <pcl/point_types.h>
#include <pcl/point_cloud.h>
#include <pcl/kdtree/kdtree_flann.h>

#include "DigiUtils.hpp"
#include "NearestNeighborMetric.hpp"

NearestNeighborPointMetric::NearestNeighborPointMetric(const NearestNeighborConfig& config) : config_(config) {
    if (!(config_.scaleEpsilon > 0.0)) {
        LOG_WARNING("scaleEpsilon must be strictly positive, got " << config_.scaleEpsilon << ". Using 1e-8.");
        config_.scaleEpsilon = 1e-8;
    }
}

std::vector<std::string> NearestNeighborPointMetric::missingSeries(const NameToCoordinates& preds,
                                                                   const NameToCoordinates& refs) {
    std::set<std::string> predNames, refNames;
    for (const auto& kv: preds) predNames.insert(kv.first);
    for (const auto& kv: refs) refNames.insert(kv.first);
    const std::set<std::string> missing = setsDifference(refNames, predNames);
    return {missing.begin(), missing.end()};
}

AxisScale NearestNeighborPointMetric::computeScale(const NameToCoordinates& reference) const {
    double xMin = std::numeric_limits<double>::max(), xMax = std::numeric_limits<double>::lowest();
    double yMin = std::numeric_limits<double>::max(), yMax = std::numeric_limits<double>::lowest();
    bool any = false;
    for (const auto& [name, coords]: reference) {
        for (const auto& c: coords) {
            xMin = std::min(xMin, c[0]);
            xMax = std::max(xMax, c[0]);
            yMin = std::min(yMin, c[1]);
            yMax = std::max(yMax, c[1]);
            any = true;
        }
    }

    AxisScale scale;
    if (!any) {
        scale.xRange = config_.scaleEpsilon;
        scale.yRange = config_.scaleEpsilon;
        return scale;
    }
    scale.xMin = xMin;
    scale.yMin = yMin;
    scale.xRange = std::max(xMax - xMin, config_.scaleEpsilon);
    scale.yRange = std::max(yMax - yMin, config_.scaleEpsilon);
    return scale;
}

double NearestNeighborPointMetric::seriesError(const std::vector<Coordinate>& predicted,
                                               const std::vector<Coordinate>& reference,
                                               const AxisScale& scale) const {
    if (predicted.empty()) return 0.0;

    // The kd-tree only picks the nearest reference point; the distance itself
    // is recomputed in double from the original coordinates.
    auto toNormalized = [&scale](const Coordinate& c) {
        return pcl::PointXYZ(static_cast<float>((c[0] - scale.xMin) / scale.xRange),
                             static_cast<float>((c[1] - scale.yMin) / scale.yRange),
                             0.0f);
    };
    const pcl::PointCloud<pcl::PointXYZ>::Ptr refCloud(new pcl::PointCloud<pcl::PointXYZ>);
    refCloud->points.reserve(reference.size());
    for (const auto& c: reference) refCloud->points.push_back(toNormalized(c));
    refCloud->width = static_cast<uint32_t>(refCloud->points.size());
    refCloud->height = 1;
    refCloud->is_dense = true;

    pcl::KdTreeFLANN<pcl::PointXYZ> kdtree;
    kdtree.setInputCloud(refCloud);
    std::vector<int> pointIdx(1);
    std::vector<float> pointSqDist(1);

    double acc = 0.0;
    for (const auto& c: predicted) {
        if (kdtree.nearestKSearch(toNormalized(c), 1, pointIdx, pointSqDist) < 1) {
            LOG_WARNING("Nearest-neighbor search returned no result for (" << c[0] << ", " << c[1] << ")");
            continue;
        }
        const Coordinate& r = reference[static_cast<size_t>(pointIdx[0])];
        const double dx = (c[0] - r[0]) / scale.xRange;
        const double dy = (c[1] - r[1]) / scale.yRange;
        const double sq = dx * dx + dy * dy;
        acc += config_.errorMetric == ErrorMetric::RMSE ? sq : std::sqrt(sq);
    }
    const double mean = acc / static_cast<double>(predicted.size());
    return config_.errorMetric == ErrorMetric::RMSE ? std::sqrt(mean) : mean;
}

MetricResult NearestNeighborPointMetric::evaluate(const NameToCoordinates& preds,
                                                  const NameToCoordinates& refs) const {
    const auto missing = missingSeries(preds, refs);
    if (!missing.empty()) {
        std::ostringstream oss;
        for (size_t i = 0; i < missing.size(); ++i) oss << (i ? ", " : "") << missing[i];
        LOG_INFO("Series missing in prediction: " << oss.str());
    }

    const AxisScale scale = computeScale(refs);
    double sum = 0.0;
    int evaluated = 0;
    MetricResult result = MetricResult::unbounded(0.0);

    for (const auto& [name, predCoords]: preds) {
        const auto refIt = refs.find(name);
        if (refIt == refs.end()) continue;

        if (refIt->second.empty()) {
            ++result.skippedSeries;
            ++result.skipHistogram[SkipReason::EMPTY_SERIES];
            LOG_DEBUG("Series \"" << name << "\" skipped: reference has no points");
            continue;
        }
        if (predCoords.empty()) {
            LOG_WARNING("Series \"" << name << "\" has no predicted points; counted with error 0.");
        }
        const double err = seriesError(predCoords, refIt->second, scale);
        LOG_DEBUG("Series \"" << name << "\": " << toString(config_.errorMetric) << " = " << err);
        sum += err;
        ++evaluated;
    }

    for (const auto& name: missing) result.diagnostics.push_back("missing series: " + name);

    if (evaluated == 0) {
        MetricResult none = MetricResult::incomparable(MetricScale::UNBOUNDED, "no common series to compare");
        none.skippedSeries = result.skippedSeries;
        none.skipHistogram = result.skipHistogram;
        none.diagnostics.insert(none.diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
        return none;
    }

    result.evaluatedSeries = evaluated;
    result.value = sum / static_cast<double>(evaluated);
    return result;
}

MetricResult NearestNeighborPointMetric::evaluate(const SimpleDigitization& preds,
                                                  const SimpleDigitization& refs) const {
    return evaluate(preds.getNameToCoordinates(), refs.getNameToCoordinates());
}

std::optional<double> NearestNeighborPointMetric::score(const NameToCoordinates& preds,
                                                        const NameToCoordinates& refs) const {
    const MetricResult r = evaluate(preds, refs);
    if (!r.comparable) return std::nullopt;
    return r.value;
}

std::optional<double> NearestNeighborPointMetric::score(const SimpleDigitization& preds,
                                                        const SimpleDigitization& refs) const {
    return score(preds.getNameToCoordinates(), refs.getNameToCoordinates());
}
