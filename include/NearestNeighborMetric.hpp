//
// Project: DIGI_SCORE
// File: NearestNeighborMetric.hpp
//
// Point-matching metric for the simple name -> [[x, y], ...] digitization shape.
// No ordering or interpolation basis is assumed: each predicted point is matched
// to its nearest reference point of the same series. Lower is better and the
// value has no upper bound.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "MetricResult.hpp"
#include "PlotModel.hpp"

struct NearestNeighborConfig {
    ErrorMetric errorMetric = ErrorMetric::RMSE;
    double scaleEpsilon = 1e-8; // floor for a degenerate reference axis range
};

/**
 * @struct AxisScale
 * @brief Normalization derived from the reference digitization only.
 */
struct AxisScale {
    double xMin = 0.0;
    double yMin = 0.0;
    double xRange = 1.0;
    double yRange = 1.0;
};

class NearestNeighborPointMetric final : public MetricInterface<SimpleDigitization> {
    NearestNeighborConfig config_;

public:
    explicit NearestNeighborPointMetric(const NearestNeighborConfig& config = NearestNeighborConfig());

    /**
     * @brief Average per-series error over series present in both inputs.
     * @return std::nullopt when no common series can be compared.
     * @note Not symmetric: the scale comes from refs alone.
     */
    [[nodiscard]] std::optional<double> score(const NameToCoordinates& preds, const NameToCoordinates& refs) const;
    [[nodiscard]] std::optional<double> score(const SimpleDigitization& preds, const SimpleDigitization& refs) const;

    /**
     * @brief Tagged variant of score(): UNBOUNDED, with missing-series diagnostics and skip counts.
     */
    [[nodiscard]] MetricResult evaluate(const NameToCoordinates& preds, const NameToCoordinates& refs) const;
    [[nodiscard]] MetricResult evaluate(const SimpleDigitization& preds,
                                        const SimpleDigitization& refs) const override;

    /**
     * @brief Per-axis min and range over every reference point; ranges are floored at scaleEpsilon.
     */
    [[nodiscard]] AxisScale computeScale(const NameToCoordinates& reference) const;

    /**
     * @brief Error of one series under the configured ErrorMetric.
     * @details For each predicted point, the normalized distance to its nearest reference point:
     *          RMSE -> sqrt(mean(d^2)), MAE -> mean(d). 0.0 when predicted is empty.
     * @pre reference non-empty.
     */
    [[nodiscard]] double seriesError(const std::vector<Coordinate>& predicted,
                                     const std::vector<Coordinate>& reference,
                                     const AxisScale& scale) const;

    [[nodiscard]] const NearestNeighborConfig& getConfig() const { return config_; }

    // Reference series names the prediction does not contain
    static std::vector<std::string> missingSeries(const NameToCoordinates& preds, const NameToCoordinates& refs);
};
