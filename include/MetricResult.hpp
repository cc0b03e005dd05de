//
// Project: DIGI_SCORE
// File: MetricResult.hpp
//
// Tagged result shared by every plot metric, so that bounded [0,1] scores and
// unbounded distances are never confused by a caller.
//

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "CommonTypes.hpp"

enum class MetricScale {
    BOUNDED, // score in [0, 1], higher is better
    UNBOUNDED // non-negative distance, lower is better
};

struct MetricResult {
    MetricScale scale = MetricScale::BOUNDED;
    bool comparable = false; // false: inputs could not be compared at all
    double value = 0.0; // score or distance; 0.0 when not comparable
    int evaluatedSeries = 0;
    int skippedSeries = 0;
    std::map<SkipReason, int> skipHistogram;
    std::vector<std::string> diagnostics; // non-fatal notes, e.g. missing series

    static MetricResult bounded(const double score) {
        MetricResult r;
        r.scale = MetricScale::BOUNDED;
        r.comparable = true;
        r.value = score;
        return r;
    }

    static MetricResult unbounded(const double distance) {
        MetricResult r;
        r.scale = MetricScale::UNBOUNDED;
        r.comparable = true;
        r.value = distance;
        return r;
    }

    static MetricResult incomparable(const MetricScale scale, std::string why) {
        MetricResult r;
        r.scale = scale;
        r.comparable = false;
        r.value = 0.0;
        r.diagnostics.push_back(std::move(why));
        return r;
    }
};

/**
 * @brief A metric comparing a prediction against a reference of the same shape.
 */
template<typename T>
class MetricInterface {
public:
    virtual ~MetricInterface() = default;

    [[nodiscard]] virtual MetricResult evaluate(const T& preds, const T& refs) const = 0;
};
