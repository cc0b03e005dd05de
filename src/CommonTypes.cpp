//
// Project: DIGI_SCORE
// File: CommonTypes.cpp
//

#include <stdexcept>

#include "CommonTypes.hpp"
#include "DigiUtils.hpp"

AxisSide parseAxisSide(const std::string& str) {
    const std::string s = normalizeLabel(str);
    if (s == "left") return AxisSide::LEFT;
    if (s == "right") return AxisSide::RIGHT;
    throw std::invalid_argument("Unknown axis: \"" + str + "\" (expected left/right)");
}

const char* toString(const AxisSide side) {
    return side == AxisSide::LEFT ? "left" : "right";
}

const char* toString(const ErrorMetric metric) {
    return metric == ErrorMetric::RMSE ? "RMSE" : "MAE";
}

const char* toString(const MatchStrategy strategy) {
    return strategy == MatchStrategy::EXACT ? "EXACT" : "FUZZY";
}

const char* toString(const MetricKind kind) {
    return kind == MetricKind::COMPOSITE ? "COMPOSITE" : "NEAREST_NEIGHBOR";
}

const char* toString(const SkipReason reason) {
    switch (reason) {
        case SkipReason::EMPTY_SERIES:
            return "EMPTY_SERIES";
        case SkipReason::ZERO_RANGE:
            return "ZERO_RANGE";
        case SkipReason::INSUFFICIENT_X_SPAN:
            return "INSUFFICIENT_X_SPAN";
    }
    return "UNKNOWN";
}
