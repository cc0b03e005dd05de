//
// Project: DIGI_SCORE
// File: MetadataScorer.cpp
//

#include <array>
#include <utility>

#include "DigiUtils.hpp"
#include "MetadataScorer.hpp"

double scoreMetadata(const PlotMetadata& predicted, const PlotMetadata& reference) {
    const std::array<std::pair<const std::string*, const std::string*>, 2> fields{{
        {&predicted.xAxisLabel, &reference.xAxisLabel},
        {&predicted.leftYAxisLabel, &reference.leftYAxisLabel},
    }};

    int points = 0;
    for (const auto& [pred, ref]: fields) {
        const std::string p = normalizeLabel(*pred);
        if (!p.empty() && p == normalizeLabel(*ref)) ++points;
    }
    return static_cast<double>(points) / static_cast<double>(fields.size());
}
