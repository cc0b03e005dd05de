//
// Project: DIGI_SCORE
// File: MetadataScorer.hpp
//

#pragma once

#include "PlotModel.hpp"

/**
 * @brief Axis-label agreement in [0, 1].
 * @details One point each for x label and left y label when their trimmed,
 *          lower-cased values are equal and non-empty; score = points / 2.
 *          Right-axis labels and the title are not scored.
 * @note Trimming and lower-casing are ASCII only: labels that differ only in the
 *       case of a non-ASCII letter (Greek capital vs small delta) do not agree.
 */
double scoreMetadata(const PlotMetadata& predicted, const PlotMetadata& reference);
