//
// Project: DIGI_SCORE
// File: SeriesMatcher.hpp
//
// Aligns named series of a prediction with those of a reference.
//

#pragma once

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "CommonTypes.hpp"

struct MatchingConfig {
    MatchStrategy strategy = MatchStrategy::EXACT;
    double fuzzyThreshold = 0.7; // minimum name similarity accepted by FUZZY
};

/**
 * @struct SeriesMatchResult
 * @brief One-to-one predicted -> reference name pairs plus the fraction of predicted series matched.
 */
struct SeriesMatchResult {
    std::vector<std::pair<std::string, std::string>> pairs; // (predicted, reference)
    double matchFraction = 0.0;

    [[nodiscard]] std::set<std::string> matchedPredictedNames() const;
    [[nodiscard]] std::set<std::string> matchedReferenceNames() const;
};

class SeriesMatcher {
public:
    virtual ~SeriesMatcher() = default;

    /**
     * @brief Pair predicted series names with reference series names.
     * @details matchFraction = |pairs| / |predicted| when predicted is non-empty;
     *          otherwise 1.0 if reference is also empty, else 0.0.
     */
    [[nodiscard]] virtual SeriesMatchResult match(const std::set<std::string>& predicted,
                                                  const std::set<std::string>& reference) const = 0;

    [[nodiscard]] virtual MatchStrategy strategy() const = 0;

protected:
    static double matchFraction(size_t matched, size_t predictedCount, size_t referenceCount);
};

/**
 * @brief Case-sensitive equality of names, no normalization at all.
 */
class ExactSeriesMatcher final : public SeriesMatcher {
public:
    [[nodiscard]] SeriesMatchResult match(const std::set<std::string>& predicted,
                                          const std::set<std::string>& reference) const override;

    [[nodiscard]] MatchStrategy strategy() const override { return MatchStrategy::EXACT; }
};

/**
 * @brief Similarity-threshold matching with greedy one-to-one assignment.
 * @details
 *   similarity = 0.4 * sequence ratio + 0.4 * token Jaccard + 0.2 * substring score,
 *   computed on lower-cased, whitespace-collapsed names (identical normalized names score 1.0).
 *   Candidate pairs at or above the threshold are assigned by descending similarity.
 */
class FuzzySeriesMatcher final : public SeriesMatcher {
    double threshold_;

public:
    explicit FuzzySeriesMatcher(double threshold = 0.7);

    [[nodiscard]] SeriesMatchResult match(const std::set<std::string>& predicted,
                                          const std::set<std::string>& reference) const override;

    [[nodiscard]] MatchStrategy strategy() const override { return MatchStrategy::FUZZY; }

    [[nodiscard]] double getThreshold() const { return threshold_; }

    // Similarity of two series names in [0, 1]
    static double nameSimilarity(const std::string& a, const std::string& b);
};

std::unique_ptr<SeriesMatcher> createSeriesMatcher(const MatchingConfig& config);
