//
// Project: DIGI_SCORE
// File: SeriesMatcher.cpp
//

#include <algorithm>
#include <tuple>

#include "DigiUtils.hpp"
#include "SeriesMatcher.hpp"

std::set<std::string> SeriesMatchResult::matchedPredictedNames() const {
    std::set<std::string> names;
    for (const auto& [pred, ref]: pairs) names.insert(pred);
    return names;
}

std::set<std::string> SeriesMatchResult::matchedReferenceNames() const {
    std::set<std::string> names;
    for (const auto& [pred, ref]: pairs) names.insert(ref);
    return names;
}

double SeriesMatcher::matchFraction(const size_t matched, const size_t predictedCount, const size_t referenceCount) {
    if (predictedCount == 0) {
        // Nothing extracted: perfect only if there was nothing to extract
        return referenceCount == 0 ? 1.0 : 0.0;
    }
    return static_cast<double>(matched) / static_cast<double>(predictedCount);
}

SeriesMatchResult ExactSeriesMatcher::match(const std::set<std::string>& predicted,
                                            const std::set<std::string>& reference) const {
    SeriesMatchResult result;
    for (const auto& name: setsIntersection(predicted, reference)) {
        result.pairs.emplace_back(name, name);
    }
    result.matchFraction = matchFraction(result.pairs.size(), predicted.size(), reference.size());
    return result;
}

FuzzySeriesMatcher::FuzzySeriesMatcher(const double threshold) : threshold_(threshold) {}

double FuzzySeriesMatcher::nameSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0.0;

    const std::string normA = normalizeName(a);
    const std::string normB = normalizeName(b);
    if (normA == normB) return 1.0;
    if (normA.empty() || normB.empty()) return 0.0;

    // Sequence ratio 2*M/T over the longest common subsequence
    const double sequenceSimilarity = 2.0 * static_cast<double>(longestCommonSubsequence(normA, normB)) /
                                      static_cast<double>(normA.size() + normB.size());

    // Token overlap (Jaccard)
    const auto tokensA = splitTokens(normA);
    const auto tokensB = splitTokens(normB);
    const std::set<std::string> wordsA(tokensA.begin(), tokensA.end());
    const std::set<std::string> wordsB(tokensB.begin(), tokensB.end());
    double wordSimilarity = 0.0;
    if (!wordsA.empty() && !wordsB.empty()) {
        const size_t inter = setsIntersection(wordsA, wordsB).size();
        const size_t uni = wordsA.size() + wordsB.size() - inter;
        wordSimilarity = uni > 0 ? static_cast<double>(inter) / static_cast<double>(uni) : 0.0;
    }

    // Substring heuristic, e.g. abbreviation contained in the full name
    double substringSimilarity = 0.0;
    if (normA.size() > 3 && normB.size() > 3) {
        if (normA.find(normB) != std::string::npos || normB.find(normA) != std::string::npos) {
            substringSimilarity = 0.8;
        } else if (const size_t common = longestCommonSubstring(normA, normB); common >= 3) {
            substringSimilarity = static_cast<double>(common) /
                                  static_cast<double>(std::max(normA.size(), normB.size()));
        }
    }

    return 0.4 * sequenceSimilarity + 0.4 * wordSimilarity + 0.2 * substringSimilarity;
}

SeriesMatchResult FuzzySeriesMatcher::match(const std::set<std::string>& predicted,
                                            const std::set<std::string>& reference) const {
    // (similarity, predicted, reference)
    std::vector<std::tuple<double, std::string, std::string>> candidates;
    for (const auto& pred: predicted) {
        for (const auto& ref: reference) {
            if (const double sim = nameSimilarity(pred, ref); sim >= threshold_) {
                candidates.emplace_back(sim, pred, ref);
            }
        }
    }

    // Highest similarity first; names break ties so the assignment is reproducible
    std::sort(candidates.begin(), candidates.end(), [](const auto& l, const auto& r) {
        if (std::get<0>(l) != std::get<0>(r)) return std::get<0>(l) > std::get<0>(r);
        if (std::get<1>(l) != std::get<1>(r)) return std::get<1>(l) < std::get<1>(r);
        return std::get<2>(l) < std::get<2>(r);
    });

    SeriesMatchResult result;
    std::set<std::string> usedPred, usedRef;
    for (const auto& [sim, pred, ref]: candidates) {
        if (usedPred.count(pred) || usedRef.count(ref)) continue;
        usedPred.insert(pred);
        usedRef.insert(ref);
        result.pairs.emplace_back(pred, ref);
        LOG_DEBUG("Fuzzy series match \"" << pred << "\" -> \"" << ref << "\" (similarity " << sim << ")");
    }
    result.matchFraction = matchFraction(result.pairs.size(), predicted.size(), reference.size());
    return result;
}

std::unique_ptr<SeriesMatcher> createSeriesMatcher(const MatchingConfig& config) {
    if (config.strategy == MatchStrategy::FUZZY) {
        return std::make_unique<FuzzySeriesMatcher>(config.fuzzyThreshold);
    }
    return std::make_unique<ExactSeriesMatcher>();
}
