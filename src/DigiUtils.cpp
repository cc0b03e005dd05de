//
// Project: DIGI_SCORE
// File: DigiUtils.cpp
//

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <sstream>

#include <omp.h>

#include "CommonTypes.hpp"
#include "DigiUtils.hpp"


// Function to set the number of threads for OpenMP.
// Cases of a batch run are spread over these threads.
void settingThreads(const int desiredThreads) {
    const int ompMax = omp_get_max_threads();
    LOG_INFO("OMP default threads: " << ompMax);
    if (desiredThreads == -1) {
        omp_set_num_threads(ompMax);
        LOG_INFO("Using maximum available threads for evaluation: " << ompMax);
    } else if (desiredThreads > ompMax) {
        omp_set_num_threads(ompMax);
        LOG_WARNING("Desired thread number exceeds device capacity: " << desiredThreads << " > " << ompMax
            << ". Set to maximum available: " << ompMax);
    } else if (desiredThreads < -1 || desiredThreads == 0) {
        omp_set_num_threads(ompMax);
        LOG_WARNING("Desired thread number is invalid: " << desiredThreads
            << ". Set to maximum available: " << ompMax);
    } else {
        omp_set_num_threads(desiredThreads);
        LOG_INFO("Set OMP threads to: " << desiredThreads);
    }
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    const auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
    const auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string normalizeLabel(const std::string& s) {
    return toLower(trim(s));
}

std::string normalizeName(const std::string& s) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& token: splitTokens(toLower(s))) {
        if (!first) oss << ' ';
        oss << token;
        first = false;
    }
    return oss.str();
}

std::vector<std::string> splitTokens(const std::string& s) {
    std::istringstream iss(s);
    return {std::istream_iterator<std::string>(iss), std::istream_iterator<std::string>()};
}

// Classic O(|a|*|b|) dynamic program, one row kept
size_t longestCommonSubsequence(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1, 0), curr(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            curr[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : std::max(prev[j], curr[j - 1]);
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

size_t longestCommonSubstring(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1, 0), curr(b.size() + 1, 0);
    size_t best = 0;
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            curr[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : 0;
            best = std::max(best, curr[j]);
        }
        std::swap(prev, curr);
    }
    return best;
}

std::set<std::string> setsIntersection(const std::set<std::string>& s1, const std::set<std::string>& s2) {
    std::set<std::string> out;
    std::set_intersection(s1.begin(), s1.end(), s2.begin(), s2.end(), std::inserter(out, out.begin()));
    return out;
}

std::set<std::string> setsDifference(const std::set<std::string>& s1, const std::set<std::string>& s2) {
    std::set<std::string> out;
    std::set_difference(s1.begin(), s1.end(), s2.begin(), s2.end(), std::inserter(out, out.begin()));
    return out;
}

double meanOf(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (const double v: values) sum += v;
    return sum / static_cast<double>(values.size());
}

// n - 1 denominator; 0.0 for fewer than two values
double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double mu = meanOf(values);
    double acc = 0.0;
    for (const double v: values) acc += (v - mu) * (v - mu);
    return std::sqrt(acc / static_cast<double>(values.size() - 1));
}
