//
// Project: DIGI_SCORE
// File: DigiUtils.hpp
//

#ifndef DIGI_UTILS_
#define DIGI_UTILS_

#include <set>
#include <string>
#include <vector>

// Functions declaration
void settingThreads(int desiredThreads);

// String helpers
std::string toLower(std::string s);
std::string trim(const std::string& s);
// trim + lower-case, used for axis labels
std::string normalizeLabel(const std::string& s);
// lower-case + collapse whitespace runs to one space + trim, used for series names
std::string normalizeName(const std::string& s);
std::vector<std::string> splitTokens(const std::string& s);

// Sequence helpers
size_t longestCommonSubsequence(const std::string& a, const std::string& b);
size_t longestCommonSubstring(const std::string& a, const std::string& b);

// Set operations
std::set<std::string> setsIntersection(const std::set<std::string>& s1, const std::set<std::string>& s2);
std::set<std::string> setsDifference(const std::set<std::string>& s1, const std::set<std::string>& s2);

// Statistics
double meanOf(const std::vector<double>& values);
double sampleStdDev(const std::vector<double>& values);

#endif // DIGI_UTILS_
