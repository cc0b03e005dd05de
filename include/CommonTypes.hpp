//
// Project: DIGI_SCORE
// File: CommonTypes.hpp
//

#pragma once

// system
#include <iostream>
#include <string>

////============================================================
///
/// System
///
////============================================================

// Terminal color codes for output
#define RED "\033[31m"
#define BRIGHT_YELLOW "\033[93m"
#define GREEN "\033[32m"
#define YELLOW "\033[33m"
#define BLUE "\033[34m"
#define RESET "\033[0m"

// Log levels, ordered by verbosity
enum class DigiLogLevel {
    DIGI_SILENT = 0, // nothing at all
    DIGI_ERROR = 1, // errors only
    DIGI_CRITICAL = 2, // critical warnings and above
    DIGI_WARNING = 3, // warnings and above
    DIGI_INFO = 4, // info and above
    DIGI_DEBUG = 5 // everything
};

// Process-wide log threshold
class DigiLogger {
    // private
    inline static DigiLogLevel currentLevel = DigiLogLevel::DIGI_INFO;

public:
    static void setLevel(const DigiLogLevel level) {
        currentLevel = level;
    }

    static DigiLogLevel getLevel() {
        return currentLevel;
    }

    static bool shouldLog(DigiLogLevel level) {
        return static_cast<int>(level) <= static_cast<int>(currentLevel);
    }
};

// Logging macros
#define LOG_ERROR(msg) \
if (DigiLogger::shouldLog(DigiLogLevel::DIGI_ERROR)) \
std::cout << RED << "[ERROR] " << msg << RESET << std::endl
#define LOG_CRITICAL(msg) \
if (DigiLogger::shouldLog(DigiLogLevel::DIGI_CRITICAL)) \
std::cout << BRIGHT_YELLOW << "[CRITICAL] " << msg << RESET << std::endl
#define LOG_WARNING(msg) \
if (DigiLogger::shouldLog(DigiLogLevel::DIGI_WARNING)) \
std::cout << YELLOW << "[WARNING] " << msg << RESET << std::endl
#define LOG_INFO(msg) \
if (DigiLogger::shouldLog(DigiLogLevel::DIGI_INFO)) \
std::cout << "[INFO] " << msg << std::endl
#define LOG_DEBUG(msg) \
if (DigiLogger::shouldLog(DigiLogLevel::DIGI_DEBUG)) \
std::cout << BLUE << "[DEBUG] " << msg << RESET << std::endl
#define LOG_TIMER(msg) \
if (DigiLogger::shouldLog(DigiLogLevel::DIGI_INFO)) \
std::cout << BLUE << "[Timer] " << msg << RESET << std::endl


////============================================================
///
/// Scoring related
///
////============================================================

// Which y-axis a point or series is plotted against
enum class AxisSide {
    LEFT,
    RIGHT
};

// Error aggregation used by the nearest-neighbor point metric
enum class ErrorMetric {
    RMSE, // sqrt(mean(min squared distance))
    MAE // mean(min distance)
};

// Strategy used to pair predicted series names with reference series names
enum class MatchStrategy {
    EXACT,
    FUZZY
};

// Which metric the batch evaluation runs
enum class MetricKind {
    COMPOSITE,
    NEAREST_NEIGHBOR
};

// Why a matched series did not contribute to an aggregate
enum class SkipReason {
    EMPTY_SERIES, // either side has no points
    ZERO_RANGE, // the normalization box is degenerate on one axis
    INSUFFICIENT_X_SPAN // a curve spans less than one grid step in x
};

/**
 * @brief Parse "left"/"right" (case-insensitive).
 * @throws std::invalid_argument for any other value.
 */
AxisSide parseAxisSide(const std::string& str);

const char* toString(AxisSide side);
const char* toString(ErrorMetric metric);
const char* toString(MatchStrategy strategy);
const char* toString(MetricKind kind);
const char* toString(SkipReason reason);
