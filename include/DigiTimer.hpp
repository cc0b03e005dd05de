//
// Project: DIGI_SCORE
// File: DigiTimer.hpp
//

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "CommonTypes.hpp" // For logging macros

/**
 * @class Timer
 * @brief Measures named sessions and keeps the elapsed seconds of each.
 */
class Timer {
    // private
    std::chrono::steady_clock::time_point startTime;
    std::vector<double> elapsedTimes;
    std::string currentSession;
    bool isRunning;

public:
    Timer() : isRunning(false) {}

    void startTiming(const std::string& sessionName) {
        currentSession = sessionName;
        startTime = std::chrono::steady_clock::now();
        isRunning = true;
        LOG_TIMER(sessionName << " started");
    }

    double endTiming() {
        if (!isRunning) {
            LOG_TIMER(YELLOW << "No active timing session" << RESET);
            return 0.0;
        }

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
        const double elapsedSeconds = elapsed.count();

        elapsedTimes.push_back(elapsedSeconds);
        isRunning = false;

        LOG_TIMER(currentSession << " completed: " << elapsedSeconds << " seconds");

        return elapsedSeconds;
    }

    [[nodiscard]] double getTotalElapsedTime() const {
        double total = 0.0;
        for (const double t: elapsedTimes) total += t;
        return total;
    }
};
