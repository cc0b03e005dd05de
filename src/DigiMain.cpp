//
// Project: DIGI_SCORE
// File: DigiMain.cpp
//

#include <iostream>

#include "CommonTypes.hpp"
#include "DigiConfig.hpp"
#include "DigiScore.hpp"
#include "DigiTimer.hpp"
#include "DigiUtils.hpp"

/**
 * @brief Batch evaluation entry.
 * @param argc Number of arguments
 * @param argv argv[1] is the configuration file
 * @return 0 if every case was loaded, 1 if some failed, -1 on usage or configuration errors
 */
int main(const int argc, char** argv) {
    // Check if the required arguments are provided
    if (argc == 1) {
        LOG_ERROR("Not enough arguments provided. " << RESET);
        LOG_INFO("Usage: " << argv[0] << " <config_file> ");
        return -1;
    }
    if (argc > 2) {
        LOG_WARNING("Too many arguments provided. Ignoring the rest arguments");
    }

    DigiConfig digiConfig;
    if (!digiConfig.load(argv[1])) {
        LOG_ERROR("Failed to load configuration file: " << argv[1]);
        return -1;
    }
    LOG_INFO("Configuration file is loaded from " << argv[1]);

    if (!digiConfig.validate()) {
        LOG_ERROR("No valid evaluation cases: every case needs a prediction and a groundTruth path.");
        return -1;
    }
    digiConfig.printSummary();

    ////////////////////////////////////////////////////////////////
    ///
    /// Set system
    ///
    ////////////////////////////////////////////////////////////////
    settingThreads(digiConfig.desiredThreads);

    Timer timer;
    timer.startTiming("batch evaluation");
    const std::vector<DigiResult> results = evaluation(digiConfig);
    timer.endTiming();

    const BatchSummary summary = summarize(results, digiConfig.metricKind);
    printSummary(summary, digiConfig.metricKind);

    if (summary.failedCount > 0) {
        std::cout << YELLOW << summary.failedCount << " case(s) could not be loaded" << RESET << std::endl;
        return 1;
    }
    std::cout << GREEN << "Evaluation finished" << RESET << std::endl;
    return 0;
}
