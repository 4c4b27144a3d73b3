#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

#include "batch/batchrunner.hpp"
#include "config.hpp"
#include "config_loader.hpp"
#include "utils.hpp"

using namespace cellquant;

namespace {
std::atomic<bool>* g_stopFlag = nullptr;

void onInterrupt(int)
{
    if (g_stopFlag)
        g_stopFlag->store(true);
}
} // namespace

int main(int argc, char** argv)
{
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <ld|ros> <image-or-folder> <outputDir> [config.yml]" << std::endl;
        return 1;
    }

    AnalysisKind kind;
    try {
        kind = parseAnalysisKind(argv[1]);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    const std::string input = argv[2];
    const std::string outputDir = argv[3];
    // Если передан файл конфигурации, используем его, иначе "default.yml"
    const bool explicitConfig = argc >= 5;
    const std::string configFile = explicitConfig ? argv[4] : "default.yml";

    // Загружаем YAML-конфигурацию
    AnalysisConfig config;
    if (explicitConfig || std::filesystem::exists(configFile)) {
        try {
            config = ConfigLoader::loadFile(configFile);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config file: " << e.what() << std::endl;
            return 1;
        }
    } else {
        std::cout << "Config file not found (" << configFile << "); using built-in defaults." << std::endl;
    }

    // imshow из нескольких потоков не поддерживается
    debugDisplayEnabled = config.debug.show && config.batch.workers <= 1 && !isHeadlessMode();

    BatchRunner runner(kind, config);
    g_stopFlag = &runner.stopFlag();
    std::signal(SIGINT, onInterrupt);

    std::vector<ImageJob> jobs;
    try {
        jobs = runner.discover(input, outputDir);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (jobs.empty()) {
        std::cerr << "No " << themeName(kind) << " images found under " << input << std::endl;
        return 1;
    }

    std::cout << "Processing " << jobs.size() << " images with "
              << std::max(1, config.batch.workers) << " worker(s)..." << std::endl;
    std::vector<BatchItemResult> rows = runner.run(jobs);

    int failed = 0;
    for (const auto& r : rows)
        if (r.status == "failed")
            ++failed;

    try {
        std::filesystem::create_directories(outputDir);
        BatchRunner::writeSummary(rows, (std::filesystem::path(outputDir) / "batch_summary.csv").string());
    } catch (const std::exception& e) {
        std::cerr << "Failed to write batch summary: " << e.what() << std::endl;
        return 1;
    }

    if (debugDisplayEnabled) {
        std::cout << "Press any key to exit..." << std::endl;
        cv::waitKey(0);
    }

    g_stopFlag = nullptr;
    if (runner.stopRequested())
        return 130;
    return failed > 0 ? 2 : 0;
}
