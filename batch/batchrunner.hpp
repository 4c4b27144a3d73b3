#ifndef BATCHRUNNER_HPP
#define BATCHRUNNER_HPP

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../config.hpp"
#include "../image_processing.hpp"
#include "../report/reportwriter.h"

namespace cellquant {

/** Which workflow a batch runs. */
enum class AnalysisKind {
    LipidDroplets,
    ReactiveOxygen
};

/// "ld"/"lds" или "ros" (без учёта регистра).
AnalysisKind parseAnalysisKind(const std::string& s);

/// Folder name that marks the workflow in the input tree: "LDs" or "ROS".
std::string themeName(AnalysisKind kind);

/** One image scheduled for analysis. */
struct ImageJob {
    std::string path;      ///< input file
    ImageMetadata meta;
    std::string outputDir; ///< per-image output folder
};

/** One row of batch_summary.csv. */
struct BatchItemResult {
    std::string image;
    std::string status = "pending"; ///< ok / skipped / failed / cancelled
    int nuclei = 0;
    std::vector<std::pair<std::string, int>> counts; ///< species name -> objects
    std::string message;
};

/**
 * @brief Discover images, run one workflow per image on a small worker pool,
 *        export reports and rasters, collect a summary.
 *
 * Workers pull jobs through an atomic index; the stop flag is checked before
 * each image, an image that already started is finished.
 */
class BatchRunner {
public:
    BatchRunner(AnalysisKind kind, AnalysisConfig config);

    /**
     * @brief Metadata from a path relative to the input root.
     *
     * Layout: `<CellLine>/<Theme>/<Source>/<NPs>/<Dose>/<Objective...>/<file>`.
     * Returns nullopt for fewer than six components or another theme
     * (compared case-insensitively). The objective is the remaining folders
     * joined with '_'.
     */
    static std::optional<ImageMetadata> parseLayout(const std::filesystem::path& relative,
                                                    const std::string& theme);

    /// `<root>/<CellLine>/<Source>/<NPs>/<Dose>/<Objective>`; empty tags are skipped.
    static std::filesystem::path outputFolder(const std::filesystem::path& root, const ImageMetadata& meta);

    /**
     * @brief Build the job list.
     *
     * A directory is searched recursively for the configured extensions
     * (sorted by path); a single file becomes one job with "unknown" tags.
     * @throws std::runtime_error if input does not exist
     */
    std::vector<ImageJob> discover(const std::string& input, const std::string& outputRoot) const;

    /** Process all jobs; the returned rows keep the job order. */
    std::vector<BatchItemResult> run(const std::vector<ImageJob>& jobs);

    /** Analyse, export and summarise a single image. Errors become a "failed" row. */
    BatchItemResult processOne(const ImageJob& job) const;

    /// `<outputDir>/<name>_nuclei_overlay.png`, written last for every image.
    static std::filesystem::path completionMarker(const ImageJob& job);

    static std::string summaryCsv(const std::vector<BatchItemResult>& rows);
    static void writeSummary(const std::vector<BatchItemResult>& rows, const std::string& path);

    void requestStop() { stop_.store(true); }
    bool stopRequested() const { return stop_.load(); }
    std::atomic<bool>& stopFlag() { return stop_; }

    const AnalysisConfig& config() const { return config_; }

private:
    void exportLipid(const LipidAnalysis& a, const cv::Mat& image, const ImageJob& job) const;
    void exportReactiveOxygen(const RosAnalysis& a, const cv::Mat& image, const ImageJob& job) const;
    void exportNuclei(const NucleusSegmentation& nuc, const cv::Mat& image, const ImageJob& job) const;

    AnalysisKind      kind_;
    AnalysisConfig    config_;
    ImageAnalyzer     analyzer_;
    std::atomic<bool> stop_{false};
    mutable std::mutex mutex_; ///< guards the summary rows and console progress
};

} // namespace cellquant

#endif // BATCHRUNNER_HPP
