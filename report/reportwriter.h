#pragma once
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "../image_processing.hpp"

namespace cellquant {

/** Experimental condition tags carried into every table. */
struct ImageMetadata
{
    std::string filename;                      ///< image name without extension
    std::string cellLine          = "unknown";
    std::string irradiationSource = "unknown";
    std::string nanoparticles     = "unknown";
    std::string dose              = "unknown";
    std::string objective         = "unknown";
};

/** Aggregate statistics of one species. */
struct SpeciesSummary
{
    int    count             = 0;
    double totalArea         = 0.0;
    double meanArea          = std::numeric_limits<double>::quiet_NaN();
    double meanEccentricity  = std::numeric_limits<double>::quiet_NaN();
    double meanEquivDiameter = std::numeric_limits<double>::quiet_NaN();
    double meanIntensity     = std::numeric_limits<double>::quiet_NaN();
    double stdIntensity      = std::numeric_limits<double>::quiet_NaN(); ///< sample std (n-1)
    double totalFluorescence = std::numeric_limits<double>::quiet_NaN(); ///< Σ area·intensity
};

/* -------------------------------------------------------------- *
 * ReportWriter: три CSV-таблицы на изображение                   *
 *   _global  – ключ/значение                                     *
 *   _nuclei  – строка на ядро                                    *
 *   _objects – строка на объект                                  *
 * -------------------------------------------------------------- */
/**
 * @brief Turn analysis results into CSV report tables.
 */
class ReportWriter
{
public:
    /// Какой канал считается "интенсивностью" объекта.
    enum class IntensitySource { Red, Green };

    explicit ReportWriter(ImageMetadata meta) : meta_(std::move(meta)) {}

    /* ---------- lipid droplets --------------------------------- */
    std::string lipidGlobal (const LipidAnalysis& a) const;
    std::string lipidNuclei (const LipidAnalysis& a) const;
    std::string lipidObjects(const LipidAnalysis& a) const;

    /* ---------- ROS -------------------------------------------- */
    std::string rosGlobal (const RosAnalysis& a) const;
    std::string rosNuclei (const RosAnalysis& a) const;
    std::string rosObjects(const RosAnalysis& a) const;

    /**
     * @brief Write `<name>_LDReport_{global,nuclei,objects}.csv` into outDir.
     * @return written paths
     * @throws std::runtime_error if a file cannot be opened
     */
    std::vector<std::string> writeLipid(const LipidAnalysis& a, const std::string& outDir) const;

    /// Same for `<name>_ROSReport_*.csv`.
    std::vector<std::string> writeReactiveOxygen(const RosAnalysis& a, const std::string& outDir) const;

    /* ---------- helpers ---------------------------------------- */
    /**
     * @brief Count, areas and intensity statistics of a record list.
     *
     * The intensity of a record is its mean over the chosen channel; for
     * IntensitySource::Red a record without red intensity falls back to its
     * colocalisation coverage. Records without any value are left out of
     * the intensity statistics.
     */
    static SpeciesSummary summarize(const std::vector<RegionRecord>& regions, IntensitySource src);

    /** Mean number of objects per nucleus; NaN without nuclei. */
    static double meanPerNucleus(const SpeciesResult& species);

    /** Mean red/green ratio over records whose green intensity is positive. */
    static double meanRedGreenRatio(const std::vector<RegionRecord>& regions);

    /** Number formatting used in every table ("NaN" for missing values). */
    static std::string formatValue(double v);
    static std::string formatValue(const std::optional<double>& v);

    /** Quote a text field when it contains a separator or quote. */
    static std::string csvField(const std::string& s);

    const ImageMetadata& metadata() const { return meta_; }

private:
    void objectRows(std::ostringstream& oss, const SpeciesResult& species) const;
    static std::string objectHeader();
    static void writeFile(const std::string& path, const std::string& content);

    ImageMetadata meta_;
};

} // namespace cellquant
