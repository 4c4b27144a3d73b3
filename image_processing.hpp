#ifndef IMAGE_PROCESSING_HPP
#define IMAGE_PROCESSING_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "analysis/colocalization.hpp"
#include "analysis/nucleusassignment.hpp"
#include "config.hpp"
#include "segmentation/labelmapping.hpp"
#include "segmentation/nucleussegmenter.hpp"
#include "visualization.hpp"

namespace cellquant {

/**
 * @brief One detected species (green LDs, ROS, ...) after labelling,
 *        nucleus assignment and intensity measurement.
 */
struct SpeciesResult
{
    std::string name;                 ///< "Red", "Green", "Colocalized", "Diffuse", "ROS", ...
    cv::Mat1b detectionMask;          ///< binary mask the regions were labelled from
    cv::Mat1i labels;                 ///< 1..N, same order as regions
    std::vector<RegionRecord> regions;
    ReconstructedMask reconstruction; ///< size-coded disks
    int numNuclei = 0;

    int count() const { return static_cast<int>(regions.size()); }

    /// Группировка по ядрам; указатели живут, пока жив этот объект.
    NucleusGroups groups() const { return NucleusAssignment::group(regions, numNuclei); }
};

/** Everything produced by the lipid-droplet workflow on one image. */
struct LipidAnalysis
{
    NucleusSegmentation nuclei;
    SpeciesResult green;
    SpeciesResult red;
    SpeciesResult colocalized;
    SpeciesResult diffuse;
    ColocalizationMetrics metrics; ///< red vs green over green ∪ red reconstructions
};

/** Everything produced by the ROS workflow on one image. */
struct RosAnalysis
{
    NucleusSegmentation nuclei;
    SpeciesResult punctate;
    SpeciesResult diffuse;
};

/**
 * @brief Per-image workflows built from the detectors.
 *
 * Stateless apart from the configuration, so one instance may be shared by
 * several worker threads.
 */
class ImageAnalyzer
{
public:
    explicit ImageAnalyzer(AnalysisConfig config = {});

    /**
     * @brief nuclei → green LDs → red LDs → colocalised LDs → diffuse LDs,
     *        then the red/green colocalisation statistics.
     * @param image  RGB float image in [0,1]
     * @throws InputShapeError on a non RGB image
     */
    LipidAnalysis analyzeLipidDroplets(const cv::Mat& image) const;

    /// nuclei → punctate ROS → diffuse ROS.
    RosAnalysis analyzeReactiveOxygen(const cv::Mat& image) const;

    /**
     * @brief Label a detection mask and attach nucleus ids, intensities and
     *        the size-coded reconstruction.
     *
     * Without nuclei no region is kept: the species reports zero objects.
     */
    static SpeciesResult buildSpecies(const std::string& name,
                                      const cv::Mat& mask,
                                      const cv::Mat& image,
                                      const NucleusSegmentation& nuclei,
                                      bool withRed = true);

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;
};

} // namespace cellquant

#endif // IMAGE_PROCESSING_HPP
