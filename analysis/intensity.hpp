#ifndef INTENSITY_H
#define INTENSITY_H

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>
#include "../segmentation/labelmapping.hpp"

namespace cellquant {

/**
 * @brief Per-object photometry on the normalised raw channels.
 */
class IntensityMeasurement {
public:
    /** Mean of a single-channel image over a pixel set; nullopt for an empty set. */
    static std::optional<double> meanOver(const cv::Mat& channel, const std::vector<cv::Point>& pixels);

    /**
     * @brief Fill meanIntensityRed / meanIntensityGreen of every record.
     * @param image  3-channel RGB image in [0,1]
     * @param withRed  false for dyes measured in green only (ROS)
     */
    static void addChannelIntensities(std::vector<RegionRecord>& regions, const cv::Mat& image,
                                      bool withRed = true);

    /** meanIntensityColoc = fraction of the record's pixels set in colocMask. */
    static void addColocalizationCoverage(std::vector<RegionRecord>& regions, const cv::Mat& colocMask);
};

} // namespace cellquant

#endif // INTENSITY_H
