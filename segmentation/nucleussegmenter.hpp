#ifndef NUCLEUSSEGMENTER_H
#define NUCLEUSSEGMENTER_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "labelmapping.hpp"
#include "../config.hpp"

namespace cellquant {

/** Output of nucleus segmentation. */
struct NucleusSegmentation {
    cv::Mat1b                  mask;      ///< 255 inside accepted nuclei
    cv::Mat1i                  labels;    ///< 1..N, consistent with nuclei[i].id == i + 1
    std::vector<NucleusRecord> nuclei;
    cv::Mat1f                  enhanced;  ///< equalised nuclear channel

    int count() const { return static_cast<int>(nuclei.size()); }
};

/**
 * @brief Nucleus segmentation pipeline on the blue (DAPI) channel.
 *
 * equalise -> Otsu * scale -> fill holes -> remove small -> clear border ->
 * label -> drop nuclei centred near the border -> merge small fragments ->
 * polar boundary profile.
 */
class NucleusSegmenter {
public:
    explicit NucleusSegmenter(NucleusConfig config = {});

    /**
     * Segment nuclei of a 3-channel image (blue channel is used).
     * @throws InputShapeError if the image does not have 3 channels.
     */
    NucleusSegmentation segment(const cv::Mat& image) const;

    /** Segment nuclei of an already extracted nuclear channel in [0,1]. */
    NucleusSegmentation segmentChannel(const cv::Mat& channel) const;

    /** Boundary radius/angle profile relative to the centroid. */
    static void computePolarProfile(NucleusRecord& nucleus);

    const NucleusConfig& config() const { return config_; }

private:
    /** Keep regions whose centroid is at least borderMargin away from every edge. */
    std::vector<RegionRecord> excludeBorderCentroids(const std::vector<RegionRecord>& regions,
                                                     const cv::Size& size) const;
    /**
     * Large nuclei are kept; a small one (area < fraction * median) survives
     * only if its centroid is closer than mergeDist to a large nucleus.
     */
    cv::Mat1b mergeSmallNuclei(const std::vector<RegionRecord>& regions, const cv::Size& size) const;

    NucleusSegmentation finalize(const cv::Mat1b& mask, const cv::Mat1f& enhanced) const;

    NucleusConfig config_;
};

} // namespace cellquant

#endif // NUCLEUSSEGMENTER_H
