#ifndef REGIONFILTER_H
#define REGIONFILTER_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "../config.hpp"
#include "../segmentation/labelmapping.hpp"

namespace cellquant {

/**
 * @brief Conjunctive shape and nucleus-context predicates over labelled candidates.
 *
 * A region is kept only when every active predicate holds; there is no
 * partial acceptance.
 */
class RegionFilter {
public:
    /**
     * @brief Shannon entropy (bits) of the 256-bin histogram in a window x window
     *        neighbourhood of every pixel; borders are mirrored.
     * @param channel  single-channel image in [0,1]
     */
    static cv::Mat1f localEntropy(const cv::Mat& channel, int window = 9);

    /**
     * @brief Evaluate the shape predicates on one record.
     * @param entropy  normalised entropy map, required when minEntropy is set
     */
    static bool passesShape(const RegionRecord& region, const ShapeFilterConfig& config,
                            const cv::Mat1f& entropy = cv::Mat1f());

    /** Records of the labelled mask that pass every shape predicate. */
    static std::vector<RegionRecord> filterShape(const LabeledRegions& labeled,
                                                 const ShapeFilterConfig& config,
                                                 const cv::Mat1f& entropy = cv::Mat1f());

    /** Label a mask and keep only the components passing the shape predicates. */
    static cv::Mat1b applyShapeFilter(const cv::Mat& mask, const ShapeFilterConfig& config,
                                      const cv::Mat1f& entropy = cv::Mat1f());

    /**
     * @brief Remove nuclear overlap: whole regions (DiscardRegion) or only the
     *        shared pixels (ClipPixels).
     */
    static cv::Mat1b excludeNuclearOverlap(const cv::Mat& mask, const cv::Mat& nucMask,
                                           OverlapPolicy policy);

    /**
     * @brief Keep regions close enough to a nucleus.
     *
     * The distance of a region is the minimum Euclidean distance of its pixels to
     * the nuclear mask. With adaptiveBackground the bound is maxDistHighBg, or
     * maxDistLowBg when the mean of @p channel over a ring of ringRadius around the
     * region is at most backgroundThreshold; a region with an empty ring is dropped.
     * An empty mask or a mask without nuclei yields an empty result.
     */
    static cv::Mat1b filterByNucleusDistance(const cv::Mat& mask, const cv::Mat& nucMask,
                                             const cv::Mat& channel, const ContextFilterConfig& config);

    /**
     * @brief Overlap exclusion then distance filtering.
     *
     * An empty @p nucMask (no raster given) disables the context filter.
     * @throws InputShapeError if nucMask and mask differ in size.
     */
    static cv::Mat1b applyContextFilter(const cv::Mat& mask, const cv::Mat& nucMask,
                                        const cv::Mat& channel, const ContextFilterConfig& config);
};

} // namespace cellquant

#endif // REGIONFILTER_H
