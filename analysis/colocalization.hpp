#ifndef COLOCALIZATION_H
#define COLOCALIZATION_H

#include <limits>
#include <opencv2/opencv.hpp>
#include <vector>
#include "../config.hpp"
#include "../segmentation/labelmapping.hpp"

namespace cellquant {

/** Two-channel intensity statistics over a mask; NaN when undefined. */
struct ColocalizationMetrics {
    double pearson   = std::numeric_limits<double>::quiet_NaN();
    double mandersM1 = std::numeric_limits<double>::quiet_NaN(); ///< share of channel A over B > 0
    double mandersM2 = std::numeric_limits<double>::quiet_NaN(); ///< share of channel B over A > 0
    double overlap   = std::numeric_limits<double>::quiet_NaN();
    double pValue    = std::numeric_limits<double>::quiet_NaN(); ///< permutation test on Pearson
};

/**
 * @brief Cross-channel colocalisation: object detection on two masks and
 *        intensity correlation statistics.
 */
class Colocalization {
public:
    explicit Colocalization(ColocalizationConfig config = colocalizationDefaults());

    /**
     * @brief Regions present in both masks.
     *
     * Both masks are dilated with a disk of dilateRadius, intersected, cleaned
     * (small components, holes) and shape filtered; the survivors are relabelled.
     * @throws InputShapeError if the masks differ in size
     */
    LabeledRegions detect(const cv::Mat& maskA, const cv::Mat& maskB) const;

    /**
     * @brief Pearson, Manders M1/M2, overlap coefficient and permutation p-value.
     *
     * Each channel is divided by its maximum before restricting to the mask.
     * An empty mask gives all-NaN metrics; a size mismatch throws InputShapeError.
     */
    ColocalizationMetrics metrics(const cv::Mat& channelA, const cv::Mat& channelB,
                                  const cv::Mat& mask) const;

    /** Pearson correlation; NaN for fewer than two samples or zero variance. */
    static double pearson(const std::vector<double>& a, const std::vector<double>& b);

    /// Uniformly random permutation of @p values in place.
    static void shuffleSamples(std::vector<double>& values, cv::RNG& rng);

    const ColocalizationConfig& config() const { return config_; }

private:
    ColocalizationConfig config_;
};

} // namespace cellquant

#endif // COLOCALIZATION_H
