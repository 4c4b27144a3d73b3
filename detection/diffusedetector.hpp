#ifndef DIFFUSEDETECTOR_H
#define DIFFUSEDETECTOR_H

#include <opencv2/opencv.hpp>
#include <vector>
#include "../config.hpp"

namespace cellquant {

/** Result of the intensity-clustering detector. */
struct DiffuseDetection {
    cv::Mat1b           mask;              ///< brightest-cluster regions after cleanup
    std::vector<double> centers;           ///< final cluster centres, ascending
    bool                converged = true;  ///< false if the refinement hit maxIterations
    int                 iterations = 0;    ///< refinement iterations over the full image
};

/**
 * @brief Detector for soft-edged high-intensity regions.
 *
 * Grey conversion, contrast stretch, k-means on the intensities (centres
 * initialised on a random sample of the pixels above a minimum, then refined
 * on every pixel of the image), brightest cluster, small-object removal and
 * closing.
 */
class DiffuseDetector {
public:
    explicit DiffuseDetector(DiffuseDetectorConfig config = {});

    static DiffuseDetector lipid(const DiffuseDetectorConfig& config = diffuseLipidDefaults());
    static DiffuseDetector reactiveOxygen(const DiffuseDetectorConfig& config = diffuseRosDefaults());

    /**
     * @brief Detect diffuse regions of a 3-channel image.
     * @param nucMask  nuclear mask of the same size, or empty to skip context filtering
     * @throws InputShapeError on a non-3-channel image or a nucMask size mismatch
     */
    DiffuseDetection detect(const cv::Mat& image, const cv::Mat& nucMask = cv::Mat()) const;

    /** Same as detect() on a contrast-stretched grey image in [0,1]. */
    DiffuseDetection detectGray(const cv::Mat& gray, const cv::Mat& nucMask = cv::Mat()) const;

    /**
     * @brief 1-D k-means: centres from cv::kmeans on a sample of @p seeds, then
     *        Lloyd iterations over @p values until no assignment changes.
     * @param labels  out: cluster of each value, indexing the returned centres;
     *                the last assignment when the budget runs out
     * @return centres sorted ascending
     */
    std::vector<double> clusterIntensities(const std::vector<float>& seeds,
                                           const std::vector<float>& values,
                                           std::vector<int>& labels,
                                           bool& converged, int& iterations) const;

    const DiffuseDetectorConfig& config() const { return config_; }

private:
    DiffuseDetectorConfig config_;
};

} // namespace cellquant

#endif // DIFFUSEDETECTOR_H
