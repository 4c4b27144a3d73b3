#ifndef BLOBDETECTOR_H
#define BLOBDETECTOR_H

#include <opencv2/opencv.hpp>
#include "../config.hpp"

namespace cellquant {

/** Intermediate and final masks of one detector run. */
struct BlobDetection {
    cv::Mat1b mask;      ///< final candidate mask
    cv::Mat1b dogMask;   ///< DoG branch after cleanup, shape and overlap filtering
    cv::Mat1b sdogMask;  ///< SDOG branch (empty unless useSteerable)
    cv::Mat1f response;  ///< normalised DoG response
};

/**
 * @brief Punctate-object detector: band-pass filtering, global threshold,
 *        morphological cleanup and shape/context filtering on one channel.
 *
 * With useSteerable a second, Gaussian-derivative response is thresholded
 * independently and both masks are merged by combineDetections().
 */
class BlobDetector {
public:
    BlobDetector(BlobDetectorConfig config, Channel channel);

    /** Green-channel lipid droplets. */
    static BlobDetector greenLipid(const BlobDetectorConfig& config = greenLipidDefaults());
    /** Red-channel lipid droplets (DoG + SDOG). */
    static BlobDetector redLipid(const BlobDetectorConfig& config = redLipidDefaults());
    /** Punctate ROS in the green channel. */
    static BlobDetector reactiveOxygen(const BlobDetectorConfig& config = rosDefaults());

    /**
     * @brief Detect candidates in the configured channel of a 3-channel image.
     * @param nucMask  nuclear mask of the same size, or empty to skip context filtering
     * @throws InputShapeError on a non-3-channel image or a nucMask size mismatch
     */
    BlobDetection detect(const cv::Mat& image, const cv::Mat& nucMask = cv::Mat()) const;

    /** Same as detect() on an already extracted channel in [0,1]. */
    BlobDetection detectChannel(const cv::Mat& channel, const cv::Mat& nucMask = cv::Mat()) const;

    /** Normalised [0,1] difference of Gaussians (optional pre-smoothing). */
    static cv::Mat1f differenceOfGaussians(const cv::Mat& channel, const DoGConfig& config);

    /** response > level, level from Otsu or a percentile, plus offset. */
    static cv::Mat1b thresholdResponse(const cv::Mat1f& response, const DoGConfig& config);

    /**
     * @brief Normalised steerable response: gradient magnitude times the largest
     *        absolute Hessian eigenvalue at scale sigma (replicated borders).
     */
    static cv::Mat1f steerableResponse(const cv::Mat& channel, double sigma);

    /** Remove small components, close with a disk, fill holes. */
    static cv::Mat1b cleanup(const cv::Mat& mask, const CleanupConfig& config);

    /**
     * @brief Intersection of both masks plus the objects found by exactly one
     *        method whose mean @p rawChannel intensity exceeds intensityThreshold.
     */
    static cv::Mat1b combineDetections(const cv::Mat& dogMask, const cv::Mat& sdogMask,
                                       const cv::Mat& rawChannel, double intensityThreshold);

    const BlobDetectorConfig& config() const { return config_; }
    Channel channel() const { return channel_; }

private:
    /** Shape filter then nuclear-overlap exclusion for one branch. */
    cv::Mat1b filterBranch(const cv::Mat1b& mask, const cv::Mat& nucMask,
                           const cv::Mat1f& entropy) const;

    BlobDetectorConfig config_;
    Channel            channel_;
};

} // namespace cellquant

#endif // BLOBDETECTOR_H
