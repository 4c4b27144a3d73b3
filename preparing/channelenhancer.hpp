#ifndef CHANNELENHANCER_H
#define CHANNELENHANCER_H

#include <opencv2/core.hpp>
#include "../config.hpp"

namespace cellquant {

/**
 * @brief Contrast and background normalisation of single fluorescence channels.
 *
 * Every routine takes a single-channel image with values in [0,1] and
 * returns a new CV_32F image; the input is never modified.
 */
class ChannelEnhancer {
public:
    /** Copy one channel of a 3-channel image as CV_32F. */
    static cv::Mat1f extractChannel(const cv::Mat& image, Channel channel);

    /** Luminance of an RGB image (0.299 R + 0.587 G + 0.114 B). */
    static cv::Mat1f toGray(const cv::Mat& image);

    /** Tile-based contrast-limited adaptive histogram equalisation. */
    static cv::Mat1f equalize(const cv::Mat& channel, const ClaheConfig& config);

    /** Subtract the configured background estimate, clipping negatives to 0. */
    static cv::Mat1f subtractBackground(const cv::Mat& channel, const EnhancerConfig& config);

    /** equalize() followed by subtractBackground(). */
    static cv::Mat1f enhance(const cv::Mat& channel, const EnhancerConfig& config);

    /**
     * Full-range remap saturating the lowFraction darkest and
     * (1 - highFraction) brightest pixels.
     */
    static cv::Mat1f contrastStretch(const cv::Mat& channel, double lowFraction = 0.01,
                                     double highFraction = 0.99);

    /** Gaussian blur with replicated borders; sigma <= 0 returns a copy. */
    static cv::Mat1f gaussian(const cv::Mat& channel, double sigma);
};

} // namespace cellquant

#endif // CHANNELENHANCER_H
