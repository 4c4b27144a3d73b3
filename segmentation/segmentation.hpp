#ifndef SEGMENTATION_H
#define SEGMENTATION_H

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "../utils.hpp"

namespace cellquant {

/**
 * @brief Collection of static binary-morphology and threshold helpers.
 *
 * Masks are CV_8UC1 with 0 = background and 255 = foreground; any non-zero
 * input pixel is treated as foreground.
 */
class Segmentation {
public:
    /** Remove small connected components from a binary image.
     *  @param method  "fixed" (min_size), "mean" or "median" of component sizes
     *  @return        CV_8UC1 mask keeping components with size >= threshold */
    static cv::Mat1b removeSmallConnectedComponents(const cv::Mat& src, const std::string& method = "fixed",
                                                    int min_size = 1, int connectivity = 8, bool debug = false);

    /** Fill background regions not reachable from the image border. */
    static cv::Mat1b fillHoles(const cv::Mat& mask);

    /** Remove every 8-connected component touching the image border. */
    static cv::Mat1b clearBorder(const cv::Mat& mask);

    /** Disk structuring element of the given radius (radius 0 = single pixel). */
    static cv::Mat diskKernel(int radius);

    static cv::Mat1b closeDisk(const cv::Mat& mask, int radius);
    static cv::Mat1b dilateDisk(const cv::Mat& mask, int radius);
    /** Grey-level opening with a disk; keeps the input depth. */
    static cv::Mat openDisk(const cv::Mat& src, int radius);

    /** Linear remap of min..max to [0,1] (CV_32F). A constant image maps to zeros. */
    static cv::Mat1f normalizeRange(const cv::Mat& src);

    /** Otsu level of a [0,1] image on a 256-bin histogram, returned in [0,1]. */
    static double otsuThreshold(const cv::Mat& img01);

    /** p-th percentile (0..100) with linear interpolation between order statistics. */
    static double percentile(const cv::Mat& src, double p);

    /** Binary mask of pixels whose label is in keep. */
    static cv::Mat1b keepLabels(const cv::Mat1i& labels, const std::vector<int>& keep);

    /** Foreground of src as 0/255 CV_8UC1. */
    static cv::Mat1b toMask(const cv::Mat& src);
};

} // namespace cellquant

#endif // SEGMENTATION_H
