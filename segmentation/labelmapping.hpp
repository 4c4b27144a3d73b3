#ifndef LABELMAPPING_H
#define LABELMAPPING_H

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>
#include "../utils.hpp"

namespace cellquant {

/**
 * @brief One detected object: nucleus, LD, ROS spot, diffuse or colocalised region.
 *
 * Coordinates are 0-based pixel coordinates (x = column, y = row).
 */
struct RegionRecord {
    int         id = 0;                 ///< label value in the owning label map
    cv::Point2d centroid;               ///< mean pixel position
    int         area = 0;               ///< pixel count
    double      perimeter = 0.0;        ///< length of the outer boundary
    double      eccentricity = 0.0;     ///< of the moment-equivalent ellipse
    double      solidity = 0.0;         ///< area / convexArea
    double      extent = 0.0;           ///< area / bounding box area
    double      equivDiameter = 0.0;    ///< diameter of the disk with the same area
    double      majorAxisLength = 0.0;
    double      minorAxisLength = 0.0;
    double      orientation = 0.0;      ///< degrees, counter-clockwise from the x axis
    cv::Rect    boundingBox;
    int         convexArea = 0;
    std::vector<cv::Point> pixels;      ///< owned pixel set

    std::optional<int>    assignedNucleusId;  ///< set by nucleus assignment
    std::optional<double> meanIntensityRed;
    std::optional<double> meanIntensityGreen;
    std::optional<double> meanIntensityColoc; ///< fraction of pixels under the coloc mask

    /** 4*pi*A / (P^2 + eps) */
    double circularity() const;
};

/**
 * @brief Nucleus with its polar boundary profile (diagnostic only).
 */
struct NucleusRecord : RegionRecord {
    double              meanIntensity = 0.0; ///< on the equalised nuclear channel
    std::vector<cv::Point> boundary;         ///< outer boundary points
    std::vector<double> polarRadius;         ///< distance of each boundary point to the centroid
    std::vector<double> polarAngle;          ///< atan2 angle in degrees, (-180, 180]
};

/** Label raster plus one record per label (records[i].id == i + 1). */
struct LabeledRegions {
    cv::Mat1i                 labels;    ///< 0 = background, 1..N
    std::vector<RegionRecord> regions;
    int count() const { return static_cast<int>(regions.size()); }
};

class LabelMapping {
public:
    /**
     * @brief 8-connected labelling of a binary mask with the full property set.
     *
     * Labels are contiguous 1..N, numbered by the raster-order position
     * (row-major) of each component's first pixel.
     * @throws InputShapeError if the mask is not a 2-D CV_8UC1 raster.
     */
    static LabeledRegions labelRegions(const cv::Mat& mask);

    /** Raster-order relabelling of an 8-connected mask; returns the number of labels. */
    static int labelComponents(const cv::Mat1b& mask, cv::Mat1i& labels);

    /** Records for labels 1..numLabels of an existing label raster. */
    static std::vector<RegionRecord> extractRegions(const cv::Mat1i& labels, int numLabels);

    /** Geometry of one pixel set. */
    static RegionRecord measureRegion(const std::vector<cv::Point>& pixels, int id);

    /** Paint the pixel sets of the records into a 0/255 mask of the given size. */
    static cv::Mat1b maskFromRegions(const std::vector<RegionRecord>& regions, const cv::Size& size);

    /** Paint records into a label raster using their ids. */
    static cv::Mat1i labelsFromRegions(const std::vector<RegionRecord>& regions, const cv::Size& size);
};

} // namespace cellquant

#endif // LABELMAPPING_H
