#pragma once
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "segmentation/labelmapping.hpp"
#include "utils.hpp"

namespace cellquant {

/** Radius tier of a reconstructed object. */
enum class SizeTier { Small, Medium, Large };

/// r <= 2 -> Small, r <= 4 -> Medium, иначе Large.
inline SizeTier sizeTier(int radius)
{
    if (radius <= 2) return SizeTier::Small;
    if (radius <= 4) return SizeTier::Medium;
    return SizeTier::Large;
}

/// BGR-цвет уровня: синий / зелёный / красный.
inline cv::Vec3b tierColor(SizeTier tier)
{
    switch (tier) {
    case SizeTier::Small:  return cv::Vec3b(255, 0, 0);
    case SizeTier::Medium: return cv::Vec3b(0, 255, 0);
    case SizeTier::Large:  return cv::Vec3b(0, 0, 255);
    }
    return cv::Vec3b(255, 255, 255);
}

/// Радиус круга той же площади, округлённый вверх.
inline int reconstructionRadius(double area)
{
    return static_cast<int>(std::ceil(std::sqrt(area / CV_PI)));
}

/** Size-coded reconstruction of a record list. */
struct ReconstructedMask {
    cv::Mat1b mask;   ///< union of all disks
    cv::Mat3b color;  ///< BGR, tier colour of the last disk drawn on each pixel
};

/**
 * @brief Draw a filled disk of radius ceil(sqrt(A/pi)) at every rounded centroid.
 *
 * Pixel (x,y) belongs to a disk when dx^2 + dy^2 <= r^2. Records with zero
 * area are skipped; disks are clipped to the canvas.
 */
inline ReconstructedMask reconstructFromRecords(const std::vector<RegionRecord>& records,
                                                const cv::Size& size)
{
    ReconstructedMask out;
    out.mask = cv::Mat1b::zeros(size);
    out.color = cv::Mat3b::zeros(size);

    for (const auto& rec : records) {
        if (rec.area <= 0)
            continue;
        const int r = reconstructionRadius(rec.area);
        const int cx = static_cast<int>(std::lround(rec.centroid.x));
        const int cy = static_cast<int>(std::lround(rec.centroid.y));
        const cv::Vec3b color = tierColor(sizeTier(r));

        for (int dy = -r; dy <= r; ++dy) {
            const int y = cy + dy;
            if (y < 0 || y >= size.height) continue;
            for (int dx = -r; dx <= r; ++dx) {
                const int x = cx + dx;
                if (x < 0 || x >= size.width) continue;
                if (dx * dx + dy * dy > r * r) continue;
                out.mask(y, x) = 255;
                out.color(y, x) = color;
            }
        }
    }
    return out;
}

/// RGB [0,1] (или 8U) -> BGR 8U для записи/показа.
inline cv::Mat3b toBgr8(const cv::Mat& image)
{
    cv::Mat img8u;
    if (image.depth() == CV_8U)
        img8u = image;
    else
        image.convertTo(img8u, CV_8U, 255.0);

    cv::Mat3b bgr;
    if (img8u.channels() == 1)
        cv::cvtColor(img8u, bgr, cv::COLOR_GRAY2BGR);
    else
        cv::cvtColor(img8u, bgr, cv::COLOR_RGB2BGR);
    return bgr;
}

/**
 * @brief Blend a label map over an image, one parula colour per label.
 *
 * @param labels        CV_32S label raster, 0 = background
 * @param image         RGB source in [0,1] (or 8-bit), 1 or 3 channels
 * @param transparency  weight of the source image on labelled pixels (0..1)
 * @return              BGR overlay
 */
inline cv::Mat3b labelOverlay(const cv::Mat1i& labels,
                              const cv::Mat& image,
                              double transparency = 0.5,
                              int colormap = cv::COLORMAP_PARULA)
{
    CV_Assert(!labels.empty() && labels.size() == image.size());
    cv::Mat3b base = toBgr8(image);

    double minVal, maxVal;
    cv::minMaxLoc(labels, &minVal, &maxVal);
    const int numLabels = static_cast<int>(maxVal);
    if (numLabels <= 0)
        return base;

    /* 1.  палитра: numLabels цветов, равномерно по colormap ---------------- */
    cv::Mat1b ramp(1, numLabels);
    for (int i = 0; i < numLabels; ++i)
        ramp(0, i) = static_cast<uchar>(numLabels > 1 ? std::lround(255.0 * i / (numLabels - 1)) : 0);
    cv::Mat3b palette;
    cv::applyColorMap(ramp, palette, colormap);

    /* 2.  смешиваем только там, где есть метка ----------------------------- */
    cv::Mat3b out = base.clone();
    const double a = std::clamp(transparency, 0.0, 1.0);
    for (int y = 0; y < labels.rows; ++y)
        for (int x = 0; x < labels.cols; ++x) {
            const int l = labels(y, x);
            if (l <= 0) continue;
            const cv::Vec3b& c = palette(0, l - 1);
            const cv::Vec3b& b = base(y, x);
            for (int k = 0; k < 3; ++k)
                out(y, x)[k] = cv::saturate_cast<uchar>(a * b[k] + (1.0 - a) * c[k]);
        }
    return out;
}

/**
 * @brief 100x300 legend: small / medium / large disks (radius 15) with captions.
 */
inline cv::Mat3b createSizeLegendImage()
{
    cv::Mat3b legend = cv::Mat3b::zeros(100, 300);
    const char* captions[] = {"Small (1x)", "Medium (2x)", "Large (3x)"};
    const SizeTier tiers[] = {SizeTier::Small, SizeTier::Medium, SizeTier::Large};
    const int radius = 15;

    for (int i = 0; i < 3; ++i) {
        const cv::Point center(50 + i * 100, 50);
        const cv::Vec3b c = tierColor(tiers[i]);
        for (int y = center.y - radius; y <= center.y + radius; ++y)
            for (int x = center.x - radius; x <= center.x + radius; ++x) {
                const int dx = x - center.x, dy = y - center.y;
                if (dx * dx + dy * dy <= radius * radius)
                    legend(y, x) = c;
            }

        int baseline = 0;
        const double scale = 0.4;
        cv::Size ts = cv::getTextSize(captions[i], cv::FONT_HERSHEY_SIMPLEX, scale, 1, &baseline);
        cv::putText(legend, captions[i], cv::Point(center.x - ts.width / 2, 88),
                    cv::FONT_HERSHEY_SIMPLEX, scale, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    }
    return legend;
}

} // namespace cellquant
