#include "regionfilter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include "../segmentation/segmentation.hpp"
#include "../utils.hpp"

namespace cellquant {

cv::Mat1f RegionFilter::localEntropy(const cv::Mat& channel, int window)
{
    requireSingleChannel(channel, "RegionFilter::localEntropy");
    if (window < 1 || window % 2 == 0)
        throw std::invalid_argument("RegionFilter::localEntropy: window must be odd and positive");

    cv::Mat1b img8u;
    channel.convertTo(img8u, CV_8U, channel.depth() == CV_8U ? 1.0 : 255.0);

    const int half = window / 2;
    cv::Mat1b padded;
    cv::copyMakeBorder(img8u, padded, half, half, half, half, cv::BORDER_REFLECT);

    // H = log2(N) - (1/N) * sum(c * log2 c); сумма c*log2(c) обновляется
    // инкрементально при сдвиге окна вдоль строки.
    const double total = static_cast<double>(window) * window;
    std::vector<double> clogc(static_cast<size_t>(total) + 1, 0.0);
    for (size_t c = 1; c < clogc.size(); ++c)
        clogc[c] = c * std::log2(static_cast<double>(c));
    const double log2N = std::log2(total);

    cv::Mat1f entropy(img8u.size());
    std::vector<int> hist(256);
    for (int y = 0; y < img8u.rows; ++y) {
        std::fill(hist.begin(), hist.end(), 0);
        double acc = 0.0;
        auto add = [&](uchar v) {
            acc -= clogc[hist[v]];
            ++hist[v];
            acc += clogc[hist[v]];
        };
        auto remove = [&](uchar v) {
            acc -= clogc[hist[v]];
            --hist[v];
            acc += clogc[hist[v]];
        };

        for (int wy = 0; wy < window; ++wy)
            for (int wx = 0; wx < window; ++wx)
                add(padded(y + wy, wx));
        entropy(y, 0) = static_cast<float>(log2N - acc / total);

        for (int x = 1; x < img8u.cols; ++x) {
            for (int wy = 0; wy < window; ++wy) {
                remove(padded(y + wy, x - 1));
                add(padded(y + wy, x - 1 + window));
            }
            entropy(y, x) = static_cast<float>(std::max(0.0, log2N - acc / total));
        }
    }
    return entropy;
}

bool RegionFilter::passesShape(const RegionRecord& region, const ShapeFilterConfig& config,
                               const cv::Mat1f& entropy)
{
    if (region.area < config.minArea || region.area > config.maxArea)
        return false;
    if (config.minCircularity && !(region.circularity() > *config.minCircularity))
        return false;
    if (config.maxEccentricity && !(region.eccentricity < *config.maxEccentricity))
        return false;
    if (config.minSolidity && !(region.solidity > *config.minSolidity))
        return false;
    if (config.minEntropy) {
        if (entropy.empty())
            throw std::invalid_argument("RegionFilter::passesShape: entropy map required for minEntropy");
        double sum = 0.0;
        for (const auto& p : region.pixels)
            sum += entropy(p);
        const double mean = region.pixels.empty() ? 0.0 : sum / region.pixels.size();
        if (!(mean > *config.minEntropy))
            return false;
    }
    return true;
}

std::vector<RegionRecord> RegionFilter::filterShape(const LabeledRegions& labeled,
                                                    const ShapeFilterConfig& config,
                                                    const cv::Mat1f& entropy)
{
    std::vector<RegionRecord> kept;
    for (const auto& r : labeled.regions)
        if (passesShape(r, config, entropy))
            kept.push_back(r);
    return kept;
}

cv::Mat1b RegionFilter::applyShapeFilter(const cv::Mat& mask, const ShapeFilterConfig& config,
                                         const cv::Mat1f& entropy)
{
    LabeledRegions labeled = LabelMapping::labelRegions(mask);
    if (labeled.regions.empty())
        return cv::Mat1b::zeros(mask.size());

    std::vector<int> keep;
    for (const auto& r : labeled.regions)
        if (passesShape(r, config, entropy))
            keep.push_back(r.id);
    return Segmentation::keepLabels(labeled.labels, keep);
}

cv::Mat1b RegionFilter::excludeNuclearOverlap(const cv::Mat& mask, const cv::Mat& nucMask,
                                              OverlapPolicy policy)
{
    cv::Mat1b candidates = Segmentation::toMask(mask);
    cv::Mat1b nuclei = Segmentation::toMask(nucMask);
    requireSameSize("RegionFilter::excludeNuclearOverlap", candidates, nuclei);

    if (policy == OverlapPolicy::ClipPixels) {
        cv::Mat1b result;
        cv::bitwise_and(candidates, ~nuclei, result);
        return result;
    }

    cv::Mat1i labels;
    const int n = LabelMapping::labelComponents(candidates, labels);
    std::vector<bool> touches(n + 1, false);
    for (int y = 0; y < labels.rows; ++y)
        for (int x = 0; x < labels.cols; ++x)
            if (nuclei(y, x) && labels(y, x) > 0)
                touches[labels(y, x)] = true;

    std::vector<int> keep;
    for (int l = 1; l <= n; ++l)
        if (!touches[l]) keep.push_back(l);
    return Segmentation::keepLabels(labels, keep);
}

cv::Mat1b RegionFilter::filterByNucleusDistance(const cv::Mat& mask, const cv::Mat& nucMask,
                                                const cv::Mat& channel, const ContextFilterConfig& config)
{
    cv::Mat1b candidates = Segmentation::toMask(mask);
    cv::Mat1b result = cv::Mat1b::zeros(candidates.size());
    if (cv::countNonZero(candidates) == 0)
        return result;

    cv::Mat1b nuclei = Segmentation::toMask(nucMask);
    requireSameSize("RegionFilter::filterByNucleusDistance", candidates, nuclei);
    if (cv::countNonZero(nuclei) == 0) {
        std::cerr << "[RegionFilter] warning: no nuclei, all candidates rejected by distance" << std::endl;
        return result;
    }

    cv::Mat1f channel32;
    if (config.adaptiveBackground) {
        requireSingleChannel(channel, "RegionFilter::filterByNucleusDistance");
        requireSameSize("RegionFilter::filterByNucleusDistance", candidates, channel);
        channel.convertTo(channel32, CV_32F);
    }

    // Расстояние каждого пикселя до ближайшего пикселя ядра.
    cv::Mat1b notNuclei = nuclei == 0;
    cv::Mat1f dist;
    cv::distanceTransform(notNuclei, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE, CV_32F);

    LabeledRegions labeled = LabelMapping::labelRegions(candidates);
    const cv::Rect frame(0, 0, candidates.cols, candidates.rows);
    const cv::Mat ringKernel = Segmentation::diskKernel(config.ringRadius);

    std::vector<int> keep;
    for (const auto& r : labeled.regions) {
        double minDist = std::numeric_limits<double>::infinity();
        for (const auto& p : r.pixels)
            minDist = std::min(minDist, static_cast<double>(dist(p)));

        if (!config.adaptiveBackground) {
            if (minDist <= config.maxDist)
                keep.push_back(r.id);
            continue;
        }

        /* ── фоновое кольцо вокруг объекта ── */
        const int pad = config.ringRadius;
        cv::Rect roi(r.boundingBox.x - pad, r.boundingBox.y - pad,
                     r.boundingBox.width + 2 * pad, r.boundingBox.height + 2 * pad);
        roi &= frame;
        cv::Mat1b object = cv::Mat1b::zeros(roi.size());
        for (const auto& p : r.pixels)
            object(p - roi.tl()) = 255;
        cv::Mat1b dilated;
        cv::dilate(object, dilated, ringKernel, cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        cv::Mat1b ring = dilated & ~object;
        if (cv::countNonZero(ring) == 0)
            continue;
        const double ringMean = cv::mean(channel32(roi), ring)[0];

        if (minDist <= config.maxDistHighBg ||
            (minDist <= config.maxDistLowBg && ringMean <= config.backgroundThreshold))
            keep.push_back(r.id);
    }
    return Segmentation::keepLabels(labeled.labels, keep);
}

cv::Mat1b RegionFilter::applyContextFilter(const cv::Mat& mask, const cv::Mat& nucMask,
                                           const cv::Mat& channel, const ContextFilterConfig& config)
{
    cv::Mat1b result = Segmentation::toMask(mask);
    if (nucMask.empty())
        return result;
    requireSameSize("RegionFilter::applyContextFilter", result, nucMask);

    if (config.excludeNuclearOverlap)
        result = excludeNuclearOverlap(result, nucMask, config.overlapPolicy);
    if (config.distanceFilter)
        result = filterByNucleusDistance(result, nucMask, channel, config);
    return result;
}

} // namespace cellquant
