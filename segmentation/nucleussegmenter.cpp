#include "nucleussegmenter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>
#include "segmentation.hpp"
#include "../preparing/channelenhancer.hpp"
#include "../utils.hpp"

namespace cellquant {

NucleusSegmenter::NucleusSegmenter(NucleusConfig config)
    : config_(std::move(config))
{
}

NucleusSegmentation NucleusSegmenter::segment(const cv::Mat& image) const
{
    requireThreeChannels(image, "NucleusSegmenter::segment");
    return segmentChannel(ChannelEnhancer::extractChannel(image, Channel::Blue));
}

NucleusSegmentation NucleusSegmenter::segmentChannel(const cv::Mat& channel) const
{
    requireSingleChannel(channel, "NucleusSegmenter::segmentChannel");

    /* ─ 1. Контраст и бинаризация ─ */
    cv::Mat1f enhanced = ChannelEnhancer::equalize(channel, config_.clahe);
    const double level = Segmentation::otsuThreshold(enhanced) * config_.otsuScale;
    cv::Mat1b bw = enhanced > level;
    showMatDebug("Nuclei: binary", bw);

    /* ─ 2. Морфологическая очистка ─ */
    bw = Segmentation::fillHoles(bw);
    bw = Segmentation::removeSmallConnectedComponents(bw, "fixed", config_.minArea, 8);
    if (config_.clearBorder)
        bw = Segmentation::clearBorder(bw);

    /* ─ 3. Разметка и отбор по положению центроида ─ */
    LabeledRegions labeled = LabelMapping::labelRegions(bw);
    std::vector<RegionRecord> valid = excludeBorderCentroids(labeled.regions, bw.size());

    cv::Mat1b finalMask;
    if (config_.mergeSmall && valid.size() > 1)
        finalMask = mergeSmallNuclei(valid, bw.size());
    else
        finalMask = LabelMapping::maskFromRegions(valid, bw.size());

    NucleusSegmentation result = finalize(finalMask, enhanced);
    if (result.nuclei.empty())
        std::cerr << "[NucleusSegmenter] warning: no nuclei detected" << std::endl;
    else
        std::cout << "[NucleusSegmenter] " << result.count() << " nuclei" << std::endl;
    return result;
}

std::vector<RegionRecord> NucleusSegmenter::excludeBorderCentroids(const std::vector<RegionRecord>& regions,
                                                                   const cv::Size& size) const
{
    const double m = config_.borderMargin;
    std::vector<RegionRecord> kept;
    for (const auto& r : regions) {
        const cv::Point2d& c = r.centroid;
        if (c.x < m || c.x > size.width - 1 - m || c.y < m || c.y > size.height - 1 - m)
            continue;
        kept.push_back(r);
    }
    return kept;
}

cv::Mat1b NucleusSegmenter::mergeSmallNuclei(const std::vector<RegionRecord>& regions,
                                             const cv::Size& size) const
{
    std::vector<double> areas;
    for (const auto& r : regions)
        areas.push_back(r.area);
    std::sort(areas.begin(), areas.end());
    const size_t n = areas.size();
    const double median = (n % 2 == 1) ? areas[n / 2] : 0.5 * (areas[n / 2 - 1] + areas[n / 2]);
    const double areaThresh = config_.mergeAreaFraction * median;

    std::vector<RegionRecord> large, small;
    for (const auto& r : regions)
        (r.area < areaThresh ? small : large).push_back(r);

    std::vector<RegionRecord> merged = large;
    int absorbed = 0;
    for (const auto& s : small) {
        const bool nearLarge = std::any_of(large.begin(), large.end(), [&](const RegionRecord& l) {
            return cv::norm(l.centroid - s.centroid) < config_.mergeDist;
        });
        if (nearLarge) {
            merged.push_back(s);
            ++absorbed;
        }
    }
    if (!small.empty())
        std::cout << "[NucleusSegmenter] small fragments: " << small.size()
                  << ", merged: " << absorbed << std::endl;
    return LabelMapping::maskFromRegions(merged, size);
}

NucleusSegmentation NucleusSegmenter::finalize(const cv::Mat1b& mask, const cv::Mat1f& enhanced) const
{
    NucleusSegmentation result;
    result.mask = mask;
    result.enhanced = enhanced;

    LabeledRegions labeled = LabelMapping::labelRegions(mask);
    result.labels = labeled.labels;
    for (auto& r : labeled.regions) {
        NucleusRecord nucleus;
        static_cast<RegionRecord&>(nucleus) = std::move(r);

        double sum = 0.0;
        for (const auto& p : nucleus.pixels)
            sum += enhanced(p);
        nucleus.meanIntensity = nucleus.pixels.empty() ? 0.0 : sum / nucleus.pixels.size();

        computePolarProfile(nucleus);
        result.nuclei.push_back(std::move(nucleus));
    }
    return result;
}

void NucleusSegmenter::computePolarProfile(NucleusRecord& nucleus)
{
    nucleus.boundary.clear();
    nucleus.polarRadius.clear();
    nucleus.polarAngle.clear();
    if (nucleus.pixels.empty())
        return;

    // Локальная маска по bounding box с рамкой 1 px, контур в координатах кадра.
    const cv::Rect& bb = nucleus.boundingBox;
    const cv::Point offset(bb.x - 1, bb.y - 1);
    cv::Mat1b local = cv::Mat1b::zeros(bb.height + 2, bb.width + 2);
    for (const auto& p : nucleus.pixels)
        local(p - offset) = 255;
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(local, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE, offset);
    if (contours.empty())
        return;
    auto largest = std::max_element(contours.begin(), contours.end(),
                                    [](const auto& a, const auto& b) { return a.size() < b.size(); });

    nucleus.boundary = *largest;
    for (const auto& p : nucleus.boundary) {
        const double dx = p.x - nucleus.centroid.x;
        const double dy = p.y - nucleus.centroid.y;
        nucleus.polarRadius.push_back(std::hypot(dx, dy));
        nucleus.polarAngle.push_back(std::atan2(dy, dx) * 180.0 / CV_PI);
    }
}

} // namespace cellquant
