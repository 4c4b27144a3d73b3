#include "intensity.hpp"

#include "../config.hpp"
#include "../preparing/channelenhancer.hpp"
#include "../segmentation/segmentation.hpp"
#include "../utils.hpp"

namespace cellquant {

std::optional<double> IntensityMeasurement::meanOver(const cv::Mat& channel,
                                                     const std::vector<cv::Point>& pixels)
{
    requireSingleChannel(channel, "IntensityMeasurement::meanOver");
    cv::Mat1f values;
    if (channel.type() == CV_32FC1)
        values = channel;
    else
        channel.convertTo(values, CV_32F);

    const cv::Rect frame(0, 0, values.cols, values.rows);
    double sum = 0.0;
    size_t n = 0;
    for (const auto& p : pixels) {
        if (!frame.contains(p))
            continue;
        sum += values(p);
        ++n;
    }
    if (n == 0)
        return std::nullopt;
    return sum / n;
}

void IntensityMeasurement::addChannelIntensities(std::vector<RegionRecord>& regions, const cv::Mat& image,
                                                 bool withRed)
{
    requireThreeChannels(image, "IntensityMeasurement::addChannelIntensities");
    const cv::Mat1f green = ChannelEnhancer::extractChannel(image, Channel::Green);
    cv::Mat1f red;
    if (withRed)
        red = ChannelEnhancer::extractChannel(image, Channel::Red);

    for (auto& r : regions) {
        if (r.pixels.empty())
            continue;
        r.meanIntensityGreen = meanOver(green, r.pixels);
        if (withRed)
            r.meanIntensityRed = meanOver(red, r.pixels);
    }
}

void IntensityMeasurement::addColocalizationCoverage(std::vector<RegionRecord>& regions,
                                                     const cv::Mat& colocMask)
{
    cv::Mat1b mask = Segmentation::toMask(colocMask);
    cv::Mat1f coverage;
    mask.convertTo(coverage, CV_32F, 1.0 / 255.0);
    for (auto& r : regions) {
        if (r.pixels.empty())
            continue;
        r.meanIntensityColoc = meanOver(coverage, r.pixels);
    }
}

} // namespace cellquant
