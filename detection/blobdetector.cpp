#include "blobdetector.hpp"

#include <cmath>
#include <iostream>
#include <utility>
#include "regionfilter.hpp"
#include "../preparing/channelenhancer.hpp"
#include "../segmentation/labelmapping.hpp"
#include "../segmentation/segmentation.hpp"
#include "../utils.hpp"

namespace cellquant {

BlobDetector::BlobDetector(BlobDetectorConfig config, Channel channel)
    : config_(std::move(config)), channel_(channel)
{
}

BlobDetector BlobDetector::greenLipid(const BlobDetectorConfig& config)
{
    return BlobDetector(config, Channel::Green);
}

BlobDetector BlobDetector::redLipid(const BlobDetectorConfig& config)
{
    return BlobDetector(config, Channel::Red);
}

BlobDetector BlobDetector::reactiveOxygen(const BlobDetectorConfig& config)
{
    return BlobDetector(config, Channel::Green);
}

BlobDetection BlobDetector::detect(const cv::Mat& image, const cv::Mat& nucMask) const
{
    requireThreeChannels(image, "BlobDetector::detect");
    return detectChannel(ChannelEnhancer::extractChannel(image, channel_), nucMask);
}

BlobDetection BlobDetector::detectChannel(const cv::Mat& channel, const cv::Mat& nucMask) const
{
    requireSingleChannel(channel, "BlobDetector::detectChannel");
    if (!nucMask.empty()) {
        requireSingleChannel(nucMask, "BlobDetector::detectChannel");
        requireSameSize("BlobDetector::detectChannel", channel, nucMask);
    }

    cv::Mat1f raw;
    channel.convertTo(raw, CV_32F);

    /* ─ 1. Контраст и вычитание фона ─ */
    cv::Mat1f equalized = config_.enhancer.equalize
                              ? ChannelEnhancer::equalize(raw, config_.enhancer.clahe)
                              : raw.clone();
    cv::Mat1f enhanced = ChannelEnhancer::subtractBackground(equalized, config_.enhancer);
    showMatDebug("Blob: enhanced", enhanced);

    cv::Mat1f entropy;
    if (config_.shape.minEntropy)
        entropy = Segmentation::normalizeRange(RegionFilter::localEntropy(equalized, config_.shape.entropyWindow));

    /* ─ 2. DoG-ветка ─ */
    BlobDetection result;
    result.response = differenceOfGaussians(enhanced, config_.dog);
    cv::Mat1b bw = cleanup(thresholdResponse(result.response, config_.dog), config_.cleanup);
    result.dogMask = filterBranch(bw, nucMask, entropy);

    /* ─ 3. SDOG-ветка и объединение ─ */
    cv::Mat1b candidates = result.dogMask;
    if (config_.useSteerable) {
        cv::Mat1f sdog = steerableResponse(raw, config_.sdog.sigma);
        const double level = Segmentation::otsuThreshold(sdog) + config_.sdog.offset;
        cv::Mat1b sbw = cleanup(sdog > level, config_.cleanup);
        result.sdogMask = filterBranch(sbw, nucMask, entropy);
        candidates = combineDetections(result.dogMask, result.sdogMask, raw,
                                       config_.combineIntensityThreshold);
    }

    /* ─ 4. Расстояние до ядра (и фон вокруг объекта) ─ */
    if (!nucMask.empty() && config_.context.distanceFilter)
        candidates = RegionFilter::filterByNucleusDistance(candidates, nucMask, raw, config_.context);

    result.mask = candidates;
    showMatDebug("Blob: final", result.mask);
    return result;
}

cv::Mat1b BlobDetector::filterBranch(const cv::Mat1b& mask, const cv::Mat& nucMask,
                                     const cv::Mat1f& entropy) const
{
    cv::Mat1b filtered = RegionFilter::applyShapeFilter(mask, config_.shape, entropy);
    if (!nucMask.empty() && config_.context.excludeNuclearOverlap)
        filtered = RegionFilter::excludeNuclearOverlap(filtered, nucMask, config_.context.overlapPolicy);
    return filtered;
}

cv::Mat1f BlobDetector::differenceOfGaussians(const cv::Mat& channel, const DoGConfig& config)
{
    requireSingleChannel(channel, "BlobDetector::differenceOfGaussians");
    if (!(config.sigmaSmall > 0.0) || !(config.sigmaLarge > config.sigmaSmall))
        throw std::invalid_argument("BlobDetector: DoG requires 0 < sigmaSmall < sigmaLarge");

    cv::Mat1f src = ChannelEnhancer::gaussian(channel, config.preSmoothSigma);
    cv::Mat1f dog = ChannelEnhancer::gaussian(src, config.sigmaSmall) -
                    ChannelEnhancer::gaussian(src, config.sigmaLarge);
    return Segmentation::normalizeRange(dog);
}

cv::Mat1b BlobDetector::thresholdResponse(const cv::Mat1f& response, const DoGConfig& config)
{
    double level = 0.0;
    switch (config.method) {
    case ThresholdMethod::Otsu:
        level = Segmentation::otsuThreshold(response);
        break;
    case ThresholdMethod::Percentile:
        level = Segmentation::percentile(response, config.percentile);
        break;
    }
    cv::Mat1b bw = response > (level + config.offset);
    return bw;
}

cv::Mat1f BlobDetector::steerableResponse(const cv::Mat& channel, double sigma)
{
    requireSingleChannel(channel, "BlobDetector::steerableResponse");
    if (!(sigma > 0.0))
        throw std::invalid_argument("BlobDetector::steerableResponse: sigma must be positive");

    cv::Mat1f src;
    channel.convertTo(src, CV_32F);

    /* ── ядра производных гауссианы на сетке [-ceil(3σ), ceil(3σ)] ── */
    const int half = static_cast<int>(std::ceil(3.0 * sigma));
    const int side = 2 * half + 1;
    const double s2 = sigma * sigma, s4 = s2 * s2;
    cv::Mat1f gx(side, side), gy(side, side), gxx(side, side), gyy(side, side), gxy(side, side);
    for (int row = 0; row < side; ++row) {
        const double y = row - half;
        for (int col = 0; col < side; ++col) {
            const double x = col - half;
            const double g = std::exp(-(x * x + y * y) / (2.0 * s2)) / (2.0 * CV_PI * s2);
            gx(row, col)  = static_cast<float>(-x * g / s2);
            gy(row, col)  = static_cast<float>(-y * g / s2);
            gxx(row, col) = static_cast<float>((x * x - s2) * g / s4);
            gyy(row, col) = static_cast<float>((y * y - s2) * g / s4);
            gxy(row, col) = static_cast<float>(x * y * g / s4);
        }
    }

    // filter2D - корреляция, как и требуется для этих ядер.
    auto apply = [&](const cv::Mat1f& kernel) {
        cv::Mat1f out;
        cv::filter2D(src, out, CV_32F, kernel, cv::Point(-1, -1), 0.0, cv::BORDER_REPLICATE);
        return out;
    };
    cv::Mat1f ix = apply(gx), iy = apply(gy);
    cv::Mat1f ixx = apply(gxx), iyy = apply(gyy), ixy = apply(gxy);

    cv::Mat1f magnitude;
    cv::magnitude(ix, iy, magnitude);

    /* ── собственные числа гессиана ── */
    cv::Mat1f trace = ixx + iyy;
    cv::Mat1f det = ixx.mul(iyy) - ixy.mul(ixy);
    cv::Mat1f disc = trace.mul(trace) * 0.25 - det;
    cv::max(disc, 0.0, disc);
    cv::sqrt(disc, disc);
    cv::Mat1f lambda1 = cv::abs(trace * 0.5 + disc);
    cv::Mat1f lambda2 = cv::abs(trace * 0.5 - disc);
    cv::Mat1f maxEig;
    cv::max(lambda1, lambda2, maxEig);

    return Segmentation::normalizeRange(magnitude.mul(maxEig));
}

cv::Mat1b BlobDetector::cleanup(const cv::Mat& mask, const CleanupConfig& config)
{
    cv::Mat1b bw = Segmentation::removeSmallConnectedComponents(mask, "fixed", config.minPixels, 8);
    bw = Segmentation::closeDisk(bw, config.closeRadius);
    if (config.fillHoles)
        bw = Segmentation::fillHoles(bw);
    return bw;
}

cv::Mat1b BlobDetector::combineDetections(const cv::Mat& dogMask, const cv::Mat& sdogMask,
                                          const cv::Mat& rawChannel, double intensityThreshold)
{
    cv::Mat1b a = Segmentation::toMask(dogMask);
    cv::Mat1b b = Segmentation::toMask(sdogMask);
    requireSameSize("BlobDetector::combineDetections", a, b, rawChannel);

    cv::Mat1b intersection = a & b;
    cv::Mat1b exclusive = a ^ b;

    cv::Mat1f raw;
    rawChannel.convertTo(raw, CV_32F);

    LabeledRegions labeled = LabelMapping::labelRegions(exclusive);
    std::vector<int> keep;
    for (const auto& r : labeled.regions) {
        double sum = 0.0;
        for (const auto& p : r.pixels)
            sum += raw(p);
        if (!r.pixels.empty() && sum / r.pixels.size() > intensityThreshold)
            keep.push_back(r.id);
    }

    cv::Mat1b combined = intersection | Segmentation::keepLabels(labeled.labels, keep);
    return combined;
}

} // namespace cellquant
