#include "channelenhancer.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>
#include "../segmentation/segmentation.hpp"
#include "../utils.hpp"

namespace cellquant {

cv::Mat1f ChannelEnhancer::extractChannel(const cv::Mat& image, Channel channel)
{
    requireThreeChannels(image, "ChannelEnhancer::extractChannel");
    cv::Mat plane;
    cv::extractChannel(image, plane, static_cast<int>(channel));
    cv::Mat1f result;
    plane.convertTo(result, CV_32F);
    return result;
}

cv::Mat1f ChannelEnhancer::toGray(const cv::Mat& image)
{
    requireThreeChannels(image, "ChannelEnhancer::toGray");
    cv::Mat img32;
    image.convertTo(img32, CV_32FC3);
    cv::Mat1f gray;
    cv::cvtColor(img32, gray, cv::COLOR_RGB2GRAY);
    return gray;
}

cv::Mat1f ChannelEnhancer::equalize(const cv::Mat& channel, const ClaheConfig& config)
{
    requireSingleChannel(channel, "ChannelEnhancer::equalize");
    if (config.tilesX < 1 || config.tilesY < 1)
        throw std::invalid_argument("ChannelEnhancer::equalize: tile grid must be positive");

    cv::Mat ch8u;
    channel.convertTo(ch8u, CV_8U, 255.0);

    // Нормированный clip limit -> кратность среднего заполнения бина (256 бинов).
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(config.clipLimit * 256.0,
                                               cv::Size(config.tilesX, config.tilesY));
    cv::Mat eq8u;
    clahe->apply(ch8u, eq8u);

    cv::Mat1f result;
    eq8u.convertTo(result, CV_32F, 1.0 / 255.0);
    return result;
}

cv::Mat1f ChannelEnhancer::gaussian(const cv::Mat& channel, double sigma)
{
    cv::Mat1f src;
    channel.convertTo(src, CV_32F);
    if (sigma <= 0.0)
        return src.clone();
    const int k = getKernelSize(sigma);
    cv::Mat1f blurred;
    cv::GaussianBlur(src, blurred, cv::Size(k, k), sigma, sigma, cv::BORDER_REPLICATE);
    return blurred;
}

cv::Mat1f ChannelEnhancer::subtractBackground(const cv::Mat& channel, const EnhancerConfig& config)
{
    requireSingleChannel(channel, "ChannelEnhancer::subtractBackground");
    cv::Mat1f src;
    channel.convertTo(src, CV_32F);

    cv::Mat1f background;
    switch (config.background) {
    case BackgroundMethod::None:
        return src;
    case BackgroundMethod::Opening:
        background = Segmentation::openDisk(src, config.openingRadius);
        break;
    case BackgroundMethod::Gaussian:
        background = gaussian(src, config.gaussianSigma);
        break;
    }

    cv::Mat1f result = src - background;
    cv::max(result, 0.0, result);
    return result;
}

cv::Mat1f ChannelEnhancer::enhance(const cv::Mat& channel, const EnhancerConfig& config)
{
    requireSingleChannel(channel, "ChannelEnhancer::enhance");
    cv::Mat1f base;
    if (config.equalize)
        base = equalize(channel, config.clahe);
    else
        channel.convertTo(base, CV_32F);
    return subtractBackground(base, config);
}

cv::Mat1f ChannelEnhancer::contrastStretch(const cv::Mat& channel, double lowFraction,
                                           double highFraction)
{
    requireSingleChannel(channel, "ChannelEnhancer::contrastStretch");
    cv::Mat1f src;
    channel.convertTo(src, CV_32F);

    double low = Segmentation::percentile(src, lowFraction * 100.0);
    double high = Segmentation::percentile(src, highFraction * 100.0);
    if (high - low < 1e-12) {
        // Вырожденный диапазон: оставляем полный [0,1].
        low = 0.0;
        high = 1.0;
    }

    cv::Mat1f result;
    src.convertTo(result, CV_32F, 1.0 / (high - low), -low / (high - low));
    cv::max(result, 0.0, result);
    cv::min(result, 1.0, result);
    return result;
}

} // namespace cellquant
