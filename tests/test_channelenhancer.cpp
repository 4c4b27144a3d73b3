#include <gtest/gtest.h>

#include "preparing/channelenhancer.hpp"
#include "test_helpers.hpp"

using namespace cellquant;

TEST(ChannelEnhancerTest, ExtractChannelUsesRgbOrder)
{
    cv::Mat1f r(4, 4, 0.1f), g(4, 4, 0.5f), b(4, 4, 0.9f);
    cv::Mat img = test::rgbImage(r, g, b);
    EXPECT_NEAR(ChannelEnhancer::extractChannel(img, Channel::Red)(0, 0), 0.1f, 1e-6);
    EXPECT_NEAR(ChannelEnhancer::extractChannel(img, Channel::Green)(0, 0), 0.5f, 1e-6);
    EXPECT_NEAR(ChannelEnhancer::extractChannel(img, Channel::Blue)(0, 0), 0.9f, 1e-6);
}

TEST(ChannelEnhancerTest, RejectsSingleChannelImage)
{
    cv::Mat1f gray(4, 4, 0.2f);
    EXPECT_THROW(ChannelEnhancer::extractChannel(gray, Channel::Green), InputShapeError);
    EXPECT_THROW(ChannelEnhancer::toGray(gray), InputShapeError);
}

TEST(ChannelEnhancerTest, EqualizeKeepsRangeAndOrder)
{
    cv::Mat1f ch(64, 64, 0.05f);
    test::drawDisk<float>(ch, {32, 32}, 6, 0.4f);
    cv::Mat1f eq = ChannelEnhancer::equalize(ch, ClaheConfig{});

    double minVal, maxVal;
    cv::minMaxLoc(eq, &minVal, &maxVal);
    EXPECT_GE(minVal, 0.0);
    EXPECT_LE(maxVal, 1.0);
    EXPECT_GT(eq(32, 32), eq(2, 2));
}

TEST(ChannelEnhancerTest, OpeningRemovesFlatBackground)
{
    cv::Mat1f ch(64, 64, 0.3f);
    test::drawDisk<float>(ch, {32, 32}, 3, 0.9f);

    EnhancerConfig cfg;
    cfg.equalize = false;
    cfg.background = BackgroundMethod::Opening;
    cfg.openingRadius = 6;
    cv::Mat1f out = ChannelEnhancer::subtractBackground(ch, cfg);

    EXPECT_NEAR(out(5, 5), 0.0f, 1e-6);
    EXPECT_NEAR(out(32, 32), 0.6f, 1e-5);

    double minVal;
    cv::minMaxLoc(out, &minVal);
    EXPECT_GE(minVal, 0.0);
}

TEST(ChannelEnhancerTest, GaussianBackgroundIsClippedAtZero)
{
    cv::Mat1f ch(40, 40, 0.0f);
    ch(cv::Rect(0, 0, 20, 40)).setTo(1.0f);

    EnhancerConfig cfg;
    cfg.background = BackgroundMethod::Gaussian;
    cfg.gaussianSigma = 5.0;
    cv::Mat1f out = ChannelEnhancer::subtractBackground(ch, cfg);
    double minVal;
    cv::minMaxLoc(out, &minVal);
    EXPECT_GE(minVal, 0.0);
}

TEST(ChannelEnhancerTest, ContrastStretchMapsToUnitRange)
{
    cv::Mat1f ch(10, 10);
    for (int i = 0; i < 100; ++i)
        ch(i / 10, i % 10) = 0.2f + 0.005f * i;

    cv::Mat1f out = ChannelEnhancer::contrastStretch(ch);
    double minVal, maxVal;
    cv::minMaxLoc(out, &minVal, &maxVal);
    EXPECT_NEAR(minVal, 0.0, 1e-6);
    EXPECT_NEAR(maxVal, 1.0, 1e-6);

    cv::Mat1f flat(5, 5, 0.4f);
    EXPECT_NEAR(ChannelEnhancer::contrastStretch(flat)(0, 0), 0.4f, 1e-6);
}
