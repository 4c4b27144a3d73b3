#include <gtest/gtest.h>

#include "detection/blobdetector.hpp"
#include "segmentation/labelmapping.hpp"
#include "test_helpers.hpp"

using namespace cellquant;

namespace {

BlobDetectorConfig plainGreenConfig()
{
    BlobDetectorConfig c = greenLipidDefaults();
    c.enhancer.equalize = false;
    c.enhancer.background = BackgroundMethod::None;
    return c;
}

} // namespace

TEST(BlobDetectorTest, TwoDisksGiveTwoRegions)
{
    cv::Mat1f green = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(green, {10, 10}, 3, 1.0f);
    test::drawDisk<float>(green, {50, 50}, 3, 1.0f);

    BlobDetection det = BlobDetector(plainGreenConfig(), Channel::Green).detectChannel(green);
    LabeledRegions regions = LabelMapping::labelRegions(det.mask);
    ASSERT_EQ(regions.count(), 2);

    std::vector<cv::Point2d> expected = {{10, 10}, {50, 50}};
    for (const auto& e : expected) {
        const bool found = std::any_of(regions.regions.begin(), regions.regions.end(),
                                       [&](const RegionRecord& r) { return cv::norm(r.centroid - e) < 1.5; });
        EXPECT_TRUE(found) << "no region near (" << e.x << ", " << e.y << ")";
    }
    for (const auto& r : regions.regions) {
        EXPECT_GE(r.area, 4);
        EXPECT_LE(r.area, 300);
    }
}

TEST(BlobDetectorTest, DetectOnRgbUsesConfiguredChannel)
{
    cv::Mat1f red = cv::Mat1f::zeros(64, 64);
    cv::Mat1f green = cv::Mat1f::zeros(64, 64);
    cv::Mat1f blue = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(green, {20, 20}, 3, 1.0f);
    test::drawDisk<float>(green, {44, 44}, 3, 1.0f);

    cv::Mat img = test::rgbImage(red, green, blue);
    BlobDetection onGreen = BlobDetector(plainGreenConfig(), Channel::Green).detect(img);
    BlobDetection onRed = BlobDetector(plainGreenConfig(), Channel::Red).detect(img);
    EXPECT_EQ(LabelMapping::labelRegions(onGreen.mask).count(), 2);
    EXPECT_EQ(cv::countNonZero(onRed.mask), 0);
}

TEST(BlobDetectorTest, NucleusOverlapDiscardsBlob)
{
    cv::Mat1f green = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(green, {20, 20}, 3, 1.0f);
    test::drawDisk<float>(green, {44, 44}, 3, 1.0f);

    cv::Mat1b nuc = cv::Mat1b::zeros(64, 64);
    test::drawDisk<uchar>(nuc, {44, 44}, 2, 255);

    BlobDetectorConfig cfg = plainGreenConfig();
    cfg.context.adaptiveBackground = false;
    cfg.context.maxDist = 90.0;
    BlobDetection det = BlobDetector(cfg, Channel::Green).detectChannel(green, nuc);
    LabeledRegions regions = LabelMapping::labelRegions(det.mask);
    ASSERT_EQ(regions.count(), 1);
    EXPECT_NEAR(regions.regions[0].centroid.x, 20.0, 1.5);
}

TEST(BlobDetectorTest, NucleusMaskSizeMismatchThrows)
{
    cv::Mat1f green = cv::Mat1f::zeros(32, 32);
    cv::Mat1b nuc = cv::Mat1b::zeros(16, 16);
    EXPECT_THROW(BlobDetector::greenLipid().detectChannel(green, nuc), InputShapeError);
}

TEST(BlobDetectorTest, DogRequiresOrderedSigmas)
{
    cv::Mat1f ch = cv::Mat1f::zeros(8, 8);
    DoGConfig cfg;
    cfg.sigmaSmall = 2.0;
    cfg.sigmaLarge = 1.0;
    EXPECT_THROW(BlobDetector::differenceOfGaussians(ch, cfg), std::invalid_argument);
}

TEST(BlobDetectorTest, SteerableResponseIsNormalized)
{
    cv::Mat1f ch = cv::Mat1f::zeros(40, 40);
    test::drawDisk<float>(ch, {20, 20}, 4, 0.8f);
    cv::Mat1f resp = BlobDetector::steerableResponse(ch, 1.0);

    double minVal, maxVal;
    cv::minMaxLoc(resp, &minVal, &maxVal);
    EXPECT_GE(minVal, 0.0);
    EXPECT_NEAR(maxVal, 1.0, 1e-6);
    // отклик сосредоточен у края диска, а не в углу
    EXPECT_GT(resp(20, 24), resp(2, 2));
}

TEST(BlobDetectorTest, CombineKeepsIntersectionAndBrightExclusiveRegions)
{
    cv::Mat1b dog = cv::Mat1b::zeros(40, 40);
    cv::Mat1b sdog = cv::Mat1b::zeros(40, 40);
    cv::Mat1f raw = cv::Mat1f::zeros(40, 40);

    // общий объект
    test::drawDisk<uchar>(dog, {10, 10}, 3, 255);
    test::drawDisk<uchar>(sdog, {10, 10}, 3, 255);
    // только DoG, яркий
    test::drawDisk<uchar>(dog, {30, 10}, 3, 255);
    test::drawDisk<float>(raw, {30, 10}, 3, 0.5f);
    // только SDOG, тусклый
    test::drawDisk<uchar>(sdog, {10, 30}, 3, 255);
    test::drawDisk<float>(raw, {10, 30}, 3, 0.1f);

    cv::Mat1b combined = BlobDetector::combineDetections(dog, sdog, raw, 0.15);
    EXPECT_EQ(combined(10, 10), 255);
    EXPECT_EQ(combined(10, 30), 255);
    EXPECT_EQ(combined(30, 10), 0);
    EXPECT_EQ(LabelMapping::labelRegions(combined).count(), 2);
}

TEST(BlobDetectorTest, RedPresetRunsBothBranches)
{
    cv::Mat1f red = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(red, {20, 20}, 4, 0.9f);
    test::drawDisk<float>(red, {44, 44}, 4, 0.9f);

    BlobDetection det = BlobDetector::redLipid().detectChannel(red);
    EXPECT_FALSE(det.dogMask.empty());
    EXPECT_FALSE(det.sdogMask.empty());
    EXPECT_EQ(det.mask.size(), red.size());
}
