#include <gtest/gtest.h>

#include "detection/diffusedetector.hpp"
#include "segmentation/labelmapping.hpp"
#include "test_helpers.hpp"

using namespace cellquant;

namespace {

cv::Mat1f threeLevelImage()
{
    cv::Mat1f gray(64, 64, 0.1f);
    gray(cv::Rect(4, 4, 16, 16)).setTo(0.5f);
    test::drawDisk<float>(gray, {44, 44}, 8, 0.9f);
    return gray;
}

} // namespace

TEST(DiffuseDetectorTest, BrightestClusterIsSelected)
{
    DiffuseDetection det = DiffuseDetector().detectGray(threeLevelImage());

    ASSERT_EQ(det.centers.size(), 3u);
    EXPECT_NEAR(det.centers.front(), 0.1, 1e-3);
    EXPECT_NEAR(det.centers.back(), 0.9, 1e-3);
    EXPECT_TRUE(det.converged);

    EXPECT_EQ(det.mask(44, 44), 255);
    EXPECT_EQ(det.mask(12, 12), 0);
    EXPECT_EQ(det.mask(0, 0), 0);
    EXPECT_EQ(LabelMapping::labelRegions(det.mask).count(), 1);
}

TEST(DiffuseDetectorTest, SameSeedGivesSameMask)
{
    DiffuseDetectorConfig cfg;
    cfg.seed = 7;
    cv::Mat1f gray = threeLevelImage();
    DiffuseDetection a = DiffuseDetector(cfg).detectGray(gray);
    DiffuseDetection b = DiffuseDetector(cfg).detectGray(gray);
    EXPECT_EQ(cv::countNonZero(a.mask != b.mask), 0);
    EXPECT_EQ(a.centers, b.centers);
}

TEST(DiffuseDetectorTest, TooFewPixelsGiveEmptyResult)
{
    cv::Mat1f gray = cv::Mat1f::zeros(32, 32);
    gray(3, 3) = 0.8f;
    DiffuseDetection det = DiffuseDetector().detectGray(gray);
    EXPECT_EQ(det.mask.size(), gray.size());
    EXPECT_EQ(cv::countNonZero(det.mask), 0);
    EXPECT_TRUE(det.centers.empty());
}

TEST(DiffuseDetectorTest, SmallBrightSpotsAreRemoved)
{
    cv::Mat1f gray(64, 64, 0.1f);
    gray(cv::Rect(4, 4, 16, 16)).setTo(0.5f);
    test::drawDisk<float>(gray, {44, 44}, 2, 0.9f); // 13 px < minPixels

    DiffuseDetection det = DiffuseDetector().detectGray(gray);
    EXPECT_EQ(det.mask(44, 44), 0);
}

TEST(DiffuseDetectorTest, RejectsInvalidClusterCount)
{
    DiffuseDetectorConfig cfg;
    cfg.numClusters = 0;
    EXPECT_THROW(DiffuseDetector{cfg}, std::invalid_argument);
}

TEST(DiffuseDetectorTest, DetectRejectsGrayInput)
{
    EXPECT_THROW(DiffuseDetector::lipid().detect(threeLevelImage()), InputShapeError);
}

namespace {

// 0 на верхних 39 строках, 0.6 на следующих 13, 0.9 на нижних 12
cv::Mat1f darkBackgroundImage()
{
    cv::Mat1f gray = cv::Mat1f::zeros(64, 64);
    gray(cv::Rect(0, 39, 64, 13)).setTo(0.6f);
    gray(cv::Rect(0, 52, 64, 12)).setTo(0.9f);
    return gray;
}

} // namespace

TEST(DiffuseDetectorTest, DarkBackgroundTakesPartInRefinement)
{
    DiffuseDetectorConfig cfg;
    cfg.numClusters = 2;
    DiffuseDetection det = DiffuseDetector(cfg).detectGray(darkBackgroundImage());

    // фон стягивает нижний центр к нулю, и 0.6 уходит в яркий кластер
    ASSERT_EQ(det.centers.size(), 2u);
    EXPECT_LT(det.centers.front(), 0.05);
    EXPECT_NEAR(det.centers.back(), (0.6 * 13 + 0.9 * 12) / 25.0, 1e-3);
    EXPECT_TRUE(det.converged);

    EXPECT_EQ(det.mask(45, 10), 255);
    EXPECT_EQ(det.mask(58, 10), 255);
    EXPECT_EQ(det.mask(10, 10), 0);
}

TEST(DiffuseDetectorTest, IterationBudgetExhaustedKeepsLastIterate)
{
    DiffuseDetectorConfig cfg;
    cfg.numClusters = 2;
    cfg.maxIterations = 1;
    cv::Mat1f gray = darkBackgroundImage();

    DiffuseDetection det;
    ASSERT_NO_THROW(det = DiffuseDetector(cfg).detectGray(gray));
    EXPECT_FALSE(det.converged);
    EXPECT_EQ(det.iterations, 1);
    ASSERT_EQ(det.centers.size(), 2u);
    ASSERT_EQ(det.mask.size(), gray.size());

    // первое разбиение от начальных центров 0.6 и 0.9
    EXPECT_EQ(det.mask(58, 10), 255);
    EXPECT_EQ(det.mask(45, 10), 0);
    EXPECT_EQ(det.mask(10, 10), 0);
}

TEST(DiffuseDetectorTest, GlobalRngIsRestored)
{
    cv::theRNG() = cv::RNG(12345);
    const std::uint64_t before = cv::theRNG().state;

    DiffuseDetector().detectGray(threeLevelImage());
    EXPECT_EQ(cv::theRNG().state, before);
}
