#include <gtest/gtest.h>

#include "segmentation/nucleussegmenter.hpp"
#include "test_helpers.hpp"

using namespace cellquant;

namespace {

cv::Mat nuclearImage(const cv::Mat1f& blue)
{
    cv::Mat1f zero = cv::Mat1f::zeros(blue.size());
    return test::rgbImage(zero, zero, blue);
}

NucleusConfig smallNuclei()
{
    NucleusConfig c;
    c.minArea = 50;
    return c;
}

} // namespace

TEST(NucleusSegmenterTest, SingleDiskIsOneNucleus)
{
    cv::Mat1f blue = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(blue, {32, 32}, 5, 1.0f);

    NucleusSegmentation nuc = NucleusSegmenter(smallNuclei()).segment(nuclearImage(blue));
    ASSERT_EQ(nuc.count(), 1);
    EXPECT_NEAR(nuc.nuclei[0].area, CV_PI * 25.0, 5.0);
    EXPECT_NEAR(nuc.nuclei[0].centroid.x, 32.0, 1.0);
    EXPECT_NEAR(nuc.nuclei[0].centroid.y, 32.0, 1.0);
    EXPECT_EQ(nuc.nuclei[0].id, 1);
    EXPECT_EQ(nuc.labels(32, 32), 1);
    EXPECT_EQ(cv::countNonZero(nuc.mask), nuc.nuclei[0].area);
}

TEST(NucleusSegmenterTest, DefaultMinimumAreaRejectsSmallDisk)
{
    cv::Mat1f blue = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(blue, {32, 32}, 5, 1.0f);

    NucleusSegmentation nuc = NucleusSegmenter().segment(nuclearImage(blue));
    EXPECT_EQ(nuc.count(), 0);
    EXPECT_EQ(cv::countNonZero(nuc.mask), 0);
}

TEST(NucleusSegmenterTest, BorderTouchingNucleusIsCleared)
{
    cv::Mat1f blue = cv::Mat1f::zeros(80, 80);
    test::drawDisk<float>(blue, {40, 40}, 8, 1.0f);
    test::drawDisk<float>(blue, {2, 40}, 8, 1.0f);

    NucleusSegmentation nuc = NucleusSegmenter(smallNuclei()).segment(nuclearImage(blue));
    ASSERT_EQ(nuc.count(), 1);
    EXPECT_NEAR(nuc.nuclei[0].centroid.x, 40.0, 1.0);
}

TEST(NucleusSegmenterTest, SmallFragmentFarFromLargeNucleiIsDropped)
{
    cv::Mat1f blue = cv::Mat1f::zeros(128, 128);
    test::drawDisk<float>(blue, {30, 30}, 12, 1.0f);
    test::drawDisk<float>(blue, {90, 30}, 12, 1.0f);
    test::drawDisk<float>(blue, {30, 90}, 12, 1.0f);
    // маленький фрагмент далеко от крупных ядер
    test::drawDisk<float>(blue, {95, 95}, 5, 1.0f);

    NucleusSegmentation nuc = NucleusSegmenter(smallNuclei()).segment(nuclearImage(blue));
    EXPECT_EQ(nuc.count(), 3);
    EXPECT_EQ(nuc.mask(95, 95), 0);
}

TEST(NucleusSegmenterTest, MergingDisabledKeepsSmallFragment)
{
    cv::Mat1f blue = cv::Mat1f::zeros(128, 128);
    test::drawDisk<float>(blue, {30, 30}, 12, 1.0f);
    test::drawDisk<float>(blue, {90, 30}, 12, 1.0f);
    test::drawDisk<float>(blue, {30, 90}, 12, 1.0f);
    test::drawDisk<float>(blue, {95, 95}, 5, 1.0f);

    NucleusConfig cfg = smallNuclei();
    cfg.mergeSmall = false;
    NucleusSegmentation nuc = NucleusSegmenter(cfg).segment(nuclearImage(blue));
    EXPECT_EQ(nuc.count(), 4);
}

TEST(NucleusSegmenterTest, PolarProfileOfDisk)
{
    cv::Mat1f blue = cv::Mat1f::zeros(64, 64);
    test::drawDisk<float>(blue, {32, 32}, 10, 1.0f);

    NucleusSegmentation nuc = NucleusSegmenter(smallNuclei()).segment(nuclearImage(blue));
    ASSERT_EQ(nuc.count(), 1);
    const NucleusRecord& n = nuc.nuclei[0];
    ASSERT_FALSE(n.boundary.empty());
    ASSERT_EQ(n.polarRadius.size(), n.boundary.size());
    for (double r : n.polarRadius)
        EXPECT_NEAR(r, 10.0, 1.0);
    for (double a : n.polarAngle) {
        EXPECT_GT(a, -180.0 - 1e-9);
        EXPECT_LE(a, 180.0);
    }
}

TEST(NucleusSegmenterTest, EmptyImageGivesNoNuclei)
{
    cv::Mat1f blue = cv::Mat1f::zeros(32, 32);
    NucleusSegmentation nuc = NucleusSegmenter().segment(nuclearImage(blue));
    EXPECT_EQ(nuc.count(), 0);
    EXPECT_EQ(nuc.mask.size(), blue.size());
}

TEST(NucleusSegmenterTest, RejectsGrayImage)
{
    cv::Mat1f gray = cv::Mat1f::zeros(16, 16);
    EXPECT_THROW(NucleusSegmenter().segment(gray), InputShapeError);
}
