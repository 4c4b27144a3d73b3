#include <gtest/gtest.h>

#include "image_processing.hpp"
#include "test_helpers.hpp"

using namespace cellquant;

namespace {

cv::Mat cellImage()
{
    cv::Mat1f blue = cv::Mat1f::zeros(96, 96);
    cv::Mat1f green = cv::Mat1f::zeros(96, 96);
    cv::Mat1f red = cv::Mat1f::zeros(96, 96);
    test::drawDisk<float>(blue, {48, 48}, 10, 0.9f);
    test::drawDisk<float>(green, {70, 48}, 3, 0.8f);
    test::drawDisk<float>(red, {70, 48}, 3, 0.4f);
    return test::rgbImage(red, green, blue);
}

AnalysisConfig smallNucleiConfig()
{
    AnalysisConfig cfg;
    cfg.nucleus.minArea = 50;
    return cfg;
}

} // namespace

TEST(ImageAnalyzerTest, BuildSpeciesWithoutNucleiHasNoObjects)
{
    cv::Mat img = cellImage();
    cv::Mat1b mask = test::diskMask(img.size(), {70, 48}, 3);

    SpeciesResult s = ImageAnalyzer::buildSpecies("Green", mask, img, NucleusSegmentation{});
    EXPECT_EQ(s.count(), 0);
    EXPECT_TRUE(s.groups().empty());
    EXPECT_EQ(cv::countNonZero(s.labels), 0);
    EXPECT_EQ(cv::countNonZero(s.reconstruction.mask), 0);
    // сама детекция сохраняется
    EXPECT_EQ(s.detectionMask(48, 70), 255);
}

TEST(ImageAnalyzerTest, BuildSpeciesOnEmptyMask)
{
    cv::Mat img = cellImage();
    SpeciesResult s = ImageAnalyzer::buildSpecies("ROS", cv::Mat1b::zeros(img.size()), img,
                                                  NucleusSegmentation{}, false);
    EXPECT_EQ(s.count(), 0);
    EXPECT_EQ(s.labels.size(), img.size());
    EXPECT_EQ(cv::countNonZero(s.reconstruction.mask), 0);
}

TEST(ImageAnalyzerTest, LipidWorkflowAssignsToNucleus)
{
    LipidAnalysis a = ImageAnalyzer(smallNucleiConfig()).analyzeLipidDroplets(cellImage());
    ASSERT_EQ(a.nuclei.count(), 1);
    EXPECT_EQ(a.green.name, "Green");
    EXPECT_EQ(a.colocalized.name, "Colocalized");
    EXPECT_EQ(a.green.numNuclei, 1);
    for (const auto& r : a.green.regions) {
        ASSERT_TRUE(r.assignedNucleusId.has_value());
        EXPECT_EQ(*r.assignedNucleusId, 1);
    }
    EXPECT_EQ(a.diffuse.labels.size(), a.nuclei.mask.size());
}

TEST(ImageAnalyzerTest, RosWorkflowMeasuresGreenOnly)
{
    RosAnalysis a = ImageAnalyzer(smallNucleiConfig()).analyzeReactiveOxygen(cellImage());
    EXPECT_EQ(a.punctate.name, "ROS");
    EXPECT_EQ(a.diffuse.name, "ROS Diffuse");
    for (const auto& r : a.punctate.regions)
        EXPECT_FALSE(r.meanIntensityRed.has_value());
}

TEST(ImageAnalyzerTest, RejectsGrayImage)
{
    EXPECT_THROW(ImageAnalyzer().analyzeLipidDroplets(cv::Mat1f::zeros(16, 16)), InputShapeError);
}
