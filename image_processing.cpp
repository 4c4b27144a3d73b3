#include "image_processing.hpp"

#include <iostream>
#include <utility>

#include "analysis/intensity.hpp"
#include "detection/blobdetector.hpp"
#include "detection/diffusedetector.hpp"
#include "preparing/channelenhancer.hpp"
#include "segmentation/segmentation.hpp"
#include "utils.hpp"

namespace cellquant {

ImageAnalyzer::ImageAnalyzer(AnalysisConfig config)
    : config_(std::move(config))
{
}

SpeciesResult ImageAnalyzer::buildSpecies(const std::string& name,
                                          const cv::Mat& mask,
                                          const cv::Mat& image,
                                          const NucleusSegmentation& nuclei,
                                          bool withRed)
{
    SpeciesResult s;
    s.name = name;
    s.numNuclei = nuclei.count();

    LabeledRegions labeled = LabelMapping::labelRegions(mask);
    s.detectionMask = mask.empty() ? cv::Mat1b::zeros(image.size()) : Segmentation::toMask(mask);

    // без ядер объектов нет
    s.regions = NucleusAssignment::assign(labeled.regions, nuclei.nuclei);
    s.labels = (labeled.labels.empty() || s.regions.empty()) ? cv::Mat1i::zeros(image.size())
                                                             : labeled.labels;

    IntensityMeasurement::addChannelIntensities(s.regions, image, withRed);
    s.reconstruction = reconstructFromRecords(s.regions, image.size());

    std::cout << "[ImageAnalyzer] " << name << ": " << s.count() << " objects" << std::endl;
    return s;
}

LipidAnalysis ImageAnalyzer::analyzeLipidDroplets(const cv::Mat& image) const
{
    requireThreeChannels(image, "ImageAnalyzer::analyzeLipidDroplets");
    LipidAnalysis out;

    /* ─ 1. Ядра ─ */
    out.nuclei = NucleusSegmenter(config_.nucleus).segment(image);
    const cv::Mat1b& nucMask = out.nuclei.mask;

    /* ─ 2. Точечные LD: зелёный и красный каналы ─ */
    BlobDetection green = BlobDetector::greenLipid(config_.greenLipid).detect(image, nucMask);
    out.green = buildSpecies("Green", green.mask, image, out.nuclei);
    showMatDebug("LD green", out.green.detectionMask);

    BlobDetection red = BlobDetector::redLipid(config_.redLipid).detect(image, nucMask);
    out.red = buildSpecies("Red", red.mask, image, out.nuclei);
    showMatDebug("LD red", out.red.detectionMask);

    /* ─ 3. Колокализация по восстановленным маскам ─ */
    const Colocalization coloc(config_.colocalization);
    LabeledRegions both = coloc.detect(out.green.reconstruction.mask, out.red.reconstruction.mask);
    cv::Mat1b colocMask = LabelMapping::maskFromRegions(both.regions, image.size());
    out.colocalized = buildSpecies("Colocalized", colocMask, image, out.nuclei);

    IntensityMeasurement::addColocalizationCoverage(out.green.regions, colocMask);
    IntensityMeasurement::addColocalizationCoverage(out.red.regions, colocMask);
    IntensityMeasurement::addColocalizationCoverage(out.colocalized.regions, colocMask);

    /* ─ 4. Диффузные LD ─ */
    DiffuseDetection diffuse = DiffuseDetector::lipid(config_.diffuseLipid).detect(image, nucMask);
    out.diffuse = buildSpecies("Diffuse", diffuse.mask, image, out.nuclei);

    /* ─ 5. Метрики red/green внутри green ∪ red ─ */
    cv::Mat1b roi = out.green.reconstruction.mask | out.red.reconstruction.mask;
    out.metrics = coloc.metrics(ChannelEnhancer::extractChannel(image, Channel::Red),
                                ChannelEnhancer::extractChannel(image, Channel::Green),
                                roi);
    return out;
}

RosAnalysis ImageAnalyzer::analyzeReactiveOxygen(const cv::Mat& image) const
{
    requireThreeChannels(image, "ImageAnalyzer::analyzeReactiveOxygen");
    RosAnalysis out;

    out.nuclei = NucleusSegmenter(config_.nucleus).segment(image);
    const cv::Mat1b& nucMask = out.nuclei.mask;

    BlobDetection punctate = BlobDetector::reactiveOxygen(config_.ros).detect(image, nucMask);
    out.punctate = buildSpecies("ROS", punctate.mask, image, out.nuclei, false);
    showMatDebug("ROS", out.punctate.detectionMask);

    DiffuseDetection diffuse = DiffuseDetector::reactiveOxygen(config_.diffuseRos).detect(image, nucMask);
    out.diffuse = buildSpecies("ROS Diffuse", diffuse.mask, image, out.nuclei, false);
    return out;
}

} // namespace cellquant
