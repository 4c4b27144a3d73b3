#include "diffusedetector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <limits>
#include <random>
#include <utility>
#include "regionfilter.hpp"
#include "../preparing/channelenhancer.hpp"
#include "../segmentation/segmentation.hpp"
#include "../utils.hpp"

namespace cellquant {

namespace {

// При равенстве расстояний выигрывает центр с большим индексом.
int nearestCenter(float v, const std::vector<double>& centers)
{
    int best = 0;
    double bestDist = std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < centers.size(); ++c) {
        const double d = std::abs(v - centers[c]);
        if (d <= bestDist) {
            bestDist = d;
            best = static_cast<int>(c);
        }
    }
    return best;
}

// Восстанавливает глобальный генератор OpenCV текущего потока.
class ScopedRngState {
public:
    explicit ScopedRngState(std::uint64_t seed)
        : saved_(cv::theRNG().state)
    {
        cv::theRNG() = cv::RNG(seed);
    }
    ~ScopedRngState() { cv::theRNG().state = saved_; }

    ScopedRngState(const ScopedRngState&) = delete;
    ScopedRngState& operator=(const ScopedRngState&) = delete;

private:
    std::uint64_t saved_;
};

} // namespace

DiffuseDetector::DiffuseDetector(DiffuseDetectorConfig config)
    : config_(std::move(config))
{
    if (config_.numClusters < 1)
        throw std::invalid_argument("DiffuseDetector: numClusters must be positive");
}

DiffuseDetector DiffuseDetector::lipid(const DiffuseDetectorConfig& config)
{
    return DiffuseDetector(config);
}

DiffuseDetector DiffuseDetector::reactiveOxygen(const DiffuseDetectorConfig& config)
{
    return DiffuseDetector(config);
}

DiffuseDetection DiffuseDetector::detect(const cv::Mat& image, const cv::Mat& nucMask) const
{
    requireThreeChannels(image, "DiffuseDetector::detect");
    cv::Mat1f gray = ChannelEnhancer::contrastStretch(ChannelEnhancer::toGray(image));
    return detectGray(gray, nucMask);
}

std::vector<double> DiffuseDetector::clusterIntensities(const std::vector<float>& seeds,
                                                        const std::vector<float>& values,
                                                        std::vector<int>& labels,
                                                        bool& converged, int& iterations) const
{
    const int k = config_.numClusters;
    converged = false;
    iterations = 0;

    /* ── 1. подвыборка для инициализации центров ── */
    std::vector<float> sample;
    if (config_.maxSamples > 0 && seeds.size() > static_cast<size_t>(config_.maxSamples)) {
        std::mt19937_64 rng(config_.seed);
        std::sample(seeds.begin(), seeds.end(), std::back_inserter(sample),
                    config_.maxSamples, rng);
    } else {
        sample = seeds;
    }

    cv::Mat1f samples(static_cast<int>(sample.size()), 1, sample.data());
    cv::Mat sampleLabels, centersMat;
    {
        ScopedRngState rngGuard(config_.seed + 1);
        cv::kmeans(samples, k, sampleLabels,
                   cv::TermCriteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS,
                                    config_.maxIterations, 1e-6),
                   std::max(config_.replicates, 1), cv::KMEANS_PP_CENTERS, centersMat);
    }

    std::vector<double> centers;
    for (int c = 0; c < centersMat.rows; ++c)
        centers.push_back(centersMat.at<float>(c, 0));

    /* ── 2. уточнение по всем пикселям ── */
    std::vector<int> assignment(values.size(), -1);
    while (iterations < config_.maxIterations) {
        ++iterations;
        bool changed = false;
        std::vector<double> sums(k, 0.0);
        std::vector<size_t> counts(k, 0);
        for (size_t i = 0; i < values.size(); ++i) {
            const int c = nearestCenter(values[i], centers);
            if (c != assignment[i]) {
                assignment[i] = c;
                changed = true;
            }
            sums[c] += values[i];
            ++counts[c];
        }
        if (!changed) {
            converged = true;
            break;
        }
        // Пустой кластер сохраняет прежний центр.
        for (int c = 0; c < k; ++c)
            if (counts[c] > 0)
                centers[c] = sums[c] / counts[c];
    }
    if (iterations == 0)
        for (size_t i = 0; i < values.size(); ++i)
            assignment[i] = nearestCenter(values[i], centers);

    /* ── 3. центры по возрастанию, метки в том же порядке ── */
    std::vector<int> order(centers.size());
    for (size_t c = 0; c < order.size(); ++c)
        order[c] = static_cast<int>(c);
    std::stable_sort(order.begin(), order.end(),
                     [&centers](int a, int b) { return centers[a] < centers[b]; });

    std::vector<int> rank(centers.size());
    std::vector<double> sorted(centers.size());
    for (size_t r = 0; r < order.size(); ++r) {
        rank[order[r]] = static_cast<int>(r);
        sorted[r] = centers[order[r]];
    }

    labels.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i)
        labels[i] = rank[assignment[i]];
    return sorted;
}

DiffuseDetection DiffuseDetector::detectGray(const cv::Mat& gray, const cv::Mat& nucMask) const
{
    requireSingleChannel(gray, "DiffuseDetector::detectGray");
    if (!nucMask.empty())
        requireSameSize("DiffuseDetector::detectGray", gray, nucMask);

    cv::Mat1f img;
    gray.convertTo(img, CV_32F);

    DiffuseDetection result;
    result.mask = cv::Mat1b::zeros(img.size());

    // порог только для инициализации; уточнение идёт по всему изображению
    std::vector<float> seeds;
    std::vector<float> values;
    values.reserve(img.total());
    for (int y = 0; y < img.rows; ++y)
        for (int x = 0; x < img.cols; ++x) {
            const float v = img(y, x);
            values.push_back(v);
            if (v > config_.intensityThreshold)
                seeds.push_back(v);
        }

    if (seeds.size() < static_cast<size_t>(config_.numClusters)) {
        std::cerr << "[DiffuseDetector] warning: " << seeds.size()
                  << " pixels above threshold, nothing to cluster" << std::endl;
        return result;
    }

    std::vector<int> labels;
    result.centers = clusterIntensities(seeds, values, labels, result.converged, result.iterations);
    if (!result.converged)
        std::cerr << "[DiffuseDetector] warning: clustering did not converge in "
                  << config_.maxIterations << " iterations, using last iterate" << std::endl;

    /* ── самый яркий кластер ── */
    const int brightest = static_cast<int>(result.centers.size()) - 1;
    cv::Mat1b bw = cv::Mat1b::zeros(img.size());
    size_t i = 0;
    for (int y = 0; y < img.rows; ++y)
        for (int x = 0; x < img.cols; ++x, ++i)
            if (labels[i] == brightest)
                bw(y, x) = 255;

    bw = Segmentation::removeSmallConnectedComponents(bw, "fixed", config_.minPixels, 8);
    bw = Segmentation::closeDisk(bw, config_.closeRadius);
    showMatDebug("Diffuse: brightest cluster", bw);

    result.mask = RegionFilter::applyContextFilter(bw, nucMask, img, config_.context);
    return result;
}

} // namespace cellquant
