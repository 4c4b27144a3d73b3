#include "colocalization.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <iostream>
#include <utility>
#include "../detection/regionfilter.hpp"
#include "../segmentation/segmentation.hpp"
#include "../utils.hpp"

namespace cellquant {

Colocalization::Colocalization(ColocalizationConfig config)
    : config_(std::move(config))
{
}

LabeledRegions Colocalization::detect(const cv::Mat& maskA, const cv::Mat& maskB) const
{
    cv::Mat1b a = Segmentation::toMask(maskA);
    cv::Mat1b b = Segmentation::toMask(maskB);
    requireSameSize("Colocalization::detect", a, b);

    // Небольшая дилатация компенсирует сдвиг между каналами.
    cv::Mat1b both = Segmentation::dilateDisk(a, config_.dilateRadius) &
                     Segmentation::dilateDisk(b, config_.dilateRadius);
    both = Segmentation::removeSmallConnectedComponents(both, "fixed", config_.minPixels, 8);
    if (config_.fillHoles)
        both = Segmentation::fillHoles(both);

    cv::Mat1b filtered = RegionFilter::applyShapeFilter(both, config_.shape);
    LabeledRegions result = LabelMapping::labelRegions(filtered);
    std::cout << "[Colocalization] " << result.count() << " colocalised regions" << std::endl;
    return result;
}

double Colocalization::pearson(const std::vector<double>& a, const std::vector<double>& b)
{
    const size_t n = std::min(a.size(), b.size());
    if (n < 2)
        return std::numeric_limits<double>::quiet_NaN();

    double meanA = 0.0, meanB = 0.0;
    for (size_t i = 0; i < n; ++i) {
        meanA += a[i];
        meanB += b[i];
    }
    meanA /= n;
    meanB /= n;

    double sab = 0.0, saa = 0.0, sbb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double da = a[i] - meanA, db = b[i] - meanB;
        sab += da * db;
        saa += da * da;
        sbb += db * db;
    }
    if (saa <= 0.0 || sbb <= 0.0)
        return std::numeric_limits<double>::quiet_NaN();
    return sab / std::sqrt(saa * sbb);
}

void Colocalization::shuffleSamples(std::vector<double>& values, cv::RNG& rng)
{
    // Фишер-Йетс
    for (size_t i = values.size(); i > 1; --i) {
        const int j = rng.uniform(0, static_cast<int>(i));
        std::swap(values[i - 1], values[static_cast<size_t>(j)]);
    }
}

ColocalizationMetrics Colocalization::metrics(const cv::Mat& channelA, const cv::Mat& channelB,
                                              const cv::Mat& mask) const
{
    ColocalizationMetrics m;
    requireSingleChannel(channelA, "Colocalization::metrics");
    requireSingleChannel(channelB, "Colocalization::metrics");
    if (mask.empty()) {
        std::cerr << "[Colocalization] warning: empty mask, metrics undefined" << std::endl;
        return m;
    }
    requireSameSize("Colocalization::metrics", channelA, channelB, mask);

    cv::Mat1b roi = Segmentation::toMask(mask);
    if (cv::countNonZero(roi) == 0) {
        std::cerr << "[Colocalization] warning: empty mask, metrics undefined" << std::endl;
        return m;
    }

    /* ─ 1. Нормировка каналов по максимуму ─ */
    cv::Mat1d ra, gb;
    channelA.convertTo(ra, CV_64F);
    channelB.convertTo(gb, CV_64F);
    double maxA = 0.0, maxB = 0.0;
    cv::minMaxLoc(ra, nullptr, &maxA);
    cv::minMaxLoc(gb, nullptr, &maxB);
    ra /= (maxA + DBL_EPSILON);
    gb /= (maxB + DBL_EPSILON);

    std::vector<double> r, g;
    for (int y = 0; y < roi.rows; ++y)
        for (int x = 0; x < roi.cols; ++x)
            if (roi(y, x)) {
                r.push_back(ra(y, x));
                g.push_back(gb(y, x));
            }

    /* ─ 2. Pearson, Manders, overlap ─ */
    m.pearson = pearson(r, g);

    double sumR = 0.0, sumG = 0.0, sumRcoloc = 0.0, sumGcoloc = 0.0;
    double sumRG = 0.0, sumR2 = 0.0, sumG2 = 0.0;
    for (size_t i = 0; i < r.size(); ++i) {
        sumR += r[i];
        sumG += g[i];
        if (g[i] > 0.0) sumRcoloc += r[i];
        if (r[i] > 0.0) sumGcoloc += g[i];
        sumRG += r[i] * g[i];
        sumR2 += r[i] * r[i];
        sumG2 += g[i] * g[i];
    }
    m.mandersM1 = sumRcoloc / (sumR + DBL_EPSILON);
    m.mandersM2 = sumGcoloc / (sumG + DBL_EPSILON);
    m.overlap = sumRG / std::sqrt(sumR2 * sumG2 + DBL_EPSILON);

    /* ─ 3. Перестановочный тест ─ */
    if (std::isnan(m.pearson) || config_.permutations <= 0)
        return m;

    cv::RNG rng(config_.seed + 1);
    std::vector<double> permuted;
    int atLeast = 0;
    for (int k = 0; k < config_.permutations; ++k) {
        permuted = g;
        shuffleSamples(permuted, rng);
        const double rPerm = pearson(r, permuted);
        if (rPerm >= m.pearson)
            ++atLeast;
    }
    m.pValue = static_cast<double>(atLeast) / config_.permutations;
    return m;
}

} // namespace cellquant
