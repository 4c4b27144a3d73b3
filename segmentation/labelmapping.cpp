#include "labelmapping.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace cellquant {

double RegionRecord::circularity() const
{
    return 4.0 * CV_PI * area / (perimeter * perimeter + DBL_EPSILON);
}

int LabelMapping::labelComponents(const cv::Mat1b& mask, cv::Mat1i& labels)
{
    CV_Assert(mask.type() == CV_8UC1);

    cv::Mat1i raw;
    int n = cv::connectedComponents(mask, raw, 8, CV_32S);

    // Перенумерация в порядке первого появления при построчном обходе:
    // порядок меток не зависит от алгоритма разметки внутри OpenCV.
    std::vector<int> lut(n, 0);
    int next = 1;
    labels.create(mask.size());
    for (int y = 0; y < raw.rows; ++y) {
        const int* in = raw.ptr<int>(y);
        int* out = labels.ptr<int>(y);
        for (int x = 0; x < raw.cols; ++x) {
            int l = in[x];
            if (l > 0 && lut[l] == 0)
                lut[l] = next++;
            out[x] = lut[l];
        }
    }
    return next - 1;
}

LabeledRegions LabelMapping::labelRegions(const cv::Mat& mask)
{
    if (mask.dims != 2 || mask.channels() != 1 || (!mask.empty() && mask.depth() != CV_8U)) {
        throw InputShapeError("LabelMapping::labelRegions: expected a 2-D CV_8UC1 mask, got " +
                              matTypeStr(mask.type()));
    }

    LabeledRegions result;
    if (mask.empty())
        return result;

    cv::Mat1b binary;
    cv::compare(mask, 0, binary, cv::CMP_NE);

    int n = labelComponents(binary, result.labels);
    result.regions = extractRegions(result.labels, n);
    return result;
}

std::vector<RegionRecord> LabelMapping::extractRegions(const cv::Mat1i& labels, int numLabels)
{
    std::vector<std::vector<cv::Point>> pixelSets(std::max(numLabels, 0));
    for (int y = 0; y < labels.rows; ++y) {
        const int* row = labels.ptr<int>(y);
        for (int x = 0; x < labels.cols; ++x) {
            int l = row[x];
            if (l > 0 && l <= numLabels)
                pixelSets[l - 1].emplace_back(x, y);
        }
    }

    std::vector<RegionRecord> regions;
    regions.reserve(pixelSets.size());
    for (size_t i = 0; i < pixelSets.size(); ++i)
        regions.push_back(measureRegion(pixelSets[i], static_cast<int>(i) + 1));
    return regions;
}

RegionRecord LabelMapping::measureRegion(const std::vector<cv::Point>& pixels, int id)
{
    RegionRecord r;
    r.id = id;
    r.pixels = pixels;
    r.area = static_cast<int>(pixels.size());
    if (pixels.empty())
        return r;

    /* ── 1. bounding box и центроид ─────────────────────────────────────── */
    int minX = pixels[0].x, maxX = pixels[0].x;
    int minY = pixels[0].y, maxY = pixels[0].y;
    double sumX = 0.0, sumY = 0.0;
    for (const auto& p : pixels) {
        minX = std::min(minX, p.x); maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y); maxY = std::max(maxY, p.y);
        sumX += p.x;
        sumY += p.y;
    }
    const double n = static_cast<double>(pixels.size());
    r.boundingBox = cv::Rect(minX, minY, maxX - minX + 1, maxY - minY + 1);
    r.centroid = cv::Point2d(sumX / n, sumY / n);

    /* ── 2. эллипс с теми же вторыми моментами ─────────────────────────── */
    // 1/12 - момент одного пикселя как единичного квадрата.
    double uxx = 0.0, uyy = 0.0, uxy = 0.0;
    for (const auto& p : pixels) {
        const double dx = p.x - r.centroid.x;
        const double dy = p.y - r.centroid.y;
        uxx += dx * dx;
        uyy += dy * dy;
        uxy += dx * dy;
    }
    uxx = uxx / n + 1.0 / 12.0;
    uyy = uyy / n + 1.0 / 12.0;
    uxy = uxy / n;

    const double common = std::sqrt((uxx - uyy) * (uxx - uyy) + 4.0 * uxy * uxy);
    r.majorAxisLength = 2.0 * std::sqrt(2.0) * std::sqrt(uxx + uyy + common);
    r.minorAxisLength = 2.0 * std::sqrt(2.0) * std::sqrt(std::max(0.0, uxx + uyy - common));
    if (r.majorAxisLength > 0.0) {
        const double a = r.majorAxisLength / 2.0, b = r.minorAxisLength / 2.0;
        r.eccentricity = 2.0 * std::sqrt(std::max(0.0, a * a - b * b)) / r.majorAxisLength;
    }

    // Ориентация считается для оси y, направленной вверх.
    const double uxyUp = -uxy;
    double num, den;
    if (uyy > uxx) {
        num = uyy - uxx + common;
        den = 2.0 * uxyUp;
    } else {
        num = 2.0 * uxyUp;
        den = uxx - uyy + common;
    }
    if (num == 0.0 && den == 0.0)
        r.orientation = 0.0;
    else if (den == 0.0)
        r.orientation = num > 0.0 ? 90.0 : -90.0;
    else
        r.orientation = std::atan(num / den) * 180.0 / CV_PI;

    /* ── 3. локальная маска с рамкой 1 px ───────────────────────────────── */
    const cv::Point offset(minX - 1, minY - 1);
    cv::Mat1b roi = cv::Mat1b::zeros(r.boundingBox.height + 2, r.boundingBox.width + 2);
    std::vector<cv::Point> local;
    local.reserve(pixels.size());
    for (const auto& p : pixels) {
        local.push_back(p - offset);
        roi(local.back()) = 255;
    }

    /* ── 4. периметр по внешнему контуру ───────────────────────────────── */
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(roi.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
    if (!contours.empty()) {
        auto largest = std::max_element(contours.begin(), contours.end(),
                                        [](const auto& a, const auto& b) { return a.size() < b.size(); });
        r.perimeter = largest->size() > 1 ? cv::arcLength(*largest, true) : 0.0;
    }

    /* ── 5. выпуклая оболочка ───────────────────────────────────────────── */
    std::vector<cv::Point> hull;
    cv::convexHull(local, hull);
    cv::Mat1b hullMask = roi.clone();
    if (!hull.empty())
        cv::fillConvexPoly(hullMask, hull, cv::Scalar(255), cv::LINE_8);
    r.convexArea = std::max(cv::countNonZero(hullMask), r.area);

    r.solidity = static_cast<double>(r.area) / r.convexArea;
    r.extent = static_cast<double>(r.area) / r.boundingBox.area();
    r.equivDiameter = std::sqrt(4.0 * r.area / CV_PI);
    return r;
}

cv::Mat1b LabelMapping::maskFromRegions(const std::vector<RegionRecord>& regions, const cv::Size& size)
{
    cv::Mat1b mask = cv::Mat1b::zeros(size);
    const cv::Rect bounds(0, 0, size.width, size.height);
    for (const auto& r : regions)
        for (const auto& p : r.pixels)
            if (bounds.contains(p))
                mask(p) = 255;
    return mask;
}

cv::Mat1i LabelMapping::labelsFromRegions(const std::vector<RegionRecord>& regions, const cv::Size& size)
{
    cv::Mat1i labels = cv::Mat1i::zeros(size);
    const cv::Rect bounds(0, 0, size.width, size.height);
    for (const auto& r : regions)
        for (const auto& p : r.pixels)
            if (bounds.contains(p))
                labels(p) = r.id;
    return labels;
}

} // namespace cellquant
