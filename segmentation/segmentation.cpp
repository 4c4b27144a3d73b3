#include "segmentation.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace cellquant {

cv::Mat1b Segmentation::toMask(const cv::Mat& src) {
    requireSingleChannel(src, "Segmentation::toMask");
    cv::Mat1b mask;
    cv::compare(src, 0, mask, cv::CMP_NE);
    return mask;
}

cv::Mat1b Segmentation::removeSmallConnectedComponents(const cv::Mat& src, const std::string& method,
                                                       int min_size, int connectivity, bool debug) {
    cv::Mat1b srcMask = toMask(src);

    // Находим связанные компоненты
    cv::Mat labels, stats, centroids;
    int num_components = cv::connectedComponentsWithStats(srcMask, labels, stats, centroids, connectivity, CV_32S);

    // Размеры компонентов (без фона с меткой 0)
    std::vector<int> sizes;
    for (int i = 1; i < num_components; i++) {
        sizes.push_back(stats.at<int>(i, cv::CC_STAT_AREA));
    }
    if (sizes.empty())
        return cv::Mat1b::zeros(srcMask.size());

    // Порог фильтрации по выбранному методу
    double threshold_val = 0.0;
    if (method == "fixed") {
        threshold_val = min_size;
    } else if (method == "mean") {
        threshold_val = std::accumulate(sizes.begin(), sizes.end(), 0.0) / sizes.size();
    } else if (method == "median") {
        std::vector<int> sorted = sizes;
        std::sort(sorted.begin(), sorted.end());
        const size_t n = sorted.size();
        threshold_val = (n % 2 == 1) ? sorted[n / 2] : 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
    } else {
        throw std::runtime_error("Unknown method in removeSmallConnectedComponents: " + method);
    }

    cv::Mat1b result = cv::Mat1b::zeros(srcMask.size());
    int kept = 0;
    for (int y = 0; y < labels.rows; y++) {
        const int* row = labels.ptr<int>(y);
        uchar* out = result.ptr<uchar>(y);
        for (int x = 0; x < labels.cols; x++) {
            int label = row[x];
            if (label > 0 && sizes[label - 1] >= threshold_val)
                out[x] = 255;
        }
    }
    if (debug) {
        for (int s : sizes)
            if (s >= threshold_val) ++kept;
        std::cout << "[removeSmallConnectedComponents] " << method << " threshold " << threshold_val
                  << ": kept " << kept << " of " << sizes.size() << " components" << std::endl;
    }
    return result;
}

cv::Mat1b Segmentation::fillHoles(const cv::Mat& mask) {
    cv::Mat1b src = toMask(mask);

    // Рамка в 1 пиксель гарантирует, что весь внешний фон связан с углом.
    cv::Mat1b padded;
    cv::copyMakeBorder(src, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    cv::Mat1b background = padded.clone();
    cv::floodFill(background, cv::Point(0, 0), cv::Scalar(255), nullptr,
                  cv::Scalar(0), cv::Scalar(0), 4);

    // Дыры = то, что осталось нулём после заливки снаружи.
    cv::Mat1b holes;
    cv::bitwise_not(background, holes);
    cv::Mat1b filled = padded | holes;
    return filled(cv::Rect(1, 1, src.cols, src.rows)).clone();
}

cv::Mat1b Segmentation::clearBorder(const cv::Mat& mask) {
    cv::Mat1b src = toMask(mask);
    if (src.empty())
        return src;

    cv::Mat1i labels;
    int n = cv::connectedComponents(src, labels, 8, CV_32S);
    std::vector<bool> touches(n, false);
    const int lastRow = labels.rows - 1, lastCol = labels.cols - 1;
    for (int x = 0; x <= lastCol; ++x) {
        touches[labels(0, x)] = true;
        touches[labels(lastRow, x)] = true;
    }
    for (int y = 0; y <= lastRow; ++y) {
        touches[labels(y, 0)] = true;
        touches[labels(y, lastCol)] = true;
    }

    cv::Mat1b result = cv::Mat1b::zeros(src.size());
    for (int y = 0; y < labels.rows; ++y)
        for (int x = 0; x < labels.cols; ++x) {
            int l = labels(y, x);
            if (l > 0 && !touches[l])
                result(y, x) = 255;
        }
    return result;
}

cv::Mat Segmentation::diskKernel(int radius) {
    if (radius < 0)
        throw std::invalid_argument("diskKernel: negative radius");
    const int side = 2 * radius + 1;
    return cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(side, side));
}

cv::Mat1b Segmentation::closeDisk(const cv::Mat& mask, int radius) {
    cv::Mat1b src = toMask(mask);
    if (radius <= 0)
        return src;
    cv::Mat1b result;
    // Константная рамка 0: замыкание не приклеивает объекты к краю.
    cv::morphologyEx(src, result, cv::MORPH_CLOSE, diskKernel(radius), cv::Point(-1, -1), 1,
                     cv::BORDER_CONSTANT, cv::Scalar(0));
    return result;
}

cv::Mat1b Segmentation::dilateDisk(const cv::Mat& mask, int radius) {
    cv::Mat1b src = toMask(mask);
    if (radius <= 0)
        return src;
    cv::Mat1b result;
    cv::dilate(src, result, diskKernel(radius), cv::Point(-1, -1), 1,
               cv::BORDER_CONSTANT, cv::Scalar(0));
    return result;
}

cv::Mat Segmentation::openDisk(const cv::Mat& src, int radius) {
    if (radius <= 0)
        return src.clone();
    cv::Mat result;
    cv::morphologyEx(src, result, cv::MORPH_OPEN, diskKernel(radius));
    return result;
}

cv::Mat1f Segmentation::normalizeRange(const cv::Mat& src) {
    requireSingleChannel(src, "Segmentation::normalizeRange");
    double minVal, maxVal;
    cv::minMaxLoc(src, &minVal, &maxVal);
    cv::Mat1f result;
    if (maxVal - minVal < 1e-12) {
        result = cv::Mat1f::zeros(src.size());
        return result;
    }
    src.convertTo(result, CV_32F, 1.0 / (maxVal - minVal), -minVal / (maxVal - minVal));
    return result;
}

double Segmentation::otsuThreshold(const cv::Mat& img01) {
    requireSingleChannel(img01, "Segmentation::otsuThreshold");
    cv::Mat img8u;
    img01.convertTo(img8u, CV_8U, 255.0);
    cv::Mat dummy;
    double level = cv::threshold(img8u, dummy, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return level / 255.0;
}

double Segmentation::percentile(const cv::Mat& src, double p) {
    requireSingleChannel(src, "Segmentation::percentile");
    cv::Mat1f values;
    cv::Mat continuous = src.isContinuous() ? src : src.clone();
    continuous.reshape(1, 1).convertTo(values, CV_32F);
    std::vector<float> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());

    // Ранг i-го элемента соответствует процентилю 100*(i+0.5)/n.
    const double n = static_cast<double>(sorted.size());
    const double rank = p / 100.0 * n - 0.5;
    if (rank <= 0.0)
        return sorted.front();
    if (rank >= n - 1.0)
        return sorted.back();
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const double frac = rank - lo;
    return sorted[lo] + frac * (sorted[lo + 1] - sorted[lo]);
}

cv::Mat1b Segmentation::keepLabels(const cv::Mat1i& labels, const std::vector<int>& keep) {
    int maxLabel = 0;
    for (int l : keep)
        maxLabel = std::max(maxLabel, l);
    std::vector<bool> lut(maxLabel + 1, false);
    for (int l : keep)
        if (l > 0) lut[l] = true;

    cv::Mat1b result = cv::Mat1b::zeros(labels.size());
    for (int y = 0; y < labels.rows; ++y)
        for (int x = 0; x < labels.cols; ++x) {
            int l = labels(y, x);
            if (l > 0 && l <= maxLabel && lut[l])
                result(y, x) = 255;
        }
    return result;
}

} // namespace cellquant
