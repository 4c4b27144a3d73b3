#ifndef UTILS_H
#define UTILS_H

#include <stdexcept>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

namespace cellquant {

/**
 * @brief Image or mask geometry does not match what a stage expects
 *        (wrong channel count, not 2-D, or size mismatch with the nuclear mask).
 */
class InputShapeError : public std::invalid_argument {
public:
    explicit InputShapeError(const std::string& what) : std::invalid_argument(what) {}
};

/// Включается из конфигурации (debug.show).
inline bool debugDisplayEnabled = false;

/// true, если окно показать нельзя: задан CELLQUANT_HEADLESS или нет DISPLAY.
static bool isHeadlessMode()
{
    if (std::getenv("CELLQUANT_HEADLESS"))
        return true;
    const char* display = std::getenv("DISPLAY");
    return display == nullptr || *display == '\0';
}

// Функция для вычисления kernel size по sigma: правило 2*ceil(3*sigma)+1
static int getKernelSize(double sigma) {
    return static_cast<int>(2 * std::ceil(3 * sigma) + 1);
}

/// Читаемый вывод cv::Mat::type()
static std::string matTypeStr(int t)
{
    const int depth = t & CV_MAT_DEPTH_MASK;
    const int chans = 1 + (t >> CV_CN_SHIFT);

    const char* depthStr =
        depth == CV_8U  ? "CV_8U"  :
        depth == CV_8S  ? "CV_8S"  :
        depth == CV_16U ? "CV_16U" :
        depth == CV_16S ? "CV_16S" :
        depth == CV_32S ? "CV_32S" :
        depth == CV_32F ? "CV_32F" :
        depth == CV_64F ? "CV_64F" : "UNKNOWN";

    std::ostringstream oss;
    oss << depthStr << 'C' << chans;
    return oss.str();
}

/**
 * @brief Load a multi-channel fluorescence image as CV_32FC3 in RGB order, scaled to [0,1].
 *
 * 8-bit samples are divided by 255, 16-bit by 65535, float images are taken as is.
 * A single-channel file is rejected with InputShapeError.
 */
static cv::Mat loadImageFromFile(const std::filesystem::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR);
    if (img.empty()) {
        throw std::runtime_error("Could not load image: " + path.string());
    }
    if (img.channels() == 4)
        cv::cvtColor(img, img, cv::COLOR_BGRA2BGR);
    if (img.channels() != 3) {
        throw InputShapeError("Expected a 3-channel image, got " + matTypeStr(img.type()) +
                              ": " + path.string());
    }

    double scale = 1.0;
    switch (img.depth()) {
        case CV_8U:  scale = 1.0 / 255.0;   break;
        case CV_16U: scale = 1.0 / 65535.0; break;
        case CV_32F:
        case CV_64F: scale = 1.0;           break;
        default:
            throw std::runtime_error("Unsupported sample type " + matTypeStr(img.type()) +
                                     ": " + path.string());
    }

    cv::Mat rgb;
    cv::cvtColor(img, rgb, cv::COLOR_BGR2RGB);
    cv::Mat imgFloat;
    rgb.convertTo(imgFloat, CV_32FC3, scale);
    return imgFloat;
}

/// Проверка: ровно 3 канала, непустое 2-D изображение.
static void requireThreeChannels(const cv::Mat& image, const char* where) {
    if (image.empty() || image.dims != 2 || image.channels() != 3) {
        throw InputShapeError(std::string(where) + ": expected a 3-channel 2-D image, got " +
                              matTypeStr(image.type()));
    }
}

/// Проверка: одноканальное непустое 2-D изображение.
static void requireSingleChannel(const cv::Mat& image, const char* where) {
    if (image.empty() || image.dims != 2 || image.channels() != 1) {
        throw InputShapeError(std::string(where) + ": expected a single-channel 2-D image, got " +
                              matTypeStr(image.type()));
    }
}

/**
 *  Конвертирует произвольный cv::Mat -> CV_8U, 1 или 3 канала.
 *
 *  @param  src             любая матрица (глубина 8/16/32, 1 или 3 канала)
 *  @param  applyColorMap   true  => к 1-канальному применяем COLORMAP_JET
 *  @param  dst             результат, которым можно сразу imshow(...)
 */
static inline bool toDisplayable(const cv::Mat& src,
                          cv::Mat&       dst,
                          bool           applyColorMap = false)
{
    if(src.empty())
        return false;

    cv::Mat tmp;

    /* ---------- приведём глубину к 8-бит -------------------------------- */
    if (src.depth() == CV_8U) {
        tmp = src;
    } else {
        double minVal, maxVal;
        cv::minMaxLoc(src.reshape(1), &minVal, &maxVal);
        if (maxVal - minVal < 1e-12) maxVal = minVal + 1.0;

        double scale = 255.0 / (maxVal - minVal);
        double shift = -minVal * scale;
        src.convertTo(tmp, CV_8U, scale, shift);
    }

    /* ---------- RGB -> BGR для imshow ----------------------------------- */
    if (tmp.channels() == 1) {
        if (applyColorMap)
            cv::applyColorMap(tmp, dst, cv::COLORMAP_JET);
        else
            dst = tmp;
    } else if (tmp.channels() == 3) {
        cv::cvtColor(tmp, dst, cv::COLOR_RGB2BGR);
    } else {
        return false;
    }
    return true;
}

/// Показ промежуточного растра; ничего не делает без debug.show или без дисплея.
static void showMatDebug(const std::string &windowName, const cv::Mat &mat, bool isColor = false)
{
    if (!debugDisplayEnabled || isHeadlessMode())
        return;

    cv::Mat vis;
    if(toDisplayable(mat, vis, isColor))
    {
        cv::namedWindow(windowName, cv::WINDOW_NORMAL | cv::WINDOW_KEEPRATIO);
        cv::resizeWindow(windowName, mat.cols, mat.rows);
        cv::imshow(windowName, vis);
        cv::waitKey(0);
    }
}

/*-------------------------------------------------------------------------*/
/*  проверка совместимости                                                 */
/*-------------------------------------------------------------------------*/
/**
 * @brief   Проверить, одинаковы ли размеры набора матриц.
 * @return  true – совместимы. Иначе подробности выводятся в std::cerr.
 */
static bool checkSizeCompatibility(const std::vector<cv::Mat>& mats)
{
    if (mats.size() < 2)
        return true;

    const cv::Size refSize = mats[0].size();
    bool sizeMismatch = false;
    for (size_t i = 1; i < mats.size(); ++i)
        if (mats[i].size() != refSize) sizeMismatch = true;

    if (!sizeMismatch)
        return true;

    std::cerr << "[checkSizeCompatibility] mismatch detected:\n";
    for (size_t i = 0; i < mats.size(); ++i)
        std::cerr << "  #" << i << ": size = " << mats[i].cols << 'x' << mats[i].rows
                  << ", type = " << matTypeStr(mats[i].type()) << '\n';
    return false;
}

/// Вариадик-обёртка: бросает InputShapeError при несовпадении размеров.
template<typename... Mats>
void requireSameSize(const char* where, const cv::Mat& m0, const cv::Mat& m1, const Mats&... rest)
{
    std::vector<cv::Mat> pack = { m0, m1, rest... };
    if (!checkSizeCompatibility(pack))
        throw InputShapeError(std::string(where) + ": image and mask sizes differ");
}

} // namespace cellquant

#endif // UTILS_H
