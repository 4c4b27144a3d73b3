#include "config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace cellquant {

namespace {

template <typename T>
void read(const YAML::Node& n, const char* key, T& value)
{
    if (n[key])
        value = n[key].as<T>();
}

/* null -> предикат выключен */
void readOptional(const YAML::Node& n, const char* key, std::optional<double>& value)
{
    if (!n[key])
        return;
    if (n[key].IsNull())
        value.reset();
    else
        value = n[key].as<double>();
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

BackgroundMethod parseBackground(const std::string& s)
{
    const std::string v = lower(s);
    if (v == "none") return BackgroundMethod::None;
    if (v == "opening") return BackgroundMethod::Opening;
    if (v == "gaussian") return BackgroundMethod::Gaussian;
    throw std::runtime_error("[ConfigLoader] unknown background method: " + s);
}

ThresholdMethod parseThreshold(const std::string& s)
{
    const std::string v = lower(s);
    if (v == "otsu") return ThresholdMethod::Otsu;
    if (v == "percentile") return ThresholdMethod::Percentile;
    throw std::runtime_error("[ConfigLoader] unknown threshold method: " + s);
}

OverlapPolicy parseOverlap(const std::string& s)
{
    const std::string v = lower(s);
    if (v == "discard" || v == "discard_region") return OverlapPolicy::DiscardRegion;
    if (v == "clip" || v == "clip_pixels") return OverlapPolicy::ClipPixels;
    throw std::runtime_error("[ConfigLoader] unknown overlap policy: " + s);
}

void readClahe(const YAML::Node& n, ClaheConfig& c)
{
    if (!n) return;
    read(n, "clip_limit", c.clipLimit);
    read(n, "tiles_x", c.tilesX);
    read(n, "tiles_y", c.tilesY);
}

/* секция с детекторами: неизвестные имена только предупреждаем */
void warnUnknown(const YAML::Node& section, const std::string& where,
                 std::initializer_list<const char*> known)
{
    if (!section.IsMap())
        return;
    for (const auto& kv : section) {
        const std::string key = kv.first.as<std::string>();
        const bool found = std::any_of(known.begin(), known.end(),
                                       [&](const char* k) { return key == k; });
        if (!found)
            std::cerr << "[ConfigLoader] warning: ignoring unknown entry '"
                      << where << key << "'" << std::endl;
    }
}

} // namespace

void ConfigLoader::readEnhancer(const YAML::Node& n, EnhancerConfig& c)
{
    if (!n) return;
    read(n, "equalize", c.equalize);
    readClahe(n["clahe"], c.clahe);
    if (n["background"])
        c.background = parseBackground(n["background"].as<std::string>());
    read(n, "opening_radius", c.openingRadius);
    read(n, "gaussian_sigma", c.gaussianSigma);
}

void ConfigLoader::readDoG(const YAML::Node& n, DoGConfig& c)
{
    if (!n) return;
    read(n, "pre_smooth_sigma", c.preSmoothSigma);
    read(n, "sigma_small", c.sigmaSmall);
    read(n, "sigma_large", c.sigmaLarge);
    if (n["method"])
        c.method = parseThreshold(n["method"].as<std::string>());
    read(n, "percentile", c.percentile);
    read(n, "offset", c.offset);
}

void ConfigLoader::readCleanup(const YAML::Node& n, CleanupConfig& c)
{
    if (!n) return;
    read(n, "min_pixels", c.minPixels);
    read(n, "close_radius", c.closeRadius);
    read(n, "fill_holes", c.fillHoles);
}

void ConfigLoader::readShape(const YAML::Node& n, ShapeFilterConfig& c)
{
    if (!n) return;
    read(n, "min_area", c.minArea);
    read(n, "max_area", c.maxArea);
    readOptional(n, "min_circularity", c.minCircularity);
    readOptional(n, "max_eccentricity", c.maxEccentricity);
    readOptional(n, "min_solidity", c.minSolidity);
    readOptional(n, "min_entropy", c.minEntropy);
    read(n, "entropy_window", c.entropyWindow);
}

void ConfigLoader::readContext(const YAML::Node& n, ContextFilterConfig& c)
{
    if (!n) return;
    read(n, "exclude_nuclear_overlap", c.excludeNuclearOverlap);
    if (n["overlap_policy"])
        c.overlapPolicy = parseOverlap(n["overlap_policy"].as<std::string>());
    read(n, "distance_filter", c.distanceFilter);
    read(n, "adaptive_background", c.adaptiveBackground);
    read(n, "max_dist", c.maxDist);
    read(n, "max_dist_low_bg", c.maxDistLowBg);
    read(n, "max_dist_high_bg", c.maxDistHighBg);
    read(n, "background_threshold", c.backgroundThreshold);
    read(n, "ring_radius", c.ringRadius);
}

void ConfigLoader::readBlob(const YAML::Node& n, BlobDetectorConfig& c)
{
    if (!n) return;
    readEnhancer(n["enhancer"], c.enhancer);
    readDoG(n["dog"], c.dog);
    readCleanup(n["cleanup"], c.cleanup);
    readShape(n["shape"], c.shape);
    readContext(n["context"], c.context);
    read(n, "use_steerable", c.useSteerable);
    if (n["sdog"]) {
        read(n["sdog"], "sigma", c.sdog.sigma);
        read(n["sdog"], "offset", c.sdog.offset);
    }
    read(n, "combine_intensity_threshold", c.combineIntensityThreshold);
}

void ConfigLoader::readDiffuse(const YAML::Node& n, DiffuseDetectorConfig& c)
{
    if (!n) return;
    read(n, "intensity_threshold", c.intensityThreshold);
    read(n, "num_clusters", c.numClusters);
    read(n, "max_samples", c.maxSamples);
    read(n, "replicates", c.replicates);
    read(n, "max_iterations", c.maxIterations);
    read(n, "min_pixels", c.minPixels);
    read(n, "close_radius", c.closeRadius);
    read(n, "seed", c.seed);
    readContext(n["context"], c.context);
}

void ConfigLoader::readNucleus(const YAML::Node& n, NucleusConfig& c)
{
    if (!n) return;
    readClahe(n["clahe"], c.clahe);
    read(n, "otsu_scale", c.otsuScale);
    read(n, "min_area", c.minArea);
    read(n, "border_margin", c.borderMargin);
    read(n, "clear_border", c.clearBorder);
    read(n, "merge_small", c.mergeSmall);
    read(n, "merge_area_fraction", c.mergeAreaFraction);
    read(n, "merge_dist", c.mergeDist);
}

void ConfigLoader::readColocalization(const YAML::Node& n, ColocalizationConfig& c)
{
    if (!n) return;
    read(n, "dilate_radius", c.dilateRadius);
    read(n, "min_pixels", c.minPixels);
    read(n, "fill_holes", c.fillHoles);
    readShape(n["shape"], c.shape);
    read(n, "permutations", c.permutations);
    read(n, "seed", c.seed);
}

void ConfigLoader::readBatch(const YAML::Node& n, BatchConfig& c)
{
    if (!n) return;
    read(n, "workers", c.workers);
    read(n, "skip_existing", c.skipExisting);
    read(n, "write_images", c.writeImages);
    read(n, "write_reports", c.writeReports);
    read(n, "overlay_alpha", c.overlayAlpha);
    read(n, "nucleus_overlay_alpha", c.nucleusOverlayAlpha);
    read(n, "diffuse_overlay_alpha", c.diffuseOverlayAlpha);
    read(n, "extensions", c.extensions);
}

AnalysisConfig ConfigLoader::fromNode(const YAML::Node& root)
{
    AnalysisConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw std::runtime_error("[ConfigLoader] top level must be a map");

    try {
        warnUnknown(root, "", {"nucleus", "ld", "ros", "batch", "debug"});

        readNucleus(root["nucleus"], cfg.nucleus);

        if (const YAML::Node ld = root["ld"]) {
            warnUnknown(ld, "ld.", {"green", "red", "diffuse", "colocalization"});
            readBlob(ld["green"], cfg.greenLipid);
            readBlob(ld["red"], cfg.redLipid);
            readDiffuse(ld["diffuse"], cfg.diffuseLipid);
            readColocalization(ld["colocalization"], cfg.colocalization);
        }
        if (const YAML::Node ros = root["ros"]) {
            warnUnknown(ros, "ros.", {"punctate", "diffuse"});
            readBlob(ros["punctate"], cfg.ros);
            readDiffuse(ros["diffuse"], cfg.diffuseRos);
        }

        readBatch(root["batch"], cfg.batch);
        if (root["debug"])
            read(root["debug"], "show", cfg.debug.show);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("[ConfigLoader] bad value: ") + e.what());
    }
    return cfg;
}

AnalysisConfig ConfigLoader::loadFile(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("[ConfigLoader] failed to load " + path + ": " + e.what());
    }
    AnalysisConfig cfg = fromNode(root);
    std::cout << "[ConfigLoader] loaded config from: " << path << std::endl;
    return cfg;
}

} // namespace cellquant
