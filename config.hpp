#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cellquant {

    /** Semantic channel indices of an analysed image (RGB order after loading). */
    enum Channel : int {
        Red = 0,   ///< lipid / red marker
        Green = 1, ///< primary marker (LDs, ROS dye)
        Blue = 2   ///< nuclear stain (DAPI)
    };

    /** Contrast-limited adaptive histogram equalisation. */
    struct ClaheConfig {
        double clipLimit = 0.01; ///< normalised clip limit in [0,1]
        int tilesX = 8;          ///< number of tiles along x
        int tilesY = 8;          ///< number of tiles along y
    };

    /** How the background estimate is obtained before subtraction. */
    enum class BackgroundMethod {
        None,     ///< no background subtraction
        Opening,  ///< morphological opening with a disk
        Gaussian  ///< large-kernel Gaussian blur
    };

    /** Configuration of the channel enhancer. */
    struct EnhancerConfig {
        bool equalize = true;                                   ///< apply CLAHE first
        ClaheConfig clahe;                                      ///< CLAHE parameters
        BackgroundMethod background = BackgroundMethod::Opening;///< background model
        int openingRadius = 15;                                 ///< disk radius for Opening
        double gaussianSigma = 20.0;                            ///< sigma for Gaussian
    };

    enum class ThresholdMethod {
        Otsu,       ///< global Otsu level of the normalised response
        Percentile  ///< fixed high percentile of the normalised response
    };

    /** Difference-of-Gaussians band-pass and its threshold. */
    struct DoGConfig {
        double preSmoothSigma = 0.0;  ///< optional pre-smoothing (0 = off)
        double sigmaSmall = 1.0;      ///< narrow Gaussian
        double sigmaLarge = 2.0;      ///< wide Gaussian
        ThresholdMethod method = ThresholdMethod::Percentile;
        double percentile = 98.0;     ///< used with ThresholdMethod::Percentile
        double offset = 0.0;          ///< added to the threshold
    };

    /** Steerable (Gaussian-derivative) detector. */
    struct SDoGConfig {
        double sigma = 1.0;  ///< scale of the derivative kernels
        double offset = 0.0; ///< added to the Otsu level
    };

    /** Morphological cleanup applied to every thresholded response. */
    struct CleanupConfig {
        int minPixels = 5;     ///< remove 8-connected components smaller than this
        int closeRadius = 1;   ///< closing disk radius (0 = off)
        bool fillHoles = true; ///< fill enclosed holes
    };

    /** Shape predicates; an unset optional disables the predicate. */
    struct ShapeFilterConfig {
        int minArea = 4;                        ///< inclusive lower bound
        int maxArea = 300;                      ///< inclusive upper bound
        std::optional<double> minCircularity;   ///< circularity must be greater
        std::optional<double> maxEccentricity;  ///< eccentricity must be smaller
        std::optional<double> minSolidity;      ///< solidity must be greater
        std::optional<double> minEntropy;       ///< mean local entropy must be greater
        int entropyWindow = 9;                  ///< side of the entropy neighbourhood
    };

    /** What happens to a region that shares pixels with the nuclear mask. */
    enum class OverlapPolicy {
        DiscardRegion, ///< the whole region is dropped
        ClipPixels     ///< only the shared pixels are removed
    };

    /** Nucleus-relative context predicates. */
    struct ContextFilterConfig {
        bool excludeNuclearOverlap = true;
        OverlapPolicy overlapPolicy = OverlapPolicy::DiscardRegion;
        bool distanceFilter = true;        ///< apply a distance-to-nucleus bound
        bool adaptiveBackground = false;   ///< branch the bound on local background
        double maxDist = 90.0;             ///< bound when adaptiveBackground is off
        double maxDistLowBg = 125.0;       ///< bound for a weak background ring
        double maxDistHighBg = 90.0;       ///< bound for a strong background ring
        double backgroundThreshold = 0.1;  ///< ring mean separating weak/strong
        int ringRadius = 10;               ///< dilation radius of the background ring
    };

    /** Punctate (blob) detector preset. */
    struct BlobDetectorConfig {
        EnhancerConfig enhancer;
        DoGConfig dog;
        CleanupConfig cleanup;
        ShapeFilterConfig shape;
        ContextFilterConfig context;
        bool useSteerable = false;           ///< add the SDOG branch and combine
        SDoGConfig sdog;
        double combineIntensityThreshold = 0.15; ///< raw-channel mean for single-method objects
    };

    /** Intensity clustering detector for soft-edged regions. */
    struct DiffuseDetectorConfig {
        double intensityThreshold = 0.05; ///< pixels at or below are not clustered
        int numClusters = 3;
        int maxSamples = 50000;           ///< sample budget for initial centres
        int replicates = 3;               ///< k-means attempts on the sample
        int maxIterations = 100;          ///< full-image refinement budget
        int minPixels = 30;
        int closeRadius = 3;
        std::uint64_t seed = 0;           ///< sampling / initialisation seed
        ContextFilterConfig context;
    };

    /** Nucleus segmentation on the blue channel. */
    struct NucleusConfig {
        ClaheConfig clahe;
        double otsuScale = 0.9;         ///< multiplier applied to the Otsu level
        int minArea = 100;              ///< minimum nucleus area in pixels
        int borderMargin = 5;           ///< centroid distance to the image border
        bool clearBorder = true;        ///< drop components touching the border
        bool mergeSmall = true;         ///< merge small fragments into nearby nuclei
        double mergeAreaFraction = 0.4; ///< "small" = area < fraction * median
        double mergeDist = 15.0;        ///< centroid distance for merging
    };

    /** Colocalisation detection and statistics. */
    struct ColocalizationConfig {
        int dilateRadius = 1;
        int minPixels = 5;
        bool fillHoles = true;
        ShapeFilterConfig shape;
        int permutations = 100;  ///< shuffles for the p-value
        std::uint64_t seed = 0;
    };

    /** Batch orchestration. */
    struct BatchConfig {
        int workers = 1;                 ///< concurrent images
        bool skipExisting = true;        ///< skip images whose overlay already exists
        bool writeImages = true;         ///< PNG dumps of masks and overlays
        bool writeReports = true;        ///< CSV tables
        double overlayAlpha = 0.5;       ///< label overlay transparency
        double nucleusOverlayAlpha = 0.6;
        double diffuseOverlayAlpha = 0.4;
        std::vector<std::string> extensions = {".tif", ".tiff"};
    };

    /** Debug display. */
    struct DebugConfig {
        bool show = false; ///< imshow intermediate rasters when not headless
    };

    /** Green LD preset. */
    inline BlobDetectorConfig greenLipidDefaults()
    {
        BlobDetectorConfig c;
        c.enhancer.background = BackgroundMethod::Opening;
        c.enhancer.openingRadius = 15;
        c.dog.sigmaSmall = 1.0;
        c.dog.sigmaLarge = 2.0;
        c.dog.method = ThresholdMethod::Percentile;
        c.dog.percentile = 98.0;
        c.shape.minArea = 4;
        c.shape.maxArea = 300;
        c.shape.maxEccentricity = 0.75;
        c.shape.minSolidity = 0.7;
        c.context.adaptiveBackground = true;
        return c;
    }

    /** Red LD preset (DoG + SDOG combination). */
    inline BlobDetectorConfig redLipidDefaults()
    {
        BlobDetectorConfig c;
        c.enhancer.background = BackgroundMethod::Opening;
        c.enhancer.openingRadius = 15;
        c.dog.sigmaSmall = 1.5;
        c.dog.sigmaLarge = 3.0;
        c.dog.method = ThresholdMethod::Percentile;
        c.dog.percentile = 98.0;
        c.shape.minArea = 20;
        c.shape.maxArea = 300;
        c.shape.maxEccentricity = 0.85;
        c.shape.minSolidity = 0.7;
        c.context.adaptiveBackground = true;
        c.useSteerable = true;
        c.sdog.sigma = 1.0;
        c.combineIntensityThreshold = 0.15;
        return c;
    }

    /** Punctate ROS preset. */
    inline BlobDetectorConfig rosDefaults()
    {
        BlobDetectorConfig c;
        c.enhancer.background = BackgroundMethod::Gaussian;
        c.enhancer.gaussianSigma = 20.0;
        c.dog.preSmoothSigma = 1.0;
        c.dog.sigmaSmall = 1.0;
        c.dog.sigmaLarge = 2.0;
        c.dog.method = ThresholdMethod::Otsu;
        c.dog.offset = 0.03;
        c.shape.minArea = 30;
        c.shape.maxArea = 300;
        c.shape.minCircularity = 0.5;
        c.shape.maxEccentricity = 0.85;
        c.shape.minEntropy = 0.2;
        c.context.adaptiveBackground = false;
        c.context.maxDist = 90.0;
        return c;
    }

    inline DiffuseDetectorConfig diffuseLipidDefaults()
    {
        DiffuseDetectorConfig c;
        c.intensityThreshold = 0.05;
        c.context.overlapPolicy = OverlapPolicy::ClipPixels;
        return c;
    }

    inline DiffuseDetectorConfig diffuseRosDefaults()
    {
        DiffuseDetectorConfig c;
        c.intensityThreshold = 0.01;
        c.context.overlapPolicy = OverlapPolicy::ClipPixels;
        return c;
    }

    inline ColocalizationConfig colocalizationDefaults()
    {
        ColocalizationConfig c;
        c.shape.minArea = 20;
        c.shape.maxArea = 300;
        c.shape.maxEccentricity = 0.85;
        c.shape.minSolidity = 0.7;
        return c;
    }

    /** Combined configuration for both analysis workflows. */
    struct AnalysisConfig {
        NucleusConfig nucleus;
        BlobDetectorConfig greenLipid = greenLipidDefaults();
        BlobDetectorConfig redLipid = redLipidDefaults();
        DiffuseDetectorConfig diffuseLipid = diffuseLipidDefaults();
        ColocalizationConfig colocalization = colocalizationDefaults();
        BlobDetectorConfig ros = rosDefaults();
        DiffuseDetectorConfig diffuseRos = diffuseRosDefaults();
        BatchConfig batch;
        DebugConfig debug;
    };

} // namespace cellquant
