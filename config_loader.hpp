#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "config.hpp"
#include "yaml-cpp/yaml.h"

namespace cellquant {

/**
 * @brief Read an AnalysisConfig from YAML.
 *
 * Layout (every key optional, missing keys keep the preset defaults):
 * @code
 * nucleus:   { otsu_scale: 0.9, min_area: 100, clahe: { clip_limit: 0.01 } }
 * ld:
 *   green:          { dog: { sigma_small: 1.0 }, shape: { max_eccentricity: 0.75 } }
 *   red:            { use_steerable: true, sdog: { sigma: 1.0 } }
 *   diffuse:        { intensity_threshold: 0.05 }
 *   colocalization: { permutations: 100 }
 * ros:
 *   punctate:       { dog: { method: otsu, offset: 0.03 } }
 *   diffuse:        { intensity_threshold: 0.01 }
 * batch:     { workers: 4, skip_existing: true }
 * debug:     { show: false }
 * @endcode
 * Optional shape predicates accept `null` to disable them.
 */
class ConfigLoader
{
public:
    /**
     * @throws std::runtime_error if the file cannot be read or parsed, or a
     *         value has the wrong type
     */
    static AnalysisConfig loadFile(const std::string& path);

    /// Same as loadFile, from an already parsed document.
    static AnalysisConfig fromNode(const YAML::Node& root);

    static void readEnhancer(const YAML::Node& n, EnhancerConfig& c);
    static void readDoG(const YAML::Node& n, DoGConfig& c);
    static void readCleanup(const YAML::Node& n, CleanupConfig& c);
    static void readShape(const YAML::Node& n, ShapeFilterConfig& c);
    static void readContext(const YAML::Node& n, ContextFilterConfig& c);
    static void readBlob(const YAML::Node& n, BlobDetectorConfig& c);
    static void readDiffuse(const YAML::Node& n, DiffuseDetectorConfig& c);
    static void readNucleus(const YAML::Node& n, NucleusConfig& c);
    static void readColocalization(const YAML::Node& n, ColocalizationConfig& c);
    static void readBatch(const YAML::Node& n, BatchConfig& c);
};

} // namespace cellquant

#endif // CONFIG_LOADER_HPP
