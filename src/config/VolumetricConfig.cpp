// SPDX-License-Identifier: MIT

#include "config/VolumetricConfig.h"

#include "volumetric/ShadowMap.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

namespace glm {

inline void to_json(nlohmann::json& j, const glm::vec3& v)
{
    j = nlohmann::json { v.x, v.y, v.z };
}

inline void from_json(const nlohmann::json& j, glm::vec3& v)
{
    if (!j.is_array() || j.size() != 3)
        throw ConfigurationError(fmt::format("expected an array of 3 numbers, got {}", j.dump()));
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
    v.z = j.at(2).get<float>();
}

} // namespace glm

namespace {

constexpr const char* kReciprocalDepth = "reciprocal_depth";
constexpr const char* kViewRay = "view_ray";

template <typename T>
void readOptional(const nlohmann::json& object, const char* key, T& target)
{
    if (!object.contains(key))
        return;
    try {
        target = object.at(key).get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigurationError(fmt::format("Invalid value for '{}': {}", key, ex.what()));
    } catch (const ConfigurationError& ex) {
        throw ConfigurationError(fmt::format("Invalid value for '{}': {}", key, ex.what()));
    }
}

[[nodiscard]] DistanceModel parseDistanceModel(const std::string& name)
{
    if (name == kReciprocalDepth)
        return DistanceModel::ReciprocalDepth;
    if (name == kViewRay)
        return DistanceModel::ViewRay;
    throw ConfigurationError(fmt::format(
        "Invalid value for 'distance_model': '{}' (expected '{}' or '{}')", name, kReciprocalDepth, kViewRay));
}

[[nodiscard]] const char* distanceModelName(DistanceModel model)
{
    return model == DistanceModel::ViewRay ? kViewRay : kReciprocalDepth;
}

void parseLight(const nlohmann::json& object, DirectionalLight& light)
{
    if (!object.is_object())
        throw ConfigurationError("Invalid value for 'light': expected an object");
    readOptional(object, "direction", light.direction);
    readOptional(object, "focus", light.focus);
    readOptional(object, "half_extent", light.halfExtent);
    readOptional(object, "depth_range", light.depthRange);
}

} // namespace

VolumetricConfig parseVolumetricConfig(const nlohmann::json& root)
{
    if (!root.is_object())
        throw ConfigurationError("Volumetric configuration must be a JSON object");

    VolumetricConfig config;
    VolumetricSettings& settings = config.volumetric;
    readOptional(root, "shadow_size", settings.shadowSize);
    readOptional(root, "transparency", settings.medium.transparency);
    readOptional(root, "scatter", settings.medium.scatter);
    readOptional(root, "shadow_threshold_narrowness", settings.shadowThresholdNarrowness);
    readOptional(root, "camera_submerged", settings.cameraSubmerged);

    std::string distanceModel = distanceModelName(settings.distanceModel);
    readOptional(root, "distance_model", distanceModel);
    settings.distanceModel = parseDistanceModel(distanceModel);

    if (root.contains("light"))
        parseLight(root.at("light"), config.light);

    validateVolumetricConfig(config);
    return config;
}

VolumetricConfig loadVolumetricConfig(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigurationError(fmt::format("Failed to open configuration file {}", path.string()));

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigurationError(fmt::format("Failed to parse {}: {}", path.string(), ex.what()));
    }
    return parseVolumetricConfig(root);
}

void validateVolumetricConfig(const VolumetricConfig& config)
{
    const VolumetricSettings& settings = config.volumetric;
    if (settings.shadowSize < kMinShadowSize || settings.shadowSize > kMaxShadowSize)
        throw ConfigurationError(fmt::format("'shadow_size' must lie in [{}, {}], got {}",
            kMinShadowSize, kMaxShadowSize, settings.shadowSize));

    for (int channel = 0; channel < 3; ++channel) {
        const float value = settings.medium.transparency[channel];
        if (!(value > 0.0f && value < 1.0f))
            throw ConfigurationError(fmt::format(
                "'transparency' component {} must lie in (0, 1), got {}", channel, value));
    }

    if (!(settings.medium.scatter >= 0.0f))
        throw ConfigurationError(fmt::format("'scatter' must be non-negative, got {}", settings.medium.scatter));
    if (!(settings.shadowThresholdNarrowness > 0.0f))
        throw ConfigurationError(fmt::format(
            "'shadow_threshold_narrowness' must be positive, got {}", settings.shadowThresholdNarrowness));

    if (!(config.light.halfExtent > 0.0f))
        throw ConfigurationError(fmt::format("'light.half_extent' must be positive, got {}", config.light.halfExtent));
    if (!(config.light.depthRange > 0.0f))
        throw ConfigurationError(fmt::format("'light.depth_range' must be positive, got {}", config.light.depthRange));
}

nlohmann::json toJson(const VolumetricConfig& config)
{
    const VolumetricSettings& settings = config.volumetric;
    return {
        { "shadow_size", settings.shadowSize },
        { "transparency", settings.medium.transparency },
        { "scatter", settings.medium.scatter },
        { "shadow_threshold_narrowness", settings.shadowThresholdNarrowness },
        { "distance_model", distanceModelName(settings.distanceModel) },
        { "camera_submerged", settings.cameraSubmerged },
        { "light", {
            { "direction", config.light.direction },
            { "focus", config.light.focus },
            { "half_extent", config.light.halfExtent },
            { "depth_range", config.light.depthRange },
        } },
    };
}

void saveVolumetricConfig(const VolumetricConfig& config, const std::filesystem::path& path)
{
    validateVolumetricConfig(config);

    std::ofstream file(path);
    if (!file)
        throw ConfigurationError(fmt::format("Failed to open {} for writing", path.string()));
    file << toJson(config).dump(4) << '\n';
}
