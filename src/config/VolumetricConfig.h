// SPDX-License-Identifier: MIT
#pragma once

#include "volumetric/LightFrustum.h"
#include "volumetric/VolumetricSettings.h"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <stdexcept>

struct ConfigurationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct VolumetricConfig {
    VolumetricSettings volumetric {};
    DirectionalLight light {};
};

// Missing keys keep their defaults; present keys are type- and range-checked.
[[nodiscard]] VolumetricConfig parseVolumetricConfig(const nlohmann::json& root);
[[nodiscard]] VolumetricConfig loadVolumetricConfig(const std::filesystem::path& path);

// Throws ConfigurationError naming the first offending key.
void validateVolumetricConfig(const VolumetricConfig& config);

[[nodiscard]] nlohmann::json toJson(const VolumetricConfig& config);

// Validates, then writes the configuration as indented JSON.
void saveVolumetricConfig(const VolumetricConfig& config, const std::filesystem::path& path);
