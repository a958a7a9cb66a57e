// SPDX-License-Identifier: MIT
#pragma once

#include "volumetric/ScatteringIntegrator.h"

// Everything the volumetric core reads from configuration.
struct VolumetricSettings {
    int shadowSize { 1024 };
    MediumParameters medium {};
    float shadowThresholdNarrowness { 256.0f };
    DistanceModel distanceModel { DistanceModel::ReciprocalDepth };
    // Attenuate surfaces by the medium between them and the camera.
    bool cameraSubmerged { false };
};
