// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

// Homogeneous participating medium. Transparency is the fraction of light
// surviving one unit of travel, per channel, and must lie in (0, 1).
struct MediumParameters {
    glm::vec3 transparency { 0.92f };
    float scatter { 0.0f };
};

// How a cap fragment's distance to the camera is measured.
enum class DistanceModel {
    // near / ndc.z, i.e. depth along the view axis rather than along the ray.
    ReciprocalDepth,
    // Euclidean distance to the reconstructed view-space point.
    ViewRay,
};

// Closed-form in-scattering through a Beer-Lambert medium. The scattered
// light between distances a and b is contribution(a) - contribution(b), so
// every boundary of the lit volume adds its own term with the sign of its
// facing and the sum over a view ray is the integral along it.
class AnalyticScatteringIntegrator {
public:
    explicit AnalyticScatteringIntegrator(const MediumParameters& medium);

    [[nodiscard]] const MediumParameters& medium() const { return m_medium; }

    // scatter * transparency^d / -ln(transparency)
    [[nodiscard]] glm::vec3 contribution(float distance) const;
    // Positive where a ray enters the lit volume, negative where it leaves.
    [[nodiscard]] glm::vec3 signedContribution(float distance, bool frontFacing) const;
    // Light scattered over [entry, exit] inside the lit volume.
    [[nodiscard]] glm::vec3 segment(float entry, float exit) const;
    // transparency^d
    [[nodiscard]] glm::vec3 absorption(float distance) const;

private:
    MediumParameters m_medium;
    glm::vec3 m_extinction;
};

[[nodiscard]] float reciprocalDepthDistance(float nearPlane, float ndcDepth);
[[nodiscard]] float viewRayDistance(const glm::mat4& inverseProjection, const glm::vec2& ndcXY, float ndcDepth);
[[nodiscard]] float surfaceDistance(DistanceModel model, float nearPlane, const glm::mat4& inverseProjection,
    const glm::vec2& ndcXY, float ndcDepth);
