// SPDX-License-Identifier: MIT

#include "TestHelpers.h"

#include "volumetric/ScatteringIntegrator.h"

#include <gtest/gtest.h>

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

#include <cmath>

namespace {

MediumParameters fog()
{
    MediumParameters medium;
    medium.transparency = glm::vec3(0.9f, 0.8f, 0.95f);
    medium.scatter = 0.05f;
    return medium;
}

// Simpson's rule over scatter * transparency^t.
glm::vec3 integrateNumerically(const MediumParameters& medium, float from, float to)
{
    constexpr int steps = 2000;
    const float h = (to - from) / steps;
    glm::vec3 sum(0.0f);
    for (int i = 0; i <= steps; ++i) {
        const float t = from + h * static_cast<float>(i);
        const float weight = (i == 0 || i == steps) ? 1.0f : (i % 2 == 1 ? 4.0f : 2.0f);
        const glm::vec3 value(std::pow(medium.transparency.x, t), std::pow(medium.transparency.y, t), std::pow(medium.transparency.z, t));
        sum += weight * medium.scatter * value;
    }
    return sum * h / 3.0f;
}

} // namespace

TEST(ScatteringIntegrator, ContributionAtZeroIsScatterOverExtinction)
{
    const AnalyticScatteringIntegrator integrator(fog());
    const glm::vec3 c = integrator.contribution(0.0f);
    EXPECT_NEAR(c.x, 0.05f / -std::log(0.9f), 1e-5f);
    EXPECT_NEAR(c.y, 0.05f / -std::log(0.8f), 1e-5f);
    EXPECT_NEAR(c.z, 0.05f / -std::log(0.95f), 1e-5f);
}

TEST(ScatteringIntegrator, SegmentIsTheIntegralAlongTheRay)
{
    const MediumParameters medium = fog();
    const AnalyticScatteringIntegrator integrator(medium);
    expectVec3Near(integrator.segment(2.0f, 17.0f), integrateNumerically(medium, 2.0f, 17.0f), 1e-4f);
    expectVec3Near(integrator.segment(0.1f, 0.5f), integrateNumerically(medium, 0.1f, 0.5f), 1e-5f);
}

TEST(ScatteringIntegrator, SegmentsAdd)
{
    const AnalyticScatteringIntegrator integrator(fog());
    expectVec3Near(integrator.segment(1.0f, 4.0f) + integrator.segment(4.0f, 9.0f), integrator.segment(1.0f, 9.0f), 1e-5f);
}

TEST(ScatteringIntegrator, SignedContributionFollowsFacing)
{
    const AnalyticScatteringIntegrator integrator(fog());
    const glm::vec3 c = integrator.contribution(3.0f);
    expectVec3Near(integrator.signedContribution(3.0f, true), c, 0.0f);
    expectVec3Near(integrator.signedContribution(3.0f, false), -c, 0.0f);

    // Enter at 2, leave at 5: the two boundaries sum to the segment.
    const glm::vec3 pair = integrator.signedContribution(2.0f, true) + integrator.signedContribution(5.0f, false);
    expectVec3Near(pair, integrator.segment(2.0f, 5.0f), 1e-6f);
}

TEST(ScatteringIntegrator, ContributionDecreasesWithDistance)
{
    const AnalyticScatteringIntegrator integrator(fog());
    float previous = integrator.contribution(0.0f).x;
    for (float d = 1.0f; d < 100.0f; d += 7.0f) {
        const float current = integrator.contribution(d).x;
        EXPECT_LT(current, previous);
        EXPECT_GT(current, 0.0f);
        previous = current;
    }
}

TEST(ScatteringIntegrator, NoScatterMeansNoContribution)
{
    MediumParameters medium = fog();
    medium.scatter = 0.0f;
    const AnalyticScatteringIntegrator integrator(medium);
    expectVec3Near(integrator.contribution(0.5f), glm::vec3(0.0f), 0.0f);
}

TEST(ScatteringIntegrator, ContributionVanishesFarAway)
{
    const AnalyticScatteringIntegrator integrator(fog());
    const glm::vec3 far = integrator.contribution(1e4f);
    EXPECT_LT(far.x, 1e-6f);
    EXPECT_LT(far.y, 1e-6f);
    EXPECT_LT(far.z, 1e-6f);
    EXPECT_GE(far.z, 0.0f);
}

TEST(ScatteringIntegrator, AbsorptionIsTransparencyToTheDistance)
{
    const AnalyticScatteringIntegrator integrator(fog());
    expectVec3Near(integrator.absorption(0.0f), glm::vec3(1.0f), 1e-6f);
    expectVec3Near(integrator.absorption(1.0f), glm::vec3(0.9f, 0.8f, 0.95f), 1e-6f);
    expectVec3Near(integrator.absorption(2.0f), glm::vec3(0.81f, 0.64f, 0.9025f), 1e-5f);
}

TEST(ScatteringIntegrator, ReciprocalDepthDistance)
{
    EXPECT_FLOAT_EQ(reciprocalDepthDistance(0.1f, 1.0f), 0.1f);
    EXPECT_FLOAT_EQ(reciprocalDepthDistance(0.1f, 0.01f), 10.0f);
}

TEST(ScatteringIntegrator, ViewRayDistanceReconstructsTheViewPoint)
{
    const CameraMatrices camera = lookAtCamera(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, -1.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    const glm::mat4 inverseProjection = camera.inverseProjection();

    // On the view axis both models agree.
    const float ndcDepth = camera.nearPlane / 20.0f;
    EXPECT_NEAR(viewRayDistance(inverseProjection, glm::vec2(0.0f), ndcDepth), 20.0f, 1e-3f);

    const glm::vec3 viewPoint(6.0f, -3.0f, -20.0f);
    const glm::vec4 clip = camera.projection * glm::vec4(viewPoint, 1.0f);
    const glm::vec3 ndc = glm::vec3(clip) / clip.w;
    EXPECT_NEAR(viewRayDistance(inverseProjection, glm::vec2(ndc), ndc.z), glm::length(viewPoint), 1e-3f);
    EXPECT_NEAR(reciprocalDepthDistance(camera.nearPlane, ndc.z), 20.0f, 1e-3f);

    EXPECT_NEAR(surfaceDistance(DistanceModel::ViewRay, camera.nearPlane, inverseProjection, glm::vec2(ndc), ndc.z),
        glm::length(viewPoint), 1e-3f);
    EXPECT_NEAR(surfaceDistance(DistanceModel::ReciprocalDepth, camera.nearPlane, inverseProjection, glm::vec2(ndc), ndc.z),
        20.0f, 1e-3f);
}
