// SPDX-License-Identifier: MIT

#include "volumetric/ScatteringIntegrator.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/exponential.hpp>
#include <glm/geometric.hpp>
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

AnalyticScatteringIntegrator::AnalyticScatteringIntegrator(const MediumParameters& medium)
    : m_medium(medium)
    , m_extinction(-glm::log(medium.transparency))
{
}

glm::vec3 AnalyticScatteringIntegrator::contribution(float distance) const
{
    return m_medium.scatter * absorption(distance) / m_extinction;
}

glm::vec3 AnalyticScatteringIntegrator::signedContribution(float distance, bool frontFacing) const
{
    const glm::vec3 value = contribution(distance);
    return frontFacing ? value : -value;
}

glm::vec3 AnalyticScatteringIntegrator::segment(float entry, float exit) const
{
    return contribution(entry) - contribution(exit);
}

glm::vec3 AnalyticScatteringIntegrator::absorption(float distance) const
{
    return glm::pow(m_medium.transparency, glm::vec3(distance));
}

float reciprocalDepthDistance(float nearPlane, float ndcDepth)
{
    return nearPlane / ndcDepth;
}

float viewRayDistance(const glm::mat4& inverseProjection, const glm::vec2& ndcXY, float ndcDepth)
{
    const glm::vec4 view = inverseProjection * glm::vec4(ndcXY, ndcDepth, 1.0f);
    return glm::length(glm::vec3(view) / view.w);
}

float surfaceDistance(DistanceModel model, float nearPlane, const glm::mat4& inverseProjection,
    const glm::vec2& ndcXY, float ndcDepth)
{
    switch (model) {
    case DistanceModel::ViewRay:
        return viewRayDistance(inverseProjection, ndcXY, ndcDepth);
    case DistanceModel::ReciprocalDepth:
    default:
        return reciprocalDepthDistance(nearPlane, ndcDepth);
    }
}
