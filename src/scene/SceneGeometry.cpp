// SPDX-License-Identifier: MIT

#include "scene/SceneGeometry.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/geometric.hpp>
DISABLE_WARNINGS_POP()

void SceneGeometry::addQuad(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& d, const glm::vec3& diffuse)
{
    const glm::vec3 normal = glm::normalize(glm::cross(b - a, c - a));
    m_triangles.push_back(SceneTriangle { { a, b, c }, normal, diffuse });
    m_triangles.push_back(SceneTriangle { { a, c, d }, normal, diffuse });
}

void SceneGeometry::addGroundPlane(float halfExtent, float height, const glm::vec3& diffuse)
{
    addQuad(glm::vec3(-halfExtent, height, halfExtent),
        glm::vec3(halfExtent, height, halfExtent),
        glm::vec3(halfExtent, height, -halfExtent),
        glm::vec3(-halfExtent, height, -halfExtent),
        diffuse);
}

void SceneGeometry::addBox(const glm::vec3& minCorner, const glm::vec3& maxCorner, const glm::vec3& diffuse)
{
    const glm::vec3& lo = minCorner;
    const glm::vec3& hi = maxCorner;

    // +y / -y
    addQuad({ lo.x, hi.y, hi.z }, { hi.x, hi.y, hi.z }, { hi.x, hi.y, lo.z }, { lo.x, hi.y, lo.z }, diffuse);
    addQuad({ lo.x, lo.y, lo.z }, { hi.x, lo.y, lo.z }, { hi.x, lo.y, hi.z }, { lo.x, lo.y, hi.z }, diffuse);
    // +x / -x
    addQuad({ hi.x, lo.y, hi.z }, { hi.x, lo.y, lo.z }, { hi.x, hi.y, lo.z }, { hi.x, hi.y, hi.z }, diffuse);
    addQuad({ lo.x, lo.y, lo.z }, { lo.x, lo.y, hi.z }, { lo.x, hi.y, hi.z }, { lo.x, hi.y, lo.z }, diffuse);
    // +z / -z
    addQuad({ lo.x, lo.y, hi.z }, { hi.x, lo.y, hi.z }, { hi.x, hi.y, hi.z }, { lo.x, hi.y, hi.z }, diffuse);
    addQuad({ hi.x, lo.y, lo.z }, { lo.x, lo.y, lo.z }, { lo.x, hi.y, lo.z }, { hi.x, hi.y, lo.z }, diffuse);
}

SceneGeometry buildDemoScene()
{
    SceneGeometry scene;
    scene.addGroundPlane(40.0f, 0.0f, glm::vec3(0.55f, 0.52f, 0.48f));

    const glm::vec3 stone(0.7f, 0.68f, 0.62f);
    for (int i = -3; i <= 3; ++i) {
        const float x = static_cast<float>(i) * 3.0f;
        scene.addBox(glm::vec3(x - 0.4f, 0.0f, -6.4f), glm::vec3(x + 0.4f, 6.0f, -5.6f), stone);
        scene.addBox(glm::vec3(x - 0.4f, 0.0f, 5.6f), glm::vec3(x + 0.4f, 6.0f, 6.4f), stone);
    }
    scene.addBox(glm::vec3(-10.0f, 6.0f, -7.0f), glm::vec3(10.0f, 6.6f, 7.0f), stone);
    scene.addBox(glm::vec3(-2.0f, 0.0f, -1.0f), glm::vec3(0.0f, 1.5f, 1.0f), glm::vec3(0.35f, 0.42f, 0.6f));
    return scene;
}
