// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

#include <array>
#include <cstddef>
#include <vector>

// Flat-shaded triangle. Positions are counter-clockwise around the normal.
struct SceneTriangle {
    std::array<glm::vec3, 3> positions;
    glm::vec3 normal { 0.0f, 1.0f, 0.0f };
    glm::vec3 diffuse { 1.0f };
};

// Triangle soup consumed by the shadow and geometry passes, on the GPU and in
// the reference pipeline alike.
class SceneGeometry {
public:
    void addQuad(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c, const glm::vec3& d, const glm::vec3& diffuse);
    void addGroundPlane(float halfExtent, float height, const glm::vec3& diffuse);
    void addBox(const glm::vec3& minCorner, const glm::vec3& maxCorner, const glm::vec3& diffuse);

    void clear() { m_triangles.clear(); }

    [[nodiscard]] const std::vector<SceneTriangle>& triangles() const { return m_triangles; }
    [[nodiscard]] std::size_t triangleCount() const { return m_triangles.size(); }

private:
    std::vector<SceneTriangle> m_triangles;
};

// Ground with a colonnade and a roof slab so a low sun throws visible shafts.
[[nodiscard]] SceneGeometry buildDemoScene();
