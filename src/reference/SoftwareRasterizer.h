// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec4.hpp>
DISABLE_WARNINGS_POP()

#include <array>
#include <functional>

struct RasterFragment {
    int x { 0 };
    int y { 0 };
    // Window depth, equal to ndc.z for a zero-to-one depth range.
    float depth { 0.0f };
    bool frontFacing { true };
};

// Scalar triangle rasterizer following the OpenGL rules the capping protocol
// relies on: homogeneous clipping against 0 <= z <= w and a guard band,
// fixed-point vertex snapping and a top-left fill rule, so triangles sharing
// an edge never both cover, or both miss, a pixel centre on it.
class SoftwareRasterizer {
public:
    using FragmentCallback = std::function<void(const RasterFragment&)>;

    SoftwareRasterizer(int width, int height);

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }

    void setFrontFaceCounterClockwise(bool counterClockwise) { m_frontFaceCCW = counterClockwise; }

    void drawTriangle(const std::array<glm::vec4, 3>& clipPositions, const FragmentCallback& onFragment) const;

private:
    void rasterizeSnapped(const std::array<glm::vec4, 3>& clipPositions, const FragmentCallback& onFragment) const;

    int m_width;
    int m_height;
    bool m_frontFaceCCW { true };
};
