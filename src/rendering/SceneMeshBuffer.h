// SPDX-License-Identifier: MIT
#pragma once

#include "scene/SceneGeometry.h"

#include <framework/opengl_includes.h>

// Non-indexed GPU copy of a SceneGeometry; three vertices per triangle with
// the face normal and colour repeated on each.
class SceneMeshBuffer {
public:
    SceneMeshBuffer() = default;
    explicit SceneMeshBuffer(const SceneGeometry& scene);
    // Cannot copy because it would require reference counting of GPU resources.
    SceneMeshBuffer(const SceneMeshBuffer&) = delete;
    SceneMeshBuffer(SceneMeshBuffer&&) noexcept;
    ~SceneMeshBuffer();

    SceneMeshBuffer& operator=(const SceneMeshBuffer&) = delete;
    SceneMeshBuffer& operator=(SceneMeshBuffer&&) noexcept;

    void upload(const SceneGeometry& scene);
    void draw() const;

    [[nodiscard]] GLsizei vertexCount() const { return m_vertexCount; }
    [[nodiscard]] GLsizei triangleCount() const { return m_vertexCount / 3; }

private:
    void moveInto(SceneMeshBuffer&&);
    void freeGpuMemory();

private:
    GLsizei m_vertexCount { 0 };
    GLuint m_vbo { 0 };
    GLuint m_vao { 0 };
};
