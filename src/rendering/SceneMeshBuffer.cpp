// SPDX-License-Identifier: MIT

#include "rendering/SceneMeshBuffer.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

#include <cstddef>
#include <utility>
#include <vector>

namespace {

struct SceneVertex {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec3 diffuse;
};

} // namespace

SceneMeshBuffer::SceneMeshBuffer(const SceneGeometry& scene)
{
    upload(scene);
}

SceneMeshBuffer::SceneMeshBuffer(SceneMeshBuffer&& other) noexcept
{
    moveInto(std::move(other));
}

SceneMeshBuffer::~SceneMeshBuffer()
{
    freeGpuMemory();
}

SceneMeshBuffer& SceneMeshBuffer::operator=(SceneMeshBuffer&& other) noexcept
{
    if (this != &other)
        moveInto(std::move(other));
    return *this;
}

void SceneMeshBuffer::upload(const SceneGeometry& scene)
{
    std::vector<SceneVertex> vertices;
    vertices.reserve(scene.triangleCount() * 3);
    for (const SceneTriangle& triangle : scene.triangles()) {
        for (const glm::vec3& position : triangle.positions)
            vertices.push_back(SceneVertex { position, triangle.normal, triangle.diffuse });
    }

    if (m_vao == 0)
        glGenVertexArrays(1, &m_vao);
    if (m_vbo == 0)
        glGenBuffers(1, &m_vbo);

    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertices.size() * sizeof(SceneVertex)), vertices.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glEnableVertexAttribArray(1);
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(SceneVertex), reinterpret_cast<void*>(offsetof(SceneVertex, position)));
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(SceneVertex), reinterpret_cast<void*>(offsetof(SceneVertex, normal)));
    glVertexAttribPointer(2, 3, GL_FLOAT, GL_FALSE, sizeof(SceneVertex), reinterpret_cast<void*>(offsetof(SceneVertex, diffuse)));

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    m_vertexCount = static_cast<GLsizei>(vertices.size());
}

void SceneMeshBuffer::draw() const
{
    if (m_vertexCount == 0)
        return;
    glBindVertexArray(m_vao);
    glDrawArrays(GL_TRIANGLES, 0, m_vertexCount);
}

void SceneMeshBuffer::moveInto(SceneMeshBuffer&& other)
{
    freeGpuMemory();
    m_vertexCount = std::exchange(other.m_vertexCount, 0);
    m_vbo = std::exchange(other.m_vbo, 0);
    m_vao = std::exchange(other.m_vao, 0);
}

void SceneMeshBuffer::freeGpuMemory()
{
    if (m_vao != 0)
        glDeleteVertexArrays(1, &m_vao);
    if (m_vbo != 0)
        glDeleteBuffers(1, &m_vbo);
    m_vao = 0;
    m_vbo = 0;
    m_vertexCount = 0;
}
