// SPDX-License-Identifier: MIT

#include "rendering/GeometryStage.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <imgui.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <array>
#include <stdexcept>

namespace {

constexpr std::array<float, 4> kDiffuseClear { 0.0f, 0.0f, 0.0f, 0.0f };
// Encoded zero normal.
constexpr std::array<float, 4> kNormalClear { 0.5f, 0.5f, 0.5f, 0.0f };
// Linear depth 0 marks pixels without geometry.
constexpr std::array<float, 4> kLinearDepthClear { 0.0f, 0.0f, 0.0f, 0.0f };

[[nodiscard]] bool isValidSize(glm::ivec2 size)
{
    return size.x > 0 && size.y > 0;
}

void allocateTarget(GLuint texture, GLenum internalFormat, GLenum format, GLenum type, glm::ivec2 size)
{
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(internalFormat), size.x, size.y, 0, format, type, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
}

} // namespace

GeometryStage::~GeometryStage()
{
    shutdown();
}

void GeometryStage::initialize(const std::filesystem::path& shaderDirectory, glm::ivec2 framebufferSize)
{
    m_shaders.load("gbuffer", shaderDirectory / "gbuffer.vert", shaderDirectory / "gbuffer.frag");
    resize(framebufferSize);
}

void GeometryStage::shutdown()
{
    if (m_framebuffer) glDeleteFramebuffers(1, &m_framebuffer);
    if (m_diffuse) glDeleteTextures(1, &m_diffuse);
    if (m_normal) glDeleteTextures(1, &m_normal);
    if (m_linearDepth) glDeleteTextures(1, &m_linearDepth);
    if (m_depthStencil) glDeleteTextures(1, &m_depthStencil);

    m_framebuffer = 0;
    m_diffuse = m_normal = m_linearDepth = m_depthStencil = 0;
    m_size = glm::ivec2(0);
}

void GeometryStage::resize(glm::ivec2 framebufferSize)
{
    if (!isValidSize(framebufferSize))
        return;
    ensureFramebuffer(framebufferSize);
}

void GeometryStage::ensureFramebuffer(glm::ivec2 size)
{
    if (m_framebuffer == 0)
        glGenFramebuffers(1, &m_framebuffer);
    if (m_diffuse == 0)
        glGenTextures(1, &m_diffuse);
    if (m_normal == 0)
        glGenTextures(1, &m_normal);
    if (m_linearDepth == 0)
        glGenTextures(1, &m_linearDepth);
    if (m_depthStencil == 0)
        glGenTextures(1, &m_depthStencil);

    if (m_size == size)
        return;
    m_size = size;

    allocateTarget(m_diffuse, GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE, size);
    allocateTarget(m_normal, GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE, size);
    allocateTarget(m_linearDepth, GL_R32F, GL_RED, GL_FLOAT, size);
    allocateTarget(m_depthStencil, GL_DEPTH32F_STENCIL8, GL_DEPTH_STENCIL, GL_FLOAT_32_UNSIGNED_INT_24_8_REV, size);
    glBindTexture(GL_TEXTURE_2D, 0);

    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_diffuse, 0);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT1, GL_TEXTURE_2D, m_normal, 0);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT2, GL_TEXTURE_2D, m_linearDepth, 0);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_TEXTURE_2D, m_depthStencil, 0);

    const GLenum buffers[] = { GL_COLOR_ATTACHMENT0, GL_COLOR_ATTACHMENT1, GL_COLOR_ATTACHMENT2 };
    glDrawBuffers(3, buffers);

    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (status != GL_FRAMEBUFFER_COMPLETE)
        throw std::runtime_error(fmt::format("GeometryStage framebuffer incomplete (0x{:x}).", status));
}

void GeometryStage::render(const SceneMeshBuffer& mesh, const CameraMatrices& camera, RenderStats& stats)
{
    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glViewport(0, 0, m_size.x, m_size.y);

    glDisable(GL_BLEND);
    glDisable(GL_STENCIL_TEST);
    glDisable(GL_CULL_FACE);
    glFrontFace(GL_CCW);

    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_GREATER);
    glDepthMask(GL_TRUE);
    glStencilMask(0xFF);

    glClearBufferfv(GL_COLOR, 0, kDiffuseClear.data());
    glClearBufferfv(GL_COLOR, 1, kNormalClear.data());
    glClearBufferfv(GL_COLOR, 2, kLinearDepthClear.data());
    // Reversed-Z: 0 is infinitely far away.
    glClearBufferfi(GL_DEPTH_STENCIL, 0, 0.0f, 0);

    m_shaders.bind("gbuffer");
    m_shaders.setMat4("viewProjection", camera.viewProjection());
    m_shaders.setFloat("nearPlane", camera.nearPlane);
    mesh.draw();
    stats.addDraw(RenderPass::Geometry, static_cast<std::uint64_t>(mesh.triangleCount()));

    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void GeometryStage::drawImGuiPanel() const
{
    ImGui::Text("G-buffer: %d x %d", m_size.x, m_size.y);
    ImGui::TextUnformatted("Diffuse RGBA8, normal RGBA8, linear depth R32F");
}
