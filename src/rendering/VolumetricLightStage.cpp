// SPDX-License-Identifier: MIT

#include "rendering/VolumetricLightStage.h"
#include "rendering/TextureUnits.h"
#include "volumetric/LightParameters.h"
#include "volumetric/VolumeCapMesh.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <imgui.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <stdexcept>

namespace {

constexpr std::array<float, 4> kScatterClear { 0.0f, 0.0f, 0.0f, 0.0f };
constexpr GLsizei kFullscreenTriangleVertices = 3;

[[nodiscard]] GLenum toGlStencilOp(StencilOp op)
{
    switch (op) {
    case StencilOp::Invert:
        return GL_INVERT;
    case StencilOp::IncrementWrap:
        return GL_INCR_WRAP;
    case StencilOp::Keep:
    default:
        return GL_KEEP;
    }
}

#ifndef NDEBUG
void debugTraceStencilMasks(const char* label)
{
    GLint front = 0;
    GLint back = 0;
    glGetIntegerv(GL_STENCIL_WRITEMASK, &front);
    glGetIntegerv(GL_STENCIL_BACK_WRITEMASK, &back);
    std::fprintf(stderr, "[VolumetricLightStage] %s | front mask=0x%x back mask=0x%x\n", label, front, back);
}
#define TRACE_STENCIL(label) debugTraceStencilMasks(label)
#else
#define TRACE_STENCIL(label) ((void)0)
#endif

} // namespace

VolumetricLightStage::~VolumetricLightStage()
{
    shutdown();
}

void VolumetricLightStage::initialize(const std::filesystem::path& shaderDirectory, glm::ivec2 framebufferSize, GLuint depthStencilTexture)
{
    m_shaders.appendPreambleFile(shaderDirectory / "light_parameters.glsl");
    m_shaders.load("far_cap", shaderDirectory / "volumetric_cap.vert", shaderDirectory / "volumetric_cap.frag");
    m_shaders.load("near_cap", shaderDirectory / "near_cap.vert", shaderDirectory / "near_cap.frag");

    if (m_emptyVao == 0)
        glGenVertexArrays(1, &m_emptyVao);
    resize(framebufferSize, depthStencilTexture);
}

void VolumetricLightStage::shutdown()
{
    if (m_framebuffer) glDeleteFramebuffers(1, &m_framebuffer);
    if (m_scatter) glDeleteTextures(1, &m_scatter);
    if (m_emptyVao) glDeleteVertexArrays(1, &m_emptyVao);
    m_parameters.shutdown();

    m_framebuffer = 0;
    m_scatter = 0;
    m_emptyVao = 0;
    m_attachedDepthStencil = 0;
    m_size = glm::ivec2(0);
}

void VolumetricLightStage::resize(glm::ivec2 framebufferSize, GLuint depthStencilTexture)
{
    if (framebufferSize.x <= 0 || framebufferSize.y <= 0)
        return;
    ensureFramebuffer(framebufferSize, depthStencilTexture);
}

void VolumetricLightStage::ensureFramebuffer(glm::ivec2 size, GLuint depthStencilTexture)
{
    if (m_framebuffer == 0)
        glGenFramebuffers(1, &m_framebuffer);
    if (m_scatter == 0)
        glGenTextures(1, &m_scatter);

    if (m_size == size && m_attachedDepthStencil == depthStencilTexture)
        return;

    if (m_size != size) {
        glBindTexture(GL_TEXTURE_2D, m_scatter);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA16F, size.x, size.y, 0, GL_RGBA, GL_FLOAT, nullptr);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D, 0);
        m_size = size;
    }

    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_scatter, 0);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_TEXTURE_2D, depthStencilTexture, 0);
    const GLenum buffers[] = { GL_COLOR_ATTACHMENT0 };
    glDrawBuffers(1, buffers);

    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (status != GL_FRAMEBUFFER_COMPLETE)
        throw std::runtime_error(fmt::format("VolumetricLightStage framebuffer incomplete (0x{:x}).", status));

    m_attachedDepthStencil = depthStencilTexture;
}

void VolumetricLightStage::applyStencilPass(const StencilCapPass& pass) const
{
    glStencilFunc(GL_ALWAYS, 0, 0xFF);
    glStencilOpSeparate(GL_FRONT, GL_KEEP, GL_KEEP, toGlStencilOp(pass.front.depthPass));
    glStencilOpSeparate(GL_BACK, GL_KEEP, GL_KEEP, toGlStencilOp(pass.back.depthPass));
    glStencilMaskSeparate(GL_FRONT, pass.front.writeMask);
    glStencilMaskSeparate(GL_BACK, pass.back.writeMask);

    if (pass.testSceneDepth) {
        glEnable(GL_DEPTH_TEST);
        glDepthFunc(GL_GREATER);
    } else {
        glDisable(GL_DEPTH_TEST);
    }
}

void VolumetricLightStage::render(const ShadowMapPass& shadowMap, const VolumetricSettings& volumetric, const CameraMatrices& camera, RenderStats& stats)
{
    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glViewport(0, 0, m_size.x, m_size.y);
    glClearBufferfv(GL_COLOR, 0, kScatterClear.data());

    m_lastCapTriangles = 0;
    if (!m_settings.enabled) {
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        return;
    }

    // Each face adds its signed contribution; back faces carry negative values.
    glEnable(GL_BLEND);
    glBlendEquation(GL_FUNC_ADD);
    glBlendFunc(GL_ONE, GL_ONE);
    glDisable(GL_CULL_FACE);
    glDepthMask(GL_FALSE);
    glEnable(GL_STENCIL_TEST);

    shadowMap.bindForSampling(TextureUnits::ShadowMap);
    glBindVertexArray(m_emptyVao);
    const glm::vec2 viewportSize(m_size);

    if (m_settings.farCapEnabled) {
        LightParameters parameters = makeCapPassParameters(volumetric, camera, shadowMap.frustum());
        parameters.shadowSize = shadowMap.resolution();
        m_parameters.upload(parameters);
        m_parameters.bind(BufferBindings::LightParameters);

        const VolumeCapMesh mesh(shadowMap.resolution());
        applyStencilPass(farCapPass());
        glFrontFace(capFrontFaceIsCounterClockwise(parameters.transform) ? GL_CCW : GL_CW);
        TRACE_STENCIL("far cap");

        m_shaders.bind("far_cap");
        m_shaders.setVec2("viewportSize", viewportSize);
        glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(mesh.vertexCount()));
        m_lastCapTriangles = mesh.triangleCount();
        stats.addDraw(RenderPass::FarCap, m_lastCapTriangles);
    }

    if (m_settings.nearCapEnabled) {
        // The near cap maps screen points back into light clip space.
        LightParameters parameters = makeCompositionParameters(volumetric, camera, shadowMap.frustum());
        parameters.shadowSize = shadowMap.resolution();
        m_parameters.upload(parameters);
        m_parameters.bind(BufferBindings::LightParameters);

        applyStencilPass(nearCapPass());
        glFrontFace(GL_CCW);
        TRACE_STENCIL("near cap");

        m_shaders.bind("near_cap");
        m_shaders.setVec2("viewportSize", viewportSize);
        glDrawArrays(GL_TRIANGLES, 0, kFullscreenTriangleVertices);
        stats.addDraw(RenderPass::NearCap, 1);
    }

    glFrontFace(GL_CCW);
    glStencilMask(0xFF);
    glDisable(GL_STENCIL_TEST);
    glDepthMask(GL_TRUE);
    glEnable(GL_DEPTH_TEST);
    glDisable(GL_BLEND);
    glBindVertexArray(0);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void VolumetricLightStage::drawImGuiPanel()
{
    ImGui::Checkbox("Volumetric light", &m_settings.enabled);
    ImGui::BeginDisabled(!m_settings.enabled);
    ImGui::Checkbox("Far cap (pass A)", &m_settings.farCapEnabled);
    ImGui::Checkbox("Near cap (pass B)", &m_settings.nearCapEnabled);
    ImGui::EndDisabled();
    ImGui::Text("Cap triangles: %llu", static_cast<unsigned long long>(m_lastCapTriangles));
}
