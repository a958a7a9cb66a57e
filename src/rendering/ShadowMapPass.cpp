// SPDX-License-Identifier: MIT

#include "rendering/ShadowMapPass.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <imgui.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <stdexcept>

ShadowMapPass::~ShadowMapPass()
{
    shutdown();
}

void ShadowMapPass::initialize(const std::filesystem::path& shaderDirectory, int resolution)
{
    m_shaders.load("shadow", shaderDirectory / "shadow.vert", shaderDirectory / "shadow.frag");
    ensureSampler();
    resize(resolution);
}

void ShadowMapPass::shutdown()
{
    if (m_framebuffer != 0) {
        glDeleteFramebuffers(1, &m_framebuffer);
        m_framebuffer = 0;
    }
    if (m_depthTexture != 0) {
        glDeleteTextures(1, &m_depthTexture);
        m_depthTexture = 0;
    }
    if (m_sampler != 0) {
        glDeleteSamplers(1, &m_sampler);
        m_sampler = 0;
    }
    m_resolution = 0;
}

void ShadowMapPass::resize(int resolution)
{
    if (resolution < kMinShadowSize || resolution > kMaxShadowSize)
        throw std::invalid_argument(fmt::format(
            "Shadow map resolution must lie in [{}, {}], got {}", kMinShadowSize, kMaxShadowSize, resolution));
    if (resolution == m_resolution && m_depthTexture != 0)
        return;

    if (m_depthTexture == 0)
        glGenTextures(1, &m_depthTexture);

    glBindTexture(GL_TEXTURE_2D, m_depthTexture);
    glTexImage2D(GL_TEXTURE_2D,
        0,
        GL_DEPTH_COMPONENT32F,
        resolution,
        resolution,
        0,
        GL_DEPTH_COMPONENT,
        GL_FLOAT,
        nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_COMPARE_MODE, GL_NONE);
    glBindTexture(GL_TEXTURE_2D, 0);

    m_resolution = resolution;
    ensureFramebuffer();
}

void ShadowMapPass::ensureFramebuffer()
{
    if (m_framebuffer == 0)
        glGenFramebuffers(1, &m_framebuffer);

    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_TEXTURE_2D, m_depthTexture, 0);
    glDrawBuffer(GL_NONE);
    glReadBuffer(GL_NONE);

    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (status != GL_FRAMEBUFFER_COMPLETE)
        throw std::runtime_error(fmt::format("ShadowMapPass framebuffer incomplete (0x{:x}).", status));
}

void ShadowMapPass::ensureSampler()
{
    if (m_sampler != 0)
        return;

    glGenSamplers(1, &m_sampler);
    glSamplerParameteri(m_sampler, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glSamplerParameteri(m_sampler, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glSamplerParameteri(m_sampler, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glSamplerParameteri(m_sampler, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glSamplerParameteri(m_sampler, GL_TEXTURE_COMPARE_MODE, GL_NONE);
}

void ShadowMapPass::render(const LightFrustum& frustum, const RenderGeometryCallback& renderGeometry)
{
    m_frustum = frustum;

    GLint previousViewport[4];
    glGetIntegerv(GL_VIEWPORT, previousViewport);

    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glViewport(0, 0, m_resolution, m_resolution);

    // The light projection keeps the usual depth direction: nearest wins.
    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LESS);
    glDepthMask(GL_TRUE);
    glClearDepth(1.0);
    glClear(GL_DEPTH_BUFFER_BIT);

    glDisable(GL_CULL_FACE);
    glEnable(GL_POLYGON_OFFSET_FILL);
    glPolygonOffset(m_settings.slopeBias, m_settings.constantBias);

    m_shaders.bind("shadow");
    m_shaders.setMat4("lightMatrix", frustum.worldToClip);
    renderGeometry(frustum.worldToClip);

    glDisable(GL_POLYGON_OFFSET_FILL);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(previousViewport[0], previousViewport[1], previousViewport[2], previousViewport[3]);
}

void ShadowMapPass::bindForSampling(GLuint unit) const
{
    glBindTextureUnit(unit, m_depthTexture);
    glBindSampler(unit, m_sampler);
}

void ShadowMapPass::drawImGuiPanel()
{
    ImGui::Text("Resolution: %d x %d", m_resolution, m_resolution);
    ImGui::SliderFloat("Slope bias", &m_settings.slopeBias, 0.0f, 8.0f);
    ImGui::SliderFloat("Constant bias", &m_settings.constantBias, 0.0f, 32.0f);
}
