// SPDX-License-Identifier: MIT

#include "rendering/DeferredCompositionStage.h"
#include "rendering/TextureUnits.h"
#include "volumetric/DirectLighting.h"
#include "volumetric/LightParameters.h"
#include "volumetric/StencilCapState.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/gtc/type_ptr.hpp>
#include <imgui.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <stdexcept>

DeferredCompositionStage::~DeferredCompositionStage()
{
    shutdown();
}

void DeferredCompositionStage::initialize(const std::filesystem::path& shaderDirectory, glm::ivec2 framebufferSize, GLuint depthStencilTexture)
{
    m_shaders.addDefine("AMBIENT_FLOOR", fmt::format("{:.6f}", kAmbientFloor));
    m_shaders.appendPreambleFile(shaderDirectory / "light_parameters.glsl");
    m_shaders.load("composition", shaderDirectory / "fullscreen.vert", shaderDirectory / "composition.frag");
    m_shaders.load("closing", shaderDirectory / "fullscreen.vert", shaderDirectory / "composition_close.frag");

    if (m_emptyVao == 0)
        glGenVertexArrays(1, &m_emptyVao);
    resize(framebufferSize, depthStencilTexture);
}

void DeferredCompositionStage::shutdown()
{
    if (m_framebuffer) glDeleteFramebuffers(1, &m_framebuffer);
    if (m_hdrColor) glDeleteTextures(1, &m_hdrColor);
    if (m_emptyVao) glDeleteVertexArrays(1, &m_emptyVao);
    m_parameters.shutdown();

    m_framebuffer = 0;
    m_hdrColor = 0;
    m_emptyVao = 0;
    m_attachedDepthStencil = 0;
    m_size = glm::ivec2(0);
}

void DeferredCompositionStage::resize(glm::ivec2 framebufferSize, GLuint depthStencilTexture)
{
    if (framebufferSize.x <= 0 || framebufferSize.y <= 0)
        return;
    ensureFramebuffer(framebufferSize, depthStencilTexture);
}

void DeferredCompositionStage::ensureFramebuffer(glm::ivec2 size, GLuint depthStencilTexture)
{
    if (m_framebuffer == 0)
        glGenFramebuffers(1, &m_framebuffer);
    if (m_hdrColor == 0)
        glGenTextures(1, &m_hdrColor);

    if (m_size == size && m_attachedDepthStencil == depthStencilTexture)
        return;

    if (m_size != size) {
        glBindTexture(GL_TEXTURE_2D, m_hdrColor);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA16F, size.x, size.y, 0, GL_RGBA, GL_FLOAT, nullptr);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D, 0);
        m_size = size;
    }

    // The depth-stencil attachment carries the cap bits written by the volumetric stage.
    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_hdrColor, 0);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_TEXTURE_2D, depthStencilTexture, 0);
    const GLenum buffers[] = { GL_COLOR_ATTACHMENT0 };
    glDrawBuffers(1, buffers);

    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (status != GL_FRAMEBUFFER_COMPLETE)
        throw std::runtime_error(fmt::format("DeferredCompositionStage framebuffer incomplete (0x{:x}).", status));

    m_attachedDepthStencil = depthStencilTexture;
}

void DeferredCompositionStage::render(const GeometryStage& gbuffer,
    const VolumetricLightStage& volumetricLight,
    const ShadowMapPass& shadowMap,
    const VolumetricSettings& volumetric,
    const CameraMatrices& camera,
    RenderStats& stats)
{
    LightParameters parameters = makeCompositionParameters(volumetric, camera, shadowMap.frustum());
    parameters.shadowSize = shadowMap.resolution();
    m_parameters.upload(parameters);
    m_parameters.bind(BufferBindings::LightParameters);

    glBindFramebuffer(GL_FRAMEBUFFER, m_framebuffer);
    glViewport(0, 0, m_size.x, m_size.y);
    glDisable(GL_DEPTH_TEST);
    glDepthMask(GL_FALSE);
    glDisable(GL_BLEND);
    glDisable(GL_STENCIL_TEST);
    glDisable(GL_CULL_FACE);

    shadowMap.bindForSampling(TextureUnits::ShadowMap);
    glBindTextureUnit(TextureUnits::GBuffer_Diffuse, gbuffer.diffuseTexture());
    glBindTextureUnit(TextureUnits::GBuffer_Normal, gbuffer.normalTexture());
    glBindTextureUnit(TextureUnits::GBuffer_LinearDepth, gbuffer.linearDepthTexture());
    glBindTextureUnit(TextureUnits::Volumetric, volumetricLight.scatterTexture());

    const glm::vec2 viewportSize(m_size);
    glBindVertexArray(m_emptyVao);

    m_shaders.bind("composition");
    m_shaders.setVec2("viewportSize", viewportSize);
    m_shaders.setVec3("background", m_settings.background);
    glDrawArrays(GL_TRIANGLES, 0, 3);
    stats.addDraw(RenderPass::Composition, 1);

    if (m_settings.closingTermEnabled) {
        // dst - src where the parity bit is set. Bit 2 needs no gate: far cap
        // fragments behind the surface failed the depth test and added nothing.
        glEnable(GL_STENCIL_TEST);
        glStencilFunc(GL_EQUAL, StencilCapState::NearParityBit, StencilCapState::NearParityBit);
        glStencilOp(GL_KEEP, GL_KEEP, GL_KEEP);
        glEnable(GL_BLEND);
        glBlendEquation(GL_FUNC_REVERSE_SUBTRACT);
        glBlendFunc(GL_ONE, GL_ONE);

        m_shaders.bind("closing");
        m_shaders.setVec2("viewportSize", viewportSize);
        glDrawArrays(GL_TRIANGLES, 0, 3);
        stats.addDraw(RenderPass::Composition, 1);

        glBlendEquation(GL_FUNC_ADD);
        glDisable(GL_BLEND);
    }

    glStencilMask(0xFF);
    glClearStencil(0);
    glClear(GL_STENCIL_BUFFER_BIT);
    glDisable(GL_STENCIL_TEST);

    glDepthMask(GL_TRUE);
    glEnable(GL_DEPTH_TEST);
    glBindVertexArray(0);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void DeferredCompositionStage::drawImGuiPanel()
{
    ImGui::ColorEdit3("Background", glm::value_ptr(m_settings.background));
    ImGui::Checkbox("Close segments ending on surfaces", &m_settings.closingTermEnabled);
}
