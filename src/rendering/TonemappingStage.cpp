// SPDX-License-Identifier: MIT
#include "rendering/TonemappingStage.h"
#include "rendering/TextureUnits.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <imgui.h>
DISABLE_WARNINGS_POP()

TonemappingStage::~TonemappingStage()
{
    shutdown();
}

void TonemappingStage::initialize(const std::filesystem::path& shaderDirectory)
{
    m_shaders.load("tonemap", shaderDirectory / "fullscreen.vert", shaderDirectory / "tonemap.frag");
    if (m_emptyVao == 0)
        glGenVertexArrays(1, &m_emptyVao);
}

void TonemappingStage::shutdown()
{
    if (m_emptyVao) glDeleteVertexArrays(1, &m_emptyVao);
    m_emptyVao = 0;
}

void TonemappingStage::render(GLuint hdrTexture, glm::ivec2 framebufferSize, GLuint targetFramebuffer)
{
    glBindFramebuffer(GL_FRAMEBUFFER, targetFramebuffer);
    glViewport(0, 0, framebufferSize.x, framebufferSize.y);
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_STENCIL_TEST);
    glDisable(GL_BLEND);

    glBindTextureUnit(TextureUnits::HdrColor, hdrTexture);

    m_shaders.bind("tonemap");
    m_shaders.setFloat("exposure", m_settings.exposure);
    m_shaders.setFloat("gamma", m_settings.gamma);
    m_shaders.setInt("tonemapEnabled", m_settings.tonemapEnabled ? 1 : 0);

    glBindVertexArray(m_emptyVao);
    glDrawArrays(GL_TRIANGLES, 0, 3);
    glBindVertexArray(0);

    glEnable(GL_DEPTH_TEST);
}

void TonemappingStage::drawImGuiPanel()
{
    ImGui::TextUnformatted("Tone Mapping");
    ImGui::Checkbox("Reinhard", &m_settings.tonemapEnabled);
    ImGui::SliderFloat("Exposure", &m_settings.exposure, -5.0f, 5.0f);
    ImGui::SliderFloat("Gamma", &m_settings.gamma, 0.8f, 3.2f);
}
