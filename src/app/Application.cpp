// SPDX-License-Identifier: MIT
#include "app/Window.h"
#include "camera/FlyingCamera.h"
#include "config/VolumetricConfig.h"
#include "rendering/DeferredCompositionStage.h"
#include "rendering/GeometryStage.h"
#include "rendering/RenderStats.h"
#include "rendering/SceneMeshBuffer.h"
#include "rendering/ShadowMapPass.h"
#include "rendering/TonemappingStage.h"
#include "rendering/VolumetricLightStage.h"
#include "scene/SceneGeometry.h"
#include "volumetric/CameraTransforms.h"
#include "volumetric/LightFrustum.h"

#include <framework/opengl_includes.h>

DISABLE_WARNINGS_PUSH()
// Include glad before glfw3
#include <GLFW/glfw3.h>
#include <glm/gtc/type_ptr.hpp>
#include <glm/trigonometric.hpp>
#include <imgui.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>

#ifndef NDEBUG
namespace {
void traceFramebuffer(const char* label)
{
    GLint draw = 0;
    GLint read = 0;
    glGetIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &draw);
    glGetIntegerv(GL_READ_FRAMEBUFFER_BINDING, &read);
    fmt::print(stderr, "[Application] {} | draw={} read={}\n", label, draw, read);
}
}
#define TRACE_APP_FBO(label) traceFramebuffer(label)
#else
#define TRACE_APP_FBO(label) ((void)0)
#endif

namespace {

const std::filesystem::path kShaderDirectory { RESOURCE_ROOT "shaders" };
const std::filesystem::path kDefaultConfig { RESOURCE_ROOT "configs/default.json" };

constexpr std::array<int, 4> kShadowSizes { 256, 512, 1024, 2048 };

void APIENTRY glDebugOutput(GLenum source,
    GLenum type,
    GLuint id,
    GLenum severity,
    GLsizei length,
    const GLchar* message,
    const void* userParam)
{
    (void)source;
    (void)type;
    (void)length;
    (void)userParam;
    const char* level = severity == GL_DEBUG_SEVERITY_HIGH ? "error" : "warning";
    fmt::print(stderr, "[GL {} {}] {}\n", level, id, message);
}

void enableDebugOutput()
{
    GLint flags = 0;
    glGetIntegerv(GL_CONTEXT_FLAGS, &flags);
    if ((flags & GL_CONTEXT_FLAG_DEBUG_BIT) == 0)
        return;

    glEnable(GL_DEBUG_OUTPUT);
    glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
    glDebugMessageCallback(glDebugOutput, nullptr);
    glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DEBUG_SEVERITY_NOTIFICATION, 0, nullptr, GL_FALSE);
}

} // namespace

class Application {
public:
    explicit Application(std::filesystem::path configPath);

    void update();

private:
    void handleCameraInput(float deltaTime);
    void renderFrame(glm::ivec2 framebufferSize);
    void resizeTargets(glm::ivec2 framebufferSize);

    void drawUi();
    void drawMediumPanel();
    void drawLightPanel();
    void drawConfigPanel();

    void reloadConfig();
    void saveConfig();

    // Declared first so the GL context outlives every stage below.
    Window m_window;

    std::filesystem::path m_configPath;
    VolumetricConfig m_config;
    std::string m_configStatus;
    bool m_configStatusIsError { false };

    FlyingCamera m_camera;
    SceneMeshBuffer m_sceneMesh;

    ShadowMapPass m_shadowMap;
    GeometryStage m_geometryStage;
    VolumetricLightStage m_volumetricStage;
    DeferredCompositionStage m_compositionStage;
    TonemappingStage m_tonemapping;

    RenderStats m_renderStats;
    float m_frameTimeMs { 0.0f };

    bool m_mouseLookActive { false };
    glm::vec2 m_lastCursor { 0.0f };
};

Application::Application(std::filesystem::path configPath)
    : m_window("Tyndall", glm::ivec2(1600, 900))
    , m_configPath(std::move(configPath))
    , m_config(loadVolumetricConfig(m_configPath))
{
    enableDebugOutput();
    // Reversed-Z needs the full [0, 1] depth range.
    glClipControl(GL_LOWER_LEFT, GL_ZERO_TO_ONE);

    const SceneGeometry scene = buildDemoScene();
    m_sceneMesh.upload(scene);
    fmt::print(stderr, "[Application] demo scene: {} triangles\n", scene.triangleCount());

    const glm::ivec2 framebuffer = m_window.getFrameBufferSize();
    m_shadowMap.initialize(kShaderDirectory, m_config.volumetric.shadowSize);
    m_geometryStage.initialize(kShaderDirectory, framebuffer);
    m_volumetricStage.initialize(kShaderDirectory, framebuffer, m_geometryStage.depthStencilTexture());
    m_compositionStage.initialize(kShaderDirectory, framebuffer, m_geometryStage.depthStencilTexture());
    m_tonemapping.initialize(kShaderDirectory);

    m_window.registerWindowResizeCallback([this](const glm::ivec2& framebufferSize) {
        resizeTargets(framebufferSize);
    });

    m_camera.setPosition(glm::vec3(-26.0f, 7.0f, 26.0f));
    m_camera.lookAt(glm::vec3(0.0f, 4.0f, 0.0f));
}

void Application::resizeTargets(glm::ivec2 framebufferSize)
{
    if (framebufferSize.x <= 0 || framebufferSize.y <= 0)
        return;
    m_geometryStage.resize(framebufferSize);
    m_volumetricStage.resize(framebufferSize, m_geometryStage.depthStencilTexture());
    m_compositionStage.resize(framebufferSize, m_geometryStage.depthStencilTexture());
}

void Application::update()
{
    auto lastFrameTime = std::chrono::steady_clock::now();

    while (!m_window.shouldClose()) {
        const auto now = std::chrono::steady_clock::now();
        const float deltaTime = std::chrono::duration<float>(now - lastFrameTime).count();
        lastFrameTime = now;
        m_frameTimeMs = deltaTime * 1000.0f;

        m_window.updateInput();
        handleCameraInput(deltaTime);

        const glm::ivec2 framebufferSize = m_window.getFrameBufferSize();
        if (framebufferSize.x > 0 && framebufferSize.y > 0)
            renderFrame(framebufferSize);

        drawUi();

        // Processes input and swaps the window buffer
        m_window.swapBuffers();
    }
}

void Application::handleCameraInput(float deltaTime)
{
    const ImGuiIO& io = ImGui::GetIO();

    const bool lookPressed = m_window.isMouseButtonPressed(GLFW_MOUSE_BUTTON_RIGHT) && !io.WantCaptureMouse;
    const glm::vec2 cursor = m_window.getCursorPos();
    if (lookPressed && !m_mouseLookActive) {
        m_mouseLookActive = true;
        m_window.setMouseCaptured(true);
    } else if (!m_window.isMouseButtonPressed(GLFW_MOUSE_BUTTON_RIGHT) && m_mouseLookActive) {
        m_mouseLookActive = false;
        m_window.setMouseCaptured(false);
    } else if (m_mouseLookActive) {
        const glm::vec2 delta = cursor - m_lastCursor;
        m_camera.addYawPitch(delta.x, -delta.y);
    }
    m_lastCursor = cursor;

    if (io.WantCaptureKeyboard)
        return;

    glm::vec3 direction { 0.0f };
    if (m_window.isKeyPressed(GLFW_KEY_W))
        direction.z += 1.0f;
    if (m_window.isKeyPressed(GLFW_KEY_S))
        direction.z -= 1.0f;
    if (m_window.isKeyPressed(GLFW_KEY_D))
        direction.x += 1.0f;
    if (m_window.isKeyPressed(GLFW_KEY_A))
        direction.x -= 1.0f;
    if (m_window.isKeyPressed(GLFW_KEY_SPACE))
        direction.y += 1.0f;
    if (m_window.isKeyPressed(GLFW_KEY_LEFT_CONTROL))
        direction.y -= 1.0f;
    m_camera.move(direction, deltaTime);

    if (m_window.isKeyPressed(GLFW_KEY_ESCAPE))
        m_window.close();
}

void Application::renderFrame(glm::ivec2 framebufferSize)
{
    m_renderStats.reset();

    const float aspect = static_cast<float>(framebufferSize.x) / static_cast<float>(framebufferSize.y);
    const CameraMatrices camera = makeCameraMatrices(m_camera.getViewMatrix(),
        glm::radians(m_camera.getFieldOfView()), aspect, m_camera.getNearPlane());
    const LightFrustum light = buildLightFrustum(m_config.light);

    m_shadowMap.resize(m_config.volumetric.shadowSize);
    m_shadowMap.render(light, [this](const glm::mat4&) {
        m_sceneMesh.draw();
        m_renderStats.addDraw(RenderPass::ShadowMap, static_cast<std::uint64_t>(m_sceneMesh.triangleCount()));
    });
    TRACE_APP_FBO("after shadow map");

    m_geometryStage.render(m_sceneMesh, camera, m_renderStats);
    TRACE_APP_FBO("after geometry");
    m_volumetricStage.render(m_shadowMap, m_config.volumetric, camera, m_renderStats);
    TRACE_APP_FBO("after volumetric light");
    m_compositionStage.render(m_geometryStage, m_volumetricStage, m_shadowMap, m_config.volumetric, camera, m_renderStats);
    TRACE_APP_FBO("after composition");
    m_tonemapping.render(m_compositionStage.hdrTexture(), framebufferSize);
}

void Application::drawUi()
{
    ImGui::Begin("Tyndall");
    ImGui::Text("Frame: %.2f ms", static_cast<double>(m_frameTimeMs));
    ImGui::Text("Draw calls: %llu  Triangles: %llu",
        static_cast<unsigned long long>(m_renderStats.totalDrawCalls()),
        static_cast<unsigned long long>(m_renderStats.totalTriangles()));
    if (ImGui::TreeNode("Passes")) {
        for (std::size_t i = 0; i < RenderStats::kPassCount; ++i) {
            ImGui::Text("%-12s %llu draws, %llu triangles", renderPassName(static_cast<RenderPass>(i)),
                static_cast<unsigned long long>(m_renderStats.drawCalls[i]),
                static_cast<unsigned long long>(m_renderStats.triangles[i]));
        }
        ImGui::TreePop();
    }
    const glm::vec3 position = m_camera.getPosition();
    ImGui::Text("Camera: %.1f %.1f %.1f", static_cast<double>(position.x), static_cast<double>(position.y), static_cast<double>(position.z));
    ImGui::TextUnformatted("Hold RMB to look, WASD/Space/LCtrl to fly");

    if (ImGui::CollapsingHeader("Medium", ImGuiTreeNodeFlags_DefaultOpen))
        drawMediumPanel();
    if (ImGui::CollapsingHeader("Light", ImGuiTreeNodeFlags_DefaultOpen))
        drawLightPanel();
    if (ImGui::CollapsingHeader("Shadow Map"))
        m_shadowMap.drawImGuiPanel();
    if (ImGui::CollapsingHeader("G-buffer"))
        m_geometryStage.drawImGuiPanel();
    if (ImGui::CollapsingHeader("Volumetric Light"))
        m_volumetricStage.drawImGuiPanel();
    if (ImGui::CollapsingHeader("Composition"))
        m_compositionStage.drawImGuiPanel();
    if (ImGui::CollapsingHeader("Tone Mapping"))
        m_tonemapping.drawImGuiPanel();
    if (ImGui::CollapsingHeader("Configuration"))
        drawConfigPanel();
    ImGui::End();
}

void Application::drawMediumPanel()
{
    VolumetricSettings& settings = m_config.volumetric;
    ImGui::SliderFloat3("Transparency", glm::value_ptr(settings.medium.transparency), 0.5f, 0.999f, "%.3f");
    ImGui::SliderFloat("Scatter", &settings.medium.scatter, 0.0f, 0.2f, "%.4f");
    ImGui::SliderFloat("Shadow narrowness", &settings.shadowThresholdNarrowness, 1.0f, 2048.0f, "%.0f", ImGuiSliderFlags_Logarithmic);

    int model = settings.distanceModel == DistanceModel::ViewRay ? 1 : 0;
    const char* models[] = { "Reciprocal depth", "View ray" };
    if (ImGui::Combo("Distance model", &model, models, 2))
        settings.distanceModel = model == 1 ? DistanceModel::ViewRay : DistanceModel::ReciprocalDepth;

    ImGui::Checkbox("Camera submerged", &settings.cameraSubmerged);

    int sizeIndex = 0;
    for (int i = 0; i < static_cast<int>(kShadowSizes.size()); ++i) {
        if (kShadowSizes[static_cast<std::size_t>(i)] == settings.shadowSize)
            sizeIndex = i;
    }
    const char* sizeLabels[] = { "256", "512", "1024", "2048" };
    if (ImGui::Combo("Shadow size", &sizeIndex, sizeLabels, static_cast<int>(kShadowSizes.size())))
        settings.shadowSize = kShadowSizes[static_cast<std::size_t>(sizeIndex)];
}

void Application::drawLightPanel()
{
    DirectionalLight& light = m_config.light;
    ImGui::DragFloat3("Direction", glm::value_ptr(light.direction), 0.01f, -1.0f, 1.0f);
    ImGui::DragFloat3("Focus", glm::value_ptr(light.focus), 0.1f);
    ImGui::SliderFloat("Half extent", &light.halfExtent, 1.0f, 100.0f);
    ImGui::SliderFloat("Depth range", &light.depthRange, 1.0f, 300.0f);
}

void Application::drawConfigPanel()
{
    const std::string pathString = m_configPath.string();
    ImGui::TextWrapped("%s", pathString.c_str());
    if (ImGui::Button("Reload"))
        reloadConfig();
    ImGui::SameLine();
    if (ImGui::Button("Save"))
        saveConfig();

    if (!m_configStatus.empty()) {
        const ImVec4 color = m_configStatusIsError ? ImVec4(1.0f, 0.4f, 0.4f, 1.0f) : ImVec4(0.6f, 1.0f, 0.6f, 1.0f);
        ImGui::TextColored(color, "%s", m_configStatus.c_str());
    }
}

void Application::reloadConfig()
{
    try {
        m_config = loadVolumetricConfig(m_configPath);
        m_configStatus = "Reloaded " + m_configPath.filename().string();
        m_configStatusIsError = false;
    } catch (const ConfigurationError& ex) {
        m_configStatus = ex.what();
        m_configStatusIsError = true;
        fmt::print(stderr, "[Application] {}\n", ex.what());
    }
}

void Application::saveConfig()
{
    try {
        saveVolumetricConfig(m_config, m_configPath);
        m_configStatus = "Saved " + m_configPath.filename().string();
        m_configStatusIsError = false;
    } catch (const ConfigurationError& ex) {
        m_configStatus = ex.what();
        m_configStatusIsError = true;
        fmt::print(stderr, "[Application] {}\n", ex.what());
    }
}

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1]) : kDefaultConfig;

    try {
        Application app(configPath);
        app.update();
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[Application] fatal: {}\n", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
