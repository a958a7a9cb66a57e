// SPDX-License-Identifier: MIT
#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()

#include <functional>
#include <string_view>
#include <vector>

struct GLFWwindow;

// GLFW window with an OpenGL 4.5 core context and the ImGui backends bound
// to it. updateInput() starts an ImGui frame and swapBuffers() renders it.
class Window {
public:
    using WindowResizeCallback = std::function<void(const glm::ivec2& framebufferSize)>;

    Window(std::string_view title, const glm::ivec2& windowSize);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    void close();
    [[nodiscard]] bool shouldClose() const;

    void updateInput();
    void swapBuffers();

    void registerWindowResizeCallback(WindowResizeCallback&& callback);

    [[nodiscard]] bool isKeyPressed(int key) const;
    [[nodiscard]] bool isMouseButtonPressed(int button) const;
    [[nodiscard]] glm::vec2 getCursorPos() const;
    void setMouseCaptured(bool captured);

    [[nodiscard]] glm::ivec2 getWindowSize() const;
    [[nodiscard]] glm::ivec2 getFrameBufferSize() const;
    [[nodiscard]] float getAspectRatio() const;

private:
    static void framebufferSizeCallback(GLFWwindow* window, int width, int height);

    GLFWwindow* m_window { nullptr };
    std::vector<WindowResizeCallback> m_resizeCallbacks;
};
