// SPDX-License-Identifier: MIT

#include "app/Window.h"

#include <framework/opengl_includes.h>

DISABLE_WARNINGS_PUSH()
// Include glad before glfw3
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace {

void glfwErrorCallback(int error, const char* description)
{
    fmt::print(stderr, "[GLFW {}] {}\n", error, description);
}

} // namespace

Window::Window(std::string_view title, const glm::ivec2& windowSize)
{
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit())
        throw std::runtime_error("Could not initialize GLFW");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#ifndef NDEBUG
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
#endif

    const std::string titleString(title);
    m_window = glfwCreateWindow(windowSize.x, windowSize.y, titleString.c_str(), nullptr, nullptr);
    if (m_window == nullptr) {
        glfwTerminate();
        throw std::runtime_error("Could not create an OpenGL 4.5 core window");
    }

    glfwMakeContextCurrent(m_window);
    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        glfwDestroyWindow(m_window);
        glfwTerminate();
        throw std::runtime_error("Could not load OpenGL functions");
    }
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, framebufferSizeCallback);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(m_window, true);
    ImGui_ImplOpenGL3_Init("#version 450");

    fmt::print(stderr, "[Window] OpenGL {} on {}\n",
        reinterpret_cast<const char*>(glGetString(GL_VERSION)),
        reinterpret_cast<const char*>(glGetString(GL_RENDERER)));
}

Window::~Window()
{
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(m_window);
    glfwTerminate();
}

void Window::close()
{
    glfwSetWindowShouldClose(m_window, GLFW_TRUE);
}

bool Window::shouldClose() const
{
    return glfwWindowShouldClose(m_window) != 0;
}

void Window::updateInput()
{
    glfwPollEvents();
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void Window::swapBuffers()
{
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(m_window);
}

void Window::registerWindowResizeCallback(WindowResizeCallback&& callback)
{
    m_resizeCallbacks.push_back(std::move(callback));
}

bool Window::isKeyPressed(int key) const
{
    return glfwGetKey(m_window, key) == GLFW_PRESS;
}

bool Window::isMouseButtonPressed(int button) const
{
    return glfwGetMouseButton(m_window, button) == GLFW_PRESS;
}

glm::vec2 Window::getCursorPos() const
{
    double x = 0.0;
    double y = 0.0;
    glfwGetCursorPos(m_window, &x, &y);
    return glm::vec2(static_cast<float>(x), static_cast<float>(y));
}

void Window::setMouseCaptured(bool captured)
{
    glfwSetInputMode(m_window, GLFW_CURSOR, captured ? GLFW_CURSOR_DISABLED : GLFW_CURSOR_NORMAL);
}

glm::ivec2 Window::getWindowSize() const
{
    glm::ivec2 size { 0 };
    glfwGetWindowSize(m_window, &size.x, &size.y);
    return size;
}

glm::ivec2 Window::getFrameBufferSize() const
{
    glm::ivec2 size { 0 };
    glfwGetFramebufferSize(m_window, &size.x, &size.y);
    return size;
}

float Window::getAspectRatio() const
{
    const glm::ivec2 size = getFrameBufferSize();
    if (size.y == 0)
        return 1.0f;
    return static_cast<float>(size.x) / static_cast<float>(size.y);
}

void Window::framebufferSizeCallback(GLFWwindow* window, int width, int height)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (self == nullptr)
        return;
    const glm::ivec2 size(width, height);
    for (const WindowResizeCallback& callback : self->m_resizeCallbacks)
        callback(size);
}
