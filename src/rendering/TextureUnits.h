// SPDX-License-Identifier: MIT
#pragma once

#include <framework/opengl_includes.h>

namespace TextureUnits {

// Shared by every pass that reads the light's depth map.
constexpr GLuint ShadowMap = 0;

// G-buffer inputs of the composition pass.
constexpr GLuint GBuffer_Diffuse = 1;
constexpr GLuint GBuffer_Normal = 2;
constexpr GLuint GBuffer_LinearDepth = 3;
constexpr GLuint Volumetric = 4;

constexpr GLuint HdrColor = 5;

} // namespace TextureUnits

// Uniform block bindings.
namespace BufferBindings {

constexpr GLuint LightParameters = 0;

} // namespace BufferBindings
