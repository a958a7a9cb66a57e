// SPDX-License-Identifier: MIT
#pragma once

#include "volumetric/LightParameters.h"

#include <framework/opengl_includes.h>

// Uniform buffer holding one GpuLightParameters block.
class LightParameterBuffer {
public:
    LightParameterBuffer() = default;
    ~LightParameterBuffer();

    LightParameterBuffer(const LightParameterBuffer&) = delete;
    LightParameterBuffer& operator=(const LightParameterBuffer&) = delete;

    void upload(const LightParameters& parameters);
    void bind(GLuint binding) const;
    void shutdown();

    [[nodiscard]] GLuint buffer() const { return m_buffer; }

private:
    GLuint m_buffer { 0 };
};
