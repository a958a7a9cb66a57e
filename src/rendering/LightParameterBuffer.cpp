// SPDX-License-Identifier: MIT

#include "rendering/LightParameterBuffer.h"

LightParameterBuffer::~LightParameterBuffer()
{
    shutdown();
}

void LightParameterBuffer::upload(const LightParameters& parameters)
{
    const GpuLightParameters gpuParameters(parameters);
    if (m_buffer == 0) {
        glGenBuffers(1, &m_buffer);
        glBindBuffer(GL_UNIFORM_BUFFER, m_buffer);
        glBufferData(GL_UNIFORM_BUFFER, sizeof(GpuLightParameters), &gpuParameters, GL_DYNAMIC_DRAW);
    } else {
        glBindBuffer(GL_UNIFORM_BUFFER, m_buffer);
        glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(GpuLightParameters), &gpuParameters);
    }
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
}

void LightParameterBuffer::bind(GLuint binding) const
{
    glBindBufferBase(GL_UNIFORM_BUFFER, binding, m_buffer);
}

void LightParameterBuffer::shutdown()
{
    if (m_buffer != 0) {
        glDeleteBuffers(1, &m_buffer);
        m_buffer = 0;
    }
}
