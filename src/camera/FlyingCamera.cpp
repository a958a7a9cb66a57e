// SPDX-License-Identifier: MIT

#include "camera/FlyingCamera.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/trigonometric.hpp>
DISABLE_WARNINGS_POP()

#include <cmath>
#include <limits>

namespace {
constexpr glm::vec3 WORLD_UP { 0.0f, 1.0f, 0.0f };
}

FlyingCamera::FlyingCamera()
{
	updateVectors();
}

void FlyingCamera::setPosition(const glm::vec3& position)
{
	m_position = position;
}

void FlyingCamera::setYaw(float yawDegrees)
{
	m_yawDegrees = yawDegrees;
	updateVectors();
}

void FlyingCamera::setPitch(float pitchDegrees)
{
	m_pitchDegrees = glm::clamp(pitchDegrees, m_minPitch, m_maxPitch);
	updateVectors();
}

void FlyingCamera::setMovementSpeed(float unitsPerSecond)
{
	m_movementSpeed = glm::max(unitsPerSecond, 0.0f);
}

void FlyingCamera::setMouseSensitivity(float degreesPerPixel)
{
	m_mouseSensitivity = degreesPerPixel;
}

void FlyingCamera::setFieldOfView(float fovyDegrees)
{
	m_fovyDegrees = glm::clamp(fovyDegrees, 10.0f, 150.0f);
}

void FlyingCamera::move(const glm::vec3& direction, float deltaTimeSeconds)
{
	if (deltaTimeSeconds <= 0.0f || glm::length(direction) <= 0.0f)
		return;

	const glm::vec3 displacement = m_right * direction.x + WORLD_UP * direction.y + m_forward * direction.z;
	if (glm::length(displacement) > 0.0f)
		m_position += glm::normalize(displacement) * m_movementSpeed * deltaTimeSeconds;
}

void FlyingCamera::addYawPitch(float yawOffsetPixels, float pitchOffsetPixels)
{
	m_yawDegrees += yawOffsetPixels * m_mouseSensitivity;
	m_pitchDegrees = glm::clamp(m_pitchDegrees + pitchOffsetPixels * m_mouseSensitivity, m_minPitch, m_maxPitch);
	updateVectors();
}

void FlyingCamera::lookAt(const glm::vec3& target)
{
	const glm::vec3 offset = target - m_position;
	if (glm::length(offset) < 1e-4f)
		return;

	const glm::vec3 direction = glm::normalize(offset);
	m_yawDegrees = glm::degrees(std::atan2(direction.z, direction.x));
	m_pitchDegrees = glm::clamp(glm::degrees(std::asin(direction.y)), m_minPitch, m_maxPitch);
	updateVectors();
}

glm::mat4 FlyingCamera::getViewMatrix() const
{
	return glm::lookAt(m_position, m_position + m_forward, WORLD_UP);
}

void FlyingCamera::updateVectors()
{
	const float yawRad = glm::radians(m_yawDegrees);
	const float pitchRad = glm::radians(m_pitchDegrees);

	const glm::vec3 forward {
		glm::cos(pitchRad) * glm::cos(yawRad),
		glm::sin(pitchRad),
		glm::cos(pitchRad) * glm::sin(yawRad)
	};

	m_forward = glm::normalize(forward);
	const glm::vec3 right = glm::cross(m_forward, WORLD_UP);
	if (glm::length(right) < std::numeric_limits<float>::epsilon())
		m_right = glm::vec3(1.0f, 0.0f, 0.0f);
	else
		m_right = glm::normalize(right);
}
