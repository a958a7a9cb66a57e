// SPDX-License-Identifier: MIT

#pragma once

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
DISABLE_WARNINGS_POP()

// Free-flying camera for inspecting the light shafts.
class FlyingCamera {
public:
	FlyingCamera();

	void setPosition(const glm::vec3& position);
	void setYaw(float yawDegrees);
	void setPitch(float pitchDegrees);
	void setMovementSpeed(float unitsPerSecond);
	void setMouseSensitivity(float degreesPerPixel);
	void setFieldOfView(float fovyDegrees);

	[[nodiscard]] glm::vec3 getPosition() const { return m_position; }
	[[nodiscard]] float getYaw() const { return m_yawDegrees; }
	[[nodiscard]] float getPitch() const { return m_pitchDegrees; }
	[[nodiscard]] float getMovementSpeed() const { return m_movementSpeed; }
	[[nodiscard]] float getMouseSensitivity() const { return m_mouseSensitivity; }
	[[nodiscard]] float getFieldOfView() const { return m_fovyDegrees; }
	[[nodiscard]] float getNearPlane() const { return m_nearPlane; }

	// direction.x = strafing (right +, left -)
	// direction.y = vertical (up +, down -)
	// direction.z = forward/backward (forward +, backward -)
	void move(const glm::vec3& direction, float deltaTimeSeconds);
	void addYawPitch(float yawOffsetPixels, float pitchOffsetPixels);
	void lookAt(const glm::vec3& target);

	[[nodiscard]] glm::mat4 getViewMatrix() const;
	[[nodiscard]] glm::vec3 getForward() const { return m_forward; }
	[[nodiscard]] glm::vec3 getRight() const { return m_right; }

private:
	void updateVectors();

	glm::vec3 m_position { 0.0f, 6.0f, 30.0f };
	glm::vec3 m_forward { 0.0f, 0.0f, -1.0f };
	glm::vec3 m_right { 1.0f, 0.0f, 0.0f };
	float m_yawDegrees { -90.0f };
	float m_pitchDegrees { 0.0f };

	float m_movementSpeed { 8.0f };
	float m_mouseSensitivity { 0.1f };
	float m_fovyDegrees { 70.0f };
	float m_nearPlane { 0.1f };

	float m_minPitch { -89.0f };
	float m_maxPitch { 89.0f };
};
