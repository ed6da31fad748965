#pragma once

#include <glm/gtc/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/trigonometric.hpp>
#include <glm/vec3.hpp>

#include <algorithm>
#include <cmath>

namespace minir::renderer::scene {

    // View/projection pair. position() is the viewer position the scene culls against.
    class Camera {
    public:
        void lookAt(const glm::vec3& eye,
                    const glm::vec3& center,
                    const glm::vec3& up = glm::vec3(0.f, 1.f, 0.f))
        {
            m_view = glm::lookAt(eye, center, up);
            m_eye = eye;
            m_center = center;
            m_up = up;
        }

        // Places the eye on a sphere around target. Angles in degrees; pitch is
        // kept short of the poles so lookAt never degenerates.
        void orbit(const glm::vec3& target, float yawDeg, float pitchDeg, float radius)
        {
            const float pitch = glm::radians(std::clamp(pitchDeg, -89.0f, 89.0f));
            const float yaw = glm::radians(yawDeg);
            const glm::vec3 offset(std::cos(pitch) * std::sin(yaw),
                                   std::sin(pitch),
                                   std::cos(pitch) * std::cos(yaw));
            lookAt(target + offset * radius, target);
        }

        // fovyDeg in degrees
        void setPerspective(float fovyDeg, float aspect, float zNear, float zFar)
        {
            m_proj = glm::perspective(glm::radians(fovyDeg), aspect, zNear, zFar);
        }

        const glm::mat4& view() const noexcept { return m_view; }
        const glm::mat4& proj() const noexcept { return m_proj; }
        glm::mat4 viewProj() const noexcept { return m_proj * m_view; }

        const glm::vec3& position() const noexcept { return m_eye; }
        const glm::vec3& target() const noexcept { return m_center; }
        const glm::vec3& up() const noexcept { return m_up; }

    private:
        glm::mat4 m_view{1.0f};
        glm::mat4 m_proj{1.0f};

        glm::vec3 m_eye{0.0f, 0.0f, 3.0f};
        glm::vec3 m_center{0.0f};
        glm::vec3 m_up{0.0f, 1.0f, 0.0f};
    };

}
