#pragma once

#include "minir/core/Handle.h"
#include "minir/renderer/RenderBackend.hpp"

#include <glm/vec3.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace minir::renderer::lighting
{
    enum class LightType : int32_t
    {
        Directional = 0,
        Point = 1,
        Spot = 2
    };

    struct Light
    {
        LightType type = LightType::Point;
        glm::vec3 position{2.0f, 3.0f, 2.0f};
        glm::vec3 direction{0.0f, -1.0f, 0.0f};
        glm::vec3 color{1.0f};
        float intensity = 1.0f;

        // Point/spot attenuation
        float constant = 1.0f;
        float linear = 0.09f;
        float quadratic = 0.032f;

        // Spot cone, degrees
        float innerCutOff = 12.5f;
        float outerCutOff = 17.5f;
    };

    const char* toString(LightType type);

    /**
     * @brief Global lighting parameters plus one primary light, pushed to a shader as uniforms.
     *
     * Component names accepted by toggleComponent / adjustStrength are matched
     * case-insensitively: "ambient", "diffuse", "specular" and, for
     * adjustStrength only, "intensity". Unknown names are ignored.
     */
    class LightingController
    {
    public:
        static constexpr float kMaxStrength = 2.0f;
        static constexpr float kMaxIntensity = 5.0f;

        LightingController() = default;

        void applyToShader(RenderBackend& backend, ShaderHandle shader, const glm::vec3& viewPos) const;

        bool toggleComponent(std::string_view component);
        bool adjustStrength(std::string_view component, float delta);

        // Directional -> Point -> Spot -> Directional.
        void cyclePrimaryLightType();

        [[nodiscard]] std::string getLightingInfo() const;

        [[nodiscard]] Light& primaryLight() { return m_primary; }
        [[nodiscard]] const Light& primaryLight() const { return m_primary; }

        [[nodiscard]] bool ambientEnabled() const { return m_enableAmbient; }
        [[nodiscard]] bool diffuseEnabled() const { return m_enableDiffuse; }
        [[nodiscard]] bool specularEnabled() const { return m_enableSpecular; }

        [[nodiscard]] float ambientStrength() const { return m_ambientStrength; }
        [[nodiscard]] float diffuseStrength() const { return m_diffuseStrength; }
        [[nodiscard]] float specularStrength() const { return m_specularStrength; }

        [[nodiscard]] const glm::vec3& ambientColor() const { return m_ambientColor; }
        void setAmbientColor(const glm::vec3& color) { m_ambientColor = color; }

        void resetToDefaults();

    private:
        bool m_enableAmbient = true;
        bool m_enableDiffuse = true;
        bool m_enableSpecular = true;

        float m_ambientStrength = 0.1f;
        float m_diffuseStrength = 1.0f;
        float m_specularStrength = 0.5f;

        glm::vec3 m_ambientColor{0.1f};

        Light m_primary{};
    };
}
