#include "minir/renderer/lighting/LightingController.hpp"

#include "minir/core/common.hpp"
#include "minir/core/logger.hpp"

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace minir::renderer::lighting
{
    const char* toString(LightType type)
    {
        switch (type)
        {
        case LightType::Directional: return "Directional";
        case LightType::Point: return "Point";
        case LightType::Spot: return "Spot";
        }
        return "Unknown";
    }

    void LightingController::applyToShader(RenderBackend& backend, ShaderHandle shader,
                                           const glm::vec3& viewPos) const
    {
        backend.setUniform(shader, "light.type", static_cast<int32_t>(m_primary.type));
        backend.setUniform(shader, "light.position", m_primary.position);
        backend.setUniform(shader, "light.direction", glm::normalize(m_primary.direction));
        backend.setUniform(shader, "light.color", m_primary.color);
        backend.setUniform(shader, "light.intensity", m_primary.intensity);
        backend.setUniform(shader, "light.constant", m_primary.constant);
        backend.setUniform(shader, "light.linear", m_primary.linear);
        backend.setUniform(shader, "light.quadratic", m_primary.quadratic);
        if (m_primary.type == LightType::Spot)
        {
            backend.setUniform(shader, "light.cutOff", std::cos(glm::radians(m_primary.innerCutOff)));
            backend.setUniform(shader, "light.outerCutOff", std::cos(glm::radians(m_primary.outerCutOff)));
        }

        backend.setUniform(shader, "viewPos", viewPos);
        backend.setUniform(shader, "enableAmbient", m_enableAmbient);
        backend.setUniform(shader, "enableDiffuse", m_enableDiffuse);
        backend.setUniform(shader, "enableSpecular", m_enableSpecular);
        backend.setUniform(shader, "ambientStrength", m_ambientStrength);
        backend.setUniform(shader, "diffuseStrength", m_diffuseStrength);
        backend.setUniform(shader, "specularStrength", m_specularStrength);
        backend.setUniform(shader, "ambientColor", m_ambientColor);
    }

    bool LightingController::toggleComponent(std::string_view component)
    {
        bool* flag = nullptr;
        if (util::iequals(component, "ambient"))
        {
            flag = &m_enableAmbient;
        }
        else if (util::iequals(component, "diffuse"))
        {
            flag = &m_enableDiffuse;
        }
        else if (util::iequals(component, "specular"))
        {
            flag = &m_enableSpecular;
        }

        if (flag == nullptr)
        {
            core::Logger::Render.warn("Unknown lighting component '{}'", component);
            return false;
        }

        *flag = !*flag;
        core::Logger::Render.info("{} lighting: {}", component, *flag ? "ON" : "OFF");
        return true;
    }

    bool LightingController::adjustStrength(std::string_view component, float delta)
    {
        if (util::iequals(component, "ambient"))
        {
            m_ambientStrength = std::clamp(m_ambientStrength + delta, 0.0f, kMaxStrength);
        }
        else if (util::iequals(component, "diffuse"))
        {
            m_diffuseStrength = std::clamp(m_diffuseStrength + delta, 0.0f, kMaxStrength);
        }
        else if (util::iequals(component, "specular"))
        {
            m_specularStrength = std::clamp(m_specularStrength + delta, 0.0f, kMaxStrength);
        }
        else if (util::iequals(component, "intensity"))
        {
            m_primary.intensity = std::clamp(m_primary.intensity + delta, 0.0f, kMaxIntensity);
        }
        else
        {
            core::Logger::Render.warn("Unknown lighting component '{}'", component);
            return false;
        }
        return true;
    }

    void LightingController::cyclePrimaryLightType()
    {
        switch (m_primary.type)
        {
        case LightType::Directional:
            m_primary.type = LightType::Point;
            m_primary.position = glm::vec3(2.0f, 3.0f, 2.0f);
            break;
        case LightType::Point:
            m_primary.type = LightType::Spot;
            m_primary.direction = glm::vec3(0.0f, -1.0f, 0.0f);
            break;
        case LightType::Spot:
            m_primary.type = LightType::Directional;
            m_primary.direction = glm::vec3(-0.2f, -1.0f, -0.3f);
            break;
        }
        core::Logger::Render.info("Light type: {}", toString(m_primary.type));
    }

    std::string LightingController::getLightingInfo() const
    {
        const glm::vec3& p = m_primary.position;
        std::string info = "Lighting Status:\n";
        info += std::format("  Primary Light: {} at ({:.2f}, {:.2f}, {:.2f})\n", toString(m_primary.type), p.x, p.y, p.z);
        info += std::format("  Ambient: {} ({:.2f})\n", m_enableAmbient ? "ON" : "OFF", m_ambientStrength);
        info += std::format("  Diffuse: {} ({:.2f})\n", m_enableDiffuse ? "ON" : "OFF", m_diffuseStrength);
        info += std::format("  Specular: {} ({:.2f})\n", m_enableSpecular ? "ON" : "OFF", m_specularStrength);
        return info;
    }

    void LightingController::resetToDefaults()
    {
        *this = LightingController{};
    }
}
