#include "minir/app/Application.hpp"
#include "minir/core/cvar.hpp"
#include "minir/renderer/lighting/LightingController.hpp"
#include "minir/renderer/scene/Camera.hpp"
#include "minir/renderer/scene/ContentRegistry.hpp"
#include "minir/renderer/scene/DemoScene.hpp"
#include "minir/renderer/scene/Model.hpp"
#include "minir/renderer/scene/SceneManager.hpp"

#include <charconv>
#include <cstdio>
#include <memory>
#include <string_view>
#include <system_error>

AUTO_CVAR_FLOAT(scene_perf_log_interval, "Seconds between scene performance log lines (0 disables)",
                2.0f, minir::core::CVarFlags::save);

using namespace minir;
using namespace minir::renderer;

class SceneDemoApp : public app::Application {
    scene::ContentRegistry m_content;
    std::unique_ptr<scene::SceneManager> m_scene;
    scene::Camera m_camera;
    lighting::LightingController m_lighting;
    ShaderHandle m_shader{};

    float m_cameraYaw = 0.0f;
    float m_perfTimer = 0.0f;

public:
    explicit SceneDemoApp(app::ApplicationConfig cfg) : Application(std::move(cfg)) {}

    void onInit() override {
        m_shader = backend().createShaderProgram("lighting");
        m_scene = std::make_unique<scene::SceneManager>(scene::SceneSettings::fromCVars());

        auto car = scene::Model::createCube(backend(), 2.0f, glm::vec4(0.8f, 0.2f, 0.2f, 1.0f));
        car->setName("Car");
        const DrawableHandle carHandle = m_content.add(std::move(car));

        scene::createDemoScene(*m_scene, m_content, backend(), carHandle);

        m_camera.setPerspective(45.0f, aspectRatio(), 0.1f, 100.0f);
        m_camera.orbit(glm::vec3(0.0f, 0.0f, 5.0f), m_cameraYaw, 20.0f, 20.0f);

        Log::info("Controls: C culling | +/- render distance | I scene info | 1/2/3 lighting | Tab light type | Esc quit");
    }

    void onEvent(const SDL_Event& e) override {
        if (e.type != SDL_EVENT_KEY_DOWN || e.key.repeat) {
            return;
        }

        switch (e.key.scancode) {
        case SDL_SCANCODE_C:
            m_scene->toggleDistanceCulling();
            break;
        case SDL_SCANCODE_EQUALS:
        case SDL_SCANCODE_KP_PLUS:
            m_scene->adjustRenderDistance(5.0f);
            break;
        case SDL_SCANCODE_MINUS:
        case SDL_SCANCODE_KP_MINUS:
            m_scene->adjustRenderDistance(-5.0f);
            break;
        case SDL_SCANCODE_I:
            m_scene->printSceneInfo();
            Log::info("{}", m_lighting.getLightingInfo());
            break;
        case SDL_SCANCODE_1:
            m_lighting.toggleComponent("ambient");
            break;
        case SDL_SCANCODE_2:
            m_lighting.toggleComponent("diffuse");
            break;
        case SDL_SCANCODE_3:
            m_lighting.toggleComponent("specular");
            break;
        case SDL_SCANCODE_TAB:
            m_lighting.cyclePrimaryLightType();
            break;
        case SDL_SCANCODE_ESCAPE:
            requestQuit();
            break;
        default:
            break;
        }
    }

    void onUpdate(float dt) override {
        m_cameraYaw += 10.0f * dt;
        m_camera.orbit(glm::vec3(0.0f, 0.0f, 5.0f), m_cameraYaw, 20.0f, 20.0f);

        m_scene->update(dt);

        const float interval = scene_perf_log_interval.get();
        m_perfTimer += dt;
        if (interval > 0.0f && m_perfTimer >= interval) {
            m_perfTimer = 0.0f;
            Log::info("{} | {:.0f} FPS", m_scene->getPerformanceInfo(), timer().averageFps());
        }
    }

    void onRenderFrame(float dt) override {
        (void)dt;
        const glm::vec3& eye = m_camera.position();

        m_lighting.applyToShader(backend(), m_shader, eye);
        backend().setUniform(m_shader, "view", m_camera.view());
        backend().setUniform(m_shader, "projection", m_camera.proj());

        m_scene->render(m_shader, eye);
    }

    void onShutdown() override {
        m_scene->settings().storeToCVars();
        m_scene->dispose();
        m_content.clear();
        backend().destroyShaderProgram(m_shader);
    }
};

int main(int argc, char** argv) {
    app::ApplicationConfig cfg{};
    cfg.title = "minir - Scene Management Demo";

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--headless") {
            cfg.headless = true;
        } else if (arg == "--frames" && i + 1 < argc) {
            const std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), cfg.maxFrames);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                std::fprintf(stderr, "invalid --frames value '%s'\n", argv[i]);
                return 2;
            }
        }
    }
    if (cfg.headless && cfg.maxFrames == 0) {
        cfg.maxFrames = 300;
    }

    SceneDemoApp app(std::move(cfg));
    return app.run();
}
