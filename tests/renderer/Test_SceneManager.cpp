#include "SceneTestUtils.hpp"

#include "minir/core/cvar.hpp"
#include "minir/renderer/scene/SceneManager.hpp"

#include <cpptrace/cpptrace.hpp>
#include <doctest/doctest.h>

#include <string>

using namespace minir;
using namespace minir::renderer::scene;

namespace {

void checkAccounting(const SceneManager &scene) {
  CHECK(scene.renderedObjects() + scene.culledObjects() == scene.totalObjects());
}

}

TEST_CASE("SceneManager add and remove") {
  test::SceneFixture fx;
  SceneManager scene;

  auto owned = fx.makeObject(fx.addRecording(), "A");
  SceneObject *a = scene.addObject(std::move(owned));
  REQUIRE(a != nullptr);
  CHECK(scene.totalObjects() == 1);
  CHECK(scene.contains(a));

  SUBCASE("Null add is ignored") {
    CHECK(scene.addObject(nullptr) == nullptr);
    CHECK(scene.totalObjects() == 1);
  }

  SUBCASE("Adding the same object twice keeps one entry") {
    CHECK(scene.addObject(std::unique_ptr<SceneObject>(a)) == a);
    CHECK(scene.totalObjects() == 1);
  }

  SUBCASE("Remove hands ownership back") {
    std::unique_ptr<SceneObject> removed = scene.removeObject(a);
    REQUIRE(removed != nullptr);
    CHECK(removed.get() == a);
    CHECK(scene.totalObjects() == 0);
    CHECK_FALSE(removed->isDisposed());

    CHECK(scene.removeObject(a) == nullptr);
    CHECK(scene.removeObject(nullptr) == nullptr);
    CHECK(scene.totalObjects() == 0);
  }

  SUBCASE("Insertion order is preserved") {
    scene.addObject(fx.makeObject(fx.addRecording(), "B"));
    scene.addObject(fx.makeObject(fx.addRecording(), "C"));
    auto all = scene.getAllObjects();
    REQUIRE(all.size() == 3);
    CHECK(all[0]->name() == "A");
    CHECK(all[1]->name() == "B");
    CHECK(all[2]->name() == "C");
  }
}

TEST_CASE("SceneManager findObject ignores case and returns the first match") {
  test::SceneFixture fx;
  SceneManager scene;

  scene.addObject(fx.makeObject(fx.addRecording(), "A", glm::vec3(0.0f)));
  scene.addObject(fx.makeObject(fx.addRecording(), "B", glm::vec3(1.0f)));
  scene.addObject(fx.makeObject(fx.addRecording(), "A", glm::vec3(2.0f)));

  SceneObject *found = scene.findObject("a");
  REQUIRE(found != nullptr);
  CHECK(found->position() == glm::vec3(0.0f));

  CHECK(scene.findObject("b") != nullptr);
  CHECK(scene.findObject("missing") == nullptr);
  CHECK(scene.findObject("") == nullptr);
}

TEST_CASE("SceneManager distance culling") {
  test::SceneFixture fx;
  SceneSettings settings{};
  settings.maxRenderDistance = 10.0f;
  SceneManager scene(settings);

  for (float d : {5.0f, 10.0f, 10.5f, 20.0f}) {
    scene.addObject(fx.makeObject(fx.addRecording(), "Obj_" + std::to_string(static_cast<int>(d * 10)),
                                  glm::vec3(d, 0.0f, 0.0f)));
  }

  scene.render(fx.shader, glm::vec3(0.0f));
  CHECK(scene.renderedObjects() == 2);
  CHECK(scene.culledObjects() == 2);
  checkAccounting(scene);

  SUBCASE("Widening the radius renders more") {
    scene.adjustRenderDistance(0.5f);
    scene.render(fx.shader, glm::vec3(0.0f));
    CHECK(scene.renderedObjects() == 3);
    CHECK(scene.culledObjects() == 1);
    checkAccounting(scene);
  }

  SUBCASE("Viewer position matters") {
    scene.render(fx.shader, glm::vec3(20.0f, 0.0f, 0.0f));
    CHECK(scene.renderedObjects() == 3);
    CHECK(scene.culledObjects() == 1);
  }

  SUBCASE("Culling off renders everything") {
    scene.toggleDistanceCulling();
    CHECK_FALSE(scene.distanceCullingEnabled());
    scene.render(fx.shader, glm::vec3(1000.0f));
    CHECK(scene.renderedObjects() == 4);
    CHECK(scene.culledObjects() == 0);
    checkAccounting(scene);
  }
}

TEST_CASE("SceneManager counters with invisible objects") {
  test::SceneFixture fx;
  SceneManager scene;

  DrawableHandle hidden = fx.addRecording();
  scene.addObject(fx.makeObject(fx.addRecording(), "Visible"));
  SceneObject *h = scene.addObject(fx.makeObject(hidden, "Hidden"));
  h->setVisible(false);

  SUBCASE("Culling on counts invisible objects as culled") {
    scene.render(fx.shader, glm::vec3(0.0f));
    CHECK(scene.renderedObjects() == 1);
    CHECK(scene.culledObjects() == 1);
    checkAccounting(scene);
  }

  SUBCASE("Culling off counts them as rendered without drawing") {
    scene.setDistanceCulling(false);
    scene.render(fx.shader, glm::vec3(0.0f));
    CHECK(scene.renderedObjects() == 2);
    CHECK(scene.culledObjects() == 0);
    CHECK(fx.recording(hidden)->renderCount == 0);
  }
}

TEST_CASE("SceneManager counters reset every render") {
  test::SceneFixture fx;
  SceneManager scene;
  scene.addObject(fx.makeObject(fx.addRecording(), "Near", glm::vec3(1.0f)));
  scene.addObject(fx.makeObject(fx.addRecording(), "Far", glm::vec3(500.0f)));

  for (int frame = 0; frame < 3; ++frame) {
    scene.render(fx.shader, glm::vec3(0.0f));
    CHECK(scene.renderedObjects() == 1);
    CHECK(scene.culledObjects() == 1);
  }

  SceneStats stats = scene.stats();
  CHECK(stats.totalObjects == 2);
  CHECK(stats.renderedObjects == 1);
  CHECK(stats.culledObjects == 1);
}

TEST_CASE("SceneManager render distance has a floor") {
  SceneManager scene;
  CHECK(scene.maxRenderDistance() == doctest::Approx(50.0f));

  scene.adjustRenderDistance(-1000.0f);
  CHECK(scene.maxRenderDistance() == doctest::Approx(SceneSettings::kMinRenderDistance));

  scene.adjustRenderDistance(2.5f);
  CHECK(scene.maxRenderDistance() == doctest::Approx(7.5f));

  SceneSettings tooSmall{};
  tooSmall.maxRenderDistance = 1.0f;
  SceneManager clamped(tooSmall);
  CHECK(clamped.maxRenderDistance() == doctest::Approx(5.0f));
}

TEST_CASE("SceneManager update advances every object") {
  test::SceneFixture fx;
  SceneManager scene;

  SceneObject *spinning = scene.addObject(fx.makeObject(fx.addRecording(), "Spinning"));
  spinning->setAutoRotate(true);
  spinning->setRotationSpeed(glm::vec3(0.0f, 90.0f, 0.0f));
  SceneObject *still = scene.addObject(fx.makeObject(fx.addRecording(), "Still"));

  scene.update(0.5f);
  scene.update(0.5f);

  CHECK(spinning->rotation().y == doctest::Approx(90.0f));
  CHECK(still->rotation() == glm::vec3(0.0f));
}

TEST_CASE("SceneManager render draws through the backend") {
  test::SceneFixture fx;
  SceneManager scene;

  scene.addObject(fx.makeObject(fx.addCube(), "Near", glm::vec3(1.0f, 0.0f, 0.0f)));
  scene.addObject(fx.makeObject(fx.addCube(), "Far", glm::vec3(100.0f, 0.0f, 0.0f)));

  fx.backend.beginFrame();
  scene.render(fx.shader, glm::vec3(0.0f));
  fx.backend.endFrame();

  CHECK(fx.backend.lastFrameDrawCount() == 1);
  REQUIRE(fx.backend.drawCalls().size() == 1);
  CHECK(fx.backend.drawCalls()[0].model[3][0] == doctest::Approx(1.0f));
}

TEST_CASE("Draw log holds only the current frame") {
  test::SceneFixture fx;
  SceneManager scene;

  scene.addObject(fx.makeObject(fx.addCube(), "Left", glm::vec3(-2.0f, 0.0f, 0.0f)));
  scene.addObject(fx.makeObject(fx.addCube(), "Right", glm::vec3(2.0f, 0.0f, 0.0f)));
  scene.addObject(fx.makeObject(fx.addCube(), "Far", glm::vec3(200.0f, 0.0f, 0.0f)));

  for (int frame = 0; frame < 3; ++frame) {
    fx.backend.beginFrame();
    scene.render(fx.shader, glm::vec3(0.0f));
    fx.backend.endFrame();

    CHECK(scene.renderedObjects() == 2);
    CHECK(fx.backend.lastFrameDrawCount() == 2);
    CHECK(fx.backend.drawCalls().size() == 2);
  }
  CHECK(fx.backend.frameIndex() == 3);

  fx.backend.beginFrame();
  CHECK(fx.backend.drawCalls().empty());
}

TEST_CASE("SceneManager render propagates drawable faults") {
  test::SceneFixture fx;
  SceneManager scene;

  DrawableHandle cube = fx.addCube();
  scene.addObject(fx.makeObject(cube, "Broken"));
  fx.backend.destroyMesh(static_cast<Mesh *>(fx.content.get(cube))->gpuMesh());

  CHECK_THROWS_AS(scene.render(fx.shader, glm::vec3(0.0f)), cpptrace::runtime_error);

  // The pass guard is released even when a draw throws.
  CHECK(scene.addObject(fx.makeObject(fx.addRecording(), "After")) != nullptr);
}

TEST_CASE("SceneManager clear and dispose") {
  test::SceneFixture fx;
  DrawableHandle shared = fx.addRecording();

  SceneManager scene;
  SceneObject *first = scene.addObject(fx.makeObject(shared, "First"));
  scene.addObject(first->clone());
  CHECK(fx.content.userCount(shared) == 2);

  scene.render(fx.shader, glm::vec3(0.0f));
  scene.clear();

  CHECK(scene.totalObjects() == 0);
  CHECK(scene.renderedObjects() == 0);
  CHECK(scene.culledObjects() == 0);
  CHECK(fx.content.userCount(shared) == 0);
  CHECK(fx.content.contains(shared));

  scene.dispose();
  scene.dispose();
  CHECK(scene.totalObjects() == 0);
}

TEST_CASE("SceneManager getPerformanceInfo") {
  test::SceneFixture fx;
  SceneManager scene;
  scene.addObject(fx.makeObject(fx.addRecording(), "Near", glm::vec3(1.0f)));
  scene.addObject(fx.makeObject(fx.addRecording(), "Far", glm::vec3(100.0f)));
  scene.render(fx.shader, glm::vec3(0.0f));

  CHECK(scene.getPerformanceInfo() ==
        "Objects: 2 | Rendered: 1 | Culled: 1 | Distance Culling: On | Max Distance: 50");

  scene.toggleDistanceCulling();
  CHECK(scene.getPerformanceInfo() ==
        "Objects: 2 | Rendered: 1 | Culled: 1 | Distance Culling: Off | Max Distance: 50");
}

TEST_CASE("SceneSettings round-trip through cvars") {
  core::ICVar *culling = core::CVarSystem::find("scene_distance_culling");
  core::ICVar *distance = core::CVarSystem::find("scene_max_render_distance");
  REQUIRE(culling != nullptr);
  REQUIRE(distance != nullptr);

  const std::string oldCulling = culling->toString();
  const std::string oldDistance = distance->toString();

  culling->setFromString("false");
  distance->setFromString("2");
  SceneSettings fromCVars = SceneSettings::fromCVars();
  CHECK_FALSE(fromCVars.enableDistanceCulling);
  CHECK(fromCVars.maxRenderDistance == doctest::Approx(SceneSettings::kMinRenderDistance));

  SceneSettings stored{};
  stored.enableDistanceCulling = true;
  stored.maxRenderDistance = 75.0f;
  stored.storeToCVars();
  CHECK(culling->toString() == "true");
  CHECK(SceneSettings::fromCVars().maxRenderDistance == doctest::Approx(75.0f));

  culling->setFromString(oldCulling);
  distance->setFromString(oldDistance);
}

TEST_CASE("Re-adding an owned object during a pass keeps it alive") {
  test::SceneFixture fx;
  SceneManager scene;

  DrawableHandle h = fx.addRecording();
  SceneObject *owned = scene.addObject(fx.makeObject(h, "Owned"));
  SceneObject *returned = nullptr;
  fx.recording(h)->onRender = [&] {
    returned = scene.addObject(std::unique_ptr<SceneObject>(owned));
  };

  CHECK_NOTHROW(scene.render(fx.shader, glm::vec3(0.0f)));
  CHECK(returned == owned);
  CHECK(scene.totalObjects() == 1);
  CHECK(scene.renderedObjects() == 1);

  fx.recording(h)->onRender = nullptr;
  REQUIRE(scene.findObject("owned") == owned);
  CHECK_FALSE(owned->isDisposed());
  scene.render(fx.shader, glm::vec3(0.0f));
  CHECK(fx.recording(h)->renderCount == 2);
}

#ifdef DEBUG
TEST_CASE("SceneManager rejects structural changes during a pass") {
  test::SceneFixture fx;
  SceneManager scene;

  DrawableHandle h = fx.addRecording();
  scene.addObject(fx.makeObject(h, "Reentrant"));
  fx.recording(h)->onRender = [&] {
    scene.addObject(fx.makeObject(fx.addRecording(), "Intruder"));
  };

  CHECK_THROWS_AS(scene.render(fx.shader, glm::vec3(0.0f)), cpptrace::runtime_error);
  CHECK(scene.totalObjects() == 1);

  fx.recording(h)->onRender = nullptr;
  CHECK(scene.addObject(fx.makeObject(fx.addRecording(), "Later")) != nullptr);
}
#endif
