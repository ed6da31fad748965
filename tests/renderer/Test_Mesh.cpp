#include "minir/renderer/NullRenderBackend.hpp"
#include "minir/renderer/scene/Mesh.hpp"
#include "minir/renderer/scene/Model.hpp"
#include "minir/renderer/scene/Primitive.hpp"

#include <cpptrace/cpptrace.hpp>
#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <type_traits>
#include <variant>

using namespace minir;
using namespace minir::renderer;
using namespace minir::renderer::scene;

namespace {

MeshData triangle() {
  MeshData data{};
  data.m_attributes = VertexAttribute_Position;
  data.m_vertices = {0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 1.0f, 0.0f};
  data.m_indices = {0, 1, 2};
  return data;
}

}

TEST_CASE("Primitive geometry layouts") {
  SUBCASE("Cube") {
    MeshData cube = Primitive::createCube(2.0f);
    CHECK(cube.floatsPerVertex() == 12);
    CHECK(cube.vertexCount() == 24);
    CHECK(cube.m_indices.size() == 36);

    BoundingBox b = BoundingBox::fromInterleaved(cube.m_vertices, cube.floatsPerVertex());
    CHECK(b.m_min == glm::vec3(-1.0f));
    CHECK(b.m_max == glm::vec3(1.0f));
  }

  SUBCASE("Wireframe cube") {
    MeshData wire = Primitive::createWireframeCube(1.0f);
    CHECK(wire.floatsPerVertex() == 7);
    CHECK(wire.vertexCount() == 8);
    CHECK(wire.m_indices.size() == 24);
  }

  SUBCASE("Grid") {
    MeshData grid = Primitive::createGrid(10.0f, 4.0f, 2);
    CHECK(grid.floatsPerVertex() == 8);
    CHECK(grid.vertexCount() == 9);
    CHECK(grid.m_indices.size() == 24);

    BoundingBox b = BoundingBox::fromInterleaved(grid.m_vertices, grid.floatsPerVertex());
    CHECK(b.size().x == doctest::Approx(10.0f));
    CHECK(b.size().y == doctest::Approx(0.0f));
    CHECK(b.size().z == doctest::Approx(4.0f));

    CHECK(Primitive::createGrid(1.0f, 1.0f, 0).m_vertices.empty());
  }
}

TEST_CASE("Mesh::create validates geometry") {
  NullRenderBackend backend;

  SUBCASE("Valid triangle uploads") {
    auto mesh = Mesh::create(backend, triangle());
    REQUIRE(mesh.has_value());
    CHECK((*mesh)->vertexCount() == 3);
    CHECK((*mesh)->indexCount() == 3);
    CHECK((*mesh)->kind() == DrawableKind::Mesh);
    CHECK(backend.liveMeshCount() == 1);
    mesh->reset();
    CHECK(backend.liveMeshCount() == 0);
  }

  SUBCASE("Empty geometry") {
    auto mesh = Mesh::create(backend, MeshData{});
    CHECK_FALSE(mesh.has_value());
  }

  SUBCASE("Missing position attribute") {
    MeshData data = triangle();
    data.m_attributes = VertexAttribute_Color;
    CHECK_FALSE(Mesh::create(backend, data).has_value());
  }

  SUBCASE("Partial vertex") {
    MeshData data = triangle();
    data.m_vertices.push_back(1.0f);
    CHECK_FALSE(Mesh::create(backend, data).has_value());
  }

  SUBCASE("Index count does not fit the topology") {
    MeshData data = triangle();
    data.m_indices = {0, 1};
    CHECK_FALSE(Mesh::create(backend, data).has_value());
    CHECK(Mesh::create(backend, data, PrimitiveTopology::LineList).has_value());
  }

  SUBCASE("Index out of range") {
    MeshData data = triangle();
    data.m_indices = {0, 1, 3};
    auto mesh = Mesh::create(backend, data);
    REQUIRE_FALSE(mesh.has_value());
    CHECK(mesh.error().find("out of range") != std::string::npos);
  }

  CHECK(backend.liveMeshCount() == 0);
}

TEST_CASE("Meshes and models are only built by their factories") {
  static_assert(!std::is_constructible_v<Mesh, RenderBackend &, GpuMeshHandle, uint32_t, uint32_t,
                                         PrimitiveTopology, const BoundingBox &>);
  static_assert(!std::is_constructible_v<Model, std::unique_ptr<Mesh>, std::string, std::filesystem::path>);
  static_assert(!std::is_copy_constructible_v<Mesh>);

  NullRenderBackend backend;
  auto mesh = Mesh::create(backend, triangle());
  REQUIRE(mesh.has_value());
  CHECK((*mesh)->vertexCount() == 3);
  CHECK(backend.liveMeshCount() == 1);

  auto model = Model::create(std::move(*mesh), "Tri");
  REQUIRE(model.has_value());
  CHECK((*model)->name() == "Tri");
  CHECK((*model)->mesh().indexCount() == 3);

  model->reset();
  CHECK(backend.liveMeshCount() == 0);
}

TEST_CASE("Mesh render submits a draw") {
  NullRenderBackend backend;
  ShaderHandle shader = backend.createShaderProgram("unlit");

  auto mesh = Mesh::createCube(backend, 1.0f, true);
  mesh->setColor(glm::vec4(0.25f, 0.5f, 0.75f, 1.0f));
  mesh->transform().m_position = glm::vec3(3.0f, 0.0f, 0.0f);
  mesh->render(shader);

  REQUIRE(backend.drawCalls().size() == 1);
  const DrawCommand &cmd = backend.drawCalls()[0];
  CHECK(cmd.topology == PrimitiveTopology::LineList);
  CHECK(cmd.indexCount == 24);
  CHECK(cmd.color == glm::vec4(0.25f, 0.5f, 0.75f, 1.0f));
  CHECK(cmd.model[3][0] == doctest::Approx(3.0f));

  const UniformValue *useTexture = backend.uniform(shader, "uUseTexture");
  REQUIRE(useTexture != nullptr);
  CHECK(std::get<bool>(*useTexture) == false);

  SUBCASE("Invalid shader is a fault") {
    CHECK_THROWS_AS(mesh->render(INVALID_SHADER_HANDLE), cpptrace::runtime_error);
  }
}

TEST_CASE("Model wraps a mesh") {
  NullRenderBackend backend;
  ShaderHandle shader = backend.createShaderProgram("lit");

  SUBCASE("Null mesh is rejected") {
    auto model = Model::create(nullptr, "Empty");
    CHECK_FALSE(model.has_value());
  }

  SUBCASE("Name falls back to the source file stem") {
    auto model = Model::create(Mesh::createCube(backend, 1.0f), "", "assets/car.obj");
    REQUIRE(model.has_value());
    CHECK((*model)->name() == "car");
    CHECK((*model)->sourcePath() == std::filesystem::path("assets/car.obj"));
  }

  SUBCASE("Bounds helpers") {
    auto model = Model::create(Mesh::createCube(backend, 4.0f), "Big");
    REQUIRE(model.has_value());
    Model &m = **model;

    CHECK(m.boundsSize() == glm::vec3(4.0f));
    m.scaleToFit(2.0f);
    CHECK(m.transform().m_scale == glm::vec3(0.5f));
    m.centerAtOrigin();
    CHECK(m.transform().m_position == glm::vec3(0.0f));
  }

  SUBCASE("Render forwards the model transform to its mesh") {
    auto model = Model::createCube(backend, 1.0f);
    model->transform().m_position = glm::vec3(0.0f, 5.0f, 0.0f);
    model->render(shader);

    REQUIRE(backend.drawCalls().size() == 1);
    CHECK(backend.drawCalls()[0].model[3][1] == doctest::Approx(5.0f));
    CHECK(model->mesh().transform() == model->transform());
  }
}
