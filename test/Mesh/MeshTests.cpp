#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/Mesh.hpp>
#include <evergreen/StarTopper.hpp>
#include <glm/gtc/matrix_transform.hpp>

using namespace evergreen;
using Catch::Approx;

namespace {

// Every triangle faces away from the origin and agrees with its vertex normals
void require_outward(const Mesh& mesh) {
    REQUIRE(mesh.index_count() % 3 == 0);
    for (uint32_t i = 0; i < mesh.index_count(); i += 3) {
        const auto& a = mesh.vertices[mesh.indices[i]];
        const auto& b = mesh.vertices[mesh.indices[i + 1]];
        const auto& c = mesh.vertices[mesh.indices[i + 2]];
        glm::vec3 face = glm::cross(b.position - a.position, c.position - a.position);
        glm::vec3 centroid = (a.position + b.position + c.position) / 3.0f;
        REQUIRE(glm::dot(face, centroid) > 0.0f);
        REQUIRE(glm::dot(face, a.normal) > 0.0f);
    }
}

} // namespace

TEST_CASE("Icosphere subdivision", "[mesh]")
{
    SECTION("base icosahedron")
    {
        auto mesh = meshes::icosphere(1.0f, 0);
        REQUIRE(mesh.vertex_count() == 12);
        REQUIRE(mesh.index_count() == 60);
        require_outward(mesh);
    }

    SECTION("two levels share midpoints")
    {
        auto mesh = meshes::icosphere(0.5f, 2);
        REQUIRE(mesh.vertex_count() == 162);
        REQUIRE(mesh.index_count() == 960);
        for (const auto& vertex : mesh.vertices) {
            REQUIRE(glm::length(vertex.position) == Approx(0.5f));
            REQUIRE(glm::length(vertex.normal) == Approx(1.0f));
        }
        require_outward(mesh);
    }
}

TEST_CASE("Cube has flat faces", "[mesh]")
{
    auto mesh = meshes::cube(2.0f);
    REQUIRE(mesh.vertex_count() == 24);
    REQUIRE(mesh.index_count() == 36);
    for (const auto& vertex : mesh.vertices) {
        REQUIRE(glm::abs(vertex.position.x) == Approx(1.0f));
        REQUIRE(glm::abs(vertex.position.y) == Approx(1.0f));
        REQUIRE(glm::abs(vertex.position.z) == Approx(1.0f));
        REQUIRE(glm::dot(vertex.normal, vertex.position) == Approx(1.0f));
    }
    require_outward(mesh);
}

TEST_CASE("Octahedron has eight flat faces", "[mesh]")
{
    auto mesh = meshes::octahedron(1.0f);
    REQUIRE(mesh.vertex_count() == 24);
    REQUIRE(mesh.index_count() == 24);
    require_outward(mesh);
}

TEST_CASE("Star outline extrudes into a closed prism", "[mesh]")
{
    TopperConfig config;
    auto outline = StarTopper::build_outline(config);
    const auto n = static_cast<uint32_t>(outline.size());

    auto mesh = meshes::extrude(outline, config.depth);
    REQUIRE(mesh.vertex_count() == 2 * (n + 1) + 4 * n);
    REQUIRE(mesh.index_count() == 12 * n);
    for (const auto& vertex : mesh.vertices) {
        REQUIRE(glm::abs(vertex.position.z) == Approx(config.depth * 0.5f));
    }
    require_outward(mesh);

    SECTION("degenerate outline yields nothing")
    {
        std::vector<glm::vec2> line{{0.0f, 0.0f}, {1.0f, 0.0f}};
        REQUIRE(meshes::extrude(line, 1.0f).vertices.empty());
    }
}

TEST_CASE("Ribbon strip indices", "[mesh][ribbon]")
{
    REQUIRE(meshes::ribbon_vertex_count(33) == 66);
    REQUIRE(meshes::ribbon_indices(1).empty());

    auto indices = meshes::ribbon_indices(33, 100);
    REQUIRE(indices.size() == 32 * 6);
    REQUIRE(indices.front() == 100);
    REQUIRE(indices.back() == 100 + 64);
    for (auto index : indices) {
        REQUIRE(index >= 100);
        REQUIRE(index < 100 + 66);
    }
}

TEST_CASE("Ribbon strip vertices follow the frame", "[mesh][ribbon]")
{
    auto curve = RibbonCurve::create({});
    REQUIRE(curve.has_value());
    auto samples = curve->samples();

    const glm::vec3 offset{2.0f, 3.0f, -1.0f};
    glm::mat4 frame = glm::translate(glm::mat4(1.0f), offset);

    std::vector<Vertex> vertices(meshes::ribbon_vertex_count(static_cast<uint32_t>(samples.size())));
    meshes::write_ribbon(samples, frame, vertices);

    for (std::size_t i = 0; i < samples.size(); i++) {
        const auto& sample = samples[i];
        const auto& left = vertices[i * 2];
        const auto& right = vertices[i * 2 + 1];
        REQUIRE(glm::distance(left.position, sample.center - sample.half_width + offset) < 1e-5f);
        REQUIRE(glm::distance(right.position, sample.center + sample.half_width + offset) < 1e-5f);
        REQUIRE(glm::length(left.normal) == Approx(1.0f));
        REQUIRE(glm::dot(left.normal, sample.half_width) == Approx(0.0f).margin(1e-5));
    }
}
