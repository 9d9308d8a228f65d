#pragma once

#include "RibbonCurve.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace evergreen {

struct Vertex {
    glm::vec3 position;
    glm::vec3 normal;
};

/**
 * @brief Indexed triangle list (counter-clockwise front faces)
 */
struct Mesh {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;

    [[nodiscard]] uint32_t index_count() const { return static_cast<uint32_t>(indices.size()); }
    [[nodiscard]] uint32_t vertex_count() const { return static_cast<uint32_t>(vertices.size()); }
};

/**
 * @brief Procedural meshes used by the viewer
 */
namespace meshes {

/**
 * @brief Subdivided icosahedron
 *
 * @param radius Sphere radius
 * @param subdivisions Each level splits every triangle into four
 */
[[nodiscard]] Mesh icosphere(float radius, uint32_t subdivisions);

/**
 * @brief Axis-aligned cube centred on the origin with flat normals
 */
[[nodiscard]] Mesh cube(float edge);

/**
 * @brief Regular octahedron with flat normals
 */
[[nodiscard]] Mesh octahedron(float radius);

/**
 * @brief Prism extruded along z from a closed outline
 *
 * The outline must be star-shaped around the origin; caps are fanned from
 * the centre. The prism spans z in [-depth/2, depth/2].
 */
[[nodiscard]] Mesh extrude(std::span<const glm::vec2> outline, float depth);

/// Vertices of a strip with @p samples sample pairs.
[[nodiscard]] inline constexpr uint32_t ribbon_vertex_count(uint32_t samples) { return samples * 2; }

/**
 * @brief Index list of a two-sided strip for @p samples sample pairs
 */
[[nodiscard]] std::vector<uint32_t> ribbon_indices(uint32_t samples, uint32_t base_vertex = 0);

/**
 * @brief Write the strip vertices of one ribbon in world space
 *
 * Each sample becomes a left and right vertex (center -/+ half_width)
 * transformed by @p frame. Normals come from the strip's local surface.
 *
 * @param out Destination, at least ribbon_vertex_count(samples.size()) long
 */
void write_ribbon(std::span<const RibbonSample> samples, const glm::mat4& frame, std::span<Vertex> out);

} // namespace meshes

} // namespace evergreen
