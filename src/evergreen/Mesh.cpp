#include <evergreen/Mesh.hpp>
#include <evergreen/Logger.hpp>
#include <array>
#include <cassert>
#include <cmath>
#include <unordered_map>

namespace evergreen::meshes {

namespace {

void add_flat_triangle(Mesh& mesh, const glm::vec3& a, const glm::vec3& b, const glm::vec3& c) {
    glm::vec3 normal = glm::normalize(glm::cross(b - a, c - a));
    auto base = mesh.vertex_count();
    mesh.vertices.push_back({a, normal});
    mesh.vertices.push_back({b, normal});
    mesh.vertices.push_back({c, normal});
    mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2});
}

} // namespace

Mesh icosphere(float radius, uint32_t subdivisions) {
    const float t = (1.0f + std::sqrt(5.0f)) / 2.0f;

    std::vector<glm::vec3> positions = {
        {-1,  t,  0}, { 1,  t,  0}, {-1, -t,  0}, { 1, -t,  0},
        { 0, -1,  t}, { 0,  1,  t}, { 0, -1, -t}, { 0,  1, -t},
        { t,  0, -1}, { t,  0,  1}, {-t,  0, -1}, {-t,  0,  1}
    };
    for (auto& p : positions) {
        p = glm::normalize(p);
    }

    std::vector<uint32_t> indices = {
        0, 11, 5,   0, 5, 1,    0, 1, 7,    0, 7, 10,   0, 10, 11,
        1, 5, 9,    5, 11, 4,   11, 10, 2,  10, 7, 6,   7, 1, 8,
        3, 9, 4,    3, 4, 2,    3, 2, 6,    3, 6, 8,    3, 8, 9,
        4, 9, 5,    2, 4, 11,   6, 2, 10,   8, 6, 7,    9, 8, 1
    };

    for (uint32_t level = 0; level < subdivisions; level++) {
        std::vector<uint32_t> refined;
        refined.reserve(indices.size() * 4);
        std::unordered_map<uint64_t, uint32_t> midpoints;

        auto midpoint = [&](uint32_t a, uint32_t b) -> uint32_t {
            if (a > b) std::swap(a, b);
            uint64_t key = (static_cast<uint64_t>(a) << 32) | b;
            if (auto it = midpoints.find(key); it != midpoints.end()) {
                return it->second;
            }
            auto index = static_cast<uint32_t>(positions.size());
            positions.push_back(glm::normalize(positions[a] + positions[b]));
            midpoints.emplace(key, index);
            return index;
        };

        for (std::size_t i = 0; i < indices.size(); i += 3) {
            uint32_t v1 = indices[i];
            uint32_t v2 = indices[i + 1];
            uint32_t v3 = indices[i + 2];
            uint32_t a = midpoint(v1, v2);
            uint32_t b = midpoint(v2, v3);
            uint32_t c = midpoint(v3, v1);
            refined.insert(refined.end(), {v1, a, c, v2, b, a, v3, c, b, a, b, c});
        }
        indices = std::move(refined);
    }

    Mesh mesh;
    mesh.vertices.reserve(positions.size());
    for (const auto& p : positions) {
        mesh.vertices.push_back({p * radius, p});
    }
    mesh.indices = std::move(indices);

    Logger::instance().debug("Generated icosphere: {} vertices, {} indices", mesh.vertex_count(), mesh.index_count());
    return mesh;
}

Mesh cube(float edge) {
    const float h = edge * 0.5f;
    Mesh mesh;
    mesh.vertices.reserve(24);
    mesh.indices.reserve(36);

    // normal, then two in-face axes with u x v == normal
    const std::array<std::array<glm::vec3, 3>, 6> faces = {{
        {{{ 1, 0, 0}, {0, 1, 0}, {0, 0, 1}}},
        {{{-1, 0, 0}, {0, 0, 1}, {0, 1, 0}}},
        {{{ 0, 1, 0}, {0, 0, 1}, {1, 0, 0}}},
        {{{ 0,-1, 0}, {1, 0, 0}, {0, 0, 1}}},
        {{{ 0, 0, 1}, {1, 0, 0}, {0, 1, 0}}},
        {{{ 0, 0,-1}, {0, 1, 0}, {1, 0, 0}}},
    }};

    for (const auto& [normal, u, v] : faces) {
        auto base = mesh.vertex_count();
        glm::vec3 centre = normal * h;
        mesh.vertices.push_back({centre + (-u - v) * h, normal});
        mesh.vertices.push_back({centre + ( u - v) * h, normal});
        mesh.vertices.push_back({centre + ( u + v) * h, normal});
        mesh.vertices.push_back({centre + (-u + v) * h, normal});
        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    }
    return mesh;
}

Mesh octahedron(float radius) {
    const std::array<glm::vec3, 6> p = {{
        { radius, 0, 0}, {-radius, 0, 0},
        {0,  radius, 0}, {0, -radius, 0},
        {0, 0,  radius}, {0, 0, -radius}
    }};

    Mesh mesh;
    // Upper four faces around +y, then lower four around -y
    add_flat_triangle(mesh, p[4], p[0], p[2]);
    add_flat_triangle(mesh, p[0], p[5], p[2]);
    add_flat_triangle(mesh, p[5], p[1], p[2]);
    add_flat_triangle(mesh, p[1], p[4], p[2]);
    add_flat_triangle(mesh, p[0], p[4], p[3]);
    add_flat_triangle(mesh, p[5], p[0], p[3]);
    add_flat_triangle(mesh, p[1], p[5], p[3]);
    add_flat_triangle(mesh, p[4], p[1], p[3]);
    return mesh;
}

Mesh extrude(std::span<const glm::vec2> outline, float depth) {
    Mesh mesh;
    if (outline.size() < 3) {
        return mesh;
    }

    const auto n = static_cast<uint32_t>(outline.size());
    const float front = depth * 0.5f;
    const float back = -front;

    // Caps: fan from the centre
    for (float z : {front, back}) {
        glm::vec3 normal{0.0f, 0.0f, z > 0.0f ? 1.0f : -1.0f};
        auto centre = mesh.vertex_count();
        mesh.vertices.push_back({{0.0f, 0.0f, z}, normal});
        for (const auto& p : outline) {
            mesh.vertices.push_back({{p.x, p.y, z}, normal});
        }
        for (uint32_t i = 0; i < n; i++) {
            uint32_t a = centre + 1 + i;
            uint32_t b = centre + 1 + (i + 1) % n;
            if (z > 0.0f) {
                mesh.indices.insert(mesh.indices.end(), {centre, a, b});
            } else {
                mesh.indices.insert(mesh.indices.end(), {centre, b, a});
            }
        }
    }

    // Side walls, one flat quad per outline edge
    for (uint32_t i = 0; i < n; i++) {
        glm::vec2 a = outline[i];
        glm::vec2 b = outline[(i + 1) % n];
        glm::vec2 edge = b - a;
        glm::vec3 normal = glm::normalize(glm::vec3(edge.y, -edge.x, 0.0f));

        auto base = mesh.vertex_count();
        mesh.vertices.push_back({{a.x, a.y, front}, normal});
        mesh.vertices.push_back({{a.x, a.y, back}, normal});
        mesh.vertices.push_back({{b.x, b.y, back}, normal});
        mesh.vertices.push_back({{b.x, b.y, front}, normal});
        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    }
    return mesh;
}

std::vector<uint32_t> ribbon_indices(uint32_t samples, uint32_t base_vertex) {
    std::vector<uint32_t> indices;
    if (samples < 2) {
        return indices;
    }
    indices.reserve((samples - 1) * 6);
    for (uint32_t i = 0; i + 1 < samples; i++) {
        uint32_t left = base_vertex + i * 2;
        uint32_t right = left + 1;
        uint32_t next_left = left + 2;
        uint32_t next_right = left + 3;
        indices.insert(indices.end(), {left, right, next_right, left, next_right, next_left});
    }
    return indices;
}

void write_ribbon(std::span<const RibbonSample> samples, const glm::mat4& frame, std::span<Vertex> out) {
    assert(out.size() >= ribbon_vertex_count(static_cast<uint32_t>(samples.size())));
    const glm::mat3 normal_matrix = glm::transpose(glm::inverse(glm::mat3(frame)));
    const auto count = samples.size();

    for (std::size_t i = 0; i < count; i++) {
        const auto& sample = samples[i];

        // Tangent by central difference, one-sided at the ends
        const auto& prev = samples[i == 0 ? 0 : i - 1].center;
        const auto& next = samples[i + 1 < count ? i + 1 : i].center;
        glm::vec3 tangent = next - prev;
        glm::vec3 local_normal = glm::cross(tangent, sample.half_width);
        float length = glm::length(local_normal);
        local_normal = length > 1e-6f ? local_normal / length : glm::vec3(0.0f, 1.0f, 0.0f);

        glm::vec3 normal = glm::normalize(normal_matrix * local_normal);
        glm::vec4 left = frame * glm::vec4(sample.center - sample.half_width, 1.0f);
        glm::vec4 right = frame * glm::vec4(sample.center + sample.half_width, 1.0f);

        out[i * 2] = {glm::vec3(left), normal};
        out[i * 2 + 1] = {glm::vec3(right), normal};
    }
}

} // namespace evergreen::meshes
