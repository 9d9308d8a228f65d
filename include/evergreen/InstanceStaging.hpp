#pragma once

#include "InstanceSink.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace evergreen {

/**
 * @brief Per-instance record as laid out in the instance storage buffer
 *
 * Matches the Slang InstanceData struct (std430).
 */
struct GpuInstance {
    glm::mat4 model{1.0f};
    glm::vec4 color{1.0f, 1.0f, 1.0f, 0.0f};   ///< rgb = base color, a = emission strength
};
static_assert(sizeof(GpuInstance) == 80, "GpuInstance must match the shader layout");

class InstanceStaging;

/**
 * @brief Contiguous window of the staging array handed to one population
 */
class InstanceRange final : public InstanceSink {
public:
    InstanceRange() = default;

    [[nodiscard]] uint32_t capacity() const override { return m_count; }
    void set_transform(uint32_t index, const InstanceTransform& transform) override;
    void set_color(uint32_t index, const glm::vec3& color) override;

    /**
     * @brief Emission strength of instance @p index (0 = lit only)
     */
    void set_emission(uint32_t index, float strength);

    /// Store a ready-made model matrix.
    void set_model(uint32_t index, const glm::mat4& model);

    [[nodiscard]] uint32_t first() const { return m_first; }
    [[nodiscard]] uint32_t count() const { return m_count; }
    [[nodiscard]] const std::string& name() const { return m_name; }

private:
    friend class InstanceStaging;
    InstanceRange(InstanceStaging* owner, std::string name, uint32_t first, uint32_t count)
        : m_owner(owner), m_name(std::move(name)), m_first(first), m_count(count) {}

    GpuInstance& at(uint32_t index);

    InstanceStaging* m_owner = nullptr;
    std::string m_name;
    uint32_t m_first = 0;
    uint32_t m_count = 0;
};

/**
 * @brief CPU copy of every instance record drawn in a frame
 *
 * Populations write through their InstanceRange; the renderer copies the
 * whole array into the mapped storage buffer of the frame in flight.
 * Ranges are laid out back to back in allocation order. Allocate every
 * range before handing any of them out: later allocations grow the array
 * but keep earlier ranges valid because ranges address by index.
 */
class InstanceStaging {
public:
    InstanceStaging() = default;
    InstanceStaging(const InstanceStaging&) = delete;
    InstanceStaging& operator=(const InstanceStaging&) = delete;

    /**
     * @brief Reserve @p count consecutive records
     *
     * Records start with an identity model and white color.
     */
    [[nodiscard]] InstanceRange allocate(std::string name, uint32_t count);

    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(m_records.size()); }
    [[nodiscard]] std::span<const GpuInstance> records() const { return m_records; }
    [[nodiscard]] std::size_t byte_size() const { return m_records.size() * sizeof(GpuInstance); }

private:
    friend class InstanceRange;
    std::vector<GpuInstance> m_records;
};

} // namespace evergreen
