#pragma once

#include "VulkanContext.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace evergreen::render {

/**
 * @brief Persistently mapped, host-coherent Vulkan buffer
 *
 * Everything the viewer uploads (meshes, per-frame instances, view
 * parameters, the ribbon strip) is small enough to live in host-visible
 * memory, so there are no staging copies.
 */
class HostBuffer {
public:
    static std::expected<HostBuffer, std::string> create(const VulkanContext& context,
                                                         vk::DeviceSize size,
                                                         vk::BufferUsageFlags usage);

    /// Create a buffer holding a copy of @p bytes.
    static std::expected<HostBuffer, std::string> create_with(const VulkanContext& context,
                                                              std::span<const std::byte> bytes,
                                                              vk::BufferUsageFlags usage);

    HostBuffer() = default;
    ~HostBuffer();

    HostBuffer(const HostBuffer&) = delete;
    HostBuffer& operator=(const HostBuffer&) = delete;
    HostBuffer(HostBuffer&& other) noexcept;
    HostBuffer& operator=(HostBuffer&& other) noexcept;

    /**
     * @brief Copy @p bytes to @p offset
     *
     * Writes beyond size() are truncated.
     */
    void write(std::span<const std::byte> bytes, vk::DeviceSize offset = 0);

    [[nodiscard]] vk::Buffer buffer() const { return m_buffer; }
    [[nodiscard]] vk::DeviceSize size() const { return m_size; }
    [[nodiscard]] void* mapped() const { return m_mapped; }

private:
    void release();

    vk::Device m_device;
    vk::Buffer m_buffer;
    vk::DeviceMemory m_memory;
    vk::DeviceSize m_size = 0;
    void* m_mapped = nullptr;
};

} // namespace evergreen::render
