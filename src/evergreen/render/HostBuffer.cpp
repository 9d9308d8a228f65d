#include <evergreen/render/HostBuffer.hpp>
#include <evergreen/Logger.hpp>
#include <algorithm>
#include <cstring>
#include <format>
#include <utility>

namespace evergreen::render {

std::expected<HostBuffer, std::string> HostBuffer::create(const VulkanContext& context,
                                                          vk::DeviceSize size,
                                                          vk::BufferUsageFlags usage) {
    HostBuffer out;
    out.m_device = context.device();
    // Zero-sized buffers are invalid; an empty population still gets a slot
    out.m_size = std::max<vk::DeviceSize>(size, 16);

    auto buffer_res = out.m_device.createBuffer(vk::BufferCreateInfo()
        .setSize(out.m_size)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive));
    CHECK_VK_RESULT(buffer_res, "Failed to create buffer: {}");
    out.m_buffer = buffer_res.value;

    auto requirements = out.m_device.getBufferMemoryRequirements(out.m_buffer);
    auto memory_type = context.find_memory_type(requirements.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent);
    if (!memory_type) {
        return std::unexpected(std::format("Host buffer: {}", memory_type.error()));
    }

    auto memory_res = out.m_device.allocateMemory(vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type));
    CHECK_VK_RESULT(memory_res, "Failed to allocate buffer memory: {}");
    out.m_memory = memory_res.value;

    auto bind_res = out.m_device.bindBufferMemory(out.m_buffer, out.m_memory, 0);
    CHECK_VK_RESULT_VOID(bind_res, "Failed to bind buffer memory: {}");

    auto map_res = out.m_device.mapMemory(out.m_memory, 0, out.m_size);
    CHECK_VK_RESULT(map_res, "Failed to map buffer memory: {}");
    out.m_mapped = map_res.value;

    Logger::instance().trace("Host buffer {} bytes ({})", out.m_size, vk::to_string(usage));
    return out;
}

std::expected<HostBuffer, std::string> HostBuffer::create_with(const VulkanContext& context,
                                                               std::span<const std::byte> bytes,
                                                               vk::BufferUsageFlags usage) {
    auto buffer = create(context, bytes.size(), usage);
    if (buffer) {
        buffer->write(bytes);
    }
    return buffer;
}

HostBuffer::~HostBuffer() {
    release();
}

HostBuffer::HostBuffer(HostBuffer&& other) noexcept
    : m_device(other.m_device)
    , m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_size(std::exchange(other.m_size, 0))
    , m_mapped(std::exchange(other.m_mapped, nullptr))
{
}

HostBuffer& HostBuffer::operator=(HostBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_device = other.m_device;
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_memory = std::exchange(other.m_memory, nullptr);
        m_size = std::exchange(other.m_size, 0);
        m_mapped = std::exchange(other.m_mapped, nullptr);
    }
    return *this;
}

void HostBuffer::write(std::span<const std::byte> bytes, vk::DeviceSize offset) {
    if (!m_mapped || offset >= m_size) {
        return;
    }
    auto count = std::min<vk::DeviceSize>(bytes.size(), m_size - offset);
    std::memcpy(static_cast<std::byte*>(m_mapped) + offset, bytes.data(), count);
}

void HostBuffer::release() {
    if (m_memory) {
        if (m_mapped) {
            m_device.unmapMemory(m_memory);
            m_mapped = nullptr;
        }
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
    if (m_buffer) {
        m_device.destroyBuffer(m_buffer);
        m_buffer = nullptr;
    }
}

} // namespace evergreen::render
