#pragma once

#include "HostBuffer.hpp"
#include "Shader.hpp"
#include "VulkanContext.hpp"
#include <evergreen/Camera.hpp>
#include <evergreen/HolidayScene.hpp>
#include <evergreen/InstanceStaging.hpp>
#include <evergreen/Mesh.hpp>
#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ImDrawData;

namespace evergreen::render {

inline constexpr uint32_t MAX_POINT_LIGHTS = 4;

/**
 * @brief Point light as laid out in the view uniform buffer
 */
struct GpuPointLight {
    glm::vec4 position{0.0f};   ///< xyz = world position, w = range (0 = unlimited)
    glm::vec4 color{0.0f};      ///< rgb = color * intensity
};

/**
 * @brief Per-frame uniform block (binding 0)
 */
struct ViewParams {
    glm::mat4 view_projection{1.0f};
    glm::vec4 eye{0.0f};
    glm::vec4 ambient{0.0f};    ///< rgb = ambient color * intensity
    std::array<GpuPointLight, MAX_POINT_LIGHTS> lights{};
};

/**
 * @brief Push constant block of the vertex stage
 */
struct DrawPush {
    uint32_t instance_offset = 0;
    uint32_t padding[3] = {};
};

/**
 * @brief Everything render_frame() needs to know about the target image
 */
struct FrameInfo {
    uint32_t image_index;
    vk::Semaphore image_available;   ///< From begin_frame()
    vk::Framebuffer framebuffer;
    vk::Extent2D extent;
    vk::RenderPass render_pass;
    Camera& camera;
    ImDrawData* imgui_draw_data;     ///< Optional overlay
};

/**
 * @brief Instanced forward renderer for the holiday scene
 *
 * One pipeline draws every mesh. Per-instance model matrices and colors
 * live in a host-visible storage buffer (one copy per frame in flight);
 * each draw selects its slice with a push-constant instance offset. The
 * bow ribbons are rebuilt every frame into a world-space strip buffer and
 * drawn with a single identity instance.
 *
 * Frame protocol:
 * 1. begin_frame() waits for the frame slot and hands out its acquire semaphore
 * 2. the caller acquires a swapchain image with it
 * 3. render_frame() publishes the scene, records, submits and returns the
 *    semaphore to present with
 */
class SceneRenderer {
public:
    static std::expected<std::unique_ptr<SceneRenderer>, std::string> create(
        const VulkanContext& context,
        vk::RenderPass render_pass,
        uint32_t image_count,
        const HolidayScene& scene
    );

    ~SceneRenderer();

    SceneRenderer(const SceneRenderer&) = delete;
    SceneRenderer& operator=(const SceneRenderer&) = delete;

    /**
     * @brief Wait until the current frame slot is free again
     *
     * @return Semaphore the swapchain acquire should signal
     */
    [[nodiscard]] std::expected<vk::Semaphore, std::string> begin_frame();

    /**
     * @brief Upload the scene, record and submit one frame
     *
     * @return Semaphore signalled when rendering finished
     */
    [[nodiscard]] std::expected<vk::Semaphore, std::string> render_frame(
        const HolidayScene& scene,
        const FrameInfo& info,
        vk::Queue graphics_queue
    );

    /**
     * @brief Resize per-image resources after the swapchain was rebuilt
     */
    std::expected<void, std::string> handle_swapchain_recreation(uint32_t image_count);

    [[nodiscard]] uint32_t instance_count() const { return m_staging.size(); }
    [[nodiscard]] uint32_t draw_count() const { return static_cast<uint32_t>(m_batches.size()); }

    /**
     * @brief Lights for the current star position and glow
     */
    [[nodiscard]] static ViewParams make_view_params(const HolidayScene& scene, Camera& camera);

private:
    struct GpuMesh {
        HostBuffer vertices;
        HostBuffer indices;
        uint32_t index_count = 0;
    };

    struct DrawBatch {
        uint32_t mesh;            ///< Index into m_meshes, or RIBBON_MESH
        InstanceRange* range;
    };

    static constexpr uint32_t RIBBON_MESH = UINT32_MAX;

    SceneRenderer(const VulkanContext& context, vk::RenderPass render_pass);

    std::expected<uint32_t, std::string> upload_mesh(const Mesh& mesh);
    std::expected<void, std::string> create_meshes(const HolidayScene& scene);
    std::expected<void, std::string> create_ribbon_buffers(const HolidayScene& scene);
    std::expected<void, std::string> create_instances(const HolidayScene& scene);
    std::expected<void, std::string> create_pipeline();
    std::expected<void, std::string> create_descriptor_sets();
    std::expected<void, std::string> create_frame_resources(uint32_t image_count);

    void write_ribbons(const HolidayScene& scene, HostBuffer& target);
    void record(vk::CommandBuffer cmd, const FrameInfo& info);

    const VulkanContext* m_context;
    vk::Device m_device;
    vk::RenderPass m_render_pass;

    std::optional<Shader> m_vertex_shader;
    std::optional<Shader> m_fragment_shader;
    vk::DescriptorSetLayout m_descriptor_layout;
    vk::PipelineLayout m_pipeline_layout;
    vk::ShaderStageFlags m_push_stages;
    vk::Pipeline m_pipeline;
    vk::DescriptorPool m_descriptor_pool;

    // Meshes and the instance slices drawn with them
    std::vector<GpuMesh> m_meshes;
    InstanceStaging m_staging;
    InstanceRange m_spheres;
    InstanceRange m_cubes;
    InstanceRange m_snow;
    InstanceRange m_gift_boxes;
    InstanceRange m_gift_trim;
    InstanceRange m_topper;
    InstanceRange m_ribbon;
    SceneSinks m_sinks;
    std::vector<DrawBatch> m_batches;

    // Ribbon strip: static indices, vertices rewritten per frame
    HostBuffer m_ribbon_indices;
    uint32_t m_ribbon_index_count = 0;
    std::vector<Vertex> m_ribbon_scratch;

    // Per frame in flight
    std::array<HostBuffer, MAX_FRAMES_IN_FLIGHT> m_instance_buffers;
    std::array<HostBuffer, MAX_FRAMES_IN_FLIGHT> m_view_buffers;
    std::array<HostBuffer, MAX_FRAMES_IN_FLIGHT> m_ribbon_vertices;
    std::array<vk::DescriptorSet, MAX_FRAMES_IN_FLIGHT> m_descriptor_sets{};
    std::array<vk::Fence, MAX_FRAMES_IN_FLIGHT> m_in_flight{};
    std::array<vk::Semaphore, MAX_FRAMES_IN_FLIGHT> m_image_available{};
    std::vector<vk::CommandBuffer> m_command_buffers;
    vk::CommandPool m_command_pool;
    uint32_t m_current_frame = 0;

    // Per swapchain image
    std::vector<vk::Semaphore> m_render_finished;
};

} // namespace evergreen::render
