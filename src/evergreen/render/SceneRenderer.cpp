#include <evergreen/render/SceneRenderer.hpp>
#include <evergreen/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_vulkan.h>
#include <cstring>
#include <format>
#include <span>

namespace evergreen::render {

namespace {

constexpr uint32_t SPHERE_SUBDIVISIONS = 2;
constexpr float SPHERE_RADIUS = 0.5f;
constexpr float ORNAMENT_CUBE_EDGE = 0.8f;
constexpr float STAR_DEPTH = 0.3f;

// Self-illumination of the lit populations
constexpr float SNOW_EMISSION = 0.8f;
constexpr float GIFT_EMISSION = 0.2f;
constexpr float TOPPER_EMISSION = 0.5f;

constexpr float AMBIENT_INTENSITY = 0.2f;
constexpr float STAR_LIGHT_RANGE = 15.0f;
constexpr glm::vec3 GOLD{1.0f, 0.843f, 0.0f};
constexpr glm::vec3 WARM_RED{1.0f, 0.2f, 0.2f};

// #050505 in linear space
constexpr std::array<float, 4> BACKGROUND{0.0015f, 0.0015f, 0.0015f, 1.0f};

template<typename T>
std::span<const std::byte> as_bytes(std::span<const T> values) {
    return std::as_bytes(values);
}

template<typename T>
std::span<const std::byte> object_bytes(const T& value) {
    return std::as_bytes(std::span<const T>(&value, 1));
}

} // namespace

SceneRenderer::SceneRenderer(const VulkanContext& context, vk::RenderPass render_pass)
    : m_context(&context)
    , m_device(context.device())
    , m_render_pass(render_pass)
{
}

SceneRenderer::~SceneRenderer() {
    if (!m_device) {
        return;
    }
    for (auto fence : m_in_flight) {
        if (fence) m_device.destroyFence(fence);
    }
    for (auto semaphore : m_image_available) {
        if (semaphore) m_device.destroySemaphore(semaphore);
    }
    for (auto semaphore : m_render_finished) {
        m_device.destroySemaphore(semaphore);
    }
    if (m_command_pool) m_device.destroyCommandPool(m_command_pool);
    if (m_descriptor_pool) m_device.destroyDescriptorPool(m_descriptor_pool);
    if (m_pipeline) m_device.destroyPipeline(m_pipeline);
    if (m_pipeline_layout) m_device.destroyPipelineLayout(m_pipeline_layout);
    if (m_descriptor_layout) m_device.destroyDescriptorSetLayout(m_descriptor_layout);
}

std::expected<std::unique_ptr<SceneRenderer>, std::string> SceneRenderer::create(
    const VulkanContext& context,
    vk::RenderPass render_pass,
    uint32_t image_count,
    const HolidayScene& scene
) {
    std::unique_ptr<SceneRenderer> renderer{new SceneRenderer(context, render_pass)};

    auto vert = Shader::create(context.device(), "instanced/instanced_vert");
    if (!vert) return std::unexpected(std::format("Vertex shader: {}", vert.error()));
    renderer->m_vertex_shader.emplace(std::move(*vert));

    auto frag = Shader::create(context.device(), "instanced/instanced_frag");
    if (!frag) return std::unexpected(std::format("Fragment shader: {}", frag.error()));
    renderer->m_fragment_shader.emplace(std::move(*frag));

    if (auto r = renderer->create_instances(scene); !r) return std::unexpected(r.error());
    if (auto r = renderer->create_meshes(scene); !r) return std::unexpected(r.error());
    if (auto r = renderer->create_ribbon_buffers(scene); !r) return std::unexpected(r.error());
    if (auto r = renderer->create_pipeline(); !r) return std::unexpected(r.error());
    if (auto r = renderer->create_descriptor_sets(); !r) return std::unexpected(r.error());
    if (auto r = renderer->create_frame_resources(image_count); !r) return std::unexpected(r.error());

    Logger::instance().info("Scene renderer ready: {} instances in {} draws",
                            renderer->instance_count(), renderer->draw_count());
    return renderer;
}

std::expected<void, std::string> SceneRenderer::create_instances(const HolidayScene& scene) {
    const auto& gifts = scene.gifts();

    m_spheres = m_staging.allocate("spheres", scene.spheres().size());
    m_cubes = m_staging.allocate("cubes", scene.cubes().size());
    m_snow = m_staging.allocate("snow", scene.snow().size());
    m_gift_boxes = m_staging.allocate("gift boxes", gifts.size());
    m_gift_trim = m_staging.allocate("gift trim", gifts.size() * GiftCluster::TRIM_PER_GIFT);
    m_topper = m_staging.allocate("topper", 1);
    m_ribbon = m_staging.allocate("ribbons", gifts.ribbons().empty() ? 0 : 1);

    m_sinks = SceneSinks{
        .spheres = &m_spheres,
        .cubes = &m_cubes,
        .snow = &m_snow,
        .gift_boxes = &m_gift_boxes,
        .gift_trim = &m_gift_trim,
        .topper = &m_topper,
    };

    // Colors are fixed at creation; only transforms change per frame
    scene.publish_colors(m_sinks);
    for (uint32_t i = 0; i < m_snow.count(); i++) {
        m_snow.set_emission(i, SNOW_EMISSION);
    }
    for (uint32_t i = 0; i < m_gift_boxes.count(); i++) {
        m_gift_boxes.set_emission(i, GIFT_EMISSION);
    }
    m_topper.set_emission(0, TOPPER_EMISSION);
    if (m_ribbon.count() > 0) {
        m_ribbon.set_model(0, glm::mat4(1.0f));
        m_ribbon.set_color(0, scene.config().ribbon_color);
    }

    const auto bytes = std::max<std::size_t>(m_staging.byte_size(), sizeof(GpuInstance));
    for (auto& buffer : m_instance_buffers) {
        auto created = HostBuffer::create(*m_context, bytes, vk::BufferUsageFlagBits::eStorageBuffer);
        if (!created) return std::unexpected(created.error());
        buffer = std::move(*created);
    }
    for (auto& buffer : m_view_buffers) {
        auto created = HostBuffer::create(*m_context, sizeof(ViewParams), vk::BufferUsageFlagBits::eUniformBuffer);
        if (!created) return std::unexpected(created.error());
        buffer = std::move(*created);
    }
    return {};
}

std::expected<uint32_t, std::string> SceneRenderer::upload_mesh(const Mesh& mesh) {
    auto vertices = HostBuffer::create_with(*m_context, as_bytes(std::span<const Vertex>(mesh.vertices)),
                                            vk::BufferUsageFlagBits::eVertexBuffer);
    if (!vertices) return std::unexpected(vertices.error());
    auto indices = HostBuffer::create_with(*m_context, as_bytes(std::span<const uint32_t>(mesh.indices)),
                                           vk::BufferUsageFlagBits::eIndexBuffer);
    if (!indices) return std::unexpected(indices.error());

    m_meshes.push_back(GpuMesh{std::move(*vertices), std::move(*indices), mesh.index_count()});
    return static_cast<uint32_t>(m_meshes.size() - 1);
}

std::expected<void, std::string> SceneRenderer::create_meshes(const HolidayScene& scene) {
    auto sphere = upload_mesh(meshes::icosphere(SPHERE_RADIUS, SPHERE_SUBDIVISIONS));
    if (!sphere) return std::unexpected(sphere.error());
    auto ornament_cube = upload_mesh(meshes::cube(ORNAMENT_CUBE_EDGE));
    if (!ornament_cube) return std::unexpected(ornament_cube.error());
    auto unit_cube = upload_mesh(meshes::cube(1.0f));
    if (!unit_cube) return std::unexpected(unit_cube.error());
    auto crystal = upload_mesh(meshes::octahedron(1.0f));
    if (!crystal) return std::unexpected(crystal.error());
    auto star = upload_mesh(meshes::extrude(scene.topper().outline(), STAR_DEPTH));
    if (!star) return std::unexpected(star.error());

    m_batches = {
        {*sphere, &m_spheres},
        {*ornament_cube, &m_cubes},
        {*crystal, &m_snow},
        {*unit_cube, &m_gift_boxes},
        {*unit_cube, &m_gift_trim},
        {*star, &m_topper},
        {RIBBON_MESH, &m_ribbon},
    };
    std::erase_if(m_batches, [](const DrawBatch& batch) { return batch.range->count() == 0; });
    return {};
}

std::expected<void, std::string> SceneRenderer::create_ribbon_buffers(const HolidayScene& scene) {
    std::vector<uint32_t> indices;
    uint32_t vertex_count = 0;
    for (const auto& ribbon : scene.gifts().ribbons()) {
        auto samples = ribbon.curve.sample_count();
        indices.append_range(meshes::ribbon_indices(samples, vertex_count));
        vertex_count += meshes::ribbon_vertex_count(samples);
    }
    m_ribbon_index_count = static_cast<uint32_t>(indices.size());
    m_ribbon_scratch.resize(vertex_count);

    auto index_buffer = HostBuffer::create_with(*m_context, as_bytes(std::span<const uint32_t>(indices)),
                                                vk::BufferUsageFlagBits::eIndexBuffer);
    if (!index_buffer) return std::unexpected(index_buffer.error());
    m_ribbon_indices = std::move(*index_buffer);

    for (auto& buffer : m_ribbon_vertices) {
        auto created = HostBuffer::create(*m_context, vertex_count * sizeof(Vertex), vk::BufferUsageFlagBits::eVertexBuffer);
        if (!created) return std::unexpected(created.error());
        buffer = std::move(*created);
    }
    Logger::instance().debug("Ribbon strip: {} vertices, {} indices", vertex_count, m_ribbon_index_count);
    return {};
}

std::expected<void, std::string> SceneRenderer::create_pipeline() {
    auto bindings = Shader::merge_bindings({&*m_vertex_shader, &*m_fragment_shader});
    if (!bindings) return std::unexpected(bindings.error());

    auto layout_res = m_device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo().setBindings(*bindings));
    CHECK_VK_RESULT(layout_res, "Failed to create descriptor layout: {}");
    m_descriptor_layout = layout_res.value;

    auto push_range = Shader::merge_push_constants({&*m_vertex_shader, &*m_fragment_shader});
    if (!push_range) {
        return std::unexpected("Instanced shaders declare no push constants");
    }
    if (push_range->size < sizeof(uint32_t)) {
        return std::unexpected(std::format("Push constant block is {} bytes", push_range->size));
    }
    // Pushes always cover the whole block
    push_range->offset = 0;
    push_range->size = sizeof(DrawPush);
    m_push_stages = push_range->stageFlags;

    auto pipeline_layout_res = m_device.createPipelineLayout(vk::PipelineLayoutCreateInfo()
        .setSetLayouts(m_descriptor_layout)
        .setPushConstantRanges(*push_range));
    CHECK_VK_RESULT(pipeline_layout_res, "Failed to create pipeline layout: {}");
    m_pipeline_layout = pipeline_layout_res.value;

    std::array stages = {m_vertex_shader->stage_create_info(), m_fragment_shader->stage_create_info()};

    std::array attributes = {
        vk::VertexInputAttributeDescription(0, 0, vk::Format::eR32G32B32Sfloat, offsetof(Vertex, position)),
        vk::VertexInputAttributeDescription(1, 0, vk::Format::eR32G32B32Sfloat, offsetof(Vertex, normal)),
    };
    auto vertex_binding = vk::VertexInputBindingDescription(0, sizeof(Vertex), vk::VertexInputRate::eVertex);
    auto vertex_input = vk::PipelineVertexInputStateCreateInfo()
        .setVertexBindingDescriptions(vertex_binding)
        .setVertexAttributeDescriptions(attributes);

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(vk::PrimitiveTopology::eTriangleList);

    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    // Ribbons are seen from both sides, so nothing is culled
    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    auto depth_stencil = vk::PipelineDepthStencilStateCreateInfo()
        .setDepthTestEnable(true)
        .setDepthWriteEnable(true)
        .setDepthCompareOp(vk::CompareOp::eLess);

    auto blend_attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(vk::ColorComponentFlagBits::eR | vk::ColorComponentFlagBits::eG |
                           vk::ColorComponentFlagBits::eB | vk::ColorComponentFlagBits::eA)
        .setBlendEnable(false);
    auto color_blending = vk::PipelineColorBlendStateCreateInfo().setAttachments(blend_attachment);

    std::array dynamic_states = {vk::DynamicState::eViewport, vk::DynamicState::eScissor};
    auto dynamic_state = vk::PipelineDynamicStateCreateInfo().setDynamicStates(dynamic_states);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, vk::GraphicsPipelineCreateInfo()
        .setStages(stages)
        .setPVertexInputState(&vertex_input)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPDepthStencilState(&depth_stencil)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_pipeline_layout)
        .setRenderPass(m_render_pass)
        .setSubpass(0));
    CHECK_VK_RESULT(pipeline_res, "Failed to create graphics pipeline: {}");
    m_pipeline = pipeline_res.value;
    return {};
}

std::expected<void, std::string> SceneRenderer::create_descriptor_sets() {
    std::array pool_sizes = {
        vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, MAX_FRAMES_IN_FLIGHT),
        vk::DescriptorPoolSize(vk::DescriptorType::eStorageBuffer, MAX_FRAMES_IN_FLIGHT),
    };
    auto pool_res = m_device.createDescriptorPool(vk::DescriptorPoolCreateInfo()
        .setMaxSets(MAX_FRAMES_IN_FLIGHT)
        .setPoolSizes(pool_sizes));
    CHECK_VK_RESULT(pool_res, "Failed to create descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    std::array<vk::DescriptorSetLayout, MAX_FRAMES_IN_FLIGHT> layouts;
    layouts.fill(m_descriptor_layout);
    auto sets_res = m_device.allocateDescriptorSets(vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_descriptor_pool)
        .setSetLayouts(layouts));
    CHECK_VK_RESULT(sets_res, "Failed to allocate descriptor sets: {}");

    for (uint32_t frame = 0; frame < MAX_FRAMES_IN_FLIGHT; frame++) {
        m_descriptor_sets[frame] = sets_res.value[frame];

        auto view_info = vk::DescriptorBufferInfo(m_view_buffers[frame].buffer(), 0, sizeof(ViewParams));
        auto instance_info = vk::DescriptorBufferInfo(m_instance_buffers[frame].buffer(), 0, VK_WHOLE_SIZE);
        std::array writes = {
            vk::WriteDescriptorSet()
                .setDstSet(m_descriptor_sets[frame])
                .setDstBinding(0)
                .setDescriptorType(vk::DescriptorType::eUniformBuffer)
                .setBufferInfo(view_info),
            vk::WriteDescriptorSet()
                .setDstSet(m_descriptor_sets[frame])
                .setDstBinding(1)
                .setDescriptorType(vk::DescriptorType::eStorageBuffer)
                .setBufferInfo(instance_info),
        };
        m_device.updateDescriptorSets(writes, nullptr);
    }
    return {};
}

std::expected<void, std::string> SceneRenderer::create_frame_resources(uint32_t image_count) {
    auto pool_res = m_device.createCommandPool(vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->graphics_family())
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer));
    CHECK_VK_RESULT(pool_res, "Failed to create command pool: {}");
    m_command_pool = pool_res.value;

    auto buffers_res = m_device.allocateCommandBuffers(vk::CommandBufferAllocateInfo()
        .setCommandPool(m_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(MAX_FRAMES_IN_FLIGHT));
    CHECK_VK_RESULT(buffers_res, "Failed to allocate command buffers: {}");
    m_command_buffers = std::move(buffers_res.value);

    for (uint32_t frame = 0; frame < MAX_FRAMES_IN_FLIGHT; frame++) {
        auto fence_res = m_device.createFence({vk::FenceCreateFlagBits::eSignaled});
        CHECK_VK_RESULT(fence_res, "Failed to create fence: {}");
        m_in_flight[frame] = fence_res.value;

        auto semaphore_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(semaphore_res, "Failed to create semaphore: {}");
        m_image_available[frame] = semaphore_res.value;
    }
    return handle_swapchain_recreation(image_count);
}

std::expected<void, std::string> SceneRenderer::handle_swapchain_recreation(uint32_t image_count) {
    if (m_render_finished.size() == image_count) {
        return {};
    }
    // Semaphores may still be waited on by a pending present
    auto wait_res = m_device.waitIdle();
    CHECK_VK_RESULT_VOID(wait_res, "waitIdle before semaphore rebuild failed: {}");

    for (auto semaphore : m_render_finished) {
        m_device.destroySemaphore(semaphore);
    }
    m_render_finished.clear();
    for (uint32_t i = 0; i < image_count; i++) {
        auto semaphore_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(semaphore_res, "Failed to create semaphore: {}");
        m_render_finished.push_back(semaphore_res.value);
    }
    Logger::instance().debug("Render-finished semaphores for {} images", image_count);
    return {};
}

ViewParams SceneRenderer::make_view_params(const HolidayScene& scene, Camera& camera) {
    ViewParams params;
    params.view_projection = camera.view_projection_matrix();
    params.eye = glm::vec4(camera.position(), 1.0f);
    params.ambient = glm::vec4(glm::vec3(AMBIENT_INTENSITY), 0.0f);
    params.lights[0] = {{10.0f, 10.0f, 10.0f, 0.0f}, glm::vec4(GOLD * 1.5f, 0.0f)};
    params.lights[1] = {{-10.0f, 10.0f, -10.0f, 0.0f}, glm::vec4(WARM_RED, 0.0f)};
    params.lights[2] = {{0.0f, -10.0f, 5.0f, 0.0f}, glm::vec4(glm::vec3(0.8f), 0.0f)};

    const auto& topper = scene.topper();
    params.lights[3] = {glm::vec4(topper.transform().position, STAR_LIGHT_RANGE),
                        glm::vec4(scene.config().topper.color * topper.glow(), 0.0f)};
    return params;
}

std::expected<vk::Semaphore, std::string> SceneRenderer::begin_frame() {
    auto wait_res = m_device.waitForFences(m_in_flight[m_current_frame], true, UINT64_MAX);
    CHECK_VK_RESULT_VOID(wait_res, "Waiting for frame fence failed: {}");
    return m_image_available[m_current_frame];
}

void SceneRenderer::write_ribbons(const HolidayScene& scene, HostBuffer& target) {
    const auto& gifts = scene.gifts();
    std::size_t offset = 0;
    for (uint32_t i = 0; i < gifts.ribbons().size(); i++) {
        auto samples = gifts.ribbons()[i].curve.samples();
        auto count = meshes::ribbon_vertex_count(static_cast<uint32_t>(samples.size()));
        meshes::write_ribbon(samples, gifts.ribbon_frame(i), std::span<Vertex>(m_ribbon_scratch).subspan(offset, count));
        offset += count;
    }
    target.write(as_bytes(std::span<const Vertex>(m_ribbon_scratch)));
}

void SceneRenderer::record(vk::CommandBuffer cmd, const FrameInfo& info) {
    std::array<vk::ClearValue, 2> clear_values = {
        vk::ClearColorValue(BACKGROUND),
        vk::ClearDepthStencilValue(1.0f, 0)
    };
    cmd.beginRenderPass(vk::RenderPassBeginInfo()
        .setRenderPass(info.render_pass)
        .setFramebuffer(info.framebuffer)
        .setRenderArea(vk::Rect2D({0, 0}, info.extent))
        .setClearValues(clear_values), vk::SubpassContents::eInline);

    // Negative height flips Y to match the right-handed camera
    auto viewport = vk::Viewport()
        .setX(0.0f)
        .setY(static_cast<float>(info.extent.height))
        .setWidth(static_cast<float>(info.extent.width))
        .setHeight(-static_cast<float>(info.extent.height))
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);
    cmd.setViewport(0, viewport);
    cmd.setScissor(0, vk::Rect2D({0, 0}, info.extent));

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, m_pipeline);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, m_pipeline_layout, 0,
                           m_descriptor_sets[m_current_frame], {});

    for (const auto& batch : m_batches) {
        DrawPush push{.instance_offset = batch.range->first()};
        cmd.pushConstants(m_pipeline_layout, m_push_stages, 0, sizeof(DrawPush), &push);

        if (batch.mesh == RIBBON_MESH) {
            cmd.bindVertexBuffers(0, m_ribbon_vertices[m_current_frame].buffer(), vk::DeviceSize{0});
            cmd.bindIndexBuffer(m_ribbon_indices.buffer(), 0, vk::IndexType::eUint32);
            cmd.drawIndexed(m_ribbon_index_count, 1, 0, 0, 0);
            continue;
        }
        const auto& mesh = m_meshes[batch.mesh];
        cmd.bindVertexBuffers(0, mesh.vertices.buffer(), vk::DeviceSize{0});
        cmd.bindIndexBuffer(mesh.indices.buffer(), 0, vk::IndexType::eUint32);
        cmd.drawIndexed(mesh.index_count, batch.range->count(), 0, 0, 0);
    }

    if (info.imgui_draw_data) {
        ImGui_ImplVulkan_RenderDrawData(info.imgui_draw_data, static_cast<VkCommandBuffer>(cmd));
    }
    cmd.endRenderPass();
}

std::expected<vk::Semaphore, std::string> SceneRenderer::render_frame(
    const HolidayScene& scene,
    const FrameInfo& info,
    vk::Queue graphics_queue
) {
    if (info.image_index >= m_render_finished.size()) {
        return std::unexpected(std::format("Image {} has no render-finished semaphore", info.image_index));
    }

    // The fence of this slot was waited on in begin_frame(), so its buffers are free
    scene.publish(m_sinks);
    m_instance_buffers[m_current_frame].write(as_bytes(m_staging.records()));
    auto params = make_view_params(scene, info.camera);
    m_view_buffers[m_current_frame].write(object_bytes(params));
    write_ribbons(scene, m_ribbon_vertices[m_current_frame]);

    auto reset_res = m_device.resetFences(m_in_flight[m_current_frame]);
    CHECK_VK_RESULT_VOID(reset_res, "Failed to reset fence: {}");

    auto cmd = m_command_buffers[m_current_frame];
    auto cmd_reset_res = cmd.reset();
    CHECK_VK_RESULT_VOID(cmd_reset_res, "Failed to reset command buffer: {}");
    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    CHECK_VK_RESULT_VOID(begin_res, "Failed to begin command buffer: {}");
    record(cmd, info);
    auto end_res = cmd.end();
    CHECK_VK_RESULT_VOID(end_res, "Failed to end command buffer: {}");

    auto finished = m_render_finished[info.image_index];
    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit_res = graphics_queue.submit(vk::SubmitInfo()
        .setWaitSemaphores(info.image_available)
        .setWaitDstStageMask(wait_stage)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(finished), m_in_flight[m_current_frame]);
    CHECK_VK_RESULT_VOID(submit_res, "Queue submit failed: {}");

    m_current_frame = (m_current_frame + 1) % MAX_FRAMES_IN_FLIGHT;
    return finished;
}

} // namespace evergreen::render
