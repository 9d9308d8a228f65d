#include <catch2/catch_test_macros.hpp>
#include <algorithm>

#include <evergreen/InstanceStaging.hpp>
#include <evergreen/Logger.hpp>
#include <evergreen/render/SceneRenderer.hpp>
#include <evergreen/render/Shader.hpp>
#include <evergreen/render/VulkanContext.hpp>
#include <evergreen/render/Window.hpp>

using namespace evergreen;
using namespace evergreen::render;

namespace {

const DescriptorInfo* find_descriptor(const Shader& shader, std::string_view name)
{
    const auto& descriptors = shader.descriptors();
    auto it = std::ranges::find_if(descriptors, [&](const DescriptorInfo& d) { return d.name == name; });
    return it == descriptors.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("Instanced shaders load and reflect", "[shader][loading]")
{
    Logger::instance().set_level(spdlog::level::trace);
    auto glfw = GlfwSession::create();
    REQUIRE(glfw.has_value());
    auto ctx = VulkanContext::create("Shader Test");
    REQUIRE(ctx.has_value());
    auto device = (*ctx)->device();

    auto vert = Shader::create(device, "instanced/instanced_vert");
    auto frag = Shader::create(device, "instanced/instanced_frag");

    SECTION("shaders load without error")
    {
        REQUIRE(vert.has_value());
        REQUIRE(frag.has_value());
    }

    REQUIRE(vert.has_value());
    REQUIRE(frag.has_value());

    SECTION("shader modules are valid")
    {
        REQUIRE(vert->module());
        REQUIRE(frag->module());
    }

    SECTION("stages are detected")
    {
        REQUIRE(vert->stage() == vk::ShaderStageFlagBits::eVertex);
        REQUIRE(frag->stage() == vk::ShaderStageFlagBits::eFragment);
    }

    SECTION("vertex stage sees the view block and the instance buffer")
    {
        const auto* view = find_descriptor(*vert, "view");
        REQUIRE(view != nullptr);
        REQUIRE(view->binding == 0);
        REQUIRE(view->set == 0);
        REQUIRE(view->type == vk::DescriptorType::eUniformBuffer);
        REQUIRE(view->size == sizeof(ViewParams));

        const auto* instances = find_descriptor(*vert, "instances");
        REQUIRE(instances != nullptr);
        REQUIRE(instances->binding == 1);
        REQUIRE(instances->type == vk::DescriptorType::eStorageBuffer);
        REQUIRE(instances->size == sizeof(GpuInstance));
    }

    SECTION("only the vertex stage has push constants")
    {
        REQUIRE(vert->push_constants().has_value());
        REQUIRE(vert->push_constants()->size == sizeof(DrawPush));
        REQUIRE(!frag->push_constants().has_value());
    }

    SECTION("merged bindings cover both stages")
    {
        auto bindings = Shader::merge_bindings({&*vert, &*frag});
        REQUIRE(bindings.has_value());
        REQUIRE(bindings->size() == 2);

        auto view = std::ranges::find_if(*bindings, [](const auto& b) { return b.binding == 0; });
        REQUIRE(view != bindings->end());
        REQUIRE((view->stageFlags & vk::ShaderStageFlagBits::eVertex));
        REQUIRE((view->stageFlags & vk::ShaderStageFlagBits::eFragment));

        auto range = Shader::merge_push_constants({&*vert, &*frag});
        REQUIRE(range.has_value());
        REQUIRE(range->offset == 0);
    }
}

TEST_CASE("Missing shader reports an error", "[shader][loading]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto glfw = GlfwSession::create();
    REQUIRE(glfw.has_value());
    auto ctx = VulkanContext::create("Shader Test");
    REQUIRE(ctx.has_value());

    auto missing = Shader::create((*ctx)->device(), "instanced/does_not_exist");
    REQUIRE(!missing.has_value());
    REQUIRE(!missing.error().empty());
}
