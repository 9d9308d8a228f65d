// Evergreen - interactive holiday scene
// Scene: particle tree, snow, gifts and star (evergreen_core)
// View: instanced Vulkan renderer with an ImGui overlay
// Application: window, input and the optional gesture source

#include <evergreen/render/SceneApplication.hpp>
#include <evergreen/Logger.hpp>
#include <spdlog/spdlog.h>
#include <string_view>

int main(int argc, char** argv) {
    evergreen::render::ViewerConfig config{};
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--gestures") {
            config.start_gesture_source = true;
        } else if (arg == "--verbose") {
            Logger::instance().set_console_level(spdlog::level::trace);
        } else {
            Logger::instance().warn("Ignoring unknown argument '{}'", arg);
        }
    }

    try {
        auto app = evergreen::render::SceneApplication::create(config);
        if (!app) {
            Logger::instance().error("Failed to start: {}", app.error());
            return 1;
        }

        if (auto result = (*app)->run(); !result) {
            Logger::instance().error("Runtime error: {}", result.error());
            return 1;
        }

        Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
