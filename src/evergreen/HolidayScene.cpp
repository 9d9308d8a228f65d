#include <evergreen/HolidayScene.hpp>
#include <evergreen/Color.hpp>
#include <evergreen/Logger.hpp>
#include <evergreen/Random.hpp>

namespace evergreen {

HolidayScene::HolidayScene(const SceneConfig& config,
                           InstancePopulation spheres,
                           InstancePopulation cubes,
                           SnowSimulator snow,
                           GiftCluster gifts,
                           StarTopper topper)
    : m_config(config)
    , m_spheres(std::move(spheres))
    , m_cubes(std::move(cubes))
    , m_snow(std::move(snow))
    , m_gifts(std::move(gifts))
    , m_topper(std::move(topper))
    , m_mapper(config.gesture)
    , m_controller(config.rotation)
{
}

std::expected<std::unique_ptr<HolidayScene>, std::string> HolidayScene::create(const SceneConfig& config) {
    if (!config.is_valid()) {
        return std::unexpected("Invalid scene configuration");
    }

    auto rng = make_rng(config.seed);

    auto sphere_palette = parse_palette(palettes::sphere_ornaments());
    if (!sphere_palette) {
        return std::unexpected("Sphere palette: " + sphere_palette.error());
    }
    auto cube_palette = parse_palette(palettes::cube_ornaments());
    if (!cube_palette) {
        return std::unexpected("Cube palette: " + cube_palette.error());
    }

    auto spheres = InstancePopulation::create(config.spheres, *sphere_palette, rng);
    if (!spheres) {
        return std::unexpected("Sphere ornaments: " + spheres.error());
    }
    auto cubes = InstancePopulation::create(config.cubes, *cube_palette, rng);
    if (!cubes) {
        return std::unexpected("Cube ornaments: " + cubes.error());
    }

    // Derive the snow seed so a fixed scene seed reproduces the snowfall too
    SnowConfig snow_config = config.snow;
    if (snow_config.seed == 0 && config.seed != 0) {
        snow_config.seed = config.seed + 1;
    }
    auto snow = SnowSimulator::create(snow_config);
    if (!snow) {
        return std::unexpected("Snow: " + snow.error());
    }

    auto gifts = GiftCluster::create(config.gifts, rng);
    if (!gifts) {
        return std::unexpected("Gifts: " + gifts.error());
    }

    auto topper = StarTopper::create(config.topper);
    if (!topper) {
        return std::unexpected("Topper: " + topper.error());
    }

    Logger::instance().info("Holiday scene ready ({} spheres, {} cubes, {} snow, {} gifts)",
                            spheres->size(), cubes->size(), snow->size(), gifts->size());

    return std::unique_ptr<HolidayScene>(new HolidayScene(
        config,
        std::move(*spheres),
        std::move(*cubes),
        std::move(*snow),
        std::move(*gifts),
        std::move(*topper)
    ));
}

void HolidayScene::drain_gestures() {
    auto sample = m_gesture_channel.take();
    if (!sample) {
        return;
    }
    m_controller.apply_gesture(m_mapper.process(*sample));
}

void HolidayScene::stop_gestures() {
    m_gesture_channel.clear();
    m_mapper.reset();
    m_controller.set_manual_rotation(0.0f);
    Logger::instance().debug("Gesture input cleared");
}

void HolidayScene::tick(float delta_time) {
    if (delta_time <= 0.0f) {
        return;
    }

    m_elapsed += delta_time;
    m_frame++;

    drain_gestures();
    m_controller.update(delta_time);

    const InteractionMode mode = m_controller.current_mode();
    m_spheres.update(delta_time, m_elapsed, mode);
    m_cubes.update(delta_time, m_elapsed, mode);
    m_snow.step(delta_time, m_elapsed, mode);
    m_gifts.update(delta_time, m_elapsed, mode);
    m_topper.update(delta_time, m_elapsed, mode);
}

void HolidayScene::publish(const SceneSinks& sinks) const {
    if (sinks.spheres) m_spheres.publish(*sinks.spheres);
    if (sinks.cubes) m_cubes.publish(*sinks.cubes);
    if (sinks.snow) m_snow.publish(*sinks.snow, m_elapsed);
    if (sinks.gift_boxes) m_gifts.publish_boxes(*sinks.gift_boxes);
    if (sinks.gift_trim) m_gifts.publish_trim(*sinks.gift_trim);
    if (sinks.topper) m_topper.publish(*sinks.topper);
}

void HolidayScene::publish_colors(const SceneSinks& sinks) const {
    if (sinks.spheres) m_spheres.publish_colors(*sinks.spheres);
    if (sinks.cubes) m_cubes.publish_colors(*sinks.cubes);
    if (sinks.snow) {
        for (uint32_t i = 0; i < m_snow.size(); i++) {
            sinks.snow->set_color(i, glm::vec3(1.0f));
        }
    }
    if (sinks.gift_boxes) m_gifts.publish_box_colors(*sinks.gift_boxes);
    if (sinks.gift_trim) m_gifts.publish_trim_colors(*sinks.gift_trim, m_config.ribbon_color);
    if (sinks.topper) sinks.topper->set_color(0, m_config.topper.color);
}

std::vector<UICallbackGroup> HolidayScene::get_ui_callback_groups() {
    std::vector<UICallbackGroup> groups;
    groups.push_back({"Interaction", m_controller.get_ui_callbacks()});
    groups.push_back({"Gesture", m_mapper.get_ui_callbacks()});
    groups.push_back({"Sphere Ornaments", m_spheres.get_ui_callbacks()});
    groups.push_back({"Cube Ornaments", m_cubes.get_ui_callbacks()});
    groups.push_back({"Snow", m_snow.get_ui_callbacks()});
    groups.push_back({"Gifts", m_gifts.get_ui_callbacks()});
    return groups;
}

} // namespace evergreen
