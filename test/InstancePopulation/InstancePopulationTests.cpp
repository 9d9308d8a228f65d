#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/Color.hpp>
#include <evergreen/InstancePopulation.hpp>
#include <cmath>

using namespace evergreen;
using Catch::Approx;

namespace {

class RecordingSink final : public InstanceSink {
public:
    explicit RecordingSink(uint32_t capacity) : transforms(capacity), colors(capacity) {}

    [[nodiscard]] uint32_t capacity() const override { return static_cast<uint32_t>(transforms.size()); }
    void set_transform(uint32_t index, const InstanceTransform& transform) override { transforms[index] = transform; }
    void set_color(uint32_t index, const glm::vec3& color) override { colors[index] = color; }

    std::vector<InstanceTransform> transforms;
    std::vector<glm::vec3> colors;
};

InstancePopulation make_population(uint32_t count) {
    auto palette = parse_palette(palettes::sphere_ornaments());
    PopulationConfig config;
    config.count = count;
    std::mt19937 rng(42);
    auto population = InstancePopulation::create(config, *palette, rng);
    REQUIRE(population.has_value());
    return std::move(*population);
}

} // namespace

TEST_CASE("Population starts in Tree formation", "[population]")
{
    auto population = make_population(300);
    REQUIRE(population.size() == 300);
    auto current = population.current_positions();
    auto tree = population.tree_targets();
    for (uint32_t i = 0; i < population.size(); i++) {
        REQUIRE(current[i] == tree[i]);
    }
}

TEST_CASE("Empty population is valid", "[population]")
{
    auto population = make_population(0);
    REQUIRE(population.size() == 0);
    population.update(0.016f, 0.016f, InteractionMode::Exploded);

    RecordingSink sink(0);
    population.publish(sink);
    population.publish_colors(sink);
}

TEST_CASE("Population converges on the active formation", "[population]")
{
    auto population = make_population(200);

    float elapsed = 0.0f;
    for (int i = 0; i < 600; i++) {
        elapsed += 1.0f / 60.0f;
        population.update(1.0f / 60.0f, elapsed, InteractionMode::Exploded);
    }

    auto current = population.current_positions();
    auto exploded = population.exploded_targets();
    for (uint32_t i = 0; i < population.size(); i++) {
        REQUIRE(glm::distance(current[i], exploded[i]) < 1e-3f);
    }

    SECTION("and back")
    {
        for (int i = 0; i < 600; i++) {
            elapsed += 1.0f / 60.0f;
            population.update(1.0f / 60.0f, elapsed, InteractionMode::Tree);
        }
        auto tree = population.tree_targets();
        for (uint32_t i = 0; i < population.size(); i++) {
            REQUIRE(glm::distance(population.current_positions()[i], tree[i]) < 1e-3f);
        }
    }
}

TEST_CASE("Rotation and scale are pure functions of time and index", "[population]")
{
    auto population = make_population(10);
    const auto& config = population.config();

    REQUIRE(population.rotation_at(2.0f, 3) == population.rotation_at(2.0f, 3));
    REQUIRE(population.rotation_at(0.0f, 4) == glm::vec3(4.0f));

    for (float t : {0.0f, 0.7f, 3.3f, 100.0f}) {
        float scale = population.scale_at(t, 5);
        REQUIRE(scale >= config.base_scale - config.pulse_amplitude - 1e-6f);
        REQUIRE(scale <= config.base_scale + config.pulse_amplitude + 1e-6f);
    }
}

TEST_CASE("Publish writes every instance", "[population]")
{
    auto population = make_population(50);
    population.update(0.5f, 0.5f, InteractionMode::Exploded);

    RecordingSink sink(50);
    population.publish(sink);
    population.publish_colors(sink);

    for (uint32_t i = 0; i < 50; i++) {
        REQUIRE(sink.transforms[i].position == population.current_positions()[i]);
        REQUIRE(sink.transforms[i].scale.x == Approx(population.scale_at(0.5f, i)));
        REQUIRE(sink.colors[i] == population.colors()[i]);
    }
}

TEST_CASE("Invalid configuration is rejected", "[population]")
{
    auto palette = parse_palette(palettes::sphere_ornaments());
    PopulationConfig config;
    config.pulse_amplitude = config.base_scale * 2.0f;
    std::mt19937 rng(1);
    REQUIRE(!InstancePopulation::create(config, *palette, rng).has_value());
}
