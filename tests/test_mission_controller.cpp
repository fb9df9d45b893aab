#include <catch2/catch_test_macros.hpp>

#include "map/terrain_generator.hpp"
#include "sim/mission_controller.hpp"
#include "sim/mission_telemetry.hpp"

#include <cmath>

using namespace rsim;
using namespace rsim::sim;
using rsim::map::PathAlgorithm;
using rsim::map::TerrainCell;

namespace {

ControllerSettings settings_for(u64 seed, f64 energy,
                                PathAlgorithm algorithm = PathAlgorithm::AStar) {
    ControllerSettings s;
    s.grid_size = 20;
    s.seed = seed;
    s.initial_energy = energy;
    s.algorithm = algorithm;
    return s;
}

} // namespace

TEST_CASE("Controller cannot start before a plan exists", "[controller]") {
    MissionTelemetry telemetry;
    MissionController controller(settings_for(42, 100.0), telemetry);
    auto started = controller.start_stop();
    REQUIRE_FALSE(started.ok());
    CHECK(started.error().code == ErrorCode::InvalidArgument);
    CHECK_FALSE(controller.running());
    CHECK_FALSE(controller.tick());
}

TEST_CASE("Controller reset builds terrain and a plan", "[controller]") {
    MissionTelemetry telemetry;
    MissionController controller(settings_for(42, 100.0), telemetry);
    REQUIRE(controller.reset().ok());

    CHECK(controller.current_seed() == 42);
    CHECK(controller.grid().size() == 20);
    CHECK(controller.grid().get(controller.grid().goal()) ==
          TerrainCell::GoalMarker);
    REQUIRE(controller.last_plan().has_value());
    CHECK(controller.last_plan()->found);
    CHECK(controller.rover().has_path());
    CHECK(controller.rover().status() == RoverStatus::Idle);

    // Same terrain as generating directly with that seed
    auto direct = map::generate_terrain(20, 42);
    REQUIRE(direct.ok());
    for (i32 y = 0; y < 20; ++y) {
        for (i32 x = 0; x < 20; ++x) {
            CHECK(direct.value().base({x, y}) ==
                  controller.grid().base({x, y}));
        }
    }
}

TEST_CASE("Controller runs a mission to the goal", "[controller]") {
    MissionTelemetry telemetry;
    MissionController controller(settings_for(42, 10000.0), telemetry);
    REQUIRE(controller.reset().ok());
    const size_t plan_length = controller.last_plan()->plan.length();

    auto ticks = controller.run_to_completion(20 * 20 + 1);
    REQUIRE(ticks.ok());
    CHECK(ticks.value() == plan_length);
    CHECK_FALSE(controller.running());

    const auto& rover = controller.rover();
    CHECK(rover.status() == RoverStatus::ReachedGoal);
    CHECK(rover.position() == controller.grid().goal());
    CHECK(controller.grid().count(TerrainCell::RoverMarker) == 1);

    REQUIRE(telemetry.history().size() == 1);
    const auto& rec = telemetry.history()[0];
    CHECK(rec.mission_id == 0);
    CHECK(rec.success);
    CHECK(rec.total_distance == plan_length);
    CHECK(rec.path == controller.last_plan()->plan.cells);
    CHECK(rec.energy_consumed == 10000.0 - rover.energy());
    CHECK(rec.terrain_distribution.count(TerrainCell::RoverMarker) == 0);
    CHECK(rec.terrain_distribution.count(TerrainCell::GoalMarker) == 0);
    CHECK(rec.terrain_distribution.count(TerrainCell::Obstacle) == 0);

    CHECK(controller.mission_id() == 1);
    CHECK_FALSE(controller.tick());

    auto again = controller.start_stop();
    CHECK_FALSE(again.ok());
}

TEST_CASE("Controller records a failed mission on low energy",
          "[controller]") {
    MissionTelemetry telemetry;
    MissionController controller(settings_for(7, 1.0), telemetry);
    REQUIRE(controller.reset().ok());
    REQUIRE(controller.run_to_completion(100).ok());

    CHECK(controller.rover().status() == RoverStatus::OutOfEnergy);
    REQUIRE(telemetry.history().size() == 1);
    CHECK_FALSE(telemetry.history()[0].success);
    CHECK(telemetry.history()[0].total_distance == 1);
    CHECK(telemetry.history()[0].energy_consumed == 1.0);
}

TEST_CASE("Controller start_stop toggles without ending the mission",
          "[controller]") {
    MissionTelemetry telemetry;
    MissionController controller(settings_for(3, 10000.0), telemetry);
    REQUIRE(controller.reset().ok());

    REQUIRE(controller.start_stop().ok());
    CHECK(controller.running());
    CHECK(telemetry.mission_active());
    CHECK(controller.tick());
    CHECK(controller.tick());

    REQUIRE(controller.start_stop().ok());
    CHECK_FALSE(controller.running());
    CHECK_FALSE(controller.tick());
    CHECK(telemetry.recorded_steps() == 2);

    // Resuming continues the same telemetry mission
    REQUIRE(controller.start_stop().ok());
    CHECK(controller.tick());
    CHECK(telemetry.recorded_steps() == 3);
    CHECK(controller.mission_id() == 0);
}

TEST_CASE("Controller reset advances the seed", "[controller]") {
    MissionTelemetry telemetry;
    MissionController controller(settings_for(100, 10000.0), telemetry);
    REQUIRE(controller.reset().ok());
    CHECK(controller.current_seed() == 100);
    REQUIRE(controller.run_to_completion(401).ok());

    REQUIRE(controller.reset().ok());
    CHECK(controller.current_seed() == 101);
    CHECK(controller.rover().status() == RoverStatus::Idle);
    CHECK(controller.rover().energy() == 10000.0);
    REQUIRE(controller.run_to_completion(401).ok());

    REQUIRE(telemetry.history().size() == 2);
    CHECK(telemetry.history()[0].mission_id == 0);
    CHECK(telemetry.history()[1].mission_id == 1);
    CHECK(telemetry.performance_metrics().success_rate == 100.0);
}

TEST_CASE("Controller uses the configured algorithm", "[controller]") {
    MissionTelemetry telemetry;
    MissionController a(settings_for(5, 10000.0, PathAlgorithm::AStar),
                        telemetry);
    MissionController d(settings_for(5, 10000.0, PathAlgorithm::Dijkstra),
                        telemetry);
    REQUIRE(a.reset().ok());
    REQUIRE(d.reset().ok());
    CHECK(std::abs(a.last_plan()->plan.total_cost -
                   d.last_plan()->plan.total_cost) < 1e-9);

    d.set_algorithm(PathAlgorithm::EnergyEfficient);
    REQUIRE(d.replan().ok());
    CHECK(d.last_plan()->found);
}

TEST_CASE("Controller rejects a grid too small to generate", "[controller]") {
    MissionTelemetry telemetry;
    ControllerSettings s = settings_for(1, 100.0);
    s.grid_size = 5;
    MissionController controller(s, telemetry);
    auto r = controller.reset();
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}
