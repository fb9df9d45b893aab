#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "map/path_planner.hpp"
#include "map/terrain_grid.hpp"
#include "sim/rover.hpp"

#include <optional>

namespace rsim::sim {

class MissionTelemetry;

struct ControllerSettings {
    u32 grid_size = 20;
    std::optional<u64> seed;      // first terrain seed; random if unset
    f64 initial_energy = 100.0;
    map::PathAlgorithm algorithm = map::PathAlgorithm::AStar;
};

/// Wires terrain, planner, rover and telemetry for one mission at a time.
/// The caller owns the cadence: call tick() once per simulated step.
class MissionController {
public:
    MissionController(const ControllerSettings& settings,
                      MissionTelemetry& telemetry);

    /// Fresh terrain (next seed), rover back to origin, new plan.
    /// Stops a running mission without recording it.
    Result<void> reset();

    /// Toggle running. Starting without a plan fails. Starting from Idle
    /// opens a telemetry mission.
    Result<void> start_stop();

    /// One rover step when running. Returns true if the rover moved.
    bool tick();

    /// Start (if needed) and tick until the mission ends or max_ticks pass.
    /// Returns the number of ticks run.
    Result<u32> run_to_completion(u32 max_ticks);

    /// Replan from the rover's current position with the configured
    /// algorithm. Only valid while the rover is Idle.
    Result<void> replan();

    void set_algorithm(map::PathAlgorithm algorithm) {
        settings_.algorithm = algorithm;
    }

    bool running() const { return running_; }
    u32 mission_id() const { return mission_id_; }
    u64 current_seed() const { return seed_; }
    const map::TerrainGrid& grid() const { return grid_; }
    const Rover& rover() const { return rover_; }
    const std::optional<map::PathResult>& last_plan() const {
        return last_plan_;
    }
    const ControllerSettings& settings() const { return settings_; }

private:
    void end_mission();

    ControllerSettings settings_;
    MissionTelemetry& telemetry_;
    map::TerrainGrid grid_;
    Rover rover_;
    std::optional<map::PathResult> last_plan_;
    u64 seed_ = 0;
    u32 mission_id_ = 0;
    bool running_ = false;
    bool mission_open_ = false;
    bool first_reset_ = true;
};

} // namespace rsim::sim
