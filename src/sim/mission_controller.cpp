#include "sim/mission_controller.hpp"
#include "map/terrain_generator.hpp"
#include "sim/mission_telemetry.hpp"

#include <random>
#include <spdlog/spdlog.h>

namespace rsim::sim {

MissionController::MissionController(const ControllerSettings& settings,
                                     MissionTelemetry& telemetry)
    : settings_(settings),
      telemetry_(telemetry),
      grid_(map::TerrainGrid::MIN_SIZE),
      rover_(settings.initial_energy) {
    seed_ = settings_.seed ? *settings_.seed : std::random_device{}();
}

Result<void> MissionController::reset() {
    running_ = false;
    mission_open_ = false;

    // Each reset after the first draws the next seed in sequence
    if (!first_reset_) ++seed_;
    first_reset_ = false;

    auto generated = map::generate_terrain(settings_.grid_size, seed_);
    if (!generated) return generated.error();
    grid_ = std::move(generated.value());

    rover_.reset();
    last_plan_.reset();

    auto marked = grid_.mark(grid_.goal(), map::TerrainCell::GoalMarker);
    if (!marked) return marked.error();

    spdlog::info("Mission {}: {}x{} terrain, seed {}", mission_id_,
                 settings_.grid_size, settings_.grid_size, seed_);
    return replan();
}

Result<void> MissionController::replan() {
    if (rover_.status() != RoverStatus::Idle) {
        return Error(ErrorCode::InvalidArgument,
                     "Cannot replan while rover is " +
                         std::string(rover_status_name(rover_.status())));
    }

    auto result = map::PathPlanner::find_path(grid_, rover_.position(),
                                              grid_.goal(),
                                              settings_.algorithm);
    if (!result) return result.error();

    last_plan_ = result.value();
    if (!rover_.assign_path(last_plan_->plan)) {
        return Error(ErrorCode::InvalidArgument, "Rover rejected the plan");
    }
    if (last_plan_->found) {
        spdlog::info("Path found ({}): {} cells, cost {:.1f}",
                     map::algorithm_name(settings_.algorithm),
                     last_plan_->plan.length(), last_plan_->plan.total_cost);
    } else {
        spdlog::warn("No path found ({})",
                     map::algorithm_name(settings_.algorithm));
    }
    return {};
}

Result<void> MissionController::start_stop() {
    if (running_) {
        running_ = false;
        spdlog::info("Mission {} paused", mission_id_);
        return {};
    }

    if (!rover_.has_path()) {
        return Error(ErrorCode::InvalidArgument, "No valid path to follow");
    }
    if (is_terminal(rover_.status())) {
        return Error(ErrorCode::InvalidArgument,
                     "Mission already ended; reset first");
    }

    if (rover_.status() == RoverStatus::Idle && !mission_open_) {
        telemetry_.start_mission(mission_id_, rover_.initial_energy());
        mission_open_ = true;
    }
    running_ = true;
    return {};
}

bool MissionController::tick() {
    if (!running_) return false;

    bool moved = rover_.step(grid_);
    if (moved) {
        const auto& visited = rover_.terrain_visited();
        telemetry_.record_step(rover_.position(), rover_.energy(),
                               visited.back(), rover_.speed());
    }

    if (is_terminal(rover_.status())) {
        end_mission();
    } else if (!moved) {
        // Plan exhausted without a terminal state; nothing more to do
        running_ = false;
    }
    return moved;
}

Result<u32> MissionController::run_to_completion(u32 max_ticks) {
    if (!running_) {
        auto started = start_stop();
        if (!started) return started.error();
    }

    u32 ticks = 0;
    while (running_ && ticks < max_ticks) {
        tick();
        ++ticks;
    }
    if (running_) {
        spdlog::warn("Mission {} still running after {} ticks", mission_id_,
                     ticks);
    }
    return ticks;
}

void MissionController::end_mission() {
    running_ = false;
    mission_open_ = false;

    const bool success = rover_.status() == RoverStatus::ReachedGoal;
    auto record = telemetry_.end_mission(success);
    spdlog::info("Mission {} {}: energy {:.1f}, path length {}, status {}",
                 mission_id_, success ? "succeeded" : "failed",
                 rover_.energy(), rover_.path().length(),
                 rover_status_name(rover_.status()));
    if (!record) {
        spdlog::debug("Mission {} ended without recorded steps", mission_id_);
    }
    ++mission_id_;
}

} // namespace rsim::sim
