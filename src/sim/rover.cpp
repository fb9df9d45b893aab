#include "sim/rover.hpp"
#include "map/terrain_grid.hpp"

#include <algorithm>
#include <cassert>
#include <spdlog/spdlog.h>

namespace rsim::sim {

const char* rover_status_name(RoverStatus status) {
    switch (status) {
    case RoverStatus::Idle: return "IDLE";
    case RoverStatus::Moving: return "MOVING";
    case RoverStatus::ReachedGoal: return "REACHED_GOAL";
    case RoverStatus::OutOfEnergy: return "OUT_OF_ENERGY";
    case RoverStatus::Stuck: return "STUCK";
    }
    return "UNKNOWN";
}

Rover::Rover(f64 initial_energy)
    : initial_energy_(initial_energy), energy_(initial_energy) {
    assert(initial_energy > 0.0);
}

bool Rover::assign_path(const map::PathPlan& plan) {
    if (status_ != RoverStatus::Idle) {
        spdlog::warn("Rover: path rejected while {}",
                     rover_status_name(status_));
        return false;
    }
    plan_ = plan;
    path_index_ = 0;
    return true;
}

bool Rover::step(map::TerrainGrid& grid) {
    if (is_terminal(status_)) return false;
    if (plan_.empty() || path_index_ >= plan_.length()) return false;

    const map::Coord next = plan_.cells[path_index_];
    auto cell_result = grid.at(next);
    if (!cell_result) {
        // Plan from a different grid; treat as blocked
        spdlog::warn("Rover: {}", cell_result.error().message);
        status_ = RoverStatus::Stuck;
        return false;
    }

    const map::TerrainCell cell = cell_result.value();
    if (!map::is_passable(cell)) {
        spdlog::info("Rover: blocked at ({}, {}), stuck", next.x, next.y);
        status_ = RoverStatus::Stuck;
        return false;
    }

    const f64 cost = map::terrain_cost(cell);
    if (energy_ < cost) {
        spdlog::info("Rover: {:.1f} energy left, step needs {:.1f}", energy_,
                     cost);
        status_ = RoverStatus::OutOfEnergy;
        return false;
    }

    // Only the rover's own marker is lifted; a goal marker under the rover
    // is not there yet since the goal is the last cell.
    if (grid.in_bounds(position_) &&
        grid.get(position_) == map::TerrainCell::RoverMarker) {
        auto cleared = grid.clear_marker(position_);
        if (!cleared) spdlog::warn("Rover: {}", cleared.error().message);
    }
    position_ = next;
    auto marked = grid.mark(position_, map::TerrainCell::RoverMarker);
    if (!marked) spdlog::warn("Rover: {}", marked.error().message);

    // History and speed use the terrain under any marker
    const map::TerrainCell terrain = grid.base(next);
    energy_ -= cost;
    step_costs_.push_back(cost);
    ++path_index_;
    ++distance_;
    terrain_visited_.push_back(terrain);
    speed_ = map::speed_factor(terrain);
    status_ = RoverStatus::Moving;

    if (path_index_ >= plan_.length()) {
        status_ = RoverStatus::ReachedGoal;
        spdlog::info("Rover: goal reached with {:.1f} energy", energy_);
    }
    return true;
}

void Rover::reset() {
    energy_ = initial_energy_;
    position_ = {0, 0};
    status_ = RoverStatus::Idle;
    plan_ = {};
    path_index_ = 0;
    distance_ = 0;
    speed_ = 1.0;
    terrain_visited_.clear();
    step_costs_.clear();
}

StopReport Rover::emergency_stop() {
    status_ = RoverStatus::Idle;
    StopReport report;
    report.position = position_;
    report.energy_remaining = energy_;
    report.path_progress = progress_percent() / 100.0;
    report.final_status = status_;
    return report;
}

TerrainDistribution Rover::terrain_distribution() const {
    TerrainDistribution dist;
    if (terrain_visited_.empty()) return dist;
    for (auto cell : terrain_visited_) dist[cell] += 1.0;
    const f64 total = static_cast<f64>(terrain_visited_.size());
    for (auto& [cell, share] : dist) share /= total;
    return dist;
}

std::optional<EfficiencyMetrics> Rover::efficiency_metrics() const {
    if (plan_.empty()) return std::nullopt;

    const f64 steps = static_cast<f64>(std::max<size_t>(1, path_index_));
    EfficiencyMetrics m;
    m.energy_per_step = (initial_energy_ - energy_) / steps;
    m.progress_rate = static_cast<f64>(path_index_) /
                      static_cast<f64>(plan_.length());
    m.average_speed = static_cast<f64>(distance_) / steps;
    m.terrain_distribution = terrain_distribution();
    return m;
}

bool Rover::can_complete_path(const map::TerrainGrid& grid) const {
    if (plan_.empty() || path_index_ >= plan_.length()) return true;

    f64 needed = 0.0;
    for (size_t i = path_index_; i < plan_.length(); ++i) {
        const auto& c = plan_.cells[i];
        if (!grid.in_bounds(c)) return false;
        needed += grid.cost_at(c);
    }
    return energy_ >= needed;
}

size_t Rover::estimated_remaining_steps() const {
    if (path_index_ >= plan_.length()) return 0;
    return plan_.length() - path_index_;
}

f64 Rover::estimate_completion_time() const {
    return static_cast<f64>(estimated_remaining_steps()) / speed_;
}

std::optional<PathStats> Rover::path_stats() const {
    if (plan_.empty()) return std::nullopt;
    PathStats stats;
    stats.total_length = plan_.length();
    stats.completed = path_index_;
    stats.remaining = estimated_remaining_steps();
    stats.estimated_time = estimate_completion_time();
    return stats;
}

bool Rover::is_near_obstacle(const map::TerrainGrid& grid) const {
    for (i32 dy = -1; dy <= 1; ++dy) {
        for (i32 dx = -1; dx <= 1; ++dx) {
            map::Coord c{position_.x + dx, position_.y + dy};
            if (grid.in_bounds(c) && grid.get(c) == map::TerrainCell::Obstacle)
                return true;
        }
    }
    return false;
}

f64 Rover::progress_percent() const {
    if (plan_.empty()) return 0.0;
    return static_cast<f64>(path_index_) /
           static_cast<f64>(plan_.length()) * 100.0;
}

RoverSnapshot Rover::snapshot() const {
    RoverSnapshot s;
    s.position = position_;
    s.energy = energy_;
    s.status = status_;
    s.progress_percent = progress_percent();
    s.distance = distance_;
    s.speed = speed_;
    return s;
}

} // namespace rsim::sim
