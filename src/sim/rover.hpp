#pragma once

#include "core/types.hpp"
#include "map/coord.hpp"
#include "map/path_planner.hpp"
#include "map/terrain_cost.hpp"

#include <map>
#include <optional>
#include <vector>

namespace rsim::map {
class TerrainGrid;
}

namespace rsim::sim {

enum class RoverStatus : u8 {
    Idle,
    Moving,
    ReachedGoal,
    OutOfEnergy,
    Stuck,
};

const char* rover_status_name(RoverStatus status);

inline bool is_terminal(RoverStatus status) {
    return status == RoverStatus::ReachedGoal ||
           status == RoverStatus::OutOfEnergy || status == RoverStatus::Stuck;
}

/// Fraction of visited steps per terrain class.
using TerrainDistribution = std::map<map::TerrainCell, f64>;

struct EfficiencyMetrics {
    f64 energy_per_step = 0.0; // energy used / completed steps (min 1)
    f64 progress_rate = 0.0;   // completed / plan length
    f64 average_speed = 0.0;   // distance / completed steps (min 1)
    TerrainDistribution terrain_distribution;
};

/// Read-only view for display layers.
struct RoverSnapshot {
    map::Coord position;
    f64 energy = 0.0;
    RoverStatus status = RoverStatus::Idle;
    f64 progress_percent = 0.0;
    u32 distance = 0;
    f64 speed = 1.0;
};

struct PathStats {
    size_t total_length = 0;
    size_t completed = 0;
    size_t remaining = 0;
    f64 estimated_time = 0.0;
};

struct StopReport {
    map::Coord position;
    f64 energy_remaining = 0.0;
    f64 path_progress = 0.0; // 0..1
    RoverStatus final_status = RoverStatus::Idle;
};

/// Mobile agent that follows an assigned plan one cell per step().
///
/// Energy is only ever deducted by a successful step, so after k moves
/// energy == initial - sum of the k entered cell costs. A step that cannot
/// be paid for moves the rover to OutOfEnergy instead.
class Rover {
public:
    explicit Rover(f64 initial_energy = 100.0);

    /// Assign a plan. Only valid while Idle; resets progress.
    /// Returns false if the rover is not Idle.
    bool assign_path(const map::PathPlan& plan);

    /// Advance one cell along the plan, reading and updating the live grid.
    /// Returns true only if the rover moved.
    bool step(map::TerrainGrid& grid);

    /// Back to Idle at the origin with full energy and no plan.
    void reset();

    /// Halt in place. Position, energy and plan are kept.
    StopReport emergency_stop();

    // Derived queries
    std::optional<EfficiencyMetrics> efficiency_metrics() const;
    TerrainDistribution terrain_distribution() const;
    bool can_complete_path(const map::TerrainGrid& grid) const;
    size_t estimated_remaining_steps() const;
    f64 estimate_completion_time() const;
    std::optional<PathStats> path_stats() const;
    bool is_near_obstacle(const map::TerrainGrid& grid) const;
    RoverSnapshot snapshot() const;
    f64 progress_percent() const;

    // Accessors
    RoverStatus status() const { return status_; }
    const map::Coord& position() const { return position_; }
    f64 energy() const { return energy_; }
    f64 initial_energy() const { return initial_energy_; }
    f64 speed() const { return speed_; }
    u32 distance() const { return distance_; }
    size_t path_index() const { return path_index_; }
    bool has_path() const { return !plan_.empty(); }
    const map::PathPlan& path() const { return plan_; }
    /// Base terrain class of each entered cell; never a marker.
    const std::vector<map::TerrainCell>& terrain_visited() const {
        return terrain_visited_;
    }
    /// Energy paid for each successful step, in order.
    const std::vector<f64>& step_costs() const { return step_costs_; }

private:
    f64 initial_energy_;
    f64 energy_;
    map::Coord position_;
    RoverStatus status_ = RoverStatus::Idle;
    map::PathPlan plan_;
    size_t path_index_ = 0;
    u32 distance_ = 0;
    f64 speed_ = 1.0;
    std::vector<map::TerrainCell> terrain_visited_;
    std::vector<f64> step_costs_;
};

} // namespace rsim::sim
