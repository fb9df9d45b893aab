#pragma once

#include "core/types.hpp"
#include "map/coord.hpp"
#include "map/terrain_cost.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rsim::sim {

/// Immutable summary of one finished mission.
struct MissionRecord {
    u32 mission_id = 0;
    std::string start_time; // "%Y-%m-%d %H:%M:%S", local time
    std::string end_time;
    bool success = false;
    u32 total_distance = 0;
    f64 energy_consumed = 0.0;
    std::map<map::TerrainCell, f64> terrain_distribution;
    f64 average_speed = 0.0;
    std::vector<map::Coord> path;

    bool operator==(const MissionRecord& o) const {
        return mission_id == o.mission_id && start_time == o.start_time &&
               end_time == o.end_time && success == o.success &&
               total_distance == o.total_distance &&
               energy_consumed == o.energy_consumed &&
               terrain_distribution == o.terrain_distribution &&
               average_speed == o.average_speed && path == o.path;
    }
    bool operator!=(const MissionRecord& o) const { return !(*this == o); }
};

struct PerformanceMetrics {
    f64 success_rate = 0.0;        // percent
    f64 avg_energy_per_step = 0.0;
    f64 avg_mission_distance = 0.0;
    size_t total_missions = 0;
    u32 longest_mission = 0;
    std::optional<u32> most_efficient_mission;
};

struct MissionReport {
    size_t total_missions = 0;
    f64 success_rate = 0.0;
    f64 average_energy_consumption = 0.0;
    f64 average_distance = 0.0;
};

/// Per-step log of the active mission plus the session's finished missions.
/// One instance lives for the whole session and is passed by reference to
/// whoever records into or reports from it.
class MissionTelemetry {
public:
    /// Open a new mission. Discards any unfinished one.
    void start_mission(u32 mission_id, f64 initial_energy);

    /// One observation per successful rover move. Ignored with a warning
    /// when no mission is open.
    void record_step(const map::Coord& position, f64 energy,
                     map::TerrainCell terrain, f64 speed);

    /// Finalize the active mission into a record and append it to history.
    /// Returns nullopt when nothing was recorded.
    std::optional<MissionRecord> end_mission(bool success);

    PerformanceMetrics performance_metrics() const;
    std::optional<MissionReport> mission_report() const;

    bool mission_active() const { return active_; }
    size_t recorded_steps() const { return current_.path.size(); }

    /// Energy level after each step of the active mission.
    const std::vector<f64>& energy_trace() const { return current_.energy; }

    const std::vector<MissionRecord>& history() const { return history_; }

    /// Swap in a loaded history (e.g. from an archive file).
    void replace_history(std::vector<MissionRecord> records);

    void clear();

private:
    struct ActiveMission {
        u32 id = 0;
        f64 initial_energy = 0.0;
        std::string start_time;
        std::vector<map::Coord> path;
        std::vector<f64> energy;
        std::vector<map::TerrainCell> terrain;
        std::vector<f64> speed;
    };

    bool active_ = false;
    ActiveMission current_;
    std::vector<MissionRecord> history_;
};

/// Current local time as "%Y-%m-%d %H:%M:%S".
std::string format_timestamp_now();

} // namespace rsim::sim
