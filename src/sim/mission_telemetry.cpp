#include "sim/mission_telemetry.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <numeric>
#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>

namespace rsim::sim {

std::string format_timestamp_now() {
    std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(now));
}

void MissionTelemetry::start_mission(u32 mission_id, f64 initial_energy) {
    if (active_ && !current_.path.empty()) {
        spdlog::warn("Telemetry: mission {} discarded with {} steps",
                     current_.id, current_.path.size());
    }
    current_ = ActiveMission{};
    current_.id = mission_id;
    current_.initial_energy = initial_energy;
    current_.start_time = format_timestamp_now();
    active_ = true;
    spdlog::info("Telemetry: mission {} started", mission_id);
}

void MissionTelemetry::record_step(const map::Coord& position, f64 energy,
                                   map::TerrainCell terrain, f64 speed) {
    if (!active_) {
        spdlog::warn("Telemetry: step at ({}, {}) with no open mission",
                     position.x, position.y);
        return;
    }
    current_.path.push_back(position);
    current_.energy.push_back(energy);
    current_.terrain.push_back(terrain);
    current_.speed.push_back(speed);
}

std::optional<MissionRecord> MissionTelemetry::end_mission(bool success) {
    if (current_.path.empty()) {
        active_ = false;
        return std::nullopt;
    }

    MissionRecord record;
    record.mission_id = current_.id;
    record.start_time = current_.start_time;
    record.end_time = format_timestamp_now();
    record.success = success;
    record.total_distance = static_cast<u32>(current_.path.size());

    // Lowest point reached, not the final level
    f64 min_energy = *std::min_element(current_.energy.begin(),
                                       current_.energy.end());
    record.energy_consumed =
        std::max(0.0, current_.initial_energy - min_energy);

    const f64 steps = static_cast<f64>(current_.terrain.size());
    for (auto cell : current_.terrain) record.terrain_distribution[cell] += 1.0;
    for (auto& [cell, share] : record.terrain_distribution) share /= steps;

    record.average_speed =
        std::accumulate(current_.speed.begin(), current_.speed.end(), 0.0) /
        static_cast<f64>(current_.speed.size());
    record.path = current_.path;

    history_.push_back(record);
    active_ = false;
    current_ = ActiveMission{};

    spdlog::info("Telemetry: mission {} {} after {} steps, {:.1f} energy used",
                 record.mission_id, success ? "succeeded" : "failed",
                 record.total_distance, record.energy_consumed);
    return record;
}

PerformanceMetrics MissionTelemetry::performance_metrics() const {
    PerformanceMetrics m;
    if (history_.empty()) return m;

    const f64 count = static_cast<f64>(history_.size());
    size_t successes = 0;
    f64 energy_per_step_sum = 0.0;
    f64 distance_sum = 0.0;
    f64 best_eps = 0.0;

    for (const auto& r : history_) {
        if (r.success) ++successes;
        // Zero-distance missions count as one step
        const f64 eps = r.energy_consumed /
                        static_cast<f64>(std::max<u32>(1, r.total_distance));
        energy_per_step_sum += eps;
        distance_sum += r.total_distance;
        m.longest_mission = std::max(m.longest_mission, r.total_distance);

        // First one wins on ties
        if (!m.most_efficient_mission || eps < best_eps) {
            best_eps = eps;
            m.most_efficient_mission = r.mission_id;
        }
    }

    m.success_rate = static_cast<f64>(successes) / count * 100.0;
    m.avg_energy_per_step = energy_per_step_sum / count;
    m.avg_mission_distance = distance_sum / count;
    m.total_missions = history_.size();
    return m;
}

std::optional<MissionReport> MissionTelemetry::mission_report() const {
    if (history_.empty()) return std::nullopt;

    MissionReport report;
    report.total_missions = history_.size();
    const f64 count = static_cast<f64>(history_.size());
    f64 energy = 0.0, distance = 0.0;
    size_t successes = 0;
    for (const auto& r : history_) {
        energy += r.energy_consumed;
        distance += r.total_distance;
        if (r.success) ++successes;
    }
    report.success_rate = static_cast<f64>(successes) / count * 100.0;
    report.average_energy_consumption = energy / count;
    report.average_distance = distance / count;
    return report;
}

void MissionTelemetry::replace_history(std::vector<MissionRecord> records) {
    history_ = std::move(records);
}

void MissionTelemetry::clear() {
    active_ = false;
    current_ = ActiveMission{};
    history_.clear();
}

} // namespace rsim::sim
