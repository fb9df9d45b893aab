#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "map/path_planner.hpp"

#include <optional>
#include <string_view>

struct lua_State;

namespace rsim::lua {

class LuaState;

constexpr u32 MAX_GRID_SIZE = 4096;
constexpr u32 MAX_MISSIONS = 1'000'000;

/// Run parameters, read from the global `Mission` table of a config script:
///
///     Mission = {
///         GridSize = 20, Seed = 7, InitialEnergy = 100,
///         Algorithm = "A*", Missions = 3, TelemetryFile = "missions.yaml",
///     }
///
/// Every field is optional. Integers must be whole and non-negative;
/// GridSize and Missions must also fit validate()'s ranges.
struct MissionConfig {
    u32 grid_size = 20;
    std::optional<u64> seed;
    f64 initial_energy = 100.0;
    map::PathAlgorithm algorithm = map::PathAlgorithm::AStar;
    u32 missions = 1;
    fs::path telemetry_file; // empty: do not save
};

/// Check ranges shared by file and command-line input.
Result<void> validate(const MissionConfig& config);

class MissionConfigLoader {
public:
    /// Execute a config script and read its Mission table over `base`.
    Result<MissionConfig> load_file(LuaState& state, const fs::path& path,
                                    MissionConfig base = {});

    /// Same, from an in-memory chunk.
    Result<MissionConfig> load_string(LuaState& state, std::string_view code,
                                      MissionConfig base = {});

private:
    Result<MissionConfig> read_mission_table(lua_State* L,
                                             MissionConfig config);
};

} // namespace rsim::lua
