#include "lua/mission_config.hpp"
#include "lua/lua_state.hpp"
#include "core/log.hpp"
#include "map/terrain_generator.hpp"

#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>
#include <string>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rsim::lua {

static Error field_error(const char* key, const char* expected) {
    return Error(ErrorCode::InvalidArgument,
                 std::string("Mission.") + key + " must be " + expected);
}

/// Push Mission[key]. The Mission table must be on top of the stack.
static void push_field(lua_State* L, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, -2);
}

static Result<std::optional<f64>> read_number(lua_State* L, const char* key) {
    StackGuard guard(L);
    push_field(L, key);
    if (lua_isnil(L, -1)) return std::optional<f64>{};
    if (lua_type(L, -1) != LUA_TNUMBER) return field_error(key, "a number");
    return std::optional<f64>{lua_tonumber(L, -1)};
}

/// Read an optional whole number no larger than max.
static Result<std::optional<u64>> read_integer(lua_State* L, const char* key,
                                               u64 max) {
    auto number = read_number(L, key);
    if (!number) return number.error();
    if (!number.value()) return std::optional<u64>{};

    // 2^64, the first double a u64 cannot hold
    constexpr f64 U64_LIMIT = 18446744073709551616.0;
    const f64 v = *number.value();
    if (v < 0 || std::floor(v) != v) {
        return field_error(key, "a non-negative integer");
    }
    if (v >= U64_LIMIT || static_cast<u64>(v) > max) {
        return Error(ErrorCode::InvalidArgument,
                     std::string("Mission.") + key + " must be at most " +
                         std::to_string(max));
    }
    return std::optional<u64>{static_cast<u64>(v)};
}

static Result<std::optional<std::string>> read_string(lua_State* L,
                                                      const char* key) {
    StackGuard guard(L);
    push_field(L, key);
    if (lua_isnil(L, -1)) return std::optional<std::string>{};
    if (lua_type(L, -1) != LUA_TSTRING) return field_error(key, "a string");
    return std::optional<std::string>{
        std::string(lua_tostring(L, -1), lua_strlen(L, -1))};
}

Result<void> validate(const MissionConfig& config) {
    if (config.grid_size < map::MIN_GENERATED_SIZE ||
        config.grid_size > MAX_GRID_SIZE) {
        return Error(ErrorCode::InvalidArgument,
                     "Grid size must be between " +
                         std::to_string(map::MIN_GENERATED_SIZE) + " and " +
                         std::to_string(MAX_GRID_SIZE));
    }
    if (!(config.initial_energy > 0.0)) {
        return Error(ErrorCode::InvalidArgument,
                     "Initial energy must be positive");
    }
    if (config.missions < 1 || config.missions > MAX_MISSIONS) {
        return Error(ErrorCode::InvalidArgument,
                     "Mission count must be between 1 and " +
                         std::to_string(MAX_MISSIONS));
    }
    return {};
}

Result<MissionConfig> MissionConfigLoader::load_file(LuaState& state,
                                                     const fs::path& path,
                                                     MissionConfig base) {
    log::register_script_logging(state.raw());
    spdlog::info("Loading mission config: {}", path.string());

    auto result = state.do_file(path);
    if (!result) {
        return Error(result.error().code,
                     "Failed to execute config: " + result.error().message);
    }
    return read_mission_table(state.raw(), std::move(base));
}

Result<MissionConfig> MissionConfigLoader::load_string(LuaState& state,
                                                       std::string_view code,
                                                       MissionConfig base) {
    log::register_script_logging(state.raw());
    auto result = state.do_string(code);
    if (!result) {
        return Error(result.error().code,
                     "Failed to execute config: " + result.error().message);
    }
    return read_mission_table(state.raw(), std::move(base));
}

Result<MissionConfig> MissionConfigLoader::read_mission_table(
    lua_State* L, MissionConfig config) {
    StackGuard guard(L);

    lua_getglobal(L, "Mission");
    if (lua_isnil(L, -1)) {
        spdlog::warn("Config defines no Mission table, using defaults");
        return config;
    }
    if (!lua_istable(L, -1)) {
        return Error(ErrorCode::InvalidArgument,
                     "'Mission' global is not a table");
    }

    auto grid_size = read_integer(L, "GridSize", MAX_GRID_SIZE);
    if (!grid_size) return grid_size.error();
    if (grid_size.value()) {
        config.grid_size = static_cast<u32>(*grid_size.value());
    }

    auto seed = read_integer(L, "Seed", std::numeric_limits<u64>::max());
    if (!seed) return seed.error();
    if (seed.value()) config.seed = *seed.value();

    auto missions = read_integer(L, "Missions", MAX_MISSIONS);
    if (!missions) return missions.error();
    if (missions.value()) {
        config.missions = static_cast<u32>(*missions.value());
    }

    auto energy = read_number(L, "InitialEnergy");
    if (!energy) return energy.error();
    if (energy.value()) config.initial_energy = *energy.value();

    auto algorithm_name = read_string(L, "Algorithm");
    if (!algorithm_name) return algorithm_name.error();
    if (algorithm_name.value()) {
        auto algorithm = map::parse_algorithm(*algorithm_name.value());
        if (!algorithm) return algorithm.error();
        config.algorithm = algorithm.value();
    }

    auto telemetry_file = read_string(L, "TelemetryFile");
    if (!telemetry_file) return telemetry_file.error();
    if (telemetry_file.value()) config.telemetry_file = *telemetry_file.value();

    auto valid = validate(config);
    if (!valid) return valid.error();
    return config;
}

} // namespace rsim::lua
