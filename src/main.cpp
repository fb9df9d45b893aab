#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/lua_state.hpp"
#include "lua/mission_config.hpp"
#include "map/path_planner.hpp"
#include "sim/mission_controller.hpp"
#include "sim/mission_telemetry.hpp"
#include "sim/telemetry_archive.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

struct CliOptions {
    rsim::fs::path config_file;
    rsim::fs::path load_file;
    rsim::log::LogOptions log;
    rsim::lua::MissionConfig overrides;
    // Which fields of `overrides` were given on the command line
    bool has_size = false;
    bool has_seed = false;
    bool has_energy = false;
    bool has_algorithm = false;
    bool has_missions = false;
    bool has_save = false;
    bool help = false;
};

static void print_usage() {
    std::cout << "RoverSim v" << rsim::VERSION << "\n"
              << "Headless rover traversal simulator\n\n"
              << "Usage:\n"
              << "  roversim [options]\n\n"
              << "Options:\n"
              << "  --config <path>     Lua mission config (Mission = {...})\n"
              << "  --size <n>          Grid size, at least 10 (default: 20)\n"
              << "  --seed <n>          Terrain seed (default: random)\n"
              << "  --energy <x>        Initial rover energy (default: 100)\n"
              << "  --algorithm <name>  A*, Dijkstra or EnergyEfficient\n"
              << "  --missions <n>      Missions to run back to back (default: 1)\n"
              << "  --save <path>       Write mission history as YAML\n"
              << "  --load <path>       Load earlier history before running\n"
              << "  --log <path>        Log file (default: roversim.log)\n"
              << "  --verbose           Log planner and generator detail\n"
              << "  --quiet             Log to the file only\n"
              << "  --help              Show this help message\n";
}

static bool parse_u64(const char* text, rsim::u64& out) {
    char* end = nullptr;
    unsigned long long val = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || text[0] == '-') return false;
    out = static_cast<rsim::u64>(val);
    return true;
}

static rsim::Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    auto bad_value = [](const char* flag, const char* value) {
        return rsim::Error(rsim::ErrorCode::InvalidArgument,
                           std::string("Invalid ") + flag + " value: " + value);
    };

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;
        rsim::u64 number = 0;

        if (std::strcmp(arg, "--help") == 0) {
            opts.help = true;
        } else if (std::strcmp(arg, "--config") == 0 && has_value) {
            opts.config_file = argv[++i];
        } else if (std::strcmp(arg, "--load") == 0 && has_value) {
            opts.load_file = argv[++i];
        } else if (std::strcmp(arg, "--save") == 0 && has_value) {
            opts.overrides.telemetry_file = argv[++i];
            opts.has_save = true;
        } else if (std::strcmp(arg, "--log") == 0 && has_value) {
            opts.log.file = argv[++i];
        } else if (std::strcmp(arg, "--verbose") == 0) {
            opts.log.level = spdlog::level::debug;
        } else if (std::strcmp(arg, "--quiet") == 0) {
            opts.log.console = false;
        } else if (std::strcmp(arg, "--size") == 0 && has_value) {
            if (!parse_u64(argv[++i], number) ||
                number > rsim::lua::MAX_GRID_SIZE)
                return bad_value(arg, argv[i]);
            opts.overrides.grid_size = static_cast<rsim::u32>(number);
            opts.has_size = true;
        } else if (std::strcmp(arg, "--seed") == 0 && has_value) {
            if (!parse_u64(argv[++i], number)) return bad_value(arg, argv[i]);
            opts.overrides.seed = number;
            opts.has_seed = true;
        } else if (std::strcmp(arg, "--missions") == 0 && has_value) {
            if (!parse_u64(argv[++i], number) ||
                number > rsim::lua::MAX_MISSIONS)
                return bad_value(arg, argv[i]);
            opts.overrides.missions = static_cast<rsim::u32>(number);
            opts.has_missions = true;
        } else if (std::strcmp(arg, "--energy") == 0 && has_value) {
            char* end = nullptr;
            double val = std::strtod(argv[++i], &end);
            if (end == argv[i] || *end != '\0') return bad_value(arg, argv[i]);
            opts.overrides.initial_energy = val;
            opts.has_energy = true;
        } else if (std::strcmp(arg, "--algorithm") == 0 && has_value) {
            auto algorithm = rsim::map::parse_algorithm(argv[++i]);
            if (!algorithm) return algorithm.error();
            opts.overrides.algorithm = algorithm.value();
            opts.has_algorithm = true;
        } else {
            return rsim::Error(rsim::ErrorCode::InvalidArgument,
                               std::string("Unknown or incomplete option: ") +
                                   arg);
        }
    }
    return opts;
}

/// Command-line values win over the config file.
static rsim::lua::MissionConfig merge(rsim::lua::MissionConfig config,
                                      const CliOptions& opts) {
    const auto& o = opts.overrides;
    if (opts.has_size) config.grid_size = o.grid_size;
    if (opts.has_seed) config.seed = o.seed;
    if (opts.has_energy) config.initial_energy = o.initial_energy;
    if (opts.has_algorithm) config.algorithm = o.algorithm;
    if (opts.has_missions) config.missions = o.missions;
    if (opts.has_save) config.telemetry_file = o.telemetry_file;
    return config;
}

static void report(const rsim::sim::MissionTelemetry& telemetry) {
    auto metrics = telemetry.performance_metrics();
    spdlog::info("=== Mission report ===");
    spdlog::info("  Missions:            {}", metrics.total_missions);
    spdlog::info("  Success rate:        {:.1f}%", metrics.success_rate);
    spdlog::info("  Avg energy per step: {:.2f}", metrics.avg_energy_per_step);
    spdlog::info("  Avg distance:        {:.1f}", metrics.avg_mission_distance);
    spdlog::info("  Longest mission:     {}", metrics.longest_mission);
    if (metrics.most_efficient_mission) {
        spdlog::info("  Most efficient:      mission {}",
                     *metrics.most_efficient_mission);
    }
}

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (parsed && parsed.value().help) {
        print_usage();
        return 0;
    }

    rsim::log::init(parsed ? parsed.value().log : rsim::log::LogOptions{});

    if (!parsed) {
        spdlog::error("{}", parsed.error().describe());
        print_usage();
        rsim::log::shutdown();
        return 1;
    }
    const CliOptions& opts = parsed.value();

    rsim::lua::MissionConfig config;
    if (!opts.config_file.empty()) {
        rsim::lua::LuaState state;
        rsim::lua::MissionConfigLoader loader;
        auto loaded = loader.load_file(state, opts.config_file);
        if (!loaded) {
            spdlog::error("Config error: {}", loaded.error().describe());
            rsim::log::shutdown();
            return 1;
        }
        config = loaded.value();
    }
    config = merge(std::move(config), opts);

    auto valid = rsim::lua::validate(config);
    if (!valid) {
        spdlog::error("{}", valid.error().describe());
        rsim::log::shutdown();
        return 1;
    }

    rsim::sim::MissionTelemetry telemetry;
    if (!opts.load_file.empty()) {
        auto history = rsim::sim::load_missions(opts.load_file);
        if (!history) {
            spdlog::error("{}", history.error().describe());
            rsim::log::shutdown();
            return 1;
        }
        telemetry.replace_history(std::move(history.value()));
    }

    rsim::sim::ControllerSettings settings;
    settings.grid_size = config.grid_size;
    settings.seed = config.seed;
    settings.initial_energy = config.initial_energy;
    settings.algorithm = config.algorithm;
    rsim::sim::MissionController controller(settings, telemetry);

    spdlog::info("Running {} mission(s): {}x{} grid, energy {:.1f}, {}",
                 config.missions, config.grid_size, config.grid_size,
                 config.initial_energy,
                 rsim::map::algorithm_name(config.algorithm));

    // Each step visits a new cell, so a plan never exceeds N*N cells
    const rsim::u32 max_ticks = config.grid_size * config.grid_size + 1;

    for (rsim::u32 m = 0; m < config.missions; ++m) {
        auto reset = controller.reset();
        if (!reset) {
            spdlog::error("Reset failed: {}", reset.error().message);
            rsim::log::shutdown();
            return 1;
        }
        if (!controller.rover().has_path()) {
            spdlog::warn("Mission {} skipped: no path on seed {}",
                         controller.mission_id(), controller.current_seed());
            continue;
        }
        auto ticks = controller.run_to_completion(max_ticks);
        if (!ticks) {
            spdlog::error("Mission failed to start: {}",
                          ticks.error().message);
            rsim::log::shutdown();
            return 1;
        }
    }

    report(telemetry);

    if (!config.telemetry_file.empty()) {
        auto saved =
            rsim::sim::save_missions(config.telemetry_file, telemetry.history());
        if (!saved) {
            spdlog::error("{}", saved.error().describe());
            rsim::log::shutdown();
            return 1;
        }
    }

    rsim::log::shutdown();
    return 0;
}
