#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rsim::log {

/// Join all script arguments the way print() would, without separators.
static std::string join_args(lua_State* L) {
    const int n = lua_gettop(L);
    std::string line;
    for (int i = 1; i <= n; ++i) {
        switch (lua_type(L, i)) {
        case LUA_TSTRING:
        case LUA_TNUMBER:
            line += lua_tostring(L, i);
            break;
        case LUA_TNIL:
            line += "nil";
            break;
        case LUA_TBOOLEAN:
            line += lua_toboolean(L, i) ? "true" : "false";
            break;
        default:
            line += lua_typename(L, lua_type(L, i));
            break;
        }
    }
    return line;
}

template <spdlog::level::level_enum Level>
static int forward(lua_State* L) {
    spdlog::log(Level, "[config] {}", join_args(L));
    return 0;
}

struct ScriptLogFunction {
    const char* name;
    lua_CFunction fn;
};

static constexpr ScriptLogFunction SCRIPT_LOG_FUNCTIONS[] = {
    {"LOG", forward<spdlog::level::info>},
    {"WARN", forward<spdlog::level::warn>},
    {"SPEW", forward<spdlog::level::debug>},
    {"ALERT", forward<spdlog::level::err>},
};

void init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.file.string(), true));

    auto logger =
        std::make_shared<spdlog::logger>("rsim", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::info("RoverSim v{}", VERSION);
}

void shutdown() {
    spdlog::shutdown();
}

void register_script_logging(lua_State* L) {
    for (const auto& f : SCRIPT_LOG_FUNCTIONS) {
        lua_register(L, f.name, f.fn);
    }
}

} // namespace rsim::log
