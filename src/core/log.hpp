#pragma once

#include "core/types.hpp"

#include <spdlog/spdlog.h>

struct lua_State;

namespace rsim::log {

struct LogOptions {
    fs::path file = "roversim.log";
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true; // false: file sink only
};

/// Install the "rsim" logger as the spdlog default.
void init(const LogOptions& options = {});

/// Flush and shutdown logging.
void shutdown();

/// Expose LOG, WARN, SPEW and ALERT to a config script. Each joins its
/// arguments into one line and forwards it at info, warn, debug and error.
void register_script_logging(lua_State* L);

} // namespace rsim::log
