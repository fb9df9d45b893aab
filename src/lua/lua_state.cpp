#include "lua/lua_state.hpp"

#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace rsim::lua {

/// Pop the error object left by a failed load or call.
static Error pop_script_error(lua_State* L, const char* chunk) {
    const char* msg = lua_tostring(L, -1);
    std::string text = msg ? msg : std::string("error in ") + chunk;
    lua_pop(L, 1);
    return Error(ErrorCode::ScriptError, std::move(text));
}

LuaState::LuaState() {
    L_ = lua_open();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    luaopen_base(L_);
    luaopen_table(L_);
    luaopen_string(L_);
    luaopen_math(L_);
    lua_settop(L_, 0);
}

LuaState::~LuaState() {
    if (L_) lua_close(L_);
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

Result<void> LuaState::do_string(std::string_view code,
                                 const char* chunk_name) {
    return run_chunk(code.data(), code.size(), chunk_name);
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error(ErrorCode::IoError,
                     "Failed to open script: " + path.string());
    }
    std::string source((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error(ErrorCode::IoError,
                     "Failed to read script: " + path.string());
    }

    const std::string chunk = "@" + path.string();
    return run_chunk(source.data(), source.size(), chunk.c_str());
}

Result<void> LuaState::run_chunk(const char* buf, size_t len,
                                 const char* name) {
    if (!L_) return Error(ErrorCode::ScriptError, "Lua state not available");

    // Skip a UTF-8 BOM
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    if (luaL_loadbuffer(L_, buf, len, name) != 0) {
        return pop_script_error(L_, name);
    }
    if (lua_pcall(L_, 0, 0, 0) != 0) {
        return pop_script_error(L_, name);
    }
    return {};
}

StackGuard::StackGuard(lua_State* L) : L_(L), top_(lua_gettop(L)) {}

StackGuard::~StackGuard() {
    lua_settop(L_, top_);
}

} // namespace rsim::lua
