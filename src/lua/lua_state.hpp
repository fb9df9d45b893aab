#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>

struct lua_State;

namespace rsim::lua {

/// RAII wrapper around a Lua 5.0 state for config scripts.
/// Only the base, table, string and math libraries are opened.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    void set_global_string(const char* name, const char* value);
    void set_global_number(const char* name, f64 value);

    /// Execute a chunk of Lua code. Load and runtime failures are
    /// ScriptError.
    Result<void> do_string(std::string_view code,
                           const char* chunk_name = "=config");

    /// Execute a script file. An unreadable file is IoError.
    Result<void> do_file(const fs::path& path);

private:
    Result<void> run_chunk(const char* buf, size_t len, const char* name);

    lua_State* L_ = nullptr;
};

/// Restores the stack height it saw on construction when it goes out of
/// scope, so early returns need no manual lua_pop bookkeeping.
class StackGuard {
public:
    explicit StackGuard(lua_State* L);
    ~StackGuard();

    StackGuard(const StackGuard&) = delete;
    StackGuard& operator=(const StackGuard&) = delete;

private:
    lua_State* L_;
    int top_;
};

} // namespace rsim::lua
