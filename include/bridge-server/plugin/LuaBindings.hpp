#pragma once
#include "bridge-server/export.h"
#include "bridge-server/registry/CallableRegistry.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <sol/sol.hpp>
#include <string>

namespace bridgesrv {
namespace plugin {

/// Tables nested deeper than this are rejected when converting to JSON
constexpr int kMaxLuaNestingDepth = 64;

/// Convert a Lua value to JSON.
/// Sequences 1..n become arrays, other tables (including empty ones) become
/// objects. Integers and floats stay distinct. Throws std::runtime_error for
/// functions, userdata, threads and over-deep nesting.
BRIDGE_SERVER_API nlohmann::json lua_to_json(const sol::object &value,
                                             int depth = 0);

BRIDGE_SERVER_API sol::object json_to_lua(sol::state_view lua,
                                          const nlohmann::json &value,
                                          int depth = 0);

/// Normalize a Lua assertion return value
BRIDGE_SERVER_API AssertionOutcome lua_assertion_outcome(const sol::object &value);

// Adapters from Lua functions to registry callables. Lua errors are raised
// as std::runtime_error carrying the Lua message.
BRIDGE_SERVER_API FunctionCallable wrap_lua_function(sol::protected_function fn);
BRIDGE_SERVER_API AssertionCallable
wrap_lua_assertion(sol::protected_function fn);
BRIDGE_SERVER_API HookCallable wrap_lua_hook(sol::protected_function fn);

/// The `Registry` userdata a script registers into
class BRIDGE_SERVER_API LuaRegistryHandle {
public:
  LuaRegistryHandle() : registry_(std::make_shared<CallableRegistry>()) {}

  void register_function(const std::string &name, sol::protected_function fn,
                         sol::optional<std::string> description);
  void register_assertion(const std::string &name, sol::protected_function fn,
                          sol::optional<std::string> description);
  void register_hook(const std::string &name, sol::protected_function fn);

  const CallableRegistry &registry() const { return *registry_; }
  void clear() { registry_->clear(); }

private:
  std::shared_ptr<CallableRegistry> registry_;
};

/// Register the Context and Registry usertypes and route print() to the log
BRIDGE_SERVER_API void bind_lua_api(sol::state &lua);

} // namespace plugin
} // namespace bridgesrv
