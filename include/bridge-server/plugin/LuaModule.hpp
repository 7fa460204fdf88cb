#pragma once
#include "bridge-server/export.h"
#include "bridge-server/plugin/ModuleLoader.hpp"

#include <sol/sol.hpp>
#include <string>
#include <vector>

namespace bridgesrv {
namespace plugin {

/// A Lua script module.
///
/// The script runs once, in its own environment, with a `registry` global
/// it can register callables into. Afterwards the `functions`,
/// `assertions` and `hooks` tables it defines are merged on top.
class BRIDGE_SERVER_API LuaModule : public LoadedModule {
public:
  explicit LuaModule(const std::string &script_path,
                     const ModuleOptions &options = {});
  ~LuaModule() override;

  LuaModule(const LuaModule &) = delete;
  LuaModule &operator=(const LuaModule &) = delete;

  ModuleKind kind() const override { return ModuleKind::Lua; }
  const std::string &path() const override { return module_path_; }
  const CallableRegistry &registry() const override { return registry_; }

private:
  void open_libraries(const std::vector<std::string> &names);
  void harvest_registry_object(sol::environment &env);
  void harvest_containers(sol::environment &env);

  std::string module_path_;
  sol::state lua_;
  // Declared after lua_ so it is destroyed before the state closes
  CallableRegistry registry_;
};

/// Map a library name from the configuration to sol::lib; throws
/// std::invalid_argument for unknown names
BRIDGE_SERVER_API sol::lib lua_library_from_name(const std::string &name);

} // namespace plugin
} // namespace bridgesrv
