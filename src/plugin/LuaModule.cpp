#include "bridge-server/plugin/LuaModule.hpp"
#include "bridge-server/Logger.hpp"
#include "bridge-server/plugin/LuaBindings.hpp"

#include <stdexcept>
#include <unordered_map>

namespace bridgesrv {
namespace plugin {

sol::lib lua_library_from_name(const std::string &name) {
  static const std::unordered_map<std::string, sol::lib> libraries = {
      {"base", sol::lib::base},       {"package", sol::lib::package},
      {"coroutine", sol::lib::coroutine}, {"string", sol::lib::string},
      {"os", sol::lib::os},           {"math", sol::lib::math},
      {"table", sol::lib::table},     {"debug", sol::lib::debug},
      {"bit32", sol::lib::bit32},     {"io", sol::lib::io},
      {"utf8", sol::lib::utf8}};

  auto it = libraries.find(name);
  if (it == libraries.end()) {
    throw std::invalid_argument("Unknown Lua library: " + name);
  }
  return it->second;
}

LuaModule::LuaModule(const std::string &script_path,
                     const ModuleOptions &options)
    : module_path_(script_path) {

  LOG_INFO("MODULE", "LOAD", "Loading Lua module: {}", script_path);

  open_libraries(options.lua_libraries);
  bind_lua_api(lua_);

  sol::environment env(lua_, sol::create, lua_.globals());
  env["registry"] = LuaRegistryHandle{};

  auto load_result =
      lua_.safe_script_file(script_path, env, sol::script_pass_on_error);
  if (!load_result.valid()) {
    sol::error err = load_result;
    throw ModuleLoadError(std::string("Lua error: ") + err.what());
  }

  harvest_registry_object(env);
  harvest_containers(env);

  LOG_INFO("MODULE", "LOAD",
           "Lua module loaded: {} ({} functions, {} assertions, {} hooks)",
           script_path, registry_.function_names().size(),
           registry_.assertion_names().size(), registry_.hook_names().size());
}

LuaModule::~LuaModule() { registry_.clear(); }

void LuaModule::open_libraries(const std::vector<std::string> &names) {
  for (const auto &name : names) {
    try {
      lua_.open_libraries(lua_library_from_name(name));
    } catch (const std::invalid_argument &ex) {
      throw ModuleLoadError(ex.what());
    }
  }
}

void LuaModule::harvest_registry_object(sol::environment &env) {
  sol::object reg = env["registry"];
  if (reg.is<LuaRegistryHandle>()) {
    registry_.merge(reg.as<LuaRegistryHandle &>().registry());
  } else if (reg.valid() && reg.get_type() != sol::type::lua_nil) {
    LOG_WARN("MODULE", "LOAD",
             "Global 'registry' is not a Registry object; ignoring it");
  }
}

void LuaModule::harvest_containers(sol::environment &env) {
  // Each entry is either a function or {fn = function, description = "..."}
  auto unpack = [this](const char *container, const sol::object &key,
                       const sol::object &value)
      -> std::pair<std::string, std::pair<sol::protected_function,
                                          std::string>> {
    if (key.get_type() != sol::type::string) {
      throw ModuleLoadError(
          fmt::format("{} in {} has a non-string key", container, module_path_));
    }
    std::string name = key.as<std::string>();

    if (value.get_type() == sol::type::function) {
      return {name, {value.as<sol::protected_function>(), ""}};
    }
    if (value.get_type() == sol::type::table) {
      sol::table entry = value.as<sol::table>();
      sol::object fn = entry["fn"];
      if (fn.get_type() == sol::type::function) {
        std::string description =
            entry.get_or<std::string>("description", std::string());
        return {name, {fn.as<sol::protected_function>(), description}};
      }
    }
    throw ModuleLoadError(fmt::format(
        "{}.{} must be a function or a table with an 'fn' function", container,
        name));
  };

  auto table_of = [&env](const char *container) -> sol::optional<sol::table> {
    sol::object obj = env[container];
    if (obj.get_type() == sol::type::table) {
      return obj.as<sol::table>();
    }
    if (obj.valid() && obj.get_type() != sol::type::lua_nil) {
      LOG_WARN("MODULE", "LOAD", "Global '{}' is not a table; ignoring it",
               container);
    }
    return sol::nullopt;
  };

  if (auto functions = table_of("functions")) {
    for (const auto &kv : *functions) {
      auto [name, entry] = unpack("functions", kv.first, kv.second);
      registry_.register_function(name, wrap_lua_function(entry.first),
                                  entry.second);
    }
  }

  if (auto assertions = table_of("assertions")) {
    for (const auto &kv : *assertions) {
      auto [name, entry] = unpack("assertions", kv.first, kv.second);
      registry_.register_assertion(name, wrap_lua_assertion(entry.first),
                                   entry.second);
    }
  }

  if (auto hooks = table_of("hooks")) {
    for (const auto &kv : *hooks) {
      auto [name, entry] = unpack("hooks", kv.first, kv.second);
      registry_.register_hook(name, wrap_lua_hook(entry.first));
    }
  }
}

} // namespace plugin
} // namespace bridgesrv
