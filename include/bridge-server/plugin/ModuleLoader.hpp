#pragma once
#include "bridge-server/export.h"
#include "bridge-server/registry/CallableRegistry.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace bridgesrv {
namespace plugin {

/// Fatal load-phase failure: the bridge must not start serving
class BRIDGE_SERVER_API ModuleLoadError : public std::runtime_error {
public:
  explicit ModuleLoadError(const std::string &message)
      : std::runtime_error(message) {}
};

enum class ModuleKind { Lua, Native };

BRIDGE_SERVER_API const char *to_string(ModuleKind kind);

struct ModuleOptions {
  /// Lua standard libraries opened for script modules
  std::vector<std::string> lua_libraries{"base", "string", "table", "math"};
};

/// A loaded extension module and the callables harvested from it.
///
/// The module owns its registry so that no callable can outlive the code
/// (Lua state or shared library) it refers to.
class BRIDGE_SERVER_API LoadedModule {
public:
  virtual ~LoadedModule() = default;

  virtual ModuleKind kind() const = 0;
  virtual const std::string &path() const = 0;
  virtual const CallableRegistry &registry() const = 0;
};

/// Resolve path to a module, execute it and build its registry.
/// "*.lua" is run as a Lua script, anything else is opened as a shared
/// library. Throws ModuleLoadError.
BRIDGE_SERVER_API std::unique_ptr<LoadedModule>
load_module(const std::string &path, const ModuleOptions &options = {});

} // namespace plugin
} // namespace bridgesrv
