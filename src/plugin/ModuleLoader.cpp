#include "bridge-server/plugin/ModuleLoader.hpp"
#include "bridge-server/Logger.hpp"
#include "bridge-server/plugin/LuaModule.hpp"
#include "bridge-server/plugin/NativeModule.hpp"

#include <filesystem>

namespace bridgesrv {
namespace plugin {

const char *to_string(ModuleKind kind) {
  switch (kind) {
  case ModuleKind::Lua:
    return "lua";
  case ModuleKind::Native:
    return "native";
  }
  return "unknown";
}

std::unique_ptr<LoadedModule> load_module(const std::string &path,
                                          const ModuleOptions &options) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (path.empty() || !fs::is_regular_file(path, ec)) {
    throw ModuleLoadError("Module not found: " + path);
  }

  std::string resolved = fs::absolute(path, ec).string();
  if (ec) {
    resolved = path;
  }
  LOG_DEBUG("MODULE", "RESOLVE", "Resolved module path: {}", resolved);

  if (fs::path(resolved).extension() == ".lua") {
    return std::make_unique<LuaModule>(resolved, options);
  }
  return std::make_unique<NativeModule>(resolved);
}

} // namespace plugin
} // namespace bridgesrv
