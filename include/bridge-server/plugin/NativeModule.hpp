#pragma once
#include "bridge-server/export.h"
#include "bridge-server/plugin/ModuleInterface.hpp"
#include "bridge-server/plugin/ModuleLoader.hpp"

#include <optional>
#include <string>

#ifdef _WIN32
#include <windows.h>
using LibraryHandle = HMODULE;
#else
#include <dlfcn.h>
using LibraryHandle = void *;
#endif

namespace bridgesrv {
namespace plugin {

/// RAII wrapper for a dynamically loaded native module
class BRIDGE_SERVER_API NativeModule : public LoadedModule {
public:
  /// Load module from shared library path and harvest its callables
  explicit NativeModule(const std::string &module_path);

  /// Clears the registry, then unloads the library
  ~NativeModule() override;

  NativeModule(const NativeModule &) = delete;
  NativeModule &operator=(const NativeModule &) = delete;

  ModuleKind kind() const override { return ModuleKind::Native; }
  const std::string &path() const override { return module_path_; }
  const CallableRegistry &registry() const override { return registry_; }

  /// Metadata, if the module exports bridge_module_metadata
  const std::optional<ModuleMetadata> &metadata() const { return metadata_; }

private:
  LibraryHandle handle_{nullptr};
  std::string module_path_;
  std::optional<ModuleMetadata> metadata_;
  CallableRegistry registry_;

  // Function pointers to module symbols (null when not exported)
  decltype(&bridge_module_metadata) fn_metadata_{nullptr};
  decltype(&bridge_module_register) fn_register_{nullptr};
  const FunctionTableEntry *functions_table_{nullptr};
  const AssertionTableEntry *assertions_table_{nullptr};
  const HookTableEntry *hooks_table_{nullptr};

  void load_symbols();
  void check_metadata();
  void harvest();
  void unload();
};

} // namespace plugin
} // namespace bridgesrv
