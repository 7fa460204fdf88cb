#include "bridge-server/plugin/NativeModule.hpp"
#include "bridge-server/Logger.hpp"

namespace bridgesrv {
namespace plugin {

#ifdef _WIN32
#define LOAD_LIBRARY(path) LoadLibraryA(path)
#define GET_SYMBOL(handle, name) GetProcAddress(handle, name)
#define CLOSE_LIBRARY(handle) FreeLibrary(handle)
#define LIBRARY_ERROR() "Windows LoadLibrary error"
#else
#define LOAD_LIBRARY(path) dlopen(path, RTLD_NOW | RTLD_LOCAL)
#define GET_SYMBOL(handle, name) dlsym(handle, name)
#define CLOSE_LIBRARY(handle) dlclose(handle)
#define LIBRARY_ERROR() dlerror()
#endif

NativeModule::NativeModule(const std::string &module_path)
    : module_path_(module_path) {

  LOG_INFO("MODULE", "LOAD", "Loading native module: {}", module_path);

  handle_ = LOAD_LIBRARY(module_path.c_str());

  if (!handle_) {
    const char *reason = LIBRARY_ERROR();
    throw ModuleLoadError(std::string("Failed to load library: ") +
                          (reason ? reason : module_path));
  }

  try {
    load_symbols();
    check_metadata();
    harvest();
  } catch (...) {
    registry_.clear();
    unload();
    throw;
  }

  LOG_INFO("MODULE", "LOAD",
           "Native module loaded: {} ({} functions, {} assertions, {} hooks)",
           module_path, registry_.function_names().size(),
           registry_.assertion_names().size(), registry_.hook_names().size());
}

NativeModule::~NativeModule() {
  registry_.clear();
  unload();
}

void NativeModule::load_symbols() {
  fn_metadata_ = reinterpret_cast<decltype(fn_metadata_)>(
      GET_SYMBOL(handle_, "bridge_module_metadata"));

  fn_register_ = reinterpret_cast<decltype(fn_register_)>(
      GET_SYMBOL(handle_, "bridge_module_register"));

  functions_table_ = reinterpret_cast<const FunctionTableEntry *>(
      GET_SYMBOL(handle_, "bridge_module_functions"));

  assertions_table_ = reinterpret_cast<const AssertionTableEntry *>(
      GET_SYMBOL(handle_, "bridge_module_assertions"));

  hooks_table_ = reinterpret_cast<const HookTableEntry *>(
      GET_SYMBOL(handle_, "bridge_module_hooks"));
}

void NativeModule::check_metadata() {
  if (!fn_metadata_) {
    return;
  }

  ModuleMetadata meta{};
  try {
    meta = fn_metadata_();
  } catch (const std::exception &ex) {
    throw ModuleLoadError(fmt::format("Module metadata failed in {}: {}",
                                      module_path_, ex.what()));
  } catch (...) {
    throw ModuleLoadError(fmt::format(
        "Module metadata failed in {}: Unknown error", module_path_));
  }
  if (meta.api_version != BRIDGE_MODULE_API_VERSION) {
    throw ModuleLoadError(fmt::format(
        "Module API version mismatch in {}: module has {}, expected {}",
        module_path_, meta.api_version, BRIDGE_MODULE_API_VERSION));
  }

  LOG_DEBUG("MODULE", "LOAD", "Module metadata: name={} version={}",
            meta.name ? meta.name : "", meta.version ? meta.version : "");
  metadata_ = meta;
}

void NativeModule::harvest() {
  if (fn_register_) {
    try {
      fn_register_(&registry_);
    } catch (const std::exception &ex) {
      throw ModuleLoadError(fmt::format(
          "Module registration failed in {}: {}", module_path_, ex.what()));
    } catch (...) {
      throw ModuleLoadError(fmt::format(
          "Module registration failed in {}: Unknown error", module_path_));
    }
  }

  if (functions_table_) {
    for (const FunctionTableEntry *e = functions_table_; e->name; ++e) {
      if (!e->fn) {
        LOG_WARN("MODULE", "LOAD", "Skipping function '{}' with no callable",
                 e->name);
        continue;
      }
      ModuleFunction fn = e->fn;
      registry_.register_function(
          e->name,
          [fn](const nlohmann::json &args, ExecutionContext &ctx) {
            return fn(args, ctx);
          },
          e->description ? e->description : "");
    }
  }

  if (assertions_table_) {
    for (const AssertionTableEntry *e = assertions_table_; e->name; ++e) {
      if (!e->fn) {
        LOG_WARN("MODULE", "LOAD", "Skipping assertion '{}' with no callable",
                 e->name);
        continue;
      }
      ModuleFunction fn = e->fn;
      registry_.register_assertion(
          e->name,
          [fn](const nlohmann::json &params, ExecutionContext &ctx) {
            return AssertionOutcome::from_value(fn(params, ctx));
          },
          e->description ? e->description : "");
    }
  }

  if (hooks_table_) {
    for (const HookTableEntry *e = hooks_table_; e->name; ++e) {
      if (!e->fn) {
        LOG_WARN("MODULE", "LOAD", "Skipping hook '{}' with no callable",
                 e->name);
        continue;
      }
      ModuleHook fn = e->fn;
      registry_.register_hook(e->name, [fn](ExecutionContext &ctx) { fn(ctx); });
    }
  }
}

void NativeModule::unload() {
  if (handle_) {
    LOG_DEBUG("MODULE", "UNLOAD", "Unloading native module: {}", module_path_);
    CLOSE_LIBRARY(handle_);
    handle_ = nullptr;
  }
}

} // namespace plugin
} // namespace bridgesrv
