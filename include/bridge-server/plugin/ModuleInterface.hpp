#ifndef BRIDGE_SERVER_MODULE_INTERFACE_HPP
#define BRIDGE_SERVER_MODULE_INTERFACE_HPP

#include "bridge-server/context/ExecutionContext.hpp"
#include "bridge-server/export.h"
#include "bridge-server/registry/CallableRegistry.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>

// API version
#define BRIDGE_MODULE_API_VERSION 1

namespace bridgesrv {
namespace plugin {

/// Function or assertion exported through a declarative table
using ModuleFunction = nlohmann::json (*)(const nlohmann::json &args,
                                          ExecutionContext &ctx);
using ModuleHook = void (*)(ExecutionContext &ctx);

// Table entries. Each exported table ends with an entry whose name is null.
struct FunctionTableEntry {
  const char *name;
  ModuleFunction fn;
  const char *description;
};

/// Assertions return any JSON value; it is normalized with
/// AssertionOutcome::from_value
struct AssertionTableEntry {
  const char *name;
  ModuleFunction fn;
  const char *description;
};

struct HookTableEntry {
  const char *name;
  ModuleHook fn;
};

// Module metadata (returned by bridge_module_metadata)
struct ModuleMetadata {
  uint32_t api_version;
  const char *name;
  const char *version;
};

} // namespace plugin
} // namespace bridgesrv

// Symbols a native module may export. All of them are optional; a module
// that exports none of them contributes nothing.
extern "C" {

/**
 * Module metadata
 * When present the API version must match BRIDGE_MODULE_API_VERSION.
 * Throwing aborts the load.
 */
BRIDGE_MODULE_API bridgesrv::plugin::ModuleMetadata
bridge_module_metadata(void);

/**
 * Explicit registration
 * Called once with the registry being built; may throw to abort the load
 */
BRIDGE_MODULE_API void
bridge_module_register(bridgesrv::CallableRegistry *registry);

/**
 * Declarative tables, merged after bridge_module_register
 * Later entries replace earlier registrations of the same name
 */
extern BRIDGE_MODULE_API const bridgesrv::plugin::FunctionTableEntry
    bridge_module_functions[];
extern BRIDGE_MODULE_API const bridgesrv::plugin::AssertionTableEntry
    bridge_module_assertions[];
extern BRIDGE_MODULE_API const bridgesrv::plugin::HookTableEntry
    bridge_module_hooks[];
}

#endif // BRIDGE_SERVER_MODULE_INTERFACE_HPP
