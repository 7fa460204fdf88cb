#pragma once
#include "bridge-server/context/ExecutionContext.hpp"
#include "bridge-server/export.h"
#include "bridge-server/registry/AssertionOutcome.hpp"

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace bridgesrv {

using FunctionCallable = std::function<nlohmann::json(
    const nlohmann::json &args, ExecutionContext &ctx)>;
using AssertionCallable = std::function<AssertionOutcome(
    const nlohmann::json &params, ExecutionContext &ctx)>;
using HookCallable = std::function<void(ExecutionContext &ctx)>;

struct FunctionEntry {
  FunctionCallable fn;
  std::string description;
};

struct AssertionEntry {
  AssertionCallable fn;
  std::string description;
};

/// Name -> callable tables for the functions, assertions and hooks a module
/// contributes. The three namespaces are independent.
///
/// Filled by the module loader; the dispatcher only ever sees it const.
class BRIDGE_SERVER_API CallableRegistry {
public:
  CallableRegistry() = default;

  CallableRegistry(const CallableRegistry &) = delete;
  CallableRegistry &operator=(const CallableRegistry &) = delete;
  CallableRegistry(CallableRegistry &&) = default;
  CallableRegistry &operator=(CallableRegistry &&) = default;

  /// Register a function (replaces any previous entry of the same name)
  void register_function(const std::string &name, FunctionCallable fn,
                         const std::string &description = "");

  /// Register an assertion (replaces any previous entry of the same name)
  void register_assertion(const std::string &name, AssertionCallable fn,
                          const std::string &description = "");

  /// Register a lifecycle hook (replaces any previous entry of the same name)
  void register_hook(const std::string &name, HookCallable fn);

  /// Copy every entry of other into this registry, overwriting names that
  /// already exist
  void merge(const CallableRegistry &other);

  const FunctionEntry *find_function(const std::string &name) const;
  const AssertionEntry *find_assertion(const std::string &name) const;
  const HookCallable *find_hook(const std::string &name) const;

  std::vector<std::string> function_names() const;
  std::vector<std::string> assertion_names() const;
  std::vector<std::string> hook_names() const;

  /// [{name, description}, ...] sorted by name
  nlohmann::json describe_functions() const;
  nlohmann::json describe_assertions() const;

  /// Run an assertion and always produce an outcome: unknown names and
  /// exceptions thrown by the assertion become failed outcomes
  AssertionOutcome evaluate_assertion(const std::string &name,
                                      const nlohmann::json &params,
                                      ExecutionContext &ctx) const;

  bool empty() const;

  /// Drop every entry (must happen before the code behind them is unloaded)
  void clear();

private:
  std::map<std::string, FunctionEntry> functions_;
  std::map<std::string, AssertionEntry> assertions_;
  std::map<std::string, HookCallable> hooks_;
};

/// "a, b, c" or "(none)"
BRIDGE_SERVER_API std::string join_names(const std::vector<std::string> &names);

} // namespace bridgesrv
