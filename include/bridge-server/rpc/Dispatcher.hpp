#pragma once
#include "bridge-server/context/ExecutionContext.hpp"
#include "bridge-server/export.h"
#include "bridge-server/registry/CallableRegistry.hpp"
#include "bridge-server/rpc/JsonRpc.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridgesrv {
namespace rpc {

/// Fixed table of protocol methods over a registry and a context.
///
/// Handlers return the `result` member of the response or throw. RpcError
/// keeps its code; any other exception is reported by the caller as
/// SERVER_ERROR.
class BRIDGE_SERVER_API Dispatcher {
public:
  using Handler = std::function<nlohmann::json(const nlohmann::json &params)>;

  Dispatcher(const CallableRegistry &registry, ExecutionContext &context);

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

  /// Run method with params; throws RpcError(METHOD_NOT_FOUND) for unknown
  /// methods
  nlohmann::json dispatch(const std::string &method,
                          const nlohmann::json &params);

  bool has_method(const std::string &method) const;

  /// Sorted method names
  std::vector<std::string> methods() const;

private:
  void register_handlers();

  nlohmann::json handle_fn_call(const nlohmann::json &params);
  nlohmann::json handle_ctx_get(const nlohmann::json &params);
  nlohmann::json handle_ctx_set(const nlohmann::json &params);
  nlohmann::json handle_ctx_clear(const nlohmann::json &params);
  nlohmann::json handle_set_execution_info(const nlohmann::json &params);
  nlohmann::json handle_sync_step_outputs(const nlohmann::json &params);
  nlohmann::json handle_hook_call(const nlohmann::json &params);
  nlohmann::json handle_assert_custom(const nlohmann::json &params);
  nlohmann::json handle_clock_sync(const nlohmann::json &params);
  nlohmann::json handle_registry_info(const nlohmann::json &params);
  nlohmann::json handle_mock_set(const nlohmann::json &params);

  const CallableRegistry &registry_;
  ExecutionContext &context_;
  std::unordered_map<std::string, Handler> handlers_;
  // fn.call overrides installed by mock.set
  std::unordered_map<std::string, nlohmann::json> function_mocks_;
};

} // namespace rpc
} // namespace bridgesrv
