#include "bridge-server/rpc/Dispatcher.hpp"
#include "bridge-server/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace bridgesrv {
namespace rpc {

using json = nlohmann::json;

namespace {

RpcError invalid_params(const std::string &detail) {
  return RpcError(error_code::INVALID_PARAMS, "Invalid params: " + detail);
}

std::string require_string(const json &params, const char *name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    throw invalid_params(fmt::format("missing '{}'", name));
  }
  if (!it->is_string()) {
    throw invalid_params(fmt::format("'{}' must be a string", name));
  }
  return it->get<std::string>();
}

std::string string_or(const json &params, const char *name,
                      const std::string &fallback) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw invalid_params(fmt::format("'{}' must be a string", name));
  }
  return it->get<std::string>();
}

json value_or(const json &params, const char *name, json fallback) {
  auto it = params.find(name);
  if (it == params.end()) {
    return fallback;
  }
  return *it;
}

// First of the snake_case / camelCase spellings that is present
json::const_iterator find_either(const json &params, const char *name,
                                 const char *alt_name) {
  auto it = params.find(name);
  if (it == params.end()) {
    it = params.find(alt_name);
  }
  return it;
}

} // namespace

Dispatcher::Dispatcher(const CallableRegistry &registry,
                       ExecutionContext &context)
    : registry_(registry), context_(context) {
  register_handlers();
}

void Dispatcher::register_handlers() {
  handlers_["fn.call"] = [this](const json &p) { return handle_fn_call(p); };
  handlers_["ctx.get"] = [this](const json &p) { return handle_ctx_get(p); };
  handlers_["ctx.set"] = [this](const json &p) { return handle_ctx_set(p); };
  handlers_["ctx.clear"] = [this](const json &p) {
    return handle_ctx_clear(p);
  };
  handlers_["ctx.setExecutionInfo"] = [this](const json &p) {
    return handle_set_execution_info(p);
  };
  handlers_["ctx.syncStepOutputs"] = [this](const json &p) {
    return handle_sync_step_outputs(p);
  };
  handlers_["hook.call"] = [this](const json &p) {
    return handle_hook_call(p);
  };
  handlers_["assert.custom"] = [this](const json &p) {
    return handle_assert_custom(p);
  };
  handlers_["list_functions"] = [this](const json &) {
    return json{{"functions", registry_.describe_functions()}};
  };
  handlers_["list_assertions"] = [this](const json &) {
    return json{{"assertions", registry_.describe_assertions()}};
  };
  handlers_["clock.sync"] = [this](const json &p) {
    return handle_clock_sync(p);
  };
  handlers_["registry.info"] = [this](const json &p) {
    return handle_registry_info(p);
  };
  handlers_["mock.set"] = [this](const json &p) { return handle_mock_set(p); };
  handlers_["mock.clear"] = [this](const json &) {
    LOG_DEBUG("DISPATCH", "MOCK", "Clearing {} function mocks",
              function_mocks_.size());
    function_mocks_.clear();
    return json::object();
  };
}

json Dispatcher::dispatch(const std::string &method, const json &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    throw RpcError(error_code::METHOD_NOT_FOUND,
                   "Method not found: " + method);
  }
  return it->second(params);
}

bool Dispatcher::has_method(const std::string &method) const {
  return handlers_.count(method) > 0;
}

std::vector<std::string> Dispatcher::methods() const {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto &[name, _] : handlers_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

json Dispatcher::handle_fn_call(const json &params) {
  std::string name = require_string(params, "name");
  json args = value_or(params, "args", nullptr);

  auto mock = function_mocks_.find(name);
  if (mock != function_mocks_.end()) {
    LOG_DEBUG("DISPATCH", "FN_CALL", "Returning mocked result for {}", name);
    return json{{"result", mock->second}};
  }

  const FunctionEntry *entry = registry_.find_function(name);
  if (!entry) {
    throw RpcError(error_code::SERVER_ERROR,
                   fmt::format("Function not found: {}. Available: {}", name,
                               join_names(registry_.function_names())));
  }

  return json{{"result", entry->fn(args, context_)}};
}

json Dispatcher::handle_ctx_get(const json &params) {
  std::string key = require_string(params, "key");
  auto value = context_.get(key);
  return json{{"value", value ? *value : json(nullptr)}};
}

json Dispatcher::handle_ctx_set(const json &params) {
  std::string key = require_string(params, "key");
  context_.set(key, value_or(params, "value", nullptr));
  return json::object();
}

json Dispatcher::handle_ctx_clear(const json &params) {
  std::string pattern = string_or(params, "pattern", "*");
  std::size_t cleared = context_.clear(pattern);
  LOG_DEBUG("DISPATCH", "CTX", "Cleared {} keys matching '{}'", cleared,
            pattern);
  return json{{"cleared", cleared}};
}

json Dispatcher::handle_set_execution_info(const json &params) {
  ExecutionInfo info;
  info.run_id = string_or(params, "runId", "");
  info.job_name = string_or(params, "jobName", "");
  info.step_name = string_or(params, "stepName", "");
  context_.set_execution_info(std::move(info));
  return json::object();
}

json Dispatcher::handle_sync_step_outputs(const json &params) {
  std::string step_id = require_string(params, "stepId");
  json outputs = value_or(params, "outputs", json::object());
  if (outputs.is_null()) {
    outputs = json::object();
  }
  if (!outputs.is_object()) {
    throw invalid_params("'outputs' must be an object");
  }

  ExecutionContext::StepOutputs converted;
  for (auto it = outputs.begin(); it != outputs.end(); ++it) {
    if (it->is_null()) {
      continue;
    }
    converted[it.key()] =
        it->is_string() ? it->get<std::string>() : dump_compact(*it);
  }

  context_.sync_step_outputs(step_id, converted);
  return json::object();
}

json Dispatcher::handle_hook_call(const json &params) {
  std::string hook = require_string(params, "hook");
  const HookCallable *fn = registry_.find_hook(hook);
  if (!fn) {
    LOG_DEBUG("DISPATCH", "HOOK", "No hook registered for {}", hook);
    return json::object();
  }
  (*fn)(context_);
  return json::object();
}

json Dispatcher::handle_assert_custom(const json &params) {
  std::string name = require_string(params, "name");
  json assertion_params = value_or(params, "params", json::object());
  if (assertion_params.is_null()) {
    assertion_params = json::object();
  }
  return registry_.evaluate_assertion(name, assertion_params, context_)
      .to_json();
}

json Dispatcher::handle_clock_sync(const json &params) {
  ClockState clock;

  auto ms = find_either(params, "virtual_time_ms", "virtualTimeMs");
  if (ms != params.end() && !ms->is_null()) {
    if (ms->is_number_unsigned()) {
      if (ms->get<uint64_t>() > static_cast<uint64_t>(kMaxVirtualTimeMs)) {
        throw invalid_params("'virtual_time_ms' out of range");
      }
      clock.virtual_time_ms = static_cast<int64_t>(ms->get<uint64_t>());
    } else if (ms->is_number_integer()) {
      clock.virtual_time_ms = ms->get<int64_t>();
    } else if (ms->is_number_float()) {
      double value = ms->get<double>();
      if (!std::isfinite(value) ||
          std::fabs(value) > static_cast<double>(kMaxVirtualTimeMs)) {
        throw invalid_params("'virtual_time_ms' out of range");
      }
      clock.virtual_time_ms = std::llround(value);
    } else {
      throw invalid_params("'virtual_time_ms' must be a number");
    }
    if (*clock.virtual_time_ms > kMaxVirtualTimeMs ||
        *clock.virtual_time_ms < -kMaxVirtualTimeMs) {
      throw invalid_params("'virtual_time_ms' out of range");
    }
  }

  auto iso = find_either(params, "virtual_time_iso", "virtualTimeIso");
  if (iso != params.end() && !iso->is_null()) {
    if (!iso->is_string()) {
      throw invalid_params("'virtual_time_iso' must be a string");
    }
    clock.virtual_time_iso = iso->get<std::string>();
  }

  auto frozen = params.find("frozen");
  if (frozen != params.end() && !frozen->is_null()) {
    if (!frozen->is_boolean()) {
      throw invalid_params("'frozen' must be a boolean");
    }
    clock.frozen = frozen->get<bool>();
  }

  LOG_DEBUG("DISPATCH", "CLOCK", "Clock synced: {}",
            dump_compact(clock.to_json()));
  context_.set_clock(std::move(clock));
  return json::object();
}

json Dispatcher::handle_registry_info(const json &) {
  return json{{"functions", registry_.function_names()},
              {"assertions", registry_.assertion_names()},
              {"hooks", registry_.hook_names()}};
}

json Dispatcher::handle_mock_set(const json &params) {
  std::string target = require_string(params, "target");
  function_mocks_[target] = value_or(params, "value", nullptr);
  LOG_DEBUG("DISPATCH", "MOCK", "Mocked function {}", target);
  return json::object();
}

} // namespace rpc
} // namespace bridgesrv
