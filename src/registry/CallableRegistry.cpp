#include "bridge-server/registry/CallableRegistry.hpp"
#include "bridge-server/Logger.hpp"
#include <fmt/ranges.h>

namespace bridgesrv {

std::string join_names(const std::vector<std::string> &names) {
  if (names.empty()) {
    return "(none)";
  }
  return fmt::format("{}", fmt::join(names, ", "));
}

void CallableRegistry::register_function(const std::string &name,
                                         FunctionCallable fn,
                                         const std::string &description) {
  if (functions_.count(name)) {
    LOG_DEBUG("REGISTRY", "FUNCTION", "Replacing function: {}", name);
  }
  functions_[name] = FunctionEntry{std::move(fn), description};
}

void CallableRegistry::register_assertion(const std::string &name,
                                          AssertionCallable fn,
                                          const std::string &description) {
  if (assertions_.count(name)) {
    LOG_DEBUG("REGISTRY", "ASSERTION", "Replacing assertion: {}", name);
  }
  assertions_[name] = AssertionEntry{std::move(fn), description};
}

void CallableRegistry::register_hook(const std::string &name,
                                     HookCallable fn) {
  if (hooks_.count(name)) {
    LOG_DEBUG("REGISTRY", "HOOK", "Replacing hook: {}", name);
  }
  hooks_[name] = std::move(fn);
}

void CallableRegistry::merge(const CallableRegistry &other) {
  for (const auto &[name, entry] : other.functions_) {
    functions_[name] = entry;
  }
  for (const auto &[name, entry] : other.assertions_) {
    assertions_[name] = entry;
  }
  for (const auto &[name, hook] : other.hooks_) {
    hooks_[name] = hook;
  }
}

const FunctionEntry *
CallableRegistry::find_function(const std::string &name) const {
  auto it = functions_.find(name);
  if (it == functions_.end()) {
    return nullptr;
  }
  return &it->second;
}

const AssertionEntry *
CallableRegistry::find_assertion(const std::string &name) const {
  auto it = assertions_.find(name);
  if (it == assertions_.end()) {
    return nullptr;
  }
  return &it->second;
}

const HookCallable *CallableRegistry::find_hook(const std::string &name) const {
  auto it = hooks_.find(name);
  if (it == hooks_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> CallableRegistry::function_names() const {
  std::vector<std::string> names;
  names.reserve(functions_.size());
  for (const auto &[name, _] : functions_) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::string> CallableRegistry::assertion_names() const {
  std::vector<std::string> names;
  names.reserve(assertions_.size());
  for (const auto &[name, _] : assertions_) {
    names.push_back(name);
  }
  return names;
}

std::vector<std::string> CallableRegistry::hook_names() const {
  std::vector<std::string> names;
  names.reserve(hooks_.size());
  for (const auto &[name, _] : hooks_) {
    names.push_back(name);
  }
  return names;
}

nlohmann::json CallableRegistry::describe_functions() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &[name, entry] : functions_) {
    list.push_back({{"name", name}, {"description", entry.description}});
  }
  return list;
}

nlohmann::json CallableRegistry::describe_assertions() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &[name, entry] : assertions_) {
    list.push_back({{"name", name}, {"description", entry.description}});
  }
  return list;
}

AssertionOutcome
CallableRegistry::evaluate_assertion(const std::string &name,
                                     const nlohmann::json &params,
                                     ExecutionContext &ctx) const {
  const AssertionEntry *entry = find_assertion(name);
  if (!entry) {
    return AssertionOutcome::failed(
        fmt::format("Assertion not found: {}. Available: {}", name,
                    join_names(assertion_names())));
  }

  try {
    return entry->fn(params, ctx);
  } catch (const std::exception &ex) {
    LOG_WARN("REGISTRY", "ASSERTION", "Assertion '{}' threw: {}", name,
             ex.what());
    return AssertionOutcome::failed(ex.what());
  } catch (...) {
    LOG_WARN("REGISTRY", "ASSERTION", "Assertion '{}' threw a non-standard "
             "exception", name);
    return AssertionOutcome::failed("Unknown error");
  }
}

bool CallableRegistry::empty() const {
  return functions_.empty() && assertions_.empty() && hooks_.empty();
}

void CallableRegistry::clear() {
  functions_.clear();
  assertions_.clear();
  hooks_.clear();
}

} // namespace bridgesrv
