#include "bridge-server/context/ExecutionContext.hpp"
#include <algorithm>
#include <stdexcept>

namespace bridgesrv {

nlohmann::json ClockState::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  j["virtual_time_ms"] =
      virtual_time_ms ? nlohmann::json(*virtual_time_ms) : nlohmann::json();
  j["virtual_time_iso"] =
      virtual_time_iso ? nlohmann::json(*virtual_time_iso) : nlohmann::json();
  j["frozen"] = frozen;
  return j;
}

static bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() &&
         s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool key_matches_pattern(const std::string &key, const std::string &pattern) {
  if (pattern == "*") {
    return true;
  }

  bool leading = !pattern.empty() && pattern.front() == '*';
  bool trailing = !pattern.empty() && pattern.back() == '*';

  if (leading && trailing && pattern.size() >= 2) {
    // Contains
    std::string substr = pattern.substr(1, pattern.size() - 2);
    return key.find(substr) != std::string::npos;
  }
  if (leading) {
    return ends_with(key, pattern.substr(1));
  }
  if (trailing) {
    return starts_with(key, pattern.substr(0, pattern.size() - 1));
  }
  return key == pattern;
}

std::optional<nlohmann::json>
ExecutionContext::get(const std::string &key) const {
  std::lock_guard lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void ExecutionContext::set(const std::string &key, nlohmann::json value) {
  std::lock_guard lock(mutex_);
  values_[key] = std::move(value);
}

bool ExecutionContext::remove(const std::string &key) {
  std::lock_guard lock(mutex_);
  return values_.erase(key) > 0;
}

bool ExecutionContext::contains(const std::string &key) const {
  std::lock_guard lock(mutex_);
  return values_.count(key) > 0;
}

std::size_t ExecutionContext::clear(const std::string &pattern) {
  std::lock_guard lock(mutex_);

  if (pattern == "*") {
    std::size_t count = values_.size();
    values_.clear();
    return count;
  }

  std::size_t count = 0;
  for (auto it = values_.begin(); it != values_.end();) {
    if (key_matches_pattern(it->first, pattern)) {
      it = values_.erase(it);
      ++count;
    } else {
      ++it;
    }
  }
  return count;
}

std::size_t ExecutionContext::size() const {
  std::lock_guard lock(mutex_);
  return values_.size();
}

std::vector<std::string> ExecutionContext::keys() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  result.reserve(values_.size());
  for (const auto &[key, _] : values_) {
    result.push_back(key);
  }
  std::sort(result.begin(), result.end());
  return result;
}

void ExecutionContext::sync_step_outputs(const std::string &step_id,
                                         const StepOutputs &outputs) {
  std::lock_guard lock(mutex_);
  auto &existing = step_outputs_[step_id];
  for (const auto &[name, value] : outputs) {
    existing[name] = value;
  }
}

std::optional<std::string>
ExecutionContext::get_step_output(const std::string &step_id,
                                  const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto step = step_outputs_.find(step_id);
  if (step == step_outputs_.end()) {
    return std::nullopt;
  }
  auto output = step->second.find(name);
  if (output == step->second.end()) {
    return std::nullopt;
  }
  return output->second;
}

ExecutionContext::StepOutputs
ExecutionContext::get_step_outputs(const std::string &step_id) const {
  std::lock_guard lock(mutex_);
  auto step = step_outputs_.find(step_id);
  if (step == step_outputs_.end()) {
    return {};
  }
  return step->second;
}

void ExecutionContext::set_execution_info(ExecutionInfo info) {
  std::lock_guard lock(mutex_);
  info_ = std::move(info);
}

ExecutionInfo ExecutionContext::execution_info() const {
  std::lock_guard lock(mutex_);
  return info_;
}

std::string ExecutionContext::run_id() const {
  std::lock_guard lock(mutex_);
  return info_.run_id;
}

std::string ExecutionContext::job_name() const {
  std::lock_guard lock(mutex_);
  return info_.job_name;
}

std::string ExecutionContext::step_name() const {
  std::lock_guard lock(mutex_);
  return info_.step_name;
}

void ExecutionContext::set_clock(std::optional<ClockState> clock) {
  if (clock && clock->virtual_time_ms &&
      (*clock->virtual_time_ms > kMaxVirtualTimeMs ||
       *clock->virtual_time_ms < -kMaxVirtualTimeMs)) {
    throw std::out_of_range("virtual time out of range: " +
                            std::to_string(*clock->virtual_time_ms) + " ms");
  }
  std::lock_guard lock(mutex_);
  clock_ = std::move(clock);
}

std::optional<ClockState> ExecutionContext::clock() const {
  std::lock_guard lock(mutex_);
  return clock_;
}

bool ExecutionContext::is_clock_mocked() const {
  std::lock_guard lock(mutex_);
  return clock_ && clock_->virtual_time_ms.has_value();
}

std::chrono::system_clock::time_point ExecutionContext::now() const {
  {
    std::lock_guard lock(mutex_);
    if (clock_ && clock_->virtual_time_ms) {
      return std::chrono::system_clock::time_point(
          std::chrono::milliseconds(*clock_->virtual_time_ms));
    }
  }
  return std::chrono::system_clock::now();
}

int64_t ExecutionContext::now_ms() const {
  {
    std::lock_guard lock(mutex_);
    if (clock_ && clock_->virtual_time_ms) {
      return *clock_->virtual_time_ms;
    }
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             now().time_since_epoch())
      .count();
}

} // namespace bridgesrv
