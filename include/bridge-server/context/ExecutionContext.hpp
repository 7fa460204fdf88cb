#pragma once
#include "bridge-server/export.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridgesrv {

/// Largest virtual time, in either direction, that a system_clock
/// time_point can hold
constexpr int64_t kMaxVirtualTimeMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::duration::max())
        .count();

/// Virtual clock override pushed by the orchestrator (clock.sync)
struct ClockState {
  std::optional<int64_t> virtual_time_ms;
  std::optional<std::string> virtual_time_iso;
  bool frozen{false};

  nlohmann::json to_json() const;
};

/// Identity of the run/job/step currently being executed
struct ExecutionInfo {
  std::string run_id;
  std::string job_name;
  std::string step_name;
};

/// Match a context key against a clear() pattern.
///
///   "*"         every key
///   "*substr*"  keys containing substr
///   "*suffix"   keys ending with suffix
///   "prefix*"   keys starting with prefix
///   otherwise   exact key only
BRIDGE_SERVER_API bool key_matches_pattern(const std::string &key,
                                           const std::string &pattern);

/// State shared by every call dispatched during the lifetime of the bridge.
///
/// Every operation takes the internal lock for its whole duration, so a
/// clear() is never observed half-done. No lock is held while user code
/// runs; callables may call back into the context freely.
class BRIDGE_SERVER_API ExecutionContext {
public:
  using StepOutputs = std::map<std::string, std::string>;

  ExecutionContext() = default;

  ExecutionContext(const ExecutionContext &) = delete;
  ExecutionContext &operator=(const ExecutionContext &) = delete;

  /// Stored value, or std::nullopt if the key was never set (a stored
  /// JSON null is returned as a value)
  std::optional<nlohmann::json> get(const std::string &key) const;

  void set(const std::string &key, nlohmann::json value);

  /// Returns true if the key existed
  bool remove(const std::string &key);

  bool contains(const std::string &key) const;

  /// Remove every key matching pattern, returns the number removed
  std::size_t clear(const std::string &pattern = "*");

  std::size_t size() const;

  /// Sorted snapshot of the current keys
  std::vector<std::string> keys() const;

  /// Merge outputs into the step's existing set, creating it if needed
  void sync_step_outputs(const std::string &step_id,
                         const StepOutputs &outputs);

  std::optional<std::string> get_step_output(const std::string &step_id,
                                             const std::string &name) const;

  /// All outputs recorded for a step (empty if the step is unknown)
  StepOutputs get_step_outputs(const std::string &step_id) const;

  void set_execution_info(ExecutionInfo info);
  ExecutionInfo execution_info() const;

  std::string run_id() const;
  std::string job_name() const;
  std::string step_name() const;

  /// Replace the clock override wholesale; std::nullopt removes it.
  /// Throws std::out_of_range if virtual_time_ms exceeds kMaxVirtualTimeMs.
  void set_clock(std::optional<ClockState> clock);
  std::optional<ClockState> clock() const;

  /// True iff a clock override with a virtual time is active
  bool is_clock_mocked() const;

  /// Virtual time when the clock is mocked, wall-clock time otherwise
  std::chrono::system_clock::time_point now() const;

  /// now() as milliseconds since the Unix epoch
  int64_t now_ms() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, nlohmann::json> values_;
  std::unordered_map<std::string, StepOutputs> step_outputs_;
  ExecutionInfo info_;
  std::optional<ClockState> clock_;
};

} // namespace bridgesrv
