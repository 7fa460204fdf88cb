#pragma once
#include "bridge-server/export.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bridgesrv {

/// Result of a custom assertion. Failure is an outcome, not an error.
struct BRIDGE_SERVER_API AssertionOutcome {
  bool success{false};
  std::optional<std::string> message;
  std::optional<nlohmann::json> actual;
  std::optional<nlohmann::json> expected;

  static AssertionOutcome passed(std::optional<std::string> message = {});
  static AssertionOutcome failed(std::string message,
                                 std::optional<nlohmann::json> actual = {},
                                 std::optional<nlohmann::json> expected = {});

  /// Normalize an arbitrary value returned by an assertion:
  /// an object supplies {success (default true), message, actual,
  /// expected}; a boolean is the success flag; anything else counts by
  /// truthiness.
  static AssertionOutcome from_value(const nlohmann::json &value);

  /// {success, message?, actual?, expected?} with absent fields omitted
  nlohmann::json to_json() const;
};

/// null, false, 0, "" and empty containers are falsy
BRIDGE_SERVER_API bool json_truthy(const nlohmann::json &value);

} // namespace bridgesrv
