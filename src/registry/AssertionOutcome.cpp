#include "bridge-server/registry/AssertionOutcome.hpp"

namespace bridgesrv {

bool json_truthy(const nlohmann::json &value) {
  switch (value.type()) {
  case nlohmann::json::value_t::null:
  case nlohmann::json::value_t::discarded:
    return false;
  case nlohmann::json::value_t::boolean:
    return value.get<bool>();
  case nlohmann::json::value_t::number_integer:
    return value.get<int64_t>() != 0;
  case nlohmann::json::value_t::number_unsigned:
    return value.get<uint64_t>() != 0;
  case nlohmann::json::value_t::number_float:
    return value.get<double>() != 0.0;
  case nlohmann::json::value_t::string:
    return !value.get_ref<const std::string &>().empty();
  case nlohmann::json::value_t::array:
  case nlohmann::json::value_t::object:
  case nlohmann::json::value_t::binary:
    return !value.empty();
  }
  return false;
}

AssertionOutcome AssertionOutcome::passed(std::optional<std::string> message) {
  AssertionOutcome outcome;
  outcome.success = true;
  outcome.message = std::move(message);
  return outcome;
}

AssertionOutcome
AssertionOutcome::failed(std::string message,
                         std::optional<nlohmann::json> actual,
                         std::optional<nlohmann::json> expected) {
  AssertionOutcome outcome;
  outcome.success = false;
  outcome.message = std::move(message);
  outcome.actual = std::move(actual);
  outcome.expected = std::move(expected);
  return outcome;
}

AssertionOutcome AssertionOutcome::from_value(const nlohmann::json &value) {
  AssertionOutcome outcome;

  if (value.is_boolean()) {
    outcome.success = value.get<bool>();
    return outcome;
  }

  if (!value.is_object()) {
    outcome.success = json_truthy(value);
    return outcome;
  }

  auto success = value.find("success");
  outcome.success = success == value.end() || json_truthy(*success);

  auto message = value.find("message");
  if (message != value.end() && !message->is_null()) {
    outcome.message = message->is_string() ? message->get<std::string>()
                                           : message->dump();
  }

  auto actual = value.find("actual");
  if (actual != value.end() && !actual->is_null()) {
    outcome.actual = *actual;
  }

  auto expected = value.find("expected");
  if (expected != value.end() && !expected->is_null()) {
    outcome.expected = *expected;
  }

  return outcome;
}

nlohmann::json AssertionOutcome::to_json() const {
  nlohmann::json j = {{"success", success}};
  if (message) {
    j["message"] = *message;
  }
  if (actual) {
    j["actual"] = *actual;
  }
  if (expected) {
    j["expected"] = *expected;
  }
  return j;
}

} // namespace bridgesrv
