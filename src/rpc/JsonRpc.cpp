#include "bridge-server/rpc/JsonRpc.hpp"

#include <fmt/format.h>

namespace bridgesrv {
namespace rpc {

using json = nlohmann::json;

json parse_envelope(const std::string &line) {
  // depth counts enclosing containers, so the top level is 0
  json::parser_callback_t limit_depth = [](int depth, json::parse_event_t event,
                                           json &) {
    if ((event == json::parse_event_t::object_start ||
         event == json::parse_event_t::array_start) &&
        depth >= kMaxEnvelopeDepth) {
      throw RpcError(error_code::PARSE_ERROR,
                     fmt::format("Parse error: nesting deeper than {} levels",
                                 kMaxEnvelopeDepth));
    }
    return true;
  };
  return json::parse(line, limit_depth);
}

json request_id(const json &envelope) {
  if (!envelope.is_object()) {
    return nullptr;
  }
  auto it = envelope.find("id");
  if (it == envelope.end()) {
    return nullptr;
  }
  return *it;
}

Request parse_request(const json &envelope) {
  if (!envelope.is_object()) {
    throw RpcError(error_code::INVALID_REQUEST,
                   "Invalid request: expected a JSON object");
  }

  auto method = envelope.find("method");
  if (method == envelope.end() || !method->is_string()) {
    throw RpcError(error_code::INVALID_REQUEST,
                   "Invalid request: missing or invalid method");
  }

  Request request;
  request.id = request_id(envelope);
  request.method = method->get<std::string>();

  auto params = envelope.find("params");
  if (params == envelope.end() || params->is_null()) {
    request.params = json::object();
  } else if (params->is_object()) {
    request.params = *params;
  } else {
    throw RpcError(error_code::INVALID_PARAMS,
                   "Invalid params: params must be an object");
  }
  return request;
}

std::string dump_compact(const json &value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_result(const json &id, const json &result) {
  return fmt::format(R"({{"jsonrpc":"2.0","id":{},"result":{}}})",
                     dump_compact(id), dump_compact(result));
}

std::string encode_error(const json &id, int code, const std::string &message) {
  json error = {{"code", code}, {"message", message}};
  return fmt::format(R"({{"jsonrpc":"2.0","id":{},"error":{}}})",
                     dump_compact(id), dump_compact(error));
}

} // namespace rpc
} // namespace bridgesrv
