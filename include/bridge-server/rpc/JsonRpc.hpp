#pragma once
#include "bridge-server/export.h"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace bridgesrv {
namespace rpc {

// JSON-RPC 2.0 error codes
namespace error_code {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
// Any failure raised while a handler runs
constexpr int SERVER_ERROR = -32000;
} // namespace error_code

/// Error carried back to the client as {"code", "message"}
class BRIDGE_SERVER_API RpcError : public std::runtime_error {
public:
  RpcError(int code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  int code() const noexcept { return code_; }

private:
  int code_;
};

struct Request {
  nlohmann::json id;
  std::string method;
  nlohmann::json params;
};

/// Deepest array/object nesting accepted in a request line
constexpr int kMaxEnvelopeDepth = 256;

/// Parse one request line. Throws json::parse_error for malformed JSON and
/// RpcError(PARSE_ERROR) when nesting exceeds kMaxEnvelopeDepth.
BRIDGE_SERVER_API nlohmann::json parse_envelope(const std::string &line);

/// The id to echo for an envelope: its "id" member, or null when the
/// envelope is not an object or has none
BRIDGE_SERVER_API nlohmann::json request_id(const nlohmann::json &envelope);

/// Validate a parsed envelope. Absent or null params become {}.
/// Throws RpcError with INVALID_REQUEST or INVALID_PARAMS.
BRIDGE_SERVER_API Request parse_request(const nlohmann::json &envelope);

// Serialized envelopes, keys in jsonrpc/id/result|error order. Invalid UTF-8
// in strings is replaced, never fatal.
BRIDGE_SERVER_API std::string encode_result(const nlohmann::json &id,
                                            const nlohmann::json &result);
BRIDGE_SERVER_API std::string encode_error(const nlohmann::json &id, int code,
                                           const std::string &message);

/// Compact, newline-free dump used for everything written to the wire
BRIDGE_SERVER_API std::string dump_compact(const nlohmann::json &value);

} // namespace rpc
} // namespace bridgesrv
