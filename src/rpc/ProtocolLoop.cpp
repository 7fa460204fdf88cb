#include "bridge-server/rpc/ProtocolLoop.hpp"
#include "bridge-server/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace bridgesrv {
namespace rpc {

using json = nlohmann::json;

std::optional<std::string> ProtocolLoop::handle_line(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (std::all_of(line.begin(), line.end(),
                  [](unsigned char c) { return std::isspace(c); })) {
    return std::nullopt;
  }

  json envelope;
  try {
    envelope = parse_envelope(line);
  } catch (const json::parse_error &e) {
    LOG_WARN("RPC", "PARSE", "Malformed request line: {} ({})", line, e.what());
    return encode_error(nullptr, error_code::PARSE_ERROR,
                        std::string("Parse error: ") + e.what());
  } catch (const RpcError &e) {
    LOG_WARN("RPC", "PARSE", "Rejected request line of {} bytes: {}",
             line.size(), e.what());
    return encode_error(nullptr, e.code(), e.what());
  }

  json id = request_id(envelope);
  try {
    Request request = parse_request(envelope);
    LOG_DEBUG("RPC", "REQUEST", "id={} method={}", dump_compact(request.id),
              request.method);

    json result = dispatcher_.dispatch(request.method, request.params);
    return encode_result(request.id, result);
  } catch (const RpcError &e) {
    LOG_WARN("RPC", "ERROR", "Request id={} failed ({}): {}", dump_compact(id),
             e.code(), e.what());
    return encode_error(id, e.code(), e.what());
  } catch (const std::exception &e) {
    LOG_ERROR("RPC", "ERROR", "Handler error for id={}: {}", dump_compact(id),
              e.what());
    return encode_error(id, error_code::SERVER_ERROR, e.what());
  } catch (...) {
    LOG_ERROR("RPC", "ERROR", "Handler threw a non-standard exception for id={}",
              dump_compact(id));
    return encode_error(id, error_code::SERVER_ERROR, "Unknown error");
  }
}

std::size_t ProtocolLoop::run(std::istream &in, std::ostream &out) {
  std::size_t responses = 0;
  std::string line;

  while (std::getline(in, line)) {
    auto response = handle_line(std::move(line));
    if (!response) {
      continue;
    }

    out << *response << '\n';
    out.flush();
    if (!out) {
      LOG_ERROR("RPC", "WRITE", "Protocol output stream failed; stopping");
      break;
    }
    ++responses;
  }

  LOG_INFO("RPC", "LOOP", "Input closed after {} responses", responses);
  return responses;
}

} // namespace rpc
} // namespace bridgesrv
