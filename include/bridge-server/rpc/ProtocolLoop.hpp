#pragma once
#include "bridge-server/export.h"
#include "bridge-server/rpc/Dispatcher.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace bridgesrv {
namespace rpc {

/// Line-delimited JSON-RPC serve loop.
///
/// One request per line in, exactly one response per non-blank line out.
/// No failure of a single request stops the loop.
class BRIDGE_SERVER_API ProtocolLoop {
public:
  explicit ProtocolLoop(Dispatcher &dispatcher) : dispatcher_(dispatcher) {}

  /// Response envelope for one input line, std::nullopt for blank lines
  std::optional<std::string> handle_line(std::string line);

  /// Serve until in reaches EOF. Returns the number of responses written.
  std::size_t run(std::istream &in, std::ostream &out);

private:
  Dispatcher &dispatcher_;
};

} // namespace rpc
} // namespace bridgesrv
