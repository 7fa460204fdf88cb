#include "bridge-server/Logger.hpp"

namespace bridgesrv {

// Defined out of line so native modules share the host's logger instance
BridgeLogger &BridgeLogger::instance() {
  static BridgeLogger logger;
  return logger;
}

} // namespace bridgesrv
