#pragma once
#include "bridge-server/export.h"

#include <memory>
#include <ostream>
#include <streambuf>

namespace bridgesrv {
namespace rpc {

/// Output stream over the process's original stdout.
///
/// claim_stdout() duplicates fd 1 for the protocol and then points fd 1 at
/// stderr, so anything module code prints lands in diagnostics instead of
/// the envelope stream.
class BRIDGE_SERVER_API ProtocolOutput {
public:
  /// Takes ownership of fd
  explicit ProtocolOutput(int fd);
  ~ProtocolOutput();

  ProtocolOutput(const ProtocolOutput &) = delete;
  ProtocolOutput &operator=(const ProtocolOutput &) = delete;

  /// Throws std::system_error if the descriptors cannot be rearranged
  static std::unique_ptr<ProtocolOutput> claim_stdout();

  std::ostream &stream() { return stream_; }
  int fd() const { return fd_; }

private:
  class FdStreamBuf : public std::streambuf {
  public:
    explicit FdStreamBuf(int fd);

  protected:
    int_type overflow(int_type ch) override;
    int sync() override;

  private:
    bool flush_buffer();

    int fd_;
    char buffer_[4096];
  };

  int fd_;
  FdStreamBuf buf_;
  std::ostream stream_;
};

} // namespace rpc
} // namespace bridgesrv
