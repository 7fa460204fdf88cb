#include "bridge-server/rpc/ProtocolOutput.hpp"
#include "bridge-server/Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define DUP_FD(fd) _dup(fd)
#define DUP2_FD(from, to) _dup2(from, to)
#define WRITE_FD(fd, data, size) _write(fd, data, static_cast<unsigned>(size))
#define CLOSE_FD(fd) _close(fd)
#define STDOUT_FD 1
#define STDERR_FD 2
#else
#include <unistd.h>
#define DUP_FD(fd) dup(fd)
#define DUP2_FD(from, to) dup2(from, to)
#define WRITE_FD(fd, data, size) write(fd, data, size)
#define CLOSE_FD(fd) close(fd)
#define STDOUT_FD STDOUT_FILENO
#define STDERR_FD STDERR_FILENO
#endif

namespace bridgesrv {
namespace rpc {

ProtocolOutput::FdStreamBuf::FdStreamBuf(int fd) : fd_(fd) {
  setp(buffer_, buffer_ + sizeof(buffer_));
}

bool ProtocolOutput::FdStreamBuf::flush_buffer() {
  const char *data = pbase();
  std::size_t remaining = static_cast<std::size_t>(pptr() - pbase());

  while (remaining > 0) {
    auto written = WRITE_FD(fd_, data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  setp(buffer_, buffer_ + sizeof(buffer_));
  return true;
}

ProtocolOutput::FdStreamBuf::int_type
ProtocolOutput::FdStreamBuf::overflow(int_type ch) {
  if (!flush_buffer()) {
    return traits_type::eof();
  }
  if (!traits_type::eq_int_type(ch, traits_type::eof())) {
    *pptr() = traits_type::to_char_type(ch);
    pbump(1);
  }
  return traits_type::not_eof(ch);
}

int ProtocolOutput::FdStreamBuf::sync() { return flush_buffer() ? 0 : -1; }

ProtocolOutput::ProtocolOutput(int fd) : fd_(fd), buf_(fd), stream_(&buf_) {}

ProtocolOutput::~ProtocolOutput() {
  stream_.flush();
  if (fd_ >= 0) {
    CLOSE_FD(fd_);
  }
}

std::unique_ptr<ProtocolOutput> ProtocolOutput::claim_stdout() {
  // Anything already buffered for stdout belongs to the old descriptor
  std::cout.flush();
  std::fflush(stdout);

  int protocol_fd = DUP_FD(STDOUT_FD);
  if (protocol_fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "Failed to duplicate stdout");
  }

  if (DUP2_FD(STDERR_FD, STDOUT_FD) < 0) {
    int err = errno;
    CLOSE_FD(protocol_fd);
    throw std::system_error(err, std::generic_category(),
                            "Failed to redirect stdout to stderr");
  }

  LOG_DEBUG("RPC", "OUTPUT", "Protocol output on fd {}; fd {} now mirrors stderr",
            protocol_fd, STDOUT_FD);
  return std::make_unique<ProtocolOutput>(protocol_fd);
}

} // namespace rpc
} // namespace bridgesrv
