#include "tunnelshare/net/port_allocator.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace tunnelshare::net {

common::Result<std::uint16_t> allocate_ephemeral_port() {
#ifdef _WIN32
  return common::Result<std::uint16_t>::failure(common::ErrorKind::PortAllocationFailure,
                                                "port allocation is not implemented on Windows");
#else
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return common::Result<std::uint16_t>::failure(
        common::ErrorKind::PortAllocationFailure,
        std::string("failed to create socket: ") + std::strerror(errno));
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(0);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(fd);
    return common::Result<std::uint16_t>::failure(common::ErrorKind::PortAllocationFailure,
                                                  "no free local port: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&actual), &actual_len) != 0) {
    const std::string msg = std::strerror(errno);
    close(fd);
    return common::Result<std::uint16_t>::failure(common::ErrorKind::PortAllocationFailure,
                                                  "getsockname failed: " + msg);
  }

  close(fd);
  return common::Result<std::uint16_t>::success(ntohs(actual.sin_port));
#endif
}

} // namespace tunnelshare::net
