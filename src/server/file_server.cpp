#include "tunnelshare/server/file_server.hpp"

#include "tunnelshare/observability/global.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#ifndef _WIN32
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace tunnelshare::server {

namespace {

constexpr int kListenBacklog = 64;
constexpr int kAcceptPollMs = 200;

#ifndef _WIN32
int open_listen_socket() {
#ifdef __linux__
  return socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
#else
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd >= 0) {
    fcntl(fd, F_SETFD, FD_CLOEXEC);
  }
  return fd;
#endif
}

int accept_client(const int listen_fd) {
  sockaddr_in client_addr{};
  socklen_t len = sizeof(client_addr);
#ifdef __linux__
  return accept4(listen_fd, reinterpret_cast<sockaddr *>(&client_addr), &len, SOCK_CLOEXEC);
#else
  const int fd = accept(listen_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
  if (fd >= 0) {
    fcntl(fd, F_SETFD, FD_CLOEXEC);
  }
  return fd;
#endif
}

// Short socket timeouts let the handler re-check its overall deadline.
void set_io_slices(const int fd) {
  timeval slice{};
  slice.tv_sec = 1;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &slice, sizeof(slice));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &slice, sizeof(slice));
}
#endif

void publish_active(const std::string &share_id, const std::size_t count) {
  observability::record_metric(
      observability::ActiveConnectionsMetric{.share_id = share_id, .count = count});
}

} // namespace

FileServer::FileServer(ShareContext context, FileServerOptions options)
    : shared_(std::make_shared<Shared>(std::move(context), std::move(options))) {}

FileServer::~FileServer() { stop(); }

common::Status FileServer::start() {
#ifdef _WIN32
  return common::Status::error(common::ErrorKind::BindFailure,
                               "file server is not implemented on Windows");
#else
  if (running_) {
    return common::Status::error(common::ErrorKind::BindFailure, "file server already running");
  }

  listen_fd_ = open_listen_socket();
  if (listen_fd_ < 0) {
    return common::Status::error(common::ErrorKind::BindFailure,
                                 std::string("failed to create listen socket: ") +
                                     std::strerror(errno));
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  const FileServerOptions &options = shared_->options;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, options.host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorKind::BindFailure,
                                 "invalid bind host: " + options.host);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorKind::BindFailure,
                                 "bind " + options.host + ":" + std::to_string(options.port) +
                                     " failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorKind::BindFailure, "listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  try {
    accept_thread_ = std::thread([this]() { accept_loop(); });
  } catch (const std::system_error &e) {
    running_ = false;
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error(common::ErrorKind::BindFailure,
                                 std::string("failed to start accept thread: ") + e.what());
  }
  return common::Status::success();
#endif
}

void FileServer::stop() {
#ifndef _WIN32
  if (!running_.exchange(false)) {
    return;
  }
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
#endif
}

std::uint16_t FileServer::port() const { return bound_port_; }

bool FileServer::is_running() const { return running_.load(); }

std::size_t FileServer::active_connections() const { return shared_->active.load(); }

void FileServer::accept_loop() {
#ifndef _WIN32
  const std::string &share_id = shared_->context.share_id;
  while (running_) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, kAcceptPollMs);
    if (ready <= 0 || !running_) {
      continue;
    }

    const int client = accept_client(listen_fd_);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    const std::size_t current = shared_->active.load();
    if (current >= shared_->options.max_connections) {
      close(client);
      observability::record_connection_rejected(share_id, current);
      continue;
    }

    const std::size_t now_active = shared_->active.fetch_add(1) + 1;
    publish_active(share_id, now_active);
    try {
      std::thread(&FileServer::run_connection, shared_, client).detach();
    } catch (const std::system_error &e) {
      shared_->active.fetch_sub(1);
      close(client);
      observability::record_error("file_server",
                                  std::string("failed to spawn connection thread: ") + e.what());
    }
  }
#endif
}

void FileServer::run_connection(const std::shared_ptr<Shared> &shared, const int client_fd) {
#ifndef _WIN32
  struct ActiveGuard {
    Shared &state;
    ~ActiveGuard() { publish_active(state.context.share_id, state.active.fetch_sub(1) - 1); }
  } guard{*shared};

  set_io_slices(client_fd);
  const Deadline deadline = std::chrono::steady_clock::now() + shared->options.request_timeout;
  const common::Status status = handle_connection(client_fd, shared->context, deadline);
  if (!status.ok()) {
    if (status.kind() == common::ErrorKind::RequestTimeout) {
      observability::record_connection_timeout(shared->context.share_id);
    } else {
      observability::record_warning("file_server", "connection for share " +
                                                        shared->context.share_id +
                                                        " ended: " + status.error());
    }
  }
  close(client_fd);
#else
  (void)shared;
  (void)client_fd;
#endif
}

} // namespace tunnelshare::server
