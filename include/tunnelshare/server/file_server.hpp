#pragma once

#include "tunnelshare/common/result.hpp"
#include "tunnelshare/server/responder.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace tunnelshare::server {

struct FileServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 0;
  std::size_t max_connections = 10;
  std::chrono::seconds request_timeout{300};
};

/// Loopback HTTP listener for one share. One accept thread; each accepted
/// connection runs the responder on its own detached thread, bounded by
/// max_connections. Connections above the ceiling are closed unanswered.
class FileServer {
public:
  FileServer(ShareContext context, FileServerOptions options);
  ~FileServer();

  FileServer(const FileServer &) = delete;
  FileServer &operator=(const FileServer &) = delete;

  [[nodiscard]] common::Status start();
  /// Stops accepting and waits for the accept thread. In-flight handlers
  /// finish on their own.
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t active_connections() const;

private:
  struct Shared {
    Shared(ShareContext ctx, FileServerOptions opts)
        : context(std::move(ctx)), options(std::move(opts)) {}

    const ShareContext context;
    const FileServerOptions options;
    std::atomic<std::size_t> active{0};
  };

  void accept_loop();
  static void run_connection(const std::shared_ptr<Shared> &shared, int client_fd);

  std::shared_ptr<Shared> shared_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
};

} // namespace tunnelshare::server
