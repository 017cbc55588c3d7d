#pragma once

#include "tunnelshare/common/result.hpp"
#include "tunnelshare/tunnel/agent.hpp"
#include "tunnelshare/tunnel/process.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace tunnelshare::tunnel {

enum class TunnelStatus { Spawning, Connecting, Connected, Disconnected, Error };

[[nodiscard]] std::string_view tunnel_status_name(TunnelStatus status);

struct TunnelUpdate {
  TunnelStatus status = TunnelStatus::Spawning;
  std::optional<std::string> public_url;
  std::optional<std::string> detail;
};

/// Invoked from the reader and exit-waiter threads.
using TunnelListener = std::function<void(const TunnelUpdate &)>;

/// Single-value hand-off: the first offered URL wins, later offers are ignored.
class UrlSlot {
public:
  bool offer(std::string url);
  [[nodiscard]] std::optional<std::string> wait_for(std::chrono::milliseconds timeout);
  [[nodiscard]] std::optional<std::string> peek() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<std::string> url_;
};

constexpr std::chrono::milliseconds kTerminateGrace{2000};
constexpr std::chrono::milliseconds kReaderDrainTimeout{1000};

/// Owns one running agent: two output reader threads and one exit waiter.
/// Disconnected is terminal. Destruction joins every thread, so no listener
/// call happens after the handle is gone.
class TunnelHandle {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<TunnelHandle>>
  spawn(std::shared_ptr<ITunnelAgent> agent, std::uint16_t local_port, std::string share_id,
        TunnelListener listener);

  ~TunnelHandle();

  TunnelHandle(const TunnelHandle &) = delete;
  TunnelHandle &operator=(const TunnelHandle &) = delete;

  [[nodiscard]] std::optional<std::string> wait_for_url(std::chrono::milliseconds timeout);
  [[nodiscard]] std::optional<std::string> public_url() const;
  [[nodiscard]] TunnelStatus status() const;
  [[nodiscard]] bool has_exited() const;

  /// SIGTERM, then SIGKILL once grace elapses without exit. Idempotent.
  void terminate(std::chrono::milliseconds grace = kTerminateGrace);

private:
  TunnelHandle(std::shared_ptr<ITunnelAgent> agent, std::string share_id,
               TunnelListener listener);

  void read_stream(int fd, const char *stream_name);
  void handle_line(const char *stream_name, const std::string &line);
  void wait_exit();
  void emit(TunnelStatus status, std::optional<std::string> url = std::nullopt,
            std::optional<std::string> detail = std::nullopt);

  std::shared_ptr<ITunnelAgent> agent_;
  std::string share_id_;
  TunnelListener listener_;
  AgentProcess process_;
  UrlSlot url_slot_;

  mutable std::mutex status_mutex_;
  TunnelStatus status_ = TunnelStatus::Spawning;
  // Serializes listener calls so they arrive in transition order.
  std::mutex emit_mutex_;

  std::mutex readers_mutex_;
  std::condition_variable readers_cv_;
  int readers_open_ = 2;

  mutable std::mutex exit_mutex_;
  std::condition_variable exit_cv_;
  bool exited_ = false;
  bool terminated_ = false;
  std::atomic<bool> stop_readers_{false};

  std::thread stdout_thread_;
  std::thread stderr_thread_;
  std::thread exit_thread_;
};

} // namespace tunnelshare::tunnel
