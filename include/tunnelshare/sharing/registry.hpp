#pragma once

#include "tunnelshare/common/result.hpp"
#include "tunnelshare/config/schema.hpp"
#include "tunnelshare/server/file_server.hpp"
#include "tunnelshare/sharing/counters.hpp"
#include "tunnelshare/sharing/events.hpp"
#include "tunnelshare/sharing/types.hpp"
#include "tunnelshare/tunnel/supervisor.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tunnelshare::sharing {

class ShareRegistry {
public:
  ShareRegistry(config::Config config, std::shared_ptr<IShareEventSink> events);
  ~ShareRegistry();

  ShareRegistry(const ShareRegistry &) = delete;
  ShareRegistry &operator=(const ShareRegistry &) = delete;

  /// Starts server and tunnel, waits up to sharing.url_wait_secs for the
  /// public URL. A missing URL is not an error: the share stays connecting.
  /// On failure nothing stays registered or running. On success the first
  /// status event for the share is sent after it is registered.
  [[nodiscard]] common::Result<ShareInfo> start_share(const ShareRequest &request);

  /// Same as start_share with a precomputed hash. salt is the share id the
  /// hash was originally made for.
  [[nodiscard]] common::Result<ShareInfo>
  start_share_with_password_hash(const std::filesystem::path &package_path,
                                 const std::string &instance_name, tunnel::Provider provider,
                                 const std::optional<std::string> &password_hash,
                                 const std::string &salt);

  [[nodiscard]] common::Status stop_share(const std::string &share_id);
  void stop_all_shares();

  [[nodiscard]] std::vector<ShareInfo> get_active_shares() const;
  [[nodiscard]] std::optional<ShareInfo> get_share(const std::string &share_id) const;
  [[nodiscard]] std::vector<ShareInfo>
  shares_for_package(const std::filesystem::path &package_path) const;
  [[nodiscard]] common::Result<ShareCredentials> credentials(const std::string &share_id) const;
  [[nodiscard]] std::size_t size() const;

private:
  // Tunnel updates are held back until the share is registered, then the
  // registration status event goes out first.
  struct StatusGate {
    std::mutex mutex;
    bool registered = false;
    std::optional<std::string> last_error;
  };

  struct ShareEntry {
    ShareInfo info;
    ShareCredentials credentials;
    std::shared_ptr<LiveCounters> counters;
    std::shared_ptr<std::atomic<ShareStatus>> status;
    std::shared_ptr<StatusGate> gate;
    std::string token;
    std::unique_ptr<server::FileServer> server;
    std::unique_ptr<tunnel::TunnelHandle> tunnel;
  };

  [[nodiscard]] common::Result<ShareInfo>
  start_session(const std::filesystem::path &package_path, const std::string &instance_name,
                tunnel::Provider provider, const std::optional<std::string> &password,
                const std::optional<std::string> &password_hash,
                const std::optional<std::string> &salt);

  [[nodiscard]] static tunnel::TunnelListener
  make_listener(std::string share_id, std::string token, std::shared_ptr<IShareEventSink> events,
                std::shared_ptr<std::atomic<ShareStatus>> status,
                std::shared_ptr<StatusGate> gate);
  [[nodiscard]] ShareInfo snapshot(const ShareEntry &entry) const;
  void publish_share_count() const;

  const config::Config config_;
  std::shared_ptr<IShareEventSink> events_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<ShareEntry>> shares_;
};

} // namespace tunnelshare::sharing
