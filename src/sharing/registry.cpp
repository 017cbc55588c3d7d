#include "tunnelshare/sharing/registry.hpp"

#include "tunnelshare/common/fs.hpp"
#include "tunnelshare/net/port_allocator.hpp"
#include "tunnelshare/observability/global.hpp"
#include "tunnelshare/security/credentials.hpp"
#include "tunnelshare/tunnel/factory.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace tunnelshare::sharing {

namespace {

constexpr std::chrono::milliseconds kUrlPollSlice{250};

ShareStatus to_share_status(const tunnel::TunnelStatus status) {
  switch (status) {
  case tunnel::TunnelStatus::Spawning:
  case tunnel::TunnelStatus::Connecting:
    return ShareStatus::Connecting;
  case tunnel::TunnelStatus::Connected:
    return ShareStatus::Connected;
  case tunnel::TunnelStatus::Error:
    return ShareStatus::Error;
  case tunnel::TunnelStatus::Disconnected:
    return ShareStatus::Disconnected;
  }
  return ShareStatus::Error;
}

std::filesystem::path normalized(const std::filesystem::path &path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(path, ec);
  return ec ? path.lexically_normal() : canonical;
}

} // namespace

tunnel::TunnelListener ShareRegistry::make_listener(std::string share_id, std::string token,
                                                    std::shared_ptr<IShareEventSink> events,
                                                    std::shared_ptr<std::atomic<ShareStatus>> status,
                                                    std::shared_ptr<StatusGate> gate) {
  return [share_id = std::move(share_id), token = std::move(token), events = std::move(events),
          status = std::move(status), gate = std::move(gate)](const tunnel::TunnelUpdate &update) {
    ShareStatusEvent event;
    event.share_id = share_id;
    event.status = to_share_status(update.status);
    if (update.public_url.has_value()) {
      event.public_url = compose_share_url(*update.public_url, token);
    }
    std::lock_guard<std::mutex> lock(gate->mutex);
    if (event.status == ShareStatus::Error) {
      event.error = update.detail;
      gate->last_error = update.detail;
    }
    status->store(event.status);
    if (gate->registered && events) {
      events->on_status(event);
    }
  };
}

ShareRegistry::ShareRegistry(config::Config config, std::shared_ptr<IShareEventSink> events)
    : config_(std::move(config)),
      events_(events ? std::move(events) : std::make_shared<NullEventSink>()) {}

ShareRegistry::~ShareRegistry() { stop_all_shares(); }

common::Result<ShareInfo> ShareRegistry::start_share(const ShareRequest &request) {
  return start_session(request.package_path, request.instance_name, request.provider,
                       request.password, std::nullopt, std::nullopt);
}

common::Result<ShareInfo> ShareRegistry::start_share_with_password_hash(
    const std::filesystem::path &package_path, const std::string &instance_name,
    const tunnel::Provider provider, const std::optional<std::string> &password_hash,
    const std::string &salt) {
  return start_session(package_path, instance_name, provider, std::nullopt, password_hash,
                       salt);
}

common::Result<ShareInfo> ShareRegistry::start_session(
    const std::filesystem::path &package_path, const std::string &instance_name,
    const tunnel::Provider provider, const std::optional<std::string> &password,
    const std::optional<std::string> &password_hash, const std::optional<std::string> &salt) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(package_path, ec)) {
    return common::Result<ShareInfo>::failure(common::ErrorKind::NotFound,
                                              "Package not found: " + package_path.string());
  }
  const std::uint64_t file_size = std::filesystem::file_size(package_path, ec);
  if (ec) {
    return common::Result<ShareInfo>::failure(common::ErrorKind::Io,
                                              "Failed to stat " + package_path.string() + ": " +
                                                  ec.message());
  }

  auto share_id = security::generate_share_id();
  if (!share_id.ok()) {
    return common::Result<ShareInfo>::failure(share_id.status());
  }
  auto token = security::generate_token();
  if (!token.ok()) {
    return common::Result<ShareInfo>::failure(token.status());
  }
  const std::string &id = share_id.value();

  ShareCredentials credentials;
  credentials.salt = id;
  if (password.has_value()) {
    credentials.password_hash = security::hash_password(*password, id);
  } else if (password_hash.has_value()) {
    credentials.password_hash = *password_hash;
    credentials.salt = salt.value_or(id);
  }

  auto agent = tunnel::create_agent(provider, config_);
  if (!agent.ok()) {
    return common::Result<ShareInfo>::failure(agent.status());
  }

  auto port = net::allocate_ephemeral_port();
  if (!port.ok()) {
    return common::Result<ShareInfo>::failure(port.status());
  }

  auto counters = std::make_shared<LiveCounters>();
  server::ShareContext context{
      .share_id = id,
      .package = server::ServedPackage{.path = package_path,
                                       .file_name = package_path.filename().string(),
                                       .alias = config_.sharing.package_alias,
                                       .manifest_entry = config_.sharing.manifest_entry},
      .access = server::ShareAccess{.token = token.value(),
                                    .password_hash = credentials.password_hash,
                                    .password_salt = credentials.salt},
      .counters = counters,
      .events = events_,
  };
  server::FileServerOptions options{
      .host = "127.0.0.1",
      .port = port.value(),
      .max_connections = config_.sharing.max_connections,
      .request_timeout = std::chrono::seconds(config_.sharing.request_timeout_secs),
  };

  auto file_server = std::make_unique<server::FileServer>(std::move(context), options);
  if (auto started = file_server->start(); !started.ok()) {
    return common::Result<ShareInfo>::failure(started);
  }

  auto status = std::make_shared<std::atomic<ShareStatus>>(ShareStatus::Connecting);
  auto gate = std::make_shared<StatusGate>();
  auto spawned =
      tunnel::TunnelHandle::spawn(agent.value(), file_server->port(), id,
                                  make_listener(id, token.value(), events_, status, gate));
  if (!spawned.ok()) {
    file_server->stop();
    return common::Result<ShareInfo>::failure(spawned.status());
  }
  std::unique_ptr<tunnel::TunnelHandle> tunnel_handle = std::move(spawned.value());

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(config_.sharing.url_wait_secs);
  std::optional<std::string> base_url;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    base_url = tunnel_handle->wait_for_url(std::max(std::chrono::milliseconds(0),
                                                    std::min(remaining, kUrlPollSlice)));
    if (base_url.has_value() || now >= deadline) {
      break;
    }
    // Disconnected is only reported once the agent output has been drained.
    if (tunnel_handle->status() == tunnel::TunnelStatus::Disconnected) {
      base_url = tunnel_handle->public_url();
      if (base_url.has_value()) {
        break;
      }
      tunnel_handle->terminate();
      file_server->stop();
      return common::Result<ShareInfo>::failure(
          common::ErrorKind::TunnelSpawnFailure,
          std::string(tunnel::provider_name(provider)) +
              " agent exited before publishing a public URL");
    }
  }

  auto entry = std::make_shared<ShareEntry>();
  entry->info.share_id = id;
  entry->info.instance_name = instance_name;
  entry->info.package_path = package_path.string();
  entry->info.local_port = file_server->port();
  entry->info.started_at = common::utc_timestamp_rfc3339();
  entry->info.file_size = file_size;
  entry->info.provider = provider;
  entry->info.has_password = credentials.password_hash.has_value();
  if (base_url.has_value()) {
    entry->info.public_url = compose_share_url(*base_url, token.value());
  } else {
    observability::record_warning(
        "registry", "no public URL for share " + id + " after " +
                        std::to_string(config_.sharing.url_wait_secs) +
                        "s; share remains connecting");
  }
  entry->credentials = std::move(credentials);
  entry->counters = std::move(counters);
  entry->status = std::move(status);
  entry->gate = gate;
  entry->token = token.value();
  entry->server = std::move(file_server);
  entry->tunnel = std::move(tunnel_handle);

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    shares_.emplace(id, entry);
  }
  observability::record_share_started(id, std::string(tunnel::provider_name(provider)),
                                      entry->info.local_port,
                                      entry->info.public_url.has_value());
  {
    std::lock_guard<std::mutex> lock(gate->mutex);
    gate->registered = true;
    const ShareInfo current = snapshot(*entry);
    ShareStatusEvent event;
    event.share_id = id;
    event.status = current.status;
    event.public_url = current.public_url;
    if (current.status == ShareStatus::Error) {
      event.error = gate->last_error;
    }
    events_->on_status(event);
  }
  publish_share_count();
  return common::Result<ShareInfo>::success(snapshot(*entry));
}

common::Status ShareRegistry::stop_share(const std::string &share_id) {
  std::shared_ptr<ShareEntry> entry;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = shares_.find(share_id);
    if (it == shares_.end()) {
      return common::Status::error(common::ErrorKind::NotFound, "Share not found: " + share_id);
    }
    entry = it->second;
    shares_.erase(it);
  }

  entry->server->stop();
  entry->tunnel->terminate();
  observability::record_share_stopped(share_id);
  publish_share_count();
  return common::Status::success();
}

void ShareRegistry::stop_all_shares() {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ids.reserve(shares_.size());
    for (const auto &[id, entry] : shares_) {
      ids.push_back(id);
    }
  }
  for (const auto &id : ids) {
    const common::Status stopped = stop_share(id);
    if (!stopped.ok() && stopped.kind() != common::ErrorKind::NotFound) {
      observability::record_warning("registry", stopped.error());
    }
  }
}

std::vector<ShareInfo> ShareRegistry::get_active_shares() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ShareInfo> out;
  out.reserve(shares_.size());
  for (const auto &[id, entry] : shares_) {
    out.push_back(snapshot(*entry));
  }
  std::sort(out.begin(), out.end(), [](const ShareInfo &a, const ShareInfo &b) {
    return a.started_at < b.started_at;
  });
  return out;
}

std::optional<ShareInfo> ShareRegistry::get_share(const std::string &share_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = shares_.find(share_id);
  if (it == shares_.end()) {
    return std::nullopt;
  }
  return snapshot(*it->second);
}

std::vector<ShareInfo>
ShareRegistry::shares_for_package(const std::filesystem::path &package_path) const {
  const std::filesystem::path wanted = normalized(package_path);
  std::vector<ShareInfo> out;
  for (auto &info : get_active_shares()) {
    if (normalized(info.package_path) == wanted) {
      out.push_back(std::move(info));
    }
  }
  return out;
}

common::Result<ShareCredentials> ShareRegistry::credentials(const std::string &share_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = shares_.find(share_id);
  if (it == shares_.end()) {
    return common::Result<ShareCredentials>::failure(common::ErrorKind::NotFound,
                                                     "Share not found: " + share_id);
  }
  return common::Result<ShareCredentials>::success(it->second->credentials);
}

std::size_t ShareRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return shares_.size();
}

ShareInfo ShareRegistry::snapshot(const ShareEntry &entry) const {
  ShareInfo info = entry.info;
  info.download_count = entry.counters->download_count();
  info.uploaded_bytes = entry.counters->uploaded_bytes();
  if (!info.public_url.has_value()) {
    if (auto late = entry.tunnel->public_url(); late.has_value()) {
      info.public_url = compose_share_url(*late, entry.token);
    }
  }
  info.status = entry.status->load();
  if (info.status == ShareStatus::Connecting && info.public_url.has_value()) {
    info.status = ShareStatus::Connected;
  }
  return info;
}

void ShareRegistry::publish_share_count() const {
  observability::record_metric(observability::ActiveSharesMetric{.count = size()});
}

} // namespace tunnelshare::sharing
