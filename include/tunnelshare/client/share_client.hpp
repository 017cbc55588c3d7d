#pragma once

#include "tunnelshare/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace tunnelshare::client {

struct ClientOptions {
  std::uint64_t timeout_ms = 300000;
  std::uint64_t connect_timeout_ms = 30000;
};

struct DownloadResult {
  std::filesystem::path path;
  std::uint64_t bytes = 0;
};

using ProgressCallback = std::function<void(std::uint64_t)>;

[[nodiscard]] std::string share_endpoint(const std::string &share_url, const std::string &route);

/// Maps an HTTP status and body from a share server to a status: 401 and
/// INVALID_PASSWORD become AuthFailure, other non-2xx become errors.
[[nodiscard]] common::Status classify_response(long http_status, const std::string &body);

class ShareClient {
public:
  explicit ShareClient(ClientOptions options = {});
  ~ShareClient();

  ShareClient(const ShareClient &) = delete;
  ShareClient &operator=(const ShareClient &) = delete;

  [[nodiscard]] common::Result<std::string>
  fetch_manifest(const std::string &share_url, const std::optional<std::string> &password);

  /// Streams the package into destination via a ".part" sibling that is
  /// renamed on success and removed on failure.
  [[nodiscard]] common::Result<DownloadResult>
  download(const std::string &share_url, const std::filesystem::path &destination,
           const std::optional<std::string> &password,
           const ProgressCallback &on_progress = {});

private:
  ClientOptions options_;
};

} // namespace tunnelshare::client
