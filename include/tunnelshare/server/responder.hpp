#pragma once

#include "tunnelshare/common/result.hpp"
#include "tunnelshare/server/http.hpp"
#include "tunnelshare/sharing/counters.hpp"
#include "tunnelshare/sharing/events.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace tunnelshare::server {

constexpr std::size_t kMaxRequestBytes = 4096;
constexpr std::size_t kChunkBytes = 64 * 1024;
constexpr std::size_t kProgressIntervalBytes = 256 * 1024;

struct ServedPackage {
  std::filesystem::path path;
  std::string file_name;
  std::string alias;
  std::string manifest_entry = "kaizen-manifest.json";
};

struct ShareAccess {
  std::string token;
  std::optional<std::string> password_hash;
  std::string password_salt;
};

struct ShareContext {
  std::string share_id;
  ServedPackage package;
  ShareAccess access;
  std::shared_ptr<sharing::LiveCounters> counters;
  std::shared_ptr<sharing::IShareEventSink> events;
  std::chrono::milliseconds auth_failure_delay{100};
};

enum class Route { File, Head, Manifest, NotFound };

[[nodiscard]] Route route_request(const std::string &method, const std::string &rest,
                                  const ServedPackage &package);

[[nodiscard]] common::Result<std::string> read_request(int fd, Deadline deadline);

/// Serves exactly one request on fd. Does not close fd. Returns the transport
/// outcome; HTTP-level rejections are successful responses.
[[nodiscard]] common::Status handle_connection(int fd, const ShareContext &context,
                                               Deadline deadline);

} // namespace tunnelshare::server
