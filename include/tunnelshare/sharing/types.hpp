#pragma once

#include "tunnelshare/sharing/events.hpp"
#include "tunnelshare/tunnel/agent.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tunnelshare::sharing {

struct ShareRequest {
  std::filesystem::path package_path;
  std::string instance_name;
  tunnel::Provider provider = tunnel::Provider::Bore;
  std::optional<std::string> password;
};

/// Public view of an active share. Never carries the token or password hash
/// apart from inside public_url.
struct ShareInfo {
  std::string share_id;
  std::string instance_name;
  std::string package_path;
  std::uint16_t local_port = 0;
  std::optional<std::string> public_url;
  std::uint32_t download_count = 0;
  std::uint64_t uploaded_bytes = 0;
  std::string started_at;
  std::uint64_t file_size = 0;
  tunnel::Provider provider = tunnel::Provider::Bore;
  bool has_password = false;
  ShareStatus status = ShareStatus::Connecting;
};

struct ShareCredentials {
  std::optional<std::string> password_hash;
  std::string salt;
};

[[nodiscard]] std::string to_json(const ShareInfo &info);

[[nodiscard]] std::string compose_share_url(const std::string &base, const std::string &token);

} // namespace tunnelshare::sharing
