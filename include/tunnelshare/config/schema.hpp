#pragma once

#include <cstdint>
#include <string>

namespace tunnelshare::config {

struct SharingConfig {
  std::string default_provider = "bore";
  std::uint32_t max_connections = 10;
  std::uint64_t request_timeout_secs = 300;
  std::uint64_t url_wait_secs = 30;
  std::string agents_dir = "~/.tunnelshare/agents";
  std::string database = "~/.tunnelshare/shares.db";
  std::string manifest_entry = "kaizen-manifest.json";
  std::string package_alias = "instance.kaizen";
};

struct BoreConfig {
  std::string command_path;
  std::string server = "bore.pub";
};

struct CloudflareConfig {
  std::string command_path;
};

struct TunnelConfig {
  BoreConfig bore;
  CloudflareConfig cloudflare;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SharingConfig sharing;
  TunnelConfig tunnel;
  ObservabilityConfig observability;
};

} // namespace tunnelshare::config
