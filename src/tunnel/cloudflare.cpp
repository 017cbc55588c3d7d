#include "tunnelshare/tunnel/cloudflare.hpp"

namespace tunnelshare::tunnel {

CloudflareAgent::CloudflareAgent(std::string command_path)
    : command_path_(std::move(command_path)),
      url_pattern_(R"(https://[a-zA-Z0-9-]+\.trycloudflare\.com)") {}

std::vector<std::string> CloudflareAgent::build_args(const std::uint16_t local_port) const {
  return {"tunnel", "--url", "http://localhost:" + std::to_string(local_port)};
}

std::optional<std::string> CloudflareAgent::extract_url(const std::string &line) const {
  std::smatch match;
  if (std::regex_search(line, match, url_pattern_)) {
    return match[0].str();
  }
  return std::nullopt;
}

} // namespace tunnelshare::tunnel
