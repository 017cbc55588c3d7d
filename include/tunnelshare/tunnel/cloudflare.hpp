#pragma once

#include "tunnelshare/tunnel/agent.hpp"

#include <regex>
#include <string>

namespace tunnelshare::tunnel {

class CloudflareAgent final : public ITunnelAgent {
public:
  explicit CloudflareAgent(std::string command_path);

  [[nodiscard]] Provider provider() const override { return Provider::Cloudflare; }
  [[nodiscard]] const std::string &command_path() const override { return command_path_; }
  [[nodiscard]] std::vector<std::string> build_args(std::uint16_t local_port) const override;
  [[nodiscard]] std::optional<std::string> extract_url(const std::string &line) const override;

private:
  std::string command_path_;
  std::regex url_pattern_;
};

} // namespace tunnelshare::tunnel
