#pragma once

#include "tunnelshare/tunnel/agent.hpp"

#include <regex>
#include <string>

namespace tunnelshare::tunnel {

class BoreAgent final : public ITunnelAgent {
public:
  BoreAgent(std::string command_path, std::string server = "bore.pub");

  [[nodiscard]] Provider provider() const override { return Provider::Bore; }
  [[nodiscard]] const std::string &command_path() const override { return command_path_; }
  [[nodiscard]] std::vector<std::string> build_args(std::uint16_t local_port) const override;
  [[nodiscard]] std::optional<std::string> extract_url(const std::string &line) const override;

  [[nodiscard]] const std::string &server() const { return server_; }

private:
  std::string command_path_;
  std::string server_;
  std::regex listening_pattern_;
  std::regex server_pattern_;
};

} // namespace tunnelshare::tunnel
