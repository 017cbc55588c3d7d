#pragma once

#include "tunnelshare/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tunnelshare::tunnel {

enum class Provider { Bore, Cloudflare };

[[nodiscard]] std::string_view provider_name(Provider provider);
[[nodiscard]] common::Result<Provider> parse_provider(const std::string &value);
[[nodiscard]] Provider provider_or_default(const std::string &value);

/// A tunnel agent binary: how to invoke it and how to read its public URL
/// from the lines it prints.
class ITunnelAgent {
public:
  virtual ~ITunnelAgent() = default;

  [[nodiscard]] virtual Provider provider() const = 0;
  [[nodiscard]] virtual const std::string &command_path() const = 0;
  [[nodiscard]] virtual std::vector<std::string> build_args(std::uint16_t local_port) const = 0;
  [[nodiscard]] virtual std::optional<std::string> extract_url(const std::string &line) const = 0;
};

[[nodiscard]] bool line_reports_error(const std::string &line);

} // namespace tunnelshare::tunnel
