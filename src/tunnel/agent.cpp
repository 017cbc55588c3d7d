#include "tunnelshare/tunnel/agent.hpp"

#include "tunnelshare/common/fs.hpp"

namespace tunnelshare::tunnel {

std::string_view provider_name(const Provider provider) {
  switch (provider) {
  case Provider::Bore:
    return "bore";
  case Provider::Cloudflare:
    return "cloudflare";
  }
  return "bore";
}

common::Result<Provider> parse_provider(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "bore") {
    return common::Result<Provider>::success(Provider::Bore);
  }
  if (lowered == "cloudflare") {
    return common::Result<Provider>::success(Provider::Cloudflare);
  }
  return common::Result<Provider>::failure(common::ErrorKind::InvalidArgument,
                                           "unknown tunnel provider: " + value);
}

Provider provider_or_default(const std::string &value) {
  auto parsed = parse_provider(value);
  return parsed.ok() ? parsed.value() : Provider::Bore;
}

bool line_reports_error(const std::string &line) {
  const std::string lowered = common::to_lower(line);
  return lowered.find("error") != std::string::npos ||
         lowered.find("failed") != std::string::npos;
}

} // namespace tunnelshare::tunnel
