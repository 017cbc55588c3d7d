#include "tunnelshare/tunnel/factory.hpp"

#include "tunnelshare/common/fs.hpp"
#include "tunnelshare/tunnel/bore.hpp"
#include "tunnelshare/tunnel/cloudflare.hpp"

namespace tunnelshare::tunnel {

std::filesystem::path resolve_agent_path(const Provider provider, const config::Config &config) {
  const std::string override_path = provider == Provider::Bore
                                        ? config.tunnel.bore.command_path
                                        : config.tunnel.cloudflare.command_path;
  if (!common::trim(override_path).empty()) {
    return common::expand_path(common::trim(override_path));
  }
  const std::filesystem::path dir = common::expand_path(config.sharing.agents_dir);
#ifdef _WIN32
  return dir / (provider == Provider::Bore ? "bore.exe" : "cloudflared.exe");
#else
  return dir / (provider == Provider::Bore ? "bore" : "cloudflared");
#endif
}

common::Result<std::shared_ptr<ITunnelAgent>> create_agent(const Provider provider,
                                                            const config::Config &config) {
  using AgentResult = common::Result<std::shared_ptr<ITunnelAgent>>;
  const std::filesystem::path path = resolve_agent_path(provider, config);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return AgentResult::failure(common::ErrorKind::AgentMissing,
                                std::string(provider_name(provider)) +
                                    " agent not installed at " + path.string());
  }

  if (provider == Provider::Cloudflare) {
    return AgentResult::success(std::make_shared<CloudflareAgent>(path.string()));
  }
  const std::string server = common::trim(config.tunnel.bore.server).empty()
                                 ? std::string("bore.pub")
                                 : common::trim(config.tunnel.bore.server);
  return AgentResult::success(std::make_shared<BoreAgent>(path.string(), server));
}

} // namespace tunnelshare::tunnel
