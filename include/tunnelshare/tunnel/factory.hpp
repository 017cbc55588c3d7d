#pragma once

#include "tunnelshare/config/schema.hpp"
#include "tunnelshare/tunnel/agent.hpp"

#include <filesystem>
#include <memory>

namespace tunnelshare::tunnel {

/// tunnel.<provider>.command_path when set, else {agents_dir}/bore or
/// {agents_dir}/cloudflared.
[[nodiscard]] std::filesystem::path resolve_agent_path(Provider provider,
                                                       const config::Config &config);

[[nodiscard]] common::Result<std::shared_ptr<ITunnelAgent>>
create_agent(Provider provider, const config::Config &config);

} // namespace tunnelshare::tunnel
