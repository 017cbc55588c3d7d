#pragma once

#include "tunnelshare/common/result.hpp"

#include <cstdint>

namespace tunnelshare::net {

/// Binds 127.0.0.1:0, reads the kernel-assigned port and releases the socket.
[[nodiscard]] common::Result<std::uint16_t> allocate_ephemeral_port();

} // namespace tunnelshare::net
