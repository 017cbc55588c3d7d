#pragma once

#include "tunnelshare/common/result.hpp"

#include <cstddef>
#include <string>

namespace tunnelshare::security {

constexpr std::size_t kTokenBytes = 32;

/// 32 CSPRNG bytes, lowercase hex. Fails only if OpenSSL cannot seed.
[[nodiscard]] common::Result<std::string> generate_token();

[[nodiscard]] common::Result<std::string> generate_share_id();

/// Hex SHA-256 over password || salt. The salt is the share id the hash was created for.
[[nodiscard]] std::string hash_password(const std::string &password, const std::string &salt);

[[nodiscard]] bool constant_time_eq(const std::string &a, const std::string &b);

[[nodiscard]] bool validate_password(const std::string &provided, const std::string &salt,
                                     const std::string &expected_hash);

} // namespace tunnelshare::security
