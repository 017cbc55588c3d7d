#include "tunnelshare/security/credentials.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <array>
#include <iomanip>
#include <sstream>
#include <vector>

namespace tunnelshare::security {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

common::Status random_bytes(unsigned char *out, const std::size_t size) {
  if (RAND_bytes(out, static_cast<int>(size)) != 1) {
    return common::Status::error("RAND_bytes failed");
  }
  return common::Status::success();
}

} // namespace

common::Result<std::string> generate_token() {
  std::vector<unsigned char> data(kTokenBytes);
  if (auto status = random_bytes(data.data(), data.size()); !status.ok()) {
    return common::Result<std::string>::failure(status);
  }
  return common::Result<std::string>::success(to_hex(data.data(), data.size()));
}

common::Result<std::string> generate_share_id() {
  std::array<unsigned char, 16> bytes{};
  if (auto status = random_bytes(bytes.data(), bytes.size()); !status.ok()) {
    return common::Result<std::string>::failure(status);
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  const std::string hex = to_hex(bytes.data(), bytes.size());
  return common::Result<std::string>::success(hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" +
                                              hex.substr(12, 4) + "-" + hex.substr(16, 4) +
                                              "-" + hex.substr(20));
}

std::string hash_password(const std::string &password, const std::string &salt) {
  const std::string material = password + salt;
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(material.data()), material.size(), digest);
  return to_hex(digest, sizeof(digest));
}

bool constant_time_eq(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

bool validate_password(const std::string &provided, const std::string &salt,
                       const std::string &expected_hash) {
  return constant_time_eq(hash_password(provided, salt), expected_hash);
}

} // namespace tunnelshare::security
