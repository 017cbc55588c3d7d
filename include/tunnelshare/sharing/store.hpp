#pragma once

#include "tunnelshare/common/result.hpp"
#include "tunnelshare/tunnel/agent.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace tunnelshare::sharing {

struct PersistedShare {
  std::string share_id;
  std::string instance_name;
  std::string package_path;
  tunnel::Provider provider = tunnel::Provider::Bore;
  std::optional<std::string> password_hash;
  std::string salt_id;
  std::uint64_t file_size = 0;
  std::string created_at;
};

class ShareStore {
public:
  explicit ShareStore(std::filesystem::path db_path);
  ~ShareStore();

  ShareStore(const ShareStore &) = delete;
  ShareStore &operator=(const ShareStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }

  [[nodiscard]] common::Status save_share(const PersistedShare &share);
  [[nodiscard]] common::Result<bool> delete_share(const std::string &share_id);
  [[nodiscard]] common::Status delete_all_shares();
  [[nodiscard]] common::Result<std::vector<PersistedShare>> list_shares();
  [[nodiscard]] common::Result<bool> is_package_shared(const std::string &package_path);

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
};

} // namespace tunnelshare::sharing
