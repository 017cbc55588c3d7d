#pragma once

#include "tunnelshare/common/result.hpp"
#include "tunnelshare/config/schema.hpp"
#include "tunnelshare/sharing/registry.hpp"
#include "tunnelshare/sharing/store.hpp"

#include <memory>
#include <vector>

namespace tunnelshare::sharing {

class ShareService {
public:
  ShareService(const config::Config &config, std::shared_ptr<IShareEventSink> events);

  [[nodiscard]] common::Result<ShareInfo> start(const ShareRequest &request);
  /// Stops the share if active and forgets its record. NotFound only when
  /// neither exists.
  [[nodiscard]] common::Status stop(const std::string &share_id);
  [[nodiscard]] common::Status stop_all();
  /// Restarts every persisted share whose package still exists. Records of
  /// vanished packages and failed restarts are removed.
  [[nodiscard]] common::Result<std::vector<ShareInfo>> restore();
  void shutdown();

  [[nodiscard]] std::vector<ShareInfo> active() const;
  [[nodiscard]] common::Result<std::vector<PersistedShare>> persisted();
  [[nodiscard]] common::Result<bool> is_package_shared(const std::string &package_path);

  [[nodiscard]] ShareRegistry &registry() { return *registry_; }

private:
  [[nodiscard]] common::Status persist(const ShareInfo &info);

  std::unique_ptr<ShareStore> store_;
  std::unique_ptr<ShareRegistry> registry_;
};

} // namespace tunnelshare::sharing
