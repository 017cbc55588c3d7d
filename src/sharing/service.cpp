#include "tunnelshare/sharing/service.hpp"

#include "tunnelshare/common/fs.hpp"
#include "tunnelshare/observability/global.hpp"

namespace tunnelshare::sharing {

ShareService::ShareService(const config::Config &config, std::shared_ptr<IShareEventSink> events)
    : store_(std::make_unique<ShareStore>(common::expand_path(config.sharing.database))),
      registry_(std::make_unique<ShareRegistry>(config, std::move(events))) {}

common::Result<ShareInfo> ShareService::start(const ShareRequest &request) {
  auto started = registry_->start_share(request);
  if (!started.ok()) {
    return started;
  }
  if (auto saved = persist(started.value()); !saved.ok()) {
    if (auto stopped = registry_->stop_share(started.value().share_id); !stopped.ok()) {
      observability::record_warning("service", stopped.error());
    }
    return common::Result<ShareInfo>::failure(saved);
  }
  return started;
}

common::Status ShareService::stop(const std::string &share_id) {
  const common::Status stopped = registry_->stop_share(share_id);
  auto removed = store_->delete_share(share_id);
  if (!removed.ok()) {
    return removed.status();
  }
  if (!stopped.ok() && !removed.value()) {
    return stopped;
  }
  return common::Status::success();
}

common::Status ShareService::stop_all() {
  registry_->stop_all_shares();
  return store_->delete_all_shares();
}

common::Result<std::vector<ShareInfo>> ShareService::restore() {
  using RestoreResult = common::Result<std::vector<ShareInfo>>;
  auto rows = store_->list_shares();
  if (!rows.ok()) {
    return RestoreResult::failure(rows.status());
  }

  std::vector<ShareInfo> restored;
  for (const auto &row : rows.value()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(row.package_path, ec)) {
      observability::record_warning("service", "dropping share " + row.share_id +
                                                   ": package missing at " + row.package_path);
      if (auto removed = store_->delete_share(row.share_id); !removed.ok()) {
        return RestoreResult::failure(removed.status());
      }
      continue;
    }

    auto started = registry_->start_share_with_password_hash(
        row.package_path, row.instance_name, row.provider, row.password_hash, row.salt_id);
    if (auto removed = store_->delete_share(row.share_id); !removed.ok()) {
      return RestoreResult::failure(removed.status());
    }
    if (!started.ok()) {
      observability::record_warning("service", "failed to restore share " + row.share_id +
                                                   ": " + started.error());
      continue;
    }

    if (auto saved = persist(started.value()); !saved.ok()) {
      observability::record_warning("service", "restored share " + started.value().share_id +
                                                   " not saved: " + saved.error());
    }
    restored.push_back(started.value());
  }
  return RestoreResult::success(std::move(restored));
}

void ShareService::shutdown() { registry_->stop_all_shares(); }

std::vector<ShareInfo> ShareService::active() const { return registry_->get_active_shares(); }

common::Result<std::vector<PersistedShare>> ShareService::persisted() {
  return store_->list_shares();
}

common::Result<bool> ShareService::is_package_shared(const std::string &package_path) {
  return store_->is_package_shared(package_path);
}

common::Status ShareService::persist(const ShareInfo &info) {
  auto credentials = registry_->credentials(info.share_id);
  if (!credentials.ok()) {
    return credentials.status();
  }
  PersistedShare row;
  row.share_id = info.share_id;
  row.instance_name = info.instance_name;
  row.package_path = info.package_path;
  row.provider = info.provider;
  row.password_hash = credentials.value().password_hash;
  row.salt_id = credentials.value().salt;
  row.file_size = info.file_size;
  row.created_at = info.started_at;
  return store_->save_share(row);
}

} // namespace tunnelshare::sharing
