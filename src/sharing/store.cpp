#include "tunnelshare/sharing/store.hpp"

namespace tunnelshare::sharing {

namespace {

constexpr const char *kNotInitialized = "share db not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::Database, message);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  return text == nullptr ? "" : text;
}

} // namespace

ShareStore::ShareStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 2000);
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

ShareStore::~ShareStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status ShareStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Database, kNotInitialized);
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS persistent_shares (
  share_id TEXT PRIMARY KEY,
  instance_name TEXT NOT NULL,
  package_path TEXT NOT NULL,
  provider TEXT NOT NULL,
  password_hash TEXT,
  salt_id TEXT NOT NULL,
  file_size INTEGER NOT NULL,
  created_at TEXT NOT NULL
);
)");
}

common::Status ShareStore::save_share(const PersistedShare &share) {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Database, kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO persistent_shares(share_id, instance_name, "
                    "package_path, provider, password_hash, salt_id, file_size, created_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }

  const std::string provider(tunnel::provider_name(share.provider));
  sqlite3_bind_text(stmt, 1, share.share_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, share.instance_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, share.package_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, provider.c_str(), -1, SQLITE_TRANSIENT);
  if (share.password_hash.has_value()) {
    sqlite3_bind_text(stmt, 5, share.password_hash->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 5);
  }
  sqlite3_bind_text(stmt, 6, share.salt_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(share.file_size));
  sqlite3_bind_text(stmt, 8, share.created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<bool> ShareStore::delete_share(const std::string &share_id) {
  if (db_ == nullptr) {
    return common::Result<bool>::failure(common::ErrorKind::Database, kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM persistent_shares WHERE share_id = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, share_id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Status ShareStore::delete_all_shares() {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Database, kNotInitialized);
  }
  return exec_sql(db_, "DELETE FROM persistent_shares");
}

common::Result<std::vector<PersistedShare>> ShareStore::list_shares() {
  using ListResult = common::Result<std::vector<PersistedShare>>;
  if (db_ == nullptr) {
    return ListResult::failure(common::ErrorKind::Database, kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT share_id, instance_name, package_path, provider, password_hash, "
                         "salt_id, file_size, created_at FROM persistent_shares ORDER BY "
                         "created_at ASC",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return ListResult::failure(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }

  std::vector<PersistedShare> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    PersistedShare share;
    share.share_id = column_text(stmt, 0);
    share.instance_name = column_text(stmt, 1);
    share.package_path = column_text(stmt, 2);
    share.provider = tunnel::provider_or_default(column_text(stmt, 3));
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
      share.password_hash = column_text(stmt, 4);
    }
    share.salt_id = column_text(stmt, 5);
    if (share.salt_id.empty()) {
      share.salt_id = share.share_id;
    }
    share.file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
    share.created_at = column_text(stmt, 7);
    out.push_back(std::move(share));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ListResult::failure(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }
  return ListResult::success(std::move(out));
}

common::Result<bool> ShareStore::is_package_shared(const std::string &package_path) {
  if (db_ == nullptr) {
    return common::Result<bool>::failure(common::ErrorKind::Database, kNotInitialized);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM persistent_shares WHERE package_path = ?1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, package_path.c_str(), -1, SQLITE_TRANSIENT);
  bool shared = false;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    shared = sqlite3_column_int64(stmt, 0) > 0;
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return common::Result<bool>::failure(common::ErrorKind::Database, sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(shared);
}

} // namespace tunnelshare::sharing
