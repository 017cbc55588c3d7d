#include "tunnelshare/config/config.hpp"

#include "tunnelshare/common/fs.hpp"
#include "tunnelshare/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <vector>

namespace tunnelshare::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tunnelshare";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TUNNELSHARE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

void load_sharing_config(Config &config, const common::TomlDocument &doc) {
  auto &sharing = config.sharing;
  sharing.default_provider =
      common::to_lower(doc.get_string("sharing.default_provider", sharing.default_provider));
  sharing.max_connections = static_cast<std::uint32_t>(
      doc.get_u64("sharing.max_connections", sharing.max_connections));
  sharing.request_timeout_secs =
      doc.get_u64("sharing.request_timeout_secs", sharing.request_timeout_secs);
  sharing.url_wait_secs = doc.get_u64("sharing.url_wait_secs", sharing.url_wait_secs);
  sharing.agents_dir = doc.get_string("sharing.agents_dir", sharing.agents_dir);
  sharing.database = doc.get_string("sharing.database", sharing.database);
  sharing.manifest_entry = doc.get_string("sharing.manifest_entry", sharing.manifest_entry);
  sharing.package_alias = doc.get_string("sharing.package_alias", sharing.package_alias);
}

void load_tunnel_config(Config &config, const common::TomlDocument &doc) {
  config.tunnel.bore.command_path =
      doc.get_string("tunnel.bore.command_path", config.tunnel.bore.command_path);
  config.tunnel.bore.server = doc.get_string("tunnel.bore.server", config.tunnel.bore.server);
  config.tunnel.cloudflare.command_path =
      doc.get_string("tunnel.cloudflare.command_path", config.tunnel.cloudflare.command_path);
}

void expand_paths(Config &config) {
  config.sharing.agents_dir = expand_config_value(config.sharing.agents_dir);
  config.sharing.database = expand_config_value(config.sharing.database);
  config.tunnel.bore.command_path = expand_config_value(config.tunnel.bore.command_path);
  config.tunnel.cloudflare.command_path =
      expand_config_value(config.tunnel.cloudflare.command_path);
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }

  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9]))$)");
  return std::regex_match(host, host_re);
}

bool is_known_backend(const std::string &backend) {
  std::stringstream stream(common::to_lower(backend));
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (name != "log" && name != "metrics" && name != "none" && name != "noop") {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Config, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const char *provider = std::getenv("TUNNELSHARE_PROVIDER"); provider != nullptr && *provider) {
    config.sharing.default_provider = common::to_lower(provider);
  }
  if (const char *agents = std::getenv("TUNNELSHARE_AGENTS_DIR"); agents != nullptr && *agents) {
    config.sharing.agents_dir = common::expand_path(agents);
  }
  if (const char *backend = std::getenv("TUNNELSHARE_OBSERVABILITY"); backend != nullptr &&
                                                                       *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }

  const auto &doc = parsed.value();
  Config config;
  load_sharing_config(config, doc);
  load_tunnel_config(config, doc);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  expand_paths(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    expand_paths(config);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return config;
  }

  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorKind::Io,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorKind::Io, "Unable to write temporary config file");
  }

  const auto &sharing = config.sharing;
  file << "[sharing]\n";
  file << "default_provider = " << common::quote_toml_string(sharing.default_provider) << "\n";
  file << "max_connections = " << sharing.max_connections << "\n";
  file << "request_timeout_secs = " << sharing.request_timeout_secs << "\n";
  file << "url_wait_secs = " << sharing.url_wait_secs << "\n";
  file << "agents_dir = " << common::quote_toml_string(sharing.agents_dir) << "\n";
  file << "database = " << common::quote_toml_string(sharing.database) << "\n";
  file << "manifest_entry = " << common::quote_toml_string(sharing.manifest_entry) << "\n";
  file << "package_alias = " << common::quote_toml_string(sharing.package_alias) << "\n";

  file << "\n[tunnel.bore]\n";
  file << "command_path = " << common::quote_toml_string(config.tunnel.bore.command_path) << "\n";
  file << "server = " << common::quote_toml_string(config.tunnel.bore.server) << "\n";

  file << "\n[tunnel.cloudflare]\n";
  file << "command_path = " << common::quote_toml_string(config.tunnel.cloudflare.command_path)
       << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error(common::ErrorKind::Io, "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Io,
                                 "Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;
  const auto &sharing = config.sharing;

  const std::string provider = common::to_lower(common::trim(sharing.default_provider));
  if (provider != "bore" && provider != "cloudflare") {
    return Warnings::failure(common::ErrorKind::Config,
                             "Invalid sharing.default_provider: " + sharing.default_provider);
  }

  if (sharing.max_connections == 0) {
    return Warnings::failure(common::ErrorKind::Config, "sharing.max_connections must be > 0");
  }
  if (sharing.request_timeout_secs == 0) {
    return Warnings::failure(common::ErrorKind::Config,
                             "sharing.request_timeout_secs must be > 0");
  }
  if (common::trim(sharing.manifest_entry).empty()) {
    return Warnings::failure(common::ErrorKind::Config, "sharing.manifest_entry must not be empty");
  }
  if (sharing.package_alias.find('/') != std::string::npos) {
    return Warnings::failure(common::ErrorKind::Config,
                             "sharing.package_alias must be a bare file name");
  }

  if (!is_valid_host(config.tunnel.bore.server)) {
    return Warnings::failure(common::ErrorKind::Config,
                             "tunnel.bore.server is invalid: " + config.tunnel.bore.server);
  }

  if (!is_known_backend(config.observability.backend)) {
    return Warnings::failure(common::ErrorKind::Config,
                             "Invalid observability.backend: " + config.observability.backend);
  }

  if (sharing.url_wait_secs == 0) {
    warnings.push_back("sharing.url_wait_secs is 0; shares always start without a public URL");
  }
  if (sharing.url_wait_secs > sharing.request_timeout_secs) {
    warnings.push_back("sharing.url_wait_secs exceeds sharing.request_timeout_secs");
  }
  if (sharing.max_connections > 256) {
    warnings.push_back("sharing.max_connections above 256 spawns one thread per connection");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace tunnelshare::config
