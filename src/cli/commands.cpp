#include "tunnelshare/cli/commands.hpp"

#include "tunnelshare/client/share_client.hpp"
#include "tunnelshare/common/fs.hpp"
#include "tunnelshare/common/json_util.hpp"
#include "tunnelshare/config/config.hpp"
#include "tunnelshare/observability/factory.hpp"
#include "tunnelshare/observability/global.hpp"
#include "tunnelshare/sharing/service.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tunnelshare::cli {

namespace {

std::string version_string() {
#ifdef TUNNELSHARE_VERSION
  return std::string("tunnelshare ") + TUNNELSHARE_VERSION;
#else
  return "tunnelshare 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

constexpr const char *kPasswordEnv = "TUNNELSHARE_SHARE_PASSWORD";

// Order: --password-stdin, --password, then TUNNELSHARE_SHARE_PASSWORD. An
// empty value means no password.
std::optional<std::string> take_password(std::vector<std::string> &args) {
  std::string value;
  const bool from_stdin = take_flag(args, "--password-stdin");
  const bool from_flag = take_option(args, "--password", "", value);
  if (from_stdin) {
    if (!std::getline(std::cin, value)) {
      value.clear();
    }
    if (!value.empty() && value.back() == '\r') {
      value.pop_back();
    }
  } else if (!from_flag) {
    if (const char *env = std::getenv(kPasswordEnv); env != nullptr) {
      value = env;
    }
  }
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::uint64_t> parse_seconds(const std::string &raw) {
  std::uint64_t value = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

/// Loads, validates and installs the observer for commands that serve shares.
common::Result<config::Config> load_runtime_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.status());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }
  return cfg;
}

class ConsoleEventSink final : public sharing::IShareEventSink {
public:
  explicit ConsoleEventSink(const bool json) : json_(json) {}

  void on_status(const sharing::ShareStatusEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (json_) {
      std::cout << sharing::to_json(event) << std::endl;
      return;
    }
    std::cout << "[" << event.share_id.substr(0, 8) << "] "
              << sharing::share_status_name(event.status);
    if (event.public_url.has_value()) {
      std::cout << " " << *event.public_url;
    }
    if (event.error.has_value()) {
      std::cout << " (" << *event.error << ")";
    }
    std::cout << std::endl;
  }

  void on_download(const sharing::ShareDownloadEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (json_) {
      std::cout << sharing::to_json(event) << std::endl;
      return;
    }
    if (event.completed) {
      std::cout << "[" << event.share_id.substr(0, 8) << "] download #" << event.download_count
                << " complete, " << event.uploaded_bytes << " bytes served" << std::endl;
    }
  }

private:
  const bool json_;
  std::mutex mutex_;
};

void print_share(const sharing::ShareInfo &info) {
  std::cout << "Share " << info.share_id << "\n";
  std::cout << "  Package:  " << info.package_path << " (" << info.file_size << " bytes)\n";
  std::cout << "  Name:     " << info.instance_name << "\n";
  std::cout << "  Provider: " << tunnel::provider_name(info.provider) << "\n";
  std::cout << "  Local:    http://127.0.0.1:" << info.local_port << "\n";
  std::cout << "  Password: " << (info.has_password ? "required" : "none") << "\n";
  if (info.public_url.has_value()) {
    std::cout << "  URL:      " << *info.public_url << "\n";
  } else {
    std::cout << "  URL:      (waiting for tunnel)\n";
  }
}

void serve_until_done(sharing::ShareService &service, const std::optional<std::uint64_t> duration) {
  if (duration.has_value() && *duration > 0) {
    std::this_thread::sleep_for(std::chrono::seconds(*duration));
  } else {
    std::cout << "Press Enter to stop sharing...\n";
    std::string line;
    std::getline(std::cin, line);
  }
  service.shutdown();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

int run_share(std::vector<std::string> args) {
  std::string name;
  std::string provider_raw;
  std::string duration_raw;
  const bool json = take_flag(args, "--json");
  const bool has_name = take_option(args, "--name", "-n", name);
  const bool has_provider = take_option(args, "--provider", "-p", provider_raw);
  const std::optional<std::string> password = take_password(args);
  const bool has_duration = take_option(args, "--duration-secs", "", duration_raw);
  if (args.size() != 1) {
    std::cerr << "usage: tunnelshare share FILE [--name NAME] [--provider bore|cloudflare] "
                 "[--password PW | --password-stdin] [--duration-secs N] [--json]\n";
    return 1;
  }

  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  auto provider = tunnel::parse_provider(has_provider ? provider_raw
                                                      : cfg.value().sharing.default_provider);
  if (!provider.ok()) {
    std::cerr << provider.error() << "\n";
    return 1;
  }
  std::optional<std::uint64_t> duration;
  if (has_duration) {
    duration = parse_seconds(duration_raw);
    if (!duration.has_value()) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  const std::filesystem::path package = args[0];
  sharing::ShareRequest request;
  request.package_path = std::filesystem::absolute(package);
  request.instance_name = has_name ? name : package.stem().string();
  request.provider = provider.value();
  request.password = password;

  sharing::ShareService service(cfg.value(), std::make_shared<ConsoleEventSink>(json));
  auto started = service.start(request);
  if (!started.ok()) {
    std::cerr << "share failed [" << common::error_kind_name(started.kind())
              << "]: " << started.error() << "\n";
    return 1;
  }
  if (json) {
    std::cout << sharing::to_json(started.value()) << std::endl;
  } else {
    print_share(started.value());
  }

  serve_until_done(service, duration);
  return 0;
}

int run_restore(std::vector<std::string> args) {
  std::string duration_raw;
  const bool json = take_flag(args, "--json");
  const bool has_duration = take_option(args, "--duration-secs", "", duration_raw);
  std::optional<std::uint64_t> duration;
  if (has_duration) {
    duration = parse_seconds(duration_raw);
    if (!duration.has_value()) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  auto cfg = load_runtime_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  sharing::ShareService service(cfg.value(), std::make_shared<ConsoleEventSink>(json));
  auto restored = service.restore();
  if (!restored.ok()) {
    std::cerr << restored.error() << "\n";
    return 1;
  }
  if (restored.value().empty()) {
    std::cout << "No shares to restore.\n";
    return 0;
  }
  for (const auto &info : restored.value()) {
    if (json) {
      std::cout << sharing::to_json(info) << std::endl;
    } else {
      print_share(info);
    }
  }

  serve_until_done(service, duration);
  return 0;
}

int run_list(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  sharing::ShareStore store(common::expand_path(cfg.value().sharing.database));
  auto rows = store.list_shares();
  if (!rows.ok()) {
    std::cerr << rows.error() << "\n";
    return 1;
  }
  if (rows.value().empty() && !json) {
    std::cout << "No saved shares.\n";
    return 0;
  }
  for (const auto &row : rows.value()) {
    if (json) {
      std::cout << "{\"share_id\":\"" << common::json_escape(row.share_id) << "\",\"package_path\":\""
                << common::json_escape(row.package_path) << "\",\"provider\":\""
                << tunnel::provider_name(row.provider) << "\",\"has_password\":"
                << (row.password_hash.has_value() ? "true" : "false") << "}\n";
      continue;
    }
    std::cout << row.share_id << "  " << tunnel::provider_name(row.provider) << "  "
              << (row.password_hash.has_value() ? "password  " : "open      ")
              << row.instance_name << "  " << row.package_path << "\n";
  }
  return 0;
}

int run_forget(std::vector<std::string> args) {
  const bool all = take_flag(args, "--all");
  if (!all && args.size() != 1) {
    std::cerr << "usage: tunnelshare forget SHARE_ID | --all\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  sharing::ShareService service(cfg.value(), nullptr);
  const common::Status status = all ? service.stop_all() : service.stop(args[0]);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << (all ? "Forgot all shares.\n" : "Forgot share " + args[0] + ".\n");
  return 0;
}

int run_manifest(std::vector<std::string> args) {
  const std::optional<std::string> password = take_password(args);
  if (args.size() != 1) {
    std::cerr << "usage: tunnelshare manifest SHARE_URL [--password PW | --password-stdin]\n";
    return 1;
  }

  client::ShareClient share_client;
  auto manifest = share_client.fetch_manifest(args[0], password);
  if (!manifest.ok()) {
    std::cerr << "manifest failed [" << common::error_kind_name(manifest.kind())
              << "]: " << manifest.error() << "\n";
    return 1;
  }
  std::cout << manifest.value() << "\n";
  return 0;
}

int run_download(std::vector<std::string> args) {
  const std::optional<std::string> password = take_password(args);
  if (args.size() != 2) {
    std::cerr << "usage: tunnelshare download SHARE_URL DEST [--password PW | --password-stdin]\n";
    return 1;
  }

  client::ShareClient share_client;
  auto downloaded = share_client.download(args[0], args[1], password);
  if (!downloaded.ok()) {
    std::cerr << "download failed [" << common::error_kind_name(downloaded.kind())
              << "]: " << downloaded.error() << "\n";
    return 1;
  }
  std::cout << "Saved " << downloaded.value().bytes << " bytes to "
            << downloaded.value().path.string() << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] != "validate") {
    std::cerr << "usage: tunnelshare config validate\n";
    return 1;
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cout << "warning: " << warning << "\n";
  }
  std::cout << "Configuration OK\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: tunnelshare [--config PATH] <command> [options]\n\n";
  std::cout << "Sharing:\n";
  std::cout << "  share FILE       Serve a package through a public tunnel\n";
  std::cout << "                   --name NAME --provider bore|cloudflare --password PW\n";
  std::cout << "                   --password-stdin --duration-secs N --json\n";
  std::cout << "  restore          Restart every saved share\n";
  std::cout << "  list             Show saved shares\n";
  std::cout << "  forget ID|--all  Stop and forget saved shares\n\n";
  std::cout << "Receiving:\n";
  std::cout << "  manifest URL     Print the manifest of a shared package\n";
  std::cout << "  download URL DEST\n";
  std::cout << "                   Download a shared package (--password PW)\n";
  std::cout << "                   Passwords may also come from --password-stdin or\n";
  std::cout << "                   TUNNELSHARE_SHARE_PASSWORD\n\n";
  std::cout << "Other:\n";
  std::cout << "  config validate  Check the configuration file\n";
  std::cout << "  config-path      Print the configuration file path\n";
  std::cout << "  version          Show version\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "share") {
    return run_share(std::move(args));
  }
  if (subcommand == "restore") {
    return run_restore(std::move(args));
  }
  if (subcommand == "list") {
    return run_list(std::move(args));
  }
  if (subcommand == "forget") {
    return run_forget(std::move(args));
  }
  if (subcommand == "manifest") {
    return run_manifest(std::move(args));
  }
  if (subcommand == "download") {
    return run_download(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tunnelshare::cli
