#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tunnelshare/client/share_client.hpp"
#include "tunnelshare/net/port_allocator.hpp"
#include "tunnelshare/security/credentials.hpp"
#include "tunnelshare/server/file_server.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace {

namespace cl = tunnelshare::client;
namespace srv = tunnelshare::server;
namespace ts = tunnelshare::testing;
using tunnelshare::common::ErrorKind;

constexpr const char *kToken = "c0ffeec0ffeec0ffeec0ffeec0ffeec0ffeec0ffeec0ffeec0ffeec0ffeec0ff";

struct LocalShare {
  ts::TempWorkspace workspace;
  std::filesystem::path package;
  std::unique_ptr<srv::FileServer> server;

  explicit LocalShare(const std::optional<std::string> &password = std::nullopt,
                      const std::string &payload = "payload") {
    package = ts::write_package(workspace, "client.kaizen", payload);
    srv::ShareContext context;
    context.share_id = "client-test";
    context.package = srv::ServedPackage{.path = package, .file_name = "client.kaizen",
                                         .alias = "instance.kaizen"};
    context.access.token = kToken;
    context.access.password_salt = context.share_id;
    if (password.has_value()) {
      context.access.password_hash =
          tunnelshare::security::hash_password(*password, context.share_id);
    }
    context.counters = std::make_shared<tunnelshare::sharing::LiveCounters>();
    context.events = std::make_shared<tunnelshare::sharing::NullEventSink>();
    context.auth_failure_delay = std::chrono::milliseconds(1);
    server = std::make_unique<srv::FileServer>(std::move(context), srv::FileServerOptions{});
    auto started = server->start();
    if (!started.ok()) {
      throw std::runtime_error(started.error());
    }
  }

  std::string url() const {
    return "http://127.0.0.1:" + std::to_string(server->port()) + "/" + kToken;
  }
};

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

void register_client_tests(std::vector<tunnelshare::tests::TestCase> &tests) {
  using tunnelshare::tests::require;
  using tunnelshare::tests::require_ok;

  tests.push_back({"share_endpoint_joins_route", [] {
                     require(cl::share_endpoint("http://h:1/tok/", "manifest") ==
                                 "http://h:1/tok/manifest",
                             "trailing slash removed");
                     require(cl::share_endpoint(" http://h:1/tok ", "download") ==
                                 "http://h:1/tok/download",
                             "whitespace trimmed");
                   }});

  tests.push_back({"classify_response_maps_statuses", [] {
                     require(cl::classify_response(200, "").ok(), "200 ok");
                     require(cl::classify_response(206, "").ok(), "206 ok");

                     auto required = cl::classify_response(401, "PASSWORD_REQUIRED");
                     require(required.kind() == ErrorKind::AuthFailure &&
                                 required.error() == "PASSWORD_REQUIRED",
                             "401");
                     auto invalid = cl::classify_response(403, "INVALID_PASSWORD");
                     require(invalid.kind() == ErrorKind::AuthFailure &&
                                 invalid.error() == "INVALID_PASSWORD",
                             "403 password");
                     auto denied = cl::classify_response(403, "Invalid or missing access token");
                     require(denied.kind() == ErrorKind::AuthFailure &&
                                 denied.error().rfind("Access denied", 0) == 0,
                             "403 token");
                     require(cl::classify_response(404, "").kind() == ErrorKind::NotFound, "404");
                     require(cl::classify_response(500, "boom").kind() == ErrorKind::Network,
                             "500");
                   }});

  tests.push_back({"client_fetches_manifest_and_downloads", [] {
                     LocalShare share(std::nullopt, std::string(200000, 'd'));
                     cl::ShareClient client;
                     auto manifest = client.fetch_manifest(share.url(), std::nullopt);
                     require_ok(manifest);
                     require(manifest.value().find("\"version\":\"1.0\"") != std::string::npos,
                             "manifest body");

                     const auto dest = share.workspace.path() / "out" / "copy.kaizen";
                     std::uint64_t last_progress = 0;
                     auto downloaded = client.download(
                         share.url(), dest, std::nullopt,
                         [&](const std::uint64_t bytes) { last_progress = bytes; });
                     require_ok(downloaded);
                     require(downloaded.value().bytes == std::filesystem::file_size(share.package),
                             "byte count");
                     require(last_progress == downloaded.value().bytes, "progress reaches total");
                     require(read_file(dest) == read_file(share.package), "identical copy");
                     require(!std::filesystem::exists(dest.string() + ".part"), "part file gone");
                   }});

  tests.push_back({"client_reports_password_errors", [] {
                     LocalShare share(std::string("pw"));
                     cl::ShareClient client;
                     auto required = client.fetch_manifest(share.url(), std::nullopt);
                     require(!required.ok() && required.kind() == ErrorKind::AuthFailure &&
                                 required.error() == "PASSWORD_REQUIRED",
                             "password required: " + required.error());

                     auto wrong = client.fetch_manifest(share.url(), std::string("nope"));
                     require(!wrong.ok() && wrong.error() == "INVALID_PASSWORD",
                             "invalid password: " + wrong.error());

                     const auto dest = share.workspace.path() / "denied.kaizen";
                     auto denied = client.download(share.url(), dest, std::string("nope"));
                     require(!denied.ok() && denied.kind() == ErrorKind::AuthFailure,
                             "download denied");
                     require(!std::filesystem::exists(dest), "no file on failure");
                     require(!std::filesystem::exists(dest.string() + ".part"), "part removed");

                     auto allowed = client.download(share.url(), dest, std::string("pw"));
                     require_ok(allowed);
                   }});

  tests.push_back({"client_reports_network_errors", [] {
                     auto port = tunnelshare::net::allocate_ephemeral_port();
                     require_ok(port);
                     cl::ShareClient client(cl::ClientOptions{.timeout_ms = 2000,
                                                              .connect_timeout_ms = 2000});
                     auto refused = client.fetch_manifest(
                         "http://127.0.0.1:" + std::to_string(port.value()) + "/tok", std::nullopt);
                     require(!refused.ok(), "closed port should fail");
                     require(refused.kind() == ErrorKind::Network, "Network kind");

                     LocalShare share;
                     auto wrong_token = client.fetch_manifest(
                         "http://127.0.0.1:" + std::to_string(share.server->port()) + "/bad",
                         std::nullopt);
                     require(!wrong_token.ok() && wrong_token.kind() == ErrorKind::AuthFailure,
                             "wrong token is AuthFailure");
                   }});
}
