#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tunnelshare/security/credentials.hpp"
#include "tunnelshare/server/responder.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <memory>
#include <stdexcept>
#include <thread>

namespace {

namespace srv = tunnelshare::server;
namespace ts = tunnelshare::testing;

constexpr const char *kToken = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";

struct Fixture {
  ts::TempWorkspace workspace;
  std::shared_ptr<ts::RecordingEventSink> sink = std::make_shared<ts::RecordingEventSink>();
  srv::ShareContext context;

  explicit Fixture(const std::string &payload = "payload") {
    const auto package = ts::write_package(workspace, "My Project.kaizen", payload);
    context.share_id = "share-under-test";
    context.package = srv::ServedPackage{.path = package,
                                         .file_name = "My Project.kaizen",
                                         .alias = "instance.kaizen",
                                         .manifest_entry = "kaizen-manifest.json"};
    context.access = srv::ShareAccess{.token = kToken, .password_hash = std::nullopt,
                                      .password_salt = "share-under-test"};
    context.counters = std::make_shared<tunnelshare::sharing::LiveCounters>();
    context.events = sink;
    context.auth_failure_delay = std::chrono::milliseconds(1);
  }

  void require_password(const std::string &password) {
    context.access.password_hash =
        tunnelshare::security::hash_password(password, context.access.password_salt);
  }
};

struct Exchange {
  tunnelshare::common::Status status = tunnelshare::common::Status::success();
  std::string response;
};

Exchange serve_once(const srv::ShareContext &context, const std::string &raw_request) {
  int fds[2] = {-1, -1};
  if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    throw std::runtime_error("socketpair failed");
  }
  Exchange exchange;
  std::thread handler([&]() {
    exchange.status = srv::handle_connection(
        fds[1], context, std::chrono::steady_clock::now() + std::chrono::seconds(10));
    shutdown(fds[1], SHUT_RDWR);
  });

  size_t sent = 0;
  while (sent < raw_request.size()) {
    const ssize_t n = send(fds[0], raw_request.data() + sent, raw_request.size() - sent, 0);
    if (n <= 0) {
      break;
    }
    sent += static_cast<size_t>(n);
  }
  char buffer[16384];
  while (true) {
    const ssize_t n = recv(fds[0], buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    exchange.response.append(buffer, static_cast<size_t>(n));
  }
  handler.join();
  close(fds[0]);
  close(fds[1]);
  return exchange;
}

std::string get(const std::string &path, const std::string &extra_headers = "") {
  return "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n" + extra_headers + "\r\n";
}

bool has_header(const std::string &response, const std::string &line) {
  return response.find(line + "\r\n") != std::string::npos;
}

} // namespace

void register_responder_tests(std::vector<tunnelshare::tests::TestCase> &tests) {
  using tunnelshare::tests::require;
  using tunnelshare::tests::require_ok;

  tests.push_back({"route_request_maps_paths", [] {
                     srv::ServedPackage package{.path = "/tmp/x.kaizen",
                                                .file_name = "x.kaizen",
                                                .alias = "instance.kaizen"};
                     require(srv::route_request("GET", "/", package) == srv::Route::File, "root");
                     require(srv::route_request("GET", "/download", package) == srv::Route::File,
                             "download");
                     require(srv::route_request("GET", "/x.kaizen", package) == srv::Route::File,
                             "file name");
                     require(srv::route_request("GET", "/instance.kaizen", package) ==
                                 srv::Route::File,
                             "alias");
                     require(srv::route_request("GET", "/manifest", package) ==
                                 srv::Route::Manifest,
                             "manifest");
                     require(srv::route_request("HEAD", "/download", package) == srv::Route::Head,
                             "head");
                     require(srv::route_request("HEAD", "/manifest", package) ==
                                 srv::Route::NotFound,
                             "head manifest");
                     require(srv::route_request("POST", "/download", package) ==
                                 srv::Route::NotFound,
                             "post");
                     require(srv::route_request("GET", "/other", package) == srv::Route::NotFound,
                             "unknown path");
                   }});

  tests.push_back({"full_download_serves_whole_file_and_counts_once", [] {
                     Fixture fixture;
                     const auto expected_size =
                         std::filesystem::file_size(fixture.context.package.path);
                     auto exchange = serve_once(fixture.context, get(std::string("/") + kToken +
                                                                     "/download"));
                     require_ok(exchange.status);
                     require(ts::response_status(exchange.response) == 200, exchange.response);
                     require(has_header(exchange.response,
                                        "Content-Length: " + std::to_string(expected_size)),
                             "content length");
                     require(has_header(exchange.response, "Content-Type: application/zip"),
                             "content type");
                     require(has_header(exchange.response, "Accept-Ranges: bytes"), "ranges");
                     require(has_header(exchange.response,
                                        "Content-Disposition: attachment; filename=\"My Project.kaizen\""),
                             "disposition");
                     require(exchange.response.find("Content-Range") == std::string::npos,
                             "no content range on 200");
                     require(ts::response_body(exchange.response).size() == expected_size,
                             "body length");
                     require(fixture.context.counters->download_count() == 1, "one completion");
                     require(fixture.context.counters->uploaded_bytes() == expected_size,
                             "bytes counted");
                     require(fixture.sink->saw_completed_download(), "completed event");
                   }});

  tests.push_back({"range_request_returns_partial_content_without_completion", [] {
                     Fixture fixture;
                     const auto size = std::filesystem::file_size(fixture.context.package.path);
                     auto exchange = serve_once(
                         fixture.context,
                         get(std::string("/") + kToken + "/download", "Range: bytes=10-\r\n"));
                     require_ok(exchange.status);
                     require(ts::response_status(exchange.response) == 206, exchange.response);
                     require(has_header(exchange.response,
                                        "Content-Range: bytes 10-" + std::to_string(size - 1) +
                                            "/" + std::to_string(size)),
                             "content range");
                     require(ts::response_body(exchange.response).size() == size - 10,
                             "partial body length");
                     require(fixture.context.counters->download_count() == 0,
                             "range is not a completed download");
                     require(fixture.context.counters->uploaded_bytes() == size - 10,
                             "range bytes counted");
                     require(!fixture.sink->saw_completed_download(), "no completed event");
                   }});

  tests.push_back({"unsatisfiable_range_is_416", [] {
                     Fixture fixture;
                     const auto size = std::filesystem::file_size(fixture.context.package.path);
                     auto exchange = serve_once(
                         fixture.context,
                         get(std::string("/") + kToken + "/download", "Range: bytes=9-3\r\n"));
                     require(ts::response_status(exchange.response) == 416, exchange.response);
                     require(has_header(exchange.response,
                                        "Content-Range: bytes */" + std::to_string(size)),
                             "416 content range");
                   }});

  tests.push_back({"large_download_reports_progress_and_exact_bytes", [] {
                     Fixture fixture(std::string(700 * 1024, 'q'));
                     const auto size = std::filesystem::file_size(fixture.context.package.path);
                     auto exchange =
                         serve_once(fixture.context, get(std::string("/") + kToken + "/"));
                     require_ok(exchange.status);
                     require(ts::response_body(exchange.response).size() == size, "body length");
                     require(fixture.context.counters->uploaded_bytes() == size,
                             "remainder flushed into the byte counter");
                     const auto downloads = fixture.sink->downloads();
                     require(downloads.size() >= 3, "progress events before completion");
                     require(!downloads.front().completed, "first event is progress");
                     require(downloads.back().completed, "last event is completion");
                     require(downloads.back().uploaded_bytes == size, "completion carries total");
                   }});

  tests.push_back({"head_request_sends_headers_only", [] {
                     Fixture fixture;
                     auto exchange = serve_once(fixture.context,
                                                "HEAD /" + std::string(kToken) +
                                                    "/download HTTP/1.1\r\n\r\n");
                     require(ts::response_status(exchange.response) == 200, exchange.response);
                     require(ts::response_body(exchange.response).empty(), "no body on HEAD");
                     require(fixture.context.counters->download_count() == 0, "no completion");
                   }});

  tests.push_back({"file_name_and_alias_routes_serve_package", [] {
                     Fixture fixture;
                     auto by_name = serve_once(fixture.context,
                                               get(std::string("/") + kToken +
                                                   "/My%20Project.kaizen"));
                     require(ts::response_status(by_name.response) == 200, by_name.response);
                     auto by_alias = serve_once(fixture.context,
                                                get(std::string("/") + kToken +
                                                    "/instance.kaizen"));
                     require(ts::response_status(by_alias.response) == 200, by_alias.response);
                     require(fixture.context.counters->download_count() == 2, "two completions");
                   }});

  tests.push_back({"manifest_route_returns_json", [] {
                     Fixture fixture;
                     auto exchange =
                         serve_once(fixture.context, get(std::string("/") + kToken + "/manifest"));
                     require(ts::response_status(exchange.response) == 200, exchange.response);
                     require(has_header(exchange.response, "Content-Type: application/json"),
                             "json content type");
                     require(has_header(exchange.response, "Access-Control-Allow-Origin: *"),
                             "cors header");
                     require(ts::response_body(exchange.response).find("\"version\":\"1.0\"") !=
                                 std::string::npos,
                             "manifest body");
                     require(fixture.context.counters->download_count() == 0,
                             "manifest is not a download");
                   }});

  tests.push_back({"manifest_failure_is_500", [] {
                     Fixture fixture;
                     fixture.context.package.manifest_entry = "absent.json";
                     auto exchange =
                         serve_once(fixture.context, get(std::string("/") + kToken + "/manifest"));
                     require(ts::response_status(exchange.response) == 500, exchange.response);
                     require(ts::response_body(exchange.response) == "Manifest unavailable",
                             "500 body");
                   }});

  tests.push_back({"token_checks", [] {
                     Fixture fixture;
                     auto missing = serve_once(fixture.context, get("/"));
                     require(ts::response_status(missing.response) == 403, missing.response);
                     require(ts::response_body(missing.response) == "Access denied", "no token");

                     auto wrong = serve_once(fixture.context, get("/not-the-token/download"));
                     require(ts::response_status(wrong.response) == 403, wrong.response);
                     require(ts::response_body(wrong.response) ==
                                 "Invalid or missing access token",
                             "wrong token body");

                     auto prefix = serve_once(
                         fixture.context, get(std::string("/") + std::string(kToken).substr(0, 63)));
                     require(ts::response_status(prefix.response) == 403, "token prefix rejected");
                     require(fixture.context.counters->download_count() == 0, "nothing served");
                   }});

  tests.push_back({"password_checks", [] {
                     Fixture fixture;
                     fixture.require_password("s3cret");
                     const std::string path = std::string("/") + kToken + "/download";

                     auto missing = serve_once(fixture.context, get(path));
                     require(ts::response_status(missing.response) == 401, missing.response);
                     require(ts::response_body(missing.response) == "PASSWORD_REQUIRED",
                             "401 body");

                     auto wrong = serve_once(fixture.context,
                                             get(path, "X-Share-Password: nope\r\n"));
                     require(ts::response_status(wrong.response) == 403, wrong.response);
                     require(ts::response_body(wrong.response) == "INVALID_PASSWORD", "403 body");

                     auto right = serve_once(fixture.context,
                                             get(path, "x-share-password: s3cret\r\n"));
                     require(ts::response_status(right.response) == 200, right.response);
                     require(fixture.context.counters->download_count() == 1, "one download");
                   }});

  tests.push_back({"malformed_and_unknown_requests", [] {
                     Fixture fixture;
                     auto garbage = serve_once(fixture.context, "NONSENSE\r\n\r\n");
                     require(ts::response_status(garbage.response) == 400, garbage.response);

                     auto unknown =
                         serve_once(fixture.context, get(std::string("/") + kToken + "/etc/passwd"));
                     require(ts::response_status(unknown.response) == 404, unknown.response);

                     auto post = serve_once(fixture.context, "POST /" + std::string(kToken) +
                                                                 "/download HTTP/1.1\r\n\r\n");
                     require(ts::response_status(post.response) == 404, post.response);
                   }});

  tests.push_back({"missing_package_is_404", [] {
                     Fixture fixture;
                     std::filesystem::remove(fixture.context.package.path);
                     auto exchange =
                         serve_once(fixture.context, get(std::string("/") + kToken + "/download"));
                     require(ts::response_status(exchange.response) == 404, exchange.response);
                     require(ts::response_body(exchange.response) == "File not found", "404 body");
                   }});
}
