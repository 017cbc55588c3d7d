#include "tunnelshare/server/responder.hpp"

#include "tunnelshare/observability/global.hpp"
#include "tunnelshare/package/manifest.hpp"
#include "tunnelshare/security/credentials.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>

#ifndef _WIN32
#include <sys/socket.h>
#endif

namespace tunnelshare::server {

namespace {

std::string route_label(const Route route) {
  switch (route) {
  case Route::File:
    return "file";
  case Route::Head:
    return "head";
  case Route::Manifest:
    return "manifest";
  case Route::NotFound:
    return "not_found";
  }
  return "unknown";
}

bool is_package_path(const std::string &rest, const ServedPackage &package) {
  if (rest == "/" || rest == "/download") {
    return true;
  }
  const std::string name = rest.substr(1);
  return (!package.file_name.empty() && name == package.file_name) ||
         (!package.alias.empty() && name == package.alias);
}

std::string disposition_name(const std::string &file_name) {
  std::string out = file_name;
  std::replace_if(
      out.begin(), out.end(), [](const char ch) { return ch == '"' || ch == '\r' || ch == '\n'; },
      '_');
  return out;
}

common::Status respond(const int fd, const ShareContext &context, const std::string &method,
                       const std::string &label, const HttpResponse &response,
                       const Deadline deadline) {
  observability::record_request(context.share_id, method, label, response.status);
  return write_all(fd, render_http_response(response), deadline);
}

void emit_download(const ShareContext &context, const bool completed) {
  if (!context.events) {
    return;
  }
  context.events->on_download(sharing::ShareDownloadEvent{
      .share_id = context.share_id,
      .download_count = context.counters->download_count(),
      .uploaded_bytes = context.counters->uploaded_bytes(),
      .completed = completed,
  });
}

common::Status serve_manifest(const int fd, const ShareContext &context,
                              const std::string &method, const Deadline deadline) {
  auto manifest = package::read_manifest(context.package.path, context.package.manifest_entry);
  if (!manifest.ok()) {
    observability::record_warning("responder", "manifest for share " + context.share_id +
                                                   " unavailable: " + manifest.error());
    return respond(fd, context, method, "manifest", text_response(500, "Manifest unavailable"),
                   deadline);
  }

  HttpResponse response;
  response.status = 200;
  response.content_type = "application/json";
  response.headers.emplace_back("Access-Control-Allow-Origin", "*");
  response.body = std::move(manifest.value());
  return respond(fd, context, method, "manifest", response, deadline);
}

common::Status serve_file(const int fd, const ShareContext &context, const HttpRequest &request,
                          const bool head_only, const Deadline deadline) {
  const std::string label = head_only ? "head" : "file";
  std::error_code ec;
  const std::uint64_t file_size = std::filesystem::file_size(context.package.path, ec);
  std::ifstream file(context.package.path, std::ios::binary);
  if (ec || !file) {
    observability::record_warning("responder",
                                  "package missing for share " + context.share_id);
    return respond(fd, context, request.method, label, text_response(404, "File not found"),
                   deadline);
  }

  const RangeSelection range = select_range(request.header("range"), file_size);
  if (range.kind == RangeKind::Unsatisfiable) {
    HttpResponse response = text_response(416, "");
    response.headers.emplace_back("Content-Range", "bytes */" + std::to_string(file_size));
    return respond(fd, context, request.method, label, response, deadline);
  }

  HttpResponse head;
  head.status = range.kind == RangeKind::Partial ? 206 : 200;
  head.content_type = "application/zip";
  if (range.kind == RangeKind::Partial) {
    head.headers.emplace_back("Content-Range", "bytes " + std::to_string(range.start) + "-" +
                                                   std::to_string(range.end) + "/" +
                                                   std::to_string(file_size));
  }
  head.headers.emplace_back("Content-Disposition", "attachment; filename=\"" +
                                                       disposition_name(context.package.file_name) +
                                                       "\"");
  head.headers.emplace_back("Accept-Ranges", "bytes");

  observability::record_request(context.share_id, request.method, label, head.status);
  if (auto status = write_all(fd, render_response_head(head, range.length), deadline);
      !status.ok()) {
    return status;
  }
  if (head_only) {
    return common::Status::success();
  }

  file.seekg(static_cast<std::streamoff>(range.start));
  std::array<char, kChunkBytes> buffer{};
  std::uint64_t remaining = range.length;
  std::uint64_t sent = 0;
  std::uint64_t pending = 0;
  common::Status outcome = common::Status::success();

  while (remaining > 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      outcome = common::Status::error(common::ErrorKind::RequestTimeout, "transfer timed out");
      break;
    }
    const auto want = static_cast<std::streamsize>(
        std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buffer.size())));
    file.read(buffer.data(), want);
    const std::streamsize got = file.gcount();
    if (got <= 0) {
      outcome = common::Status::error(common::ErrorKind::Io, "short read on package");
      break;
    }
    if (auto status = write_all(fd, buffer.data(), static_cast<std::size_t>(got), deadline);
        !status.ok()) {
      outcome = status;
      break;
    }
    remaining -= static_cast<std::uint64_t>(got);
    sent += static_cast<std::uint64_t>(got);
    pending += static_cast<std::uint64_t>(got);

    if (pending >= kProgressIntervalBytes) {
      context.counters->add_bytes(pending);
      pending = 0;
      emit_download(context, false);
    }
  }

  if (pending > 0) {
    context.counters->add_bytes(pending);
  }
  observability::record_metric(observability::BytesServedMetric{
      .share_id = context.share_id, .bytes = context.counters->uploaded_bytes()});

  if (outcome.ok() && range.start == 0 && sent >= file_size) {
    const std::uint32_t count = context.counters->increment_downloads();
    emit_download(context, true);
    observability::record_download_completed(context.share_id, count,
                                             context.counters->uploaded_bytes());
  } else {
    emit_download(context, false);
  }
  return outcome;
}

} // namespace

Route route_request(const std::string &method, const std::string &rest,
                    const ServedPackage &package) {
  if (method == "GET") {
    if (rest == "/manifest") {
      return Route::Manifest;
    }
    return is_package_path(rest, package) ? Route::File : Route::NotFound;
  }
  if (method == "HEAD" && is_package_path(rest, package)) {
    return Route::Head;
  }
  return Route::NotFound;
}

common::Result<std::string> read_request(const int fd, const Deadline deadline) {
#ifdef _WIN32
  (void)fd;
  (void)deadline;
  return common::Result<std::string>::failure(common::ErrorKind::Io,
                                              "socket reads are not implemented on Windows");
#else
  std::string raw;
  std::array<char, 1024> buffer{};
  while (raw.size() < kMaxRequestBytes && raw.find("\r\n\r\n") == std::string::npos) {
    const std::size_t want = std::min(buffer.size(), kMaxRequestBytes - raw.size());
    const ssize_t n = recv(fd, buffer.data(), want, 0);
    if (n > 0) {
      raw.append(buffer.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return common::Result<std::string>::failure(common::ErrorKind::RequestTimeout,
                                                    "request read timed out");
      }
      continue;
    }
    return common::Result<std::string>::failure(
        common::ErrorKind::Io, std::string("request read failed: ") + std::strerror(errno));
  }
  return common::Result<std::string>::success(std::move(raw));
#endif
}

common::Status handle_connection(const int fd, const ShareContext &context,
                                 const Deadline deadline) {
  auto raw = read_request(fd, deadline);
  if (!raw.ok()) {
    return raw.status();
  }

  auto parsed = parse_http_request(raw.value());
  if (!parsed.ok()) {
    return respond(fd, context, "-", "invalid", text_response(400, "Bad Request"), deadline);
  }
  const HttpRequest &request = parsed.value();

  const TokenPath token_path = split_token_path(request.path);
  if (token_path.token.empty()) {
    observability::record_auth_failure(context.share_id, "missing token");
    return respond(fd, context, request.method, "auth", text_response(403, "Access denied"),
                   deadline);
  }
  if (!security::constant_time_eq(token_path.token, context.access.token)) {
    std::this_thread::sleep_for(context.auth_failure_delay);
    observability::record_auth_failure(context.share_id, "invalid token");
    return respond(fd, context, request.method, "auth",
                   text_response(403, "Invalid or missing access token"), deadline);
  }

  if (context.access.password_hash.has_value()) {
    if (!request.has_header("x-share-password")) {
      observability::record_auth_failure(context.share_id, "password required");
      return respond(fd, context, request.method, "auth",
                     text_response(401, "PASSWORD_REQUIRED"), deadline);
    }
    if (!security::validate_password(request.header("x-share-password"),
                                     context.access.password_salt,
                                     *context.access.password_hash)) {
      std::this_thread::sleep_for(context.auth_failure_delay);
      observability::record_auth_failure(context.share_id, "invalid password");
      return respond(fd, context, request.method, "auth",
                     text_response(403, "INVALID_PASSWORD"), deadline);
    }
  }

  const Route route = route_request(request.method, percent_decode(token_path.rest),
                                    context.package);
  switch (route) {
  case Route::File:
    return serve_file(fd, context, request, false, deadline);
  case Route::Head:
    return serve_file(fd, context, request, true, deadline);
  case Route::Manifest:
    return serve_manifest(fd, context, request.method, deadline);
  case Route::NotFound:
    break;
  }
  return respond(fd, context, request.method, route_label(route), text_response(404, "Not Found"),
                 deadline);
}

} // namespace tunnelshare::server
