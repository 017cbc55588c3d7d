#pragma once

#include "tunnelshare/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tunnelshare::server {

using Deadline = std::chrono::steady_clock::time_point;

struct HttpRequest {
  std::string method;
  std::string target;
  std::string path;
  std::unordered_map<std::string, std::string> headers;

  [[nodiscard]] std::string header(const std::string &name) const;
  [[nodiscard]] bool has_header(const std::string &name) const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "text/plain";
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

/// Splits "/{token}/{rest}". rest always starts with '/'.
struct TokenPath {
  std::string token;
  std::string rest;
};

enum class RangeKind { Full, Partial, Unsatisfiable };

struct RangeSelection {
  RangeKind kind = RangeKind::Full;
  std::uint64_t start = 0;
  std::uint64_t end = 0;
  std::uint64_t length = 0;
};

/// Parses the request line and headers of at most one request head. Header
/// names are lowercased. Fails on a request line without method and target.
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);

[[nodiscard]] TokenPath split_token_path(const std::string &path);
[[nodiscard]] std::string percent_decode(const std::string &value);

/// Interprets a "Range: bytes=start-end" value against a file of file_size
/// bytes. Missing start is 0, missing end is file_size - 1, both clamped to
/// the file. An empty or absent header selects the whole file.
[[nodiscard]] RangeSelection select_range(const std::string &range_header,
                                          std::uint64_t file_size);

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] HttpResponse text_response(int status, std::string body);

[[nodiscard]] std::string render_response_head(const HttpResponse &response,
                                               std::uint64_t content_length);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// Writes everything or fails. A socket send timeout is retried until the
/// deadline passes, then reported as RequestTimeout.
[[nodiscard]] common::Status write_all(int fd, const char *data, std::size_t size,
                                       Deadline deadline = Deadline::max());
[[nodiscard]] common::Status write_all(int fd, const std::string &data,
                                       Deadline deadline = Deadline::max());

} // namespace tunnelshare::server
