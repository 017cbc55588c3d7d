#include "tunnelshare/server/http.hpp"

#include "tunnelshare/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <optional>
#include <sstream>

#ifndef _WIN32
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace tunnelshare::server {

namespace {

#if defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  const std::string value = common::trim(text);
  if (value.empty()) {
    return std::nullopt;
  }
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string HttpRequest::header(const std::string &name) const {
  const auto it = headers.find(common::to_lower(name));
  if (it == headers.end()) {
    return "";
  }
  return it->second;
}

bool HttpRequest::has_header(const std::string &name) const {
  return headers.contains(common::to_lower(name));
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  const std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);

  std::istringstream head_stream(head);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure(common::ErrorKind::InvalidArgument,
                                                "missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  if (!(req_line >> request.method >> request.target)) {
    return common::Result<HttpRequest>::failure(common::ErrorKind::InvalidArgument,
                                                "invalid request line");
  }
  if (request.target.empty() || request.target.front() != '/') {
    return common::Result<HttpRequest>::failure(common::ErrorKind::InvalidArgument,
                                                "request target must be an absolute path");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    const std::string value = common::trim(line.substr(colon + 1));
    request.headers.emplace(key, value);
  }

  const auto qpos = request.target.find('?');
  request.path = qpos == std::string::npos ? request.target : request.target.substr(0, qpos);
  return common::Result<HttpRequest>::success(std::move(request));
}

TokenPath split_token_path(const std::string &path) {
  const auto first = path.find_first_not_of('/');
  if (first == std::string::npos) {
    return TokenPath{.token = "", .rest = "/"};
  }
  const std::string stripped = path.substr(first);
  const auto slash = stripped.find('/');
  if (slash == std::string::npos) {
    return TokenPath{.token = stripped, .rest = "/"};
  }
  return TokenPath{.token = stripped.substr(0, slash), .rest = stripped.substr(slash)};
}

std::string percent_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      const int hi = hex_value(value[i + 1]);
      const int lo = hex_value(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

RangeSelection select_range(const std::string &range_header, const std::uint64_t file_size) {
  RangeSelection full{.kind = RangeKind::Full,
                      .start = 0,
                      .end = file_size == 0 ? 0 : file_size - 1,
                      .length = file_size};

  const std::string value = common::trim(range_header);
  if (!common::starts_with(common::to_lower(value), "bytes=")) {
    return full;
  }
  if (file_size == 0) {
    return RangeSelection{.kind = RangeKind::Unsatisfiable};
  }

  std::string range_spec = value.substr(6);
  if (const auto comma = range_spec.find(','); comma != std::string::npos) {
    range_spec = range_spec.substr(0, comma);
  }
  const auto dash = range_spec.find('-');
  const std::string start_text = dash == std::string::npos ? range_spec : range_spec.substr(0, dash);
  const std::string end_text = dash == std::string::npos ? "" : range_spec.substr(dash + 1);

  const std::uint64_t last = file_size - 1;
  const std::uint64_t start = std::min(parse_u64(start_text).value_or(0), last);
  const std::uint64_t end = std::min(parse_u64(end_text).value_or(last), last);
  if (start > end) {
    return RangeSelection{.kind = RangeKind::Unsatisfiable};
  }
  return RangeSelection{
      .kind = RangeKind::Partial, .start = start, .end = end, .length = end - start + 1};
}

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 206:
    return "Partial Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 416:
    return "Range Not Satisfiable";
  case 500:
    return "Internal Server Error";
  default:
    return "OK";
  }
}

HttpResponse text_response(const int status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "text/plain";
  response.body = body.empty() ? status_text(status) : std::move(body);
  return response;
}

std::string render_response_head(const HttpResponse &response,
                                 const std::uint64_t content_length) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << content_length << "\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "Connection: close\r\n";
  out << "\r\n";
  return out.str();
}

std::string render_http_response(const HttpResponse &response) {
  return render_response_head(response, response.body.size()) + response.body;
}

common::Status write_all(const int fd, const char *data, const std::size_t size,
                         const Deadline deadline) {
#ifdef _WIN32
  (void)fd;
  (void)data;
  (void)size;
  (void)deadline;
  return common::Status::error(common::ErrorKind::Io, "socket writes are not implemented on Windows");
#else
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = send(fd, data + sent, size - sent, kSendFlags);
    if (n > 0) {
      sent += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return common::Status::error(common::ErrorKind::RequestTimeout, "write timed out");
      }
      continue;
    }
    return common::Status::error(common::ErrorKind::Io,
                                 std::string("write failed: ") + std::strerror(errno));
  }
  return common::Status::success();
#endif
}

common::Status write_all(const int fd, const std::string &data, const Deadline deadline) {
  return write_all(fd, data.data(), data.size(), deadline);
}

} // namespace tunnelshare::server
