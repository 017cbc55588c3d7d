#include "tunnelshare/client/share_client.hpp"

#include "tunnelshare/common/fs.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <fstream>

#ifndef TUNNELSHARE_VERSION
#define TUNNELSHARE_VERSION "0.1.0"
#endif

namespace tunnelshare::client {

namespace {

constexpr std::size_t kMaxErrorBody = 4096;
constexpr const char *kUserAgent = "tunnelshare/" TUNNELSHARE_VERSION;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

struct DownloadContext {
  CURL *curl = nullptr;
  std::ofstream *file = nullptr;
  std::string error_body;
  std::uint64_t bytes = 0;
  const ProgressCallback *on_progress = nullptr;
};

size_t download_write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<DownloadContext *>(userdata);

  long status = 0;
  curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    if (context->error_body.size() < kMaxErrorBody) {
      context->error_body.append(ptr, std::min(total, kMaxErrorBody - context->error_body.size()));
    }
    return total;
  }

  context->file->write(ptr, static_cast<std::streamsize>(total));
  if (!*context->file) {
    return 0;
  }
  context->bytes += total;
  if (context->on_progress != nullptr && *context->on_progress) {
    (*context->on_progress)(context->bytes);
  }
  return total;
}

curl_slist *password_header(const std::optional<std::string> &password) {
  if (!password.has_value()) {
    return nullptr;
  }
  const std::string line = "X-Share-Password: " + *password;
  return curl_slist_append(nullptr, line.c_str());
}

common::Status transport_error(const CURLcode code) {
  return common::Status::error(code == CURLE_OPERATION_TIMEDOUT
                                   ? common::ErrorKind::RequestTimeout
                                   : common::ErrorKind::Network,
                               curl_easy_strerror(code));
}

} // namespace

std::string share_endpoint(const std::string &share_url, const std::string &route) {
  std::string base = common::trim(share_url);
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + route;
}

common::Status classify_response(const long http_status, const std::string &body) {
  if (http_status >= 200 && http_status < 300) {
    return common::Status::success();
  }
  const std::string text = common::trim(body);
  if (http_status == 401) {
    return common::Status::error(common::ErrorKind::AuthFailure, "PASSWORD_REQUIRED");
  }
  if (http_status == 403) {
    if (text.find("INVALID_PASSWORD") != std::string::npos) {
      return common::Status::error(common::ErrorKind::AuthFailure, "INVALID_PASSWORD");
    }
    return common::Status::error(common::ErrorKind::AuthFailure,
                                 "Access denied" + (text.empty() ? "" : ": " + text));
  }
  if (http_status == 404) {
    return common::Status::error(common::ErrorKind::NotFound,
                                 "Not found" + (text.empty() ? "" : ": " + text));
  }
  return common::Status::error(common::ErrorKind::Network,
                               "HTTP " + std::to_string(http_status) +
                                   (text.empty() ? "" : ": " + text));
}

ShareClient::ShareClient(ClientOptions options) : options_(options) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

ShareClient::~ShareClient() { curl_global_cleanup(); }

common::Result<std::string> ShareClient::fetch_manifest(const std::string &share_url,
                                                        const std::optional<std::string> &password) {
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return common::Result<std::string>::failure(common::ErrorKind::Network,
                                                "curl_easy_init failed");
  }

  const std::string url = share_endpoint(share_url, "manifest");
  std::string body;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_slist *headers = password_header(password);
  if (headers != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  if (code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  }
  if (headers != nullptr) {
    curl_slist_free_all(headers);
  }
  curl_easy_cleanup(curl);

  if (code != CURLE_OK) {
    return common::Result<std::string>::failure(transport_error(code));
  }
  if (auto classified = classify_response(status, body); !classified.ok()) {
    return common::Result<std::string>::failure(classified);
  }
  return common::Result<std::string>::success(std::move(body));
}

common::Result<DownloadResult> ShareClient::download(const std::string &share_url,
                                                     const std::filesystem::path &destination,
                                                     const std::optional<std::string> &password,
                                                     const ProgressCallback &on_progress) {
  using DownloadOutcome = common::Result<DownloadResult>;
  std::error_code ec;
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path(), ec);
  }
  std::filesystem::path part = destination;
  part += ".part";

  std::ofstream file(part, std::ios::binary | std::ios::trunc);
  if (!file) {
    return DownloadOutcome::failure(common::ErrorKind::Io, "Failed to open " + part.string());
  }

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    file.close();
    std::filesystem::remove(part, ec);
    return DownloadOutcome::failure(common::ErrorKind::Network, "curl_easy_init failed");
  }

  const std::string url = share_endpoint(share_url, "download");
  DownloadContext context{.curl = curl, .file = &file, .on_progress = &on_progress};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, download_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_slist *headers = password_header(password);
  if (headers != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  if (code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  }
  if (headers != nullptr) {
    curl_slist_free_all(headers);
  }
  curl_easy_cleanup(curl);
  file.close();

  if (code != CURLE_OK) {
    std::filesystem::remove(part, ec);
    if (code == CURLE_WRITE_ERROR) {
      return DownloadOutcome::failure(common::ErrorKind::Io,
                                      "Failed to write " + part.string());
    }
    return DownloadOutcome::failure(transport_error(code));
  }
  if (auto classified = classify_response(status, context.error_body); !classified.ok()) {
    std::filesystem::remove(part, ec);
    return DownloadOutcome::failure(classified);
  }

  std::filesystem::rename(part, destination, ec);
  if (ec) {
    std::filesystem::remove(part, ec);
    return DownloadOutcome::failure(common::ErrorKind::Io,
                                    "Failed to move download into " + destination.string());
  }
  return DownloadOutcome::success(DownloadResult{.path = destination, .bytes = context.bytes});
}

} // namespace tunnelshare::client
