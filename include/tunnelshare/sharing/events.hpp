#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tunnelshare::sharing {

enum class ShareStatus { Connecting, Connected, Error, Disconnected };

[[nodiscard]] std::string_view share_status_name(ShareStatus status);

struct ShareStatusEvent {
  std::string share_id;
  ShareStatus status = ShareStatus::Connecting;
  std::optional<std::string> public_url;
  std::optional<std::string> error;
};

struct ShareDownloadEvent {
  std::string share_id;
  std::uint32_t download_count = 0;
  std::uint64_t uploaded_bytes = 0;
  bool completed = false;
};

[[nodiscard]] std::string to_json(const ShareStatusEvent &event);
[[nodiscard]] std::string to_json(const ShareDownloadEvent &event);

/// Receives share status and download progress for the host application.
/// Called from connection and tunnel threads; implementations must be thread safe.
class IShareEventSink {
public:
  virtual ~IShareEventSink() = default;

  virtual void on_status(const ShareStatusEvent &event) = 0;
  virtual void on_download(const ShareDownloadEvent &event) = 0;
};

class NullEventSink final : public IShareEventSink {
public:
  void on_status(const ShareStatusEvent &) override {}
  void on_download(const ShareDownloadEvent &) override {}
};

} // namespace tunnelshare::sharing
