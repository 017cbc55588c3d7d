#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tunnelshare::observability {

struct ShareStartedEvent {
  std::string share_id;
  std::string provider;
  std::uint16_t port = 0;
  bool has_public_url = false;
};

struct ShareStoppedEvent {
  std::string share_id;
};

struct RequestServedEvent {
  std::string share_id;
  std::string method;
  std::string route;
  int status = 0;
};

struct ConnectionRejectedEvent {
  std::string share_id;
  std::uint64_t active = 0;
};

struct ConnectionTimeoutEvent {
  std::string share_id;
};

struct AuthFailureEvent {
  std::string share_id;
  std::string reason;
};

struct DownloadCompletedEvent {
  std::string share_id;
  std::uint32_t download_count = 0;
  std::uint64_t bytes = 0;
};

struct TunnelOutputEvent {
  std::string share_id;
  std::string stream;
  std::string line;
};

struct TunnelStatusEvent {
  std::string share_id;
  std::string status;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ShareStartedEvent, ShareStoppedEvent, RequestServedEvent,
                 ConnectionRejectedEvent, ConnectionTimeoutEvent, AuthFailureEvent,
                 DownloadCompletedEvent, TunnelOutputEvent, TunnelStatusEvent, WarningEvent,
                 ErrorEvent>;

struct ActiveConnectionsMetric {
  std::string share_id;
  std::uint64_t count = 0;
};

struct ActiveSharesMetric {
  std::uint64_t count = 0;
};

struct BytesServedMetric {
  std::string share_id;
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<ActiveConnectionsMetric, ActiveSharesMetric, BytesServedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace tunnelshare::observability
