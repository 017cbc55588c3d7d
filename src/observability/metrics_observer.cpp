#include "tunnelshare/observability/metrics_observer.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

namespace tunnelshare::observability {

std::uint64_t MetricsSnapshot::total_bytes_served() const {
  std::uint64_t total = 0;
  for (const auto &[share_id, bytes] : bytes_served) {
    total += bytes;
  }
  return total;
}

void MetricsObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RequestServedEvent>) {
          ++totals_.requests;
        } else if constexpr (std::is_same_v<T, ConnectionRejectedEvent>) {
          ++totals_.rejected_connections;
        } else if constexpr (std::is_same_v<T, ConnectionTimeoutEvent>) {
          ++totals_.timed_out_connections;
        } else if constexpr (std::is_same_v<T, AuthFailureEvent>) {
          ++totals_.auth_failures;
        } else if constexpr (std::is_same_v<T, DownloadCompletedEvent>) {
          ++totals_.completed_downloads;
        } else if constexpr (std::is_same_v<T, TunnelStatusEvent>) {
          if (evt.status == "error") {
            ++totals_.tunnel_errors;
          }
        } else if constexpr (std::is_same_v<T, ShareStoppedEvent>) {
          totals_.active_connections.erase(evt.share_id);
        }
      },
      event);
}

void MetricsObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveConnectionsMetric>) {
          totals_.active_connections[m.share_id] = m.count;
        } else if constexpr (std::is_same_v<T, ActiveSharesMetric>) {
          totals_.active_shares = m.count;
        } else if constexpr (std::is_same_v<T, BytesServedMetric>) {
          auto &bytes = totals_.bytes_served[m.share_id];
          bytes = std::max(bytes, m.bytes);
        }
      },
      metric);
}

void MetricsObserver::flush() {
  const MetricsSnapshot totals = snapshot();
  std::cerr << "[INFO] metrics requests=" << totals.requests
            << " downloads=" << totals.completed_downloads
            << " bytes=" << totals.total_bytes_served()
            << " rejected=" << totals.rejected_connections
            << " timeouts=" << totals.timed_out_connections
            << " auth_failures=" << totals.auth_failures
            << " tunnel_errors=" << totals.tunnel_errors << "\n";
}

MetricsSnapshot MetricsObserver::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return totals_;
}

} // namespace tunnelshare::observability
