#include "tunnelshare/observability/log_observer.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace tunnelshare::observability {

namespace {

std::mutex g_log_mutex;

void log_line(const std::string &level, const std::string &message) {
  const std::string line = "[" + level + "] " + message + "\n";
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << line;
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ShareStartedEvent>) {
          log_line("INFO", "share.start id=" + evt.share_id + " provider=" + evt.provider +
                               " port=" + std::to_string(evt.port) +
                               " public_url=" + bool_text(evt.has_public_url));
        } else if constexpr (std::is_same_v<T, ShareStoppedEvent>) {
          log_line("INFO", "share.stop id=" + evt.share_id);
        } else if constexpr (std::is_same_v<T, RequestServedEvent>) {
          log_line("DEBUG", "share.request id=" + evt.share_id + " method=" + evt.method +
                                " route=" + evt.route + " status=" + std::to_string(evt.status));
        } else if constexpr (std::is_same_v<T, ConnectionRejectedEvent>) {
          log_line("WARN", "share.rate_limited id=" + evt.share_id +
                               " active=" + std::to_string(evt.active));
        } else if constexpr (std::is_same_v<T, ConnectionTimeoutEvent>) {
          log_line("WARN", "share.timeout id=" + evt.share_id);
        } else if constexpr (std::is_same_v<T, AuthFailureEvent>) {
          log_line("WARN", "share.auth_failure id=" + evt.share_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, DownloadCompletedEvent>) {
          log_line("INFO", "share.download id=" + evt.share_id +
                               " count=" + std::to_string(evt.download_count) +
                               " bytes=" + std::to_string(evt.bytes));
        } else if constexpr (std::is_same_v<T, TunnelOutputEvent>) {
          log_line("DEBUG", "tunnel." + evt.stream + " id=" + evt.share_id + " " + evt.line);
        } else if constexpr (std::is_same_v<T, TunnelStatusEvent>) {
          std::string message = "tunnel.status id=" + evt.share_id + " status=" + evt.status;
          if (!evt.detail.empty()) {
            message += " detail=" + evt.detail;
          }
          log_line(evt.status == "error" ? "ERROR" : "INFO", message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveConnectionsMetric>) {
          log_line("DEBUG", "metric.active_connections id=" + m.share_id + " " +
                                std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ActiveSharesMetric>) {
          log_line("DEBUG", "metric.active_shares=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, BytesServedMetric>) {
          log_line("DEBUG",
                   "metric.bytes_served id=" + m.share_id + " " + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr.flush();
}

} // namespace tunnelshare::observability
