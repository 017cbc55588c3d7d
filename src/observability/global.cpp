#include "tunnelshare/observability/global.hpp"

#include <mutex>

namespace tunnelshare::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_share_started(const std::string &share_id, const std::string &provider,
                          const std::uint16_t port, const bool has_public_url) {
  record_event(ShareStartedEvent{.share_id = share_id,
                                 .provider = provider,
                                 .port = port,
                                 .has_public_url = has_public_url});
}

void record_share_stopped(const std::string &share_id) {
  record_event(ShareStoppedEvent{.share_id = share_id});
}

void record_request(const std::string &share_id, const std::string &method,
                    const std::string &route, const int status) {
  record_event(RequestServedEvent{
      .share_id = share_id, .method = method, .route = route, .status = status});
}

void record_connection_rejected(const std::string &share_id, const std::uint64_t active) {
  record_event(ConnectionRejectedEvent{.share_id = share_id, .active = active});
}

void record_connection_timeout(const std::string &share_id) {
  record_event(ConnectionTimeoutEvent{.share_id = share_id});
}

void record_auth_failure(const std::string &share_id, const std::string &reason) {
  record_event(AuthFailureEvent{.share_id = share_id, .reason = reason});
}

void record_download_completed(const std::string &share_id, const std::uint32_t download_count,
                               const std::uint64_t bytes) {
  record_event(DownloadCompletedEvent{
      .share_id = share_id, .download_count = download_count, .bytes = bytes});
}

void record_tunnel_output(const std::string &share_id, const std::string &stream,
                          const std::string &line) {
  record_event(TunnelOutputEvent{.share_id = share_id, .stream = stream, .line = line});
}

void record_tunnel_status(const std::string &share_id, const std::string &status,
                          const std::string &detail) {
  record_event(TunnelStatusEvent{.share_id = share_id, .status = status, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace tunnelshare::observability
