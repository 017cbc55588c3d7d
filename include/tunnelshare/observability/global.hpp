#pragma once

#include "tunnelshare/observability/observer.hpp"

#include <memory>

namespace tunnelshare::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_share_started(const std::string &share_id, const std::string &provider,
                          std::uint16_t port, bool has_public_url);
void record_share_stopped(const std::string &share_id);
void record_request(const std::string &share_id, const std::string &method,
                    const std::string &route, int status);
void record_connection_rejected(const std::string &share_id, std::uint64_t active);
void record_connection_timeout(const std::string &share_id);
void record_auth_failure(const std::string &share_id, const std::string &reason);
void record_download_completed(const std::string &share_id, std::uint32_t download_count,
                               std::uint64_t bytes);
void record_tunnel_output(const std::string &share_id, const std::string &stream,
                          const std::string &line);
void record_tunnel_status(const std::string &share_id, const std::string &status,
                          const std::string &detail = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace tunnelshare::observability
