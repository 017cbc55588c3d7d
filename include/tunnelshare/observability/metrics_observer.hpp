#pragma once

#include "tunnelshare/observability/observer.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace tunnelshare::observability {

struct MetricsSnapshot {
  std::uint64_t requests = 0;
  std::uint64_t rejected_connections = 0;
  std::uint64_t timed_out_connections = 0;
  std::uint64_t auth_failures = 0;
  std::uint64_t completed_downloads = 0;
  std::uint64_t tunnel_errors = 0;
  std::uint64_t active_shares = 0;
  std::map<std::string, std::uint64_t> bytes_served;
  std::map<std::string, std::uint64_t> active_connections;

  [[nodiscard]] std::uint64_t total_bytes_served() const;
};

class MetricsObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "metrics"; }

  [[nodiscard]] MetricsSnapshot snapshot() const;

private:
  mutable std::mutex mutex_;
  MetricsSnapshot totals_;
};

} // namespace tunnelshare::observability
