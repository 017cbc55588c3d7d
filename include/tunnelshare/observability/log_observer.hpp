#pragma once

#include "tunnelshare/observability/observer.hpp"

namespace tunnelshare::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace tunnelshare::observability
