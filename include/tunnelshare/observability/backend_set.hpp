#pragma once

#include "tunnelshare/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tunnelshare::observability {

/// The configured observability backends, at most one of each name. An empty
/// set is the "none" backend and drops everything.
class BackendSet final : public IObserver {
public:
  /// False when observer is null or a backend with its name is already present.
  bool add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] IObserver *find(std::string_view backend) const;
  [[nodiscard]] std::size_t size() const { return backends_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  // "none", a single backend name, or the names joined with '+'.
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
  std::string name_ = "none";
};

} // namespace tunnelshare::observability
