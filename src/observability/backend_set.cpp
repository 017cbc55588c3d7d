#include "tunnelshare/observability/backend_set.hpp"

namespace tunnelshare::observability {

bool BackendSet::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr || find(observer->name()) != nullptr) {
    return false;
  }
  if (backends_.empty()) {
    name_ = std::string(observer->name());
  } else {
    name_ += "+" + std::string(observer->name());
  }
  backends_.push_back(std::move(observer));
  return true;
}

IObserver *BackendSet::find(const std::string_view backend) const {
  for (const auto &observer : backends_) {
    if (observer->name() == backend) {
      return observer.get();
    }
  }
  return nullptr;
}

void BackendSet::record_event(const ObserverEvent &event) {
  for (auto &observer : backends_) {
    observer->record_event(event);
  }
}

void BackendSet::record_metric(const ObserverMetric &metric) {
  for (auto &observer : backends_) {
    observer->record_metric(metric);
  }
}

void BackendSet::flush() {
  for (auto &observer : backends_) {
    observer->flush();
  }
}

} // namespace tunnelshare::observability
