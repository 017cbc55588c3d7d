#include "tunnelshare/observability/factory.hpp"

#include "tunnelshare/common/fs.hpp"
#include "tunnelshare/observability/log_observer.hpp"
#include "tunnelshare/observability/metrics_observer.hpp"

#include <sstream>

namespace tunnelshare::observability {

std::unique_ptr<BackendSet> create_observer(const config::Config &config) {
  auto backends = std::make_unique<BackendSet>();
  std::stringstream stream(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (name == "log") {
      backends->add(std::make_unique<LogObserver>());
    } else if (name == "metrics") {
      backends->add(std::make_unique<MetricsObserver>());
    }
    // "none", "noop" and unknown names add nothing; validate_config reports the unknown ones.
  }
  return backends;
}

} // namespace tunnelshare::observability
