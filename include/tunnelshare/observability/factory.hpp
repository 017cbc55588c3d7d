#pragma once

#include "tunnelshare/config/schema.hpp"
#include "tunnelshare/observability/backend_set.hpp"

#include <memory>

namespace tunnelshare::observability {

// observability.backend is a comma list of "log", "metrics" and "none".
[[nodiscard]] std::unique_ptr<BackendSet> create_observer(const config::Config &config);

} // namespace tunnelshare::observability
