#include "tunnelshare/common/result.hpp"

namespace tunnelshare::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Internal:
    return "internal";
  case ErrorKind::PortAllocationFailure:
    return "port_allocation_failure";
  case ErrorKind::BindFailure:
    return "bind_failure";
  case ErrorKind::AgentMissing:
    return "agent_missing";
  case ErrorKind::TunnelSpawnFailure:
    return "tunnel_spawn_failure";
  case ErrorKind::AuthFailure:
    return "auth_failure";
  case ErrorKind::RateLimited:
    return "rate_limited";
  case ErrorKind::RequestTimeout:
    return "request_timeout";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::InvalidPackage:
    return "invalid_package";
  case ErrorKind::Database:
    return "database";
  case ErrorKind::Network:
    return "network";
  case ErrorKind::Config:
    return "config";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  }
  return "internal";
}

} // namespace tunnelshare::common
