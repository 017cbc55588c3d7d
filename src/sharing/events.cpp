#include "tunnelshare/sharing/events.hpp"

#include "tunnelshare/common/json_util.hpp"

#include <sstream>

namespace tunnelshare::sharing {

std::string_view share_status_name(const ShareStatus status) {
  switch (status) {
  case ShareStatus::Connecting:
    return "connecting";
  case ShareStatus::Connected:
    return "connected";
  case ShareStatus::Error:
    return "error";
  case ShareStatus::Disconnected:
    return "disconnected";
  }
  return "error";
}

std::string to_json(const ShareStatusEvent &event) {
  std::ostringstream out;
  out << "{\"share_id\":" << common::json_quote(event.share_id)
      << ",\"status\":" << common::json_quote(std::string(share_status_name(event.status)))
      << ",\"public_url\":"
      << (event.public_url.has_value() ? common::json_quote(*event.public_url) : "null")
      << ",\"error\":" << (event.error.has_value() ? common::json_quote(*event.error) : "null")
      << "}";
  return out.str();
}

std::string to_json(const ShareDownloadEvent &event) {
  std::ostringstream out;
  out << "{\"share_id\":" << common::json_quote(event.share_id)
      << ",\"download_count\":" << event.download_count
      << ",\"uploaded_bytes\":" << event.uploaded_bytes
      << ",\"completed\":" << (event.completed ? "true" : "false") << "}";
  return out.str();
}

} // namespace tunnelshare::sharing
