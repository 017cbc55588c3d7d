#include "tunnelshare/sharing/types.hpp"

#include "tunnelshare/common/json_util.hpp"

#include <sstream>

namespace tunnelshare::sharing {

std::string to_json(const ShareInfo &info) {
  std::ostringstream out;
  out << "{\"share_id\":" << common::json_quote(info.share_id)
      << ",\"instance_name\":" << common::json_quote(info.instance_name)
      << ",\"package_path\":" << common::json_quote(info.package_path)
      << ",\"local_port\":" << info.local_port << ",\"public_url\":"
      << (info.public_url.has_value() ? common::json_quote(*info.public_url) : "null")
      << ",\"download_count\":" << info.download_count
      << ",\"uploaded_bytes\":" << info.uploaded_bytes
      << ",\"started_at\":" << common::json_quote(info.started_at)
      << ",\"file_size\":" << info.file_size << ",\"provider\":"
      << common::json_quote(std::string(tunnel::provider_name(info.provider)))
      << ",\"has_password\":" << (info.has_password ? "true" : "false") << ",\"status\":"
      << common::json_quote(std::string(share_status_name(info.status))) << "}";
  return out.str();
}

std::string compose_share_url(const std::string &base, const std::string &token) {
  std::string trimmed = base;
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  return trimmed + "/" + token;
}

} // namespace tunnelshare::sharing
