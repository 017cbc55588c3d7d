#include "tunnelshare/sharing/counters.hpp"

namespace tunnelshare::sharing {

std::uint32_t LiveCounters::download_count() const {
  std::lock_guard<std::mutex> lock(downloads_mutex_);
  return downloads_;
}

std::uint64_t LiveCounters::uploaded_bytes() const {
  std::lock_guard<std::mutex> lock(bytes_mutex_);
  return bytes_;
}

std::uint32_t LiveCounters::increment_downloads() {
  std::lock_guard<std::mutex> lock(downloads_mutex_);
  return ++downloads_;
}

std::uint64_t LiveCounters::add_bytes(const std::uint64_t bytes) {
  std::lock_guard<std::mutex> lock(bytes_mutex_);
  bytes_ += bytes;
  return bytes_;
}

} // namespace tunnelshare::sharing
