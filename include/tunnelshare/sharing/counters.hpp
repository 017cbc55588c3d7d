#pragma once

#include <cstdint>
#include <mutex>

namespace tunnelshare::sharing {

class LiveCounters {
public:
  [[nodiscard]] std::uint32_t download_count() const;
  [[nodiscard]] std::uint64_t uploaded_bytes() const;

  std::uint32_t increment_downloads();
  std::uint64_t add_bytes(std::uint64_t bytes);

private:
  mutable std::mutex downloads_mutex_;
  std::uint32_t downloads_ = 0;
  mutable std::mutex bytes_mutex_;
  std::uint64_t bytes_ = 0;
};

} // namespace tunnelshare::sharing
