#include "bench_common.hpp"

#include "tunnelshare/security/credentials.hpp"
#include "tunnelshare/server/http.hpp"
#include "tunnelshare/sharing/counters.hpp"
#include "tunnelshare/sharing/store.hpp"

#include <filesystem>
#include <random>
#include <thread>
#include <vector>

namespace {

std::filesystem::path make_temp_dir() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base = std::filesystem::temp_directory_path() /
                    ("tunnelshare-perf-bench-" + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return base;
}

void run_request_benchmark() {
  std::cout << "\n=== Request Handling Benchmarks ===\n";

  const std::string raw = "GET /3f9a0c1d2e4b/My%20Project.kaizen HTTP/1.1\r\n"
                          "Host: bore.pub:41234\r\n"
                          "User-Agent: curl/8.5.0\r\n"
                          "Range: bytes=1048576-\r\n"
                          "X-Share-Password: correct horse\r\n\r\n";
  tunnelshare::bench::run_bench(
      "http_parse_request", 20000, [&] { (void)tunnelshare::server::parse_http_request(raw); },
      raw.size());

  tunnelshare::bench::run_bench("http_select_range", 50000, [] {
    (void)tunnelshare::server::select_range("bytes=1048576-2097151", 8ULL * 1024 * 1024);
  });

  const std::string encoded = "/My%20Project%20%28final%29.kaizen";
  tunnelshare::bench::run_bench(
      "http_percent_decode", 50000,
      [&] { (void)tunnelshare::server::percent_decode(encoded); }, encoded.size());

  const std::string salt = "4d3c2b1a-0000-4000-8000-0123456789ab";
  const std::string hash = tunnelshare::security::hash_password("correct horse", salt);
  tunnelshare::bench::run_bench("password_validate", 20000, [&] {
    (void)tunnelshare::security::validate_password("correct horse", salt, hash);
  });

  tunnelshare::bench::run_bench("token_generate", 5000, [] {
    (void)tunnelshare::security::generate_token();
  });
}

void run_concurrency_benchmark() {
  std::cout << "\n=== Concurrency Benchmarks ===\n";

  // Shared counters hit by every connection thread
  {
    tunnelshare::sharing::LiveCounters counters;
    tunnelshare::bench::run_bench("counters_concurrent_add", 100, [&] {
      std::vector<std::thread> threads;
      for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&counters]() {
          for (int j = 0; j < 1000; ++j) {
            counters.add_bytes(65536);
          }
          counters.increment_downloads();
        });
      }
      for (auto &thread : threads) {
        thread.join();
      }
    });
  }

  // Persisted share rows
  {
    const auto dir = make_temp_dir();
    tunnelshare::sharing::ShareStore store(dir / "shares.db");
    int counter = 0;
    tunnelshare::bench::run_bench("share_store_save", 200, [&] {
      tunnelshare::sharing::PersistedShare row;
      row.share_id = "bench-" + std::to_string(counter++ % 20);
      row.instance_name = "Bench";
      row.package_path = (dir / "bench.kaizen").string();
      row.salt_id = row.share_id;
      row.created_at = "2024-01-01T00:00:00Z";
      (void)store.save_share(row);
    });
    tunnelshare::bench::run_bench("share_store_list", 500, [&] { (void)store.list_shares(); });

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }
}

} // namespace

void run_performance_benchmarks() {
  run_request_benchmark();
  run_concurrency_benchmark();
}
