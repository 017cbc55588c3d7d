#include "test_framework.hpp"

#include "tunnelshare/observability/global.hpp"
#include "tunnelshare/observability/backend_set.hpp"

#include <csignal>
#include <iostream>
#include <memory>

void register_config_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_credentials_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_http_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_package_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_responder_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_file_server_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_tunnel_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_share_store_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_sharing_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_client_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_observability_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_cli_tests(std::vector<tunnelshare::tests::TestCase> &tests);
void register_share_integration_tests(std::vector<tunnelshare::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE so a client closing early does not kill the run
  std::signal(SIGPIPE, SIG_IGN);
  tunnelshare::observability::set_global_observer(
      std::make_unique<tunnelshare::observability::BackendSet>());

  std::vector<tunnelshare::tests::TestCase> tests;
  register_config_tests(tests);
  register_credentials_tests(tests);
  register_http_tests(tests);
  register_package_tests(tests);
  register_responder_tests(tests);
  register_file_server_tests(tests);
  register_tunnel_tests(tests);
  register_share_store_tests(tests);
  register_sharing_tests(tests);
  register_client_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);
  register_share_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
