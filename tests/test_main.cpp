#include "test_framework.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

void register_sha256_tests(std::vector<docsync::tests::TestCase> &tests);
void register_category_tests(std::vector<docsync::tests::TestCase> &tests);
void register_config_tests(std::vector<docsync::tests::TestCase> &tests);
void register_loader_tests(std::vector<docsync::tests::TestCase> &tests);
void register_version_store_tests(std::vector<docsync::tests::TestCase> &tests);
void register_sync_engine_tests(std::vector<docsync::tests::TestCase> &tests);
void register_flattener_tests(std::vector<docsync::tests::TestCase> &tests);

int main(int argc, char **argv) {
  std::vector<docsync::tests::TestCase> tests;
  register_sha256_tests(tests);
  register_category_tests(tests);
  register_config_tests(tests);
  register_loader_tests(tests);
  register_version_store_tests(tests);
  register_sync_engine_tests(tests);
  register_flattener_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";

  std::size_t passed = 0;
  std::size_t failed = 0;
  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    try {
      test.fn();
      ++passed;
      std::cout << "[PASS] " << test.name << "\n";
    } catch (const std::exception &e) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << e.what() << "\n";
    }
  }

  std::cout << passed << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
