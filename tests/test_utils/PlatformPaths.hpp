#pragma once

#include <filesystem>
#include <string>

// Both directories come from the build (bridge_server_test_utils)
#if !defined(BRIDGE_TEST_MODULE_DIR) || !defined(BRIDGE_TEST_FIXTURE_DIR)
#error "BRIDGE_TEST_MODULE_DIR and BRIDGE_TEST_FIXTURE_DIR must be defined"
#endif

namespace bridgesrv {
namespace test {

/// Get the platform-specific shared library extension
inline std::string get_module_extension() {
#ifdef _WIN32
  return ".dll";
#else
  return ".so";
#endif
}

/// Directory holding the native test modules built from tests/mocks
inline std::filesystem::path get_test_module_dir() {
  return std::filesystem::path(BRIDGE_TEST_MODULE_DIR);
}

/// Get full path to a native test module
inline std::filesystem::path
get_test_module_path(const std::string &module_name) {
  return get_test_module_dir() / (module_name + get_module_extension());
}

/// Directory holding the Lua test modules
inline std::filesystem::path get_fixture_dir() {
  return std::filesystem::path(BRIDGE_TEST_FIXTURE_DIR);
}

inline std::filesystem::path get_fixture_path(const std::string &file_name) {
  return get_fixture_dir() / file_name;
}

} // namespace test
} // namespace bridgesrv
