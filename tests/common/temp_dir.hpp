#ifndef NETSTACK_TESTS_COMMON_TEMP_DIR_HPP_
#define NETSTACK_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace netstack::tests::common {

// Fresh directory under the system temp root, removed on scope exit. Holds
// sim state files, snapshots and teardown reports for one test.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) {
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(now_ms));

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      Fail("failed to create temp dir " + path_.string() + ": " + ec.message());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

  std::filesystem::path operator/(std::string_view name) const {
    return path_ / std::string(name);
  }

private:
  std::filesystem::path path_;
};

} // namespace netstack::tests::common

#endif // NETSTACK_TESTS_COMMON_TEMP_DIR_HPP_
