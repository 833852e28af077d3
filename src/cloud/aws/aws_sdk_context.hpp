#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace netstack::cloud::aws {

// Process-wide AWS SDK lifecycle guard.
//
// The SDK requires exactly one Aws::InitAPI / Aws::ShutdownAPI pair per
// process, while several clients may coexist (CLI plus tests). Every handle
// holds one reference; the last release shuts the SDK down.
class AwsSdkContext {
public:
  AwsSdkContext() = default;
  ~AwsSdkContext();

  AwsSdkContext(const AwsSdkContext&) = delete;
  AwsSdkContext& operator=(const AwsSdkContext&) = delete;
  AwsSdkContext(AwsSdkContext&& other) noexcept;
  AwsSdkContext& operator=(AwsSdkContext&& other) noexcept;

  // Acquires the global SDK context for this handle. Idempotent per instance.
  bool Acquire(std::string& error);

  // Releases this handle's acquisition if present. Safe to call repeatedly.
  void Release();

  bool acquired() const {
    return acquired_;
  }

private:
  static void InitializeSdk();
  static void ShutdownSdk();

  bool acquired_ = false;

  static std::mutex global_mu_;
  static bool initialized_;
  static std::uint32_t active_handles_;
};

} // namespace netstack::cloud::aws
