#include "cloud/aws/aws_sdk_context.hpp"

#include <aws/core/Aws.h>

#include <utility>

namespace netstack::cloud::aws {

namespace {

// InitAPI and ShutdownAPI must see the same options object.
Aws::SDKOptions& SdkOptions() {
  static Aws::SDKOptions options;
  return options;
}

} // namespace

std::mutex AwsSdkContext::global_mu_{};
bool AwsSdkContext::initialized_ = false;
std::uint32_t AwsSdkContext::active_handles_ = 0;

AwsSdkContext::~AwsSdkContext() {
  Release();
}

AwsSdkContext::AwsSdkContext(AwsSdkContext&& other) noexcept {
  acquired_ = std::exchange(other.acquired_, false);
}

AwsSdkContext& AwsSdkContext::operator=(AwsSdkContext&& other) noexcept {
  if (this == &other) {
    return *this;
  }

  Release();
  acquired_ = std::exchange(other.acquired_, false);
  return *this;
}

bool AwsSdkContext::Acquire(std::string& error) {
  error.clear();
  if (acquired_) {
    return true;
  }

  std::lock_guard<std::mutex> lock(global_mu_);
  if (!initialized_) {
    InitializeSdk();
    initialized_ = true;
  }

  ++active_handles_;
  acquired_ = true;
  return true;
}

void AwsSdkContext::Release() {
  if (!acquired_) {
    return;
  }

  std::lock_guard<std::mutex> lock(global_mu_);
  if (active_handles_ > 0U) {
    --active_handles_;
  }
  acquired_ = false;

  if (active_handles_ == 0U && initialized_) {
    ShutdownSdk();
    initialized_ = false;
  }
}

void AwsSdkContext::InitializeSdk() {
  Aws::InitAPI(SdkOptions());
}

void AwsSdkContext::ShutdownSdk() {
  Aws::ShutdownAPI(SdkOptions());
}

} // namespace netstack::cloud::aws
