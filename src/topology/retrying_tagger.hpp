#pragma once

#include "cloud/cloud_client.hpp"
#include "cloud/waiter.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace netstack::core::logging {
class Logger;
}

namespace netstack::topology {

// Total attempts for one tag call, first try included.
constexpr std::uint32_t kTagMaxAttempts = 5U;

// True for the "freshly created ID not visible yet" codes the tagging endpoint
// returns under eventual consistency. Nothing else is retried.
bool IsTagRetryableErrorCode(std::string_view code);

// Delay before retry number `attempt_index` (0-based): (1 + attempt_index)
// units, so 1, 2, 3, 4 units across a full budget.
std::chrono::milliseconds ComputeTagRetryDelay(std::uint32_t attempt_index,
                                               std::chrono::milliseconds unit);

// Sets `Name=<name>` on one resource.
class RetryingTagger {
public:
  RetryingTagger(cloud::ICloudClient& client, cloud::Sleeper sleeper,
                 core::logging::Logger& logger,
                 std::chrono::milliseconds delay_unit = std::chrono::seconds(1));

  // Returns false once the error is not retryable or the attempt budget is
  // spent; `error` then holds the last provider error.
  bool TagName(const std::string& resource_id, const std::string& name,
               cloud::CloudError& error);

  // Attempts made by the most recent TagName call.
  std::uint32_t last_attempts() const {
    return last_attempts_;
  }

private:
  cloud::ICloudClient& client_;
  cloud::Sleeper sleeper_;
  core::logging::Logger& logger_;
  std::chrono::milliseconds delay_unit_;
  std::uint32_t last_attempts_ = 0;
};

} // namespace netstack::topology
