#pragma once

#include "cloud/cloud_client.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace netstack::core::logging {
class Logger;
}

namespace netstack::cloud {

// Blocks the calling thread. Injected everywhere a wait or backoff happens so
// tests and the simulated backend can run without wall-clock delays.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper RealSleeper();
Sleeper NoopSleeper();

// Bounded polling budget. The defaults match the provider's own SDK waiters
// (15 s between polls, 40 polls).
struct WaitPolicy {
  std::chrono::milliseconds poll_interval{15'000};
  std::uint32_t max_attempts = 40;
};

// One poll of described state.
enum class PollState {
  kSatisfied,
  kPending,
  // Terminal state that can never satisfy the predicate (for example a NAT
  // gateway that went to `failed`). Stops the wait immediately.
  kFailed,
};

using PollFunction = std::function<PollState(std::string& detail)>;

struct WaitResult {
  bool satisfied = false;
  std::uint32_t attempts = 0;
  std::string error;
};

// Polls `poll` until it reports kSatisfied, sleeping `poll_interval` between
// attempts. Stops with an error after `max_attempts` pending polls (timeout)
// or on the first kFailed poll. `what` names the wait in logs and errors.
WaitResult WaitUntil(std::string_view what, const PollFunction& poll, const WaitPolicy& policy,
                     const Sleeper& sleeper, core::logging::Logger& logger);

// Named waiters built on WaitUntil.
//
// "available": every listed NAT gateway reports `available`.
// "deleted": every listed NAT gateway reports `deleted` or is no longer
//   described at all.
// "terminated": every listed instance reports `terminated` or is gone.
WaitResult WaitForNatGatewaysAvailable(ICloudClient& client,
                                       const std::vector<std::string>& nat_gateway_ids,
                                       const WaitPolicy& policy, const Sleeper& sleeper,
                                       core::logging::Logger& logger);

WaitResult WaitForNatGatewaysDeleted(ICloudClient& client,
                                     const std::vector<std::string>& nat_gateway_ids,
                                     const WaitPolicy& policy, const Sleeper& sleeper,
                                     core::logging::Logger& logger);

WaitResult WaitForInstancesTerminated(ICloudClient& client,
                                      const std::vector<std::string>& instance_ids,
                                      const WaitPolicy& policy, const Sleeper& sleeper,
                                      core::logging::Logger& logger);

} // namespace netstack::cloud
