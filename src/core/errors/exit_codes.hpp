#pragma once

namespace netstack::core::errors {

// Process-exit contract for scripted provisioning runs.
//
// 0/1/2 keep their conventional meanings (success, failure, usage). The rest
// let wrappers tell apart "nothing to collect" from "backend not usable" from
// "create stopped partway and left resources behind" without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kBackendUnavailable = 20,
  kTopologyNotFound = 30,
  kTopologyAmbiguous = 31,
  kCreateStepFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace netstack::core::errors
