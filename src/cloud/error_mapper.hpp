#pragma once

#include "cloud/cloud_types.hpp"

#include <string>
#include <string_view>

namespace netstack::cloud {

// Stable classification of provider error codes.
//
// Provider codes are numerous and resource-specific
// (`InvalidVpcID.NotFound`, `InvalidSubnetID.NotFound`, ...). Orchestration
// policy only needs the class: "already gone", "already there", "still has
// dependents", and so on.
enum class CloudErrorKind {
  kNotFound,
  kDuplicate,
  kDependencyViolation,
  kIncorrectState,
  kOperationNotPermitted,
  kThrottled,
  kAccessDenied,
  kTimeout,
  kBackendUnavailable,
  kInvalidParameter,
  kUnknown,
};

std::string_view ToStableErrorCode(CloudErrorKind kind);

CloudErrorKind ClassifyCloudErrorCode(std::string_view provider_code);

inline CloudErrorKind ClassifyCloudError(const CloudError& error) {
  return ClassifyCloudErrorCode(error.code);
}

inline bool IsNotFoundError(const CloudError& error) {
  return ClassifyCloudError(error) == CloudErrorKind::kNotFound;
}

inline bool IsDuplicateError(const CloudError& error) {
  return ClassifyCloudError(error) == CloudErrorKind::kDuplicate;
}

struct CloudErrorMapping {
  CloudErrorKind kind = CloudErrorKind::kUnknown;
  std::string actionable_message;
  std::string detail;
};

// `operation` is a short human label such as "delete subnet" so guidance can
// name what was being attempted.
CloudErrorMapping MapCloudError(std::string_view operation, const CloudError& error);

// Single-line form used in logs and the teardown report:
//   "<STABLE_CODE>: <actionable_message> detail: <provider_code>: <message>"
std::string FormatCloudFailure(std::string_view operation, const CloudError& error);

} // namespace netstack::cloud
