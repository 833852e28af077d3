#include "cloud/error_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace netstack::cloud {

namespace {

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool IsOneOf(std::string_view text, std::initializer_list<std::string_view> candidates) {
  return std::find(candidates.begin(), candidates.end(), text) != candidates.end();
}

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  if (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

std::string BuildActionableMessage(CloudErrorKind kind, std::string_view operation) {
  const std::string label = operation.empty() ? "requested operation" : std::string(operation);

  switch (kind) {
  case CloudErrorKind::kNotFound:
    return "Resource was not found during " + label +
           "; it may already be gone or not yet visible.";
  case CloudErrorKind::kDuplicate:
    return "Resource already exists during " + label + ".";
  case CloudErrorKind::kDependencyViolation:
    return "Resource still has dependents during " + label +
           "; rerun teardown once dependent resources are gone.";
  case CloudErrorKind::kIncorrectState:
    return "Resource is in the wrong state for " + label +
           "; wait for pending transitions and retry.";
  case CloudErrorKind::kOperationNotPermitted:
    return "Provider does not permit " + label + " on this resource.";
  case CloudErrorKind::kThrottled:
    return "Request was throttled during " + label + "; slow down and retry.";
  case CloudErrorKind::kAccessDenied:
    return "Access denied during " + label + "; check credentials and IAM permissions.";
  case CloudErrorKind::kTimeout:
    return "Timed out during " + label + "; the resource did not reach its target state.";
  case CloudErrorKind::kBackendUnavailable:
    return "Cloud backend is unavailable for " + label +
           "; check the build configuration and network connectivity.";
  case CloudErrorKind::kInvalidParameter:
    return "Request parameters were rejected during " + label +
           "; review region, CIDR and image settings.";
  case CloudErrorKind::kUnknown:
  default:
    return "Unexpected provider failure during " + label + ".";
  }
}

} // namespace

std::string_view ToStableErrorCode(CloudErrorKind kind) {
  switch (kind) {
  case CloudErrorKind::kNotFound:
    return "CLOUD_NOT_FOUND";
  case CloudErrorKind::kDuplicate:
    return "CLOUD_DUPLICATE";
  case CloudErrorKind::kDependencyViolation:
    return "CLOUD_DEPENDENCY_VIOLATION";
  case CloudErrorKind::kIncorrectState:
    return "CLOUD_INCORRECT_STATE";
  case CloudErrorKind::kOperationNotPermitted:
    return "CLOUD_NOT_PERMITTED";
  case CloudErrorKind::kThrottled:
    return "CLOUD_THROTTLED";
  case CloudErrorKind::kAccessDenied:
    return "CLOUD_ACCESS_DENIED";
  case CloudErrorKind::kTimeout:
    return "CLOUD_TIMEOUT";
  case CloudErrorKind::kBackendUnavailable:
    return "CLOUD_BACKEND_UNAVAILABLE";
  case CloudErrorKind::kInvalidParameter:
    return "CLOUD_INVALID_PARAMETER";
  case CloudErrorKind::kUnknown:
  default:
    return "CLOUD_UNKNOWN_ERROR";
  }
}

CloudErrorKind ClassifyCloudErrorCode(std::string_view code) {
  if (code.empty()) {
    return CloudErrorKind::kUnknown;
  }

  // `*NotFound` covers every per-resource variant plus NatGatewayNotFound.
  if (EndsWith(code, "NotFound") || code == "Gateway.NotAttached") {
    return CloudErrorKind::kNotFound;
  }

  if (EndsWith(code, ".Duplicate") || EndsWith(code, "AlreadyExists") ||
      IsOneOf(code, {"Resource.AlreadyAssociated", "InvalidGroup.Duplicate"})) {
    return CloudErrorKind::kDuplicate;
  }

  if (code == "DependencyViolation" || EndsWith(code, ".InUse")) {
    return CloudErrorKind::kDependencyViolation;
  }

  if (StartsWith(code, "Incorrect") || code == "InvalidState") {
    return CloudErrorKind::kIncorrectState;
  }

  if (IsOneOf(code, {"OperationNotPermitted", "CannotDelete", "InvalidGroup.Reserved"})) {
    return CloudErrorKind::kOperationNotPermitted;
  }

  if (IsOneOf(code, {"Throttling", "RequestLimitExceeded", "ThrottlingException"})) {
    return CloudErrorKind::kThrottled;
  }

  if (IsOneOf(code, {"UnauthorizedOperation", "AuthFailure", "AccessDenied",
                     "InvalidClientTokenId", "ExpiredToken", "MissingAuthenticationToken"})) {
    return CloudErrorKind::kAccessDenied;
  }

  if (IsOneOf(code, {"WaiterTimeout", "RequestTimeout", "RequestExpired"})) {
    return CloudErrorKind::kTimeout;
  }

  if (IsOneOf(code, {"BackendUnavailable", "ServiceUnavailable", "Unavailable",
                     "InternalError", "NetworkConnection"})) {
    return CloudErrorKind::kBackendUnavailable;
  }

  if (StartsWith(code, "InvalidParameter") || StartsWith(code, "Missing") ||
      IsOneOf(code, {"InvalidSubnet.Range", "InvalidVpc.Range", "InvalidAMIID.Malformed",
                     "InvalidKeyPair.Format", "InvalidInput"})) {
    return CloudErrorKind::kInvalidParameter;
  }

  return CloudErrorKind::kUnknown;
}

CloudErrorMapping MapCloudError(std::string_view operation, const CloudError& error) {
  CloudErrorMapping mapped;
  mapped.kind = ClassifyCloudError(error);
  mapped.actionable_message = BuildActionableMessage(mapped.kind, operation);
  mapped.detail = CollapseWhitespace(FormatCloudError(error));
  return mapped;
}

std::string FormatCloudFailure(std::string_view operation, const CloudError& error) {
  const CloudErrorMapping mapped = MapCloudError(operation, error);
  std::string formatted =
      std::string(ToStableErrorCode(mapped.kind)) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

} // namespace netstack::cloud
