#include "../common/assertions.hpp"
#include "cloud/error_mapper.hpp"

#include <iostream>
#include <string>
#include <string_view>

namespace {

using netstack::cloud::CloudError;
using netstack::cloud::CloudErrorKind;
using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

void AssertKind(std::string_view code, CloudErrorKind expected) {
  const CloudErrorKind actual = netstack::cloud::ClassifyCloudErrorCode(code);
  if (actual != expected) {
    Fail("unexpected classification for '" + std::string(code) + "': " +
         std::string(netstack::cloud::ToStableErrorCode(actual)));
  }
}

} // namespace

int main() {
  // Every per-resource NotFound variant collapses to one class.
  AssertKind("InvalidVpcID.NotFound", CloudErrorKind::kNotFound);
  AssertKind("InvalidSubnetID.NotFound", CloudErrorKind::kNotFound);
  AssertKind("InvalidGroup.NotFound", CloudErrorKind::kNotFound);
  AssertKind("InvalidAllocationID.NotFound", CloudErrorKind::kNotFound);
  AssertKind("NatGatewayNotFound", CloudErrorKind::kNotFound);
  AssertKind("Gateway.NotAttached", CloudErrorKind::kNotFound);

  AssertKind("RouteAlreadyExists", CloudErrorKind::kDuplicate);
  AssertKind("InvalidPermission.Duplicate", CloudErrorKind::kDuplicate);
  AssertKind("Resource.AlreadyAssociated", CloudErrorKind::kDuplicate);

  AssertKind("DependencyViolation", CloudErrorKind::kDependencyViolation);
  AssertKind("InvalidIPAddress.InUse", CloudErrorKind::kDependencyViolation);
  AssertKind("IncorrectState", CloudErrorKind::kIncorrectState);
  AssertKind("OperationNotPermitted", CloudErrorKind::kOperationNotPermitted);
  AssertKind("CannotDelete", CloudErrorKind::kOperationNotPermitted);
  AssertKind("RequestLimitExceeded", CloudErrorKind::kThrottled);
  AssertKind("UnauthorizedOperation", CloudErrorKind::kAccessDenied);
  AssertKind("WaiterTimeout", CloudErrorKind::kTimeout);
  AssertKind("BackendUnavailable", CloudErrorKind::kBackendUnavailable);
  AssertKind("InvalidParameterValue", CloudErrorKind::kInvalidParameter);
  AssertKind("InvalidAMIID.Malformed", CloudErrorKind::kInvalidParameter);
  AssertKind("SomethingNew", CloudErrorKind::kUnknown);
  AssertKind("", CloudErrorKind::kUnknown);

  if (!netstack::cloud::IsNotFoundError({.code = "InvalidRouteTableID.NotFound", .message = ""})) {
    Fail("route table NotFound should count as not found");
  }
  if (netstack::cloud::IsNotFoundError({.code = "DependencyViolation", .message = ""})) {
    Fail("DependencyViolation must not count as not found");
  }
  if (!netstack::cloud::IsDuplicateError({.code = "RouteAlreadyExists", .message = ""})) {
    Fail("an existing route should count as a duplicate");
  }
  if (netstack::cloud::IsDuplicateError({.code = "InvalidRouteTableID.NotFound", .message = ""})) {
    Fail("a missing route table must not count as a duplicate");
  }

  const CloudError error{
      .code = "DependencyViolation",
      .message = "The subnet 'subnet-1' has\n  dependencies and cannot be deleted."};
  const std::string formatted = netstack::cloud::FormatCloudFailure("delete subnet", error);
  AssertContains(formatted, "CLOUD_DEPENDENCY_VIOLATION: ");
  AssertContains(formatted, "during delete subnet");
  // Provider messages are collapsed to a single line for logs and reports.
  AssertContains(formatted, "detail: DependencyViolation: The subnet 'subnet-1' has dependencies");
  if (formatted.find('\n') != std::string::npos) {
    Fail("formatted failure must be single-line");
  }

  const std::string unlabeled =
      netstack::cloud::FormatCloudFailure("", {.code = "", .message = ""});
  AssertContains(unlabeled, "CLOUD_UNKNOWN_ERROR: Unexpected provider failure during requested "
                            "operation.");

  std::cout << "error_mapper_smoke: ok\n";
  return 0;
}
