#include "../common/assertions.hpp"
#include "cloud/aws_client_factory.hpp"
#include "cloud/aws_stub/aws_cloud_client_stub.hpp"
#include "cloud/error_mapper.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#ifndef NETSTACK_ENABLE_AWS_BACKEND
#define NETSTACK_ENABLE_AWS_BACKEND 0
#endif

#ifndef NETSTACK_AWS_BACKEND_REQUESTED
#define NETSTACK_AWS_BACKEND_REQUESTED 0
#endif

namespace {

using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

} // namespace

int main() {
  using netstack::cloud::ICloudClient;
  using netstack::cloud::aws_stub::AwsCloudClientStub;

  static_assert(std::is_base_of_v<ICloudClient, AwsCloudClientStub>,
                "aws stub must implement ICloudClient");

  const bool expected_enabled = NETSTACK_ENABLE_AWS_BACKEND != 0;
  const bool expected_requested = NETSTACK_AWS_BACKEND_REQUESTED != 0;
  if (netstack::cloud::IsAwsBackendEnabledAtBuild() != expected_enabled) {
    Fail("build-flag mismatch: helper does not reflect NETSTACK_ENABLE_AWS_BACKEND");
  }
  if (netstack::cloud::WasAwsBackendRequestedAtBuild() != expected_requested) {
    Fail("build-flag mismatch: helper does not reflect NETSTACK_AWS_BACKEND_REQUESTED");
  }

  const std::string expected_status_text =
      expected_enabled
          ? "enabled"
          : (expected_requested ? "disabled (SDK not found)" : "disabled (build option OFF)");
  if (netstack::cloud::AwsBackendAvailabilityStatusText() != expected_status_text) {
    Fail("unexpected status text from aws backend factory helper");
  }

  // The stub is exercised directly in every build; it must fail each call
  // with one classifiable error that names the operation and region.
  AwsCloudClientStub stub("us-west-1");
  if (stub.BackendName() != "aws_stub") {
    Fail("stub must identify itself as aws_stub");
  }
  netstack::cloud::CloudError error;
  std::string vpc_id;
  if (stub.CreateVpc("10.0.0.0/16", vpc_id, error)) {
    Fail("stub CreateVpc must fail");
  }
  if (error.code != "BackendUnavailable" ||
      netstack::cloud::ClassifyCloudError(error) !=
          netstack::cloud::CloudErrorKind::kBackendUnavailable) {
    Fail("stub failures must classify as backend unavailable");
  }
  AssertContains(error.message, "operation=CreateVpc");
  AssertContains(error.message, "region=us-west-1");
  AssertContains(error.message, expected_requested ? "aws-sdk-cpp" : "NETSTACK_ENABLE_AWS_BACKEND");

  std::vector<netstack::cloud::Vpc> vpcs;
  if (stub.DescribeVpcs({}, vpcs, error) || !vpcs.empty()) {
    Fail("stub DescribeVpcs must fail without results");
  }
  netstack::cloud::CallerIdentity identity;
  if (stub.GetCallerIdentity(identity, error)) {
    Fail("stub GetCallerIdentity must fail");
  }
  std::string document;
  if (stub.DescribeInstancesDocument({}, document, error) || !document.empty()) {
    Fail("stub DescribeInstancesDocument must fail without a document");
  }
  AssertContains(error.message, "operation=DescribeInstances");

  if (!expected_enabled) {
    std::string factory_error;
    std::unique_ptr<ICloudClient> client =
        netstack::cloud::CreateAwsCloudClient("us-west-1", factory_error);
    if (client == nullptr || client->BackendName() != "aws_stub") {
      Fail("expected the stub client when the aws backend is not built in");
    }
    if (!factory_error.empty()) {
      Fail("stub fallback is not a factory error");
    }
  }

  std::cout << "aws_backend_factory_smoke: ok\n";
  return 0;
}
