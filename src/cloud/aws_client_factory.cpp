#include "cloud/aws_client_factory.hpp"

#include "cloud/aws_stub/aws_cloud_client_stub.hpp"

#ifndef NETSTACK_ENABLE_AWS_BACKEND
#define NETSTACK_ENABLE_AWS_BACKEND 0
#endif

#if NETSTACK_ENABLE_AWS_BACKEND
#include "cloud/aws/ec2_cloud_client.hpp"
#endif

namespace netstack::cloud {

bool IsAwsBackendEnabledAtBuild() {
  return aws_stub::IsAwsBackendEnabledAtBuild();
}

bool WasAwsBackendRequestedAtBuild() {
  return aws_stub::WasAwsBackendRequestedAtBuild();
}

std::string_view AwsBackendAvailabilityStatusText() {
  return aws_stub::AwsBackendAvailabilityStatusText();
}

std::unique_ptr<ICloudClient> CreateAwsCloudClient(const std::string& region,
                                                   std::string& error) {
  error.clear();
#if NETSTACK_ENABLE_AWS_BACKEND
  return aws::Ec2CloudClient::Create(region, error);
#else
  return std::make_unique<aws_stub::AwsCloudClientStub>(region);
#endif
}

} // namespace netstack::cloud
