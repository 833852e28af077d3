#pragma once

#include "cloud/cloud_client.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace netstack::cloud {

// Returns whether the AWS SDK backed client is linked in the current build.
bool IsAwsBackendEnabledAtBuild();

// Returns whether the build requested the AWS backend.
// This may still resolve to disabled if SDK discovery failed.
bool WasAwsBackendRequestedAtBuild();

// Human-readable status text for CLI visibility.
std::string_view AwsBackendAvailabilityStatusText();

// Creates the effective client for `--backend aws`.
// - enabled builds: returns `aws::Ec2CloudClient` bound to `region`
// - disabled builds: returns `aws_stub::AwsCloudClientStub`
// Returns nullptr with `error` set only when an enabled build fails to set
// up the SDK.
std::unique_ptr<ICloudClient> CreateAwsCloudClient(const std::string& region,
                                                   std::string& error);

} // namespace netstack::cloud
