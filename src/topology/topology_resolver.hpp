#pragma once

#include "cloud/cloud_client.hpp"

#include <string>
#include <vector>

namespace netstack::core::logging {
class Logger;
}

namespace netstack::topology {

// Live identity of one topology, shared by collect and teardown.
struct TopologyHandle {
  std::string region;
  std::string prefix;
  std::string vpc_id;
  std::string vpc_cidr;
};

enum class ResolveStatus {
  kFound,
  kNotFound,
  kAmbiguous,
};

const char* ToString(ResolveStatus status);

struct ResolveResult {
  ResolveStatus status = ResolveStatus::kNotFound;
  TopologyHandle handle;
  // Every VPC carrying the name tag; more than one means kAmbiguous.
  std::vector<std::string> matching_vpc_ids;
};

// Looks up the VPC tagged `Name=<prefix>-vpc`.
//
// Contract:
// - returns false only when the describe call itself fails (`error` set)
// - otherwise returns true; `result.status` tells found / not found /
//   ambiguous, and `result.handle` is filled only for kFound
bool ResolveTopology(cloud::ICloudClient& client, const std::string& region,
                     const std::string& prefix, ResolveResult& result, cloud::CloudError& error,
                     core::logging::Logger& logger);

// "prefix 'x' matches 2 VPCs in us-west-1: vpc-1, vpc-2"
std::string FormatAmbiguousTopology(const ResolveResult& result, const std::string& region,
                                    const std::string& prefix);

} // namespace netstack::topology
