#include "../common/assertions.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "core/logging/logger.hpp"
#include "topology/topology_resolver.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace {

using netstack::cloud::CloudError;
using netstack::cloud::sim::SimCloudClient;
using netstack::cloud::sim::SimFault;
using netstack::topology::ResolveResult;
using netstack::topology::ResolveStatus;
using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

std::string CreateNamedVpc(SimCloudClient& sim, const std::string& cidr,
                           const std::string& name) {
  CloudError error;
  std::string vpc_id;
  if (!sim.CreateVpc(cidr, vpc_id, error) ||
      !sim.CreateTags({vpc_id}, {{.key = "Name", .value = name}}, error)) {
    Fail("vpc setup failed: " + netstack::cloud::FormatCloudError(error));
  }
  return vpc_id;
}

} // namespace

int main() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kDebug, log_sink);
  SimCloudClient sim;
  CloudError error;
  ResolveResult result;

  // Nothing carries the name yet.
  if (!netstack::topology::ResolveTopology(sim, "us-west-1", "fang", result, error, logger)) {
    Fail("lookup of an absent topology must not be an error");
  }
  if (result.status != ResolveStatus::kNotFound || !result.matching_vpc_ids.empty() ||
      !result.handle.vpc_id.empty()) {
    Fail("expected not found with an empty handle");
  }

  // Only the exact `<prefix>-vpc` name counts.
  CreateNamedVpc(sim, "10.9.0.0/16", "fang");
  CreateNamedVpc(sim, "10.8.0.0/16", "fang-vpc-old");
  const std::string vpc_id = CreateNamedVpc(sim, "10.0.0.0/16", "fang-vpc");
  if (!netstack::topology::ResolveTopology(sim, "us-west-1", "fang", result, error, logger)) {
    Fail("lookup failed: " + netstack::cloud::FormatCloudError(error));
  }
  if (result.status != ResolveStatus::kFound || result.handle.vpc_id != vpc_id ||
      result.handle.vpc_cidr != "10.0.0.0/16" || result.handle.prefix != "fang" ||
      result.handle.region != "us-west-1") {
    Fail("expected the fang-vpc handle");
  }
  if (std::string(netstack::topology::ToString(result.status)) != "found") {
    Fail("unexpected status text");
  }

  // Two VPCs with the same name: refuse to pick one.
  const std::string duplicate_id = CreateNamedVpc(sim, "10.1.0.0/16", "fang-vpc");
  if (!netstack::topology::ResolveTopology(sim, "us-west-1", "fang", result, error, logger)) {
    Fail("ambiguity is a lookup result, not a lookup failure");
  }
  if (result.status != ResolveStatus::kAmbiguous || result.matching_vpc_ids.size() != 2U ||
      !result.handle.vpc_id.empty()) {
    Fail("expected ambiguous status with both matches listed and no handle");
  }
  const std::string message =
      netstack::topology::FormatAmbiguousTopology(result, "us-west-1", "fang");
  AssertContains(message, "prefix 'fang' matches 2 VPCs named 'fang-vpc' in us-west-1:");
  AssertContains(message, vpc_id);
  AssertContains(message, duplicate_id);

  // Describe failures are surfaced as errors.
  sim.InjectFault(SimFault{.operation = "DescribeVpcs",
                           .resource_id = "",
                           .code = "UnauthorizedOperation",
                           .message = "denied",
                           .remaining = 1});
  if (netstack::topology::ResolveTopology(sim, "us-west-1", "fang", result, error, logger)) {
    Fail("a failed describe must fail the lookup");
  }
  if (error.code != "UnauthorizedOperation") {
    Fail("expected the provider error to be returned");
  }
  AssertContains(log_sink.str(), "msg=\"topology lookup failed\"");

  std::cout << "topology_resolver_smoke: ok\n";
  return 0;
}
