#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "cloud/sim/sim_state_store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using netstack::cloud::CloudError;
using netstack::cloud::sim::SimCloudClient;
using netstack::cloud::sim::SimCloudState;
using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

void Require(bool ok, const CloudError& error, const std::string& what) {
  if (!ok) {
    Fail(what + " failed: " + netstack::cloud::FormatCloudError(error));
  }
}

// A region with one of everything: pending NAT gateway, instance with an
// attached interface, cross-group rule, tag lag counters.
SimCloudState BuildPopulatedState() {
  SimCloudClient sim(netstack::cloud::sim::SimOptions{.region = "us-west-1",
                                                      .tag_visibility_lag = 1});
  CloudError error;
  std::string vpc_id;
  std::string subnet_id;
  std::string public_group;
  std::string private_group;
  std::string nat_id;
  netstack::cloud::Address address;
  netstack::cloud::Instance instance;

  Require(sim.CreateVpc("10.0.0.0/16", vpc_id, error), error, "create vpc");
  Require(sim.CreateSubnet(vpc_id, "10.0.1.0/24", "us-west-1a", subnet_id, error), error,
          "create subnet");
  Require(sim.AllocateAddress(address, error), error, "allocate");
  Require(sim.CreateNatGateway(subnet_id, address.allocation_id, nat_id, error), error,
          "create nat");
  Require(sim.CreateSecurityGroup("fang-sg-public", "Public SG", vpc_id, public_group, error),
          error, "create public group");
  Require(sim.CreateSecurityGroup("fang-sg-private", "Private SG", vpc_id, private_group, error),
          error, "create private group");
  netstack::cloud::IpPermission from_public;
  from_public.ip_protocol = "tcp";
  from_public.from_port = 22;
  from_public.to_port = 22;
  from_public.source_group_ids = {public_group};
  Require(sim.AuthorizeSecurityGroupIngress(private_group, from_public, error), error,
          "authorize");

  netstack::cloud::RunInstanceRequest run;
  run.image_id = "ami-0b09bf4b909f29738";
  run.instance_type = "t3.micro";
  run.key_name = "fang-key";
  run.subnet_id = subnet_id;
  run.security_group_ids = {private_group};
  run.tags = {{.key = "Name", .value = "fang-ec2-private"}};
  Require(sim.RunInstance(run, instance, error), error, "run instance");
  return sim.state();
}

} // namespace

int main() {
  const netstack::tests::common::ScopedTempDir temp_dir("netstack-sim-state");
  const fs::path& root = temp_dir.path();
  const fs::path state_path = root / "state.json";

  // Missing file: empty region, not an error.
  SimCloudState loaded;
  std::string error;
  if (!netstack::cloud::sim::LoadSimState(root / "absent.json", loaded, error)) {
    Fail("missing state file should load as empty: " + error);
  }
  if (!loaded.vpcs.empty() || loaded.next_id != 1U) {
    Fail("missing state file should produce the initial state");
  }

  const SimCloudState original = BuildPopulatedState();
  if (!netstack::cloud::sim::WriteSimState(original, state_path, error)) {
    Fail("write failed: " + error);
  }
  const std::string written = netstack::tests::common::ReadFileToString(state_path);
  AssertContains(written, "\"schema_version\": \"2\"");
  AssertContains(written, "\"interface_type\": \"nat_gateway\"");
  AssertContains(written, "\"state\": \"pending\"");

  if (!netstack::cloud::sim::LoadSimState(state_path, loaded, error)) {
    Fail("load failed: " + error);
  }
  if (netstack::cloud::sim::SimStateToJson(loaded) != written) {
    Fail("reloaded state must serialize identically");
  }

  // A reloaded region keeps behaving: the NAT gateway continues its
  // transition and IDs keep counting from where they stopped.
  SimCloudClient resumed;
  resumed.ReplaceState(loaded);
  CloudError cloud_error;
  std::vector<netstack::cloud::NatGateway> gateways;
  for (int i = 0; i < 3; ++i) {
    Require(resumed.DescribeNatGateways({}, gateways, cloud_error), cloud_error, "describe nat");
  }
  if (gateways.size() != 1U ||
      gateways.front().state != netstack::cloud::NatGatewayState::kAvailable) {
    Fail("reloaded NAT gateway should finish its pending transition");
  }
  std::string new_vpc;
  Require(resumed.CreateVpc("10.1.0.0/16", new_vpc, cloud_error), cloud_error, "create vpc");
  if (original.vpcs.count(new_vpc) != 0U) {
    Fail("IDs allocated after reload must not collide with persisted ones");
  }

  // Corrupted and foreign files are rejected with the path in the message.
  {
    std::ofstream out(root / "broken.json", std::ios::binary);
    out << "{\"schema_version\": \"2\", \"next_id\": ";
  }
  if (netstack::cloud::sim::LoadSimState(root / "broken.json", loaded, error)) {
    Fail("truncated state must not load");
  }
  AssertContains(error, "broken.json");

  {
    std::ofstream out(root / "future.json", std::ios::binary);
    out << "{\"schema_version\": \"9\"}";
  }
  if (netstack::cloud::sim::LoadSimState(root / "future.json", loaded, error)) {
    Fail("unknown schema version must not load");
  }
  AssertContains(error, "unsupported schema_version '9'");

  std::cout << "sim_state_store_smoke: ok\n";
  return 0;
}
