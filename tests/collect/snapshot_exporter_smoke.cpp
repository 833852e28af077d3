#include "../common/assertions.hpp"
#include "../common/sim_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "cloud/sim/sim_state_store.hpp"
#include "collect/snapshot_exporter.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

using netstack::cloud::sim::SimCloudClient;
using netstack::cloud::sim::SimCloudState;
using netstack::cloud::sim::SimFault;
using netstack::collect::CollectRequest;
using netstack::collect::CollectResult;
using netstack::core::json::Value;
using netstack::tests::common::AssertContains;
using netstack::tests::common::CreateFixtureTopology;
using netstack::tests::common::Fail;

Value ReadJson(const fs::path& path) {
  std::string text;
  std::string error;
  if (!netstack::core::ReadTextFile(path, text, error)) {
    Fail("missing snapshot " + path.string() + ": " + error);
  }
  Value root;
  if (!netstack::core::json::Parse(text, root, error)) {
    Fail("snapshot is not valid JSON " + path.string() + ": " + error);
  }
  if (!root.IsObject()) {
    Fail("snapshot root must be an object: " + path.string());
  }
  return root;
}

const Value& RequireArray(const Value& root, const char* key) {
  const Value* member = root.Find(key);
  if (member == nullptr || !member->IsArray()) {
    Fail(std::string("expected array member ") + key);
  }
  return *member;
}

void ExpectSnapshotsWritten(const fs::path& root) {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const auto created = CreateFixtureTopology(sim, logger);

  // A second, unrelated VPC must not leak into the scoped snapshots.
  netstack::cloud::CloudError cloud_error;
  std::string other_vpc;
  std::string other_subnet;
  if (!sim.CreateVpc("10.50.0.0/16", other_vpc, cloud_error) ||
      !sim.CreateSubnet(other_vpc, "10.50.1.0/24", "us-west-1b", other_subnet, cloud_error)) {
    Fail("unrelated VPC setup failed");
  }

  const fs::path out_dir = root / "snapshots";
  std::ostringstream out;
  CollectResult result;
  std::string error;
  const CollectRequest request{.region = "us-west-1", .prefix = "fang", .output_dir = out_dir};
  if (!netstack::collect::CollectSnapshots(sim, request, out, logger, result, error)) {
    Fail("collect failed: " + error);
  }
  if (!result.lookup_completed || result.status != netstack::topology::ResolveStatus::kFound ||
      result.written_files.size() != 4U) {
    Fail("expected four snapshots for a resolved topology");
  }

  for (const char* name : {"fang-caller-identity.json", "fang-instances.json",
                           "fang-subnets.json", "fang-route-tables.json"}) {
    AssertContains(out.str(), "Saved: " + (out_dir / name).string() + "\n");
  }

  const Value identity = ReadJson(out_dir / "fang-caller-identity.json");
  const Value* account = identity.Find("Account");
  if (account == nullptr || account->string_value != "123456789012" ||
      identity.Find("Arn") == nullptr || identity.Find("UserId") == nullptr) {
    Fail("caller identity snapshot is incomplete");
  }

  const Value instances = ReadJson(out_dir / "fang-instances.json");
  const Value& reservations = RequireArray(instances, "Reservations");
  if (reservations.array_value.size() != 2U) {
    Fail("expected one reservation per launched instance");
  }
  const Value& first = RequireArray(reservations.array_value.front(), "Instances");
  if (first.array_value.size() != 1U) {
    Fail("each reservation should hold one instance");
  }
  const Value* reservation_id = reservations.array_value.front().Find("ReservationId");
  const Value* owner_id = reservations.array_value.front().Find("OwnerId");
  if (reservation_id == nullptr || reservation_id->string_value.rfind("r-", 0) != 0U ||
      owner_id == nullptr || owner_id->string_value != "123456789012") {
    Fail("reservation must carry its id and owner");
  }
  const Value& launched = first.array_value.front();
  const Value* placement = launched.Find("Placement");
  if (placement == nullptr || placement->Find("AvailabilityZone") == nullptr ||
      launched.Find("LaunchTime") == nullptr || launched.Find("PrivateDnsName") == nullptr) {
    Fail("instance must keep placement, launch time and private DNS name");
  }
  if (RequireArray(launched, "NetworkInterfaces").array_value.size() != 1U) {
    Fail("instance must list its primary network interface");
  }
  const Value* instance_id = first.array_value.front().Find("InstanceId");
  const Value* key_name = first.array_value.front().Find("KeyName");
  if (instance_id == nullptr || instance_id->string_value != created.public_instance_id ||
      key_name == nullptr || key_name->string_value != "fang-key") {
    Fail("unexpected first instance in snapshot");
  }

  const Value subnets = ReadJson(out_dir / "fang-subnets.json");
  const Value& subnet_list = RequireArray(subnets, "Subnets");
  if (subnet_list.array_value.size() != 2U) {
    Fail("subnets snapshot must be scoped to the topology VPC");
  }
  for (const auto& subnet : subnet_list.array_value) {
    const Value* vpc_id = subnet.Find("VpcId");
    if (vpc_id == nullptr || vpc_id->string_value != created.vpc_id) {
      Fail("subnet from another VPC leaked into the snapshot");
    }
    if (subnet.Find("SubnetArn") == nullptr || subnet.Find("OwnerId") == nullptr ||
        subnet.Find("AvailableIpAddressCount") == nullptr) {
      Fail("subnet snapshot dropped provider members");
    }
  }

  // Files are the backend's documents, untouched.
  std::string subnets_document;
  if (!sim.DescribeSubnetsDocument({.vpc_id = created.vpc_id}, subnets_document, cloud_error)) {
    Fail("describe subnets document failed");
  }
  if (netstack::tests::common::ReadFileToString(out_dir / "fang-subnets.json") !=
      subnets_document) {
    Fail("subnets snapshot must equal the describe response");
  }

  const Value tables = ReadJson(out_dir / "fang-route-tables.json");
  if (RequireArray(tables, "RouteTables").array_value.size() != 2U) {
    Fail("expected the main and private route tables");
  }
  std::string tables_text;
  if (!netstack::core::ReadTextFile(out_dir / "fang-route-tables.json", tables_text, error)) {
    Fail("route tables snapshot unreadable: " + error);
  }
  AssertContains(tables_text, "\"NatGatewayId\": \"" + created.nat_gateway_id + "\"");
  AssertContains(tables_text, "\"GatewayId\": \"" + created.internet_gateway_id + "\"");
  AssertContains(tables_text, "\"Main\": true");
}

void ExpectSharedReservationKeptTogether(const fs::path& root) {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const auto created = CreateFixtureTopology(sim, logger);

  // Both instances launched by one call, persisted and reloaded.
  SimCloudState state = sim.state();
  const std::string shared = state.instances.at(created.public_instance_id).reservation_id;
  state.instances.at(created.private_instance_id).reservation_id = shared;
  const fs::path state_path = root / "shared-state.json";
  std::string error;
  if (!netstack::cloud::sim::WriteSimState(state, state_path, error)) {
    Fail("state write failed: " + error);
  }
  SimCloudState loaded;
  if (!netstack::cloud::sim::LoadSimState(state_path, loaded, error)) {
    Fail("state load failed: " + error);
  }
  SimCloudClient reloaded;
  reloaded.ReplaceState(loaded);

  const fs::path out_dir = root / "shared";
  std::ostringstream out;
  CollectResult result;
  const CollectRequest request{.region = "us-west-1", .prefix = "fang", .output_dir = out_dir};
  if (!netstack::collect::CollectSnapshots(reloaded, request, out, logger, result, error)) {
    Fail("collect failed: " + error);
  }

  const Value instances = ReadJson(out_dir / "fang-instances.json");
  const Value& reservations = RequireArray(instances, "Reservations");
  if (reservations.array_value.size() != 1U) {
    Fail("instances from one launch must stay in one reservation");
  }
  const Value& reservation = reservations.array_value.front();
  const Value* reservation_id = reservation.Find("ReservationId");
  if (reservation_id == nullptr || reservation_id->string_value != shared) {
    Fail("reservation id must survive the export");
  }
  const Value& members = RequireArray(reservation, "Instances");
  if (members.array_value.size() != 2U) {
    Fail("shared reservation must hold both instances");
  }
  const Value* first_id = members.array_value[0].Find("InstanceId");
  const Value* second_index = members.array_value[1].Find("AmiLaunchIndex");
  if (first_id == nullptr || first_id->string_value != created.public_instance_id ||
      second_index == nullptr || second_index->number_value != 1.0) {
    Fail("instances must keep launch order within the reservation");
  }
}

void ExpectNotFoundStillWritesIdentity(const fs::path& root) {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;

  const fs::path out_dir = root / "missing";
  std::ostringstream out;
  CollectResult result;
  std::string error;
  const CollectRequest request{.region = "us-west-1", .prefix = "ghost", .output_dir = out_dir};
  if (netstack::collect::CollectSnapshots(sim, request, out, logger, result, error)) {
    Fail("collect must fail when no VPC matches");
  }
  if (!result.lookup_completed || result.status != netstack::topology::ResolveStatus::kNotFound) {
    Fail("expected a completed lookup with not-found status");
  }
  AssertContains(error, "No VPC with Name tag 'ghost-vpc' found in region us-west-1.");
  if (!fs::exists(out_dir / "ghost-caller-identity.json") ||
      fs::exists(out_dir / "ghost-instances.json")) {
    Fail("only the caller identity should be written for a missing topology");
  }
}

void ExpectProviderFailureReported(const fs::path& root) {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  CreateFixtureTopology(sim, logger);
  sim.InjectFault(SimFault{.operation = "DescribeSubnets",
                           .resource_id = "",
                           .code = "UnauthorizedOperation",
                           .message = "denied",
                           .remaining = 1});

  std::ostringstream out;
  CollectResult result;
  std::string error;
  const CollectRequest request{
      .region = "us-west-1", .prefix = "fang", .output_dir = root / "denied"};
  if (netstack::collect::CollectSnapshots(sim, request, out, logger, result, error)) {
    Fail("collect must fail when a describe call fails");
  }
  if (result.status != netstack::topology::ResolveStatus::kFound ||
      result.written_files.size() != 2U) {
    Fail("files written before the failure should be reported");
  }
  AssertContains(error, "during describe subnets");
}

} // namespace

int main() {
  const netstack::tests::common::ScopedTempDir temp_dir("netstack-collect-smoke");
  const fs::path& root = temp_dir.path();
  ExpectSnapshotsWritten(root);
  ExpectSharedReservationKeptTogether(root);
  ExpectNotFoundStillWritesIdentity(root);
  ExpectProviderFailureReported(root);

  std::cout << "snapshot_exporter_smoke: ok\n";
  return 0;
}
