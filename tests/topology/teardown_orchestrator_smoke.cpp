#include "../common/assertions.hpp"
#include "../common/sim_fixtures.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "core/logging/logger.hpp"
#include "topology/teardown_orchestrator.hpp"

#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using netstack::cloud::sim::SimCloudClient;
using netstack::cloud::sim::SimFault;
using netstack::topology::ActionOutcome;
using netstack::topology::CreatedTopology;
using netstack::topology::ResolveStatus;
using netstack::topology::TeardownOrchestrator;
using netstack::topology::TeardownReport;
using netstack::tests::common::AssertCalledBefore;
using netstack::tests::common::AssertContains;
using netstack::tests::common::CreateFixtureTopology;
using netstack::tests::common::FastWaiter;
using netstack::tests::common::Fail;
using netstack::tests::common::FindJournalEntry;
using netstack::tests::common::kNotInJournal;

void ExpectFullTeardown() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kDebug, log_sink);
  SimCloudClient sim;
  const CreatedTopology created = CreateFixtureTopology(sim, logger);
  const std::size_t journal_start = sim.CallJournal().size();

  std::ostringstream out;
  TeardownOrchestrator orchestrator(sim, netstack::cloud::NoopSleeper(), logger, out,
                                    FastWaiter());
  TeardownReport report;
  ResolveStatus status = ResolveStatus::kNotFound;
  std::string error;
  if (!orchestrator.Teardown("us-west-1", "fang", report, status, error)) {
    Fail("teardown failed: " + error);
  }
  if (status != ResolveStatus::kFound || !report.topology_found ||
      report.vpc_id != created.vpc_id || report.prefix != "fang" ||
      report.region != "us-west-1") {
    Fail("report should describe the resolved fang topology");
  }
  if (report.HasFailures()) {
    Fail("clean teardown should have no failures: " +
         netstack::topology::FormatTeardownSummary(report));
  }
  if (report.started_at_utc.empty() || report.finished_at_utc.empty()) {
    Fail("report timestamps should be set");
  }
  AssertContains(out.str(), "VPC: " + created.vpc_id + "\n");
  AssertContains(out.str(), "teardown complete.");

  // Nothing billable or blocking remains.
  const auto& state = sim.state();
  if (!state.vpcs.empty() || !state.subnets.empty() || !state.internet_gateways.empty() ||
      !state.addresses.empty() || !state.route_tables.empty() ||
      !state.security_groups.empty() || !state.network_interfaces.empty()) {
    Fail("teardown left resources behind in the simulated region");
  }
  for (const auto& [id, instance] : state.instances) {
    if (instance.state != netstack::cloud::InstanceState::kTerminated) {
      Fail("instance " + id + " is not terminated");
    }
  }
  for (const auto& [id, gateway] : state.nat_gateways) {
    if (gateway.state != netstack::cloud::NatGatewayState::kDeleted) {
      Fail("nat gateway " + id + " is not deleted");
    }
  }

  // Dependents go before what they depend on.
  const auto& journal = sim.CallJournal();
  AssertCalledBefore(journal, "TerminateInstances", "DeleteSubnet", journal_start);
  AssertCalledBefore(journal, "DeleteNatGateway " + created.nat_gateway_id, "ReleaseAddress",
                     journal_start);
  AssertCalledBefore(journal, "DeleteNatGateway " + created.nat_gateway_id, "DeleteRoute ",
                     journal_start);
  AssertCalledBefore(journal, "DeleteSubnet", "DeleteVpc", journal_start);
  AssertCalledBefore(journal, "DeleteSecurityGroup", "DeleteVpc", journal_start);
  if (FindJournalEntry(journal, "DeleteRouteTable " + created.public_route_table_id,
                       journal_start) != kNotInJournal) {
    Fail("the main route table must never be deleted directly");
  }
  if (sim.CallCount("DeleteSecurityGroup") != 2U) {
    Fail("the default security group must be left to the VPC delete");
  }

  // Second run resolves nothing and makes no mutating call.
  const std::size_t second_start = sim.CallJournal().size();
  std::ostringstream second_out;
  TeardownOrchestrator second(sim, netstack::cloud::NoopSleeper(), logger, second_out,
                              FastWaiter());
  TeardownReport second_report;
  if (!second.Teardown("us-west-1", "fang", second_report, status, error)) {
    Fail("second teardown should succeed: " + error);
  }
  if (status != ResolveStatus::kNotFound || second_report.topology_found ||
      !second_report.actions.empty()) {
    Fail("second teardown should find nothing to do");
  }
  AssertContains(second_out.str(),
                 "No VPC found with tag Name=fang-vpc in us-west-1. Nothing to do.");
  if (sim.CallJournal().size() != second_start + 1U) {
    Fail("second teardown should only look the VPC up");
  }
}

void ExpectAmbiguousPrefixTouchesNothing() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const CreatedTopology first = CreateFixtureTopology(sim, logger);
  const CreatedTopology second = CreateFixtureTopology(sim, logger);

  std::ostringstream out;
  TeardownOrchestrator orchestrator(sim, netstack::cloud::NoopSleeper(), logger, out,
                                    FastWaiter());
  TeardownReport report;
  ResolveStatus status = ResolveStatus::kNotFound;
  std::string error;
  if (orchestrator.Teardown("us-west-1", "fang", report, status, error)) {
    Fail("an ambiguous prefix must not be torn down");
  }
  if (status != ResolveStatus::kAmbiguous || !report.actions.empty()) {
    Fail("expected ambiguous status and no actions");
  }
  AssertContains(error, first.vpc_id);
  AssertContains(error, second.vpc_id);
  AssertContains(error, "refusing to tear down");
  if (sim.CallCount("TerminateInstances") != 0U || sim.state().vpcs.size() != 2U) {
    Fail("nothing may be deleted for an ambiguous prefix");
  }
}

void ExpectLookupFailure() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  sim.InjectFault(SimFault{.operation = "DescribeVpcs",
                           .resource_id = "",
                           .code = "RequestLimitExceeded",
                           .message = "slow down",
                           .remaining = 1});
  std::ostringstream out;
  TeardownOrchestrator orchestrator(sim, netstack::cloud::NoopSleeper(), logger, out,
                                    FastWaiter());
  TeardownReport report;
  ResolveStatus status = ResolveStatus::kFound;
  std::string error;
  if (orchestrator.Teardown("us-west-1", "fang", report, status, error)) {
    Fail("a failed lookup must fail teardown");
  }
  AssertContains(error, "during describe vpcs");
}

void ExpectRunStepAndPlan() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const CreatedTopology created = CreateFixtureTopology(sim, logger);

  std::ostringstream out;
  TeardownOrchestrator orchestrator(sim, netstack::cloud::NoopSleeper(), logger, out,
                                    FastWaiter());
  std::string error;
  if (!netstack::topology::ValidateTeardownPlan(orchestrator.Plan(), error)) {
    Fail("teardown plan should be valid: " + error);
  }

  netstack::topology::TopologyHandle handle;
  handle.region = "us-west-1";
  handle.prefix = "fang";
  handle.vpc_id = created.vpc_id;
  TeardownReport report;
  if (orchestrator.RunStep("volumes", handle, report, error)) {
    Fail("unknown teardown step must be rejected");
  }
  AssertContains(error, "unknown teardown step 'volumes'");

  // Deleting the VPC first is refused by its dependents and recorded.
  if (!orchestrator.RunStep("vpc", handle, report, error)) {
    Fail("vpc step should run: " + error);
  }
  if (report.actions.size() != 1U || report.actions.front().outcome != ActionOutcome::kFailed) {
    Fail("premature VPC delete should be recorded as failed");
  }
  AssertContains(report.actions.front().error, "CLOUD_DEPENDENCY_VIOLATION");

  if (!orchestrator.RunStep("instances", handle, report, error)) {
    Fail("instances step should run: " + error);
  }
  const auto& last = report.actions.back();
  if (last.action != "wait instances terminated" || last.outcome != ActionOutcome::kSucceeded) {
    Fail("terminate should be followed by a successful wait");
  }
}

} // namespace

int main() {
  ExpectFullTeardown();
  ExpectAmbiguousPrefixTouchesNothing();
  ExpectLookupFailure();
  ExpectRunStepAndPlan();

  std::cout << "teardown_orchestrator_smoke: ok\n";
  return 0;
}
