#include "../common/assertions.hpp"
#include "../common/sim_fixtures.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "core/logging/logger.hpp"
#include "topology/teardown_orchestrator.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace {

using netstack::cloud::sim::SimCloudClient;
using netstack::cloud::sim::SimFault;
using netstack::topology::ActionOutcome;
using netstack::topology::CreatedTopology;
using netstack::topology::ResolveStatus;
using netstack::topology::TeardownAction;
using netstack::topology::TeardownOrchestrator;
using netstack::topology::TeardownReport;
using netstack::tests::common::AssertContains;
using netstack::tests::common::CreateFixtureTopology;
using netstack::tests::common::FastWaiter;
using netstack::tests::common::Fail;

const TeardownAction* FindAction(const TeardownReport& report, const std::string& action,
                                 const std::string& resource_id) {
  for (const auto& entry : report.actions) {
    if (entry.action == action && entry.resource_id == resource_id) {
      return &entry;
    }
  }
  return nullptr;
}

TeardownReport RunTeardown(SimCloudClient& sim, netstack::core::logging::Logger& logger) {
  std::ostringstream out;
  TeardownOrchestrator orchestrator(sim, netstack::cloud::NoopSleeper(), logger, out,
                                    FastWaiter());
  TeardownReport report;
  ResolveStatus status = ResolveStatus::kNotFound;
  std::string error;
  if (!orchestrator.Teardown("us-west-1", "fang", report, status, error)) {
    Fail("teardown should complete despite failed actions: " + error);
  }
  return report;
}

void ExpectStuckRouteTableDoesNotStopLaterSteps() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const CreatedTopology created = CreateFixtureTopology(sim, logger);

  sim.InjectFault(SimFault{.operation = "DeleteRouteTable",
                           .resource_id = created.private_route_table_id,
                           .code = "InternalError",
                           .message = "route table is wedged",
                           .remaining = 1});
  const TeardownReport report = RunTeardown(sim, logger);

  if (!report.HasFailures()) {
    Fail("the injected route table failure should be reported");
  }
  const TeardownAction* stuck =
      FindAction(report, "delete route table", created.private_route_table_id);
  if (stuck == nullptr || stuck->outcome != ActionOutcome::kFailed) {
    Fail("stuck route table delete should be recorded as failed");
  }
  AssertContains(stuck->error, "route table is wedged");

  // Later steps still ran.
  const TeardownAction* subnet = FindAction(report, "delete subnet", created.private_subnet_id);
  if (subnet == nullptr || subnet->outcome != ActionOutcome::kSucceeded) {
    Fail("subnets should still be deleted after the route table failure");
  }
  if (sim.state().security_groups.size() != 1U) {
    Fail("only the default security group of the surviving VPC may remain");
  }
  const TeardownAction* vpc = FindAction(report, "delete vpc", created.vpc_id);
  if (vpc == nullptr || vpc->outcome != ActionOutcome::kFailed) {
    Fail("the VPC delete should fail while the private route table remains");
  }
  if (report.Counts().failed != 2U) {
    Fail("expected exactly two failed actions, got " +
         netstack::topology::FormatTeardownSummary(report));
  }
  AssertContains(log_sink.str(), "msg=\"teardown action failed; continuing\"");

  // The fault fired once; a rerun finishes the job and counts what earlier
  // runs already removed as done.
  const TeardownReport rerun = RunTeardown(sim, logger);
  if (!rerun.topology_found || rerun.HasFailures()) {
    Fail("rerun should resolve the leftover VPC and clean it up: " +
         netstack::topology::FormatTeardownSummary(rerun));
  }
  const TeardownAction* retried =
      FindAction(rerun, "delete route table", created.private_route_table_id);
  if (retried == nullptr || retried->outcome != ActionOutcome::kSucceeded) {
    Fail("rerun should delete the leftover route table");
  }
  if (!sim.state().vpcs.empty() || !sim.state().route_tables.empty()) {
    Fail("rerun should leave nothing behind");
  }
}

void ExpectFailedTerminateSkipsWait() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const CreatedTopology created = CreateFixtureTopology(sim, logger);

  sim.InjectFault(SimFault{.operation = "TerminateInstances",
                           .resource_id = "",
                           .code = "UnauthorizedOperation",
                           .message = "not allowed to terminate",
                           .remaining = 1});
  const TeardownReport report = RunTeardown(sim, logger);

  const std::string instance_ids =
      created.public_instance_id + "," + created.private_instance_id;
  const TeardownAction* terminate = FindAction(report, "terminate instances", instance_ids);
  if (terminate == nullptr || terminate->outcome != ActionOutcome::kFailed) {
    Fail("terminate failure should be recorded");
  }
  for (const auto& entry : report.actions) {
    if (entry.action == "wait instances terminated") {
      Fail("no wait should follow a failed terminate");
    }
  }

  // Instances still hold their subnets, so those deletes fail too, and the
  // run still reaches the VPC step.
  const TeardownAction* subnet = FindAction(report, "delete subnet", created.public_subnet_id);
  if (subnet == nullptr || subnet->outcome != ActionOutcome::kFailed) {
    Fail("subnet delete should fail while its instance is alive");
  }
  if (FindAction(report, "delete vpc", created.vpc_id) == nullptr) {
    Fail("the VPC step should still run");
  }
  if (sim.state().instances.at(created.public_instance_id).state ==
      netstack::cloud::InstanceState::kTerminated) {
    Fail("instances must not be terminated when the call failed");
  }
}

void ExpectAlreadyGoneCountsAsSkipped() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kInfo, log_sink);
  SimCloudClient sim;
  const CreatedTopology created = CreateFixtureTopology(sim, logger);

  // Another actor removes the gateway between describe and delete.
  sim.InjectFault(SimFault{.operation = "DeleteInternetGateway",
                           .resource_id = created.internet_gateway_id,
                           .code = "InvalidInternetGatewayID.NotFound",
                           .message = "The internetGateway ID does not exist",
                           .remaining = 1});
  const TeardownReport report = RunTeardown(sim, logger);

  const TeardownAction* gateway =
      FindAction(report, "delete internet gateway", created.internet_gateway_id);
  if (gateway == nullptr || gateway->outcome != ActionOutcome::kSkippedNotFound) {
    Fail("a not-found delete should be recorded as skipped");
  }
  if (report.Counts().skipped_not_found == 0U) {
    Fail("skipped actions should be counted");
  }
  AssertContains(netstack::topology::FormatTeardownSummary(report), "skipped_not_found=");
}

} // namespace

int main() {
  ExpectStuckRouteTableDoesNotStopLaterSteps();
  ExpectFailedTerminateSkipsWait();
  ExpectAlreadyGoneCountsAsSkipped();

  std::cout << "teardown_best_effort_smoke: ok\n";
  return 0;
}
