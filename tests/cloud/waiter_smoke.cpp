#include "../common/assertions.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "cloud/waiter.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using netstack::cloud::PollState;
using netstack::cloud::WaitPolicy;
using netstack::cloud::WaitResult;
using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

struct SleepRecorder {
  std::vector<std::chrono::milliseconds> sleeps;

  netstack::cloud::Sleeper AsSleeper() {
    return [this](std::chrono::milliseconds duration) { sleeps.push_back(duration); };
  }
};

void ExpectGenericWaitContract(netstack::core::logging::Logger& logger) {
  const WaitPolicy policy{.poll_interval = std::chrono::milliseconds(250), .max_attempts = 4};

  // Satisfied on the third poll: two sleeps in between, none after.
  {
    SleepRecorder recorder;
    int polls = 0;
    const WaitResult result = netstack::cloud::WaitUntil(
        "third_time",
        [&](std::string& detail) {
          ++polls;
          detail = "poll " + std::to_string(polls);
          return polls == 3 ? PollState::kSatisfied : PollState::kPending;
        },
        policy, recorder.AsSleeper(), logger);
    if (!result.satisfied || result.attempts != 3U || !result.error.empty()) {
      Fail("expected wait to be satisfied on attempt 3");
    }
    if (recorder.sleeps.size() != 2U ||
        recorder.sleeps.front() != std::chrono::milliseconds(250)) {
      Fail("expected two sleeps of the poll interval");
    }
  }

  // Budget exhausted: bounded attempts, timeout error with the last detail.
  {
    SleepRecorder recorder;
    const WaitResult result = netstack::cloud::WaitUntil(
        "never",
        [](std::string& detail) {
          detail = "still pending";
          return PollState::kPending;
        },
        policy, recorder.AsSleeper(), logger);
    if (result.satisfied || result.attempts != 4U) {
      Fail("expected timeout after exactly max_attempts polls");
    }
    if (recorder.sleeps.size() != 3U) {
      Fail("expected no sleep after the final attempt");
    }
    AssertContains(result.error, "WaiterTimeout");
    AssertContains(result.error, "after 4 attempts");
    AssertContains(result.error, "still pending");
  }

  // Terminal failure stops immediately.
  {
    SleepRecorder recorder;
    const WaitResult result = netstack::cloud::WaitUntil(
        "doomed",
        [](std::string& detail) {
          detail = "nat-1 is failed";
          return PollState::kFailed;
        },
        policy, recorder.AsSleeper(), logger);
    if (result.satisfied || result.attempts != 1U || !recorder.sleeps.empty()) {
      Fail("expected a failed poll to stop the wait on the first attempt");
    }
    AssertContains(result.error, "terminal failure state: nat-1 is failed");
  }

  // Zero budget never polls.
  {
    SleepRecorder recorder;
    int polls = 0;
    const WaitResult result = netstack::cloud::WaitUntil(
        "empty_budget",
        [&](std::string&) {
          ++polls;
          return PollState::kSatisfied;
        },
        {.poll_interval = std::chrono::milliseconds(1), .max_attempts = 0}, recorder.AsSleeper(),
        logger);
    if (result.satisfied || polls != 0) {
      Fail("expected zero-attempt budget to fail without polling");
    }
  }
}

void ExpectNamedWaitersAgainstSim(netstack::core::logging::Logger& logger) {
  netstack::cloud::sim::SimOptions options;
  options.region = "us-west-1";
  options.nat_pending_polls = 2;
  options.nat_deleting_polls = 1;
  options.instance_pending_polls = 0;
  options.instance_shutdown_polls = 2;
  netstack::cloud::sim::SimCloudClient sim(options);

  netstack::cloud::CloudError error;
  std::string vpc_id;
  std::string subnet_id;
  if (!sim.CreateVpc("10.0.0.0/16", vpc_id, error) ||
      !sim.CreateSubnet(vpc_id, "10.0.1.0/24", "us-west-1a", subnet_id, error)) {
    Fail("sim setup failed: " + netstack::cloud::FormatCloudError(error));
  }

  netstack::cloud::Address address;
  std::string nat_id;
  if (!sim.AllocateAddress(address, error) ||
      !sim.CreateNatGateway(subnet_id, address.allocation_id, nat_id, error)) {
    Fail("nat setup failed: " + netstack::cloud::FormatCloudError(error));
  }

  const WaitPolicy policy{.poll_interval = std::chrono::milliseconds(15'000), .max_attempts = 40};

  SleepRecorder available_sleeps;
  const WaitResult available = netstack::cloud::WaitForNatGatewaysAvailable(
      sim, {nat_id}, policy, available_sleeps.AsSleeper(), logger);
  if (!available.satisfied || available.attempts != 3U) {
    Fail("expected NAT gateway available on the third describe: " + available.error);
  }
  if (available_sleeps.sleeps.size() != 2U ||
      available_sleeps.sleeps.back() != std::chrono::milliseconds(15'000)) {
    Fail("expected the default 15s poll interval between NAT polls");
  }

  if (!sim.DeleteNatGateway(nat_id, error)) {
    Fail("nat delete failed: " + netstack::cloud::FormatCloudError(error));
  }
  SleepRecorder deleted_sleeps;
  const WaitResult deleted = netstack::cloud::WaitForNatGatewaysDeleted(
      sim, {nat_id}, policy, deleted_sleeps.AsSleeper(), logger);
  if (!deleted.satisfied || deleted.attempts != 2U) {
    Fail("expected NAT gateway deleted on the second describe: " + deleted.error);
  }

  // A deleted NAT gateway never becomes available again.
  const WaitResult revived = netstack::cloud::WaitForNatGatewaysAvailable(
      sim, {nat_id}, policy, netstack::cloud::NoopSleeper(), logger);
  if (revived.satisfied || revived.attempts != 1U) {
    Fail("expected waiting for a deleted NAT gateway to fail immediately");
  }
  AssertContains(revived.error, nat_id + " is deleted");

  // IDs the provider no longer knows count as deleted.
  const WaitResult unknown = netstack::cloud::WaitForNatGatewaysDeleted(
      sim, {"nat-00000000000000999"}, policy, netstack::cloud::NoopSleeper(), logger);
  if (!unknown.satisfied) {
    Fail("expected an unknown NAT gateway to satisfy the deleted waiter");
  }

  netstack::cloud::RunInstanceRequest run;
  run.image_id = "ami-0b09bf4b909f29738";
  run.instance_type = "t3.micro";
  run.key_name = "fang-key";
  run.subnet_id = subnet_id;
  netstack::cloud::Instance instance;
  if (!sim.RunInstance(run, instance, error) ||
      !sim.TerminateInstances({instance.instance_id}, error)) {
    Fail("instance setup failed: " + netstack::cloud::FormatCloudError(error));
  }
  const WaitResult terminated = netstack::cloud::WaitForInstancesTerminated(
      sim, {instance.instance_id}, policy, netstack::cloud::NoopSleeper(), logger);
  if (!terminated.satisfied || terminated.attempts != 3U) {
    Fail("expected instance terminated on the third describe: " + terminated.error);
  }

  // Tight budget surfaces as a timeout, not a hang.
  std::string second_subnet;
  std::string second_nat;
  netstack::cloud::Address second_address;
  if (!sim.CreateSubnet(vpc_id, "10.0.2.0/24", "us-west-1c", second_subnet, error) ||
      !sim.AllocateAddress(second_address, error) ||
      !sim.CreateNatGateway(second_subnet, second_address.allocation_id, second_nat, error)) {
    Fail("second nat setup failed: " + netstack::cloud::FormatCloudError(error));
  }
  const WaitResult timed_out = netstack::cloud::WaitForNatGatewaysAvailable(
      sim, {second_nat}, {.poll_interval = std::chrono::milliseconds(1), .max_attempts = 2},
      netstack::cloud::NoopSleeper(), logger);
  if (timed_out.satisfied || timed_out.attempts != 2U) {
    Fail("expected NAT wait to time out within its budget");
  }
  AssertContains(timed_out.error, "WaiterTimeout");
}

} // namespace

int main() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kDebug, log_sink);

  ExpectGenericWaitContract(logger);
  ExpectNamedWaitersAgainstSim(logger);

  AssertContains(log_sink.str(), "msg=\"wait timed out\"");

  std::cout << "waiter_smoke: ok\n";
  return 0;
}
