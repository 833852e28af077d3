#include "../common/assertions.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "core/logging/logger.hpp"
#include "topology/retrying_tagger.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using netstack::cloud::CloudError;
using netstack::cloud::sim::SimCloudClient;
using netstack::cloud::sim::SimFault;
using netstack::cloud::sim::SimOptions;
using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

struct SleepRecorder {
  std::vector<std::chrono::milliseconds> sleeps;

  netstack::cloud::Sleeper AsSleeper() {
    return [this](std::chrono::milliseconds duration) { sleeps.push_back(duration); };
  }
};

std::string CreateVpc(SimCloudClient& sim) {
  CloudError error;
  std::string vpc_id;
  if (!sim.CreateVpc("10.0.0.0/16", vpc_id, error)) {
    Fail("create vpc failed: " + netstack::cloud::FormatCloudError(error));
  }
  return vpc_id;
}

void ExpectDelaySchedule() {
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  const milliseconds unit = seconds(1);
  for (std::uint32_t i = 0; i < 4U; ++i) {
    if (netstack::topology::ComputeTagRetryDelay(i, unit) != seconds(1 + i)) {
      Fail("tag retry delay must grow linearly by one unit per attempt");
    }
  }
  if (netstack::topology::ComputeTagRetryDelay(3, milliseconds::zero()) != milliseconds::zero()) {
    Fail("a zero unit must produce zero delays");
  }
}

void ExpectRetryableCodes() {
  for (const char* code :
       {"InvalidVpcID.NotFound", "InvalidSubnetID.NotFound", "InvalidRouteTableID.NotFound",
        "InvalidInternetGatewayID.NotFound", "InvalidGroup.NotFound",
        "InvalidNatGatewayID.NotFound"}) {
    if (!netstack::topology::IsTagRetryableErrorCode(code)) {
      Fail(std::string("expected retryable tag code: ") + code);
    }
  }
  for (const char* code : {"InvalidInstanceID.NotFound", "DependencyViolation",
                           "UnauthorizedOperation", "InvalidParameterValue", ""}) {
    if (netstack::topology::IsTagRetryableErrorCode(code)) {
      Fail(std::string("unexpected retryable tag code: ") + code);
    }
  }
}

void ExpectEventualSuccess(netstack::core::logging::Logger& logger) {
  // Invisible for two tag calls, visible on the third.
  SimCloudClient sim(SimOptions{.region = "us-west-1", .tag_visibility_lag = 2});
  const std::string vpc_id = CreateVpc(sim);

  SleepRecorder recorder;
  netstack::topology::RetryingTagger tagger(sim, recorder.AsSleeper(), logger,
                                            std::chrono::seconds(1));
  CloudError error;
  if (!tagger.TagName(vpc_id, "fang-vpc", error)) {
    Fail("tag should succeed once the VPC becomes visible");
  }
  if (tagger.last_attempts() != 3U || sim.CallCount("CreateTags") != 3U) {
    Fail("expected exactly three tag attempts");
  }
  if (recorder.sleeps != std::vector<std::chrono::milliseconds>{std::chrono::seconds(1),
                                                                 std::chrono::seconds(2)}) {
    Fail("expected 1s then 2s backoff before the successful attempt");
  }
  const auto name = netstack::cloud::FindNameTag(sim.state().vpcs.at(vpc_id).tags);
  if (!name.has_value() || *name != "fang-vpc") {
    Fail("Name tag was not applied");
  }
}

void ExpectBoundedRetries(netstack::core::logging::Logger& logger) {
  // Never becomes visible within the budget.
  SimCloudClient sim(SimOptions{.region = "us-west-1", .tag_visibility_lag = 10});
  const std::string vpc_id = CreateVpc(sim);

  SleepRecorder recorder;
  netstack::topology::RetryingTagger tagger(sim, recorder.AsSleeper(), logger,
                                            std::chrono::seconds(1));
  CloudError error;
  if (tagger.TagName(vpc_id, "fang-vpc", error)) {
    Fail("tag must give up after the attempt budget");
  }
  if (tagger.last_attempts() != netstack::topology::kTagMaxAttempts ||
      sim.CallCount("CreateTags") != 5U) {
    Fail("expected exactly five tag attempts");
  }
  // Four waits between five attempts, none after the last.
  const std::vector<std::chrono::milliseconds> expected = {
      std::chrono::seconds(1), std::chrono::seconds(2), std::chrono::seconds(3),
      std::chrono::seconds(4)};
  if (recorder.sleeps != expected) {
    Fail("expected 1s, 2s, 3s, 4s backoff");
  }
  if (error.code != "InvalidVpcID.NotFound") {
    Fail("the last provider error must be surfaced");
  }
}

void ExpectNoRetryForOtherErrors(netstack::core::logging::Logger& logger) {
  SimCloudClient sim;
  const std::string vpc_id = CreateVpc(sim);
  sim.InjectFault(SimFault{.operation = "CreateTags",
                           .resource_id = vpc_id,
                           .code = "UnauthorizedOperation",
                           .message = "not allowed",
                           .remaining = 1});

  SleepRecorder recorder;
  netstack::topology::RetryingTagger tagger(sim, recorder.AsSleeper(), logger);
  CloudError error;
  if (tagger.TagName(vpc_id, "fang-vpc", error)) {
    Fail("a permission error must fail the tag");
  }
  if (tagger.last_attempts() != 1U || !recorder.sleeps.empty()) {
    Fail("non-visibility errors must not be retried");
  }
  AssertContains(error.message, "not allowed");
}

} // namespace

int main() {
  std::ostringstream log_sink;
  netstack::core::logging::Logger logger(netstack::core::logging::LogLevel::kDebug, log_sink);

  ExpectDelaySchedule();
  ExpectRetryableCodes();
  ExpectEventualSuccess(logger);
  ExpectBoundedRetries(logger);
  ExpectNoRetryForOtherErrors(logger);

  AssertContains(log_sink.str(), "msg=\"resource not visible yet, retrying tag\"");
  AssertContains(log_sink.str(), "msg=\"tag retries exhausted\"");

  std::cout << "retrying_tagger_smoke: ok\n";
  return 0;
}
