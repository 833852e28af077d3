#include "cloud/waiter.hpp"

#include "cloud/error_mapper.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <thread>

namespace netstack::cloud {

namespace {

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string joined;
  for (const auto& id : ids) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += id;
  }
  return joined;
}

// Shared shape of the "all listed resources reached state X" predicates.
// `is_done` sees each described resource; resources that are not described at
// all count as done only when `missing_is_done` is set.
template <typename Resource, typename DescribeFn, typename IdFn, typename StateFn>
PollState PollAll(const std::vector<std::string>& ids, DescribeFn describe, IdFn id_of,
                  StateFn classify, bool missing_is_done, std::string& detail) {
  std::vector<Resource> described;
  CloudError error;
  DescribeQuery query;
  query.ids = ids;
  if (!describe(query, described, error)) {
    if (IsNotFoundError(error)) {
      detail = "not yet visible: " + FormatCloudError(error);
      return missing_is_done ? PollState::kSatisfied : PollState::kPending;
    }
    detail = FormatCloudError(error);
    return PollState::kFailed;
  }

  std::size_t done = 0;
  for (const auto& id : ids) {
    const auto it = std::find_if(described.begin(), described.end(),
                                 [&](const Resource& resource) { return id_of(resource) == id; });
    if (it == described.end()) {
      if (missing_is_done) {
        ++done;
      }
      continue;
    }
    const PollState state = classify(*it, detail);
    if (state == PollState::kFailed) {
      return PollState::kFailed;
    }
    if (state == PollState::kSatisfied) {
      ++done;
    }
  }

  if (done == ids.size()) {
    return PollState::kSatisfied;
  }
  detail = std::to_string(done) + "/" + std::to_string(ids.size()) + " in target state";
  return PollState::kPending;
}

} // namespace

Sleeper RealSleeper() {
  return [](std::chrono::milliseconds duration) {
    if (duration > std::chrono::milliseconds::zero()) {
      std::this_thread::sleep_for(duration);
    }
  };
}

Sleeper NoopSleeper() {
  return [](std::chrono::milliseconds) {};
}

WaitResult WaitUntil(std::string_view what, const PollFunction& poll, const WaitPolicy& policy,
                     const Sleeper& sleeper, core::logging::Logger& logger) {
  WaitResult result;
  const std::string label(what);

  if (policy.max_attempts == 0U) {
    result.error = "wait '" + label + "' has no attempt budget";
    return result;
  }

  std::string detail;
  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    result.attempts = attempt;
    detail.clear();
    const PollState state = poll(detail);

    if (state == PollState::kSatisfied) {
      logger.Debug("wait satisfied",
                   {{"wait", label}, {"attempts", std::to_string(attempt)}});
      result.satisfied = true;
      result.error.clear();
      return result;
    }

    if (state == PollState::kFailed) {
      result.error = "wait '" + label + "' reached a terminal failure state: " + detail;
      logger.Warn("wait failed", {{"wait", label},
                                  {"attempts", std::to_string(attempt)},
                                  {"detail", detail}});
      return result;
    }

    logger.Debug("wait pending", {{"wait", label},
                                  {"attempt", std::to_string(attempt)},
                                  {"max_attempts", std::to_string(policy.max_attempts)},
                                  {"detail", detail}});
    if (attempt < policy.max_attempts) {
      sleeper(policy.poll_interval);
    }
  }

  result.error = "WaiterTimeout: wait '" + label + "' did not complete after " +
                 std::to_string(policy.max_attempts) + " attempts";
  if (!detail.empty()) {
    result.error += " (last state: " + detail + ")";
  }
  logger.Warn("wait timed out", {{"wait", label},
                                 {"attempts", std::to_string(policy.max_attempts)},
                                 {"detail", detail}});
  return result;
}

WaitResult WaitForNatGatewaysAvailable(ICloudClient& client,
                                       const std::vector<std::string>& nat_gateway_ids,
                                       const WaitPolicy& policy, const Sleeper& sleeper,
                                       core::logging::Logger& logger) {
  const auto poll = [&](std::string& detail) {
    return PollAll<NatGateway>(
        nat_gateway_ids,
        [&](const DescribeQuery& query, std::vector<NatGateway>& out, CloudError& error) {
          return client.DescribeNatGateways(query, out, error);
        },
        [](const NatGateway& gateway) { return gateway.nat_gateway_id; },
        [](const NatGateway& gateway, std::string& state_detail) {
          switch (gateway.state) {
          case NatGatewayState::kAvailable:
            return PollState::kSatisfied;
          case NatGatewayState::kPending:
            return PollState::kPending;
          case NatGatewayState::kFailed:
          case NatGatewayState::kDeleting:
          case NatGatewayState::kDeleted:
            state_detail = gateway.nat_gateway_id + " is " + ToString(gateway.state);
            return PollState::kFailed;
          }
          return PollState::kPending;
        },
        /*missing_is_done=*/false, detail);
  };
  return WaitUntil("nat_gateway_available " + JoinIds(nat_gateway_ids), poll, policy, sleeper,
                   logger);
}

WaitResult WaitForNatGatewaysDeleted(ICloudClient& client,
                                     const std::vector<std::string>& nat_gateway_ids,
                                     const WaitPolicy& policy, const Sleeper& sleeper,
                                     core::logging::Logger& logger) {
  const auto poll = [&](std::string& detail) {
    return PollAll<NatGateway>(
        nat_gateway_ids,
        [&](const DescribeQuery& query, std::vector<NatGateway>& out, CloudError& error) {
          return client.DescribeNatGateways(query, out, error);
        },
        [](const NatGateway& gateway) { return gateway.nat_gateway_id; },
        [](const NatGateway& gateway, std::string&) {
          return gateway.state == NatGatewayState::kDeleted ? PollState::kSatisfied
                                                            : PollState::kPending;
        },
        /*missing_is_done=*/true, detail);
  };
  return WaitUntil("nat_gateway_deleted " + JoinIds(nat_gateway_ids), poll, policy, sleeper,
                   logger);
}

WaitResult WaitForInstancesTerminated(ICloudClient& client,
                                      const std::vector<std::string>& instance_ids,
                                      const WaitPolicy& policy, const Sleeper& sleeper,
                                      core::logging::Logger& logger) {
  const auto poll = [&](std::string& detail) {
    return PollAll<Instance>(
        instance_ids,
        [&](const DescribeQuery& query, std::vector<Instance>& out, CloudError& error) {
          return client.DescribeInstances(query, out, error);
        },
        [](const Instance& instance) { return instance.instance_id; },
        [](const Instance& instance, std::string& state_detail) {
          switch (instance.state) {
          case InstanceState::kTerminated:
            return PollState::kSatisfied;
          case InstanceState::kStopping:
          case InstanceState::kStopped:
            // A stop racing the terminate; the provider's waiter also gives
            // up here.
            state_detail = instance.instance_id + " is " + ToString(instance.state);
            return PollState::kFailed;
          default:
            return PollState::kPending;
          }
        },
        /*missing_is_done=*/true, detail);
  };
  return WaitUntil("instance_terminated " + JoinIds(instance_ids), poll, policy, sleeper, logger);
}

} // namespace netstack::cloud
