#include "cloud/cloud_types.hpp"

namespace netstack::cloud {

const char* ToString(NatGatewayState state) {
  switch (state) {
  case NatGatewayState::kPending:
    return "pending";
  case NatGatewayState::kAvailable:
    return "available";
  case NatGatewayState::kDeleting:
    return "deleting";
  case NatGatewayState::kDeleted:
    return "deleted";
  case NatGatewayState::kFailed:
    return "failed";
  }
  return "pending";
}

bool ParseNatGatewayState(std::string_view text, NatGatewayState& state) {
  if (text == "pending") {
    state = NatGatewayState::kPending;
  } else if (text == "available") {
    state = NatGatewayState::kAvailable;
  } else if (text == "deleting") {
    state = NatGatewayState::kDeleting;
  } else if (text == "deleted") {
    state = NatGatewayState::kDeleted;
  } else if (text == "failed") {
    state = NatGatewayState::kFailed;
  } else {
    return false;
  }
  return true;
}

const char* ToString(InstanceState state) {
  switch (state) {
  case InstanceState::kPending:
    return "pending";
  case InstanceState::kRunning:
    return "running";
  case InstanceState::kShuttingDown:
    return "shutting-down";
  case InstanceState::kTerminated:
    return "terminated";
  case InstanceState::kStopping:
    return "stopping";
  case InstanceState::kStopped:
    return "stopped";
  }
  return "pending";
}

bool ParseInstanceState(std::string_view text, InstanceState& state) {
  if (text == "pending") {
    state = InstanceState::kPending;
  } else if (text == "running") {
    state = InstanceState::kRunning;
  } else if (text == "shutting-down") {
    state = InstanceState::kShuttingDown;
  } else if (text == "terminated") {
    state = InstanceState::kTerminated;
  } else if (text == "stopping") {
    state = InstanceState::kStopping;
  } else if (text == "stopped") {
    state = InstanceState::kStopped;
  } else {
    return false;
  }
  return true;
}

} // namespace netstack::cloud
