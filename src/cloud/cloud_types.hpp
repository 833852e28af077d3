#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netstack::cloud {

struct Tag {
  std::string key;
  std::string value;
};

using TagList = std::vector<Tag>;

inline constexpr std::string_view kNameTagKey = "Name";

// Returns the value of the `Name` tag, if present.
inline std::optional<std::string> FindNameTag(const TagList& tags) {
  for (const auto& tag : tags) {
    if (tag.key == kNameTagKey) {
      return tag.value;
    }
  }
  return std::nullopt;
}

// Provider error as reported by the control plane. `code` is the provider's
// machine-readable code (for example `InvalidVpcID.NotFound`); `message` is
// free text for humans.
struct CloudError {
  std::string code;
  std::string message;

  void Clear() {
    code.clear();
    message.clear();
  }

  bool empty() const {
    return code.empty() && message.empty();
  }
};

inline std::string FormatCloudError(const CloudError& error) {
  if (error.code.empty()) {
    return error.message;
  }
  if (error.message.empty()) {
    return error.code;
  }
  return error.code + ": " + error.message;
}

// Scopes a describe call. Empty/absent members do not filter. The provider
// backends translate these into their own filter syntax.
struct DescribeQuery {
  std::vector<std::string> ids;
  std::optional<std::string> vpc_id;
  std::optional<std::string> subnet_id;
  std::optional<std::string> name_tag;
};

struct Vpc {
  std::string vpc_id;
  std::string cidr_block;
  std::string state;
  bool is_default = false;
  TagList tags;
};

struct Subnet {
  std::string subnet_id;
  std::string vpc_id;
  std::string cidr_block;
  std::string availability_zone;
  std::string state;
  bool map_public_ip_on_launch = false;
  TagList tags;
};

struct InternetGatewayAttachment {
  std::string vpc_id;
  std::string state;
};

struct InternetGateway {
  std::string internet_gateway_id;
  std::vector<InternetGatewayAttachment> attachments;
  TagList tags;
};

enum class NatGatewayState {
  kPending,
  kAvailable,
  kDeleting,
  kDeleted,
  kFailed,
};

const char* ToString(NatGatewayState state);
bool ParseNatGatewayState(std::string_view text, NatGatewayState& state);

struct NatGatewayAddress {
  std::string allocation_id;
  std::string network_interface_id;
  std::string public_ip;
  std::string private_ip;
};

struct NatGateway {
  std::string nat_gateway_id;
  std::string vpc_id;
  std::string subnet_id;
  NatGatewayState state = NatGatewayState::kPending;
  std::vector<NatGatewayAddress> addresses;
  TagList tags;
};

struct Address {
  std::string allocation_id;
  std::string public_ip;
  std::string association_id;
  std::string network_interface_id;
};

struct RouteTableAssociation {
  std::string association_id;
  std::string route_table_id;
  std::string subnet_id;
  bool main = false;
};

struct Route {
  std::string destination_cidr_block;
  std::string gateway_id;
  std::string nat_gateway_id;
  std::string state;
  std::string origin;
};

// Target of a route. Exactly one of `gateway_id` / `nat_gateway_id` is set.
struct RouteSpec {
  std::string route_table_id;
  std::string destination_cidr_block;
  std::string gateway_id;
  std::string nat_gateway_id;
};

struct RouteTable {
  std::string route_table_id;
  std::string vpc_id;
  std::vector<RouteTableAssociation> associations;
  std::vector<Route> routes;
  TagList tags;

  // The main table is the one whose association list carries the main flag.
  bool IsMain() const {
    for (const auto& association : associations) {
      if (association.main) {
        return true;
      }
    }
    return false;
  }
};

struct IpPermission {
  std::string ip_protocol;
  std::int32_t from_port = 0;
  std::int32_t to_port = 0;
  std::vector<std::string> cidr_ranges;
  std::vector<std::string> source_group_ids;
};

struct SecurityGroup {
  std::string group_id;
  std::string group_name;
  std::string description;
  std::string vpc_id;
  std::vector<IpPermission> ingress;
  TagList tags;
};

inline constexpr std::string_view kDefaultSecurityGroupName = "default";

enum class InstanceState {
  kPending,
  kRunning,
  kShuttingDown,
  kTerminated,
  kStopping,
  kStopped,
};

const char* ToString(InstanceState state);
bool ParseInstanceState(std::string_view text, InstanceState& state);

struct Instance {
  std::string instance_id;
  // Launch call that created the instance; several instances can share one.
  std::string reservation_id;
  std::string launch_time;
  std::string image_id;
  std::string instance_type;
  std::string key_name;
  std::string vpc_id;
  std::string subnet_id;
  std::string private_ip;
  std::string public_ip;
  std::vector<std::string> security_group_ids;
  InstanceState state = InstanceState::kPending;
  TagList tags;
};

struct RunInstanceRequest {
  std::string image_id;
  std::string instance_type;
  std::string key_name;
  std::string subnet_id;
  std::vector<std::string> security_group_ids;
  std::string user_data;
  // Applied by the launch call itself; no separate tagging round-trip.
  TagList tags;
};

struct NetworkInterfaceAttachment {
  std::string attachment_id;
  std::string instance_id;
  std::string status;
};

struct NetworkInterfaceAssociation {
  std::string public_ip;
  std::string association_id;
  std::string allocation_id;
};

struct NetworkInterface {
  std::string network_interface_id;
  std::string vpc_id;
  std::string subnet_id;
  std::string interface_type;
  std::string status;
  std::string private_ip;
  std::string description;
  std::optional<NetworkInterfaceAttachment> attachment;
  std::optional<NetworkInterfaceAssociation> association;
};

struct CallerIdentity {
  std::string account;
  std::string arn;
  std::string user_id;
};

} // namespace netstack::cloud
