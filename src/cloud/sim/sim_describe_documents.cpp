#include "cloud/sim/sim_cloud_client.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// Response documents for snapshot export. They are rendered from the same
// state the typed describe calls read, in the member layout the provider
// uses for the same responses.
namespace netstack::cloud::sim {

namespace {

using core::JsonWriter;

void WriteTags(JsonWriter& out, const TagList& tags) {
  out.Key("Tags").BeginArray();
  for (const auto& tag : tags) {
    out.BeginObject().StringField("Key", tag.key).StringField("Value", tag.value).EndObject();
  }
  out.EndArray();
}

// The provider leaves unset members out rather than sending empty strings.
void OptionalStringField(JsonWriter& out, std::string_view key, const std::string& value) {
  if (!value.empty()) {
    out.StringField(key, value);
  }
}

std::int64_t InstanceStateCode(InstanceState state) {
  switch (state) {
  case InstanceState::kPending:
    return 0;
  case InstanceState::kRunning:
    return 16;
  case InstanceState::kShuttingDown:
    return 32;
  case InstanceState::kTerminated:
    return 48;
  case InstanceState::kStopping:
    return 64;
  case InstanceState::kStopped:
    return 80;
  }
  return 0;
}

// ip-10-0-1-4.us-west-1.compute.internal
std::string PrivateDnsName(const std::string& private_ip, const std::string& region) {
  if (private_ip.empty()) {
    return "";
  }
  std::string host = "ip-" + private_ip;
  std::replace(host.begin(), host.end(), '.', '-');
  return host + "." + region + ".compute.internal";
}

// Addresses in the block minus the five the provider reserves per subnet and
// the ones interfaces already hold.
std::int64_t AvailableIpAddressCount(const std::string& cidr_block, std::int64_t in_use) {
  const auto slash = cidr_block.find('/');
  if (slash == std::string::npos) {
    return 0;
  }
  int prefix_length = -1;
  const char* first = cidr_block.data() + slash + 1;
  const char* last = cidr_block.data() + cidr_block.size();
  const auto [end, ec] = std::from_chars(first, last, prefix_length);
  if (ec != std::errc() || end != last || prefix_length < 0 || prefix_length > 32) {
    return 0;
  }
  const std::int64_t total = std::int64_t{1} << (32 - prefix_length);
  return std::max<std::int64_t>(total - 5 - in_use, 0);
}

} // namespace

bool SimCloudClient::GetCallerIdentityDocument(std::string& document, CloudError& error) {
  document.clear();
  CallerIdentity identity;
  if (!GetCallerIdentity(identity, error)) {
    return false;
  }
  JsonWriter out;
  out.BeginObject()
      .StringField("UserId", identity.user_id)
      .StringField("Account", identity.account)
      .StringField("Arn", identity.arn)
      .EndObject();
  document = out.str() + "\n";
  return true;
}

bool SimCloudClient::DescribeInstancesDocument(const DescribeQuery& query, std::string& document,
                                               CloudError& error) {
  document.clear();
  std::vector<Instance> instances;
  if (!DescribeInstances(query, instances, error)) {
    return false;
  }

  // Reservations in launch order, each holding its instances in launch order.
  std::vector<std::vector<const Instance*>> reservations;
  for (const auto& instance : instances) {
    const auto same_reservation = [&](const std::vector<const Instance*>& members) {
      return members.front()->reservation_id == instance.reservation_id;
    };
    const auto it = std::find_if(reservations.begin(), reservations.end(), same_reservation);
    if (it == reservations.end()) {
      reservations.push_back({&instance});
    } else {
      it->push_back(&instance);
    }
  }

  JsonWriter out;
  out.BeginObject().Key("Reservations").BeginArray();
  for (const auto& members : reservations) {
    out.BeginObject().Key("Groups").BeginArray().EndArray().Key("Instances").BeginArray();
    for (std::size_t index = 0; index < members.size(); ++index) {
      const Instance& instance = *members[index];
      const auto subnet = state_.subnets.find(instance.subnet_id);

      out.BeginObject()
          .IntField("AmiLaunchIndex", static_cast<std::int64_t>(index))
          .StringField("ImageId", instance.image_id)
          .StringField("InstanceId", instance.instance_id)
          .StringField("InstanceType", instance.instance_type);
      OptionalStringField(out, "KeyName", instance.key_name);
      OptionalStringField(out, "LaunchTime", instance.launch_time);
      out.Key("Placement").BeginObject();
      if (subnet != state_.subnets.end()) {
        out.StringField("AvailabilityZone", subnet->second.availability_zone);
      }
      out.StringField("GroupName", "").StringField("Tenancy", "default").EndObject();
      out.StringField("PrivateDnsName", PrivateDnsName(instance.private_ip, options_.region));
      OptionalStringField(out, "PrivateIpAddress", instance.private_ip);
      OptionalStringField(out, "PublicIpAddress", instance.public_ip);
      out.Key("State")
          .BeginObject()
          .IntField("Code", InstanceStateCode(instance.state))
          .StringField("Name", ToString(instance.state))
          .EndObject();
      OptionalStringField(out, "SubnetId", instance.subnet_id);
      OptionalStringField(out, "VpcId", instance.vpc_id);

      out.Key("NetworkInterfaces").BeginArray();
      for (const auto& [eni_id, eni] : state_.network_interfaces) {
        if (!eni.attachment.has_value() || eni.attachment->instance_id != instance.instance_id) {
          continue;
        }
        out.BeginObject();
        if (eni.association.has_value()) {
          out.Key("Association")
              .BeginObject()
              .StringField("IpOwnerId", "amazon")
              .StringField("PublicIp", eni.association->public_ip)
              .EndObject();
        }
        out.Key("Attachment")
            .BeginObject()
            .StringField("AttachmentId", eni.attachment->attachment_id)
            .IntField("DeviceIndex", 0)
            .StringField("Status", eni.attachment->status)
            .EndObject()
            .StringField("Description", eni.description)
            .StringField("NetworkInterfaceId", eni_id)
            .StringField("OwnerId", options_.account_id)
            .StringField("PrivateIpAddress", eni.private_ip)
            .StringField("Status", eni.status)
            .StringField("SubnetId", eni.subnet_id)
            .StringField("VpcId", eni.vpc_id)
            .StringField("InterfaceType", eni.interface_type)
            .EndObject();
      }
      out.EndArray();

      out.Key("SecurityGroups").BeginArray();
      for (const auto& group_id : instance.security_group_ids) {
        out.BeginObject();
        const auto group = state_.security_groups.find(group_id);
        if (group != state_.security_groups.end()) {
          out.StringField("GroupName", group->second.group_name);
        }
        out.StringField("GroupId", group_id).EndObject();
      }
      out.EndArray();
      WriteTags(out, instance.tags);
      out.EndObject();
    }
    out.EndArray()
        .StringField("OwnerId", options_.account_id)
        .StringField("ReservationId", members.front()->reservation_id)
        .EndObject();
  }
  out.EndArray().EndObject();
  document = out.str() + "\n";
  return true;
}

bool SimCloudClient::DescribeSubnetsDocument(const DescribeQuery& query, std::string& document,
                                             CloudError& error) {
  document.clear();
  std::vector<Subnet> subnets;
  if (!DescribeSubnets(query, subnets, error)) {
    return false;
  }

  JsonWriter out;
  out.BeginObject().Key("Subnets").BeginArray();
  for (const auto& subnet : subnets) {
    const auto in_use = std::count_if(
        state_.network_interfaces.begin(), state_.network_interfaces.end(),
        [&](const auto& entry) { return entry.second.subnet_id == subnet.subnet_id; });
    out.BeginObject()
        .StringField("AvailabilityZone", subnet.availability_zone)
        .IntField("AvailableIpAddressCount",
                  AvailableIpAddressCount(subnet.cidr_block, static_cast<std::int64_t>(in_use)))
        .StringField("CidrBlock", subnet.cidr_block)
        .BoolField("DefaultForAz", false)
        .BoolField("MapPublicIpOnLaunch", subnet.map_public_ip_on_launch)
        .StringField("State", subnet.state)
        .StringField("SubnetId", subnet.subnet_id)
        .StringField("VpcId", subnet.vpc_id)
        .StringField("OwnerId", options_.account_id)
        .BoolField("AssignIpv6AddressOnCreation", false)
        .Key("Ipv6CidrBlockAssociationSet")
        .BeginArray()
        .EndArray();
    WriteTags(out, subnet.tags);
    out.StringField("SubnetArn", "arn:aws:ec2:" + options_.region + ":" + options_.account_id +
                                     ":subnet/" + subnet.subnet_id)
        .EndObject();
  }
  out.EndArray().EndObject();
  document = out.str() + "\n";
  return true;
}

bool SimCloudClient::DescribeRouteTablesDocument(const DescribeQuery& query,
                                                 std::string& document, CloudError& error) {
  document.clear();
  std::vector<RouteTable> tables;
  if (!DescribeRouteTables(query, tables, error)) {
    return false;
  }

  JsonWriter out;
  out.BeginObject().Key("RouteTables").BeginArray();
  for (const auto& table : tables) {
    out.BeginObject().Key("Associations").BeginArray();
    for (const auto& association : table.associations) {
      out.BeginObject()
          .BoolField("Main", association.main)
          .StringField("RouteTableAssociationId", association.association_id)
          .StringField("RouteTableId", association.route_table_id);
      OptionalStringField(out, "SubnetId", association.subnet_id);
      out.Key("AssociationState").BeginObject().StringField("State", "associated").EndObject();
      out.EndObject();
    }
    out.EndArray().Key("PropagatingVgws").BeginArray().EndArray();

    out.StringField("RouteTableId", table.route_table_id).Key("Routes").BeginArray();
    for (const auto& route : table.routes) {
      out.BeginObject().StringField("DestinationCidrBlock", route.destination_cidr_block);
      OptionalStringField(out, "GatewayId", route.gateway_id);
      OptionalStringField(out, "NatGatewayId", route.nat_gateway_id);
      OptionalStringField(out, "Origin", route.origin);
      OptionalStringField(out, "State", route.state);
      out.EndObject();
    }
    out.EndArray();

    WriteTags(out, table.tags);
    out.StringField("VpcId", table.vpc_id).StringField("OwnerId", options_.account_id).EndObject();
  }
  out.EndArray().EndObject();
  document = out.str() + "\n";
  return true;
}

} // namespace netstack::cloud::sim
