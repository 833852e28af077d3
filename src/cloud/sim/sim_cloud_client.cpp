#include "cloud/sim/sim_cloud_client.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <utility>

namespace netstack::cloud::sim {

namespace {

constexpr std::string_view kDefaultRouteLocal = "local";

bool Fail(CloudError& error, std::string code, std::string message) {
  error.code = std::move(code);
  error.message = std::move(message);
  return false;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

// Provider error code used when an ID of this shape is unknown.
std::string NotFoundCodeFor(std::string_view resource_id) {
  if (StartsWith(resource_id, "vpc-")) {
    return "InvalidVpcID.NotFound";
  }
  if (StartsWith(resource_id, "subnet-")) {
    return "InvalidSubnetID.NotFound";
  }
  if (StartsWith(resource_id, "rtbassoc-")) {
    return "InvalidAssociationID.NotFound";
  }
  if (StartsWith(resource_id, "rtb-")) {
    return "InvalidRouteTableID.NotFound";
  }
  if (StartsWith(resource_id, "igw-")) {
    return "InvalidInternetGatewayID.NotFound";
  }
  if (StartsWith(resource_id, "sg-")) {
    return "InvalidGroup.NotFound";
  }
  if (StartsWith(resource_id, "nat-")) {
    return "InvalidNatGatewayID.NotFound";
  }
  if (StartsWith(resource_id, "eipalloc-")) {
    return "InvalidAllocationID.NotFound";
  }
  if (StartsWith(resource_id, "eipassoc-")) {
    return "InvalidAssociationID.NotFound";
  }
  if (StartsWith(resource_id, "eni-attach-")) {
    return "InvalidAttachmentID.NotFound";
  }
  if (StartsWith(resource_id, "eni-")) {
    return "InvalidNetworkInterfaceID.NotFound";
  }
  if (StartsWith(resource_id, "i-")) {
    return "InvalidInstanceID.NotFound";
  }
  return "InvalidID";
}

bool FailNotFound(CloudError& error, const std::string& resource_id) {
  return Fail(error, NotFoundCodeFor(resource_id),
              "The ID '" + resource_id + "' does not exist");
}

bool IdSelected(const DescribeQuery& query, const std::string& id) {
  return query.ids.empty() ||
         std::find(query.ids.begin(), query.ids.end(), id) != query.ids.end();
}

bool NameSelected(const DescribeQuery& query, const TagList& tags) {
  if (!query.name_tag.has_value()) {
    return true;
  }
  const auto name = FindNameTag(tags);
  return name.has_value() && *name == *query.name_tag;
}

bool VpcSelected(const DescribeQuery& query, const std::string& vpc_id) {
  return !query.vpc_id.has_value() || *query.vpc_id == vpc_id;
}

bool SubnetSelected(const DescribeQuery& query, const std::string& subnet_id) {
  return !query.subnet_id.has_value() || *query.subnet_id == subnet_id;
}

template <typename Map>
bool CheckExplicitIds(const Map& resources, const DescribeQuery& query, CloudError& error) {
  for (const auto& id : query.ids) {
    if (resources.find(id) == resources.end()) {
      return FailNotFound(error, id);
    }
  }
  return true;
}

bool SamePermission(const IpPermission& lhs, const IpPermission& rhs) {
  return lhs.ip_protocol == rhs.ip_protocol && lhs.from_port == rhs.from_port &&
         lhs.to_port == rhs.to_port && lhs.cidr_ranges == rhs.cidr_ranges &&
         lhs.source_group_ids == rhs.source_group_ids;
}

void UpsertTag(TagList& tags, const Tag& tag) {
  for (auto& existing : tags) {
    if (existing.key == tag.key) {
      existing.value = tag.value;
      return;
    }
  }
  tags.push_back(tag);
}

} // namespace

SimCloudClient::SimCloudClient(SimOptions options) : options_(std::move(options)) {}

void SimCloudClient::InjectFault(SimFault fault) {
  faults_.push_back(std::move(fault));
}

void SimCloudClient::ReplaceState(SimCloudState state) {
  state_ = std::move(state);
}

std::size_t SimCloudClient::CallCount(std::string_view operation) const {
  return static_cast<std::size_t>(
      std::count_if(journal_.begin(), journal_.end(), [&](const std::string& entry) {
        return entry == operation ||
               (StartsWith(entry, operation) && entry.size() > operation.size() &&
                entry[operation.size()] == ' ');
      }));
}

std::string SimCloudClient::NextId(std::string_view kind_prefix) {
  std::ostringstream out;
  out << kind_prefix << '-' << std::hex << std::setw(17) << std::setfill('0') << state_.next_id++;
  return out.str();
}

std::string SimCloudClient::NextPublicIp() {
  const std::uint64_t n = state_.next_id++;
  return "198.51." + std::to_string((n / 250U) % 250U) + "." + std::to_string(n % 250U + 1U);
}

std::string SimCloudClient::NextPrivateIp(const std::string& subnet_id) {
  const std::uint64_t n = state_.next_id++;
  std::string base = "10.0.0.";
  const auto it = state_.subnets.find(subnet_id);
  if (it != state_.subnets.end()) {
    const std::string& cidr = it->second.cidr_block;
    const std::size_t last_dot = cidr.rfind('.');
    if (last_dot != std::string::npos) {
      base = cidr.substr(0, last_dot + 1U);
    }
  }
  // .0-.3 and .255 are reserved by the provider in every subnet.
  return base + std::to_string(n % 250U + 4U);
}

void SimCloudClient::Record(std::string_view operation, std::string_view resource_id) {
  std::string entry(operation);
  if (!resource_id.empty()) {
    entry += ' ';
    entry += resource_id;
  }
  journal_.push_back(std::move(entry));
}

bool SimCloudClient::CheckFault(std::string_view operation, std::string_view resource_id,
                                CloudError& error) {
  for (auto& fault : faults_) {
    if (fault.remaining == 0U || fault.operation != operation) {
      continue;
    }
    if (!fault.resource_id.empty() && fault.resource_id != resource_id) {
      continue;
    }
    --fault.remaining;
    return Fail(error, fault.code, fault.message);
  }
  return true;
}

void SimCloudClient::StartTagLag(const std::string& resource_id) {
  if (options_.tag_visibility_lag > 0U) {
    state_.tag_lag[resource_id] = options_.tag_visibility_lag;
  }
}

bool SimCloudClient::ResourceExists(const std::string& id) const {
  return state_.vpcs.count(id) != 0U || state_.subnets.count(id) != 0U ||
         state_.internet_gateways.count(id) != 0U || state_.addresses.count(id) != 0U ||
         state_.nat_gateways.count(id) != 0U || state_.route_tables.count(id) != 0U ||
         state_.security_groups.count(id) != 0U || state_.instances.count(id) != 0U ||
         state_.network_interfaces.count(id) != 0U;
}

bool SimCloudClient::GetCallerIdentity(CallerIdentity& identity, CloudError& error) {
  Record("GetCallerIdentity", "");
  if (!CheckFault("GetCallerIdentity", "", error)) {
    return false;
  }
  identity.account = options_.account_id;
  identity.user_id = options_.caller_user_id;
  identity.arn = "arn:aws:iam::" + options_.account_id + ":user/netstack-sim";
  return true;
}

bool SimCloudClient::CreateTags(const std::vector<std::string>& resource_ids,
                                const TagList& tags, CloudError& error) {
  for (const auto& id : resource_ids) {
    Record("CreateTags", id);
    if (!CheckFault("CreateTags", id, error)) {
      return false;
    }
    const auto lag = state_.tag_lag.find(id);
    if (lag != state_.tag_lag.end()) {
      if (--lag->second == 0U) {
        state_.tag_lag.erase(lag);
      }
      return FailNotFound(error, id);
    }
    if (!ResourceExists(id)) {
      return FailNotFound(error, id);
    }
  }

  const auto apply = [&](auto& resources, const std::string& id) {
    const auto it = resources.find(id);
    if (it == resources.end()) {
      return false;
    }
    for (const auto& tag : tags) {
      UpsertTag(it->second.tags, tag);
    }
    return true;
  };

  for (const auto& id : resource_ids) {
    // Addresses and interfaces accept tags on the provider but the model does
    // not carry them.
    (void)(apply(state_.vpcs, id) || apply(state_.subnets, id) ||
           apply(state_.internet_gateways, id) || apply(state_.nat_gateways, id) ||
           apply(state_.route_tables, id) || apply(state_.security_groups, id) ||
           apply(state_.instances, id));
  }
  return true;
}

bool SimCloudClient::CreateVpc(const std::string& cidr_block, std::string& vpc_id,
                               CloudError& error) {
  Record("CreateVpc", cidr_block);
  if (!CheckFault("CreateVpc", "", error)) {
    return false;
  }
  if (cidr_block.empty() || cidr_block.find('/') == std::string::npos) {
    return Fail(error, "InvalidParameterValue", "Value (" + cidr_block +
                                                    ") for parameter cidrBlock is invalid");
  }

  Vpc vpc;
  vpc.vpc_id = NextId("vpc");
  vpc.cidr_block = cidr_block;
  vpc.state = "available";
  vpc_id = vpc.vpc_id;

  // Implicit children: main route table with the local route, and the
  // default security group.
  RouteTable main_table;
  main_table.route_table_id = NextId("rtb");
  main_table.vpc_id = vpc_id;
  main_table.associations.push_back({.association_id = NextId("rtbassoc"),
                                     .route_table_id = main_table.route_table_id,
                                     .subnet_id = "",
                                     .main = true});
  main_table.routes.push_back({.destination_cidr_block = cidr_block,
                               .gateway_id = std::string(kDefaultRouteLocal),
                               .nat_gateway_id = "",
                               .state = "active",
                               .origin = "CreateRouteTable"});
  state_.route_tables.emplace(main_table.route_table_id, std::move(main_table));

  SecurityGroup default_group;
  default_group.group_id = NextId("sg");
  default_group.group_name = std::string(kDefaultSecurityGroupName);
  default_group.description = "default VPC security group";
  default_group.vpc_id = vpc_id;
  default_group.ingress.push_back({.ip_protocol = "-1",
                                   .from_port = 0,
                                   .to_port = 0,
                                   .cidr_ranges = {},
                                   .source_group_ids = {default_group.group_id}});
  state_.security_groups.emplace(default_group.group_id, std::move(default_group));

  state_.vpcs.emplace(vpc_id, std::move(vpc));
  StartTagLag(vpc_id);
  return true;
}

bool SimCloudClient::DescribeVpcs(const DescribeQuery& query, std::vector<Vpc>& vpcs,
                                  CloudError& error) {
  Record("DescribeVpcs", query.name_tag.value_or(""));
  vpcs.clear();
  if (!CheckFault("DescribeVpcs", "", error) || !CheckExplicitIds(state_.vpcs, query, error)) {
    return false;
  }
  for (const auto& [id, vpc] : state_.vpcs) {
    if (IdSelected(query, id) && VpcSelected(query, id) && NameSelected(query, vpc.tags)) {
      vpcs.push_back(vpc);
    }
  }
  return true;
}

bool SimCloudClient::DeleteVpc(const std::string& vpc_id, CloudError& error) {
  Record("DeleteVpc", vpc_id);
  if (!CheckFault("DeleteVpc", vpc_id, error)) {
    return false;
  }
  if (state_.vpcs.count(vpc_id) == 0U) {
    return FailNotFound(error, vpc_id);
  }

  const std::string dependency_message =
      "The vpc '" + vpc_id + "' has dependencies and cannot be deleted.";
  for (const auto& [id, subnet] : state_.subnets) {
    if (subnet.vpc_id == vpc_id) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }
  for (const auto& [id, gateway] : state_.internet_gateways) {
    for (const auto& attachment : gateway.attachments) {
      if (attachment.vpc_id == vpc_id) {
        return Fail(error, "DependencyViolation", dependency_message);
      }
    }
  }
  for (const auto& [id, table] : state_.route_tables) {
    if (table.vpc_id == vpc_id && !table.IsMain()) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }
  for (const auto& [id, group] : state_.security_groups) {
    if (group.vpc_id == vpc_id && group.group_name != kDefaultSecurityGroupName) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }

  // The implicit children go with the network.
  for (auto it = state_.route_tables.begin(); it != state_.route_tables.end();) {
    it = it->second.vpc_id == vpc_id ? state_.route_tables.erase(it) : std::next(it);
  }
  for (auto it = state_.security_groups.begin(); it != state_.security_groups.end();) {
    it = it->second.vpc_id == vpc_id ? state_.security_groups.erase(it) : std::next(it);
  }
  state_.vpcs.erase(vpc_id);
  return true;
}

bool SimCloudClient::CreateSubnet(const std::string& vpc_id, const std::string& cidr_block,
                                  const std::string& availability_zone, std::string& subnet_id,
                                  CloudError& error) {
  Record("CreateSubnet", vpc_id);
  if (!CheckFault("CreateSubnet", vpc_id, error)) {
    return false;
  }
  if (state_.vpcs.count(vpc_id) == 0U) {
    return FailNotFound(error, vpc_id);
  }
  if (!StartsWith(availability_zone, options_.region)) {
    return Fail(error, "InvalidParameterValue",
                "Value (" + availability_zone + ") for parameter availabilityZone is invalid. "
                "Subnets can currently only be created in region " + options_.region);
  }
  for (const auto& [id, subnet] : state_.subnets) {
    if (subnet.vpc_id == vpc_id && subnet.cidr_block == cidr_block) {
      return Fail(error, "InvalidSubnet.Conflict",
                  "The CIDR '" + cidr_block + "' conflicts with another subnet");
    }
  }

  Subnet subnet;
  subnet.subnet_id = NextId("subnet");
  subnet.vpc_id = vpc_id;
  subnet.cidr_block = cidr_block;
  subnet.availability_zone = availability_zone;
  subnet.state = "available";
  subnet_id = subnet.subnet_id;
  state_.subnets.emplace(subnet_id, std::move(subnet));
  StartTagLag(subnet_id);
  return true;
}

bool SimCloudClient::SetSubnetMapPublicIpOnLaunch(const std::string& subnet_id, bool enabled,
                                                  CloudError& error) {
  Record("SetSubnetMapPublicIpOnLaunch", subnet_id);
  if (!CheckFault("SetSubnetMapPublicIpOnLaunch", subnet_id, error)) {
    return false;
  }
  const auto it = state_.subnets.find(subnet_id);
  if (it == state_.subnets.end()) {
    return FailNotFound(error, subnet_id);
  }
  it->second.map_public_ip_on_launch = enabled;
  return true;
}

bool SimCloudClient::DescribeSubnets(const DescribeQuery& query, std::vector<Subnet>& subnets,
                                     CloudError& error) {
  Record("DescribeSubnets", query.vpc_id.value_or(""));
  subnets.clear();
  if (!CheckFault("DescribeSubnets", "", error) ||
      !CheckExplicitIds(state_.subnets, query, error)) {
    return false;
  }
  for (const auto& [id, subnet] : state_.subnets) {
    if (IdSelected(query, id) && VpcSelected(query, subnet.vpc_id) &&
        SubnetSelected(query, id) && NameSelected(query, subnet.tags)) {
      subnets.push_back(subnet);
    }
  }
  return true;
}

bool SimCloudClient::DeleteSubnet(const std::string& subnet_id, CloudError& error) {
  Record("DeleteSubnet", subnet_id);
  if (!CheckFault("DeleteSubnet", subnet_id, error)) {
    return false;
  }
  if (state_.subnets.count(subnet_id) == 0U) {
    return FailNotFound(error, subnet_id);
  }
  const std::string dependency_message =
      "The subnet '" + subnet_id + "' has dependencies and cannot be deleted.";
  for (const auto& [id, eni] : state_.network_interfaces) {
    if (eni.subnet_id == subnet_id) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }
  for (const auto& [id, instance] : state_.instances) {
    if (instance.subnet_id == subnet_id && instance.state != InstanceState::kTerminated) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }
  for (const auto& [id, gateway] : state_.nat_gateways) {
    if (gateway.subnet_id == subnet_id && gateway.state != NatGatewayState::kDeleted &&
        gateway.state != NatGatewayState::kFailed) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }

  // Explicit route table associations die with the subnet.
  for (auto& [id, table] : state_.route_tables) {
    auto& associations = table.associations;
    associations.erase(std::remove_if(associations.begin(), associations.end(),
                                      [&](const RouteTableAssociation& association) {
                                        return association.subnet_id == subnet_id;
                                      }),
                       associations.end());
  }
  state_.subnets.erase(subnet_id);
  return true;
}

bool SimCloudClient::CreateInternetGateway(std::string& internet_gateway_id, CloudError& error) {
  Record("CreateInternetGateway", "");
  if (!CheckFault("CreateInternetGateway", "", error)) {
    return false;
  }
  InternetGateway gateway;
  gateway.internet_gateway_id = NextId("igw");
  internet_gateway_id = gateway.internet_gateway_id;
  state_.internet_gateways.emplace(internet_gateway_id, std::move(gateway));
  StartTagLag(internet_gateway_id);
  return true;
}

bool SimCloudClient::AttachInternetGateway(const std::string& internet_gateway_id,
                                           const std::string& vpc_id, CloudError& error) {
  Record("AttachInternetGateway", internet_gateway_id);
  if (!CheckFault("AttachInternetGateway", internet_gateway_id, error)) {
    return false;
  }
  const auto it = state_.internet_gateways.find(internet_gateway_id);
  if (it == state_.internet_gateways.end()) {
    return FailNotFound(error, internet_gateway_id);
  }
  if (state_.vpcs.count(vpc_id) == 0U) {
    return FailNotFound(error, vpc_id);
  }
  if (!it->second.attachments.empty()) {
    return Fail(error, "Resource.AlreadyAssociated",
                "resource " + internet_gateway_id + " is already attached to network " +
                    it->second.attachments.front().vpc_id);
  }
  it->second.attachments.push_back({.vpc_id = vpc_id, .state = "available"});
  return true;
}

bool SimCloudClient::DetachInternetGateway(const std::string& internet_gateway_id,
                                           const std::string& vpc_id, CloudError& error) {
  Record("DetachInternetGateway", internet_gateway_id);
  if (!CheckFault("DetachInternetGateway", internet_gateway_id, error)) {
    return false;
  }
  const auto it = state_.internet_gateways.find(internet_gateway_id);
  if (it == state_.internet_gateways.end()) {
    return FailNotFound(error, internet_gateway_id);
  }
  auto& attachments = it->second.attachments;
  const auto attachment =
      std::find_if(attachments.begin(), attachments.end(),
                   [&](const InternetGatewayAttachment& a) { return a.vpc_id == vpc_id; });
  if (attachment == attachments.end()) {
    return Fail(error, "Gateway.NotAttached",
                "resource " + internet_gateway_id + " is not attached to network " + vpc_id);
  }
  for (const auto& [id, eni] : state_.network_interfaces) {
    if (eni.vpc_id == vpc_id && eni.association.has_value()) {
      return Fail(error, "DependencyViolation",
                  "Network " + vpc_id +
                      " has some mapped public address(es). Please unmap those public "
                      "address(es) before detaching the gateway.");
    }
  }
  attachments.erase(attachment);
  return true;
}

bool SimCloudClient::DescribeInternetGateways(const DescribeQuery& query,
                                              std::vector<InternetGateway>& gateways,
                                              CloudError& error) {
  Record("DescribeInternetGateways", query.vpc_id.value_or(""));
  gateways.clear();
  if (!CheckFault("DescribeInternetGateways", "", error) ||
      !CheckExplicitIds(state_.internet_gateways, query, error)) {
    return false;
  }
  for (const auto& [id, gateway] : state_.internet_gateways) {
    if (!IdSelected(query, id) || !NameSelected(query, gateway.tags)) {
      continue;
    }
    if (query.vpc_id.has_value()) {
      const bool attached = std::any_of(
          gateway.attachments.begin(), gateway.attachments.end(),
          [&](const InternetGatewayAttachment& a) { return a.vpc_id == *query.vpc_id; });
      if (!attached) {
        continue;
      }
    }
    gateways.push_back(gateway);
  }
  return true;
}

bool SimCloudClient::DeleteInternetGateway(const std::string& internet_gateway_id,
                                           CloudError& error) {
  Record("DeleteInternetGateway", internet_gateway_id);
  if (!CheckFault("DeleteInternetGateway", internet_gateway_id, error)) {
    return false;
  }
  const auto it = state_.internet_gateways.find(internet_gateway_id);
  if (it == state_.internet_gateways.end()) {
    return FailNotFound(error, internet_gateway_id);
  }
  if (!it->second.attachments.empty()) {
    return Fail(error, "DependencyViolation",
                "The internetGateway '" + internet_gateway_id +
                    "' has dependencies and cannot be deleted.");
  }
  state_.internet_gateways.erase(it);
  return true;
}

bool SimCloudClient::AllocateAddress(Address& address, CloudError& error) {
  Record("AllocateAddress", "");
  if (!CheckFault("AllocateAddress", "", error)) {
    return false;
  }
  Address allocated;
  allocated.allocation_id = NextId("eipalloc");
  allocated.public_ip = NextPublicIp();
  address = allocated;
  state_.addresses.emplace(allocated.allocation_id, std::move(allocated));
  return true;
}

bool SimCloudClient::DisassociateAddress(const std::string& association_id, CloudError& error) {
  Record("DisassociateAddress", association_id);
  if (!CheckFault("DisassociateAddress", association_id, error)) {
    return false;
  }
  for (auto& [allocation_id, address] : state_.addresses) {
    if (address.association_id != association_id) {
      continue;
    }
    const auto eni = state_.network_interfaces.find(address.network_interface_id);
    if (eni != state_.network_interfaces.end()) {
      if (eni->second.interface_type == "nat_gateway") {
        return Fail(error, "OperationNotPermitted",
                    "The address " + address.public_ip +
                        " is in use by a NAT gateway and cannot be disassociated");
      }
      eni->second.association.reset();
    }
    address.association_id.clear();
    address.network_interface_id.clear();
    return true;
  }
  return FailNotFound(error, association_id);
}

bool SimCloudClient::ReleaseAddress(const std::string& allocation_id, CloudError& error) {
  Record("ReleaseAddress", allocation_id);
  if (!CheckFault("ReleaseAddress", allocation_id, error)) {
    return false;
  }
  const auto it = state_.addresses.find(allocation_id);
  if (it == state_.addresses.end()) {
    return FailNotFound(error, allocation_id);
  }
  if (!it->second.association_id.empty()) {
    return Fail(error, "InvalidIPAddress.InUse",
                "Address " + it->second.public_ip + " is in use.");
  }
  state_.addresses.erase(it);
  return true;
}

bool SimCloudClient::CreateNatGateway(const std::string& subnet_id,
                                      const std::string& allocation_id,
                                      std::string& nat_gateway_id, CloudError& error) {
  Record("CreateNatGateway", subnet_id);
  if (!CheckFault("CreateNatGateway", subnet_id, error)) {
    return false;
  }
  const auto subnet = state_.subnets.find(subnet_id);
  if (subnet == state_.subnets.end()) {
    return FailNotFound(error, subnet_id);
  }
  const auto address = state_.addresses.find(allocation_id);
  if (address == state_.addresses.end()) {
    return FailNotFound(error, allocation_id);
  }
  if (!address->second.association_id.empty()) {
    return Fail(error, "Resource.AlreadyAssociated",
                "Elastic IP address [" + allocation_id + "] is already associated");
  }

  NatGateway gateway;
  gateway.nat_gateway_id = NextId("nat");
  gateway.vpc_id = subnet->second.vpc_id;
  gateway.subnet_id = subnet_id;
  gateway.state = NatGatewayState::kPending;

  NetworkInterface eni;
  eni.network_interface_id = NextId("eni");
  eni.vpc_id = gateway.vpc_id;
  eni.subnet_id = subnet_id;
  eni.interface_type = "nat_gateway";
  eni.status = "in-use";
  eni.private_ip = NextPrivateIp(subnet_id);
  eni.description = "Interface for NAT Gateway " + gateway.nat_gateway_id;
  eni.association = NetworkInterfaceAssociation{.public_ip = address->second.public_ip,
                                                .association_id = NextId("eipassoc"),
                                                .allocation_id = allocation_id};

  address->second.association_id = eni.association->association_id;
  address->second.network_interface_id = eni.network_interface_id;
  gateway.addresses.push_back({.allocation_id = allocation_id,
                               .network_interface_id = eni.network_interface_id,
                               .public_ip = address->second.public_ip,
                               .private_ip = eni.private_ip});

  nat_gateway_id = gateway.nat_gateway_id;
  state_.transition_polls[nat_gateway_id] = options_.nat_pending_polls;
  state_.network_interfaces.emplace(eni.network_interface_id, std::move(eni));
  state_.nat_gateways.emplace(nat_gateway_id, std::move(gateway));
  StartTagLag(nat_gateway_id);
  return true;
}

void SimCloudClient::FinishNatGatewayDeletion(NatGateway& gateway) {
  gateway.state = NatGatewayState::kDeleted;
  for (const auto& nat_address : gateway.addresses) {
    const auto address = state_.addresses.find(nat_address.allocation_id);
    if (address != state_.addresses.end()) {
      address->second.association_id.clear();
      address->second.network_interface_id.clear();
    }
    state_.network_interfaces.erase(nat_address.network_interface_id);
  }
  state_.transition_polls.erase(gateway.nat_gateway_id);
}

void SimCloudClient::AdvanceNatGateway(NatGateway& gateway) {
  if (gateway.state != NatGatewayState::kPending && gateway.state != NatGatewayState::kDeleting) {
    return;
  }
  auto& remaining = state_.transition_polls[gateway.nat_gateway_id];
  if (remaining > 0U) {
    --remaining;
    return;
  }
  if (gateway.state == NatGatewayState::kPending) {
    gateway.state = NatGatewayState::kAvailable;
    state_.transition_polls.erase(gateway.nat_gateway_id);
    return;
  }
  FinishNatGatewayDeletion(gateway);
}

bool SimCloudClient::DescribeNatGateways(const DescribeQuery& query,
                                         std::vector<NatGateway>& gateways, CloudError& error) {
  Record("DescribeNatGateways", query.vpc_id.value_or(""));
  gateways.clear();
  if (!CheckFault("DescribeNatGateways", "", error) ||
      !CheckExplicitIds(state_.nat_gateways, query, error)) {
    return false;
  }
  for (auto& [id, gateway] : state_.nat_gateways) {
    if (IdSelected(query, id) && VpcSelected(query, gateway.vpc_id) &&
        SubnetSelected(query, gateway.subnet_id) && NameSelected(query, gateway.tags)) {
      AdvanceNatGateway(gateway);
      gateways.push_back(gateway);
    }
  }
  return true;
}

bool SimCloudClient::DeleteNatGateway(const std::string& nat_gateway_id, CloudError& error) {
  Record("DeleteNatGateway", nat_gateway_id);
  if (!CheckFault("DeleteNatGateway", nat_gateway_id, error)) {
    return false;
  }
  const auto it = state_.nat_gateways.find(nat_gateway_id);
  if (it == state_.nat_gateways.end() || it->second.state == NatGatewayState::kDeleted) {
    return Fail(error, "NatGatewayNotFound",
                "The Nat Gateway " + nat_gateway_id + " was not found");
  }
  if (it->second.state == NatGatewayState::kDeleting) {
    return true;
  }
  it->second.state = NatGatewayState::kDeleting;
  state_.transition_polls[nat_gateway_id] = options_.nat_deleting_polls;
  return true;
}

bool SimCloudClient::CreateRouteTable(const std::string& vpc_id, std::string& route_table_id,
                                      CloudError& error) {
  Record("CreateRouteTable", vpc_id);
  if (!CheckFault("CreateRouteTable", vpc_id, error)) {
    return false;
  }
  const auto vpc = state_.vpcs.find(vpc_id);
  if (vpc == state_.vpcs.end()) {
    return FailNotFound(error, vpc_id);
  }
  RouteTable table;
  table.route_table_id = NextId("rtb");
  table.vpc_id = vpc_id;
  table.routes.push_back({.destination_cidr_block = vpc->second.cidr_block,
                          .gateway_id = std::string(kDefaultRouteLocal),
                          .nat_gateway_id = "",
                          .state = "active",
                          .origin = "CreateRouteTable"});
  route_table_id = table.route_table_id;
  state_.route_tables.emplace(route_table_id, std::move(table));
  StartTagLag(route_table_id);
  return true;
}

bool SimCloudClient::DescribeRouteTables(const DescribeQuery& query,
                                         std::vector<RouteTable>& tables, CloudError& error) {
  Record("DescribeRouteTables", query.vpc_id.value_or(""));
  tables.clear();
  if (!CheckFault("DescribeRouteTables", "", error) ||
      !CheckExplicitIds(state_.route_tables, query, error)) {
    return false;
  }
  for (const auto& [id, table] : state_.route_tables) {
    if (IdSelected(query, id) && VpcSelected(query, table.vpc_id) &&
        NameSelected(query, table.tags)) {
      tables.push_back(table);
    }
  }
  return true;
}

bool SimCloudClient::AssociateRouteTable(const std::string& route_table_id,
                                         const std::string& subnet_id,
                                         std::string& association_id, CloudError& error) {
  Record("AssociateRouteTable", route_table_id);
  if (!CheckFault("AssociateRouteTable", route_table_id, error)) {
    return false;
  }
  const auto table = state_.route_tables.find(route_table_id);
  if (table == state_.route_tables.end()) {
    return FailNotFound(error, route_table_id);
  }
  const auto subnet = state_.subnets.find(subnet_id);
  if (subnet == state_.subnets.end()) {
    return FailNotFound(error, subnet_id);
  }
  if (subnet->second.vpc_id != table->second.vpc_id) {
    return Fail(error, "InvalidParameterValue",
                "route table " + route_table_id + " and subnet " + subnet_id +
                    " belong to different networks");
  }
  for (const auto& [id, other] : state_.route_tables) {
    for (const auto& association : other.associations) {
      if (association.subnet_id == subnet_id) {
        return Fail(error, "Resource.AlreadyAssociated",
                    "the specified association for route table " + id +
                        " conflicts with an existing association");
      }
    }
  }
  association_id = NextId("rtbassoc");
  table->second.associations.push_back({.association_id = association_id,
                                        .route_table_id = route_table_id,
                                        .subnet_id = subnet_id,
                                        .main = false});
  return true;
}

bool SimCloudClient::DisassociateRouteTable(const std::string& association_id,
                                            CloudError& error) {
  Record("DisassociateRouteTable", association_id);
  if (!CheckFault("DisassociateRouteTable", association_id, error)) {
    return false;
  }
  for (auto& [id, table] : state_.route_tables) {
    auto& associations = table.associations;
    const auto it = std::find_if(
        associations.begin(), associations.end(),
        [&](const RouteTableAssociation& a) { return a.association_id == association_id; });
    if (it == associations.end()) {
      continue;
    }
    if (it->main) {
      return Fail(error, "InvalidParameterValue",
                  "cannot disassociate the main route table association " + association_id);
    }
    associations.erase(it);
    return true;
  }
  return FailNotFound(error, association_id);
}

bool SimCloudClient::CreateRoute(const RouteSpec& route, CloudError& error) {
  Record("CreateRoute", route.route_table_id);
  if (!CheckFault("CreateRoute", route.route_table_id, error)) {
    return false;
  }
  const auto table = state_.route_tables.find(route.route_table_id);
  if (table == state_.route_tables.end()) {
    return FailNotFound(error, route.route_table_id);
  }
  if (route.gateway_id.empty() == route.nat_gateway_id.empty()) {
    return Fail(error, "InvalidParameterCombination",
                "exactly one route target (gateway or NAT gateway) must be given");
  }

  if (!route.gateway_id.empty()) {
    const auto gateway = state_.internet_gateways.find(route.gateway_id);
    if (gateway == state_.internet_gateways.end()) {
      return Fail(error, "InvalidGatewayID.NotFound",
                  "The gateway ID '" + route.gateway_id + "' does not exist");
    }
    const bool attached = std::any_of(
        gateway->second.attachments.begin(), gateway->second.attachments.end(),
        [&](const InternetGatewayAttachment& a) { return a.vpc_id == table->second.vpc_id; });
    if (!attached) {
      return Fail(error, "InvalidParameterValue",
                  "route table " + route.route_table_id + " and network gateway " +
                      route.gateway_id + " belong to different networks");
    }
  } else {
    const auto gateway = state_.nat_gateways.find(route.nat_gateway_id);
    if (gateway == state_.nat_gateways.end()) {
      return FailNotFound(error, route.nat_gateway_id);
    }
    if (gateway->second.state != NatGatewayState::kAvailable) {
      return Fail(error, "IncorrectState",
                  "NAT gateway " + route.nat_gateway_id + " is " +
                      ToString(gateway->second.state));
    }
  }

  for (const auto& existing : table->second.routes) {
    if (existing.destination_cidr_block == route.destination_cidr_block) {
      return Fail(error, "RouteAlreadyExists",
                  "The route identified by " + route.destination_cidr_block +
                      " already exists.");
    }
  }
  table->second.routes.push_back({.destination_cidr_block = route.destination_cidr_block,
                                  .gateway_id = route.gateway_id,
                                  .nat_gateway_id = route.nat_gateway_id,
                                  .state = "active",
                                  .origin = "CreateRoute"});
  return true;
}

bool SimCloudClient::DeleteRoute(const std::string& route_table_id,
                                 const std::string& destination_cidr_block, CloudError& error) {
  Record("DeleteRoute", route_table_id);
  if (!CheckFault("DeleteRoute", route_table_id, error)) {
    return false;
  }
  const auto table = state_.route_tables.find(route_table_id);
  if (table == state_.route_tables.end()) {
    return FailNotFound(error, route_table_id);
  }
  auto& routes = table->second.routes;
  const auto it = std::find_if(routes.begin(), routes.end(), [&](const Route& route) {
    return route.destination_cidr_block == destination_cidr_block;
  });
  if (it == routes.end()) {
    return Fail(error, "InvalidRoute.NotFound",
                "no route with destination-cidr-block " + destination_cidr_block +
                    " in route table " + route_table_id);
  }
  if (it->gateway_id == kDefaultRouteLocal) {
    return Fail(error, "InvalidParameterValue", "cannot remove local route");
  }
  routes.erase(it);
  return true;
}

bool SimCloudClient::DeleteRouteTable(const std::string& route_table_id, CloudError& error) {
  Record("DeleteRouteTable", route_table_id);
  if (!CheckFault("DeleteRouteTable", route_table_id, error)) {
    return false;
  }
  const auto table = state_.route_tables.find(route_table_id);
  if (table == state_.route_tables.end()) {
    return FailNotFound(error, route_table_id);
  }
  if (!table->second.associations.empty()) {
    return Fail(error, "DependencyViolation",
                "The routeTable '" + route_table_id +
                    "' has dependencies and cannot be deleted.");
  }
  state_.route_tables.erase(table);
  return true;
}

bool SimCloudClient::CreateSecurityGroup(const std::string& group_name,
                                         const std::string& description,
                                         const std::string& vpc_id, std::string& group_id,
                                         CloudError& error) {
  Record("CreateSecurityGroup", group_name);
  if (!CheckFault("CreateSecurityGroup", vpc_id, error)) {
    return false;
  }
  if (state_.vpcs.count(vpc_id) == 0U) {
    return FailNotFound(error, vpc_id);
  }
  if (group_name == kDefaultSecurityGroupName) {
    return Fail(error, "InvalidGroup.Reserved", "The security group 'default' is reserved");
  }
  for (const auto& [id, group] : state_.security_groups) {
    if (group.vpc_id == vpc_id && group.group_name == group_name) {
      return Fail(error, "InvalidGroup.Duplicate",
                  "The security group '" + group_name + "' already exists for VPC '" + vpc_id +
                      "'");
    }
  }
  SecurityGroup group;
  group.group_id = NextId("sg");
  group.group_name = group_name;
  group.description = description;
  group.vpc_id = vpc_id;
  group_id = group.group_id;
  state_.security_groups.emplace(group_id, std::move(group));
  StartTagLag(group_id);
  return true;
}

bool SimCloudClient::AuthorizeSecurityGroupIngress(const std::string& group_id,
                                                   const IpPermission& permission,
                                                   CloudError& error) {
  Record("AuthorizeSecurityGroupIngress", group_id);
  if (!CheckFault("AuthorizeSecurityGroupIngress", group_id, error)) {
    return false;
  }
  const auto group = state_.security_groups.find(group_id);
  if (group == state_.security_groups.end()) {
    return FailNotFound(error, group_id);
  }
  for (const auto& source : permission.source_group_ids) {
    if (state_.security_groups.count(source) == 0U) {
      return FailNotFound(error, source);
    }
  }
  for (const auto& existing : group->second.ingress) {
    if (SamePermission(existing, permission)) {
      return Fail(error, "InvalidPermission.Duplicate",
                  "the specified rule already exists in " + group_id);
    }
  }
  group->second.ingress.push_back(permission);
  return true;
}

bool SimCloudClient::RevokeSecurityGroupIngress(const std::string& group_id,
                                                const IpPermission& permission,
                                                CloudError& error) {
  Record("RevokeSecurityGroupIngress", group_id);
  if (!CheckFault("RevokeSecurityGroupIngress", group_id, error)) {
    return false;
  }
  const auto group = state_.security_groups.find(group_id);
  if (group == state_.security_groups.end()) {
    return FailNotFound(error, group_id);
  }
  auto& ingress = group->second.ingress;
  const auto it = std::find_if(ingress.begin(), ingress.end(), [&](const IpPermission& rule) {
    return SamePermission(rule, permission);
  });
  if (it == ingress.end()) {
    return Fail(error, "InvalidPermission.NotFound",
                "the specified rule does not exist in " + group_id);
  }
  ingress.erase(it);
  return true;
}

bool SimCloudClient::DescribeSecurityGroups(const DescribeQuery& query,
                                            std::vector<SecurityGroup>& groups,
                                            CloudError& error) {
  Record("DescribeSecurityGroups", query.vpc_id.value_or(""));
  groups.clear();
  if (!CheckFault("DescribeSecurityGroups", "", error) ||
      !CheckExplicitIds(state_.security_groups, query, error)) {
    return false;
  }
  for (const auto& [id, group] : state_.security_groups) {
    if (IdSelected(query, id) && VpcSelected(query, group.vpc_id) &&
        NameSelected(query, group.tags)) {
      groups.push_back(group);
    }
  }
  return true;
}

bool SimCloudClient::DeleteSecurityGroup(const std::string& group_id, CloudError& error) {
  Record("DeleteSecurityGroup", group_id);
  if (!CheckFault("DeleteSecurityGroup", group_id, error)) {
    return false;
  }
  const auto group = state_.security_groups.find(group_id);
  if (group == state_.security_groups.end()) {
    return FailNotFound(error, group_id);
  }
  if (group->second.group_name == kDefaultSecurityGroupName) {
    return Fail(error, "CannotDelete", "the default security group cannot be deleted");
  }
  const std::string dependency_message = "resource " + group_id + " has a dependent object";
  for (const auto& [id, other] : state_.security_groups) {
    if (id == group_id) {
      continue;
    }
    for (const auto& rule : other.ingress) {
      if (std::find(rule.source_group_ids.begin(), rule.source_group_ids.end(), group_id) !=
          rule.source_group_ids.end()) {
        return Fail(error, "DependencyViolation", dependency_message);
      }
    }
  }
  for (const auto& [id, instance] : state_.instances) {
    if (instance.state == InstanceState::kTerminated) {
      continue;
    }
    if (std::find(instance.security_group_ids.begin(), instance.security_group_ids.end(),
                  group_id) != instance.security_group_ids.end()) {
      return Fail(error, "DependencyViolation", dependency_message);
    }
  }
  state_.security_groups.erase(group);
  return true;
}

bool SimCloudClient::RunInstance(const RunInstanceRequest& request, Instance& instance,
                                 CloudError& error) {
  Record("RunInstance", request.subnet_id);
  if (!CheckFault("RunInstance", request.subnet_id, error)) {
    return false;
  }
  if (request.key_name.empty()) {
    return Fail(error, "InvalidKeyPair.NotFound", "The key pair '' does not exist");
  }
  if (!StartsWith(request.image_id, "ami-")) {
    return Fail(error, "InvalidAMIID.Malformed",
                "Invalid id: \"" + request.image_id + "\" (expecting \"ami-...\")");
  }
  const auto subnet = state_.subnets.find(request.subnet_id);
  if (subnet == state_.subnets.end()) {
    return FailNotFound(error, request.subnet_id);
  }
  for (const auto& group_id : request.security_group_ids) {
    const auto group = state_.security_groups.find(group_id);
    if (group == state_.security_groups.end()) {
      return FailNotFound(error, group_id);
    }
    if (group->second.vpc_id != subnet->second.vpc_id) {
      return Fail(error, "InvalidParameter",
                  "Security group " + group_id + " and subnet " + request.subnet_id +
                      " belong to different networks.");
    }
  }

  Instance launched;
  launched.instance_id = NextId("i");
  // One instance per launch call, so every launch opens its own reservation.
  launched.reservation_id = NextId("r");
  launched.launch_time = core::FormatUtcTimestamp(std::chrono::system_clock::now());
  launched.image_id = request.image_id;
  launched.instance_type = request.instance_type;
  launched.key_name = request.key_name;
  launched.vpc_id = subnet->second.vpc_id;
  launched.subnet_id = request.subnet_id;
  launched.security_group_ids = request.security_group_ids;
  launched.private_ip = NextPrivateIp(request.subnet_id);
  launched.state = InstanceState::kPending;
  launched.tags = request.tags;

  NetworkInterface eni;
  eni.network_interface_id = NextId("eni");
  eni.vpc_id = launched.vpc_id;
  eni.subnet_id = launched.subnet_id;
  eni.interface_type = "interface";
  eni.status = "in-use";
  eni.private_ip = launched.private_ip;
  eni.description = "Primary network interface";
  eni.attachment = NetworkInterfaceAttachment{
      .attachment_id = NextId("eni-attach"),
      .instance_id = launched.instance_id,
      .status = "attached"};
  if (subnet->second.map_public_ip_on_launch) {
    launched.public_ip = NextPublicIp();
    // Auto-assigned addresses carry no allocation or association ID.
    eni.association = NetworkInterfaceAssociation{
        .public_ip = launched.public_ip, .association_id = "", .allocation_id = ""};
  }

  state_.transition_polls[launched.instance_id] = options_.instance_pending_polls;
  state_.network_interfaces.emplace(eni.network_interface_id, std::move(eni));
  instance = launched;
  state_.instances.emplace(launched.instance_id, std::move(launched));
  return true;
}

void SimCloudClient::FinishInstanceTermination(Instance& instance) {
  instance.state = InstanceState::kTerminated;
  instance.public_ip.clear();
  for (auto it = state_.network_interfaces.begin(); it != state_.network_interfaces.end();) {
    const auto& attachment = it->second.attachment;
    const bool owned = attachment.has_value() && attachment->instance_id == instance.instance_id;
    it = owned ? state_.network_interfaces.erase(it) : std::next(it);
  }
  state_.transition_polls.erase(instance.instance_id);
}

void SimCloudClient::AdvanceInstance(Instance& instance) {
  if (instance.state != InstanceState::kPending &&
      instance.state != InstanceState::kShuttingDown) {
    return;
  }
  auto& remaining = state_.transition_polls[instance.instance_id];
  if (remaining > 0U) {
    --remaining;
    return;
  }
  if (instance.state == InstanceState::kPending) {
    instance.state = InstanceState::kRunning;
    state_.transition_polls.erase(instance.instance_id);
    return;
  }
  FinishInstanceTermination(instance);
}

bool SimCloudClient::DescribeInstances(const DescribeQuery& query,
                                       std::vector<Instance>& instances, CloudError& error) {
  Record("DescribeInstances", query.vpc_id.value_or(""));
  instances.clear();
  if (!CheckFault("DescribeInstances", "", error) ||
      !CheckExplicitIds(state_.instances, query, error)) {
    return false;
  }
  for (auto& [id, instance] : state_.instances) {
    if (IdSelected(query, id) && VpcSelected(query, instance.vpc_id) &&
        SubnetSelected(query, instance.subnet_id) && NameSelected(query, instance.tags)) {
      AdvanceInstance(instance);
      instances.push_back(instance);
    }
  }
  return true;
}

bool SimCloudClient::TerminateInstances(const std::vector<std::string>& instance_ids,
                                        CloudError& error) {
  for (const auto& id : instance_ids) {
    Record("TerminateInstances", id);
    if (!CheckFault("TerminateInstances", id, error)) {
      return false;
    }
    if (state_.instances.count(id) == 0U) {
      return FailNotFound(error, id);
    }
  }
  for (const auto& id : instance_ids) {
    Instance& instance = state_.instances.at(id);
    if (instance.state == InstanceState::kTerminated ||
        instance.state == InstanceState::kShuttingDown) {
      continue;
    }
    instance.state = InstanceState::kShuttingDown;
    state_.transition_polls[id] = options_.instance_shutdown_polls;
  }
  return true;
}

bool SimCloudClient::DescribeNetworkInterfaces(const DescribeQuery& query,
                                               std::vector<NetworkInterface>& interfaces,
                                               CloudError& error) {
  Record("DescribeNetworkInterfaces",
         query.subnet_id.has_value() ? *query.subnet_id : query.vpc_id.value_or(""));
  interfaces.clear();
  if (!CheckFault("DescribeNetworkInterfaces", "", error) ||
      !CheckExplicitIds(state_.network_interfaces, query, error)) {
    return false;
  }
  for (const auto& [id, eni] : state_.network_interfaces) {
    if (IdSelected(query, id) && VpcSelected(query, eni.vpc_id) &&
        SubnetSelected(query, eni.subnet_id)) {
      interfaces.push_back(eni);
    }
  }
  return true;
}

bool SimCloudClient::DetachNetworkInterface(const std::string& attachment_id, bool force,
                                            CloudError& error) {
  Record("DetachNetworkInterface", attachment_id);
  if (!CheckFault("DetachNetworkInterface", attachment_id, error)) {
    return false;
  }
  for (auto& [id, eni] : state_.network_interfaces) {
    if (!eni.attachment.has_value() || eni.attachment->attachment_id != attachment_id) {
      continue;
    }
    const auto owner = state_.instances.find(eni.attachment->instance_id);
    const bool owner_live =
        owner != state_.instances.end() && owner->second.state != InstanceState::kTerminated;
    if (owner_live && !force) {
      return Fail(error, "OperationNotPermitted",
                  "The network interface at device index 0 cannot be detached.");
    }
    eni.attachment.reset();
    eni.status = "available";
    return true;
  }
  return FailNotFound(error, attachment_id);
}

bool SimCloudClient::DeleteNetworkInterface(const std::string& network_interface_id,
                                            CloudError& error) {
  Record("DeleteNetworkInterface", network_interface_id);
  if (!CheckFault("DeleteNetworkInterface", network_interface_id, error)) {
    return false;
  }
  const auto it = state_.network_interfaces.find(network_interface_id);
  if (it == state_.network_interfaces.end()) {
    return FailNotFound(error, network_interface_id);
  }
  if (it->second.interface_type == "nat_gateway") {
    return Fail(error, "OperationNotPermitted",
                "You do not have permission to access the specified resource.");
  }
  if (it->second.attachment.has_value()) {
    return Fail(error, "InvalidNetworkInterface.InUse",
                "Interface: [" + network_interface_id + "] in use.");
  }
  if (it->second.association.has_value() && !it->second.association->association_id.empty()) {
    const auto address = state_.addresses.find(it->second.association->allocation_id);
    if (address != state_.addresses.end()) {
      address->second.association_id.clear();
      address->second.network_interface_id.clear();
    }
  }
  state_.network_interfaces.erase(it);
  return true;
}

} // namespace netstack::cloud::sim
