#include "cloud/aws/ec2_cloud_client.hpp"

#include "cloud/aws/ec2_response_documents.hpp"

#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/Array.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/ec2/EC2Client.h>
#include <aws/ec2/model/AllocateAddressRequest.h>
#include <aws/ec2/model/AssociateRouteTableRequest.h>
#include <aws/ec2/model/AttachInternetGatewayRequest.h>
#include <aws/ec2/model/AuthorizeSecurityGroupIngressRequest.h>
#include <aws/ec2/model/CreateInternetGatewayRequest.h>
#include <aws/ec2/model/CreateNatGatewayRequest.h>
#include <aws/ec2/model/CreateRouteRequest.h>
#include <aws/ec2/model/CreateRouteTableRequest.h>
#include <aws/ec2/model/CreateSecurityGroupRequest.h>
#include <aws/ec2/model/CreateSubnetRequest.h>
#include <aws/ec2/model/CreateTagsRequest.h>
#include <aws/ec2/model/CreateVpcRequest.h>
#include <aws/ec2/model/DeleteInternetGatewayRequest.h>
#include <aws/ec2/model/DeleteNatGatewayRequest.h>
#include <aws/ec2/model/DeleteNetworkInterfaceRequest.h>
#include <aws/ec2/model/DeleteRouteRequest.h>
#include <aws/ec2/model/DeleteRouteTableRequest.h>
#include <aws/ec2/model/DeleteSecurityGroupRequest.h>
#include <aws/ec2/model/DeleteSubnetRequest.h>
#include <aws/ec2/model/DeleteVpcRequest.h>
#include <aws/ec2/model/DescribeInstancesRequest.h>
#include <aws/ec2/model/DescribeInternetGatewaysRequest.h>
#include <aws/ec2/model/DescribeNatGatewaysRequest.h>
#include <aws/ec2/model/DescribeNetworkInterfacesRequest.h>
#include <aws/ec2/model/DescribeRouteTablesRequest.h>
#include <aws/ec2/model/DescribeSecurityGroupsRequest.h>
#include <aws/ec2/model/DescribeSubnetsRequest.h>
#include <aws/ec2/model/DescribeVpcsRequest.h>
#include <aws/ec2/model/DetachInternetGatewayRequest.h>
#include <aws/ec2/model/DetachNetworkInterfaceRequest.h>
#include <aws/ec2/model/DisassociateAddressRequest.h>
#include <aws/ec2/model/DisassociateRouteTableRequest.h>
#include <aws/ec2/model/Filter.h>
#include <aws/ec2/model/ModifySubnetAttributeRequest.h>
#include <aws/ec2/model/ReleaseAddressRequest.h>
#include <aws/ec2/model/RevokeSecurityGroupIngressRequest.h>
#include <aws/ec2/model/RunInstancesRequest.h>
#include <aws/ec2/model/TerminateInstancesRequest.h>
#include <aws/sts/STSClient.h>
#include <aws/sts/model/GetCallerIdentityRequest.h>

#include <utility>

namespace netstack::cloud::aws {

namespace {

namespace Model = Aws::EC2::Model;

Aws::String ToAws(const std::string& value) {
  return Aws::String(value.c_str(), value.size());
}

std::string FromAws(const Aws::String& value) {
  return std::string(value.c_str(), value.size());
}

Aws::Vector<Aws::String> ToAwsList(const std::vector<std::string>& values) {
  Aws::Vector<Aws::String> converted;
  converted.reserve(values.size());
  for (const auto& value : values) {
    converted.push_back(ToAws(value));
  }
  return converted;
}

// Copies the SDK error into CloudError. The SDK's exception name is the
// provider error code (`InvalidVpcID.NotFound`, `DependencyViolation`, ...).
template <typename Outcome>
bool CheckOutcome(const Outcome& outcome, CloudError& error) {
  if (outcome.IsSuccess()) {
    error.Clear();
    return true;
  }
  const auto& sdk_error = outcome.GetError();
  error.code = FromAws(sdk_error.GetExceptionName());
  error.message = FromAws(sdk_error.GetMessage());
  if (error.code.empty()) {
    // Transport-level failures carry no service code.
    error.code = sdk_error.ShouldRetry() ? "ServiceUnavailable" : "UnknownError";
  }
  return false;
}

// Calls `call` until the result carries no NextToken, feeding every page to
// `consume`.
template <typename Request, typename CallFn, typename ConsumeFn>
bool Paginate(Request request, CallFn call, ConsumeFn consume, CloudError& error) {
  while (true) {
    const auto outcome = call(request);
    if (!CheckOutcome(outcome, error)) {
      return false;
    }
    const auto& result = outcome.GetResult();
    consume(result);
    if (result.GetNextToken().empty()) {
      return true;
    }
    request.SetNextToken(result.GetNextToken());
  }
}

Model::Filter MakeFilter(const char* name, const std::string& value) {
  Model::Filter filter;
  filter.SetName(name);
  filter.AddValues(ToAws(value));
  return filter;
}

// Translates the portable query into EC2 filters. `vpc_filter_name` differs
// per resource kind (`vpc-id` vs `attachment.vpc-id`).
Aws::Vector<Model::Filter> BuildFilters(const DescribeQuery& query,
                                        const char* vpc_filter_name = "vpc-id") {
  Aws::Vector<Model::Filter> filters;
  if (query.vpc_id.has_value()) {
    filters.push_back(MakeFilter(vpc_filter_name, *query.vpc_id));
  }
  if (query.subnet_id.has_value()) {
    filters.push_back(MakeFilter("subnet-id", *query.subnet_id));
  }
  if (query.name_tag.has_value()) {
    filters.push_back(MakeFilter("tag:Name", *query.name_tag));
  }
  return filters;
}

TagList FromAwsTags(const Aws::Vector<Model::Tag>& tags) {
  TagList converted;
  converted.reserve(tags.size());
  for (const auto& tag : tags) {
    converted.push_back({.key = FromAws(tag.GetKey()), .value = FromAws(tag.GetValue())});
  }
  return converted;
}

Aws::Vector<Model::Tag> ToAwsTags(const TagList& tags) {
  Aws::Vector<Model::Tag> converted;
  converted.reserve(tags.size());
  for (const auto& tag : tags) {
    converted.push_back(Model::Tag().WithKey(ToAws(tag.key)).WithValue(ToAws(tag.value)));
  }
  return converted;
}

Model::IpPermission ToAwsPermission(const IpPermission& permission) {
  Model::IpPermission converted;
  converted.SetIpProtocol(ToAws(permission.ip_protocol));
  converted.SetFromPort(permission.from_port);
  converted.SetToPort(permission.to_port);
  for (const auto& cidr : permission.cidr_ranges) {
    converted.AddIpRanges(Model::IpRange().WithCidrIp(ToAws(cidr)));
  }
  for (const auto& group_id : permission.source_group_ids) {
    converted.AddUserIdGroupPairs(Model::UserIdGroupPair().WithGroupId(ToAws(group_id)));
  }
  return converted;
}

IpPermission FromAwsPermission(const Model::IpPermission& permission) {
  IpPermission converted;
  converted.ip_protocol = FromAws(permission.GetIpProtocol());
  converted.from_port = permission.GetFromPort();
  converted.to_port = permission.GetToPort();
  for (const auto& range : permission.GetIpRanges()) {
    converted.cidr_ranges.push_back(FromAws(range.GetCidrIp()));
  }
  for (const auto& pair : permission.GetUserIdGroupPairs()) {
    converted.source_group_ids.push_back(FromAws(pair.GetGroupId()));
  }
  return converted;
}

Vpc FromAwsVpc(const Model::Vpc& vpc) {
  Vpc converted;
  converted.vpc_id = FromAws(vpc.GetVpcId());
  converted.cidr_block = FromAws(vpc.GetCidrBlock());
  converted.state = FromAws(Model::VpcStateMapper::GetNameForVpcState(vpc.GetState()));
  converted.is_default = vpc.GetIsDefault();
  converted.tags = FromAwsTags(vpc.GetTags());
  return converted;
}

Subnet FromAwsSubnet(const Model::Subnet& subnet) {
  Subnet converted;
  converted.subnet_id = FromAws(subnet.GetSubnetId());
  converted.vpc_id = FromAws(subnet.GetVpcId());
  converted.cidr_block = FromAws(subnet.GetCidrBlock());
  converted.availability_zone = FromAws(subnet.GetAvailabilityZone());
  converted.state = FromAws(Model::SubnetStateMapper::GetNameForSubnetState(subnet.GetState()));
  converted.map_public_ip_on_launch = subnet.GetMapPublicIpOnLaunch();
  converted.tags = FromAwsTags(subnet.GetTags());
  return converted;
}

InternetGateway FromAwsInternetGateway(const Model::InternetGateway& gateway) {
  InternetGateway converted;
  converted.internet_gateway_id = FromAws(gateway.GetInternetGatewayId());
  for (const auto& attachment : gateway.GetAttachments()) {
    converted.attachments.push_back(
        {.vpc_id = FromAws(attachment.GetVpcId()),
         .state = FromAws(
             Model::AttachmentStatusMapper::GetNameForAttachmentStatus(attachment.GetState()))});
  }
  converted.tags = FromAwsTags(gateway.GetTags());
  return converted;
}

NatGateway FromAwsNatGateway(const Model::NatGateway& gateway) {
  NatGateway converted;
  converted.nat_gateway_id = FromAws(gateway.GetNatGatewayId());
  converted.vpc_id = FromAws(gateway.GetVpcId());
  converted.subnet_id = FromAws(gateway.GetSubnetId());
  const std::string state =
      FromAws(Model::NatGatewayStateMapper::GetNameForNatGatewayState(gateway.GetState()));
  if (!ParseNatGatewayState(state, converted.state)) {
    converted.state = NatGatewayState::kPending;
  }
  for (const auto& address : gateway.GetNatGatewayAddresses()) {
    converted.addresses.push_back({.allocation_id = FromAws(address.GetAllocationId()),
                                   .network_interface_id = FromAws(address.GetNetworkInterfaceId()),
                                   .public_ip = FromAws(address.GetPublicIp()),
                                   .private_ip = FromAws(address.GetPrivateIp())});
  }
  converted.tags = FromAwsTags(gateway.GetTags());
  return converted;
}

RouteTable FromAwsRouteTable(const Model::RouteTable& table) {
  RouteTable converted;
  converted.route_table_id = FromAws(table.GetRouteTableId());
  converted.vpc_id = FromAws(table.GetVpcId());
  for (const auto& association : table.GetAssociations()) {
    converted.associations.push_back(
        {.association_id = FromAws(association.GetRouteTableAssociationId()),
         .route_table_id = FromAws(association.GetRouteTableId()),
         .subnet_id = FromAws(association.GetSubnetId()),
         .main = association.GetMain()});
  }
  for (const auto& route : table.GetRoutes()) {
    converted.routes.push_back(
        {.destination_cidr_block = FromAws(route.GetDestinationCidrBlock()),
         .gateway_id = FromAws(route.GetGatewayId()),
         .nat_gateway_id = FromAws(route.GetNatGatewayId()),
         .state = FromAws(Model::RouteStateMapper::GetNameForRouteState(route.GetState())),
         .origin = FromAws(Model::RouteOriginMapper::GetNameForRouteOrigin(route.GetOrigin()))});
  }
  converted.tags = FromAwsTags(table.GetTags());
  return converted;
}

SecurityGroup FromAwsSecurityGroup(const Model::SecurityGroup& group) {
  SecurityGroup converted;
  converted.group_id = FromAws(group.GetGroupId());
  converted.group_name = FromAws(group.GetGroupName());
  converted.description = FromAws(group.GetDescription());
  converted.vpc_id = FromAws(group.GetVpcId());
  for (const auto& permission : group.GetIpPermissions()) {
    converted.ingress.push_back(FromAwsPermission(permission));
  }
  converted.tags = FromAwsTags(group.GetTags());
  return converted;
}

Instance FromAwsInstance(const Model::Instance& instance, const Aws::String& reservation_id) {
  Instance converted;
  converted.instance_id = FromAws(instance.GetInstanceId());
  converted.reservation_id = FromAws(reservation_id);
  if (instance.LaunchTimeHasBeenSet()) {
    converted.launch_time =
        FromAws(instance.GetLaunchTime().ToGmtString(Aws::Utils::DateFormat::ISO_8601));
  }
  converted.image_id = FromAws(instance.GetImageId());
  converted.instance_type =
      FromAws(Model::InstanceTypeMapper::GetNameForInstanceType(instance.GetInstanceType()));
  converted.key_name = FromAws(instance.GetKeyName());
  converted.vpc_id = FromAws(instance.GetVpcId());
  converted.subnet_id = FromAws(instance.GetSubnetId());
  converted.private_ip = FromAws(instance.GetPrivateIpAddress());
  converted.public_ip = FromAws(instance.GetPublicIpAddress());
  for (const auto& group : instance.GetSecurityGroups()) {
    converted.security_group_ids.push_back(FromAws(group.GetGroupId()));
  }
  const std::string state = FromAws(
      Model::InstanceStateNameMapper::GetNameForInstanceStateName(instance.GetState().GetName()));
  if (!ParseInstanceState(state, converted.state)) {
    converted.state = InstanceState::kPending;
  }
  converted.tags = FromAwsTags(instance.GetTags());
  return converted;
}

NetworkInterface FromAwsNetworkInterface(const Model::NetworkInterface& eni) {
  NetworkInterface converted;
  converted.network_interface_id = FromAws(eni.GetNetworkInterfaceId());
  converted.vpc_id = FromAws(eni.GetVpcId());
  converted.subnet_id = FromAws(eni.GetSubnetId());
  converted.interface_type = FromAws(
      Model::NetworkInterfaceTypeMapper::GetNameForNetworkInterfaceType(eni.GetInterfaceType()));
  converted.status = FromAws(
      Model::NetworkInterfaceStatusMapper::GetNameForNetworkInterfaceStatus(eni.GetStatus()));
  converted.private_ip = FromAws(eni.GetPrivateIpAddress());
  converted.description = FromAws(eni.GetDescription());
  if (eni.AttachmentHasBeenSet() && !eni.GetAttachment().GetAttachmentId().empty()) {
    const auto& attachment = eni.GetAttachment();
    converted.attachment = NetworkInterfaceAttachment{
        .attachment_id = FromAws(attachment.GetAttachmentId()),
        .instance_id = FromAws(attachment.GetInstanceId()),
        .status = FromAws(
            Model::AttachmentStatusMapper::GetNameForAttachmentStatus(attachment.GetStatus()))};
  }
  if (eni.AssociationHasBeenSet() && !eni.GetAssociation().GetPublicIp().empty()) {
    const auto& association = eni.GetAssociation();
    converted.association = NetworkInterfaceAssociation{
        .public_ip = FromAws(association.GetPublicIp()),
        .association_id = FromAws(association.GetAssociationId()),
        .allocation_id = FromAws(association.GetAllocationId())};
  }
  return converted;
}

Aws::String EncodeUserData(const std::string& user_data) {
  const Aws::Utils::ByteBuffer buffer(reinterpret_cast<const unsigned char*>(user_data.data()),
                                      user_data.size());
  return Aws::Utils::HashingUtils::Base64Encode(buffer);
}

} // namespace

Ec2CloudClient::~Ec2CloudClient() {
  // Clients must be destroyed while the SDK is still initialized.
  sts_.reset();
  ec2_.reset();
  sdk_context_.Release();
}

std::unique_ptr<Ec2CloudClient> Ec2CloudClient::Create(const std::string& region,
                                                       std::string& error) {
  error.clear();
  if (region.empty()) {
    error = "aws backend requires a non-empty region";
    return nullptr;
  }

  std::unique_ptr<Ec2CloudClient> client(new Ec2CloudClient());
  if (!client->sdk_context_.Acquire(error)) {
    return nullptr;
  }

  Aws::Client::ClientConfiguration config;
  config.region = ToAws(region);
  client->ec2_ = std::make_unique<Aws::EC2::EC2Client>(config);
  client->sts_ = std::make_unique<Aws::STS::STSClient>(config);
  return client;
}

bool Ec2CloudClient::GetCallerIdentity(CallerIdentity& identity, CloudError& error) {
  const auto outcome = sts_->GetCallerIdentity(Aws::STS::Model::GetCallerIdentityRequest());
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  identity.account = FromAws(outcome.GetResult().GetAccount());
  identity.arn = FromAws(outcome.GetResult().GetArn());
  identity.user_id = FromAws(outcome.GetResult().GetUserId());
  return true;
}

bool Ec2CloudClient::CreateTags(const std::vector<std::string>& resource_ids, const TagList& tags,
                                CloudError& error) {
  Model::CreateTagsRequest request;
  request.SetResources(ToAwsList(resource_ids));
  request.SetTags(ToAwsTags(tags));
  return CheckOutcome(ec2_->CreateTags(request), error);
}

bool Ec2CloudClient::CreateVpc(const std::string& cidr_block, std::string& vpc_id,
                               CloudError& error) {
  Model::CreateVpcRequest request;
  request.SetCidrBlock(ToAws(cidr_block));
  const auto outcome = ec2_->CreateVpc(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  vpc_id = FromAws(outcome.GetResult().GetVpc().GetVpcId());
  return true;
}

bool Ec2CloudClient::DescribeVpcs(const DescribeQuery& query, std::vector<Vpc>& vpcs,
                                  CloudError& error) {
  vpcs.clear();
  Model::DescribeVpcsRequest request;
  if (!query.ids.empty()) {
    request.SetVpcIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  return Paginate(
      request, [this](const Model::DescribeVpcsRequest& page) { return ec2_->DescribeVpcs(page); },
      [&](const Model::DescribeVpcsResponse& result) {
        for (const auto& vpc : result.GetVpcs()) {
          vpcs.push_back(FromAwsVpc(vpc));
        }
      },
      error);
}

bool Ec2CloudClient::DeleteVpc(const std::string& vpc_id, CloudError& error) {
  Model::DeleteVpcRequest request;
  request.SetVpcId(ToAws(vpc_id));
  return CheckOutcome(ec2_->DeleteVpc(request), error);
}

bool Ec2CloudClient::CreateSubnet(const std::string& vpc_id, const std::string& cidr_block,
                                  const std::string& availability_zone, std::string& subnet_id,
                                  CloudError& error) {
  Model::CreateSubnetRequest request;
  request.SetVpcId(ToAws(vpc_id));
  request.SetCidrBlock(ToAws(cidr_block));
  request.SetAvailabilityZone(ToAws(availability_zone));
  const auto outcome = ec2_->CreateSubnet(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  subnet_id = FromAws(outcome.GetResult().GetSubnet().GetSubnetId());
  return true;
}

bool Ec2CloudClient::SetSubnetMapPublicIpOnLaunch(const std::string& subnet_id, bool enabled,
                                                  CloudError& error) {
  Model::ModifySubnetAttributeRequest request;
  request.SetSubnetId(ToAws(subnet_id));
  request.SetMapPublicIpOnLaunch(Model::AttributeBooleanValue().WithValue(enabled));
  return CheckOutcome(ec2_->ModifySubnetAttribute(request), error);
}

bool Ec2CloudClient::DescribeSubnets(const DescribeQuery& query, std::vector<Subnet>& subnets,
                                     CloudError& error) {
  subnets.clear();
  Model::DescribeSubnetsRequest request;
  if (!query.ids.empty()) {
    request.SetSubnetIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  return Paginate(
      request,
      [this](const Model::DescribeSubnetsRequest& page) { return ec2_->DescribeSubnets(page); },
      [&](const Model::DescribeSubnetsResponse& result) {
        for (const auto& subnet : result.GetSubnets()) {
          subnets.push_back(FromAwsSubnet(subnet));
        }
      },
      error);
}

bool Ec2CloudClient::DeleteSubnet(const std::string& subnet_id, CloudError& error) {
  Model::DeleteSubnetRequest request;
  request.SetSubnetId(ToAws(subnet_id));
  return CheckOutcome(ec2_->DeleteSubnet(request), error);
}

bool Ec2CloudClient::CreateInternetGateway(std::string& internet_gateway_id, CloudError& error) {
  const auto outcome = ec2_->CreateInternetGateway(Model::CreateInternetGatewayRequest());
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  internet_gateway_id = FromAws(outcome.GetResult().GetInternetGateway().GetInternetGatewayId());
  return true;
}

bool Ec2CloudClient::AttachInternetGateway(const std::string& internet_gateway_id,
                                           const std::string& vpc_id, CloudError& error) {
  Model::AttachInternetGatewayRequest request;
  request.SetInternetGatewayId(ToAws(internet_gateway_id));
  request.SetVpcId(ToAws(vpc_id));
  return CheckOutcome(ec2_->AttachInternetGateway(request), error);
}

bool Ec2CloudClient::DetachInternetGateway(const std::string& internet_gateway_id,
                                           const std::string& vpc_id, CloudError& error) {
  Model::DetachInternetGatewayRequest request;
  request.SetInternetGatewayId(ToAws(internet_gateway_id));
  request.SetVpcId(ToAws(vpc_id));
  return CheckOutcome(ec2_->DetachInternetGateway(request), error);
}

bool Ec2CloudClient::DescribeInternetGateways(const DescribeQuery& query,
                                              std::vector<InternetGateway>& gateways,
                                              CloudError& error) {
  gateways.clear();
  Model::DescribeInternetGatewaysRequest request;
  if (!query.ids.empty()) {
    request.SetInternetGatewayIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query, "attachment.vpc-id"));
  return Paginate(
      request,
      [this](const Model::DescribeInternetGatewaysRequest& page) {
        return ec2_->DescribeInternetGateways(page);
      },
      [&](const Model::DescribeInternetGatewaysResponse& result) {
        for (const auto& gateway : result.GetInternetGateways()) {
          gateways.push_back(FromAwsInternetGateway(gateway));
        }
      },
      error);
}

bool Ec2CloudClient::DeleteInternetGateway(const std::string& internet_gateway_id,
                                           CloudError& error) {
  Model::DeleteInternetGatewayRequest request;
  request.SetInternetGatewayId(ToAws(internet_gateway_id));
  return CheckOutcome(ec2_->DeleteInternetGateway(request), error);
}

bool Ec2CloudClient::AllocateAddress(Address& address, CloudError& error) {
  Model::AllocateAddressRequest request;
  request.SetDomain(Model::DomainType::vpc);
  const auto outcome = ec2_->AllocateAddress(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  address = Address{};
  address.allocation_id = FromAws(outcome.GetResult().GetAllocationId());
  address.public_ip = FromAws(outcome.GetResult().GetPublicIp());
  return true;
}

bool Ec2CloudClient::DisassociateAddress(const std::string& association_id, CloudError& error) {
  Model::DisassociateAddressRequest request;
  request.SetAssociationId(ToAws(association_id));
  return CheckOutcome(ec2_->DisassociateAddress(request), error);
}

bool Ec2CloudClient::ReleaseAddress(const std::string& allocation_id, CloudError& error) {
  Model::ReleaseAddressRequest request;
  request.SetAllocationId(ToAws(allocation_id));
  return CheckOutcome(ec2_->ReleaseAddress(request), error);
}

bool Ec2CloudClient::CreateNatGateway(const std::string& subnet_id,
                                      const std::string& allocation_id,
                                      std::string& nat_gateway_id, CloudError& error) {
  Model::CreateNatGatewayRequest request;
  request.SetSubnetId(ToAws(subnet_id));
  request.SetAllocationId(ToAws(allocation_id));
  const auto outcome = ec2_->CreateNatGateway(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  nat_gateway_id = FromAws(outcome.GetResult().GetNatGateway().GetNatGatewayId());
  return true;
}

bool Ec2CloudClient::DescribeNatGateways(const DescribeQuery& query,
                                         std::vector<NatGateway>& gateways, CloudError& error) {
  gateways.clear();
  Model::DescribeNatGatewaysRequest request;
  if (!query.ids.empty()) {
    request.SetNatGatewayIds(ToAwsList(query.ids));
  }
  // This API names its filter list `Filter` rather than `Filters`.
  request.SetFilter(BuildFilters(query));
  return Paginate(
      request,
      [this](const Model::DescribeNatGatewaysRequest& page) {
        return ec2_->DescribeNatGateways(page);
      },
      [&](const Model::DescribeNatGatewaysResponse& result) {
        for (const auto& gateway : result.GetNatGateways()) {
          gateways.push_back(FromAwsNatGateway(gateway));
        }
      },
      error);
}

bool Ec2CloudClient::DeleteNatGateway(const std::string& nat_gateway_id, CloudError& error) {
  Model::DeleteNatGatewayRequest request;
  request.SetNatGatewayId(ToAws(nat_gateway_id));
  return CheckOutcome(ec2_->DeleteNatGateway(request), error);
}

bool Ec2CloudClient::CreateRouteTable(const std::string& vpc_id, std::string& route_table_id,
                                      CloudError& error) {
  Model::CreateRouteTableRequest request;
  request.SetVpcId(ToAws(vpc_id));
  const auto outcome = ec2_->CreateRouteTable(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  route_table_id = FromAws(outcome.GetResult().GetRouteTable().GetRouteTableId());
  return true;
}

bool Ec2CloudClient::DescribeRouteTables(const DescribeQuery& query,
                                         std::vector<RouteTable>& tables, CloudError& error) {
  tables.clear();
  Model::DescribeRouteTablesRequest request;
  if (!query.ids.empty()) {
    request.SetRouteTableIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  return Paginate(
      request,
      [this](const Model::DescribeRouteTablesRequest& page) {
        return ec2_->DescribeRouteTables(page);
      },
      [&](const Model::DescribeRouteTablesResponse& result) {
        for (const auto& table : result.GetRouteTables()) {
          tables.push_back(FromAwsRouteTable(table));
        }
      },
      error);
}

bool Ec2CloudClient::AssociateRouteTable(const std::string& route_table_id,
                                         const std::string& subnet_id,
                                         std::string& association_id, CloudError& error) {
  Model::AssociateRouteTableRequest request;
  request.SetRouteTableId(ToAws(route_table_id));
  request.SetSubnetId(ToAws(subnet_id));
  const auto outcome = ec2_->AssociateRouteTable(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  association_id = FromAws(outcome.GetResult().GetAssociationId());
  return true;
}

bool Ec2CloudClient::DisassociateRouteTable(const std::string& association_id,
                                            CloudError& error) {
  Model::DisassociateRouteTableRequest request;
  request.SetAssociationId(ToAws(association_id));
  return CheckOutcome(ec2_->DisassociateRouteTable(request), error);
}

bool Ec2CloudClient::CreateRoute(const RouteSpec& route, CloudError& error) {
  Model::CreateRouteRequest request;
  request.SetRouteTableId(ToAws(route.route_table_id));
  request.SetDestinationCidrBlock(ToAws(route.destination_cidr_block));
  if (!route.gateway_id.empty()) {
    request.SetGatewayId(ToAws(route.gateway_id));
  }
  if (!route.nat_gateway_id.empty()) {
    request.SetNatGatewayId(ToAws(route.nat_gateway_id));
  }
  return CheckOutcome(ec2_->CreateRoute(request), error);
}

bool Ec2CloudClient::DeleteRoute(const std::string& route_table_id,
                                 const std::string& destination_cidr_block, CloudError& error) {
  Model::DeleteRouteRequest request;
  request.SetRouteTableId(ToAws(route_table_id));
  request.SetDestinationCidrBlock(ToAws(destination_cidr_block));
  return CheckOutcome(ec2_->DeleteRoute(request), error);
}

bool Ec2CloudClient::DeleteRouteTable(const std::string& route_table_id, CloudError& error) {
  Model::DeleteRouteTableRequest request;
  request.SetRouteTableId(ToAws(route_table_id));
  return CheckOutcome(ec2_->DeleteRouteTable(request), error);
}

bool Ec2CloudClient::CreateSecurityGroup(const std::string& group_name,
                                         const std::string& description,
                                         const std::string& vpc_id, std::string& group_id,
                                         CloudError& error) {
  Model::CreateSecurityGroupRequest request;
  request.SetGroupName(ToAws(group_name));
  request.SetDescription(ToAws(description));
  request.SetVpcId(ToAws(vpc_id));
  const auto outcome = ec2_->CreateSecurityGroup(request);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  group_id = FromAws(outcome.GetResult().GetGroupId());
  return true;
}

bool Ec2CloudClient::AuthorizeSecurityGroupIngress(const std::string& group_id,
                                                   const IpPermission& permission,
                                                   CloudError& error) {
  Model::AuthorizeSecurityGroupIngressRequest request;
  request.SetGroupId(ToAws(group_id));
  request.AddIpPermissions(ToAwsPermission(permission));
  return CheckOutcome(ec2_->AuthorizeSecurityGroupIngress(request), error);
}

bool Ec2CloudClient::RevokeSecurityGroupIngress(const std::string& group_id,
                                                const IpPermission& permission,
                                                CloudError& error) {
  Model::RevokeSecurityGroupIngressRequest request;
  request.SetGroupId(ToAws(group_id));
  request.AddIpPermissions(ToAwsPermission(permission));
  return CheckOutcome(ec2_->RevokeSecurityGroupIngress(request), error);
}

bool Ec2CloudClient::DescribeSecurityGroups(const DescribeQuery& query,
                                            std::vector<SecurityGroup>& groups,
                                            CloudError& error) {
  groups.clear();
  Model::DescribeSecurityGroupsRequest request;
  if (!query.ids.empty()) {
    request.SetGroupIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  return Paginate(
      request,
      [this](const Model::DescribeSecurityGroupsRequest& page) {
        return ec2_->DescribeSecurityGroups(page);
      },
      [&](const Model::DescribeSecurityGroupsResponse& result) {
        for (const auto& group : result.GetSecurityGroups()) {
          groups.push_back(FromAwsSecurityGroup(group));
        }
      },
      error);
}

bool Ec2CloudClient::DeleteSecurityGroup(const std::string& group_id, CloudError& error) {
  Model::DeleteSecurityGroupRequest request;
  request.SetGroupId(ToAws(group_id));
  return CheckOutcome(ec2_->DeleteSecurityGroup(request), error);
}

bool Ec2CloudClient::RunInstance(const RunInstanceRequest& request, Instance& instance,
                                 CloudError& error) {
  Model::RunInstancesRequest run;
  run.SetImageId(ToAws(request.image_id));
  run.SetInstanceType(
      Model::InstanceTypeMapper::GetInstanceTypeForName(ToAws(request.instance_type)));
  run.SetKeyName(ToAws(request.key_name));
  run.SetMinCount(1);
  run.SetMaxCount(1);
  run.SetSubnetId(ToAws(request.subnet_id));
  run.SetSecurityGroupIds(ToAwsList(request.security_group_ids));
  if (!request.user_data.empty()) {
    run.SetUserData(EncodeUserData(request.user_data));
  }
  if (!request.tags.empty()) {
    run.AddTagSpecifications(Model::TagSpecification()
                                 .WithResourceType(Model::ResourceType::instance)
                                 .WithTags(ToAwsTags(request.tags)));
  }

  const auto outcome = ec2_->RunInstances(run);
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  const auto& launched = outcome.GetResult().GetInstances();
  if (launched.empty()) {
    error.code = "UnknownError";
    error.message = "RunInstances succeeded but returned no instance";
    return false;
  }
  instance = FromAwsInstance(launched.front(), outcome.GetResult().GetReservationId());
  return true;
}

bool Ec2CloudClient::DescribeInstances(const DescribeQuery& query,
                                       std::vector<Instance>& instances, CloudError& error) {
  instances.clear();
  Model::DescribeInstancesRequest request;
  if (!query.ids.empty()) {
    request.SetInstanceIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  return Paginate(
      request,
      [this](const Model::DescribeInstancesRequest& page) {
        return ec2_->DescribeInstances(page);
      },
      [&](const Model::DescribeInstancesResponse& result) {
        for (const auto& reservation : result.GetReservations()) {
          for (const auto& instance : reservation.GetInstances()) {
            instances.push_back(FromAwsInstance(instance, reservation.GetReservationId()));
          }
        }
      },
      error);
}

bool Ec2CloudClient::TerminateInstances(const std::vector<std::string>& instance_ids,
                                        CloudError& error) {
  Model::TerminateInstancesRequest request;
  request.SetInstanceIds(ToAwsList(instance_ids));
  return CheckOutcome(ec2_->TerminateInstances(request), error);
}

bool Ec2CloudClient::DescribeNetworkInterfaces(const DescribeQuery& query,
                                               std::vector<NetworkInterface>& interfaces,
                                               CloudError& error) {
  interfaces.clear();
  Model::DescribeNetworkInterfacesRequest request;
  if (!query.ids.empty()) {
    request.SetNetworkInterfaceIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  return Paginate(
      request,
      [this](const Model::DescribeNetworkInterfacesRequest& page) {
        return ec2_->DescribeNetworkInterfaces(page);
      },
      [&](const Model::DescribeNetworkInterfacesResponse& result) {
        for (const auto& eni : result.GetNetworkInterfaces()) {
          interfaces.push_back(FromAwsNetworkInterface(eni));
        }
      },
      error);
}

bool Ec2CloudClient::DetachNetworkInterface(const std::string& attachment_id, bool force,
                                            CloudError& error) {
  Model::DetachNetworkInterfaceRequest request;
  request.SetAttachmentId(ToAws(attachment_id));
  request.SetForce(force);
  return CheckOutcome(ec2_->DetachNetworkInterface(request), error);
}

bool Ec2CloudClient::DeleteNetworkInterface(const std::string& network_interface_id,
                                            CloudError& error) {
  Model::DeleteNetworkInterfaceRequest request;
  request.SetNetworkInterfaceId(ToAws(network_interface_id));
  return CheckOutcome(ec2_->DeleteNetworkInterface(request), error);
}

bool Ec2CloudClient::GetCallerIdentityDocument(std::string& document, CloudError& error) {
  document.clear();
  const auto outcome = sts_->GetCallerIdentity(Aws::STS::Model::GetCallerIdentityRequest());
  if (!CheckOutcome(outcome, error)) {
    return false;
  }
  document = RenderCallerIdentity(outcome.GetResult());
  return true;
}

bool Ec2CloudClient::DescribeInstancesDocument(const DescribeQuery& query, std::string& document,
                                               CloudError& error) {
  document.clear();
  Model::DescribeInstancesRequest request;
  if (!query.ids.empty()) {
    request.SetInstanceIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  Aws::Vector<Model::Reservation> reservations;
  const bool ok = Paginate(
      request,
      [this](const Model::DescribeInstancesRequest& page) {
        return ec2_->DescribeInstances(page);
      },
      [&](const Model::DescribeInstancesResponse& result) {
        reservations.insert(reservations.end(), result.GetReservations().begin(),
                            result.GetReservations().end());
      },
      error);
  if (!ok) {
    return false;
  }
  document = RenderReservations(reservations);
  return true;
}

bool Ec2CloudClient::DescribeSubnetsDocument(const DescribeQuery& query, std::string& document,
                                             CloudError& error) {
  document.clear();
  Model::DescribeSubnetsRequest request;
  if (!query.ids.empty()) {
    request.SetSubnetIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  Aws::Vector<Model::Subnet> subnets;
  const bool ok = Paginate(
      request,
      [this](const Model::DescribeSubnetsRequest& page) { return ec2_->DescribeSubnets(page); },
      [&](const Model::DescribeSubnetsResponse& result) {
        subnets.insert(subnets.end(), result.GetSubnets().begin(), result.GetSubnets().end());
      },
      error);
  if (!ok) {
    return false;
  }
  document = RenderSubnets(subnets);
  return true;
}

bool Ec2CloudClient::DescribeRouteTablesDocument(const DescribeQuery& query,
                                                 std::string& document, CloudError& error) {
  document.clear();
  Model::DescribeRouteTablesRequest request;
  if (!query.ids.empty()) {
    request.SetRouteTableIds(ToAwsList(query.ids));
  }
  request.SetFilters(BuildFilters(query));
  Aws::Vector<Model::RouteTable> tables;
  const bool ok = Paginate(
      request,
      [this](const Model::DescribeRouteTablesRequest& page) {
        return ec2_->DescribeRouteTables(page);
      },
      [&](const Model::DescribeRouteTablesResponse& result) {
        tables.insert(tables.end(), result.GetRouteTables().begin(),
                      result.GetRouteTables().end());
      },
      error);
  if (!ok) {
    return false;
  }
  document = RenderRouteTables(tables);
  return true;
}

} // namespace netstack::cloud::aws
