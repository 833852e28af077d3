#include "cloud/aws/ec2_response_documents.hpp"

#include "core/json_utils.hpp"

#include <aws/core/utils/DateTime.h>
#include <aws/ec2/model/GroupIdentifier.h>
#include <aws/ec2/model/Instance.h>
#include <aws/ec2/model/InstanceBlockDeviceMapping.h>
#include <aws/ec2/model/InstanceNetworkInterface.h>
#include <aws/ec2/model/Route.h>
#include <aws/ec2/model/RouteTableAssociation.h>
#include <aws/ec2/model/Tag.h>

#include <string_view>

namespace netstack::cloud::aws {

namespace {

namespace Model = Aws::EC2::Model;
using core::JsonWriter;

std::string FromAws(const Aws::String& value) {
  return std::string(value.c_str(), value.size());
}

void OptionalString(JsonWriter& out, std::string_view key, bool has_been_set,
                    const Aws::String& value) {
  if (has_been_set) {
    out.StringField(key, FromAws(value));
  }
}

void OptionalTimestamp(JsonWriter& out, std::string_view key, bool has_been_set,
                       const Aws::Utils::DateTime& value) {
  if (has_been_set) {
    out.StringField(key, FromAws(value.ToGmtString(Aws::Utils::DateFormat::ISO_8601)));
  }
}

void WriteTags(JsonWriter& out, const Aws::Vector<Model::Tag>& tags) {
  out.Key("Tags").BeginArray();
  for (const auto& tag : tags) {
    out.BeginObject()
        .StringField("Key", FromAws(tag.GetKey()))
        .StringField("Value", FromAws(tag.GetValue()))
        .EndObject();
  }
  out.EndArray();
}

void WriteGroups(JsonWriter& out, std::string_view key,
                 const Aws::Vector<Model::GroupIdentifier>& groups) {
  out.Key(key).BeginArray();
  for (const auto& group : groups) {
    out.BeginObject();
    OptionalString(out, "GroupName", group.GroupNameHasBeenSet(), group.GetGroupName());
    OptionalString(out, "GroupId", group.GroupIdHasBeenSet(), group.GetGroupId());
    out.EndObject();
  }
  out.EndArray();
}

void WriteBlockDeviceMappings(JsonWriter& out,
                              const Aws::Vector<Model::InstanceBlockDeviceMapping>& mappings) {
  out.Key("BlockDeviceMappings").BeginArray();
  for (const auto& mapping : mappings) {
    out.BeginObject();
    OptionalString(out, "DeviceName", mapping.DeviceNameHasBeenSet(), mapping.GetDeviceName());
    if (mapping.EbsHasBeenSet()) {
      const auto& ebs = mapping.GetEbs();
      out.Key("Ebs").BeginObject();
      OptionalTimestamp(out, "AttachTime", ebs.AttachTimeHasBeenSet(), ebs.GetAttachTime());
      if (ebs.DeleteOnTerminationHasBeenSet()) {
        out.BoolField("DeleteOnTermination", ebs.GetDeleteOnTermination());
      }
      if (ebs.StatusHasBeenSet()) {
        out.StringField("Status", FromAws(Model::AttachmentStatusMapper::GetNameForAttachmentStatus(
                                      ebs.GetStatus())));
      }
      OptionalString(out, "VolumeId", ebs.VolumeIdHasBeenSet(), ebs.GetVolumeId());
      out.EndObject();
    }
    out.EndObject();
  }
  out.EndArray();
}

void WriteNetworkInterface(JsonWriter& out, const Model::InstanceNetworkInterface& eni) {
  out.BeginObject();
  if (eni.AssociationHasBeenSet()) {
    const auto& association = eni.GetAssociation();
    out.Key("Association").BeginObject();
    OptionalString(out, "IpOwnerId", association.IpOwnerIdHasBeenSet(),
                   association.GetIpOwnerId());
    OptionalString(out, "PublicDnsName", association.PublicDnsNameHasBeenSet(),
                   association.GetPublicDnsName());
    OptionalString(out, "PublicIp", association.PublicIpHasBeenSet(), association.GetPublicIp());
    out.EndObject();
  }
  if (eni.AttachmentHasBeenSet()) {
    const auto& attachment = eni.GetAttachment();
    out.Key("Attachment").BeginObject();
    OptionalTimestamp(out, "AttachTime", attachment.AttachTimeHasBeenSet(),
                      attachment.GetAttachTime());
    OptionalString(out, "AttachmentId", attachment.AttachmentIdHasBeenSet(),
                   attachment.GetAttachmentId());
    if (attachment.DeleteOnTerminationHasBeenSet()) {
      out.BoolField("DeleteOnTermination", attachment.GetDeleteOnTermination());
    }
    if (attachment.DeviceIndexHasBeenSet()) {
      out.IntField("DeviceIndex", attachment.GetDeviceIndex());
    }
    if (attachment.StatusHasBeenSet()) {
      out.StringField("Status", FromAws(Model::AttachmentStatusMapper::GetNameForAttachmentStatus(
                                    attachment.GetStatus())));
    }
    out.EndObject();
  }
  OptionalString(out, "Description", eni.DescriptionHasBeenSet(), eni.GetDescription());
  WriteGroups(out, "Groups", eni.GetGroups());
  OptionalString(out, "MacAddress", eni.MacAddressHasBeenSet(), eni.GetMacAddress());
  OptionalString(out, "NetworkInterfaceId", eni.NetworkInterfaceIdHasBeenSet(),
                 eni.GetNetworkInterfaceId());
  OptionalString(out, "OwnerId", eni.OwnerIdHasBeenSet(), eni.GetOwnerId());
  OptionalString(out, "PrivateDnsName", eni.PrivateDnsNameHasBeenSet(), eni.GetPrivateDnsName());
  OptionalString(out, "PrivateIpAddress", eni.PrivateIpAddressHasBeenSet(),
                 eni.GetPrivateIpAddress());
  if (eni.SourceDestCheckHasBeenSet()) {
    out.BoolField("SourceDestCheck", eni.GetSourceDestCheck());
  }
  if (eni.StatusHasBeenSet()) {
    out.StringField("Status", FromAws(Model::NetworkInterfaceStatusMapper::
                                          GetNameForNetworkInterfaceStatus(eni.GetStatus())));
  }
  OptionalString(out, "SubnetId", eni.SubnetIdHasBeenSet(), eni.GetSubnetId());
  OptionalString(out, "VpcId", eni.VpcIdHasBeenSet(), eni.GetVpcId());
  out.EndObject();
}

void WriteInstance(JsonWriter& out, const Model::Instance& instance) {
  out.BeginObject();
  if (instance.AmiLaunchIndexHasBeenSet()) {
    out.IntField("AmiLaunchIndex", instance.GetAmiLaunchIndex());
  }
  OptionalString(out, "ImageId", instance.ImageIdHasBeenSet(), instance.GetImageId());
  OptionalString(out, "InstanceId", instance.InstanceIdHasBeenSet(), instance.GetInstanceId());
  if (instance.InstanceTypeHasBeenSet()) {
    out.StringField("InstanceType", FromAws(Model::InstanceTypeMapper::GetNameForInstanceType(
                                        instance.GetInstanceType())));
  }
  OptionalString(out, "KernelId", instance.KernelIdHasBeenSet(), instance.GetKernelId());
  OptionalString(out, "KeyName", instance.KeyNameHasBeenSet(), instance.GetKeyName());
  OptionalTimestamp(out, "LaunchTime", instance.LaunchTimeHasBeenSet(), instance.GetLaunchTime());
  if (instance.MonitoringHasBeenSet()) {
    out.Key("Monitoring")
        .BeginObject()
        .StringField("State", FromAws(Model::MonitoringStateMapper::GetNameForMonitoringState(
                                  instance.GetMonitoring().GetState())))
        .EndObject();
  }
  if (instance.PlacementHasBeenSet()) {
    const auto& placement = instance.GetPlacement();
    out.Key("Placement").BeginObject();
    OptionalString(out, "AvailabilityZone", placement.AvailabilityZoneHasBeenSet(),
                   placement.GetAvailabilityZone());
    OptionalString(out, "GroupName", placement.GroupNameHasBeenSet(), placement.GetGroupName());
    if (placement.TenancyHasBeenSet()) {
      out.StringField("Tenancy",
                      FromAws(Model::TenancyMapper::GetNameForTenancy(placement.GetTenancy())));
    }
    out.EndObject();
  }
  OptionalString(out, "PrivateDnsName", instance.PrivateDnsNameHasBeenSet(),
                 instance.GetPrivateDnsName());
  OptionalString(out, "PrivateIpAddress", instance.PrivateIpAddressHasBeenSet(),
                 instance.GetPrivateIpAddress());
  OptionalString(out, "PublicDnsName", instance.PublicDnsNameHasBeenSet(),
                 instance.GetPublicDnsName());
  OptionalString(out, "PublicIpAddress", instance.PublicIpAddressHasBeenSet(),
                 instance.GetPublicIpAddress());
  if (instance.StateHasBeenSet()) {
    out.Key("State")
        .BeginObject()
        .IntField("Code", instance.GetState().GetCode())
        .StringField("Name", FromAws(Model::InstanceStateNameMapper::GetNameForInstanceStateName(
                                 instance.GetState().GetName())))
        .EndObject();
  }
  OptionalString(out, "StateTransitionReason", instance.StateTransitionReasonHasBeenSet(),
                 instance.GetStateTransitionReason());
  OptionalString(out, "SubnetId", instance.SubnetIdHasBeenSet(), instance.GetSubnetId());
  OptionalString(out, "VpcId", instance.VpcIdHasBeenSet(), instance.GetVpcId());
  if (instance.ArchitectureHasBeenSet()) {
    out.StringField("Architecture",
                    FromAws(Model::ArchitectureValuesMapper::GetNameForArchitectureValues(
                        instance.GetArchitecture())));
  }
  WriteBlockDeviceMappings(out, instance.GetBlockDeviceMappings());
  OptionalString(out, "ClientToken", instance.ClientTokenHasBeenSet(),
                 instance.GetClientToken());
  if (instance.EbsOptimizedHasBeenSet()) {
    out.BoolField("EbsOptimized", instance.GetEbsOptimized());
  }
  if (instance.EnaSupportHasBeenSet()) {
    out.BoolField("EnaSupport", instance.GetEnaSupport());
  }
  if (instance.HypervisorHasBeenSet()) {
    out.StringField("Hypervisor", FromAws(Model::HypervisorTypeMapper::GetNameForHypervisorType(
                                      instance.GetHypervisor())));
  }
  if (instance.IamInstanceProfileHasBeenSet()) {
    const auto& profile = instance.GetIamInstanceProfile();
    out.Key("IamInstanceProfile").BeginObject();
    OptionalString(out, "Arn", profile.ArnHasBeenSet(), profile.GetArn());
    OptionalString(out, "Id", profile.IdHasBeenSet(), profile.GetId());
    out.EndObject();
  }
  out.Key("NetworkInterfaces").BeginArray();
  for (const auto& eni : instance.GetNetworkInterfaces()) {
    WriteNetworkInterface(out, eni);
  }
  out.EndArray();
  OptionalString(out, "RootDeviceName", instance.RootDeviceNameHasBeenSet(),
                 instance.GetRootDeviceName());
  if (instance.RootDeviceTypeHasBeenSet()) {
    out.StringField("RootDeviceType", FromAws(Model::DeviceTypeMapper::GetNameForDeviceType(
                                          instance.GetRootDeviceType())));
  }
  WriteGroups(out, "SecurityGroups", instance.GetSecurityGroups());
  if (instance.SourceDestCheckHasBeenSet()) {
    out.BoolField("SourceDestCheck", instance.GetSourceDestCheck());
  }
  WriteTags(out, instance.GetTags());
  if (instance.VirtualizationTypeHasBeenSet()) {
    out.StringField("VirtualizationType",
                    FromAws(Model::VirtualizationTypeMapper::GetNameForVirtualizationType(
                        instance.GetVirtualizationType())));
  }
  out.EndObject();
}

void WriteRoute(JsonWriter& out, const Model::Route& route) {
  out.BeginObject();
  OptionalString(out, "DestinationCidrBlock", route.DestinationCidrBlockHasBeenSet(),
                 route.GetDestinationCidrBlock());
  OptionalString(out, "DestinationIpv6CidrBlock", route.DestinationIpv6CidrBlockHasBeenSet(),
                 route.GetDestinationIpv6CidrBlock());
  OptionalString(out, "DestinationPrefixListId", route.DestinationPrefixListIdHasBeenSet(),
                 route.GetDestinationPrefixListId());
  OptionalString(out, "EgressOnlyInternetGatewayId",
                 route.EgressOnlyInternetGatewayIdHasBeenSet(),
                 route.GetEgressOnlyInternetGatewayId());
  OptionalString(out, "GatewayId", route.GatewayIdHasBeenSet(), route.GetGatewayId());
  OptionalString(out, "InstanceId", route.InstanceIdHasBeenSet(), route.GetInstanceId());
  OptionalString(out, "InstanceOwnerId", route.InstanceOwnerIdHasBeenSet(),
                 route.GetInstanceOwnerId());
  OptionalString(out, "NatGatewayId", route.NatGatewayIdHasBeenSet(), route.GetNatGatewayId());
  OptionalString(out, "TransitGatewayId", route.TransitGatewayIdHasBeenSet(),
                 route.GetTransitGatewayId());
  OptionalString(out, "NetworkInterfaceId", route.NetworkInterfaceIdHasBeenSet(),
                 route.GetNetworkInterfaceId());
  if (route.OriginHasBeenSet()) {
    out.StringField("Origin",
                    FromAws(Model::RouteOriginMapper::GetNameForRouteOrigin(route.GetOrigin())));
  }
  if (route.StateHasBeenSet()) {
    out.StringField("State",
                    FromAws(Model::RouteStateMapper::GetNameForRouteState(route.GetState())));
  }
  OptionalString(out, "VpcPeeringConnectionId", route.VpcPeeringConnectionIdHasBeenSet(),
                 route.GetVpcPeeringConnectionId());
  out.EndObject();
}

} // namespace

std::string RenderCallerIdentity(const Aws::STS::Model::GetCallerIdentityResult& result) {
  JsonWriter out;
  out.BeginObject()
      .StringField("UserId", FromAws(result.GetUserId()))
      .StringField("Account", FromAws(result.GetAccount()))
      .StringField("Arn", FromAws(result.GetArn()))
      .EndObject();
  return out.str() + "\n";
}

std::string RenderReservations(const Aws::Vector<Model::Reservation>& reservations) {
  JsonWriter out;
  out.BeginObject().Key("Reservations").BeginArray();
  for (const auto& reservation : reservations) {
    out.BeginObject();
    WriteGroups(out, "Groups", reservation.GetGroups());
    out.Key("Instances").BeginArray();
    for (const auto& instance : reservation.GetInstances()) {
      WriteInstance(out, instance);
    }
    out.EndArray();
    OptionalString(out, "OwnerId", reservation.OwnerIdHasBeenSet(), reservation.GetOwnerId());
    OptionalString(out, "RequesterId", reservation.RequesterIdHasBeenSet(),
                   reservation.GetRequesterId());
    OptionalString(out, "ReservationId", reservation.ReservationIdHasBeenSet(),
                   reservation.GetReservationId());
    out.EndObject();
  }
  out.EndArray().EndObject();
  return out.str() + "\n";
}

std::string RenderSubnets(const Aws::Vector<Model::Subnet>& subnets) {
  JsonWriter out;
  out.BeginObject().Key("Subnets").BeginArray();
  for (const auto& subnet : subnets) {
    out.BeginObject();
    OptionalString(out, "AvailabilityZone", subnet.AvailabilityZoneHasBeenSet(),
                   subnet.GetAvailabilityZone());
    OptionalString(out, "AvailabilityZoneId", subnet.AvailabilityZoneIdHasBeenSet(),
                   subnet.GetAvailabilityZoneId());
    if (subnet.AvailableIpAddressCountHasBeenSet()) {
      out.IntField("AvailableIpAddressCount", subnet.GetAvailableIpAddressCount());
    }
    OptionalString(out, "CidrBlock", subnet.CidrBlockHasBeenSet(), subnet.GetCidrBlock());
    if (subnet.DefaultForAzHasBeenSet()) {
      out.BoolField("DefaultForAz", subnet.GetDefaultForAz());
    }
    if (subnet.MapPublicIpOnLaunchHasBeenSet()) {
      out.BoolField("MapPublicIpOnLaunch", subnet.GetMapPublicIpOnLaunch());
    }
    if (subnet.StateHasBeenSet()) {
      out.StringField("State",
                      FromAws(Model::SubnetStateMapper::GetNameForSubnetState(subnet.GetState())));
    }
    OptionalString(out, "SubnetId", subnet.SubnetIdHasBeenSet(), subnet.GetSubnetId());
    OptionalString(out, "VpcId", subnet.VpcIdHasBeenSet(), subnet.GetVpcId());
    OptionalString(out, "OwnerId", subnet.OwnerIdHasBeenSet(), subnet.GetOwnerId());
    if (subnet.AssignIpv6AddressOnCreationHasBeenSet()) {
      out.BoolField("AssignIpv6AddressOnCreation", subnet.GetAssignIpv6AddressOnCreation());
    }
    out.Key("Ipv6CidrBlockAssociationSet").BeginArray();
    for (const auto& association : subnet.GetIpv6CidrBlockAssociationSet()) {
      out.BeginObject();
      OptionalString(out, "AssociationId", association.AssociationIdHasBeenSet(),
                     association.GetAssociationId());
      OptionalString(out, "Ipv6CidrBlock", association.Ipv6CidrBlockHasBeenSet(),
                     association.GetIpv6CidrBlock());
      if (association.Ipv6CidrBlockStateHasBeenSet()) {
        out.Key("Ipv6CidrBlockState")
            .BeginObject()
            .StringField("State",
                         FromAws(Model::SubnetCidrBlockStateCodeMapper::
                                     GetNameForSubnetCidrBlockStateCode(
                                         association.GetIpv6CidrBlockState().GetState())))
            .EndObject();
      }
      out.EndObject();
    }
    out.EndArray();
    WriteTags(out, subnet.GetTags());
    OptionalString(out, "SubnetArn", subnet.SubnetArnHasBeenSet(), subnet.GetSubnetArn());
    out.EndObject();
  }
  out.EndArray().EndObject();
  return out.str() + "\n";
}

std::string RenderRouteTables(const Aws::Vector<Model::RouteTable>& tables) {
  JsonWriter out;
  out.BeginObject().Key("RouteTables").BeginArray();
  for (const auto& table : tables) {
    out.BeginObject().Key("Associations").BeginArray();
    for (const auto& association : table.GetAssociations()) {
      out.BeginObject();
      if (association.MainHasBeenSet()) {
        out.BoolField("Main", association.GetMain());
      }
      OptionalString(out, "RouteTableAssociationId",
                     association.RouteTableAssociationIdHasBeenSet(),
                     association.GetRouteTableAssociationId());
      OptionalString(out, "RouteTableId", association.RouteTableIdHasBeenSet(),
                     association.GetRouteTableId());
      OptionalString(out, "SubnetId", association.SubnetIdHasBeenSet(),
                     association.GetSubnetId());
      OptionalString(out, "GatewayId", association.GatewayIdHasBeenSet(),
                     association.GetGatewayId());
      if (association.AssociationStateHasBeenSet()) {
        const auto& state = association.GetAssociationState();
        out.Key("AssociationState").BeginObject();
        if (state.StateHasBeenSet()) {
          out.StringField("State", FromAws(Model::RouteTableAssociationStateCodeMapper::
                                               GetNameForRouteTableAssociationStateCode(
                                                   state.GetState())));
        }
        OptionalString(out, "StatusMessage", state.StatusMessageHasBeenSet(),
                       state.GetStatusMessage());
        out.EndObject();
      }
      out.EndObject();
    }
    out.EndArray();

    out.Key("PropagatingVgws").BeginArray();
    for (const auto& vgw : table.GetPropagatingVgws()) {
      out.BeginObject().StringField("GatewayId", FromAws(vgw.GetGatewayId())).EndObject();
    }
    out.EndArray();

    OptionalString(out, "RouteTableId", table.RouteTableIdHasBeenSet(), table.GetRouteTableId());
    out.Key("Routes").BeginArray();
    for (const auto& route : table.GetRoutes()) {
      WriteRoute(out, route);
    }
    out.EndArray();
    WriteTags(out, table.GetTags());
    OptionalString(out, "VpcId", table.VpcIdHasBeenSet(), table.GetVpcId());
    OptionalString(out, "OwnerId", table.OwnerIdHasBeenSet(), table.GetOwnerId());
    out.EndObject();
  }
  out.EndArray().EndObject();
  return out.str() + "\n";
}

} // namespace netstack::cloud::aws
