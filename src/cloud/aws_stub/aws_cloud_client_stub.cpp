#include "cloud/aws_stub/aws_cloud_client_stub.hpp"

#include <utility>

#ifndef NETSTACK_ENABLE_AWS_BACKEND
#define NETSTACK_ENABLE_AWS_BACKEND 0
#endif

#ifndef NETSTACK_AWS_BACKEND_REQUESTED
#define NETSTACK_AWS_BACKEND_REQUESTED 0
#endif

namespace netstack::cloud::aws_stub {

namespace {

std::string BuildUnavailableMessage() {
#if NETSTACK_AWS_BACKEND_REQUESTED
  return "aws backend was requested but the AWS SDK for C++ (ec2, sts) was not found at "
         "configure time; install aws-sdk-cpp and reconfigure";
#else
  return "aws backend is disabled at build time (set -DNETSTACK_ENABLE_AWS_BACKEND=ON and "
         "install aws-sdk-cpp to enable it)";
#endif
}

} // namespace

bool IsAwsBackendEnabledAtBuild() {
#if NETSTACK_ENABLE_AWS_BACKEND
  return true;
#else
  return false;
#endif
}

bool WasAwsBackendRequestedAtBuild() {
#if NETSTACK_AWS_BACKEND_REQUESTED
  return true;
#else
  return false;
#endif
}

std::string_view AwsBackendAvailabilityStatusText() {
#if NETSTACK_ENABLE_AWS_BACKEND
  return "enabled";
#elif NETSTACK_AWS_BACKEND_REQUESTED
  return "disabled (SDK not found)";
#else
  return "disabled (build option OFF)";
#endif
}

AwsCloudClientStub::AwsCloudClientStub(std::string region) : region_(std::move(region)) {}

bool AwsCloudClientStub::Unavailable(std::string_view operation, CloudError& error) const {
  error.code = "BackendUnavailable";
  error.message = BuildUnavailableMessage() + " (operation=" + std::string(operation) +
                  " region=" + region_ + ")";
  return false;
}

bool AwsCloudClientStub::GetCallerIdentity(CallerIdentity&, CloudError& error) {
  return Unavailable("GetCallerIdentity", error);
}

bool AwsCloudClientStub::CreateTags(const std::vector<std::string>&, const TagList&,
                                    CloudError& error) {
  return Unavailable("CreateTags", error);
}

bool AwsCloudClientStub::CreateVpc(const std::string&, std::string&, CloudError& error) {
  return Unavailable("CreateVpc", error);
}

bool AwsCloudClientStub::DescribeVpcs(const DescribeQuery&, std::vector<Vpc>& vpcs,
                                      CloudError& error) {
  vpcs.clear();
  return Unavailable("DescribeVpcs", error);
}

bool AwsCloudClientStub::DeleteVpc(const std::string&, CloudError& error) {
  return Unavailable("DeleteVpc", error);
}

bool AwsCloudClientStub::CreateSubnet(const std::string&, const std::string&, const std::string&,
                                      std::string&, CloudError& error) {
  return Unavailable("CreateSubnet", error);
}

bool AwsCloudClientStub::SetSubnetMapPublicIpOnLaunch(const std::string&, bool,
                                                      CloudError& error) {
  return Unavailable("SetSubnetMapPublicIpOnLaunch", error);
}

bool AwsCloudClientStub::DescribeSubnets(const DescribeQuery&, std::vector<Subnet>& subnets,
                                         CloudError& error) {
  subnets.clear();
  return Unavailable("DescribeSubnets", error);
}

bool AwsCloudClientStub::DeleteSubnet(const std::string&, CloudError& error) {
  return Unavailable("DeleteSubnet", error);
}

bool AwsCloudClientStub::CreateInternetGateway(std::string&, CloudError& error) {
  return Unavailable("CreateInternetGateway", error);
}

bool AwsCloudClientStub::AttachInternetGateway(const std::string&, const std::string&,
                                               CloudError& error) {
  return Unavailable("AttachInternetGateway", error);
}

bool AwsCloudClientStub::DetachInternetGateway(const std::string&, const std::string&,
                                               CloudError& error) {
  return Unavailable("DetachInternetGateway", error);
}

bool AwsCloudClientStub::DescribeInternetGateways(const DescribeQuery&,
                                                  std::vector<InternetGateway>& gateways,
                                                  CloudError& error) {
  gateways.clear();
  return Unavailable("DescribeInternetGateways", error);
}

bool AwsCloudClientStub::DeleteInternetGateway(const std::string&, CloudError& error) {
  return Unavailable("DeleteInternetGateway", error);
}

bool AwsCloudClientStub::AllocateAddress(Address&, CloudError& error) {
  return Unavailable("AllocateAddress", error);
}

bool AwsCloudClientStub::DisassociateAddress(const std::string&, CloudError& error) {
  return Unavailable("DisassociateAddress", error);
}

bool AwsCloudClientStub::ReleaseAddress(const std::string&, CloudError& error) {
  return Unavailable("ReleaseAddress", error);
}

bool AwsCloudClientStub::CreateNatGateway(const std::string&, const std::string&, std::string&,
                                          CloudError& error) {
  return Unavailable("CreateNatGateway", error);
}

bool AwsCloudClientStub::DescribeNatGateways(const DescribeQuery&,
                                             std::vector<NatGateway>& gateways,
                                             CloudError& error) {
  gateways.clear();
  return Unavailable("DescribeNatGateways", error);
}

bool AwsCloudClientStub::DeleteNatGateway(const std::string&, CloudError& error) {
  return Unavailable("DeleteNatGateway", error);
}

bool AwsCloudClientStub::CreateRouteTable(const std::string&, std::string&, CloudError& error) {
  return Unavailable("CreateRouteTable", error);
}

bool AwsCloudClientStub::DescribeRouteTables(const DescribeQuery&,
                                             std::vector<RouteTable>& tables,
                                             CloudError& error) {
  tables.clear();
  return Unavailable("DescribeRouteTables", error);
}

bool AwsCloudClientStub::AssociateRouteTable(const std::string&, const std::string&,
                                             std::string&, CloudError& error) {
  return Unavailable("AssociateRouteTable", error);
}

bool AwsCloudClientStub::DisassociateRouteTable(const std::string&, CloudError& error) {
  return Unavailable("DisassociateRouteTable", error);
}

bool AwsCloudClientStub::CreateRoute(const RouteSpec&, CloudError& error) {
  return Unavailable("CreateRoute", error);
}

bool AwsCloudClientStub::DeleteRoute(const std::string&, const std::string&, CloudError& error) {
  return Unavailable("DeleteRoute", error);
}

bool AwsCloudClientStub::DeleteRouteTable(const std::string&, CloudError& error) {
  return Unavailable("DeleteRouteTable", error);
}

bool AwsCloudClientStub::CreateSecurityGroup(const std::string&, const std::string&,
                                             const std::string&, std::string&,
                                             CloudError& error) {
  return Unavailable("CreateSecurityGroup", error);
}

bool AwsCloudClientStub::AuthorizeSecurityGroupIngress(const std::string&, const IpPermission&,
                                                       CloudError& error) {
  return Unavailable("AuthorizeSecurityGroupIngress", error);
}

bool AwsCloudClientStub::RevokeSecurityGroupIngress(const std::string&, const IpPermission&,
                                                    CloudError& error) {
  return Unavailable("RevokeSecurityGroupIngress", error);
}

bool AwsCloudClientStub::DescribeSecurityGroups(const DescribeQuery&,
                                                std::vector<SecurityGroup>& groups,
                                                CloudError& error) {
  groups.clear();
  return Unavailable("DescribeSecurityGroups", error);
}

bool AwsCloudClientStub::DeleteSecurityGroup(const std::string&, CloudError& error) {
  return Unavailable("DeleteSecurityGroup", error);
}

bool AwsCloudClientStub::RunInstance(const RunInstanceRequest&, Instance&, CloudError& error) {
  return Unavailable("RunInstance", error);
}

bool AwsCloudClientStub::DescribeInstances(const DescribeQuery&, std::vector<Instance>& instances,
                                           CloudError& error) {
  instances.clear();
  return Unavailable("DescribeInstances", error);
}

bool AwsCloudClientStub::TerminateInstances(const std::vector<std::string>&, CloudError& error) {
  return Unavailable("TerminateInstances", error);
}

bool AwsCloudClientStub::DescribeNetworkInterfaces(const DescribeQuery&,
                                                   std::vector<NetworkInterface>& interfaces,
                                                   CloudError& error) {
  interfaces.clear();
  return Unavailable("DescribeNetworkInterfaces", error);
}

bool AwsCloudClientStub::DetachNetworkInterface(const std::string&, bool, CloudError& error) {
  return Unavailable("DetachNetworkInterface", error);
}

bool AwsCloudClientStub::DeleteNetworkInterface(const std::string&, CloudError& error) {
  return Unavailable("DeleteNetworkInterface", error);
}

bool AwsCloudClientStub::GetCallerIdentityDocument(std::string&, CloudError& error) {
  return Unavailable("GetCallerIdentity", error);
}

bool AwsCloudClientStub::DescribeInstancesDocument(const DescribeQuery&, std::string&,
                                                   CloudError& error) {
  return Unavailable("DescribeInstances", error);
}

bool AwsCloudClientStub::DescribeSubnetsDocument(const DescribeQuery&, std::string&,
                                                 CloudError& error) {
  return Unavailable("DescribeSubnets", error);
}

bool AwsCloudClientStub::DescribeRouteTablesDocument(const DescribeQuery&, std::string&,
                                                     CloudError& error) {
  return Unavailable("DescribeRouteTables", error);
}

} // namespace netstack::cloud::aws_stub
