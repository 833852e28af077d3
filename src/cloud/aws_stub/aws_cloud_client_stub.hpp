#pragma once

#include "cloud/cloud_client.hpp"

#include <string>
#include <string_view>

namespace netstack::cloud::aws_stub {

// Returns true when the build links the AWS SDK backed client.
bool IsAwsBackendEnabledAtBuild();

// Returns true when build configuration requested the AWS backend.
// This may still evaluate to disabled if the SDK was not found at configure
// time.
bool WasAwsBackendRequestedAtBuild();

// Human-readable status string for CLI visibility.
// Values today:
// - "enabled"
// - "disabled (SDK not found)"
// - "disabled (build option OFF)"
std::string_view AwsBackendAvailabilityStatusText();

// Client used for `--backend aws` when the SDK is not linked. Every call
// fails with `BackendUnavailable` and a message naming the build switch, so
// the CLI reports one actionable error instead of a link failure.
class AwsCloudClientStub final : public ICloudClient {
public:
  explicit AwsCloudClientStub(std::string region);

  std::string_view BackendName() const override {
    return "aws_stub";
  }

  bool GetCallerIdentity(CallerIdentity& identity, CloudError& error) override;
  bool CreateTags(const std::vector<std::string>& resource_ids, const TagList& tags,
                  CloudError& error) override;

  bool CreateVpc(const std::string& cidr_block, std::string& vpc_id, CloudError& error) override;
  bool DescribeVpcs(const DescribeQuery& query, std::vector<Vpc>& vpcs,
                    CloudError& error) override;
  bool DeleteVpc(const std::string& vpc_id, CloudError& error) override;

  bool CreateSubnet(const std::string& vpc_id, const std::string& cidr_block,
                    const std::string& availability_zone, std::string& subnet_id,
                    CloudError& error) override;
  bool SetSubnetMapPublicIpOnLaunch(const std::string& subnet_id, bool enabled,
                                    CloudError& error) override;
  bool DescribeSubnets(const DescribeQuery& query, std::vector<Subnet>& subnets,
                       CloudError& error) override;
  bool DeleteSubnet(const std::string& subnet_id, CloudError& error) override;

  bool CreateInternetGateway(std::string& internet_gateway_id, CloudError& error) override;
  bool AttachInternetGateway(const std::string& internet_gateway_id, const std::string& vpc_id,
                             CloudError& error) override;
  bool DetachInternetGateway(const std::string& internet_gateway_id, const std::string& vpc_id,
                             CloudError& error) override;
  bool DescribeInternetGateways(const DescribeQuery& query,
                                std::vector<InternetGateway>& gateways,
                                CloudError& error) override;
  bool DeleteInternetGateway(const std::string& internet_gateway_id, CloudError& error) override;

  bool AllocateAddress(Address& address, CloudError& error) override;
  bool DisassociateAddress(const std::string& association_id, CloudError& error) override;
  bool ReleaseAddress(const std::string& allocation_id, CloudError& error) override;

  bool CreateNatGateway(const std::string& subnet_id, const std::string& allocation_id,
                        std::string& nat_gateway_id, CloudError& error) override;
  bool DescribeNatGateways(const DescribeQuery& query, std::vector<NatGateway>& gateways,
                           CloudError& error) override;
  bool DeleteNatGateway(const std::string& nat_gateway_id, CloudError& error) override;

  bool CreateRouteTable(const std::string& vpc_id, std::string& route_table_id,
                        CloudError& error) override;
  bool DescribeRouteTables(const DescribeQuery& query, std::vector<RouteTable>& tables,
                           CloudError& error) override;
  bool AssociateRouteTable(const std::string& route_table_id, const std::string& subnet_id,
                           std::string& association_id, CloudError& error) override;
  bool DisassociateRouteTable(const std::string& association_id, CloudError& error) override;
  bool CreateRoute(const RouteSpec& route, CloudError& error) override;
  bool DeleteRoute(const std::string& route_table_id, const std::string& destination_cidr_block,
                   CloudError& error) override;
  bool DeleteRouteTable(const std::string& route_table_id, CloudError& error) override;

  bool CreateSecurityGroup(const std::string& group_name, const std::string& description,
                           const std::string& vpc_id, std::string& group_id,
                           CloudError& error) override;
  bool AuthorizeSecurityGroupIngress(const std::string& group_id, const IpPermission& permission,
                                     CloudError& error) override;
  bool RevokeSecurityGroupIngress(const std::string& group_id, const IpPermission& permission,
                                  CloudError& error) override;
  bool DescribeSecurityGroups(const DescribeQuery& query, std::vector<SecurityGroup>& groups,
                              CloudError& error) override;
  bool DeleteSecurityGroup(const std::string& group_id, CloudError& error) override;

  bool RunInstance(const RunInstanceRequest& request, Instance& instance,
                   CloudError& error) override;
  bool DescribeInstances(const DescribeQuery& query, std::vector<Instance>& instances,
                         CloudError& error) override;
  bool TerminateInstances(const std::vector<std::string>& instance_ids,
                          CloudError& error) override;

  bool DescribeNetworkInterfaces(const DescribeQuery& query,
                                 std::vector<NetworkInterface>& interfaces,
                                 CloudError& error) override;
  bool DetachNetworkInterface(const std::string& attachment_id, bool force,
                              CloudError& error) override;
  bool DeleteNetworkInterface(const std::string& network_interface_id,
                              CloudError& error) override;

  bool GetCallerIdentityDocument(std::string& document, CloudError& error) override;
  bool DescribeInstancesDocument(const DescribeQuery& query, std::string& document,
                                 CloudError& error) override;
  bool DescribeSubnetsDocument(const DescribeQuery& query, std::string& document,
                               CloudError& error) override;
  bool DescribeRouteTablesDocument(const DescribeQuery& query, std::string& document,
                                   CloudError& error) override;

private:
  bool Unavailable(std::string_view operation, CloudError& error) const;

  std::string region_;
};

} // namespace netstack::cloud::aws_stub
