#pragma once

#include "cloud/aws/aws_sdk_context.hpp"
#include "cloud/cloud_client.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace Aws::EC2 {
class EC2Client;
}

namespace Aws::STS {
class STSClient;
}

namespace netstack::cloud::aws {

// ICloudClient backed by the AWS SDK for C++ (EC2 and STS).
//
// Provider error codes are passed through unchanged in CloudError::code
// (the SDK's exception name, e.g. `InvalidVpcID.NotFound`), so retry and
// teardown classification behave the same as against the simulated backend.
// Describe calls follow NextToken until the listing is complete.
class Ec2CloudClient final : public ICloudClient {
public:
  ~Ec2CloudClient() override;

  Ec2CloudClient(const Ec2CloudClient&) = delete;
  Ec2CloudClient& operator=(const Ec2CloudClient&) = delete;

  // Acquires the SDK context and builds region-scoped clients. Credentials
  // come from the SDK's default provider chain.
  static std::unique_ptr<Ec2CloudClient> Create(const std::string& region, std::string& error);

  std::string_view BackendName() const override {
    return "aws";
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
  Ec2CloudClient() = default;

  // Declared first so the SDK outlives both clients.
  AwsSdkContext sdk_context_;
  std::unique_ptr<Aws::EC2::EC2Client> ec2_;
  std::unique_ptr<Aws::STS::STSClient> sts_;
};

} // namespace netstack::cloud::aws
