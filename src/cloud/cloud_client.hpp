#pragma once

#include "cloud/cloud_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace netstack::cloud {

// Control-plane contract consumed by the create/teardown orchestrators and by
// collect.
//
// Contract:
// - one call per provider operation, no hidden retries or waits; retry and
//   wait policy live above this interface (RetryingTagger, waiters)
// - every call returns true on success, or false with `error` populated using
//   the provider's own error code so callers can classify it
// - describe calls return an empty list (not an error) when nothing matches
//   the query; an explicit unknown ID in `query.ids` is a NotFound error, as
//   with the real provider
class ICloudClient {
public:
  virtual ~ICloudClient() = default;

  // Short backend label used in logs ("aws", "sim").
  virtual std::string_view BackendName() const = 0;

  virtual bool GetCallerIdentity(CallerIdentity& identity, CloudError& error) = 0;

  // Idempotent label-set on one or more resources.
  virtual bool CreateTags(const std::vector<std::string>& resource_ids, const TagList& tags,
                          CloudError& error) = 0;

  // Networks.
  virtual bool CreateVpc(const std::string& cidr_block, std::string& vpc_id,
                         CloudError& error) = 0;
  virtual bool DescribeVpcs(const DescribeQuery& query, std::vector<Vpc>& vpcs,
                            CloudError& error) = 0;
  virtual bool DeleteVpc(const std::string& vpc_id, CloudError& error) = 0;

  // Subnets.
  virtual bool CreateSubnet(const std::string& vpc_id, const std::string& cidr_block,
                            const std::string& availability_zone, std::string& subnet_id,
                            CloudError& error) = 0;
  virtual bool SetSubnetMapPublicIpOnLaunch(const std::string& subnet_id, bool enabled,
                                            CloudError& error) = 0;
  virtual bool DescribeSubnets(const DescribeQuery& query, std::vector<Subnet>& subnets,
                               CloudError& error) = 0;
  virtual bool DeleteSubnet(const std::string& subnet_id, CloudError& error) = 0;

  // Internet gateways. `query.vpc_id` matches the attachment VPC.
  virtual bool CreateInternetGateway(std::string& internet_gateway_id, CloudError& error) = 0;
  virtual bool AttachInternetGateway(const std::string& internet_gateway_id,
                                     const std::string& vpc_id, CloudError& error) = 0;
  virtual bool DetachInternetGateway(const std::string& internet_gateway_id,
                                     const std::string& vpc_id, CloudError& error) = 0;
  virtual bool DescribeInternetGateways(const DescribeQuery& query,
                                        std::vector<InternetGateway>& gateways,
                                        CloudError& error) = 0;
  virtual bool DeleteInternetGateway(const std::string& internet_gateway_id,
                                     CloudError& error) = 0;

  // External addresses.
  virtual bool AllocateAddress(Address& address, CloudError& error) = 0;
  virtual bool DisassociateAddress(const std::string& association_id, CloudError& error) = 0;
  virtual bool ReleaseAddress(const std::string& allocation_id, CloudError& error) = 0;

  // NAT gateways (asynchronous lifecycle).
  virtual bool CreateNatGateway(const std::string& subnet_id, const std::string& allocation_id,
                                std::string& nat_gateway_id, CloudError& error) = 0;
  virtual bool DescribeNatGateways(const DescribeQuery& query, std::vector<NatGateway>& gateways,
                                   CloudError& error) = 0;
  virtual bool DeleteNatGateway(const std::string& nat_gateway_id, CloudError& error) = 0;

  // Route tables.
  virtual bool CreateRouteTable(const std::string& vpc_id, std::string& route_table_id,
                                CloudError& error) = 0;
  virtual bool DescribeRouteTables(const DescribeQuery& query, std::vector<RouteTable>& tables,
                                   CloudError& error) = 0;
  virtual bool AssociateRouteTable(const std::string& route_table_id,
                                   const std::string& subnet_id, std::string& association_id,
                                   CloudError& error) = 0;
  virtual bool DisassociateRouteTable(const std::string& association_id, CloudError& error) = 0;
  virtual bool CreateRoute(const RouteSpec& route, CloudError& error) = 0;
  virtual bool DeleteRoute(const std::string& route_table_id,
                           const std::string& destination_cidr_block, CloudError& error) = 0;
  virtual bool DeleteRouteTable(const std::string& route_table_id, CloudError& error) = 0;

  // Security groups.
  virtual bool CreateSecurityGroup(const std::string& group_name, const std::string& description,
                                   const std::string& vpc_id, std::string& group_id,
                                   CloudError& error) = 0;
  virtual bool AuthorizeSecurityGroupIngress(const std::string& group_id,
                                             const IpPermission& permission,
                                             CloudError& error) = 0;
  virtual bool RevokeSecurityGroupIngress(const std::string& group_id,
                                          const IpPermission& permission, CloudError& error) = 0;
  virtual bool DescribeSecurityGroups(const DescribeQuery& query,
                                      std::vector<SecurityGroup>& groups, CloudError& error) = 0;
  virtual bool DeleteSecurityGroup(const std::string& group_id, CloudError& error) = 0;

  // Instances.
  virtual bool RunInstance(const RunInstanceRequest& request, Instance& instance,
                           CloudError& error) = 0;
  virtual bool DescribeInstances(const DescribeQuery& query, std::vector<Instance>& instances,
                                 CloudError& error) = 0;
  virtual bool TerminateInstances(const std::vector<std::string>& instance_ids,
                                  CloudError& error) = 0;

  // Network interfaces.
  virtual bool DescribeNetworkInterfaces(const DescribeQuery& query,
                                         std::vector<NetworkInterface>& interfaces,
                                         CloudError& error) = 0;
  virtual bool DetachNetworkInterface(const std::string& attachment_id, bool force,
                                      CloudError& error) = 0;
  virtual bool DeleteNetworkInterface(const std::string& network_interface_id,
                                      CloudError& error) = 0;

  // Snapshot export. Each call returns the provider's response to the named
  // operation as a JSON document with the provider's own member names and
  // nesting: instances stay grouped by reservation, and every member the
  // provider returned is kept. `query` scopes the call exactly as it does for
  // the typed describe calls above, and the same faults and errors apply.
  virtual bool GetCallerIdentityDocument(std::string& document, CloudError& error) = 0;
  virtual bool DescribeInstancesDocument(const DescribeQuery& query, std::string& document,
                                         CloudError& error) = 0;
  virtual bool DescribeSubnetsDocument(const DescribeQuery& query, std::string& document,
                                       CloudError& error) = 0;
  virtual bool DescribeRouteTablesDocument(const DescribeQuery& query, std::string& document,
                                           CloudError& error) = 0;
};

} // namespace netstack::cloud
