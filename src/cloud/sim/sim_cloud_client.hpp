#pragma once

#include "cloud/cloud_client.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace netstack::cloud::sim {

// Behaviour knobs for the simulated region.
struct SimOptions {
  std::string region = "us-west-1";
  std::string account_id = "123456789012";
  std::string caller_user_id = "AIDASIMULATEDUSER0001";
  // Number of CreateTags calls that still see a freshly created ID as
  // unknown (eventual consistency between the create and tagging endpoints).
  std::uint32_t tag_visibility_lag = 0;
  // Describe polls a NAT gateway spends in `pending` / `deleting`.
  std::uint32_t nat_pending_polls = 2;
  std::uint32_t nat_deleting_polls = 2;
  // Describe polls an instance spends in `pending` / `shutting-down`.
  std::uint32_t instance_pending_polls = 1;
  std::uint32_t instance_shutdown_polls = 2;
};

// Injected provider failure. Matches calls to `operation` (the ICloudClient
// method name, e.g. "DeleteRouteTable") on `resource_id`, or on any resource
// when `resource_id` is empty. Fires `remaining` times, then disarms.
struct SimFault {
  std::string operation;
  std::string resource_id;
  std::string code = "InternalError";
  std::string message = "injected failure";
  std::uint32_t remaining = std::numeric_limits<std::uint32_t>::max();
};

// Everything the simulated region knows. Kept as plain data so it can be
// persisted between CLI invocations (see sim_state_store.hpp).
struct SimCloudState {
  std::uint64_t next_id = 1;
  std::map<std::string, Vpc> vpcs;
  std::map<std::string, Subnet> subnets;
  std::map<std::string, InternetGateway> internet_gateways;
  std::map<std::string, Address> addresses;
  std::map<std::string, NatGateway> nat_gateways;
  std::map<std::string, RouteTable> route_tables;
  std::map<std::string, SecurityGroup> security_groups;
  std::map<std::string, Instance> instances;
  std::map<std::string, NetworkInterface> network_interfaces;
  // Remaining describe polls before a NAT gateway/instance moves on.
  std::map<std::string, std::uint32_t> transition_polls;
  // Remaining CreateTags calls for which an ID is still invisible.
  std::map<std::string, std::uint32_t> tag_lag;
};

// Deterministic in-memory control plane.
//
// It applies the provider's dependency rules (a subnet with interfaces cannot
// be deleted, an attached gateway cannot be deleted, the main route table and
// default security group cannot be deleted, ...). It also creates the implicit
// children the provider creates: the main route table and default group of a
// VPC, and the interfaces owned by instances and NAT gateways. Every call is
// journaled so tests can assert ordering across the whole run.
class SimCloudClient final : public ICloudClient {
public:
  explicit SimCloudClient(SimOptions options = {});

  std::string_view BackendName() const override {
    return "sim";
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

  // Test and CLI hooks.
  void InjectFault(SimFault fault);
  const SimOptions& options() const {
    return options_;
  }
  const SimCloudState& state() const {
    return state_;
  }
  void ReplaceState(SimCloudState state);

  // Ordered record of every call as "<Operation> <primary-id>".
  const std::vector<std::string>& CallJournal() const {
    return journal_;
  }
  std::size_t CallCount(std::string_view operation) const;

private:
  std::string NextId(std::string_view kind_prefix);
  std::string NextPublicIp();
  std::string NextPrivateIp(const std::string& subnet_id);
  void Record(std::string_view operation, std::string_view resource_id);
  bool CheckFault(std::string_view operation, std::string_view resource_id, CloudError& error);
  void StartTagLag(const std::string& resource_id);
  bool ResourceExists(const std::string& resource_id) const;

  // Transition helpers invoked from describe calls.
  void AdvanceNatGateway(NatGateway& gateway);
  void AdvanceInstance(Instance& instance);
  void FinishNatGatewayDeletion(NatGateway& gateway);
  void FinishInstanceTermination(Instance& instance);

  SimOptions options_;
  SimCloudState state_;
  std::vector<SimFault> faults_;
  std::vector<std::string> journal_;
};

} // namespace netstack::cloud::sim
