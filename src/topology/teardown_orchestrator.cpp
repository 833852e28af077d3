#include "topology/teardown_orchestrator.hpp"

#include "cloud/error_mapper.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "topology/create_orchestrator.hpp"
#include "topology/naming.hpp"

#include <algorithm>
#include <chrono>
#include <ostream>
#include <utility>

namespace netstack::topology {

namespace {

constexpr std::string_view kStepInstances = "instances";
constexpr std::string_view kStepNatGateways = "nat_gateways";
constexpr std::string_view kStepAddresses = "external_addresses";
constexpr std::string_view kStepInternetGateways = "internet_gateways";
constexpr std::string_view kStepRouteTables = "route_tables";
constexpr std::string_view kStepSubnets = "subnets";
constexpr std::string_view kStepSecurityGroups = "security_groups";
constexpr std::string_view kStepVpc = "vpc";

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string joined;
  for (const auto& id : ids) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += id;
  }
  return joined;
}

cloud::DescribeQuery InVpc(const std::string& vpc_id) {
  cloud::DescribeQuery query;
  query.vpc_id = vpc_id;
  return query;
}

std::string NowUtc() {
  return core::FormatUtcTimestamp(std::chrono::system_clock::now());
}

} // namespace

TeardownOrchestrator::TeardownOrchestrator(cloud::ICloudClient& client, cloud::Sleeper sleeper,
                                           core::logging::Logger& logger, std::ostream& out,
                                           cloud::WaitPolicy waiter)
    : client_(client), sleeper_(std::move(sleeper)), logger_(logger), out_(out),
      waiter_(waiter) {
  using K = ResourceKind;
  const auto bind = [this](auto member) -> StepFunction {
    return [this, member](const TopologyHandle& handle, TeardownReport& report) {
      (this->*member)(handle, report);
    };
  };

  steps_ = {
      {.name = std::string(kStepInstances),
       .kinds = {K::kInstance},
       .run = bind(&TeardownOrchestrator::TerminateInstances)},
      {.name = std::string(kStepNatGateways),
       .kinds = {K::kNatGateway},
       .run = bind(&TeardownOrchestrator::DeleteNatGateways)},
      {.name = std::string(kStepAddresses),
       .kinds = {K::kExternalAddress},
       .run = bind(&TeardownOrchestrator::ReleaseAddresses)},
      {.name = std::string(kStepInternetGateways),
       .kinds = {K::kInternetGateway},
       .run = bind(&TeardownOrchestrator::DeleteInternetGateways)},
      {.name = std::string(kStepRouteTables),
       .kinds = {K::kRouteTable},
       .run = bind(&TeardownOrchestrator::DeleteRouteTables)},
      {.name = std::string(kStepSubnets),
       .kinds = {K::kNetworkInterface, K::kSubnet},
       .run = bind(&TeardownOrchestrator::DeleteSubnets)},
      {.name = std::string(kStepSecurityGroups),
       .kinds = {K::kSecurityGroup},
       .run = bind(&TeardownOrchestrator::DeleteSecurityGroups)},
      {.name = std::string(kStepVpc),
       .kinds = {K::kVpc},
       .run = bind(&TeardownOrchestrator::DeleteNetwork)},
  };
}

std::vector<ResourceKind> TeardownOrchestrator::Plan() const {
  std::vector<ResourceKind> plan;
  for (const auto& step : steps_) {
    plan.insert(plan.end(), step.kinds.begin(), step.kinds.end());
  }
  return plan;
}

bool TeardownOrchestrator::RunStep(std::string_view name, const TopologyHandle& handle,
                                   TeardownReport& report, std::string& error) {
  error.clear();
  for (const auto& step : steps_) {
    if (step.name == name) {
      step.run(handle, report);
      return true;
    }
  }
  error = "unknown teardown step '" + std::string(name) + "'";
  return false;
}

bool TeardownOrchestrator::Teardown(const std::string& region, const std::string& prefix,
                                    TeardownReport& report, ResolveStatus& status,
                                    std::string& error) {
  error.clear();
  report = TeardownReport{};
  report.region = region;
  report.prefix = prefix;
  report.started_at_utc = NowUtc();

  ResolveResult resolved;
  cloud::CloudError cloud_error;
  if (!ResolveTopology(client_, region, prefix, resolved, cloud_error, logger_)) {
    status = ResolveStatus::kNotFound;
    error = cloud::FormatCloudFailure("describe vpcs", cloud_error);
    report.finished_at_utc = NowUtc();
    return false;
  }

  status = resolved.status;
  if (resolved.status == ResolveStatus::kAmbiguous) {
    error = FormatAmbiguousTopology(resolved, region, prefix) +
            "; refusing to tear down, delete or rename the extra VPCs first";
    report.finished_at_utc = NowUtc();
    return false;
  }

  if (resolved.status == ResolveStatus::kNotFound) {
    out_ << "No VPC found with tag Name=" << VpcName(prefix) << " in " << region
         << ". Nothing to do.\n";
    report.finished_at_utc = NowUtc();
    return true;
  }

  report.topology_found = true;
  report.vpc_id = resolved.handle.vpc_id;
  out_ << "VPC: " << resolved.handle.vpc_id << '\n';

  TeardownResolved(resolved.handle, report);

  report.finished_at_utc = NowUtc();
  out_ << "teardown complete.\n";
  return true;
}

void TeardownOrchestrator::TeardownResolved(const TopologyHandle& handle,
                                            TeardownReport& report) {
  std::string plan_error;
  if (!ValidateTeardownPlan(Plan(), plan_error)) {
    // Steps are fixed at construction; an invalid plan would delete
    // dependencies first and fail every later call.
    report.actions.push_back({.step = "plan",
                              .action = "validate teardown order",
                              .resource_id = handle.vpc_id,
                              .outcome = ActionOutcome::kFailed,
                              .error = plan_error});
    logger_.Error("teardown plan rejected", {{"error", plan_error}});
    return;
  }

  nat_allocation_ids_.clear();
  for (std::size_t i = 0; i < steps_.size(); ++i) {
    const Step& step = steps_[i];
    const std::size_t actions_before = report.actions.size();
    logger_.Info("teardown step started",
                 {{"step", step.name}, {"index", std::to_string(i + 1U)}});
    step.run(handle, report);
    logger_.Info("teardown step finished",
                 {{"step", step.name},
                  {"actions", std::to_string(report.actions.size() - actions_before)}});
  }

  logger_.Info("teardown finished", {{"vpc_id", handle.vpc_id},
                                     {"summary", FormatTeardownSummary(report)}});
}

bool TeardownOrchestrator::RecordCall(TeardownReport& report, std::string_view step,
                                      std::string action, std::string resource_id, bool ok,
                                      const cloud::CloudError& error) {
  TeardownAction entry;
  entry.step = std::string(step);
  entry.action = std::move(action);
  entry.resource_id = std::move(resource_id);

  if (ok) {
    entry.outcome = ActionOutcome::kSucceeded;
    logger_.Info("teardown action succeeded",
                 {{"step", entry.step}, {"action", entry.action},
                  {"resource_id", entry.resource_id}});
  } else if (cloud::IsNotFoundError(error)) {
    entry.outcome = ActionOutcome::kSkippedNotFound;
    entry.error = cloud::FormatCloudError(error);
    logger_.Info("teardown action skipped; resource already gone",
                 {{"step", entry.step}, {"action", entry.action},
                  {"resource_id", entry.resource_id}, {"error_code", error.code}});
  } else {
    entry.outcome = ActionOutcome::kFailed;
    entry.error = cloud::FormatCloudFailure(entry.action, error);
    logger_.Warn("teardown action failed; continuing",
                 {{"step", entry.step}, {"action", entry.action},
                  {"resource_id", entry.resource_id}, {"error", entry.error}});
  }

  const bool gone = entry.outcome != ActionOutcome::kFailed;
  report.actions.push_back(std::move(entry));
  return gone;
}

void TeardownOrchestrator::RecordWait(TeardownReport& report, std::string_view step,
                                      std::string action, std::string resource_id,
                                      const cloud::WaitResult& result) {
  TeardownAction entry;
  entry.step = std::string(step);
  entry.action = std::move(action);
  entry.resource_id = std::move(resource_id);
  if (result.satisfied) {
    entry.outcome = ActionOutcome::kSucceeded;
    logger_.Info("teardown wait satisfied",
                 {{"step", entry.step}, {"action", entry.action},
                  {"attempts", std::to_string(result.attempts)}});
  } else {
    entry.outcome = ActionOutcome::kFailed;
    entry.error = result.error;
    logger_.Warn("teardown wait failed; continuing",
                 {{"step", entry.step}, {"action", entry.action}, {"error", entry.error}});
  }
  report.actions.push_back(std::move(entry));
}

void TeardownOrchestrator::TerminateInstances(const TopologyHandle& handle,
                                              TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::Instance> instances;
  if (!client_.DescribeInstances(InVpc(handle.vpc_id), instances, error)) {
    RecordCall(report, kStepInstances, "describe instances", handle.vpc_id, false, error);
    return;
  }

  std::vector<std::string> ids;
  for (const auto& instance : instances) {
    if (instance.state != cloud::InstanceState::kTerminated) {
      ids.push_back(instance.instance_id);
    }
  }
  if (ids.empty()) {
    return;
  }

  // One batched call; the provider accepts or rejects the whole list.
  const bool ok = client_.TerminateInstances(ids, error);
  if (!RecordCall(report, kStepInstances, "terminate instances", JoinIds(ids), ok, error)) {
    return;
  }

  // Subnets and security groups stay in use until instances are terminated.
  RecordWait(report, kStepInstances, "wait instances terminated", JoinIds(ids),
             cloud::WaitForInstancesTerminated(client_, ids, waiter_, sleeper_, logger_));
}

void TeardownOrchestrator::DeleteNatGateways(const TopologyHandle& handle,
                                             TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::NatGateway> gateways;
  if (!client_.DescribeNatGateways(InVpc(handle.vpc_id), gateways, error)) {
    RecordCall(report, kStepNatGateways, "describe nat gateways", handle.vpc_id, false, error);
    return;
  }

  std::vector<std::string> pending_ids;
  for (const auto& gateway : gateways) {
    // Deleted gateways stay describable for a while; nothing left to do.
    if (gateway.state == cloud::NatGatewayState::kDeleted) {
      continue;
    }
    for (const auto& address : gateway.addresses) {
      if (!address.allocation_id.empty()) {
        nat_allocation_ids_.insert(address.allocation_id);
      }
    }
    const bool ok = client_.DeleteNatGateway(gateway.nat_gateway_id, error);
    if (RecordCall(report, kStepNatGateways, "delete nat gateway", gateway.nat_gateway_id, ok,
                   error)) {
      pending_ids.push_back(gateway.nat_gateway_id);
    }
  }
  if (pending_ids.empty()) {
    return;
  }

  // Gateway interfaces and addresses are freed only once deletion finishes.
  RecordWait(report, kStepNatGateways, "wait nat gateways deleted", JoinIds(pending_ids),
             cloud::WaitForNatGatewaysDeleted(client_, pending_ids, waiter_, sleeper_, logger_));
}

void TeardownOrchestrator::ReleaseAddresses(const TopologyHandle& handle,
                                            TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::NetworkInterface> interfaces;
  std::set<std::string> released;

  if (!client_.DescribeNetworkInterfaces(InVpc(handle.vpc_id), interfaces, error)) {
    RecordCall(report, kStepAddresses, "describe network interfaces", handle.vpc_id, false,
               error);
  } else {
    for (const auto& eni : interfaces) {
      if (!eni.association.has_value() || eni.association->public_ip.empty()) {
        continue;
      }
      const cloud::NetworkInterfaceAssociation& association = *eni.association;
      // Auto-assigned public IPs carry neither ID and go away with the
      // interface.
      if (!association.association_id.empty()) {
        const bool ok = client_.DisassociateAddress(association.association_id, error);
        RecordCall(report, kStepAddresses,
                   "disassociate address from " + eni.network_interface_id,
                   association.association_id, ok, error);
      }
      if (!association.allocation_id.empty()) {
        const bool ok = client_.ReleaseAddress(association.allocation_id, error);
        RecordCall(report, kStepAddresses, "release address", association.allocation_id, ok,
                   error);
        released.insert(association.allocation_id);
      }
    }
  }

  for (const auto& allocation_id : nat_allocation_ids_) {
    if (released.count(allocation_id) != 0U) {
      continue;
    }
    const bool ok = client_.ReleaseAddress(allocation_id, error);
    RecordCall(report, kStepAddresses, "release nat gateway address", allocation_id, ok, error);
  }
}

void TeardownOrchestrator::DeleteInternetGateways(const TopologyHandle& handle,
                                                  TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::InternetGateway> gateways;
  if (!client_.DescribeInternetGateways(InVpc(handle.vpc_id), gateways, error)) {
    RecordCall(report, kStepInternetGateways, "describe internet gateways", handle.vpc_id, false,
               error);
    return;
  }

  for (const auto& gateway : gateways) {
    for (const auto& attachment : gateway.attachments) {
      const bool ok =
          client_.DetachInternetGateway(gateway.internet_gateway_id, attachment.vpc_id, error);
      RecordCall(report, kStepInternetGateways, "detach internet gateway from " + attachment.vpc_id,
                 gateway.internet_gateway_id, ok, error);
    }
    const bool ok = client_.DeleteInternetGateway(gateway.internet_gateway_id, error);
    RecordCall(report, kStepInternetGateways, "delete internet gateway",
               gateway.internet_gateway_id, ok, error);
  }
}

void TeardownOrchestrator::DeleteRouteTables(const TopologyHandle& handle,
                                             TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::RouteTable> tables;
  if (!client_.DescribeRouteTables(InVpc(handle.vpc_id), tables, error)) {
    RecordCall(report, kStepRouteTables, "describe route tables", handle.vpc_id, false, error);
    return;
  }

  for (const auto& table : tables) {
    for (const auto& association : table.associations) {
      if (association.main || association.association_id.empty()) {
        continue;
      }
      const bool ok = client_.DisassociateRouteTable(association.association_id, error);
      RecordCall(report, kStepRouteTables, "disassociate route table " + table.route_table_id,
                 association.association_id, ok, error);
    }

    const bool has_default_route =
        std::any_of(table.routes.begin(), table.routes.end(), [](const cloud::Route& route) {
          return route.destination_cidr_block == kDefaultRouteCidr;
        });
    if (has_default_route) {
      const bool ok =
          client_.DeleteRoute(table.route_table_id, std::string(kDefaultRouteCidr), error);
      RecordCall(report, kStepRouteTables, "delete default route", table.route_table_id, ok,
                 error);
    }

    // The main table goes away with the VPC.
    if (!table.IsMain()) {
      const bool ok = client_.DeleteRouteTable(table.route_table_id, error);
      RecordCall(report, kStepRouteTables, "delete route table", table.route_table_id, ok, error);
    }
  }
}

void TeardownOrchestrator::DeleteSubnets(const TopologyHandle& handle, TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::Subnet> subnets;
  if (!client_.DescribeSubnets(InVpc(handle.vpc_id), subnets, error)) {
    RecordCall(report, kStepSubnets, "describe subnets", handle.vpc_id, false, error);
    return;
  }

  for (const auto& subnet : subnets) {
    // Interfaces can outlive their owner for a while and block the delete.
    std::vector<cloud::NetworkInterface> interfaces;
    cloud::DescribeQuery query;
    query.subnet_id = subnet.subnet_id;
    if (!client_.DescribeNetworkInterfaces(query, interfaces, error)) {
      RecordCall(report, kStepSubnets, "describe network interfaces", subnet.subnet_id, false,
                 error);
    } else {
      for (const auto& eni : interfaces) {
        if (eni.attachment.has_value() && eni.attachment->status == "attached") {
          const bool ok =
              client_.DetachNetworkInterface(eni.attachment->attachment_id, /*force=*/true, error);
          RecordCall(report, kStepSubnets, "detach network interface " + eni.network_interface_id,
                     eni.attachment->attachment_id, ok, error);
        }
        const bool ok = client_.DeleteNetworkInterface(eni.network_interface_id, error);
        RecordCall(report, kStepSubnets, "delete network interface", eni.network_interface_id, ok,
                   error);
      }
    }

    const bool ok = client_.DeleteSubnet(subnet.subnet_id, error);
    RecordCall(report, kStepSubnets, "delete subnet", subnet.subnet_id, ok, error);
  }
}

void TeardownOrchestrator::DeleteSecurityGroups(const TopologyHandle& handle,
                                                TeardownReport& report) {
  cloud::CloudError error;
  std::vector<cloud::SecurityGroup> groups;
  if (!client_.DescribeSecurityGroups(InVpc(handle.vpc_id), groups, error)) {
    RecordCall(report, kStepSecurityGroups, "describe security groups", handle.vpc_id, false,
               error);
    return;
  }

  std::set<std::string> deletable_ids;
  for (const auto& group : groups) {
    if (group.group_name != cloud::kDefaultSecurityGroupName) {
      deletable_ids.insert(group.group_id);
    }
  }

  // A group referenced by another group's rule cannot be deleted. Drop those
  // rules first so the deletes below do not depend on listing order.
  for (const auto& group : groups) {
    if (deletable_ids.count(group.group_id) == 0U) {
      continue;
    }
    for (const auto& permission : group.ingress) {
      const bool references_sibling =
          std::any_of(permission.source_group_ids.begin(), permission.source_group_ids.end(),
                      [&](const std::string& source) {
                        return source != group.group_id && deletable_ids.count(source) != 0U;
                      });
      if (!references_sibling) {
        continue;
      }
      const bool ok = client_.RevokeSecurityGroupIngress(group.group_id, permission, error);
      RecordCall(report, kStepSecurityGroups, "revoke cross-group ingress", group.group_id, ok,
                 error);
    }
  }

  for (const auto& group : groups) {
    if (deletable_ids.count(group.group_id) == 0U) {
      continue;
    }
    const bool ok = client_.DeleteSecurityGroup(group.group_id, error);
    RecordCall(report, kStepSecurityGroups, "delete security group " + group.group_name,
               group.group_id, ok, error);
  }
}

void TeardownOrchestrator::DeleteNetwork(const TopologyHandle& handle, TeardownReport& report) {
  cloud::CloudError error;
  const bool ok = client_.DeleteVpc(handle.vpc_id, error);
  RecordCall(report, kStepVpc, "delete vpc", handle.vpc_id, ok, error);
}

} // namespace netstack::topology
