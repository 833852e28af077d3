#include "topology/create_orchestrator.hpp"

#include "cloud/error_mapper.hpp"
#include "core/logging/logger.hpp"
#include "topology/naming.hpp"
#include "topology/retrying_tagger.hpp"

#include <cstdint>
#include <ostream>
#include <utility>

namespace netstack::topology {

namespace {

constexpr std::int32_t kSshPort = 22;

bool FailCall(std::string_view operation, const cloud::CloudError& cloud_error,
              std::string& error) {
  error = cloud::FormatCloudFailure(operation, cloud_error);
  return false;
}

cloud::IpPermission SshFromCidr(const std::string& cidr) {
  cloud::IpPermission permission;
  permission.ip_protocol = "tcp";
  permission.from_port = kSshPort;
  permission.to_port = kSshPort;
  permission.cidr_ranges = {cidr};
  return permission;
}

cloud::IpPermission SshFromGroup(const std::string& group_id) {
  cloud::IpPermission permission;
  permission.ip_protocol = "tcp";
  permission.from_port = kSshPort;
  permission.to_port = kSshPort;
  permission.source_group_ids = {group_id};
  return permission;
}

} // namespace

CreateOrchestrator::CreateOrchestrator(cloud::ICloudClient& client, cloud::Sleeper sleeper,
                                       core::logging::Logger& logger, std::ostream& out,
                                       const std::chrono::milliseconds tag_delay_unit)
    : client_(client), sleeper_(std::move(sleeper)), logger_(logger), out_(out),
      tag_delay_unit_(tag_delay_unit) {
  using K = ResourceKind;
  const auto bind = [this](auto member) -> StepFunction {
    return [this, member](const CreateRequest& request, CreatedTopology& created,
                          std::string& error) {
      return (this->*member)(request, created, error);
    };
  };

  steps_ = {
      {.name = "vpc", .kinds = {K::kVpc}, .run = bind(&CreateOrchestrator::CreateNetwork)},
      {.name = "subnets", .kinds = {K::kSubnet}, .run = bind(&CreateOrchestrator::CreateSubnets)},
      {.name = "internet_gateway",
       .kinds = {K::kInternetGateway},
       .run = bind(&CreateOrchestrator::CreateInternetGateway)},
      {.name = "nat_gateway",
       .kinds = {K::kExternalAddress, K::kNatGateway},
       .run = bind(&CreateOrchestrator::CreateNatGateway)},
      {.name = "route_tables",
       .kinds = {K::kRouteTable},
       .run = bind(&CreateOrchestrator::CreateRouting)},
      {.name = "security_groups",
       .kinds = {K::kSecurityGroup},
       .run = bind(&CreateOrchestrator::CreateSecurityGroups)},
      {.name = "instances",
       .kinds = {K::kInstance},
       .run = bind(&CreateOrchestrator::LaunchInstances)},
  };
}

std::vector<ResourceKind> CreateOrchestrator::Plan() const {
  std::vector<ResourceKind> plan;
  for (const auto& step : steps_) {
    plan.insert(plan.end(), step.kinds.begin(), step.kinds.end());
  }
  return plan;
}

bool CreateOrchestrator::RunStep(std::string_view name, const CreateRequest& request,
                                 CreatedTopology& created, std::string& error) {
  error.clear();
  for (const auto& step : steps_) {
    if (step.name == name) {
      return step.run(request, created, error);
    }
  }
  error = "unknown create step '" + std::string(name) + "'";
  return false;
}

CreateResult CreateOrchestrator::Create(const CreateRequest& request) {
  CreateResult result;

  std::string plan_error;
  if (!ValidateCreationPlan(Plan(), plan_error)) {
    result.error = "create plan is out of dependency order: " + plan_error;
    logger_.Error("create plan rejected", {{"error", plan_error}});
    return result;
  }

  if (!ValidatePrefix(request.prefix, result.error)) {
    return result;
  }

  logger_.Info("create started", {{"region", request.region},
                                  {"backend", client_.BackendName()},
                                  {"steps", std::to_string(steps_.size())}});

  for (std::size_t i = 0; i < steps_.size(); ++i) {
    const Step& step = steps_[i];
    logger_.Info("create step started",
                 {{"step", step.name}, {"index", std::to_string(i + 1U)}});

    std::string step_error;
    if (!step.run(request, result.created, step_error)) {
      result.failed_step = step.name;
      result.error = step_error;
      logger_.Error("create step failed; earlier resources are left in place",
                    {{"step", step.name}, {"error", step_error}});
      return result;
    }

    result.completed_steps.push_back(step.name);
    logger_.Info("create step completed", {{"step", step.name}});
  }

  result.success = true;
  logger_.Info("create completed", {{"vpc_id", result.created.vpc_id}});
  return result;
}

bool CreateOrchestrator::Tag(const std::string& resource_id, const std::string& name,
                             std::string& error) {
  RetryingTagger tagger(client_, sleeper_, logger_, tag_delay_unit_);
  cloud::CloudError cloud_error;
  if (!tagger.TagName(resource_id, name, cloud_error)) {
    return FailCall("tag " + resource_id + " as " + name, cloud_error, error);
  }
  return true;
}

bool CreateOrchestrator::AddDefaultRoute(const cloud::RouteSpec& route, std::string& error) {
  cloud::CloudError cloud_error;
  if (client_.CreateRoute(route, cloud_error)) {
    return true;
  }
  // The only duplicate CreateRoute reports is RouteAlreadyExists.
  if (cloud::IsDuplicateError(cloud_error)) {
    logger_.Info("default route already present",
                 {{"route_table_id", route.route_table_id},
                  {"destination", route.destination_cidr_block}});
    return true;
  }
  return FailCall("create route in " + route.route_table_id, cloud_error, error);
}

bool CreateOrchestrator::CreateNetwork(const CreateRequest& request, CreatedTopology& created,
                                       std::string& error) {
  cloud::CloudError cloud_error;
  if (!client_.CreateVpc(request.config.vpc_cidr, created.vpc_id, cloud_error)) {
    return FailCall("create vpc", cloud_error, error);
  }
  if (!Tag(created.vpc_id, VpcName(request.prefix), error)) {
    return false;
  }
  out_ << "VPC: " << created.vpc_id << '\n';
  return true;
}

bool CreateOrchestrator::CreateSubnets(const CreateRequest& request, CreatedTopology& created,
                                       std::string& error) {
  const TopologyConfig& config = request.config;
  cloud::CloudError cloud_error;

  if (!client_.CreateSubnet(created.vpc_id, config.public_subnet_cidr,
                            request.region + config.public_az_suffix, created.public_subnet_id,
                            cloud_error)) {
    return FailCall("create public subnet", cloud_error, error);
  }
  if (!Tag(created.public_subnet_id, ResourceName(request.prefix, kRolePublicSubnet), error)) {
    return false;
  }

  if (!client_.CreateSubnet(created.vpc_id, config.private_subnet_cidr,
                            request.region + config.private_az_suffix,
                            created.private_subnet_id, cloud_error)) {
    return FailCall("create private subnet", cloud_error, error);
  }
  if (!Tag(created.private_subnet_id, ResourceName(request.prefix, kRolePrivateSubnet), error)) {
    return false;
  }
  out_ << "Subnets: " << created.public_subnet_id << ' ' << created.private_subnet_id << '\n';

  if (!client_.SetSubnetMapPublicIpOnLaunch(created.public_subnet_id, true, cloud_error)) {
    return FailCall("enable public IP on launch", cloud_error, error);
  }
  return true;
}

bool CreateOrchestrator::CreateInternetGateway(const CreateRequest& request,
                                               CreatedTopology& created, std::string& error) {
  cloud::CloudError cloud_error;
  if (!client_.CreateInternetGateway(created.internet_gateway_id, cloud_error)) {
    return FailCall("create internet gateway", cloud_error, error);
  }
  if (!client_.AttachInternetGateway(created.internet_gateway_id, created.vpc_id, cloud_error)) {
    return FailCall("attach internet gateway", cloud_error, error);
  }
  if (!Tag(created.internet_gateway_id, ResourceName(request.prefix, kRoleInternetGateway),
           error)) {
    return false;
  }
  out_ << "IGW: " << created.internet_gateway_id << '\n';
  return true;
}

bool CreateOrchestrator::CreateNatGateway(const CreateRequest& request, CreatedTopology& created,
                                          std::string& error) {
  cloud::CloudError cloud_error;
  cloud::Address address;
  if (!client_.AllocateAddress(address, cloud_error)) {
    return FailCall("allocate address", cloud_error, error);
  }
  created.allocation_id = address.allocation_id;

  if (!client_.CreateNatGateway(created.public_subnet_id, created.allocation_id,
                                created.nat_gateway_id, cloud_error)) {
    return FailCall("create nat gateway", cloud_error, error);
  }
  if (!Tag(created.nat_gateway_id, ResourceName(request.prefix, kRoleNatGateway), error)) {
    return false;
  }
  out_ << "NATGW: " << created.nat_gateway_id << '\n';

  // The private default route targets this gateway and is rejected until the
  // gateway is available.
  const cloud::WaitResult waited = cloud::WaitForNatGatewaysAvailable(
      client_, {created.nat_gateway_id}, request.config.waiter, sleeper_, logger_);
  if (!waited.satisfied) {
    error = waited.error;
    return false;
  }
  return true;
}

bool CreateOrchestrator::CreateRouting(const CreateRequest& request, CreatedTopology& created,
                                       std::string& error) {
  cloud::CloudError cloud_error;
  std::vector<cloud::RouteTable> tables;
  cloud::DescribeQuery query;
  query.vpc_id = created.vpc_id;
  if (!client_.DescribeRouteTables(query, tables, cloud_error)) {
    return FailCall("describe route tables", cloud_error, error);
  }
  for (const auto& table : tables) {
    if (table.IsMain()) {
      created.public_route_table_id = table.route_table_id;
      break;
    }
  }
  if (created.public_route_table_id.empty()) {
    error = "vpc " + created.vpc_id + " has no main route table";
    return false;
  }

  // The main table doubles as the public table.
  if (!Tag(created.public_route_table_id, ResourceName(request.prefix, kRoleMainRouteTable),
           error)) {
    return false;
  }
  std::string association_id;
  if (!client_.AssociateRouteTable(created.public_route_table_id, created.public_subnet_id,
                                   association_id, cloud_error)) {
    return FailCall("associate main route table", cloud_error, error);
  }
  if (!AddDefaultRoute({.route_table_id = created.public_route_table_id,
                        .destination_cidr_block = std::string(kDefaultRouteCidr),
                        .gateway_id = created.internet_gateway_id,
                        .nat_gateway_id = ""},
                       error)) {
    return false;
  }

  if (!client_.CreateRouteTable(created.vpc_id, created.private_route_table_id, cloud_error)) {
    return FailCall("create private route table", cloud_error, error);
  }
  if (!Tag(created.private_route_table_id, ResourceName(request.prefix, kRolePrivateRouteTable),
           error)) {
    return false;
  }
  if (!client_.AssociateRouteTable(created.private_route_table_id, created.private_subnet_id,
                                   association_id, cloud_error)) {
    return FailCall("associate private route table", cloud_error, error);
  }
  if (!AddDefaultRoute({.route_table_id = created.private_route_table_id,
                        .destination_cidr_block = std::string(kDefaultRouteCidr),
                        .gateway_id = "",
                        .nat_gateway_id = created.nat_gateway_id},
                       error)) {
    return false;
  }

  out_ << "RouteTables: " << created.public_route_table_id << ' '
       << created.private_route_table_id << '\n';
  return true;
}

bool CreateOrchestrator::CreateSecurityGroups(const CreateRequest& request,
                                              CreatedTopology& created, std::string& error) {
  cloud::CloudError cloud_error;

  const std::string public_name = ResourceName(request.prefix, kRolePublicSecurityGroup);
  if (!client_.CreateSecurityGroup(public_name, "Public SG", created.vpc_id,
                                   created.public_security_group_id, cloud_error)) {
    return FailCall("create public security group", cloud_error, error);
  }
  if (!Tag(created.public_security_group_id, public_name, error)) {
    return false;
  }
  if (!client_.AuthorizeSecurityGroupIngress(created.public_security_group_id,
                                             SshFromCidr(request.config.ssh_cidr), cloud_error)) {
    return FailCall("authorize ssh on public security group", cloud_error, error);
  }
  out_ << "SecurityGroup Public: " << created.public_security_group_id << '\n';

  const std::string private_name = ResourceName(request.prefix, kRolePrivateSecurityGroup);
  if (!client_.CreateSecurityGroup(private_name, "Private SG", created.vpc_id,
                                   created.private_security_group_id, cloud_error)) {
    return FailCall("create private security group", cloud_error, error);
  }
  if (!Tag(created.private_security_group_id, private_name, error)) {
    return false;
  }
  // SSH reaches private hosts only by hopping through the public group.
  if (!client_.AuthorizeSecurityGroupIngress(created.private_security_group_id,
                                             SshFromGroup(created.public_security_group_id),
                                             cloud_error)) {
    return FailCall("authorize ssh on private security group", cloud_error, error);
  }
  out_ << "SecurityGroup Private: " << created.private_security_group_id << '\n';
  return true;
}

bool CreateOrchestrator::LaunchInstances(const CreateRequest& request, CreatedTopology& created,
                                         std::string& error) {
  const TopologyConfig& config = request.config;
  const auto launch = [&](const std::string& subnet_id, const std::string& group_id,
                          std::string_view role, std::string& instance_id) {
    cloud::RunInstanceRequest run;
    run.image_id = config.image_id;
    run.instance_type = config.instance_type;
    run.key_name = request.key_name;
    run.subnet_id = subnet_id;
    run.security_group_ids = {group_id};
    run.user_data = config.user_data;
    run.tags = {{.key = std::string(cloud::kNameTagKey),
                 .value = ResourceName(request.prefix, role)}};

    cloud::Instance instance;
    cloud::CloudError cloud_error;
    if (!client_.RunInstance(run, instance, cloud_error)) {
      return FailCall("run " + std::string(role) + " instance", cloud_error, error);
    }
    instance_id = instance.instance_id;
    logger_.Info("instance launched", {{"instance_id", instance_id}, {"role", role}});
    return true;
  };

  if (!launch(created.public_subnet_id, created.public_security_group_id, kRolePublicInstance,
              created.public_instance_id)) {
    return false;
  }
  if (!launch(created.private_subnet_id, created.private_security_group_id, kRolePrivateInstance,
              created.private_instance_id)) {
    return false;
  }
  out_ << "EC2: " << created.public_instance_id << ' ' << created.private_instance_id << '\n';
  return true;
}

} // namespace netstack::topology
