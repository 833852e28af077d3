#include "topology/resource_graph.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>

namespace netstack::topology {

namespace {

constexpr std::array<ResourceKind, 9> kAllKinds = {
    ResourceKind::kVpc,          ResourceKind::kSubnet,           ResourceKind::kInternetGateway,
    ResourceKind::kExternalAddress, ResourceKind::kNatGateway,    ResourceKind::kRouteTable,
    ResourceKind::kSecurityGroup, ResourceKind::kInstance,        ResourceKind::kNetworkInterface,
};

std::optional<std::size_t> FirstIndex(const std::vector<ResourceKind>& plan, ResourceKind kind) {
  const auto it = std::find(plan.begin(), plan.end(), kind);
  if (it == plan.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - plan.begin());
}

std::optional<std::size_t> LastIndex(const std::vector<ResourceKind>& plan, ResourceKind kind) {
  const auto it = std::find(plan.rbegin(), plan.rend(), kind);
  if (it == plan.rend()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(plan.rend() - it - 1);
}

} // namespace

const char* ToString(ResourceKind kind) {
  switch (kind) {
  case ResourceKind::kVpc:
    return "vpc";
  case ResourceKind::kSubnet:
    return "subnet";
  case ResourceKind::kInternetGateway:
    return "internet_gateway";
  case ResourceKind::kExternalAddress:
    return "external_address";
  case ResourceKind::kNatGateway:
    return "nat_gateway";
  case ResourceKind::kRouteTable:
    return "route_table";
  case ResourceKind::kSecurityGroup:
    return "security_group";
  case ResourceKind::kInstance:
    return "instance";
  case ResourceKind::kNetworkInterface:
    return "network_interface";
  }
  return "unknown";
}

bool IsImplicitKind(ResourceKind kind) {
  return kind == ResourceKind::kNetworkInterface;
}

const std::vector<Dependency>& Dependencies() {
  using K = ResourceKind;
  static const std::vector<Dependency> kDependencies = {
      {.dependent = K::kSubnet, .dependency = K::kVpc},
      {.dependent = K::kInternetGateway, .dependency = K::kVpc},
      // An external address is only reachable through an attached gateway;
      // the gateway cannot be detached while addresses are mapped.
      {.dependent = K::kExternalAddress, .dependency = K::kInternetGateway},
      {.dependent = K::kNatGateway, .dependency = K::kSubnet},
      {.dependent = K::kNatGateway, .dependency = K::kExternalAddress},
      {.dependent = K::kNatGateway, .dependency = K::kNetworkInterface},
      {.dependent = K::kRouteTable, .dependency = K::kVpc},
      {.dependent = K::kRouteTable, .dependency = K::kSubnet},
      {.dependent = K::kRouteTable, .dependency = K::kInternetGateway, .blocks_teardown = false},
      {.dependent = K::kRouteTable, .dependency = K::kNatGateway, .blocks_teardown = false},
      {.dependent = K::kSecurityGroup, .dependency = K::kVpc},
      {.dependent = K::kInstance, .dependency = K::kSubnet},
      {.dependent = K::kInstance, .dependency = K::kSecurityGroup},
      {.dependent = K::kInstance, .dependency = K::kNetworkInterface},
      // Private instances need their NAT route at boot to install packages.
      {.dependent = K::kInstance, .dependency = K::kRouteTable, .blocks_teardown = false},
      {.dependent = K::kNetworkInterface, .dependency = K::kSubnet},
  };
  return kDependencies;
}

const std::vector<ResourceKind>& CreationOrder() {
  using K = ResourceKind;
  static const std::vector<ResourceKind> kOrder = {
      K::kVpc,        K::kSubnet,     K::kInternetGateway, K::kExternalAddress,
      K::kNatGateway, K::kRouteTable, K::kSecurityGroup,   K::kInstance,
  };
  return kOrder;
}

const std::vector<ResourceKind>& TeardownOrder() {
  using K = ResourceKind;
  static const std::vector<ResourceKind> kOrder = {
      K::kInstance,   K::kNatGateway,       K::kExternalAddress, K::kInternetGateway,
      K::kRouteTable, K::kNetworkInterface, K::kSubnet,          K::kSecurityGroup,
      K::kVpc,
  };
  return kOrder;
}

bool ValidateCreationPlan(const std::vector<ResourceKind>& plan, std::string& error) {
  error.clear();
  for (const ResourceKind kind : kAllKinds) {
    const auto count = std::count(plan.begin(), plan.end(), kind);
    if (IsImplicitKind(kind)) {
      if (count != 0) {
        error = std::string(ToString(kind)) + " is created implicitly and cannot be planned";
        return false;
      }
      continue;
    }
    if (count != 1) {
      error = std::string(ToString(kind)) + " must appear exactly once in a creation plan";
      return false;
    }
  }

  for (const auto& edge : Dependencies()) {
    if (IsImplicitKind(edge.dependent) || IsImplicitKind(edge.dependency)) {
      continue;
    }
    if (*FirstIndex(plan, edge.dependency) > *FirstIndex(plan, edge.dependent)) {
      error = std::string(ToString(edge.dependent)) + " is created before its dependency " +
              ToString(edge.dependency);
      return false;
    }
  }
  return true;
}

bool ValidateTeardownPlan(const std::vector<ResourceKind>& plan, std::string& error) {
  error.clear();
  for (const ResourceKind kind : kAllKinds) {
    if (!FirstIndex(plan, kind).has_value()) {
      error = std::string(ToString(kind)) + " is never torn down";
      return false;
    }
  }

  for (const auto& edge : Dependencies()) {
    if (!edge.blocks_teardown) {
      continue;
    }
    if (*LastIndex(plan, edge.dependent) > *FirstIndex(plan, edge.dependency)) {
      error = std::string(ToString(edge.dependency)) + " is torn down while dependent " +
              ToString(edge.dependent) + " may still exist";
      return false;
    }
  }
  return true;
}

} // namespace netstack::topology
