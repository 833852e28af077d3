#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace netstack::topology {

// Resource kinds of one topology, in canonical creation order. Network
// interfaces are never created directly; instances and NAT gateways bring
// their own.
enum class ResourceKind {
  kVpc,
  kSubnet,
  kInternetGateway,
  kExternalAddress,
  kNatGateway,
  kRouteTable,
  kSecurityGroup,
  kInstance,
  kNetworkInterface,
};

const char* ToString(ResourceKind kind);

// Created only as a side effect of another kind.
bool IsImplicitKind(ResourceKind kind);

// `dependent` needs `dependency` to exist.
//
// `blocks_teardown` marks edges the provider enforces on deletion: the
// dependency cannot be deleted while the dependent exists. Route targets are
// the exception: a route to a deleted gateway turns into a blackhole route,
// so it orders creation only.
struct Dependency {
  ResourceKind dependent;
  ResourceKind dependency;
  bool blocks_teardown = true;
};

// The fixed dependency structure of the topology.
const std::vector<Dependency>& Dependencies();

// Canonical forward order used by create. Excludes implicit kinds.
const std::vector<ResourceKind>& CreationOrder();

// Canonical reverse order used by teardown. Includes network interfaces,
// which teardown removes explicitly when they outlive their owner.
const std::vector<ResourceKind>& TeardownOrder();

// A creation plan is valid when every kind comes after all of its
// dependencies (both edge types). Implicit kinds may not appear.
bool ValidateCreationPlan(const std::vector<ResourceKind>& plan, std::string& error);

// A teardown plan is valid when every kind comes before each dependency it
// blocks. Kinds may repeat (a step can touch several kinds); the last
// position of a dependent and the first position of its dependency count.
bool ValidateTeardownPlan(const std::vector<ResourceKind>& plan, std::string& error);

} // namespace netstack::topology
