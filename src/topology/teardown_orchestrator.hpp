#pragma once

#include "cloud/cloud_client.hpp"
#include "cloud/waiter.hpp"
#include "topology/resource_graph.hpp"
#include "topology/teardown_report.hpp"
#include "topology/topology_resolver.hpp"

#include <functional>
#include <iosfwd>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace netstack::core::logging {
class Logger;
}

namespace netstack::topology {

// Best-effort reverse teardown of one topology.
//
// Every provider call becomes one TeardownAction in the report. A failed
// action is recorded and the run moves on: siblings within a step are
// independent, and later steps still run so that one stuck resource does not
// strand everything behind it. A second run over an already removed topology
// resolves nothing and does nothing.
class TeardownOrchestrator {
public:
  using StepFunction = std::function<void(const TopologyHandle&, TeardownReport&)>;

  struct Step {
    std::string name;
    // Kinds this step removes, in order.
    std::vector<ResourceKind> kinds;
    StepFunction run;
  };

  TeardownOrchestrator(cloud::ICloudClient& client, cloud::Sleeper sleeper,
                       core::logging::Logger& logger, std::ostream& out,
                       cloud::WaitPolicy waiter = {});

  const std::vector<Step>& steps() const {
    return steps_;
  }

  std::vector<ResourceKind> Plan() const;

  // Runs the named step alone. Returns false only for an unknown name.
  bool RunStep(std::string_view name, const TopologyHandle& handle, TeardownReport& report,
               std::string& error);

  // Resolves `<prefix>-vpc` and tears it down.
  //
  // Contract:
  // - not found: returns true with `report.topology_found == false`
  // - ambiguous prefix or failed lookup: returns false, touches nothing;
  //   `status` tells the two apart and `error` lists the matching VPC IDs
  // - otherwise returns true; individual failures are in `report.actions`
  bool Teardown(const std::string& region, const std::string& prefix, TeardownReport& report,
                ResolveStatus& status, std::string& error);

  // Runs every step against an already resolved topology.
  void TeardownResolved(const TopologyHandle& handle, TeardownReport& report);

private:
  void TerminateInstances(const TopologyHandle& handle, TeardownReport& report);
  void DeleteNatGateways(const TopologyHandle& handle, TeardownReport& report);
  void ReleaseAddresses(const TopologyHandle& handle, TeardownReport& report);
  void DeleteInternetGateways(const TopologyHandle& handle, TeardownReport& report);
  void DeleteRouteTables(const TopologyHandle& handle, TeardownReport& report);
  void DeleteSubnets(const TopologyHandle& handle, TeardownReport& report);
  void DeleteSecurityGroups(const TopologyHandle& handle, TeardownReport& report);
  void DeleteNetwork(const TopologyHandle& handle, TeardownReport& report);

  // Appends one action. NotFound errors count as skipped. Returns true when
  // the resource is gone (succeeded or skipped).
  bool RecordCall(TeardownReport& report, std::string_view step, std::string action,
                  std::string resource_id, bool ok, const cloud::CloudError& error);
  void RecordWait(TeardownReport& report, std::string_view step, std::string action,
                  std::string resource_id, const cloud::WaitResult& result);

  cloud::ICloudClient& client_;
  cloud::Sleeper sleeper_;
  core::logging::Logger& logger_;
  std::ostream& out_;
  cloud::WaitPolicy waiter_;
  std::vector<Step> steps_;
  // Allocations held by the NAT gateways deleted in this run. Their interface
  // disappears with the gateway, so the address step releases them by ID.
  std::set<std::string> nat_allocation_ids_;
};

} // namespace netstack::topology
