#pragma once

#include "cloud/cloud_client.hpp"
#include "cloud/waiter.hpp"
#include "topology/resource_graph.hpp"
#include "topology/topology_config.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace netstack::core::logging {
class Logger;
}

namespace netstack::topology {

struct CreateRequest {
  std::string region;
  std::string prefix;
  std::string key_name;
  TopologyConfig config;
};

// IDs produced so far. Each step reads what earlier steps wrote and fills its
// own members, so a partially filled value describes what a failed create left
// behind.
struct CreatedTopology {
  std::string vpc_id;
  std::string public_subnet_id;
  std::string private_subnet_id;
  std::string internet_gateway_id;
  std::string allocation_id;
  std::string nat_gateway_id;
  std::string public_route_table_id;
  std::string private_route_table_id;
  std::string public_security_group_id;
  std::string private_security_group_id;
  std::string public_instance_id;
  std::string private_instance_id;
};

struct CreateResult {
  bool success = false;
  std::vector<std::string> completed_steps;
  std::string failed_step;
  std::string error;
  CreatedTopology created;
};

// Create runs these in order; there is no rollback. A failed step leaves
// every earlier resource live and stops the run.
class CreateOrchestrator {
public:
  using StepFunction = std::function<bool(const CreateRequest&, CreatedTopology&, std::string&)>;

  struct Step {
    std::string name;
    // Kinds this step brings into existence, in order.
    std::vector<ResourceKind> kinds;
    StepFunction run;
  };

  // `out` receives the `Label: id ...` lines a caller scripts against.
  // `tag_delay_unit` scales the tag retry backoff; tests pass zero.
  CreateOrchestrator(cloud::ICloudClient& client, cloud::Sleeper sleeper,
                     core::logging::Logger& logger, std::ostream& out,
                     std::chrono::milliseconds tag_delay_unit = std::chrono::seconds(1));

  const std::vector<Step>& steps() const {
    return steps_;
  }

  // Kinds of all steps flattened, in run order.
  std::vector<ResourceKind> Plan() const;

  // Runs the named step alone against `created`. Returns false with `error`
  // set when the step fails or the name is unknown.
  bool RunStep(std::string_view name, const CreateRequest& request, CreatedTopology& created,
               std::string& error);

  CreateResult Create(const CreateRequest& request);

private:
  bool CreateNetwork(const CreateRequest& request, CreatedTopology& created, std::string& error);
  bool CreateSubnets(const CreateRequest& request, CreatedTopology& created, std::string& error);
  bool CreateInternetGateway(const CreateRequest& request, CreatedTopology& created,
                             std::string& error);
  bool CreateNatGateway(const CreateRequest& request, CreatedTopology& created,
                        std::string& error);
  bool CreateRouting(const CreateRequest& request, CreatedTopology& created, std::string& error);
  bool CreateSecurityGroups(const CreateRequest& request, CreatedTopology& created,
                            std::string& error);
  bool LaunchInstances(const CreateRequest& request, CreatedTopology& created,
                       std::string& error);

  bool Tag(const std::string& resource_id, const std::string& name, std::string& error);
  bool AddDefaultRoute(const cloud::RouteSpec& route, std::string& error);

  cloud::ICloudClient& client_;
  cloud::Sleeper sleeper_;
  core::logging::Logger& logger_;
  std::ostream& out_;
  std::chrono::milliseconds tag_delay_unit_;
  std::vector<Step> steps_;
};

// Destination of the default route in both route tables.
inline constexpr std::string_view kDefaultRouteCidr = "0.0.0.0/0";

} // namespace netstack::topology
