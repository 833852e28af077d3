#pragma once

#include "cloud/cloud_client.hpp"
#include "topology/topology_resolver.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace netstack::core::logging {
class Logger;
}

namespace netstack::collect {

struct CollectRequest {
  std::string region;
  std::string prefix;
  std::filesystem::path output_dir = ".";
};

struct CollectResult {
  // Set once the VPC lookup itself succeeded; `status` is meaningful only
  // then.
  bool lookup_completed = false;
  topology::ResolveStatus status = topology::ResolveStatus::kNotFound;
  std::vector<std::filesystem::path> written_files;
};

// Writes `<prefix>-caller-identity.json`, then resolves the topology and
// writes `<prefix>-instances.json`, `<prefix>-subnets.json` and
// `<prefix>-route-tables.json` scoped to its VPC. Each file holds the
// backend's response document byte for byte. Prints `Saved: <file>` to `out`
// after each file.
//
// Returns false on any failure, including a prefix that matches no VPC or
// more than one; `result.status` tells those apart from provider failures.
bool CollectSnapshots(cloud::ICloudClient& client, const CollectRequest& request,
                      std::ostream& out, core::logging::Logger& logger, CollectResult& result,
                      std::string& error);

} // namespace netstack::collect
