#include "topology/topology_resolver.hpp"

#include "cloud/error_mapper.hpp"
#include "core/logging/logger.hpp"
#include "topology/naming.hpp"

namespace netstack::topology {

const char* ToString(ResolveStatus status) {
  switch (status) {
  case ResolveStatus::kFound:
    return "found";
  case ResolveStatus::kNotFound:
    return "not_found";
  case ResolveStatus::kAmbiguous:
    return "ambiguous";
  }
  return "not_found";
}

bool ResolveTopology(cloud::ICloudClient& client, const std::string& region,
                     const std::string& prefix, ResolveResult& result, cloud::CloudError& error,
                     core::logging::Logger& logger) {
  result = ResolveResult{};
  error.Clear();

  const std::string vpc_name = VpcName(prefix);
  std::vector<cloud::Vpc> vpcs;
  if (!client.DescribeVpcs({.ids = {}, .vpc_id = {}, .subnet_id = {}, .name_tag = vpc_name}, vpcs,
                           error)) {
    logger.Error("topology lookup failed",
                 {{"vpc_name", vpc_name},
                  {"error", cloud::FormatCloudFailure("describe vpcs", error)}});
    return false;
  }

  for (const auto& vpc : vpcs) {
    result.matching_vpc_ids.push_back(vpc.vpc_id);
  }

  if (vpcs.empty()) {
    result.status = ResolveStatus::kNotFound;
    logger.Info("no topology found", {{"vpc_name", vpc_name}, {"region", region}});
    return true;
  }
  if (vpcs.size() > 1U) {
    result.status = ResolveStatus::kAmbiguous;
    logger.Error("topology prefix is ambiguous",
                 {{"vpc_name", vpc_name}, {"matches", std::to_string(vpcs.size())}});
    return true;
  }

  result.status = ResolveStatus::kFound;
  result.handle = {.region = region,
                   .prefix = prefix,
                   .vpc_id = vpcs.front().vpc_id,
                   .vpc_cidr = vpcs.front().cidr_block};
  logger.Info("topology resolved", {{"vpc_id", result.handle.vpc_id}, {"region", region}});
  return true;
}

std::string FormatAmbiguousTopology(const ResolveResult& result, const std::string& region,
                                    const std::string& prefix) {
  std::string text = "prefix '" + prefix + "' matches " +
                     std::to_string(result.matching_vpc_ids.size()) + " VPCs named '" +
                     VpcName(prefix) + "' in " + region + ":";
  bool first = true;
  for (const auto& vpc_id : result.matching_vpc_ids) {
    text += first ? " " : ", ";
    text += vpc_id;
    first = false;
  }
  return text;
}

} // namespace netstack::topology
