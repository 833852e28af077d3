#include "collect/snapshot_exporter.hpp"

#include "cloud/error_mapper.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "topology/naming.hpp"

#include <ostream>

namespace fs = std::filesystem;

namespace netstack::collect {

namespace {

bool SaveSnapshot(const fs::path& output_dir, const std::string& file_name,
                  const std::string& json, std::ostream& out, core::logging::Logger& logger,
                  CollectResult& result, std::string& error) {
  const fs::path path = output_dir / file_name;
  if (!core::WriteTextFileAtomic(path, json, error)) {
    logger.Error("snapshot write failed", {{"path", path.string()}, {"error", error}});
    return false;
  }
  result.written_files.push_back(path);
  logger.Info("snapshot saved", {{"path", path.string()}});
  out << "Saved: " << path.string() << '\n';
  return true;
}

} // namespace

bool CollectSnapshots(cloud::ICloudClient& client, const CollectRequest& request,
                      std::ostream& out, core::logging::Logger& logger, CollectResult& result,
                      std::string& error) {
  result = CollectResult{};
  error.clear();
  cloud::CloudError cloud_error;

  // Identity first: it proves which account the rest of the export is from,
  // even when the topology lookup below comes up empty.
  std::string document;
  if (!client.GetCallerIdentityDocument(document, cloud_error)) {
    error = cloud::FormatCloudFailure("get caller identity", cloud_error);
    return false;
  }
  if (!SaveSnapshot(request.output_dir, request.prefix + "-caller-identity.json", document, out,
                    logger, result, error)) {
    return false;
  }

  topology::ResolveResult resolved;
  if (!topology::ResolveTopology(client, request.region, request.prefix, resolved, cloud_error,
                                 logger)) {
    error = cloud::FormatCloudFailure("describe vpcs", cloud_error);
    return false;
  }
  result.lookup_completed = true;
  result.status = resolved.status;
  if (resolved.status == topology::ResolveStatus::kNotFound) {
    error = "No VPC with Name tag '" + topology::VpcName(request.prefix) +
            "' found in region " + request.region + ".";
    return false;
  }
  if (resolved.status == topology::ResolveStatus::kAmbiguous) {
    error = topology::FormatAmbiguousTopology(resolved, request.region, request.prefix);
    return false;
  }

  cloud::DescribeQuery in_vpc;
  in_vpc.vpc_id = resolved.handle.vpc_id;

  if (!client.DescribeInstancesDocument(in_vpc, document, cloud_error)) {
    error = cloud::FormatCloudFailure("describe instances", cloud_error);
    return false;
  }
  if (!SaveSnapshot(request.output_dir, request.prefix + "-instances.json", document, out,
                    logger, result, error)) {
    return false;
  }

  if (!client.DescribeSubnetsDocument(in_vpc, document, cloud_error)) {
    error = cloud::FormatCloudFailure("describe subnets", cloud_error);
    return false;
  }
  if (!SaveSnapshot(request.output_dir, request.prefix + "-subnets.json", document, out, logger,
                    result, error)) {
    return false;
  }

  if (!client.DescribeRouteTablesDocument(in_vpc, document, cloud_error)) {
    error = cloud::FormatCloudFailure("describe route tables", cloud_error);
    return false;
  }
  return SaveSnapshot(request.output_dir, request.prefix + "-route-tables.json", document, out,
                      logger, result, error);
}

} // namespace netstack::collect
