#pragma once

#include "cloud/waiter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace netstack::topology {

// Layout knobs of one topology. Defaults reproduce the stock two-tier layout
// (one /16 network, one public and one private /24 in different zones).
struct TopologyConfig {
  std::string vpc_cidr = "10.0.0.0/16";
  std::string public_subnet_cidr = "10.0.1.0/24";
  std::string private_subnet_cidr = "10.0.2.0/24";
  // Zone = region + suffix, e.g. us-west-1 + "a" -> us-west-1a.
  std::string public_az_suffix = "a";
  std::string private_az_suffix = "c";
  std::string image_id = "ami-0b09bf4b909f29738";
  std::string instance_type = "t3.micro";
  std::string user_data = "#!/bin/bash\nyum update -y";
  std::string ssh_cidr = "0.0.0.0/0";
  cloud::WaitPolicy waiter;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

struct ConfigReport {
  bool valid = false;
  std::vector<ConfigIssue> issues;
};

// Applies overrides from JSON text on top of `config`.
//
// Contract:
// - Returns true when validation completed, even if the document had issues;
//   `config` is only modified when `report.valid` is true.
// - Unknown keys, wrong types and malformed CIDR blocks are issues.
// - Parse errors are reported as one issue under path `$`.
bool ApplyTopologyConfigText(std::string_view json_text, TopologyConfig& config,
                             ConfigReport& report, std::string& error);

// Loads and applies a config file. Returns false only when the file cannot be
// read.
bool ApplyTopologyConfigFile(const std::string& config_path, TopologyConfig& config,
                             ConfigReport& report, std::string& error);

// "a.b.c.d/n" with octets <= 255 and 0 <= n <= 32.
bool IsValidIpv4Cidr(std::string_view text);

std::string FormatConfigIssues(const ConfigReport& report);

} // namespace netstack::topology
