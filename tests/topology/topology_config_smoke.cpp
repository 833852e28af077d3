#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "topology/topology_config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using netstack::topology::ConfigReport;
using netstack::topology::TopologyConfig;
using netstack::tests::common::AssertContains;
using netstack::tests::common::Fail;

ConfigReport Apply(std::string_view text, TopologyConfig& config) {
  ConfigReport report;
  std::string error;
  if (!netstack::topology::ApplyTopologyConfigText(text, config, report, error)) {
    Fail("validation did not complete: " + error);
  }
  return report;
}

void ExpectDefaults() {
  const TopologyConfig config;
  if (config.vpc_cidr != "10.0.0.0/16" || config.public_subnet_cidr != "10.0.1.0/24" ||
      config.private_subnet_cidr != "10.0.2.0/24") {
    Fail("default address plan changed");
  }
  if (config.public_az_suffix != "a" || config.private_az_suffix != "c") {
    Fail("default zone suffixes changed");
  }
  if (config.image_id != "ami-0b09bf4b909f29738" || config.instance_type != "t3.micro") {
    Fail("default instance shape changed");
  }
  if (config.ssh_cidr != "0.0.0.0/0") {
    Fail("default SSH source changed");
  }
  if (config.waiter.poll_interval != std::chrono::seconds(15) ||
      config.waiter.max_attempts != 40U) {
    Fail("default waiter budget changed");
  }
}

void ExpectOverridesApplied() {
  TopologyConfig config;
  const ConfigReport report = Apply(R"({
    "vpc_cidr": "172.16.0.0/16",
    "public_subnet_cidr": "172.16.10.0/24",
    "private_subnet_cidr": "172.16.20.0/24",
    "public_az_suffix": "b",
    "image_id": "ami-1234567890abcdef0",
    "ssh_cidr": "203.0.113.7/32",
    "waiter": {"poll_interval_ms": 500, "max_attempts": 6}
  })",
                                    config);
  if (!report.valid || !report.issues.empty()) {
    Fail("valid overrides reported issues: " + netstack::topology::FormatConfigIssues(report));
  }
  if (config.vpc_cidr != "172.16.0.0/16" || config.public_az_suffix != "b" ||
      config.ssh_cidr != "203.0.113.7/32" || config.image_id != "ami-1234567890abcdef0") {
    Fail("overrides were not applied");
  }
  // Keys that were not mentioned keep their defaults.
  if (config.private_az_suffix != "c" || config.instance_type != "t3.micro") {
    Fail("unmentioned keys must keep their values");
  }
  if (config.waiter.poll_interval != std::chrono::milliseconds(500) ||
      config.waiter.max_attempts != 6U) {
    Fail("waiter overrides were not applied");
  }
}

void ExpectIssuesLeaveConfigUntouched() {
  TopologyConfig config;
  const ConfigReport report = Apply(R"({
    "vpc_cidr": "10.0.0.0/33",
    "image_id": 42,
    "instance_type": "",
    "subnet_count": 3,
    "waiter": {"poll_interval_ms": -1, "max_attempts": 0, "jitter": true}
  })",
                                    config);
  if (report.valid) {
    Fail("invalid config reported valid");
  }
  const std::string issues = netstack::topology::FormatConfigIssues(report);
  AssertContains(issues, "vpc_cidr: must be an IPv4 CIDR block");
  AssertContains(issues, "image_id: must be a string, got number");
  AssertContains(issues, "instance_type: must not be empty");
  AssertContains(issues, "subnet_count: is not a recognized topology setting");
  AssertContains(issues, "waiter.poll_interval_ms: must be a non-negative integer");
  AssertContains(issues, "waiter.max_attempts: must be a positive integer");
  AssertContains(issues, "waiter.jitter: is not a recognized waiter setting");

  if (config.vpc_cidr != "10.0.0.0/16" || config.image_id != "ami-0b09bf4b909f29738") {
    Fail("an invalid document must not modify the config");
  }

  TopologyConfig clash;
  const ConfigReport clash_report = Apply(
      R"({"private_subnet_cidr": "10.0.1.0/24", "private_az_suffix": "a"})", clash);
  const std::string clash_issues = netstack::topology::FormatConfigIssues(clash_report);
  AssertContains(clash_issues, "private_subnet_cidr: must differ from public_subnet_cidr");
  AssertContains(clash_issues, "private_az_suffix: must differ from public_az_suffix");

  TopologyConfig syntax;
  const ConfigReport syntax_report = Apply("{\"vpc_cidr\": ", syntax);
  if (syntax_report.valid || syntax_report.issues.size() != 1U ||
      syntax_report.issues.front().path != "$") {
    Fail("syntax errors are reported as one root issue");
  }

  TopologyConfig not_object;
  const ConfigReport array_report = Apply("[1, 2]", not_object);
  AssertContains(netstack::topology::FormatConfigIssues(array_report),
                 "$: root JSON value must be an object");
}

void ExpectCidrValidation() {
  for (const char* good : {"0.0.0.0/0", "10.0.0.0/16", "255.255.255.255/32", "192.168.1.0/24"}) {
    if (!netstack::topology::IsValidIpv4Cidr(good)) {
      Fail(std::string("expected valid CIDR: ") + good);
    }
  }
  for (const char* bad : {"", "10.0.0.0", "10.0.0/16", "10.0.0.0/", "10.0.0.256/24",
                          "10.0.0.0/33", "10.0.0.0.0/8", "a.b.c.d/8", "10.0.0.0/1x"}) {
    if (netstack::topology::IsValidIpv4Cidr(bad)) {
      Fail(std::string("expected invalid CIDR: ") + bad);
    }
  }
}

void ExpectFileLoading() {
  const netstack::tests::common::ScopedTempDir temp_dir("netstack-topology-config");
  const fs::path& root = temp_dir.path();

  TopologyConfig config;
  ConfigReport report;
  std::string error;
  if (netstack::topology::ApplyTopologyConfigFile((root / "absent.json").string(), config,
                                                  report, error)) {
    Fail("a missing config file is a read failure");
  }

  {
    std::ofstream out(root / "empty.json", std::ios::binary);
  }
  if (!netstack::topology::ApplyTopologyConfigFile((root / "empty.json").string(), config,
                                                   report, error) ||
      report.valid) {
    Fail("an empty config file is an invalid document");
  }
  AssertContains(netstack::topology::FormatConfigIssues(report), "config file is empty");

  {
    std::ofstream out(root / "fang.json", std::ios::binary);
    out << R"({"instance_type": "t3.small"})";
  }
  if (!netstack::topology::ApplyTopologyConfigFile((root / "fang.json").string(), config, report,
                                                   error) ||
      !report.valid || config.instance_type != "t3.small") {
    Fail("valid config file was not applied");
  }

}

} // namespace

int main() {
  ExpectDefaults();
  ExpectOverridesApplied();
  ExpectIssuesLeaveConfigUntouched();
  ExpectCidrValidation();
  ExpectFileLoading();

  std::cout << "topology_config_smoke: ok\n";
  return 0;
}
