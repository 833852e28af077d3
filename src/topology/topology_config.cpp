#include "topology/topology_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace netstack::topology {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ConfigReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool ParseDecimal(std::string_view text, std::uint32_t max_value, std::uint32_t& out) {
  if (text.empty() || text.size() > 3U) {
    return false;
  }
  std::uint32_t value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10U + static_cast<std::uint32_t>(c - '0');
  }
  if (value > max_value) {
    return false;
  }
  out = value;
  return true;
}

void ApplyString(const JsonValue& root, std::string_view key, std::string& target,
                 ConfigReport& report) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return;
  }
  if (!field->IsString()) {
    AddIssue(report, std::string(key),
             std::string("must be a string, got ") + core::json::TypeName(field->type));
    return;
  }
  if (field->string_value.empty()) {
    AddIssue(report, std::string(key), "must not be empty");
    return;
  }
  target = field->string_value;
}

void ApplyCidr(const JsonValue& root, std::string_view key, std::string& target,
               ConfigReport& report) {
  std::string value = target;
  const std::size_t issues_before = report.issues.size();
  ApplyString(root, key, value, report);
  if (report.issues.size() != issues_before) {
    return;
  }
  if (!IsValidIpv4Cidr(value)) {
    AddIssue(report, std::string(key), "must be an IPv4 CIDR block such as 10.0.0.0/16");
    return;
  }
  target = value;
}

void ApplyWaiter(const JsonValue& root, cloud::WaitPolicy& waiter, ConfigReport& report) {
  const JsonValue* section = root.Find("waiter");
  if (section == nullptr) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "waiter", "must be an object with poll_interval_ms and/or max_attempts");
    return;
  }

  for (const auto& [key, value] : section->object_value) {
    if (key == "poll_interval_ms") {
      std::uint64_t parsed = 0;
      if (!core::json::TryGetUnsigned(value, parsed)) {
        AddIssue(report, "waiter.poll_interval_ms", "must be a non-negative integer");
        continue;
      }
      waiter.poll_interval = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
    } else if (key == "max_attempts") {
      std::uint64_t parsed = 0;
      if (!core::json::TryGetUnsigned(value, parsed) || parsed == 0U ||
          parsed > std::numeric_limits<std::uint32_t>::max()) {
        AddIssue(report, "waiter.max_attempts", "must be a positive integer");
        continue;
      }
      waiter.max_attempts = static_cast<std::uint32_t>(parsed);
    } else {
      AddIssue(report, "waiter." + key, "is not a recognized waiter setting");
    }
  }
}

void ApplyConfigObject(const JsonValue& root, TopologyConfig& config, ConfigReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "root JSON value must be an object");
    return;
  }

  static constexpr std::string_view kKnownKeys[] = {
      "vpc_cidr",      "public_subnet_cidr", "private_subnet_cidr", "public_az_suffix",
      "private_az_suffix", "image_id",       "instance_type",       "user_data",
      "ssh_cidr",      "waiter",
  };
  for (const auto& [key, value] : root.object_value) {
    bool known = false;
    for (const std::string_view candidate : kKnownKeys) {
      if (candidate == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      AddIssue(report, key, "is not a recognized topology setting");
    }
  }

  ApplyCidr(root, "vpc_cidr", config.vpc_cidr, report);
  ApplyCidr(root, "public_subnet_cidr", config.public_subnet_cidr, report);
  ApplyCidr(root, "private_subnet_cidr", config.private_subnet_cidr, report);
  ApplyString(root, "public_az_suffix", config.public_az_suffix, report);
  ApplyString(root, "private_az_suffix", config.private_az_suffix, report);
  ApplyString(root, "image_id", config.image_id, report);
  ApplyString(root, "instance_type", config.instance_type, report);
  ApplyString(root, "user_data", config.user_data, report);
  ApplyCidr(root, "ssh_cidr", config.ssh_cidr, report);
  ApplyWaiter(root, config.waiter, report);

  if (config.public_subnet_cidr == config.private_subnet_cidr) {
    AddIssue(report, "private_subnet_cidr", "must differ from public_subnet_cidr");
  }
  if (config.public_az_suffix == config.private_az_suffix) {
    AddIssue(report, "private_az_suffix",
             "must differ from public_az_suffix; the subnets need distinct zones");
  }
}

} // namespace

bool IsValidIpv4Cidr(std::string_view text) {
  const std::size_t slash = text.find('/');
  if (slash == std::string_view::npos) {
    return false;
  }
  std::uint32_t prefix_length = 0;
  if (!ParseDecimal(text.substr(slash + 1U), 32U, prefix_length)) {
    return false;
  }

  std::string_view address = text.substr(0, slash);
  for (int octet = 0; octet < 4; ++octet) {
    const std::size_t dot = address.find('.');
    const std::string_view part = octet == 3 ? address : address.substr(0, dot);
    if (octet < 3 && dot == std::string_view::npos) {
      return false;
    }
    std::uint32_t value = 0;
    if (!ParseDecimal(part, 255U, value)) {
      return false;
    }
    if (octet < 3) {
      address.remove_prefix(dot + 1U);
    }
  }
  return true;
}

bool ApplyTopologyConfigText(std::string_view json_text, TopologyConfig& config,
                             ConfigReport& report, std::string& error) {
  error.clear();
  report = ConfigReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error + " (fix JSON syntax and rerun with --config <file.json>)");
    report.valid = false;
    return true;
  }

  TopologyConfig candidate = config;
  ApplyConfigObject(root, candidate, report);
  report.valid = report.issues.empty();
  if (report.valid) {
    config = std::move(candidate);
  }
  return true;
}

bool ApplyTopologyConfigFile(const std::string& config_path, TopologyConfig& config,
                             ConfigReport& report, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    return false;
  }
  if (contents.empty()) {
    report = ConfigReport{};
    AddIssue(report, "$", "config file is empty; provide a JSON object");
    report.valid = false;
    return true;
  }
  return ApplyTopologyConfigText(contents, config, report, error);
}

std::string FormatConfigIssues(const ConfigReport& report) {
  std::string text;
  for (const auto& issue : report.issues) {
    if (!text.empty()) {
      text += "; ";
    }
    text += issue.path + ": " + issue.message;
  }
  return text;
}

} // namespace netstack::topology
