#include "core/fs_utils.hpp"
#include "topology/teardown_report.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace {

netstack::topology::TeardownReport SampleReport() {
  using netstack::topology::ActionOutcome;
  netstack::topology::TeardownReport report;
  report.region = "us-west-1";
  report.prefix = "fang";
  report.vpc_id = "vpc-1";
  report.topology_found = true;
  report.started_at_utc = "2026-01-01T00:00:00.000Z";
  report.finished_at_utc = "2026-01-01T00:01:00.000Z";
  report.actions = {
      {.step = "instances",
       .action = "terminate instances",
       .resource_id = "i-1,i-2",
       .outcome = ActionOutcome::kSucceeded,
       .error = ""},
      {.step = "internet_gateways",
       .action = "delete internet gateway",
       .resource_id = "igw-1",
       .outcome = ActionOutcome::kSkippedNotFound,
       .error = "InvalidInternetGatewayID.NotFound: gone"},
      {.step = "route_tables",
       .action = "delete route table",
       .resource_id = "rtb-2",
       .outcome = ActionOutcome::kFailed,
       .error = "CLOUD_DEPENDENCY_VIOLATION: still \"associated\""},
      {.step = "vpc",
       .action = "delete vpc",
       .resource_id = "vpc-1",
       .outcome = ActionOutcome::kSucceeded,
       .error = ""},
  };
  return report;
}

} // namespace

TEST_CASE("TeardownReport counts outcomes", "[topology][teardown]") {
  const auto report = SampleReport();
  const auto counts = report.Counts();
  REQUIRE(counts.succeeded == 2U);
  REQUIRE(counts.skipped_not_found == 1U);
  REQUIRE(counts.failed == 1U);
  REQUIRE(report.HasFailures());
  REQUIRE(netstack::topology::FormatTeardownSummary(report) ==
          "teardown summary: succeeded=2 skipped_not_found=1 failed=1");

  netstack::topology::TeardownReport empty;
  REQUIRE_FALSE(empty.HasFailures());
  REQUIRE(netstack::topology::FormatTeardownSummary(empty) ==
          "teardown summary: succeeded=0 skipped_not_found=0 failed=0");
}

TEST_CASE("ActionOutcome maps to stable strings", "[topology][teardown]") {
  using netstack::topology::ActionOutcome;
  REQUIRE(std::string(netstack::topology::ToString(ActionOutcome::kSucceeded)) == "succeeded");
  REQUIRE(std::string(netstack::topology::ToString(ActionOutcome::kSkippedNotFound)) ==
          "skipped_not_found");
  REQUIRE(std::string(netstack::topology::ToString(ActionOutcome::kFailed)) == "failed");
}

TEST_CASE("TeardownReport JSON carries counts and per-action outcomes", "[topology][teardown]") {
  const std::string json = netstack::topology::TeardownReportToJson(SampleReport());
  REQUIRE(json.find("\"topology_found\": true") != std::string::npos);
  REQUIRE(json.find("\"vpc_id\": \"vpc-1\"") != std::string::npos);
  REQUIRE(json.find("\"skipped_not_found\": 1") != std::string::npos);
  REQUIRE(json.find("\"outcome\": \"skipped_not_found\"") != std::string::npos);
  REQUIRE(json.find("\"error\": null") != std::string::npos);
  REQUIRE(json.find("still \\\"associated\\\"") != std::string::npos);
  REQUIRE(json.back() == '\n');
}

TEST_CASE("TeardownReport JSON uses null vpc_id when nothing was found", "[topology][teardown]") {
  netstack::topology::TeardownReport report;
  report.region = "us-west-1";
  report.prefix = "fang";
  const std::string json = netstack::topology::TeardownReportToJson(report);
  REQUIRE(json.find("\"topology_found\": false") != std::string::npos);
  REQUIRE(json.find("\"vpc_id\": null") != std::string::npos);
  REQUIRE(json.find("\"actions\": []") != std::string::npos);
}

TEST_CASE("WriteTeardownReportJson creates parent directories", "[topology][teardown]") {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root = std::filesystem::temp_directory_path() /
                                     ("netstack-report-test-" + std::to_string(now_ms));
  const std::filesystem::path path = root / "nested" / "report.json";

  std::string error;
  REQUIRE(netstack::topology::WriteTeardownReportJson(SampleReport(), path, error));
  std::string contents;
  REQUIRE(netstack::core::ReadTextFile(path, contents, error));
  REQUIRE(contents == netstack::topology::TeardownReportToJson(SampleReport()));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}
