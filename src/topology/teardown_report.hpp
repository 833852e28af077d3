#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace netstack::topology {

enum class ActionOutcome {
  kSucceeded,
  // The resource was already gone when the action ran. Counts as done.
  kSkippedNotFound,
  kFailed,
};

const char* ToString(ActionOutcome outcome);

// One provider call (or wait) issued by teardown.
struct TeardownAction {
  std::string step;
  std::string action;
  std::string resource_id;
  ActionOutcome outcome = ActionOutcome::kSucceeded;
  std::string error;
};

struct TeardownCounts {
  std::size_t succeeded = 0;
  std::size_t skipped_not_found = 0;
  std::size_t failed = 0;
};

struct TeardownReport {
  std::string region;
  std::string prefix;
  std::string vpc_id;
  // False when no VPC carried the prefix; teardown then did nothing.
  bool topology_found = false;
  std::string started_at_utc;
  std::string finished_at_utc;
  std::vector<TeardownAction> actions;

  TeardownCounts Counts() const;

  bool HasFailures() const {
    return Counts().failed != 0U;
  }
};

// "teardown summary: succeeded=N skipped_not_found=N failed=N"
std::string FormatTeardownSummary(const TeardownReport& report);

std::string TeardownReportToJson(const TeardownReport& report);

bool WriteTeardownReportJson(const TeardownReport& report,
                             const std::filesystem::path& output_path, std::string& error);

} // namespace netstack::topology
