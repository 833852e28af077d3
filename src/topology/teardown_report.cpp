#include "topology/teardown_report.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

namespace netstack::topology {

const char* ToString(ActionOutcome outcome) {
  switch (outcome) {
  case ActionOutcome::kSucceeded:
    return "succeeded";
  case ActionOutcome::kSkippedNotFound:
    return "skipped_not_found";
  case ActionOutcome::kFailed:
    return "failed";
  }
  return "failed";
}

TeardownCounts TeardownReport::Counts() const {
  TeardownCounts counts;
  for (const auto& action : actions) {
    switch (action.outcome) {
    case ActionOutcome::kSucceeded:
      ++counts.succeeded;
      break;
    case ActionOutcome::kSkippedNotFound:
      ++counts.skipped_not_found;
      break;
    case ActionOutcome::kFailed:
      ++counts.failed;
      break;
    }
  }
  return counts;
}

std::string FormatTeardownSummary(const TeardownReport& report) {
  const TeardownCounts counts = report.Counts();
  return "teardown summary: succeeded=" + std::to_string(counts.succeeded) +
         " skipped_not_found=" + std::to_string(counts.skipped_not_found) +
         " failed=" + std::to_string(counts.failed);
}

std::string TeardownReportToJson(const TeardownReport& report) {
  const TeardownCounts counts = report.Counts();

  core::JsonWriter out;
  out.BeginObject()
      .StringField("region", report.region)
      .StringField("prefix", report.prefix)
      .BoolField("topology_found", report.topology_found);
  if (report.vpc_id.empty()) {
    out.Key("vpc_id").Null();
  } else {
    out.StringField("vpc_id", report.vpc_id);
  }
  out.StringField("started_at_utc", report.started_at_utc)
      .StringField("finished_at_utc", report.finished_at_utc);

  out.Key("counts")
      .BeginObject()
      .UIntField("succeeded", counts.succeeded)
      .UIntField("skipped_not_found", counts.skipped_not_found)
      .UIntField("failed", counts.failed)
      .EndObject();

  out.Key("actions").BeginArray();
  for (const auto& action : report.actions) {
    out.BeginObject()
        .StringField("step", action.step)
        .StringField("action", action.action)
        .StringField("resource_id", action.resource_id)
        .StringField("outcome", ToString(action.outcome));
    if (action.error.empty()) {
      out.Key("error").Null();
    } else {
      out.StringField("error", action.error);
    }
    out.EndObject();
  }
  out.EndArray();
  out.EndObject();

  return out.str() + "\n";
}

bool WriteTeardownReportJson(const TeardownReport& report,
                             const std::filesystem::path& output_path, std::string& error) {
  return core::WriteTextFileAtomic(output_path, TeardownReportToJson(report), error);
}

} // namespace netstack::topology
