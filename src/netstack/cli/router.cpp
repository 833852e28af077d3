#include "netstack/cli/router.hpp"

#include "cloud/aws_client_factory.hpp"
#include "cloud/cloud_client.hpp"
#include "cloud/sim/sim_cloud_client.hpp"
#include "cloud/sim/sim_state_store.hpp"
#include "cloud/waiter.hpp"
#include "collect/snapshot_exporter.hpp"
#include "core/errors/exit_codes.hpp"
#include "topology/create_orchestrator.hpp"
#include "topology/naming.hpp"
#include "topology/teardown_orchestrator.hpp"
#include "topology/teardown_report.hpp"
#include "topology/topology_config.hpp"

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace netstack::cli {

namespace {

using core::errors::ExitCode;

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(ExitCode::kConfigInvalid);
constexpr int kExitBackendUnavailable = core::errors::ToInt(ExitCode::kBackendUnavailable);
constexpr int kExitTopologyNotFound = core::errors::ToInt(ExitCode::kTopologyNotFound);
constexpr int kExitTopologyAmbiguous = core::errors::ToInt(ExitCode::kTopologyAmbiguous);
constexpr int kExitCreateStepFailed = core::errors::ToInt(ExitCode::kCreateStepFailed);

constexpr std::string_view kVersionText = "netstack 0.1.0";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  netstack create --region <region> --prefix <prefix> --key-name <key> "
         "[--ssh-cidr <cidr>] [--config <file.json>] [common]\n"
      << "  netstack collect --region <region> --prefix <prefix> [--out <dir>] [common]\n"
      << "  netstack teardown --region <region> --prefix <prefix> [--report <file.json>] "
         "[--config <file.json>] [common]\n"
      << "  netstack list-backends\n"
      << "  netstack version\n"
      << "common: [--backend <aws|sim>] [--sim-state <file.json>] "
         "[--log-level <debug|info|warn|error>]\n";
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersionText << '\n';
  return kExitSuccess;
}

int CommandListBackends(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: list-backends does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "sim ✅ enabled\n";
  if (cloud::IsAwsBackendEnabledAtBuild()) {
    std::cout << "aws ✅ enabled\n";
  } else {
    std::cout << "aws ⚠️ " << cloud::AwsBackendAvailabilityStatusText() << '\n';
  }
  return kExitSuccess;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               std::string& error) {
  if (i + 1 >= args.size() || args[i + 1].empty()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

// Parse one command's flags with an explicit contract:
// - only flags listed in `allowed` are accepted
// - every flag takes exactly one value
// - positional arguments are rejected
bool ParseCommandOptions(std::string_view command, const std::vector<std::string_view>& args,
                         std::initializer_list<std::string_view> allowed,
                         CommandOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.empty() || token.front() != '-') {
      error = std::string(command) + " does not accept positional argument '" +
              std::string(token) + "'";
      return false;
    }
    if (std::find(allowed.begin(), allowed.end(), token) == allowed.end()) {
      error = "unknown option for " + std::string(command) + ": " + std::string(token);
      return false;
    }

    std::string value;
    if (!TakeValue(args, i, value, error)) {
      return false;
    }

    if (token == "--region") {
      options.region = value;
    } else if (token == "--prefix") {
      options.prefix = value;
    } else if (token == "--key-name") {
      options.key_name = value;
    } else if (token == "--backend") {
      if (value != kBackendAws && value != kBackendSim) {
        error = "invalid --backend '" + value + "' (expected aws|sim)";
        return false;
      }
      options.backend = value;
    } else if (token == "--sim-state") {
      options.sim_state_path = fs::path(value);
    } else if (token == "--ssh-cidr") {
      if (!topology::IsValidIpv4Cidr(value)) {
        error = "invalid --ssh-cidr '" + value + "' (expected an IPv4 CIDR such as 0.0.0.0/0)";
        return false;
      }
      options.ssh_cidr = value;
    } else if (token == "--config") {
      options.config_path = fs::path(value);
    } else if (token == "--out") {
      options.output_dir = fs::path(value);
    } else if (token == "--report") {
      options.report_path = fs::path(value);
    } else if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    }
  }

  if (options.region.empty()) {
    error = std::string(command) + " requires --region <region>";
    return false;
  }
  if (options.prefix.empty()) {
    error = std::string(command) + " requires --prefix <prefix>";
    return false;
  }
  if (!topology::ValidatePrefix(options.prefix, error)) {
    error = "invalid --prefix: " + error;
    return false;
  }
  if (options.backend == kBackendSim && options.sim_state_path.empty()) {
    error = "--backend sim requires --sim-state <file.json>";
    return false;
  }
  if (options.backend != kBackendSim && !options.sim_state_path.empty()) {
    error = "--sim-state requires --backend sim";
    return false;
  }
  return true;
}

// Owns the cloud client for one command. The simulated backend is loaded from
// and saved back to its state file so create, collect and teardown invoked as
// separate processes act on one region.
class BackendSession {
public:
  // Returns false with `exit_code` and `error` set when the backend cannot
  // be used.
  bool Open(const CommandOptions& options, core::logging::Logger& logger, int& exit_code,
            std::string& error) {
    if (options.backend == kBackendSim) {
      cloud::sim::SimCloudState state;
      if (!cloud::sim::LoadSimState(options.sim_state_path, state, error)) {
        error = "failed to load sim state: " + error;
        exit_code = kExitFailure;
        return false;
      }
      cloud::sim::SimOptions sim_options;
      sim_options.region = options.region;
      auto sim = std::make_unique<cloud::sim::SimCloudClient>(sim_options);
      sim->ReplaceState(std::move(state));
      sim_ = sim.get();
      client_ = std::move(sim);
      sim_state_path_ = options.sim_state_path;
      // Simulated transitions advance per describe call, not per second.
      sleeper_ = cloud::NoopSleeper();
      tag_delay_unit_ = std::chrono::milliseconds::zero();
      logger.Debug("sim backend ready", {{"sim_state", sim_state_path_.string()}});
      return true;
    }

    if (!cloud::IsAwsBackendEnabledAtBuild()) {
      error = "aws backend is " + std::string(cloud::AwsBackendAvailabilityStatusText()) +
              "; rebuild with -DNETSTACK_ENABLE_AWS_BACKEND=ON and aws-sdk-cpp installed, "
              "or use --backend sim";
      exit_code = kExitBackendUnavailable;
      return false;
    }
    client_ = cloud::CreateAwsCloudClient(options.region, error);
    if (client_ == nullptr) {
      error = "failed to initialize aws backend: " + error;
      exit_code = kExitBackendUnavailable;
      return false;
    }
    sleeper_ = cloud::RealSleeper();
    tag_delay_unit_ = std::chrono::seconds(1);
    logger.Debug("aws backend ready", {{"region", options.region}});
    return true;
  }

  cloud::ICloudClient& client() {
    return *client_;
  }

  const cloud::Sleeper& sleeper() const {
    return sleeper_;
  }

  std::chrono::milliseconds tag_delay_unit() const {
    return tag_delay_unit_;
  }

  // Saves simulated state; no-op for real backends.
  bool Persist(std::string& error) {
    if (sim_ == nullptr) {
      return true;
    }
    return cloud::sim::WriteSimState(sim_->state(), sim_state_path_, error);
  }

private:
  std::unique_ptr<cloud::ICloudClient> client_;
  cloud::sim::SimCloudClient* sim_ = nullptr;
  fs::path sim_state_path_;
  cloud::Sleeper sleeper_;
  std::chrono::milliseconds tag_delay_unit_{0};
};

// Applies `--config` when given. Returns kExitSuccess or the exit code to
// stop with.
int LoadTopologyConfig(const CommandOptions& options, core::logging::Logger& logger,
                       topology::TopologyConfig& config) {
  if (options.config_path.empty()) {
    return kExitSuccess;
  }

  std::string error;
  topology::ConfigReport report;
  if (!topology::ApplyTopologyConfigFile(options.config_path.string(), config, report, error)) {
    logger.Error("config read failed",
                 {{"config", options.config_path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    logger.Error("config invalid", {{"config", options.config_path.string()},
                                    {"issues", topology::FormatConfigIssues(report)}});
    std::cerr << "invalid config: " << options.config_path.string() << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

int PersistSession(BackendSession& session, core::logging::Logger& logger, int exit_code) {
  std::string error;
  if (!session.Persist(error)) {
    logger.Error("sim state save failed", {{"error", error}});
    std::cerr << "error: failed to save sim state: " << error << '\n';
    return exit_code == kExitSuccess ? kExitFailure : exit_code;
  }
  return exit_code;
}

int CommandCreate(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions("create", args,
                           {"--region", "--prefix", "--key-name", "--ssh-cidr", "--config",
                            "--backend", "--sim-state", "--log-level"},
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (options.key_name.empty()) {
    std::cerr << "error: create requires --key-name <existing key pair name>\n";
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetOperation("create");
  logger.SetPrefix(options.prefix);

  topology::CreateRequest request;
  request.region = options.region;
  request.prefix = options.prefix;
  request.key_name = options.key_name;
  if (const int code = LoadTopologyConfig(options, logger, request.config);
      code != kExitSuccess) {
    return code;
  }
  if (options.ssh_cidr.has_value()) {
    request.config.ssh_cidr = *options.ssh_cidr;
  }

  BackendSession session;
  int exit_code = kExitSuccess;
  if (!session.Open(options, logger, exit_code, error)) {
    logger.Error("backend unavailable", {{"backend", options.backend}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return exit_code;
  }

  topology::CreateOrchestrator orchestrator(session.client(), session.sleeper(), logger,
                                            std::cout, session.tag_delay_unit());
  const topology::CreateResult result = orchestrator.Create(request);
  if (!result.success) {
    if (result.failed_step.empty()) {
      std::cerr << "error: " << result.error << '\n';
      exit_code = kExitFailure;
    } else {
      std::cerr << "error: create step '" << result.failed_step << "' failed: " << result.error
                << '\n';
      std::cerr << "resources created before the failure were left in place; run "
                   "'netstack teardown --region "
                << options.region << " --prefix " << options.prefix << "' to remove them\n";
      exit_code = kExitCreateStepFailed;
    }
  }
  return PersistSession(session, logger, exit_code);
}

int CommandCollect(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions("collect", args,
                           {"--region", "--prefix", "--out", "--backend", "--sim-state",
                            "--log-level"},
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetOperation("collect");
  logger.SetPrefix(options.prefix);

  BackendSession session;
  int exit_code = kExitSuccess;
  if (!session.Open(options, logger, exit_code, error)) {
    logger.Error("backend unavailable", {{"backend", options.backend}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return exit_code;
  }

  collect::CollectRequest request;
  request.region = options.region;
  request.prefix = options.prefix;
  request.output_dir = options.output_dir;

  collect::CollectResult result;
  if (!collect::CollectSnapshots(session.client(), request, std::cout, logger, result, error)) {
    std::cerr << "error: " << error << '\n';
    if (result.status == topology::ResolveStatus::kAmbiguous) {
      exit_code = kExitTopologyAmbiguous;
    } else if (result.lookup_completed &&
               result.status == topology::ResolveStatus::kNotFound) {
      exit_code = kExitTopologyNotFound;
    } else {
      exit_code = kExitFailure;
    }
  } else {
    std::cout << "All outputs collected.\n";
  }
  return PersistSession(session, logger, exit_code);
}

int CommandTeardown(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions("teardown", args,
                           {"--region", "--prefix", "--report", "--config", "--backend",
                            "--sim-state", "--log-level"},
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetOperation("teardown");
  logger.SetPrefix(options.prefix);

  // Only the waiter budget matters here; layout keys are accepted so one
  // file serves both commands.
  topology::TopologyConfig config;
  if (const int code = LoadTopologyConfig(options, logger, config); code != kExitSuccess) {
    return code;
  }

  BackendSession session;
  int exit_code = kExitSuccess;
  if (!session.Open(options, logger, exit_code, error)) {
    logger.Error("backend unavailable", {{"backend", options.backend}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return exit_code;
  }

  topology::TeardownOrchestrator orchestrator(session.client(), session.sleeper(), logger,
                                              std::cout, config.waiter);
  topology::TeardownReport report;
  topology::ResolveStatus status = topology::ResolveStatus::kNotFound;
  if (!orchestrator.Teardown(options.region, options.prefix, report, status, error)) {
    std::cerr << "error: " << error << '\n';
    exit_code =
        status == topology::ResolveStatus::kAmbiguous ? kExitTopologyAmbiguous : kExitFailure;
    return PersistSession(session, logger, exit_code);
  }

  if (report.topology_found) {
    std::cout << topology::FormatTeardownSummary(report) << '\n';
    if (report.HasFailures()) {
      logger.Warn("teardown left resources behind; rerun teardown after fixing the errors",
                  {{"summary", topology::FormatTeardownSummary(report)}});
    }
  }

  if (!options.report_path.empty()) {
    if (!topology::WriteTeardownReportJson(report, options.report_path, error)) {
      logger.Error("teardown report write failed",
                   {{"report", options.report_path.string()}, {"error", error}});
      std::cerr << "error: failed to write teardown report: " << error << '\n';
      exit_code = kExitFailure;
    } else {
      std::cout << "report: " << options.report_path.string() << '\n';
    }
  }
  return PersistSession(session, logger, exit_code);
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "create") {
    return CommandCreate(args);
  }

  if (command == "collect") {
    return CommandCollect(args);
  }

  if (command == "teardown") {
    return CommandTeardown(args);
  }

  if (command == "list-backends") {
    return CommandListBackends(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace netstack::cli
