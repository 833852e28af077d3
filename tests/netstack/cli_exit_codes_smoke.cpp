#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "cloud/aws_client_factory.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using netstack::core::errors::ExitCode;
using netstack::core::errors::ToInt;
using netstack::tests::common::AssertContains;
using netstack::tests::common::DispatchWithCapturedOutput;
using netstack::tests::common::Fail;

void ExpectExit(const std::vector<std::string>& argv, ExitCode expected, std::string& out,
                std::string& err) {
  const int code = DispatchWithCapturedOutput(argv, out, err);
  if (code != ToInt(expected)) {
    std::string joined;
    for (const auto& arg : argv) {
      joined += arg + " ";
    }
    Fail("unexpected exit code " + std::to_string(code) + " for: " + joined + "\nstderr:\n" + err);
  }
}

void WriteFile(const fs::path& path, const std::string& text) {
  std::string error;
  if (!netstack::core::WriteTextFileAtomic(path, text, error)) {
    Fail("failed to write fixture " + path.string() + ": " + error);
  }
}

} // namespace

int main() {
  const netstack::tests::common::ScopedTempDir temp_dir("netstack-cli-exit-codes");
  const fs::path& root = temp_dir.path();
  const std::string state = (root / "sim-state.json").string();
  std::string out;
  std::string err;

  // Usage errors.
  ExpectExit({"netstack"}, ExitCode::kUsage, out, err);
  AssertContains(err, "usage:");
  ExpectExit({"netstack", "provision"}, ExitCode::kUsage, out, err);
  AssertContains(err, "unknown subcommand: provision");
  ExpectExit({"netstack", "create", "--region", "us-west-1", "--prefix", "fang"},
             ExitCode::kUsage, out, err);
  AssertContains(err, "create requires --key-name");
  ExpectExit({"netstack", "collect", "--prefix", "fang"}, ExitCode::kUsage, out, err);
  AssertContains(err, "collect requires --region");
  ExpectExit({"netstack", "teardown", "--region", "us-west-1", "--prefix", "bad_prefix"},
             ExitCode::kUsage, out, err);
  AssertContains(err, "invalid --prefix");
  ExpectExit({"netstack", "collect", "--region", "us-west-1", "--prefix", "fang", "--backend",
              "sim"},
             ExitCode::kUsage, out, err);
  AssertContains(err, "--backend sim requires --sim-state");
  ExpectExit({"netstack", "create", "--region", "us-west-1", "--prefix", "fang", "--key-name",
              "k", "--ssh-cidr", "everywhere"},
             ExitCode::kUsage, out, err);
  AssertContains(err, "invalid --ssh-cidr");
  ExpectExit({"netstack", "teardown", "--region", "us-west-1", "--prefix", "fang", "--out", "x"},
             ExitCode::kUsage, out, err);
  AssertContains(err, "unknown option for teardown: --out");

  // Help goes to stdout.
  ExpectExit({"netstack", "help"}, ExitCode::kSuccess, out, err);
  AssertContains(out, "netstack create --region");

  // Invalid config is reported per issue before any backend is touched.
  const fs::path bad_config = root / "bad-config.json";
  WriteFile(bad_config, R"({"vpc_cidr": "10.0.0.0/99", "colour": "blue"})");
  ExpectExit({"netstack", "create", "--region", "us-west-1", "--prefix", "fang", "--key-name",
              "fang-key", "--config", bad_config.string(), "--backend", "sim", "--sim-state",
              state},
             ExitCode::kConfigInvalid, out, err);
  AssertContains(err, "invalid config: " + bad_config.string());
  AssertContains(err, "  - vpc_cidr: ");
  AssertContains(err, "  - colour: ");
  if (fs::exists(state)) {
    Fail("a rejected config must not create sim state");
  }

  // A missing config file is a plain failure.
  ExpectExit({"netstack", "teardown", "--region", "us-west-1", "--prefix", "fang", "--config",
              (root / "absent.json").string(), "--backend", "sim", "--sim-state", state},
             ExitCode::kFailure, out, err);

  // Default backend without the SDK built in.
  if (!netstack::cloud::IsAwsBackendEnabledAtBuild()) {
    ExpectExit({"netstack", "collect", "--region", "us-west-1", "--prefix", "fang"},
               ExitCode::kBackendUnavailable, out, err);
    AssertContains(err, "aws backend is ");
    AssertContains(err, "--backend sim");
  }

  // Nothing to collect in an empty simulated region.
  ExpectExit({"netstack", "collect", "--region", "us-west-1", "--prefix", "fang", "--out",
              (root / "out").string(), "--backend", "sim", "--sim-state", state},
             ExitCode::kTopologyNotFound, out, err);
  AssertContains(err, "No VPC with Name tag 'fang-vpc' found in region us-west-1.");

  // A malformed image fails the last create step after everything else exists.
  const fs::path bad_image = root / "bad-image.json";
  WriteFile(bad_image, R"({"image_id": "bogus"})");
  ExpectExit({"netstack", "create", "--region", "us-west-1", "--prefix", "fang", "--key-name",
              "fang-key", "--config", bad_image.string(), "--backend", "sim", "--sim-state",
              state},
             ExitCode::kCreateStepFailed, out, err);
  AssertContains(err, "create step 'instances' failed");
  AssertContains(err, "netstack teardown --region us-west-1 --prefix fang");
  AssertContains(out, "SecurityGroup Private: ");

  // The partial topology persisted, so a second create makes the prefix
  // ambiguous for every command that resolves it.
  ExpectExit({"netstack", "create", "--region", "us-west-1", "--prefix", "fang", "--key-name",
              "fang-key", "--backend", "sim", "--sim-state", state},
             ExitCode::kSuccess, out, err);
  AssertContains(out, "EC2: ");
  ExpectExit({"netstack", "collect", "--region", "us-west-1", "--prefix", "fang", "--out",
              (root / "out").string(), "--backend", "sim", "--sim-state", state},
             ExitCode::kTopologyAmbiguous, out, err);
  AssertContains(err, "matches 2 VPCs named 'fang-vpc'");
  ExpectExit({"netstack", "teardown", "--region", "us-west-1", "--prefix", "fang", "--backend",
              "sim", "--sim-state", state},
             ExitCode::kTopologyAmbiguous, out, err);
  AssertContains(err, "refusing to tear down");

  // A corrupt state file is a plain failure, not a usage error.
  const fs::path corrupt_state = root / "corrupt.json";
  WriteFile(corrupt_state, "{\"schema_version\": ");
  ExpectExit({"netstack", "collect", "--region", "us-west-1", "--prefix", "fang", "--backend",
              "sim", "--sim-state", corrupt_state.string()},
             ExitCode::kFailure, out, err);
  AssertContains(err, "failed to load sim state");

  std::cout << "cli_exit_codes_smoke: ok\n";
  return 0;
}
