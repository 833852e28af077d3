#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "cloud/aws_client_factory.hpp"

#include <iostream>
#include <string>

namespace {

using netstack::tests::common::AssertContains;
using netstack::tests::common::DispatchWithCapturedOutput;
using netstack::tests::common::Fail;

} // namespace

int main() {
  std::string out;
  std::string err;

  if (DispatchWithCapturedOutput({"netstack", "list-backends"}, out, err) != 0) {
    Fail("list-backends should exit 0");
  }
  AssertContains(out, "sim ✅ enabled");
  if (netstack::cloud::IsAwsBackendEnabledAtBuild()) {
    AssertContains(out, "aws ✅ enabled");
  } else {
    AssertContains(out, "aws ⚠️ " +
                            std::string(netstack::cloud::AwsBackendAvailabilityStatusText()));
  }
  if (!err.empty()) {
    Fail("list-backends should not write to stderr");
  }

  if (DispatchWithCapturedOutput({"netstack", "list-backends", "--verbose"}, out, err) != 2) {
    Fail("list-backends with arguments should be a usage error");
  }
  AssertContains(err, "list-backends does not accept arguments");

  if (DispatchWithCapturedOutput({"netstack", "version"}, out, err) != 0) {
    Fail("version should exit 0");
  }
  AssertContains(out, "netstack 0.1.0");

  std::cout << "list_backends_smoke: ok\n";
  return 0;
}
