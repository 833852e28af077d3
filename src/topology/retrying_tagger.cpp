#include "topology/retrying_tagger.hpp"

#include "cloud/error_mapper.hpp"
#include "core/logging/logger.hpp"

#include <array>
#include <utility>

namespace netstack::topology {

namespace {

constexpr std::array<std::string_view, 6> kRetryableCodes = {
    "InvalidVpcID.NotFound",
    "InvalidSubnetID.NotFound",
    "InvalidRouteTableID.NotFound",
    "InvalidInternetGatewayID.NotFound",
    "InvalidGroup.NotFound",
    "InvalidNatGatewayID.NotFound",
};

} // namespace

bool IsTagRetryableErrorCode(std::string_view code) {
  for (const std::string_view candidate : kRetryableCodes) {
    if (candidate == code) {
      return true;
    }
  }
  return false;
}

std::chrono::milliseconds ComputeTagRetryDelay(const std::uint32_t attempt_index,
                                               const std::chrono::milliseconds unit) {
  return unit * static_cast<std::int64_t>(1U + attempt_index);
}

RetryingTagger::RetryingTagger(cloud::ICloudClient& client, cloud::Sleeper sleeper,
                               core::logging::Logger& logger,
                               const std::chrono::milliseconds delay_unit)
    : client_(client), sleeper_(std::move(sleeper)), logger_(logger), delay_unit_(delay_unit) {}

bool RetryingTagger::TagName(const std::string& resource_id, const std::string& name,
                             cloud::CloudError& error) {
  last_attempts_ = 0;
  const cloud::TagList tags = {{.key = std::string(cloud::kNameTagKey), .value = name}};

  for (std::uint32_t attempt = 0; attempt < kTagMaxAttempts; ++attempt) {
    ++last_attempts_;
    error.Clear();
    if (client_.CreateTags({resource_id}, tags, error)) {
      logger_.Debug("tagged resource", {{"resource_id", resource_id},
                                        {"name", name},
                                        {"attempts", std::to_string(last_attempts_)}});
      return true;
    }

    if (!IsTagRetryableErrorCode(error.code)) {
      logger_.Error("tag failed", {{"resource_id", resource_id},
                                   {"name", name},
                                   {"error", cloud::FormatCloudFailure("tag resource", error)}});
      return false;
    }

    if (attempt + 1U == kTagMaxAttempts) {
      break;
    }
    const auto delay = ComputeTagRetryDelay(attempt, delay_unit_);
    logger_.Warn("resource not visible yet, retrying tag",
                 {{"resource_id", resource_id},
                  {"attempt", std::to_string(last_attempts_)},
                  {"max_attempts", std::to_string(kTagMaxAttempts)},
                  {"delay_ms", std::to_string(delay.count())},
                  {"error_code", error.code}});
    sleeper_(delay);
  }

  logger_.Error("tag retries exhausted",
                {{"resource_id", resource_id},
                 {"name", name},
                 {"attempts", std::to_string(last_attempts_)},
                 {"error", cloud::FormatCloudFailure("tag resource", error)}});
  return false;
}

} // namespace netstack::topology
