#include "txasm/config.hpp"

#include <fmt/format.h>

namespace txasm {

///
/// FeeConfig
void FeeConfig::validate() const {
  if (!(lowPrice <= mediumPrice && mediumPrice <= highPrice &&
        highPrice <= urgentPrice))
    throw Error(ErrorCode::InvalidConfig,
                fmt::format("strategy prices must be non-decreasing, got "
                            "{} / {} / {} / {}",
                            lowPrice, mediumPrice, highPrice, urgentPrice));
  if (maxComputeUnitLimit == 0)
    throw Error(ErrorCode::InvalidConfig,
                "maxComputeUnitLimit must be positive");
}

void to_json(json &j, const FeeConfig &config) {
  j["lamportsPerSignature"] = config.lamportsPerSignature;
  j["maxComputeUnitLimit"] = config.maxComputeUnitLimit;
  j["lowPrice"] = config.lowPrice;
  j["mediumPrice"] = config.mediumPrice;
  j["highPrice"] = config.highPrice;
  j["urgentPrice"] = config.urgentPrice;
  j["baseComputeUnits"] = config.baseComputeUnits;
  j["computeUnitsPerInstruction"] = config.computeUnitsPerInstruction;
  j["computeUnitsPerAccount"] = config.computeUnitsPerAccount;
  j["computeUnitsPerDataByte"] = config.computeUnitsPerDataByte;
}

void from_json(const json &j, FeeConfig &config) {
  const FeeConfig defaults;
  config.lamportsPerSignature =
      j.value("lamportsPerSignature", defaults.lamportsPerSignature);
  config.maxComputeUnitLimit =
      j.value("maxComputeUnitLimit", defaults.maxComputeUnitLimit);
  config.lowPrice = j.value("lowPrice", defaults.lowPrice);
  config.mediumPrice = j.value("mediumPrice", defaults.mediumPrice);
  config.highPrice = j.value("highPrice", defaults.highPrice);
  config.urgentPrice = j.value("urgentPrice", defaults.urgentPrice);
  config.baseComputeUnits =
      j.value("baseComputeUnits", defaults.baseComputeUnits);
  config.computeUnitsPerInstruction =
      j.value("computeUnitsPerInstruction", defaults.computeUnitsPerInstruction);
  config.computeUnitsPerAccount =
      j.value("computeUnitsPerAccount", defaults.computeUnitsPerAccount);
  config.computeUnitsPerDataByte =
      j.value("computeUnitsPerDataByte", defaults.computeUnitsPerDataByte);
}

///
/// OptimizerConfig
void OptimizerConfig::validate() const {
  if (minAccountUtilization < 0.0 || minAccountUtilization > 1.0)
    throw Error(ErrorCode::InvalidConfig,
                fmt::format("minAccountUtilization must be within [0, 1], got {}",
                            minAccountUtilization));
}

void to_json(json &j, const OptimizerConfig &config) {
  j["minAccountUtilization"] = config.minAccountUtilization;
  j["maxInstructionsBeforeBatching"] = config.maxInstructionsBeforeBatching;
  j["maxAccountsBeforeReview"] = config.maxAccountsBeforeReview;
  j["largeDataThreshold"] = config.largeDataThreshold;
  j["nearLimitMargin"] = config.nearLimitMargin;
}

void from_json(const json &j, OptimizerConfig &config) {
  const OptimizerConfig defaults;
  config.minAccountUtilization =
      j.value("minAccountUtilization", defaults.minAccountUtilization);
  config.maxInstructionsBeforeBatching = j.value(
      "maxInstructionsBeforeBatching", defaults.maxInstructionsBeforeBatching);
  config.maxAccountsBeforeReview =
      j.value("maxAccountsBeforeReview", defaults.maxAccountsBeforeReview);
  config.largeDataThreshold =
      j.value("largeDataThreshold", defaults.largeDataThreshold);
  config.nearLimitMargin = j.value("nearLimitMargin", defaults.nearLimitMargin);
}

}  // namespace txasm
