#pragma once

#include <cstdint>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>

#include "txasm/error.hpp"

namespace txasm {
using json = nlohmann::json;

/**
 * Fee calculator parameters. Defaults follow mainnet.
 */
struct FeeConfig {
  /** base fee charged per required signature, in lamports */
  uint64_t lamportsPerSignature = 5000;
  /** upper bound of a transaction compute unit limit */
  uint32_t maxComputeUnitLimit = 1400000;
  /**
   * compute unit price per strategy in micro-lamports, must be
   * non-decreasing low -> urgent
   */
  uint64_t lowPrice = 1;
  uint64_t mediumPrice = 100;
  uint64_t highPrice = 1000;
  uint64_t urgentPrice = 5000;
  /**
   * compute unit estimate used when the transaction sets no limit:
   * base + perInstruction * instructions + perAccount * accounts +
   * perDataByte * data bytes
   */
  uint32_t baseComputeUnits = 200;
  uint32_t computeUnitsPerInstruction = 1000;
  uint32_t computeUnitsPerAccount = 100;
  uint32_t computeUnitsPerDataByte = 1;

  /**
   * @throw Error(InvalidConfig)
   */
  void validate() const;
};

void to_json(json &j, const FeeConfig &config);
void from_json(const json &j, FeeConfig &config);

/**
 * Optimizer thresholds that trigger suggestions
 */
struct OptimizerConfig {
  /** share of account table entries referenced by instructions, 0..1 */
  double minAccountUtilization = 0.75;
  size_t maxInstructionsBeforeBatching = 5;
  size_t maxAccountsBeforeReview = 20;
  size_t largeDataThreshold = 1000;
  /** warn when fewer bytes than this remain below the packet limit */
  size_t nearLimitMargin = 100;

  /**
   * @throw Error(InvalidConfig)
   */
  void validate() const;
};

void to_json(json &j, const OptimizerConfig &config);
void from_json(const json &j, OptimizerConfig &config);

/**
 * Read a config object from a JSON file. Missing keys keep their defaults.
 * @throw Error(InvalidConfig) when the file cannot be read, parsed or
 * validated
 */
template <typename T>
T configFromFile(const std::string &path) {
  std::ifstream fileStream(path);
  if (!fileStream)
    throw Error(ErrorCode::InvalidConfig, "cannot open config '" + path + "'");
  std::string fileContent(std::istreambuf_iterator<char>(fileStream), {});
  T config{};
  try {
    config = json::parse(fileContent).get<T>();
  } catch (const json::exception &e) {
    throw Error(ErrorCode::InvalidConfig,
                "invalid config '" + path + "': " + e.what());
  }
  config.validate();
  return config;
}

}  // namespace txasm
