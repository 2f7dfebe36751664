#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "txasm/config.hpp"
#include "txasm/transaction.hpp"

namespace txasm {

/**
 * Priority fee levels, each a fixed compute unit price. Prices never
 * decrease from Low to Urgent.
 */
enum class FeeStrategy { Low, Medium, High, Urgent };

/// every strategy, cheapest first
const std::vector<FeeStrategy> ALL_FEE_STRATEGIES = {
    FeeStrategy::Low, FeeStrategy::Medium, FeeStrategy::High,
    FeeStrategy::Urgent};

std::string to_string(FeeStrategy strategy);

enum class TransactionUrgency { NotUrgent, Normal, Urgent, Critical };

const uint64_t MICRO_LAMPORTS_PER_LAMPORT = 1000000;

struct FeeEstimate {
  FeeStrategy strategy;
  /** required signatures * lamports per signature */
  uint64_t baseFee;
  /** compute unit limit * compute unit price, rounded up to lamports */
  uint64_t priorityFee;
  uint64_t totalCost;
  uint32_t computeUnitLimit;
  /** micro-lamports per compute unit */
  uint64_t computeUnitPrice;
};

void to_json(json &j, const FeeEstimate &estimate);

/**
 * Estimates transaction cost from data in the transaction and fixed
 * parameters only; no network access
 */
class FeeCalculator {
 public:
  /**
   * @throw Error(InvalidConfig)
   */
  explicit FeeCalculator(const FeeConfig &config = FeeConfig());

  const FeeConfig &config() const { return config_; }

  uint64_t calculateBaseFee(size_t numSignatures) const;

  /**
   * Heuristic compute unit estimate for transactions without an explicit
   * limit, capped at the configured maximum
   */
  uint32_t estimateComputeUnits(const CompiledTransaction &tx) const;

  /// compute unit price of a strategy in micro-lamports
  uint64_t priceFor(FeeStrategy strategy) const;

  /**
   * Compute budget instructions in the transaction take precedence over the
   * estimate and the strategy price
   */
  FeeEstimate estimateFee(const CompiledTransaction &tx,
                          FeeStrategy strategy) const;

  /**
   * Estimate under the strategy covering the given percentile: up to 33 is
   * Low, up to 66 Medium, up to 90 High, above Urgent
   * @throw Error(InvalidArgument) when percentile > 100
   */
  FeeEstimate estimateFeeAtPercentile(const CompiledTransaction &tx,
                                      unsigned percentile) const;

  /// total cost in lamports per serialized byte
  double costPerByte(const CompiledTransaction &tx,
                     FeeStrategy strategy) const;

  /// estimates for every strategy, cheapest first
  std::vector<std::pair<FeeStrategy, FeeEstimate>> compareStrategies(
      const CompiledTransaction &tx) const;

  static FeeStrategy recommendStrategy(TransactionUrgency urgency);

 private:
  FeeConfig config_;
};

}  // namespace txasm
