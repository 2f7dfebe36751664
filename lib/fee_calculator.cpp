#include "txasm/fee_calculator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

#include "txasm/compute_budget.hpp"
#include "txasm/error.hpp"

namespace txasm {

std::string to_string(FeeStrategy strategy) {
  switch (strategy) {
    case FeeStrategy::Low:
      return "low";
    case FeeStrategy::Medium:
      return "medium";
    case FeeStrategy::High:
      return "high";
    case FeeStrategy::Urgent:
      return "urgent";
  }
  return "unknown";
}

void to_json(json &j, const FeeEstimate &estimate) {
  j["strategy"] = to_string(estimate.strategy);
  j["baseFee"] = estimate.baseFee;
  j["priorityFee"] = estimate.priorityFee;
  j["totalCost"] = estimate.totalCost;
  j["computeUnitLimit"] = estimate.computeUnitLimit;
  j["computeUnitPrice"] = estimate.computeUnitPrice;
}

namespace {
uint64_t saturatingAdd(uint64_t a, uint64_t b) {
  return a > std::numeric_limits<uint64_t>::max() - b
             ? std::numeric_limits<uint64_t>::max()
             : a + b;
}

uint64_t saturatingMul(uint64_t a, uint64_t b) {
  return b != 0 && a > std::numeric_limits<uint64_t>::max() / b
             ? std::numeric_limits<uint64_t>::max()
             : a * b;
}
}  // namespace

FeeCalculator::FeeCalculator(const FeeConfig &config) : config_(config) {
  config_.validate();
}

uint64_t FeeCalculator::calculateBaseFee(size_t numSignatures) const {
  return saturatingMul(config_.lamportsPerSignature, numSignatures);
}

uint32_t FeeCalculator::estimateComputeUnits(
    const CompiledTransaction &tx) const {
  uint64_t dataBytes = 0;
  for (const auto &ix : tx.instructions) dataBytes += ix.data.size();

  const uint64_t units =
      config_.baseComputeUnits +
      uint64_t(config_.computeUnitsPerInstruction) * tx.instructions.size() +
      uint64_t(config_.computeUnitsPerAccount) * tx.accounts.size() +
      uint64_t(config_.computeUnitsPerDataByte) * dataBytes;
  return static_cast<uint32_t>(
      std::min<uint64_t>(units, config_.maxComputeUnitLimit));
}

uint64_t FeeCalculator::priceFor(FeeStrategy strategy) const {
  switch (strategy) {
    case FeeStrategy::Low:
      return config_.lowPrice;
    case FeeStrategy::Medium:
      return config_.mediumPrice;
    case FeeStrategy::High:
      return config_.highPrice;
    case FeeStrategy::Urgent:
      return config_.urgentPrice;
  }
  return config_.urgentPrice;
}

FeeEstimate FeeCalculator::estimateFee(const CompiledTransaction &tx,
                                       FeeStrategy strategy) const {
  const auto budget = compute_budget::parse(tx);
  const uint32_t limit =
      std::min(budget.unitLimit.value_or(estimateComputeUnits(tx)),
               config_.maxComputeUnitLimit);
  const uint64_t price = budget.unitPrice.value_or(priceFor(strategy));

  // micro-lamports to lamports, rounded up
  const unsigned __int128 microLamports =
      static_cast<unsigned __int128>(limit) * price;
  const unsigned __int128 lamports =
      (microLamports + MICRO_LAMPORTS_PER_LAMPORT - 1) /
      MICRO_LAMPORTS_PER_LAMPORT;
  const uint64_t priorityFee =
      lamports > std::numeric_limits<uint64_t>::max()
          ? std::numeric_limits<uint64_t>::max()
          : static_cast<uint64_t>(lamports);

  const uint64_t baseFee = calculateBaseFee(tx.header.requiredSignatures);
  return {strategy,
          baseFee,
          priorityFee,
          saturatingAdd(baseFee, priorityFee),
          limit,
          price};
}

FeeEstimate FeeCalculator::estimateFeeAtPercentile(
    const CompiledTransaction &tx, unsigned percentile) const {
  if (percentile > 100)
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("percentile must be between 0 and 100, got {}",
                            percentile))
        .withCount(percentile);
  FeeStrategy strategy = FeeStrategy::Urgent;
  if (percentile <= 33) {
    strategy = FeeStrategy::Low;
  } else if (percentile <= 66) {
    strategy = FeeStrategy::Medium;
  } else if (percentile <= 90) {
    strategy = FeeStrategy::High;
  }
  return estimateFee(tx, strategy);
}

double FeeCalculator::costPerByte(const CompiledTransaction &tx,
                                  FeeStrategy strategy) const {
  const auto estimate = estimateFee(tx, strategy);
  return static_cast<double>(estimate.totalCost) /
         static_cast<double>(tx.size());
}

std::vector<std::pair<FeeStrategy, FeeEstimate>>
FeeCalculator::compareStrategies(const CompiledTransaction &tx) const {
  std::vector<std::pair<FeeStrategy, FeeEstimate>> estimates;
  for (const auto strategy : ALL_FEE_STRATEGIES) {
    estimates.emplace_back(strategy, estimateFee(tx, strategy));
  }
  return estimates;
}

FeeStrategy FeeCalculator::recommendStrategy(TransactionUrgency urgency) {
  switch (urgency) {
    case TransactionUrgency::NotUrgent:
      return FeeStrategy::Low;
    case TransactionUrgency::Normal:
      return FeeStrategy::Medium;
    case TransactionUrgency::Urgent:
      return FeeStrategy::High;
    case TransactionUrgency::Critical:
      return FeeStrategy::Urgent;
  }
  return FeeStrategy::Medium;
}

}  // namespace txasm
