#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "txasm/config.hpp"
#include "txasm/fee_calculator.hpp"
#include "txasm/transaction.hpp"

namespace txasm {

enum class OptimizationStrategy { Size, Cost, Balanced };

std::string to_string(OptimizationStrategy strategy);

/**
 * Share of the serialized size per category, in percent. The categories
 * partition the transaction so the shares add up to 100.
 */
struct SizeBreakdown {
  double signaturesPercent;
  /** 3-byte message header and the recent blockhash */
  double headerPercent;
  double accountKeysPercent;
  /** program indices, account indices and length prefixes */
  double instructionMetadataPercent;
  double instructionDataPercent;
};

struct TransactionAnalysis {
  size_t totalSize;
  size_t signatureBytes;
  size_t headerBytes;
  size_t accountKeyBytes;
  size_t instructionMetadataBytes;
  size_t instructionDataBytes;
  size_t numSignatures;
  size_t numAccounts;
  size_t numInstructions;
  /** account table entries no instruction references, fee payer excluded */
  size_t unusedAccounts;
  /** account references to entries an earlier instruction already uses */
  size_t redundantReferences;
  /** non-data bytes per instruction data byte */
  double overheadRatio;
  /** 0..100, higher is leaner */
  uint8_t efficiencyScore;
  SizeBreakdown breakdown;
  std::vector<std::string> suggestions;
};

void to_json(json &j, const TransactionAnalysis &analysis);

struct OptimizationReport {
  size_t originalSize;
  size_t optimizedSize;
  size_t bytesSaved;
  /** transformations applied to the returned transaction */
  std::vector<std::string> changes;
  /** improvements left to the caller */
  std::vector<std::string> suggestions;
  std::vector<PublicKey> removedAccounts;
};

void to_json(json &j, const OptimizationReport &report);

/**
 * Size and cost analysis of compiled transactions, and rewrites that keep
 * the signed meaning of every referenced account
 */
class TransactionOptimizer {
 public:
  explicit TransactionOptimizer(const OptimizerConfig &config = OptimizerConfig(),
                                const FeeConfig &feeConfig = FeeConfig());

  TransactionAnalysis analyze(const CompiledTransaction &tx) const;

  uint8_t calculateEfficiencyScore(const CompiledTransaction &tx) const;

  /**
   * Size drops account table entries that no instruction references (never
   * the fee payer or a signer) and renumbers indices; Cost rewrites nothing
   * and reports fee suggestions; Balanced does both.
   * @throw Error(UnsafeOptimization) when a rewrite would change the flags of
   * a referenced account or invalidate existing signatures
   */
  std::pair<CompiledTransaction, OptimizationReport> optimize(
      const CompiledTransaction &tx, OptimizationStrategy strategy) const;

 private:
  CompiledTransaction removeUnusedAccounts(const CompiledTransaction &tx,
                                           OptimizationReport &report) const;
  void suggestFeeChanges(const CompiledTransaction &tx,
                         OptimizationReport &report) const;

  OptimizerConfig config_;
  FeeCalculator feeCalculator_;
};

namespace utils {

bool exceedsMaxSize(const CompiledTransaction &tx);

/// bytes left below the packet limit, negative when over
int64_t availableSpace(const CompiledTransaction &tx);

/**
 * Whether an instruction with the given data size and new distinct accounts
 * still fits
 */
bool canAddInstruction(const CompiledTransaction &tx, size_t dataSize,
                       size_t numNewAccounts);

struct TransactionComparison {
  int64_t sizeDiff;
  int64_t instructionDiff;
  int64_t accountDiff;
};

TransactionComparison compareTransactions(const CompiledTransaction &a,
                                          const CompiledTransaction &b);

}  // namespace utils

}  // namespace txasm
