#include "txasm/optimizer.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include "txasm/codec.hpp"
#include "txasm/compute_budget.hpp"
#include "txasm/error.hpp"

namespace txasm {

std::string to_string(OptimizationStrategy strategy) {
  switch (strategy) {
    case OptimizationStrategy::Size:
      return "size";
    case OptimizationStrategy::Cost:
      return "cost";
    case OptimizationStrategy::Balanced:
      return "balanced";
  }
  return "unknown";
}

void to_json(json &j, const TransactionAnalysis &analysis) {
  j["totalSize"] = analysis.totalSize;
  j["signatureBytes"] = analysis.signatureBytes;
  j["headerBytes"] = analysis.headerBytes;
  j["accountKeyBytes"] = analysis.accountKeyBytes;
  j["instructionMetadataBytes"] = analysis.instructionMetadataBytes;
  j["instructionDataBytes"] = analysis.instructionDataBytes;
  j["numSignatures"] = analysis.numSignatures;
  j["numAccounts"] = analysis.numAccounts;
  j["numInstructions"] = analysis.numInstructions;
  j["unusedAccounts"] = analysis.unusedAccounts;
  j["redundantReferences"] = analysis.redundantReferences;
  j["overheadRatio"] = analysis.overheadRatio;
  j["efficiencyScore"] = analysis.efficiencyScore;
  j["breakdown"] = {
      {"signatures", analysis.breakdown.signaturesPercent},
      {"header", analysis.breakdown.headerPercent},
      {"accountKeys", analysis.breakdown.accountKeysPercent},
      {"instructionMetadata", analysis.breakdown.instructionMetadataPercent},
      {"instructionData", analysis.breakdown.instructionDataPercent}};
  j["suggestions"] = analysis.suggestions;
}

void to_json(json &j, const OptimizationReport &report) {
  j["originalSize"] = report.originalSize;
  j["optimizedSize"] = report.optimizedSize;
  j["bytesSaved"] = report.bytesSaved;
  j["changes"] = report.changes;
  j["suggestions"] = report.suggestions;
  j["removedAccounts"] = json::array();
  for (const auto &key : report.removedAccounts) {
    j["removedAccounts"].push_back(key.toBase58());
  }
}

namespace {
// marks every account table entry an instruction references
std::vector<bool> referencedAccounts(const CompiledTransaction &tx) {
  std::vector<bool> used(tx.accounts.size(), false);
  const auto mark = [&used, &tx](uint8_t index, size_t ix) {
    if (index >= used.size())
      throw Error(ErrorCode::MalformedTransaction,
                  fmt::format("instruction {} references index {} of a {} "
                              "entry account table",
                              ix, index, tx.accounts.size()))
          .withOffset(index);
    used[index] = true;
  };
  for (size_t i = 0; i < tx.instructions.size(); i++) {
    const auto &ix = tx.instructions[i];
    mark(ix.programIdIndex, i);
    for (const auto index : ix.accountIndices) mark(index, i);
  }
  return used;
}

double percentOf(size_t part, size_t total) {
  return total == 0 ? 0.0 : 100.0 * part / total;
}
}  // namespace

///
/// TransactionOptimizer
TransactionOptimizer::TransactionOptimizer(const OptimizerConfig &config,
                                           const FeeConfig &feeConfig)
    : config_(config), feeCalculator_(feeConfig) {
  config_.validate();
}

TransactionAnalysis TransactionOptimizer::analyze(
    const CompiledTransaction &tx) const {
  TransactionAnalysis analysis = {};
  analysis.totalSize = tx.size();
  analysis.numSignatures = tx.signatures.size();
  analysis.numAccounts = tx.accounts.size();
  analysis.numInstructions = tx.instructions.size();

  analysis.signatureBytes =
      CompactU16::size(CompactU16::length(tx.signatures.size())) +
      tx.signatures.size() * Signature::SIZE;
  analysis.headerBytes = MessageHeader::SIZE + PublicKey::SIZE;
  analysis.accountKeyBytes =
      CompactU16::size(CompactU16::length(tx.accounts.size())) +
      tx.accounts.size() * PublicKey::SIZE;
  analysis.instructionMetadataBytes =
      CompactU16::size(CompactU16::length(tx.instructions.size()));
  for (const auto &ix : tx.instructions) {
    analysis.instructionDataBytes += ix.data.size();
    analysis.instructionMetadataBytes += ix.byteSize() - ix.data.size();
  }

  const auto used = referencedAccounts(tx);
  for (size_t i = 1; i < used.size(); i++) {
    if (!used[i]) analysis.unusedAccounts++;
  }

  // references to entries an earlier instruction already brought in
  std::vector<bool> seen(tx.accounts.size(), false);
  size_t totalReferences = 0;
  for (const auto &ix : tx.instructions) {
    for (const auto index : ix.accountIndices) {
      if (seen[index]) analysis.redundantReferences++;
    }
    totalReferences += ix.accountIndices.size();
    seen[ix.programIdIndex] = true;
    for (const auto index : ix.accountIndices) seen[index] = true;
  }

  const size_t payload = analysis.instructionDataBytes;
  const size_t overhead = analysis.totalSize - payload;
  analysis.overheadRatio =
      payload == 0 ? static_cast<double>(overhead)
                   : static_cast<double>(overhead) / payload;

  const double unusedRatio =
      static_cast<double>(analysis.unusedAccounts) /
      std::max<size_t>(analysis.numAccounts - 1, 1);
  const double redundancyRatio =
      static_cast<double>(analysis.redundantReferences) /
      std::max<size_t>(totalReferences, 1);
  const double overheadShare =
      static_cast<double>(overhead) / std::max<size_t>(analysis.totalSize, 1);
  const double score = 100.0 - 40.0 * unusedRatio - 20.0 * redundancyRatio -
                       40.0 * overheadShare;
  analysis.efficiencyScore =
      static_cast<uint8_t>(std::lround(std::clamp(score, 0.0, 100.0)));

  analysis.breakdown = {
      percentOf(analysis.signatureBytes, analysis.totalSize),
      percentOf(analysis.headerBytes, analysis.totalSize),
      percentOf(analysis.accountKeyBytes, analysis.totalSize),
      percentOf(analysis.instructionMetadataBytes, analysis.totalSize),
      percentOf(analysis.instructionDataBytes, analysis.totalSize)};

  auto &suggestions = analysis.suggestions;
  const double utilization =
      1.0 - static_cast<double>(analysis.unusedAccounts) /
                std::max<size_t>(analysis.numAccounts, 1);
  if (utilization < config_.minAccountUtilization) {
    suggestions.push_back(fmt::format(
        "{} of {} account table entries are not referenced by any "
        "instruction; the size strategy removes them",
        analysis.unusedAccounts, analysis.numAccounts));
  }
  if (analysis.numInstructions > config_.maxInstructionsBeforeBatching) {
    suggestions.push_back(fmt::format(
        "{} instructions; consider batching similar operations into fewer "
        "instructions",
        analysis.numInstructions));
  }
  if (analysis.numAccounts > config_.maxAccountsBeforeReview) {
    suggestions.push_back(fmt::format(
        "{} accounts; review whether all of them are necessary",
        analysis.numAccounts));
  }
  if (analysis.instructionDataBytes > config_.largeDataThreshold) {
    suggestions.push_back(fmt::format(
        "{} bytes of instruction data; consider compressing or restructuring",
        analysis.instructionDataBytes));
  }
  if (analysis.totalSize > PACKET_DATA_SIZE) {
    suggestions.push_back(fmt::format(
        "{} bytes exceed the {} byte packet limit by {}", analysis.totalSize,
        PACKET_DATA_SIZE, analysis.totalSize - PACKET_DATA_SIZE));
  } else if (PACKET_DATA_SIZE - analysis.totalSize < config_.nearLimitMargin) {
    suggestions.push_back(
        fmt::format("only {} bytes left below the packet limit",
                    PACKET_DATA_SIZE - analysis.totalSize));
  }
  return analysis;
}

uint8_t TransactionOptimizer::calculateEfficiencyScore(
    const CompiledTransaction &tx) const {
  return analyze(tx).efficiencyScore;
}

CompiledTransaction TransactionOptimizer::removeUnusedAccounts(
    const CompiledTransaction &tx, OptimizationReport &report) const {
  const auto used = referencedAccounts(tx);

  std::vector<bool> remove(tx.accounts.size(), false);
  bool anyRemoved = false;
  for (size_t i = 1; i < tx.accounts.size(); i++) {
    if (used[i]) continue;
    if (tx.isSigner(i)) {
      // dropping a signer would change who authorizes the transaction
      spdlog::warn("keeping unreferenced signer {}", tx.accounts[i].toBase58());
      report.suggestions.push_back(
          fmt::format("signer {} is not referenced by any instruction",
                      tx.accounts[i].toBase58()));
      continue;
    }
    remove[i] = true;
    anyRemoved = true;
  }
  if (!anyRemoved) return tx;

  const bool signed_ = std::any_of(
      tx.signatures.begin(), tx.signatures.end(),
      [](const std::optional<Signature> &sig) { return sig.has_value(); });
  if (signed_)
    throw Error(ErrorCode::UnsafeOptimization,
                "removing accounts would invalidate the existing signatures");

  CompiledTransaction result = tx;
  result.accounts.clear();
  std::vector<uint8_t> newIndex(tx.accounts.size(), 0);
  size_t removedReadOnlyUnsigned = 0;
  for (size_t i = 0; i < tx.accounts.size(); i++) {
    if (remove[i]) {
      if (!tx.isWritable(i)) removedReadOnlyUnsigned++;
      report.removedAccounts.push_back(tx.accounts[i]);
      report.changes.push_back(
          fmt::format("removed unreferenced account {} at index {}",
                      tx.accounts[i].toBase58(), i));
      continue;
    }
    newIndex[i] = static_cast<uint8_t>(result.accounts.size());
    result.accounts.push_back(tx.accounts[i]);
  }
  result.header.readOnlyUnsignedAccounts -=
      static_cast<uint8_t>(removedReadOnlyUnsigned);
  for (auto &ix : result.instructions) {
    ix.programIdIndex = newIndex[ix.programIdIndex];
    for (auto &index : ix.accountIndices) index = newIndex[index];
  }

  // every kept entry must keep its key and flags
  for (size_t i = 0; i < tx.accounts.size(); i++) {
    if (remove[i]) continue;
    const size_t j = newIndex[i];
    if (result.accounts[j] != tx.accounts[i] ||
        result.isSigner(j) != tx.isSigner(i) ||
        result.isWritable(j) != tx.isWritable(i))
      throw Error(ErrorCode::UnsafeOptimization,
                  fmt::format("renumbering would change the flags of {} at "
                              "index {}",
                              tx.accounts[i].toBase58(), i))
          .withAccount(tx.accounts[i].toBase58())
          .withOffset(i);
  }
  return result;
}

void TransactionOptimizer::suggestFeeChanges(const CompiledTransaction &tx,
                                             OptimizationReport &report) const {
  const auto budget = compute_budget::parse(tx);
  const auto estimated = feeCalculator_.estimateComputeUnits(tx);
  if (!budget.unitLimit.has_value()) {
    report.suggestions.push_back(fmt::format(
        "no compute unit limit set; add a limit near the estimated {} units "
        "to bound the priority fee",
        estimated));
  } else if (*budget.unitLimit > 2 * uint64_t(estimated)) {
    report.suggestions.push_back(fmt::format(
        "compute unit limit {} is more than twice the estimated {} units; "
        "lowering it reduces the priority fee",
        *budget.unitLimit, estimated));
  }
  if (!budget.unitPrice.has_value()) {
    report.suggestions.push_back(fmt::format(
        "no compute unit price set; the {} strategy pays {} micro-lamports "
        "per unit",
        to_string(FeeStrategy::Medium),
        feeCalculator_.priceFor(FeeStrategy::Medium)));
  }
}

std::pair<CompiledTransaction, OptimizationReport>
TransactionOptimizer::optimize(const CompiledTransaction &tx,
                               OptimizationStrategy strategy) const {
  OptimizationReport report = {};
  report.originalSize = tx.size();

  CompiledTransaction result = tx;
  if (strategy == OptimizationStrategy::Size ||
      strategy == OptimizationStrategy::Balanced) {
    result = removeUnusedAccounts(tx, report);
  }
  if (strategy == OptimizationStrategy::Cost ||
      strategy == OptimizationStrategy::Balanced) {
    suggestFeeChanges(result, report);
  }

  report.optimizedSize = result.size();
  report.bytesSaved = report.originalSize > report.optimizedSize
                          ? report.originalSize - report.optimizedSize
                          : 0;
  spdlog::debug("{} optimization: {} -> {} bytes, {} changes",
                to_string(strategy), report.originalSize, report.optimizedSize,
                report.changes.size());
  return {result, report};
}

///
/// utils
namespace utils {

bool exceedsMaxSize(const CompiledTransaction &tx) {
  return tx.size() > PACKET_DATA_SIZE;
}

int64_t availableSpace(const CompiledTransaction &tx) {
  return static_cast<int64_t>(PACKET_DATA_SIZE) -
         static_cast<int64_t>(tx.size());
}

bool canAddInstruction(const CompiledTransaction &tx, size_t dataSize,
                       size_t numNewAccounts) {
  // program index, two short length prefixes, indices and data, new keys
  const size_t added = 1 + 1 + numNewAccounts + 1 + dataSize +
                       numNewAccounts * PublicKey::SIZE;
  return availableSpace(tx) >= static_cast<int64_t>(added);
}

TransactionComparison compareTransactions(const CompiledTransaction &a,
                                          const CompiledTransaction &b) {
  return {static_cast<int64_t>(a.size()) - static_cast<int64_t>(b.size()),
          static_cast<int64_t>(a.instructions.size()) -
              static_cast<int64_t>(b.instructions.size()),
          static_cast<int64_t>(a.accounts.size()) -
              static_cast<int64_t>(b.accounts.size())};
}

}  // namespace utils

}  // namespace txasm
