#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "helpers.hpp"

using txasm::CompiledTransaction;
using txasm::ErrorCode;
using txasm::InstructionEncoder;
using txasm::OptimizationStrategy;
using txasm::TransactionOptimizer;
namespace compute_budget = txasm::compute_budget;
namespace utils = txasm::utils;

namespace {
const txasm::PublicKey W = key(4);
const txasm::PublicKey U = key(5);
const txasm::PublicKey X = key(9);

CompiledTransaction compile(const std::vector<txasm::Instruction> &ixs) {
  return CompiledTransaction::fromInstructions(ixs, key(1), key(0xbb));
}

// table [payer, W, U, X, memo] with only the memo instruction left
CompiledTransaction withUnusedAccounts() {
  auto tx = compile(
      {InstructionEncoder(X).readonly(U).writable(W, false).build(),
       memo("Hello")});
  tx.instructions.erase(tx.instructions.begin());
  return tx;
}

bool mentions(const std::vector<std::string> &lines, const std::string &text) {
  return std::any_of(lines.begin(), lines.end(), [&text](const std::string &l) {
    return l.find(text) != std::string::npos;
  });
}
}  // namespace

TEST_CASE("analyze size breakdown") {
  const TransactionOptimizer optimizer;
  const auto tx = compile({memo("Hello")});
  const auto analysis = optimizer.analyze(tx);

  CHECK_EQ(analysis.totalSize, tx.size());
  CHECK_EQ(analysis.signatureBytes, 1 + 64);
  CHECK_EQ(analysis.headerBytes, 3 + 32);
  CHECK_EQ(analysis.accountKeyBytes, 1 + 2 * 32);
  CHECK_EQ(analysis.instructionMetadataBytes, 1 + 3);
  CHECK_EQ(analysis.instructionDataBytes, 5);
  CHECK_EQ(analysis.signatureBytes + analysis.headerBytes +
               analysis.accountKeyBytes + analysis.instructionMetadataBytes +
               analysis.instructionDataBytes,
           analysis.totalSize);

  const auto &b = analysis.breakdown;
  CHECK_EQ(b.signaturesPercent + b.headerPercent + b.accountKeysPercent +
               b.instructionMetadataPercent + b.instructionDataPercent,
           doctest::Approx(100.0));
  CHECK_EQ(b.instructionDataPercent, doctest::Approx(500.0 / 174));

  CHECK_EQ(analysis.numSignatures, 1);
  CHECK_EQ(analysis.numAccounts, 2);
  CHECK_EQ(analysis.numInstructions, 1);
  CHECK_EQ(analysis.unusedAccounts, 0);
  CHECK_EQ(analysis.redundantReferences, 0);
  CHECK_EQ(analysis.overheadRatio, doctest::Approx(169.0 / 5));
  CHECK_LE(analysis.efficiencyScore, 100);
  CHECK(analysis.suggestions.empty());
}

TEST_CASE("analyze unused and redundant accounts") {
  const TransactionOptimizer optimizer;

  const auto unused = optimizer.analyze(withUnusedAccounts());
  CHECK_EQ(unused.numAccounts, 5);
  CHECK_EQ(unused.unusedAccounts, 3);
  CHECK(mentions(unused.suggestions, "3 of 5 account table entries"));

  const auto redundant = optimizer.analyze(
      compile({InstructionEncoder(X).writable(W, false).build(),
               InstructionEncoder(X).readonly(W).readonly(U).build()}));
  CHECK_EQ(redundant.unusedAccounts, 0);
  CHECK_EQ(redundant.redundantReferences, 1);

  const auto optimized =
      optimizer.optimize(withUnusedAccounts(), OptimizationStrategy::Size)
          .first;
  CHECK_GT(optimizer.calculateEfficiencyScore(optimized),
           optimizer.calculateEfficiencyScore(withUnusedAccounts()));
}

TEST_CASE("analyze threshold suggestions") {
  const TransactionOptimizer optimizer;

  SUBCASE("many instructions") {
    std::vector<txasm::Instruction> ixs;
    for (int i = 0; i < 6; i++) ixs.push_back(memo("m"));
    CHECK(mentions(optimizer.analyze(compile(ixs)).suggestions,
                   "6 instructions"));
  }
  SUBCASE("many accounts") {
    InstructionEncoder encoder(X);
    for (uint8_t i = 0; i < 21; i++) encoder.readonly(key(0x40 + i));
    CHECK(mentions(optimizer.analyze(compile({encoder.build()})).suggestions,
                   "23 accounts"));
  }
  SUBCASE("over the packet limit") {
    const auto tx = compile({memo(std::string(1100, 'x'))});
    CHECK_EQ(tx.size(), 1270);
    CHECK(utils::exceedsMaxSize(tx));
    CHECK_EQ(utils::availableSpace(tx), -38);
    const auto analysis = optimizer.analyze(tx);
    CHECK(mentions(analysis.suggestions, "exceed the 1232 byte packet limit"));
    CHECK(mentions(analysis.suggestions, "1100 bytes of instruction data"));
  }
  SUBCASE("near the packet limit") {
    const auto tx = compile({memo(std::string(1000, 'x'))});
    CHECK_FALSE(utils::exceedsMaxSize(tx));
    CHECK(mentions(optimizer.analyze(tx).suggestions, "only 62 bytes left"));
  }
}

TEST_CASE("size optimization removes unreferenced accounts") {
  const TransactionOptimizer optimizer;
  const auto tx = withUnusedAccounts();
  const auto result = optimizer.optimize(tx, OptimizationStrategy::Size);
  const auto &optimized = result.first;
  const auto &report = result.second;

  // same bytes as compiling the remaining instruction directly
  CHECK_EQ(optimized.serialize(), compile({memo("Hello")}).serialize());
  CHECK_EQ(optimized.header, (txasm::MessageHeader{1, 0, 1}));
  CHECK_EQ(optimized.instructions[0].programIdIndex, 1);

  CHECK_EQ(report.originalSize, tx.size());
  CHECK_EQ(report.optimizedSize, optimized.size());
  CHECK_EQ(report.bytesSaved, 3 * 32);
  CHECK_EQ(report.removedAccounts, (std::vector<txasm::PublicKey>{W, U, X}));
  CHECK_EQ(report.changes.size(), 3);

  const auto comparison = utils::compareTransactions(tx, optimized);
  CHECK_EQ(comparison.sizeDiff, 96);
  CHECK_EQ(comparison.instructionDiff, 0);
  CHECK_EQ(comparison.accountDiff, 3);

  const txasm::json j = report;
  CHECK_EQ(j["bytesSaved"], 96);
  CHECK_EQ(j["removedAccounts"][0], W.toBase58());
}

TEST_CASE("size optimization is idempotent") {
  const TransactionOptimizer optimizer;
  const auto first =
      optimizer.optimize(withUnusedAccounts(), OptimizationStrategy::Size);
  const auto second = optimizer.optimize(first.first, OptimizationStrategy::Size);
  CHECK_EQ(second.second.bytesSaved, 0);
  CHECK(second.second.changes.empty());
  CHECK(second.second.removedAccounts.empty());
  CHECK_EQ(second.first.serialize(), first.first.serialize());
}

TEST_CASE("size optimization keeps signers") {
  const TransactionOptimizer optimizer;
  const auto S = key(2);
  auto tx = compile(
      {InstructionEncoder(X).signer(S, false).build(), memo("Hello")});
  tx.instructions.erase(tx.instructions.begin());

  const auto result = optimizer.optimize(tx, OptimizationStrategy::Size);
  const auto &optimized = result.first;
  CHECK_EQ(optimized.accounts.size(), 3);
  CHECK_EQ(optimized.accounts[1], S);
  CHECK(optimized.isSigner(1));
  CHECK_FALSE(optimized.isWritable(1));
  CHECK_EQ(optimized.header, (txasm::MessageHeader{2, 1, 1}));
  CHECK_EQ(optimized.signatures.size(), 2);
  CHECK_EQ(result.second.removedAccounts, (std::vector<txasm::PublicKey>{X}));
  CHECK(mentions(result.second.suggestions, S.toBase58()));
}

TEST_CASE("signed transactions are not rewritten") {
  const TransactionOptimizer optimizer;
  auto tx = withUnusedAccounts();
  txasm::Signature signature;
  signature.data.fill(0x11);
  tx.signatures[0] = signature;

  CHECK(thrownCode([&] { optimizer.optimize(tx, OptimizationStrategy::Size); }) ==
        ErrorCode::UnsafeOptimization);
  CHECK(thrownCode([&] {
          optimizer.optimize(tx, OptimizationStrategy::Balanced);
        }) == ErrorCode::UnsafeOptimization);

  // nothing to rewrite
  const auto cost = optimizer.optimize(tx, OptimizationStrategy::Cost);
  CHECK_EQ(cost.first.serialize(), tx.serialize());

  auto signedMemo = compile({memo("Hello")});
  signedMemo.signatures[0] = signature;
  const auto size = optimizer.optimize(signedMemo, OptimizationStrategy::Size);
  CHECK_EQ(size.second.bytesSaved, 0);
  CHECK_EQ(size.first.signatures[0], std::optional<txasm::Signature>(signature));
}

TEST_CASE("cost optimization only suggests") {
  const TransactionOptimizer optimizer;

  SUBCASE("no compute budget") {
    const auto tx = compile({memo("Hello")});
    const auto result = optimizer.optimize(tx, OptimizationStrategy::Cost);
    CHECK_EQ(result.first.serialize(), tx.serialize());
    CHECK(result.second.changes.empty());
    CHECK_EQ(result.second.bytesSaved, 0);
    CHECK(mentions(result.second.suggestions, "no compute unit limit"));
    CHECK(mentions(result.second.suggestions, "no compute unit price"));
  }
  SUBCASE("limit far above the estimate") {
    const auto tx = compile({compute_budget::setComputeUnitLimit(1000000),
                             compute_budget::setComputeUnitPrice(100),
                             memo("Hello")});
    const auto result = optimizer.optimize(tx, OptimizationStrategy::Cost);
    REQUIRE_EQ(result.second.suggestions.size(), 1);
    CHECK(mentions(result.second.suggestions, "compute unit limit 1000000"));
  }
  SUBCASE("tight compute budget") {
    const auto tx = compile({compute_budget::setComputeUnitLimit(5000),
                             compute_budget::setComputeUnitPrice(100),
                             memo("Hello")});
    CHECK(optimizer.optimize(tx, OptimizationStrategy::Cost)
              .second.suggestions.empty());
  }
}

TEST_CASE("balanced optimization") {
  const TransactionOptimizer optimizer;
  const auto result =
      optimizer.optimize(withUnusedAccounts(), OptimizationStrategy::Balanced);
  CHECK_EQ(result.second.changes.size(), 3);
  CHECK_EQ(result.second.bytesSaved, 96);
  CHECK(mentions(result.second.suggestions, "no compute unit limit"));
  CHECK_EQ(txasm::to_string(OptimizationStrategy::Balanced), "balanced");
}

TEST_CASE("room for another instruction") {
  const auto tx = compile({memo("Hello")});
  CHECK_EQ(utils::availableSpace(tx), 1232 - 174);
  // program index, three length bytes, one index, data and one new key
  CHECK(utils::canAddInstruction(tx, 1000, 1));
  CHECK_FALSE(utils::canAddInstruction(tx, 1030, 1));
}

TEST_CASE("optimizer config validation") {
  txasm::OptimizerConfig config;
  config.minAccountUtilization = 1.5;
  CHECK(thrownCode([&] { TransactionOptimizer optimizer(config); }) ==
        ErrorCode::InvalidConfig);

  config.minAccountUtilization = 0.3;
  const TransactionOptimizer lenient(config);
  // 40 percent utilization stays above the threshold
  CHECK_FALSE(mentions(lenient.analyze(withUnusedAccounts()).suggestions,
                       "account table entries"));
}
