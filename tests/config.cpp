#include <string>

#include "helpers.hpp"

using txasm::ErrorCode;
using txasm::FeeConfig;
using txasm::OptimizerConfig;

TEST_CASE("load fee config") {
  const auto config =
      txasm::configFromFile<FeeConfig>(FIXTURES + "/config/fee.json");
  CHECK_EQ(config.lamportsPerSignature, 10000);
  CHECK_EQ(config.highPrice, 2000);
  CHECK_EQ(config.urgentPrice, 20000);
  // missing keys keep their defaults
  CHECK_EQ(config.lowPrice, 1);
  CHECK_EQ(config.mediumPrice, 100);
  CHECK_EQ(config.maxComputeUnitLimit, 1400000);

  const txasm::FeeCalculator calculator(config);
  CHECK_EQ(calculator.calculateBaseFee(1), 10000);
  CHECK_EQ(calculator.priceFor(txasm::FeeStrategy::High), 2000);
}

TEST_CASE("load optimizer config") {
  const auto config = txasm::configFromFile<OptimizerConfig>(
      FIXTURES + "/config/optimizer.json");
  CHECK_EQ(config.minAccountUtilization, doctest::Approx(0.5));
  CHECK_EQ(config.maxInstructionsBeforeBatching, 2);
  CHECK_EQ(config.nearLimitMargin, 200);
  CHECK_EQ(config.maxAccountsBeforeReview, 20);
  CHECK_EQ(config.largeDataThreshold, 1000);

  const txasm::TransactionOptimizer optimizer(config);
  const auto tx = txasm::CompiledTransaction::fromInstructions(
      {memo("a"), memo("b"), memo("c")}, key(1), key(0xbb));
  bool batching = false;
  for (const auto &suggestion : optimizer.analyze(tx).suggestions) {
    batching |= suggestion.find("3 instructions") != std::string::npos;
  }
  CHECK(batching);
}

TEST_CASE("invalid config files") {
  CHECK(thrownCode([] {
          txasm::configFromFile<FeeConfig>(FIXTURES + "/config/missing.json");
        }) == ErrorCode::InvalidConfig);
  CHECK(thrownCode([] {
          txasm::configFromFile<FeeConfig>(FIXTURES + "/config/malformed.json");
        }) == ErrorCode::InvalidConfig);
  CHECK(thrownCode([] {
          txasm::configFromFile<FeeConfig>(FIXTURES +
                                           "/config/wrong_type.json");
        }) == ErrorCode::InvalidConfig);
  // parses, but fails validation
  CHECK(thrownCode([] {
          txasm::configFromFile<FeeConfig>(FIXTURES +
                                           "/config/fee_unordered_prices.json");
        }) == ErrorCode::InvalidConfig);
}

TEST_CASE("config json round trip") {
  FeeConfig fee;
  fee.urgentPrice = 7777;
  const txasm::json feeJson = fee;
  CHECK_EQ(feeJson["urgentPrice"], 7777);
  CHECK_EQ(feeJson.get<FeeConfig>().urgentPrice, 7777);

  OptimizerConfig optimizer;
  optimizer.largeDataThreshold = 64;
  const txasm::json optimizerJson = optimizer;
  CHECK_EQ(optimizerJson.get<OptimizerConfig>().largeDataThreshold, 64);
}
