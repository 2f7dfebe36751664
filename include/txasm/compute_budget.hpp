#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "txasm/instruction.hpp"
#include "txasm/keys.hpp"
#include "txasm/transaction.hpp"

namespace txasm {
namespace compute_budget {

const std::string PROGRAM_ID = "ComputeBudget111111111111111111111111111111";

/// instruction data discriminators
const uint8_t REQUEST_HEAP_FRAME = 1;
const uint8_t SET_COMPUTE_UNIT_LIMIT = 2;
const uint8_t SET_COMPUTE_UNIT_PRICE = 3;

const PublicKey &programId();

/**
 * Compute budget requested by a transaction
 */
struct ComputeBudget {
  std::optional<uint32_t> unitLimit;
  /** micro-lamports per compute unit */
  std::optional<uint64_t> unitPrice;
  size_t instructionCount = 0;
};

/**
 * Discriminator 2 followed by the limit as u32 little-endian
 */
Instruction setComputeUnitLimit(uint32_t units);

/**
 * Discriminator 3 followed by the price in micro-lamports as u64
 * little-endian
 */
Instruction setComputeUnitPrice(uint64_t microLamports);

/**
 * Scan the compiled instructions for the compute budget program. When a
 * parameter is set more than once the last instruction wins. Unknown
 * discriminators and short data are skipped.
 */
ComputeBudget parse(const CompiledTransaction &tx);

}  // namespace compute_budget
}  // namespace txasm
