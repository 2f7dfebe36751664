#include "txasm/compute_budget.hpp"

#include <spdlog/spdlog.h>

#include "txasm/codec.hpp"

namespace txasm {
namespace compute_budget {

const PublicKey &programId() {
  static const PublicKey id = PublicKey::fromBase58(PROGRAM_ID);
  return id;
}

Instruction setComputeUnitLimit(uint32_t units) {
  return InstructionEncoder(programId())
      .appendU8(SET_COMPUTE_UNIT_LIMIT)
      .appendU32(units)
      .build();
}

Instruction setComputeUnitPrice(uint64_t microLamports) {
  return InstructionEncoder(programId())
      .appendU8(SET_COMPUTE_UNIT_PRICE)
      .appendU64(microLamports)
      .build();
}

ComputeBudget parse(const CompiledTransaction &tx) {
  ComputeBudget budget;
  const auto programIndex = tx.indexOf(programId());
  if (!programIndex.has_value()) return budget;

  for (const auto &ix : tx.instructions) {
    if (ix.programIdIndex != *programIndex) continue;
    budget.instructionCount++;
    if (ix.data.empty()) continue;
    Reader reader(ix.data);
    const auto discriminator = reader.readU8();
    if (discriminator == SET_COMPUTE_UNIT_LIMIT &&
        reader.remaining() >= byteSize::U32) {
      budget.unitLimit = reader.readU32();
    } else if (discriminator == SET_COMPUTE_UNIT_PRICE &&
               reader.remaining() >= byteSize::U64) {
      budget.unitPrice = reader.readU64();
    } else if (discriminator == SET_COMPUTE_UNIT_LIMIT ||
               discriminator == SET_COMPUTE_UNIT_PRICE) {
      spdlog::warn("skipping compute budget instruction {} with {} data bytes",
                   discriminator, ix.data.size());
    }
  }
  return budget;
}

}  // namespace compute_budget
}  // namespace txasm
