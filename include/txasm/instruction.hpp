#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "txasm/codec.hpp"
#include "txasm/keys.hpp"

namespace txasm {

/**
 * Account metadata used to define instructions
 */
struct AccountMeta {
  PublicKey pubkey;
  bool isSigner;
  bool isWritable;

  static AccountMeta signer(const PublicKey &pubkey, bool isWritable);
  static AccountMeta writable(const PublicKey &pubkey, bool isSigner);
  static AccountMeta readonly(const PublicKey &pubkey, bool isSigner = false);

  bool operator==(const AccountMeta &other) const;
};

/**
 * One program call: the program, the accounts it touches in the order the
 * program expects them, and opaque instruction data
 */
struct Instruction {
  PublicKey programId;
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;

  /// program id followed by every account key, duplicates included
  std::vector<PublicKey> accountKeys() const;
};

/**
 * Incremental builder for an Instruction. Accounts keep their call order,
 * deduplication happens only when the transaction is compiled.
 */
class InstructionEncoder {
 public:
  explicit InstructionEncoder(const PublicKey &programId);

  InstructionEncoder &account(const AccountMeta &meta);
  InstructionEncoder &accounts(const std::vector<AccountMeta> &metas);
  InstructionEncoder &signer(const PublicKey &pubkey, bool isWritable);
  InstructionEncoder &writable(const PublicKey &pubkey, bool isSigner);
  InstructionEncoder &readonly(const PublicKey &pubkey);

  /// replace the data buffer
  InstructionEncoder &data(std::vector<uint8_t> bytes);
  InstructionEncoder &appendData(const std::vector<uint8_t> &bytes);
  InstructionEncoder &appendU8(uint8_t value);
  InstructionEncoder &appendU16(uint16_t value);
  InstructionEncoder &appendU32(uint32_t value);
  InstructionEncoder &appendU64(uint64_t value);
  InstructionEncoder &appendI64(int64_t value);
  InstructionEncoder &appendPublicKey(const PublicKey &pubkey);

  /**
   * Move the accumulated state into an Instruction and consume the encoder.
   * An instruction without accounts or data is valid. Any call after build
   * throws Error(BuilderConsumed).
   */
  Instruction build();

  bool isConsumed() const { return consumed_; }

 private:
  void ensureNotConsumed() const;

  PublicKey programId_;
  std::vector<AccountMeta> accounts_;
  std::vector<uint8_t> data_;
  bool consumed_ = false;
};

/**
 * An instruction to execute by a program, accounts referenced by their index
 * in the transaction account table
 */
struct CompiledInstruction {
  uint8_t programIdIndex;
  std::vector<uint8_t> accountIndices;
  std::vector<uint8_t> data;

  /**
   * Replace account keys by table indices
   * @throw Error(InvalidArgument) when a key is missing from the table
   */
  static CompiledInstruction fromInstruction(
      const Instruction &ix, const std::map<PublicKey, uint8_t> &indexByKey);

  static CompiledInstruction fromInstruction(
      const Instruction &ix, const std::vector<PublicKey> &accounts);

  static CompiledInstruction deserializeFrom(Reader &reader);

  /// @throw Error(InstructionDataTooLarge) for more than 65535 data bytes
  void serializeTo(std::vector<uint8_t> &buffer) const;

  /// number of bytes serializeTo appends
  size_t byteSize() const;

  bool matchesDiscriminator(const std::array<uint8_t, 8> &discriminator) const;

  bool operator==(const CompiledInstruction &other) const;
};

/**
 * Parsing of compiled instructions from wire bytes
 */
namespace InstructionDecoder {
CompiledInstruction decode(const std::vector<uint8_t> &bytes);

/// first 8 data bytes, the Anchor method discriminator
std::optional<std::array<uint8_t, 8>> extractDiscriminator(
    const std::vector<uint8_t> &data);
}  // namespace InstructionDecoder

}  // namespace txasm
