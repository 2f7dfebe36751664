#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "txasm/instruction.hpp"
#include "txasm/keys.hpp"

namespace txasm {

/// one byte account table indices
const size_t MAX_ACCOUNTS = 256;
/// largest serialized transaction that fits a network packet
const size_t PACKET_DATA_SIZE = 1232;

struct MessageHeader {
  uint8_t requiredSignatures;
  uint8_t readOnlySignedAccounts;
  uint8_t readOnlyUnsignedAccounts;

  static const size_t SIZE = 3;

  void serializeTo(std::vector<uint8_t> &buffer) const;

  bool operator==(const MessageHeader &other) const;
};

/**
 * Account table entry with the flags merged over every reference
 */
struct AccountTableEntry {
  PublicKey pubkey;
  bool isSigner;
  bool isWritable;
};

struct CompiledTransaction {
  MessageHeader header;
  /// deduplicated account table, fee payer at index 0
  std::vector<PublicKey> accounts;
  PublicKey recentBlockhash;
  std::vector<CompiledInstruction> instructions;
  /// one slot per required signature, in account table order
  std::vector<std::optional<Signature>> signatures;

  /**
   * Compile instructions into a transaction. The fee payer becomes the
   * writable signer at index 0; every other account appears once with its
   * flags OR-merged, ordered writable signers, readonly signers, writable
   * non-signers, readonly non-signers, each group in first-seen order.
   * @throw Error(MissingPayer | MissingBlockhash | EmptyInstructionList |
   * TooManyAccounts | InstructionDataTooLarge)
   */
  static CompiledTransaction fromInstructions(
      const std::vector<Instruction> &instructions,
      const std::optional<PublicKey> &payer,
      const std::optional<PublicKey> &blockhash);

  /**
   * Parse a transaction in wire format, signature slots first
   * @throw Error(MalformedVarint | UnexpectedEof | MalformedTransaction)
   */
  static CompiledTransaction deserialize(const std::vector<uint8_t> &bytes);

  /**
   * Serialize the message: header, account table, blockhash, instructions.
   * These are the bytes every signer signs.
   */
  void serializeTo(std::vector<uint8_t> &buffer) const;

  std::vector<uint8_t> messageBytes() const;

  /**
   * Serialize the full transaction; unfilled signature slots are written as
   * 64 zero bytes
   */
  std::vector<uint8_t> serialize() const;

  /// serialized message size in bytes
  size_t messageSize() const;

  /// serialized transaction size in bytes, equal to serialize().size()
  size_t size() const;

  const PublicKey &feePayer() const { return accounts.front(); }
  bool isSigner(size_t index) const;
  bool isWritable(size_t index) const;
  std::vector<AccountTableEntry> accountTable() const;
  std::optional<size_t> indexOf(const PublicKey &key) const;

  /**
   * Fill the empty signature slot of a required signer
   * @throw Error(UnexpectedSigner | SignatureSlotFilled)
   */
  void addSignature(const PublicKey &signer, const Signature &signature);

  bool isFullySigned() const;

  /// true when every slot is filled with a valid signature of the message
  bool verifySignatures() const;
};

}  // namespace txasm
