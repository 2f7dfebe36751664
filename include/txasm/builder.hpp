#pragma once

#include <optional>
#include <vector>

#include "txasm/instruction.hpp"
#include "txasm/keys.hpp"
#include "txasm/transaction.hpp"

namespace txasm {

/**
 * Signing capability: produces the signature of a message for one identity.
 * Implementations report failure by throwing.
 */
class Signer {
 public:
  virtual ~Signer() = default;

  virtual PublicKey publicKey() const = 0;

  virtual Signature sign(const std::vector<uint8_t> &message) const = 0;
};

/**
 * ed25519 signer backed by a libsodium keypair
 */
class KeypairSigner : public Signer {
 public:
  explicit KeypairSigner(const Keypair &keypair);

  PublicKey publicKey() const override;

  Signature sign(const std::vector<uint8_t> &message) const override;

 private:
  Keypair keypair_;
};

/**
 * Accumulates a fee payer, a recent blockhash and instructions, then compiles
 * them. Any build call moves the instructions into the result and consumes
 * the builder; clone() first to build more than once.
 */
class TransactionBuilder {
 public:
  TransactionBuilder &payer(const PublicKey &payer);
  TransactionBuilder &recentBlockhash(const PublicKey &blockhash);
  TransactionBuilder &addInstruction(Instruction instruction);
  TransactionBuilder &addInstructions(std::vector<Instruction> instructions);

  /**
   * Compile with every signature slot empty
   */
  CompiledTransaction buildUnsigned();

  /**
   * Compile and sign the message with each signer. Every required signer
   * must be provided exactly once.
   * @throw Error(MissingSigner | UnexpectedSigner | SigningFailed) besides
   * the compile errors
   */
  CompiledTransaction buildAndSign(const std::vector<const Signer *> &signers);

  /// copy of the accumulated state
  TransactionBuilder clone() const;

  bool isConsumed() const { return consumed_; }

  size_t instructionCount() const { return instructions_.size(); }

 private:
  void ensureNotConsumed() const;

  std::optional<PublicKey> payer_;
  std::optional<PublicKey> recentBlockhash_;
  std::vector<Instruction> instructions_;
  bool consumed_ = false;
};

}  // namespace txasm
