#include "txasm/builder.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

#include "txasm/error.hpp"

namespace txasm {

///
/// KeypairSigner
KeypairSigner::KeypairSigner(const Keypair &keypair) : keypair_(keypair) {
  initSodium();
}

PublicKey KeypairSigner::publicKey() const { return keypair_.publicKey; }

Signature KeypairSigner::sign(const std::vector<uint8_t> &message) const {
  return keypair_.privateKey.signMessage(message);
}

///
/// TransactionBuilder
void TransactionBuilder::ensureNotConsumed() const {
  if (consumed_)
    throw Error(ErrorCode::BuilderConsumed,
                "transaction builder was already built; clone() it before "
                "building to reuse its state");
}

TransactionBuilder &TransactionBuilder::payer(const PublicKey &payer) {
  ensureNotConsumed();
  payer_ = payer;
  return *this;
}

TransactionBuilder &TransactionBuilder::recentBlockhash(
    const PublicKey &blockhash) {
  ensureNotConsumed();
  recentBlockhash_ = blockhash;
  return *this;
}

TransactionBuilder &TransactionBuilder::addInstruction(
    Instruction instruction) {
  ensureNotConsumed();
  instructions_.push_back(std::move(instruction));
  return *this;
}

TransactionBuilder &TransactionBuilder::addInstructions(
    std::vector<Instruction> instructions) {
  ensureNotConsumed();
  for (auto &instruction : instructions) {
    instructions_.push_back(std::move(instruction));
  }
  return *this;
}

TransactionBuilder TransactionBuilder::clone() const {
  ensureNotConsumed();
  return *this;
}

CompiledTransaction TransactionBuilder::buildUnsigned() {
  ensureNotConsumed();
  auto tx = CompiledTransaction::fromInstructions(instructions_, payer_,
                                                  recentBlockhash_);
  consumed_ = true;
  instructions_.clear();
  return tx;
}

CompiledTransaction TransactionBuilder::buildAndSign(
    const std::vector<const Signer *> &signers) {
  ensureNotConsumed();
  auto tx = CompiledTransaction::fromInstructions(instructions_, payer_,
                                                  recentBlockhash_);
  const size_t required = tx.header.requiredSignatures;

  // match every provided signer to its slot before signing anything
  std::vector<const Signer *> bySlot(required, nullptr);
  for (const auto *signer : signers) {
    if (signer == nullptr)
      throw Error(ErrorCode::InvalidArgument, "null signer");
    const auto key = signer->publicKey();
    const auto index = tx.indexOf(key);
    if (!index.has_value() || *index >= required)
      throw Error(ErrorCode::UnexpectedSigner,
                  key.toBase58() + " is not a required signer")
          .withAccount(key.toBase58());
    if (bySlot[*index] != nullptr)
      throw Error(ErrorCode::UnexpectedSigner,
                  key.toBase58() + " was provided more than once")
          .withAccount(key.toBase58())
          .withOffset(*index);
    bySlot[*index] = signer;
  }
  for (size_t i = 0; i < required; i++) {
    if (bySlot[i] == nullptr)
      throw Error(ErrorCode::MissingSigner,
                  fmt::format("no signer for {} at index {}",
                              tx.accounts[i].toBase58(), i))
          .withAccount(tx.accounts[i].toBase58())
          .withOffset(i);
  }

  const auto message = tx.messageBytes();
  for (size_t i = 0; i < required; i++) {
    try {
      tx.signatures[i] = bySlot[i]->sign(message);
    } catch (const std::exception &e) {
      throw Error(ErrorCode::SigningFailed,
                  fmt::format("signer {} failed: {}", tx.accounts[i].toBase58(),
                              e.what()))
          .withAccount(tx.accounts[i].toBase58())
          .withOffset(i);
    }
  }
  spdlog::debug("signed transaction with {} signatures over {} message bytes",
                required, message.size());

  consumed_ = true;
  instructions_.clear();
  return tx;
}

}  // namespace txasm
