#include "txasm/instruction.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "txasm/error.hpp"

namespace txasm {

///
/// AccountMeta
AccountMeta AccountMeta::signer(const PublicKey &pubkey, bool isWritable) {
  return {pubkey, true, isWritable};
}

AccountMeta AccountMeta::writable(const PublicKey &pubkey, bool isSigner) {
  return {pubkey, isSigner, true};
}

AccountMeta AccountMeta::readonly(const PublicKey &pubkey, bool isSigner) {
  return {pubkey, isSigner, false};
}

bool AccountMeta::operator==(const AccountMeta &other) const {
  return pubkey == other.pubkey && isSigner == other.isSigner &&
         isWritable == other.isWritable;
}

///
/// Instruction
std::vector<PublicKey> Instruction::accountKeys() const {
  std::vector<PublicKey> keys = {programId};
  for (const auto &account : accounts) keys.push_back(account.pubkey);
  return keys;
}

///
/// InstructionEncoder
InstructionEncoder::InstructionEncoder(const PublicKey &programId)
    : programId_(programId) {}

void InstructionEncoder::ensureNotConsumed() const {
  if (consumed_)
    throw Error(ErrorCode::BuilderConsumed,
                "instruction encoder was already built");
}

InstructionEncoder &InstructionEncoder::account(const AccountMeta &meta) {
  ensureNotConsumed();
  accounts_.push_back(meta);
  return *this;
}

InstructionEncoder &InstructionEncoder::accounts(
    const std::vector<AccountMeta> &metas) {
  ensureNotConsumed();
  accounts_.insert(accounts_.end(), metas.begin(), metas.end());
  return *this;
}

InstructionEncoder &InstructionEncoder::signer(const PublicKey &pubkey,
                                               bool isWritable) {
  return account(AccountMeta::signer(pubkey, isWritable));
}

InstructionEncoder &InstructionEncoder::writable(const PublicKey &pubkey,
                                                 bool isSigner) {
  return account(AccountMeta::writable(pubkey, isSigner));
}

InstructionEncoder &InstructionEncoder::readonly(const PublicKey &pubkey) {
  return account(AccountMeta::readonly(pubkey));
}

InstructionEncoder &InstructionEncoder::data(std::vector<uint8_t> bytes) {
  ensureNotConsumed();
  data_ = std::move(bytes);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendData(
    const std::vector<uint8_t> &bytes) {
  ensureNotConsumed();
  encodeBytes(bytes, data_);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendU8(uint8_t value) {
  ensureNotConsumed();
  encodeU8(value, data_);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendU16(uint16_t value) {
  ensureNotConsumed();
  encodeU16(value, data_);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendU32(uint32_t value) {
  ensureNotConsumed();
  encodeU32(value, data_);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendU64(uint64_t value) {
  ensureNotConsumed();
  encodeU64(value, data_);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendI64(int64_t value) {
  ensureNotConsumed();
  encodeI64(value, data_);
  return *this;
}

InstructionEncoder &InstructionEncoder::appendPublicKey(
    const PublicKey &pubkey) {
  ensureNotConsumed();
  encodeBytes(pubkey.data, data_);
  return *this;
}

Instruction InstructionEncoder::build() {
  ensureNotConsumed();
  consumed_ = true;
  Instruction instruction = {programId_, std::move(accounts_),
                             std::move(data_)};
  accounts_.clear();
  data_.clear();
  return instruction;
}

///
/// CompiledInstruction
CompiledInstruction CompiledInstruction::fromInstruction(
    const Instruction &ix, const std::map<PublicKey, uint8_t> &indexByKey) {
  const auto lookup = [&indexByKey](const PublicKey &key) {
    const auto it = indexByKey.find(key);
    if (it == indexByKey.end())
      throw Error(ErrorCode::InvalidArgument,
                  "account not in account table: " + key.toBase58())
          .withAccount(key.toBase58());
    return it->second;
  };
  std::vector<uint8_t> accountIndices;
  accountIndices.reserve(ix.accounts.size());
  for (const auto &account : ix.accounts) {
    accountIndices.push_back(lookup(account.pubkey));
  }
  return {lookup(ix.programId), accountIndices, ix.data};
}

CompiledInstruction CompiledInstruction::fromInstruction(
    const Instruction &ix, const std::vector<PublicKey> &accounts) {
  std::map<PublicKey, uint8_t> indexByKey;
  for (size_t i = 0; i < accounts.size() && i <= 0xff; i++) {
    indexByKey.emplace(accounts[i], static_cast<uint8_t>(i));
  }
  return fromInstruction(ix, indexByKey);
}

CompiledInstruction CompiledInstruction::deserializeFrom(Reader &reader) {
  CompiledInstruction ix;
  ix.programIdIndex = reader.readU8();
  ix.accountIndices = reader.readLengthPrefixed();
  ix.data = reader.readLengthPrefixed();
  return ix;
}

namespace {
void ensureDataFits(const std::vector<uint8_t> &data) {
  if (data.size() > CompactU16::MAX)
    throw Error(ErrorCode::InstructionDataTooLarge,
                fmt::format("compiled instruction carries {} data bytes, max {}",
                            data.size(), CompactU16::MAX))
        .withCount(data.size());
}
}  // namespace

void CompiledInstruction::serializeTo(std::vector<uint8_t> &buffer) const {
  ensureDataFits(data);
  buffer.push_back(programIdIndex);
  CompactU16::encode(accountIndices, buffer);
  CompactU16::encode(data, buffer);
}

size_t CompiledInstruction::byteSize() const {
  ensureDataFits(data);
  return byteSize::U8 +
         CompactU16::size(CompactU16::length(accountIndices.size())) +
         accountIndices.size() +
         CompactU16::size(CompactU16::length(data.size())) + data.size();
}

bool CompiledInstruction::matchesDiscriminator(
    const std::array<uint8_t, 8> &discriminator) const {
  return data.size() >= discriminator.size() &&
         std::equal(discriminator.begin(), discriminator.end(), data.begin());
}

bool CompiledInstruction::operator==(const CompiledInstruction &other) const {
  return programIdIndex == other.programIdIndex &&
         accountIndices == other.accountIndices && data == other.data;
}

///
/// InstructionDecoder
namespace InstructionDecoder {
CompiledInstruction decode(const std::vector<uint8_t> &bytes) {
  Reader reader(bytes);
  return CompiledInstruction::deserializeFrom(reader);
}

std::optional<std::array<uint8_t, 8>> extractDiscriminator(
    const std::vector<uint8_t> &data) {
  if (data.size() < 8) return std::nullopt;
  std::array<uint8_t, 8> discriminator;
  std::copy(data.begin(), data.begin() + 8, discriminator.begin());
  return discriminator;
}
}  // namespace InstructionDecoder

}  // namespace txasm
