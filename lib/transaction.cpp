#include "txasm/transaction.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

#include "txasm/codec.hpp"
#include "txasm/error.hpp"

namespace txasm {

///
/// MessageHeader
void MessageHeader::serializeTo(std::vector<uint8_t> &buffer) const {
  buffer.push_back(requiredSignatures);
  buffer.push_back(readOnlySignedAccounts);
  buffer.push_back(readOnlyUnsignedAccounts);
}

bool MessageHeader::operator==(const MessageHeader &other) const {
  return requiredSignatures == other.requiredSignatures &&
         readOnlySignedAccounts == other.readOnlySignedAccounts &&
         readOnlyUnsignedAccounts == other.readOnlyUnsignedAccounts;
}

namespace {
// ordering class of an account: signer+writable, signer, writable, other
int accountClass(const AccountMeta &meta) {
  if (meta.isSigner) return meta.isWritable ? 0 : 1;
  return meta.isWritable ? 2 : 3;
}

Error malformed(const std::string &message) {
  return Error(ErrorCode::MalformedTransaction, message);
}
}  // namespace

///
/// CompiledTransaction
CompiledTransaction CompiledTransaction::fromInstructions(
    const std::vector<Instruction> &instructions,
    const std::optional<PublicKey> &payer,
    const std::optional<PublicKey> &blockhash) {
  if (!payer.has_value())
    throw Error(ErrorCode::MissingPayer, "fee payer not set");
  if (!blockhash.has_value())
    throw Error(ErrorCode::MissingBlockhash, "recent blockhash not set");
  if (instructions.empty())
    throw Error(ErrorCode::EmptyInstructionList, "no instructions provided");
  if (instructions.size() > CompactU16::MAX)
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("{} instructions exceed the compact-u16 range",
                            instructions.size()))
        .withCount(instructions.size());
  for (size_t i = 0; i < instructions.size(); i++) {
    const auto &ix = instructions[i];
    if (ix.data.size() > CompactU16::MAX)
      throw Error(ErrorCode::InstructionDataTooLarge,
                  fmt::format("instruction {} carries {} data bytes, max {}", i,
                              ix.data.size(), CompactU16::MAX))
          .withCount(ix.data.size())
          .withAccount(ix.programId.toBase58());
    if (ix.accounts.size() > CompactU16::MAX)
      throw Error(ErrorCode::TooManyAccounts,
                  fmt::format("instruction {} references {} accounts", i,
                              ix.accounts.size()))
          .withCount(ix.accounts.size());
  }

  // collect all program ids and accounts including the payer, merging metas
  // that reference the same pubkey with maximum privileges
  std::vector<AccountMeta> uniqueMetas = {{*payer, true, true}};
  std::map<PublicKey, size_t> slotByKey = {{*payer, 0}};
  const auto merge = [&uniqueMetas, &slotByKey](const AccountMeta &meta) {
    const auto dup = slotByKey.find(meta.pubkey);
    if (dup == slotByKey.end()) {
      slotByKey.emplace(meta.pubkey, uniqueMetas.size());
      uniqueMetas.push_back(meta);
    } else {
      auto &entry = uniqueMetas[dup->second];
      entry.isSigner |= meta.isSigner;
      entry.isWritable |= meta.isWritable;
    }
  };
  for (const auto &instruction : instructions) {
    for (const auto &account : instruction.accounts) merge(account);
    merge({instruction.programId, false, false});
  }

  // the payer stays first, the rest is grouped by class in first-seen order
  std::stable_sort(uniqueMetas.begin() + 1, uniqueMetas.end(),
                   [](const AccountMeta &a, const AccountMeta &b) {
                     return accountClass(a) < accountClass(b);
                   });

  if (uniqueMetas.size() > MAX_ACCOUNTS)
    throw Error(ErrorCode::TooManyAccounts,
                fmt::format("{} accounts exceed the table limit of {}",
                            uniqueMetas.size(), MAX_ACCOUNTS))
        .withCount(uniqueMetas.size());

  size_t requiredSignatures = 0;
  size_t readOnlySignedAccounts = 0;
  size_t readOnlyUnsignedAccounts = 0;
  std::vector<PublicKey> accounts;
  std::map<PublicKey, uint8_t> indexByKey;
  for (const auto &meta : uniqueMetas) {
    indexByKey.emplace(meta.pubkey, static_cast<uint8_t>(accounts.size()));
    accounts.push_back(meta.pubkey);
    if (meta.isSigner) {
      requiredSignatures++;
      if (!meta.isWritable) {
        readOnlySignedAccounts++;
      }
    } else if (!meta.isWritable) {
      readOnlyUnsignedAccounts++;
    }
  }
  if (requiredSignatures > 0xff)
    throw Error(ErrorCode::TooManyAccounts,
                fmt::format("{} signers exceed the header limit of 255",
                            requiredSignatures))
        .withCount(requiredSignatures);

  // dictionary encode individual instructions
  std::vector<CompiledInstruction> cixs;
  cixs.reserve(instructions.size());
  for (const auto &instruction : instructions) {
    cixs.push_back(CompiledInstruction::fromInstruction(instruction, indexByKey));
  }

  spdlog::debug(
      "compiled transaction: {} accounts, {} instructions, {} signatures",
      accounts.size(), cixs.size(), requiredSignatures);

  const MessageHeader header = {
      static_cast<uint8_t>(requiredSignatures),
      static_cast<uint8_t>(readOnlySignedAccounts),
      static_cast<uint8_t>(readOnlyUnsignedAccounts)};
  return {header, accounts, *blockhash, cixs,
          std::vector<std::optional<Signature>>(requiredSignatures)};
}

CompiledTransaction CompiledTransaction::deserialize(
    const std::vector<uint8_t> &bytes) {
  Reader reader(bytes);
  CompiledTransaction tx;

  const auto numSignatures = reader.readCompactU16();
  tx.signatures.reserve(numSignatures);
  for (uint16_t i = 0; i < numSignatures; i++) {
    const Signature signature = {reader.readArray<Signature::SIZE>()};
    if (signature.isZero()) {
      tx.signatures.emplace_back(std::nullopt);
    } else {
      tx.signatures.emplace_back(signature);
    }
  }

  const size_t headerOffset = reader.offset();
  tx.header.requiredSignatures = reader.readU8();
  tx.header.readOnlySignedAccounts = reader.readU8();
  tx.header.readOnlyUnsignedAccounts = reader.readU8();

  const size_t keysOffset = reader.offset();
  const auto numKeys = reader.readCompactU16();
  if (numKeys == 0 || numKeys > MAX_ACCOUNTS)
    throw malformed(fmt::format("invalid account table length {}", numKeys))
        .withOffset(keysOffset)
        .withCount(numKeys);
  tx.accounts.reserve(numKeys);
  std::set<PublicKey> seen;
  for (uint16_t i = 0; i < numKeys; i++) {
    const size_t keyOffset = reader.offset();
    const PublicKey key = {reader.readArray<PublicKey::SIZE>()};
    if (!seen.insert(key).second)
      throw malformed(fmt::format("account {} appears twice in the table",
                                  key.toBase58()))
          .withOffset(keyOffset)
          .withAccount(key.toBase58());
    tx.accounts.push_back(key);
  }
  tx.recentBlockhash = {reader.readArray<PublicKey::SIZE>()};

  const auto numInstructions = reader.readCompactU16();
  tx.instructions.reserve(numInstructions);
  for (uint16_t i = 0; i < numInstructions; i++) {
    const size_t ixOffset = reader.offset();
    auto ix = CompiledInstruction::deserializeFrom(reader);
    const auto outOfRange = [&tx](uint8_t index) {
      return index >= tx.accounts.size();
    };
    if (outOfRange(ix.programIdIndex) ||
        std::any_of(ix.accountIndices.begin(), ix.accountIndices.end(),
                    outOfRange))
      throw malformed(fmt::format(
                          "instruction {} references an account outside the "
                          "{} entry table",
                          i, tx.accounts.size()))
          .withOffset(ixOffset);
    tx.instructions.push_back(std::move(ix));
  }

  if (!reader.atEnd())
    throw malformed(fmt::format("{} trailing bytes", reader.remaining()))
        .withOffset(reader.offset())
        .withCount(reader.remaining());

  const auto &header = tx.header;
  if (header.requiredSignatures == 0 ||
      header.requiredSignatures > tx.accounts.size() ||
      header.readOnlySignedAccounts >= header.requiredSignatures ||
      header.readOnlyUnsignedAccounts >
          tx.accounts.size() - header.requiredSignatures)
    throw malformed("header counts do not fit the account table")
        .withOffset(headerOffset);
  if (tx.signatures.size() != header.requiredSignatures)
    throw malformed(fmt::format("{} signature slots for {} required signatures",
                                tx.signatures.size(),
                                header.requiredSignatures))
        .withOffset(0)
        .withCount(tx.signatures.size());
  return tx;
}

void CompiledTransaction::serializeTo(std::vector<uint8_t> &buffer) const {
  header.serializeTo(buffer);

  CompactU16::encode(CompactU16::length(accounts.size()), buffer);
  for (const auto &account : accounts) {
    encodeBytes(account.data, buffer);
  }

  encodeBytes(recentBlockhash.data, buffer);

  CompactU16::encode(CompactU16::length(instructions.size()), buffer);
  for (const auto &instruction : instructions) {
    instruction.serializeTo(buffer);
  }
}

std::vector<uint8_t> CompiledTransaction::messageBytes() const {
  std::vector<uint8_t> buffer;
  buffer.reserve(messageSize());
  serializeTo(buffer);
  return buffer;
}

std::vector<uint8_t> CompiledTransaction::serialize() const {
  std::vector<uint8_t> buffer;
  buffer.reserve(size());
  CompactU16::encode(CompactU16::length(signatures.size()), buffer);
  for (const auto &signature : signatures) {
    if (signature.has_value()) {
      encodeBytes(signature->data, buffer);
    } else {
      buffer.insert(buffer.end(), Signature::SIZE, 0);
    }
  }
  serializeTo(buffer);
  return buffer;
}

size_t CompiledTransaction::messageSize() const {
  size_t size = MessageHeader::SIZE;
  size += CompactU16::size(CompactU16::length(accounts.size()));
  size += accounts.size() * PublicKey::SIZE;
  size += PublicKey::SIZE;
  size += CompactU16::size(CompactU16::length(instructions.size()));
  for (const auto &instruction : instructions) size += instruction.byteSize();
  return size;
}

size_t CompiledTransaction::size() const {
  return CompactU16::size(CompactU16::length(signatures.size())) +
         signatures.size() * Signature::SIZE + messageSize();
}

bool CompiledTransaction::isSigner(size_t index) const {
  return index < header.requiredSignatures;
}

bool CompiledTransaction::isWritable(size_t index) const {
  if (index < header.requiredSignatures)
    return index < static_cast<size_t>(header.requiredSignatures -
                                       header.readOnlySignedAccounts);
  return index < accounts.size() - header.readOnlyUnsignedAccounts;
}

std::vector<AccountTableEntry> CompiledTransaction::accountTable() const {
  std::vector<AccountTableEntry> table;
  table.reserve(accounts.size());
  for (size_t i = 0; i < accounts.size(); i++) {
    table.push_back({accounts[i], isSigner(i), isWritable(i)});
  }
  return table;
}

std::optional<size_t> CompiledTransaction::indexOf(const PublicKey &key) const {
  const auto it = std::find(accounts.begin(), accounts.end(), key);
  if (it == accounts.end()) return std::nullopt;
  return static_cast<size_t>(it - accounts.begin());
}

void CompiledTransaction::addSignature(const PublicKey &signer,
                                       const Signature &signature) {
  const auto index = indexOf(signer);
  if (!index.has_value() || *index >= signatures.size())
    throw Error(ErrorCode::UnexpectedSigner,
                signer.toBase58() + " is not a required signer")
        .withAccount(signer.toBase58());
  if (signatures[*index].has_value())
    throw Error(ErrorCode::SignatureSlotFilled,
                fmt::format("signature slot {} of {} is already filled", *index,
                            signer.toBase58()))
        .withAccount(signer.toBase58())
        .withOffset(*index);
  signatures[*index] = signature;
}

bool CompiledTransaction::isFullySigned() const {
  return std::all_of(
      signatures.begin(), signatures.end(),
      [](const std::optional<Signature> &sig) { return sig.has_value(); });
}

bool CompiledTransaction::verifySignatures() const {
  if (!isFullySigned()) return false;
  const auto message = messageBytes();
  for (size_t i = 0; i < signatures.size(); i++) {
    if (!verifySignature(accounts[i], *signatures[i], message)) return false;
  }
  return true;
}

}  // namespace txasm
