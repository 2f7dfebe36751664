#pragma once

#include <doctest/doctest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "txasm.hpp"

const std::string FIXTURES = FIXTURES_DIR;

/// key with every byte set to fill
inline txasm::PublicKey key(uint8_t fill) {
  txasm::PublicKey result;
  result.data.fill(fill);
  return result;
}

inline std::vector<uint8_t> fromHex(const std::string &hex) {
  std::vector<uint8_t> bytes;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    bytes.push_back(
        static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
  }
  return bytes;
}

inline std::vector<uint8_t> bytesOf(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

/// error code thrown by fn, nullopt when it returns normally
template <typename Fn>
std::optional<txasm::ErrorCode> thrownCode(Fn &&fn) {
  try {
    fn();
  } catch (const txasm::Error &e) {
    return e.code();
  }
  return std::nullopt;
}

/// error thrown by fn; fails the test when nothing is thrown
template <typename Fn>
txasm::Error thrownError(Fn &&fn) {
  try {
    fn();
  } catch (const txasm::Error &e) {
    return e;
  }
  FAIL("expected txasm::Error");
  return txasm::Error(txasm::ErrorCode::InvalidArgument, "unreachable");
}

inline txasm::Instruction memo(const std::string &text) {
  return txasm::InstructionEncoder(
             txasm::PublicKey::fromBase58(txasm::MEMO_PROGRAM_ID))
      .data(bytesOf(text))
      .build();
}

/// signer returning a fixed pattern and recording every message it signs
class StubSigner : public txasm::Signer {
 public:
  StubSigner(const txasm::PublicKey &key, uint8_t fill)
      : key_(key), fill_(fill) {}

  txasm::PublicKey publicKey() const override { return key_; }

  txasm::Signature sign(const std::vector<uint8_t> &message) const override {
    messages.push_back(message);
    txasm::Signature signature;
    signature.data.fill(fill_);
    return signature;
  }

  mutable std::vector<std::vector<uint8_t>> messages;

 private:
  txasm::PublicKey key_;
  uint8_t fill_;
};
