#pragma once

#include <sodium.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace txasm {

const std::string MEMO_PROGRAM_ID =
    "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr";

/**
 * 32-byte account or program address, also used for blockhashes
 */
struct PublicKey {
  static const auto SIZE = crypto_sign_PUBLICKEYBYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  static PublicKey fromBase58(const std::string &b58);

  static PublicKey fromBytes(const std::vector<uint8_t> &bytes);

  bool operator==(const PublicKey &other) const;
  bool operator!=(const PublicKey &other) const;
  bool operator<(const PublicKey &other) const;

  std::string toBase58() const;
};

/**
 * ed25519 signature over a serialized message
 */
struct Signature {
  static const auto SIZE = crypto_sign_BYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  static Signature fromBytes(const std::vector<uint8_t> &bytes);

  bool operator==(const Signature &other) const;
  bool operator!=(const Signature &other) const;

  /// all zero, the wire placeholder of an unfilled slot
  bool isZero() const;

  std::string toBase58() const;
};

struct PrivateKey {
  static const size_t SIZE = crypto_sign_SECRETKEYBYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  Signature signMessage(const std::vector<uint8_t> &message) const;
};

struct Keypair {
  PublicKey publicKey;
  PrivateKey privateKey;

  /**
   * Load a keypair from a JSON array of the 64 secret key bytes, the format
   * written by `solana-keygen`
   */
  static Keypair fromFile(const std::string &path);

  /**
   * Derive a keypair deterministically from a 32-byte seed
   */
  static Keypair fromSeed(const std::array<uint8_t, crypto_sign_SEEDBYTES> &seed);
};

/**
 * Check an ed25519 signature of message by key
 */
bool verifySignature(const PublicKey &key, const Signature &signature,
                     const std::vector<uint8_t> &message);

/**
 * Initialize libsodium once per process
 * @throw std::runtime_error when libsodium cannot be initialized
 */
void initSodium();

}  // namespace txasm
