#include "txasm/keys.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "txasm/base58.hpp"
#include "txasm/error.hpp"

namespace txasm {
using json = nlohmann::json;

void initSodium() {
  const auto sodium_result = sodium_init();
  if (sodium_result < 0)
    throw std::runtime_error("Error initializing sodium: " +
                             std::to_string(sodium_result));
}

///
/// PublicKey
PublicKey PublicKey::fromBase58(const std::string &b58) {
  const auto decoded = b58decode(b58);
  if (decoded.size() != SIZE)
    throw Error(ErrorCode::InvalidPublicKey,
                fmt::format("not a valid PublicKey '{}': {} bytes", b58,
                            decoded.size()))
        .withCount(decoded.size());
  return fromBytes(decoded);
}

PublicKey PublicKey::fromBytes(const std::vector<uint8_t> &bytes) {
  if (bytes.size() != SIZE)
    throw Error(ErrorCode::InvalidPublicKey,
                fmt::format("expected {} bytes, got {}",
                            static_cast<size_t>(SIZE), bytes.size()))
        .withCount(bytes.size());
  PublicKey result = {};
  std::copy(bytes.begin(), bytes.end(), result.data.begin());
  return result;
}

bool PublicKey::operator==(const PublicKey &other) const {
  return data == other.data;
}

bool PublicKey::operator!=(const PublicKey &other) const {
  return data != other.data;
}

bool PublicKey::operator<(const PublicKey &other) const {
  return data < other.data;
}

std::string PublicKey::toBase58() const { return b58encode(data); }

///
/// Signature
Signature Signature::fromBytes(const std::vector<uint8_t> &bytes) {
  if (bytes.size() != SIZE)
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("expected {} signature bytes, got {}",
                            static_cast<size_t>(SIZE), bytes.size()))
        .withCount(bytes.size());
  Signature result = {};
  std::copy(bytes.begin(), bytes.end(), result.data.begin());
  return result;
}

bool Signature::operator==(const Signature &other) const {
  return data == other.data;
}

bool Signature::operator!=(const Signature &other) const {
  return data != other.data;
}

bool Signature::isZero() const {
  return std::all_of(data.begin(), data.end(),
                     [](uint8_t b) { return b == 0; });
}

std::string Signature::toBase58() const { return b58encode(data); }

///
/// PrivateKey
Signature PrivateKey::signMessage(const std::vector<uint8_t> &message) const {
  Signature sig = {};
  unsigned long long sigSize;
  if (0 != crypto_sign_detached(sig.data.data(), &sigSize, message.data(),
                                message.size(), data.data()))
    throw std::runtime_error("could not sign tx with private key");
  return sig;
}

///
/// Keypair
Keypair Keypair::fromFile(const std::string &path) {
  std::ifstream fileStream(path);
  if (!fileStream)
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("cannot open keypair file '{}'", path));
  std::string fileContent(std::istreambuf_iterator<char>(fileStream), {});
  json parsed;
  try {
    parsed = json::parse(fileContent);
  } catch (const json::exception &e) {
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("invalid keypair file '{}': {}", path, e.what()));
  }
  if (!parsed.is_array())
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("keypair file '{}' is not a byte array", path));
  std::vector<uint8_t> secret;
  secret.reserve(parsed.size());
  for (const auto &value : parsed) {
    if (!value.is_number_unsigned() || value.get<uint64_t>() > 0xff)
      throw Error(ErrorCode::InvalidArgument,
                  fmt::format("keypair file '{}' holds a non-byte value {} at "
                              "position {}",
                              path, value.dump(), secret.size()))
          .withOffset(secret.size());
    secret.push_back(value.get<uint8_t>());
  }
  if (secret.size() != PrivateKey::SIZE)
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("keypair file '{}' holds {} bytes, expected {}",
                            path, secret.size(),
                            static_cast<size_t>(PrivateKey::SIZE)))
        .withCount(secret.size());
  Keypair result = {};
  std::copy(secret.begin(), secret.end(), result.privateKey.data.begin());
  crypto_sign_ed25519_sk_to_pk(result.publicKey.data.data(),
                               result.privateKey.data.data());
  return result;
}

Keypair Keypair::fromSeed(
    const std::array<uint8_t, crypto_sign_SEEDBYTES> &seed) {
  Keypair result = {};
  if (0 != crypto_sign_seed_keypair(result.publicKey.data.data(),
                                    result.privateKey.data.data(),
                                    seed.data()))
    throw std::runtime_error("could not derive keypair from seed");
  return result;
}

bool verifySignature(const PublicKey &key, const Signature &signature,
                     const std::vector<uint8_t> &message) {
  return 0 == crypto_sign_verify_detached(signature.data.data(),
                                          message.data(), message.size(),
                                          key.data.data());
}

}  // namespace txasm
