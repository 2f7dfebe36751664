#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace txasm {

/**
 * Bitcoin-alphabet base58, the text form of keys, hashes and signatures
 */
std::string b58encode(const std::vector<uint8_t> &bytes);

template <typename Container>
std::string b58encode(const Container &bytes) {
  return b58encode(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

/**
 * @throw Error(InvalidPublicKey) on characters outside the alphabet
 */
std::vector<uint8_t> b58decode(const std::string &str);

}  // namespace txasm
