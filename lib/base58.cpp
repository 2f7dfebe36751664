#include "txasm/base58.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "txasm/error.hpp"

namespace txasm {

namespace {
const char *const ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int8_t alphabetIndex(char c) {
  const char *pos = std::find(ALPHABET, ALPHABET + 58, c);
  if (pos == ALPHABET + 58) return -1;
  return static_cast<int8_t>(pos - ALPHABET);
}
}  // namespace

std::string b58encode(const std::vector<uint8_t> &bytes) {
  size_t zeroes = 0;
  while (zeroes < bytes.size() && bytes[zeroes] == 0) zeroes++;

  // log(256) / log(58), rounded up
  std::vector<uint8_t> b58((bytes.size() - zeroes) * 138 / 100 + 1);
  size_t length = 0;
  for (size_t i = zeroes; i < bytes.size(); i++) {
    int carry = bytes[i];
    size_t j = 0;
    for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend();
         ++it, ++j) {
      carry += 256 * (*it);
      *it = carry % 58;
      carry /= 58;
    }
    length = j;
  }

  auto it = b58.begin() + (b58.size() - length);
  while (it != b58.end() && *it == 0) ++it;

  std::string result(zeroes, '1');
  for (; it != b58.end(); ++it) result += ALPHABET[*it];
  return result;
}

std::vector<uint8_t> b58decode(const std::string &str) {
  size_t zeroes = 0;
  while (zeroes < str.size() && str[zeroes] == '1') zeroes++;

  // log(58) / log(256), rounded up
  std::vector<uint8_t> b256((str.size() - zeroes) * 733 / 1000 + 1);
  size_t length = 0;
  for (size_t i = zeroes; i < str.size(); i++) {
    const int8_t digit = alphabetIndex(str[i]);
    if (digit < 0)
      throw Error(ErrorCode::InvalidPublicKey,
                  fmt::format("invalid base58 character '{}' in '{}'", str[i],
                              str))
          .withOffset(i);
    int carry = digit;
    size_t j = 0;
    for (auto it = b256.rbegin();
         (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it = carry % 256;
      carry /= 256;
    }
    length = j;
  }

  auto it = b256.begin() + (b256.size() - length);
  while (it != b256.end() && *it == 0) ++it;

  std::vector<uint8_t> result(zeroes, 0);
  result.insert(result.end(), it, b256.end());
  return result;
}

}  // namespace txasm
