#include "txasm/codec.hpp"

#include <fmt/format.h>

#include "txasm/error.hpp"

namespace txasm {

///
/// Fixed-width encoding
void encodeU8(uint8_t value, std::vector<uint8_t> &buffer) {
  buffer.push_back(value);
}

void encodeU16(uint16_t value, std::vector<uint8_t> &buffer) {
  buffer.push_back(value & 0xff);
  buffer.push_back(value >> 8);
}

void encodeU32(uint32_t value, std::vector<uint8_t> &buffer) {
  for (int i = 0; i < 4; i++) buffer.push_back((value >> (8 * i)) & 0xff);
}

void encodeU64(uint64_t value, std::vector<uint8_t> &buffer) {
  for (int i = 0; i < 8; i++) buffer.push_back((value >> (8 * i)) & 0xff);
}

void encodeI64(int64_t value, std::vector<uint8_t> &buffer) {
  encodeU64(static_cast<uint64_t>(value), buffer);
}

void encodeBytes(const std::vector<uint8_t> &bytes,
                 std::vector<uint8_t> &buffer) {
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

///
/// CompactU16
namespace CompactU16 {
void encode(uint16_t num, std::vector<uint8_t> &buffer) {
  buffer.push_back(num & 0x7f);
  num >>= 7;
  if (num == 0) return;

  buffer.back() |= 0x80;
  buffer.push_back(num & 0x7f);
  num >>= 7;
  if (num == 0) return;

  buffer.back() |= 0x80;
  buffer.push_back(num & 0x3);
}

void encode(const std::vector<uint8_t> &vec, std::vector<uint8_t> &buffer) {
  encode(length(vec.size()), buffer);
  buffer.insert(buffer.end(), vec.begin(), vec.end());
}

size_t size(uint16_t num) {
  if (num < 0x80) return 1;
  if (num < 0x4000) return 2;
  return 3;
}

uint16_t length(size_t count) {
  if (count > MAX)
    throw Error(ErrorCode::InvalidArgument,
                fmt::format("length {} exceeds the compact-u16 range", count))
        .withCount(count);
  return static_cast<uint16_t>(count);
}
}  // namespace CompactU16

///
/// Reader
Reader::Reader(const uint8_t *data, size_t size) : data_(data), size_(size) {}

Reader::Reader(const std::vector<uint8_t> &bytes)
    : data_(bytes.data()), size_(bytes.size()) {}

void Reader::require(size_t count) const {
  if (count > size_ - offset_) {
    throw Error(ErrorCode::UnexpectedEof,
                fmt::format("need {} bytes at offset {}, {} available", count,
                            offset_, size_ - offset_))
        .withOffset(offset_)
        .withCount(count);
  }
}

uint8_t Reader::readU8() {
  require(1);
  return data_[offset_++];
}

uint16_t Reader::readU16() {
  require(2);
  const uint16_t value = data_[offset_] | (data_[offset_ + 1] << 8);
  offset_ += 2;
  return value;
}

uint32_t Reader::readU32() {
  require(4);
  uint32_t value = 0;
  for (int i = 0; i < 4; i++)
    value |= static_cast<uint32_t>(data_[offset_ + i]) << (8 * i);
  offset_ += 4;
  return value;
}

uint64_t Reader::readU64() {
  require(8);
  uint64_t value = 0;
  for (int i = 0; i < 8; i++)
    value |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
  offset_ += 8;
  return value;
}

int64_t Reader::readI64() { return static_cast<int64_t>(readU64()); }

uint16_t Reader::readCompactU16() {
  const size_t start = offset_;
  uint32_t value = 0;
  for (size_t i = 0; i < CompactU16::MAX_SIZE; i++) {
    const uint8_t byte = readU8();
    const uint32_t bits = byte & 0x7f;
    if (i == CompactU16::MAX_SIZE - 1) {
      if (byte & 0x80)
        throw Error(ErrorCode::MalformedVarint,
                    fmt::format("compact-u16 at offset {} is longer than {} "
                                "bytes",
                                start, CompactU16::MAX_SIZE))
            .withOffset(start);
      if (bits > 0x3)
        throw Error(ErrorCode::MalformedVarint,
                    fmt::format("compact-u16 at offset {} exceeds {}", start,
                                CompactU16::MAX))
            .withOffset(start);
    }
    value |= bits << (7 * i);
    if ((byte & 0x80) == 0) {
      // a zero final byte after a continuation means a shorter form existed
      if (i > 0 && bits == 0)
        throw Error(ErrorCode::MalformedVarint,
                    fmt::format("non-minimal compact-u16 at offset {}", start))
            .withOffset(start);
      return static_cast<uint16_t>(value);
    }
  }
  throw Error(ErrorCode::MalformedVarint,
              fmt::format("invalid compact-u16 at offset {}", start))
      .withOffset(start);
}

std::vector<uint8_t> Reader::readBytes(size_t count) {
  require(count);
  std::vector<uint8_t> result(data_ + offset_, data_ + offset_ + count);
  offset_ += count;
  return result;
}

std::vector<uint8_t> Reader::readLengthPrefixed() {
  const auto length = readCompactU16();
  return readBytes(length);
}

}  // namespace txasm
