#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace txasm {

/// Fixed-width little-endian encoding appended to a growable buffer
void encodeU8(uint8_t value, std::vector<uint8_t> &buffer);
void encodeU16(uint16_t value, std::vector<uint8_t> &buffer);
void encodeU32(uint32_t value, std::vector<uint8_t> &buffer);
void encodeU64(uint64_t value, std::vector<uint8_t> &buffer);
void encodeI64(int64_t value, std::vector<uint8_t> &buffer);

/**
 * Append raw bytes without any length prefix. Callers that need one prefix
 * the length explicitly with CompactU16::encode.
 */
void encodeBytes(const std::vector<uint8_t> &bytes,
                 std::vector<uint8_t> &buffer);

template <size_t N>
void encodeBytes(const std::array<uint8_t, N> &bytes,
                 std::vector<uint8_t> &buffer) {
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

/// Encoded sizes of the fixed-width types
namespace byteSize {
constexpr size_t U8 = 1;
constexpr size_t U16 = 2;
constexpr size_t U32 = 4;
constexpr size_t U64 = 8;
constexpr size_t I64 = 8;
}  // namespace byteSize

///
/// compact-u16: 7 value bits per byte, high bit set when another byte
/// follows, at most 3 bytes, minimal form only
namespace CompactU16 {
constexpr uint32_t MAX = 0xffff;
constexpr size_t MAX_SIZE = 3;

void encode(uint16_t num, std::vector<uint8_t> &buffer);

/**
 * Length-prefixed byte vector: compact-u16 length followed by the bytes
 */
void encode(const std::vector<uint8_t> &vec, std::vector<uint8_t> &buffer);

/**
 * Number of bytes encode(num, ...) appends
 */
size_t size(uint16_t num);

/**
 * Narrow a collection length to a compact-u16 value
 * @throw Error(InvalidArgument) when count exceeds MAX
 */
uint16_t length(size_t count);
}  // namespace CompactU16

/**
 * Position tracking cursor over a fixed byte slice. Every read past the end
 * throws Error(UnexpectedEof); the position is unspecified afterwards and the
 * reader must not be used again.
 */
class Reader {
 public:
  Reader(const uint8_t *data, size_t size);
  explicit Reader(const std::vector<uint8_t> &bytes);

  uint8_t readU8();
  uint16_t readU16();
  uint32_t readU32();
  uint64_t readU64();
  int64_t readI64();
  uint16_t readCompactU16();
  std::vector<uint8_t> readBytes(size_t count);
  /// compact-u16 length followed by that many bytes
  std::vector<uint8_t> readLengthPrefixed();

  template <size_t N>
  std::array<uint8_t, N> readArray() {
    require(N);
    std::array<uint8_t, N> result;
    for (size_t i = 0; i < N; i++) result[i] = data_[offset_ + i];
    offset_ += N;
    return result;
  }

  size_t offset() const { return offset_; }
  size_t remaining() const { return size_ - offset_; }
  bool atEnd() const { return offset_ == size_; }

 private:
  void require(size_t count) const;

  const uint8_t *data_;
  size_t size_;
  size_t offset_ = 0;
};

}  // namespace txasm
