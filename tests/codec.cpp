#include <cstdint>
#include <vector>

#include "helpers.hpp"

using txasm::ErrorCode;
using txasm::Reader;
namespace CompactU16 = txasm::CompactU16;

namespace {
std::vector<uint8_t> compact(uint16_t value) {
  std::vector<uint8_t> buffer;
  CompactU16::encode(value, buffer);
  return buffer;
}

uint16_t decodeCompact(const std::vector<uint8_t> &bytes) {
  Reader reader(bytes);
  return reader.readCompactU16();
}
}  // namespace

TEST_CASE("fixed width integers are little-endian") {
  std::vector<uint8_t> buffer;
  txasm::encodeU8(0xab, buffer);
  txasm::encodeU16(0x0102, buffer);
  txasm::encodeU32(0x01020304, buffer);
  txasm::encodeU64(0x0102030405060708, buffer);
  txasm::encodeI64(-2, buffer);
  CHECK_EQ(buffer, fromHex("ab"
                           "0201"
                           "04030201"
                           "0807060504030201"
                           "feffffffffffffff"));

  Reader reader(buffer);
  CHECK_EQ(reader.readU8(), 0xab);
  CHECK_EQ(reader.readU16(), 0x0102);
  CHECK_EQ(reader.readU32(), 0x01020304u);
  CHECK_EQ(reader.readU64(), 0x0102030405060708ull);
  CHECK_EQ(reader.readI64(), -2);
  CHECK(reader.atEnd());
  CHECK_EQ(reader.offset(), buffer.size());
}

TEST_CASE("compact-u16 encoding") {
  CHECK_EQ(compact(0), fromHex("00"));
  CHECK_EQ(compact(0x7f), fromHex("7f"));
  CHECK_EQ(compact(0x80), fromHex("8001"));
  CHECK_EQ(compact(0xff), fromHex("ff01"));
  CHECK_EQ(compact(0x100), fromHex("8002"));
  CHECK_EQ(compact(0x3fff), fromHex("ff7f"));
  CHECK_EQ(compact(0x4000), fromHex("808001"));
  CHECK_EQ(compact(0xffff), fromHex("ffff03"));

  CHECK_EQ(CompactU16::size(0), 1);
  CHECK_EQ(CompactU16::size(0x7f), 1);
  CHECK_EQ(CompactU16::size(0x80), 2);
  CHECK_EQ(CompactU16::size(0x3fff), 2);
  CHECK_EQ(CompactU16::size(0x4000), 3);
  CHECK_EQ(CompactU16::size(0xffff), 3);
}

TEST_CASE("compact-u16 decodes every value it encodes") {
  for (uint32_t value = 0; value <= CompactU16::MAX; value++) {
    const auto encoded = compact(static_cast<uint16_t>(value));
    REQUIRE_EQ(encoded.size(), CompactU16::size(static_cast<uint16_t>(value)));
    Reader reader(encoded);
    REQUIRE_EQ(reader.readCompactU16(), value);
    REQUIRE(reader.atEnd());
  }
}

TEST_CASE("compact-u16 rejects malformed input") {
  SUBCASE("truncated") {
    CHECK(thrownCode([] { decodeCompact({}); }) == ErrorCode::UnexpectedEof);
    CHECK(thrownCode([] { decodeCompact({0x80}); }) ==
          ErrorCode::UnexpectedEof);
    CHECK(thrownCode([] { decodeCompact({0xff, 0xff}); }) ==
          ErrorCode::UnexpectedEof);
  }
  SUBCASE("non-minimal") {
    CHECK(thrownCode([] { decodeCompact({0x80, 0x00}); }) ==
          ErrorCode::MalformedVarint);
    CHECK(thrownCode([] { decodeCompact({0xff, 0x80, 0x00}); }) ==
          ErrorCode::MalformedVarint);
  }
  SUBCASE("longer than three bytes") {
    CHECK(thrownCode([] { decodeCompact({0x80, 0x80, 0x80, 0x01}); }) ==
          ErrorCode::MalformedVarint);
  }
  SUBCASE("above 0xffff") {
    const auto error = thrownError([] { decodeCompact({0xff, 0xff, 0x04}); });
    CHECK_EQ(error.code(), ErrorCode::MalformedVarint);
    CHECK_EQ(error.offset(), std::optional<size_t>(0));
  }
}

TEST_CASE("reader reports the offset of a short read") {
  const std::vector<uint8_t> bytes = {1, 2, 3, 4, 5};
  Reader reader(bytes);
  CHECK_EQ(reader.readU16(), 0x0201);
  CHECK_EQ(reader.remaining(), 3);

  const auto error = thrownError([&reader] { reader.readU32(); });
  CHECK_EQ(error.code(), ErrorCode::UnexpectedEof);
  CHECK_EQ(error.offset(), std::optional<size_t>(2));
  CHECK_EQ(error.count(), std::optional<size_t>(4));
}

TEST_CASE("length prefixed bytes") {
  std::vector<uint8_t> buffer;
  CompactU16::encode(std::vector<uint8_t>{0xaa, 0xbb}, buffer);
  CHECK_EQ(buffer, fromHex("02aabb"));

  std::vector<uint8_t> large(200, 0x11);
  buffer.clear();
  CompactU16::encode(large, buffer);
  CHECK_EQ(buffer.size(), 202);
  CHECK_EQ(buffer[0], 0xc8);
  CHECK_EQ(buffer[1], 0x01);
  Reader reader(buffer);
  CHECK_EQ(reader.readLengthPrefixed(), large);

  // the prefix promises more bytes than follow
  CHECK(thrownCode([] {
          const auto bytes = fromHex("03aabb");
          Reader reader(bytes);
          reader.readLengthPrefixed();
        }) == ErrorCode::UnexpectedEof);
}

TEST_CASE("lengths beyond the compact-u16 range are rejected") {
  CHECK_EQ(CompactU16::length(0), 0);
  CHECK_EQ(CompactU16::length(0xffff), 0xffff);

  const auto error = thrownError([] { CompactU16::length(0x10000); });
  CHECK_EQ(error.code(), ErrorCode::InvalidArgument);
  CHECK_EQ(error.count(), std::optional<size_t>(0x10000));

  std::vector<uint8_t> buffer;
  const std::vector<uint8_t> tooLong(0x10000, 0);
  CHECK(thrownCode([&] { CompactU16::encode(tooLong, buffer); }) ==
        ErrorCode::InvalidArgument);
  CHECK(buffer.empty());
}

TEST_CASE("raw bytes carry no prefix") {
  std::vector<uint8_t> buffer;
  txasm::encodeBytes(std::vector<uint8_t>{1, 2}, buffer);
  txasm::encodeBytes(key(9).data, buffer);
  CHECK_EQ(buffer.size(), 2 + 32);

  Reader reader(buffer);
  CHECK_EQ(reader.readBytes(2), fromHex("0102"));
  const txasm::PublicKey decoded = {reader.readArray<32>()};
  CHECK_EQ(decoded, key(9));
  CHECK(reader.atEnd());
}
