// ==============================================================================
// test_bytes_gtest.cpp - Тесты байтовых утилит и FILETIME (GoogleTest)
// ==============================================================================
//
// ByteView / ByteCursor, UTF-16LE → UTF-8, CRC32, конверсия FILETIME
//
// ==============================================================================

#include "artifacts/bytes.hpp"
#include "artifacts/filetime.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace artifacts::test {

// ==============================================================================
// ByteView
// ==============================================================================

TEST(BytesTest, ByteView_LittleEndianReads) {
    std::vector<std::uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    ByteView view(data);

    EXPECT_EQ(view.u8_at(0), 0x01);
    EXPECT_EQ(view.u16_at(0), 0x0201);
    EXPECT_EQ(view.u32_at(0), 0x04030201u);
    EXPECT_EQ(view.u64_at(0), 0x0807060504030201ull);
    EXPECT_EQ(view.u32_at(4), 0x08070605u);
}

TEST(BytesTest, ByteView_ReadPastEnd_Throws) {
    std::vector<std::uint8_t> data = {0x01, 0x02, 0x03};
    ByteView view(data);

    EXPECT_THROW(view.u32_at(0), std::out_of_range);
    EXPECT_THROW(view.u16_at(2), std::out_of_range);
    EXPECT_THROW(view.u8_at(3), std::out_of_range);
    EXPECT_NO_THROW(view.u16_at(1));
}

TEST(BytesTest, ByteView_SubClampsToEnd) {
    std::vector<std::uint8_t> data = {1, 2, 3, 4, 5};
    ByteView view(data);

    EXPECT_EQ(view.sub(1, 2).size(), 2u);
    EXPECT_EQ(view.sub(1, 2)[0], 2);
    EXPECT_EQ(view.sub(3, 100).size(), 2u);
    EXPECT_EQ(view.sub(10).size(), 0u);
}

// ==============================================================================
// ByteCursor
// ==============================================================================

TEST(BytesTest, Cursor_SequentialReads) {
    std::vector<std::uint8_t> data = {0xAA, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12};
    ByteCursor cur{ByteView(data)};

    EXPECT_EQ(cur.peek_u8(), 0xAA);
    EXPECT_EQ(cur.read_u8(), 0xAA);
    EXPECT_EQ(cur.read_u16(), 0x1234);
    EXPECT_EQ(cur.read_u32(), 0x12345678u);
    EXPECT_TRUE(cur.eof());
    EXPECT_THROW(cur.read_u8(), std::out_of_range);
}

TEST(BytesTest, Cursor_LimitBoundsReads) {
    std::vector<std::uint8_t> data(16, 0xFF);
    ByteCursor cur(ByteView(data), 4, 8);

    EXPECT_EQ(cur.position(), 4u);
    EXPECT_EQ(cur.remaining(), 4u);
    EXPECT_NO_THROW(cur.read_u32());
    EXPECT_TRUE(cur.eof());
    EXPECT_THROW(cur.read_u8(), std::out_of_range);
}

TEST(BytesTest, Cursor_SeekAndSkip) {
    std::vector<std::uint8_t> data = {0, 1, 2, 3, 4, 5, 6, 7};
    ByteCursor cur(ByteView(data), 0, 6);

    cur.skip(2);
    EXPECT_EQ(cur.read_u8(), 2);
    cur.seek(5);
    EXPECT_EQ(cur.read_u8(), 5);
    EXPECT_THROW(cur.seek(7), std::out_of_range);
    EXPECT_THROW(cur.skip(1), std::out_of_range);
}

TEST(BytesTest, Cursor_ReadBytesReturnsSameBuffer) {
    std::vector<std::uint8_t> data = {9, 8, 7, 6};
    ByteCursor cur{ByteView(data)};
    cur.read_u8();

    ByteView slice = cur.read_bytes(2);
    EXPECT_EQ(slice.size(), 2u);
    EXPECT_EQ(slice.data(), data.data() + 1);
    EXPECT_EQ(cur.position(), 3u);
}

// ==============================================================================
// UTF-16LE
// ==============================================================================

TEST(BytesTest, Utf16_Ascii) {
    std::vector<std::uint8_t> data = {'E', 0, 'v', 0, 't', 0};
    EXPECT_EQ(utf16le_to_utf8(ByteView(data)), "Evt");
}

TEST(BytesTest, Utf16_Cyrillic) {
    // "Жук"
    std::vector<std::uint8_t> data = {0x16, 0x04, 0x43, 0x04, 0x3A, 0x04};
    EXPECT_EQ(utf16le_to_utf8(ByteView(data)), "\xD0\x96\xD1\x83\xD0\xBA");
}

TEST(BytesTest, Utf16_SurrogatePair) {
    // U+1F600
    std::vector<std::uint8_t> data = {0x3D, 0xD8, 0x00, 0xDE};
    EXPECT_EQ(utf16le_to_utf8(ByteView(data)), "\xF0\x9F\x98\x80");
}

TEST(BytesTest, Utf16_LoneSurrogate_Replaced) {
    std::vector<std::uint8_t> data = {0x3D, 0xD8, 'a', 0};
    EXPECT_EQ(utf16le_to_utf8(ByteView(data)), "\xEF\xBF\xBD" "a");
}

TEST(BytesTest, Utf16_StopAtNul) {
    std::vector<std::uint8_t> data = {'a', 0, 'b', 0, 0, 0, 'c', 0};
    EXPECT_EQ(utf16le_to_utf8(ByteView(data), true), "ab");
    EXPECT_EQ(utf16le_to_utf8(ByteView(data), false), std::string("ab\0c", 4));
}

TEST(BytesTest, Cursor_ReadUtf16) {
    std::vector<std::uint8_t> data = {'i', 0, 'd', 0, 0xFF};
    ByteCursor cur{ByteView(data)};
    EXPECT_EQ(cur.read_utf16(2), "id");
    EXPECT_EQ(cur.read_u8(), 0xFF);
}

// ==============================================================================
// CRC32
// ==============================================================================

TEST(BytesTest, Crc32_CheckValue) {
    std::string text = "123456789";
    ByteView view(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    EXPECT_EQ(crc32(view), 0xCBF43926u);
}

TEST(BytesTest, Crc32_UpdateEqualsWhole) {
    std::string text = "123456789";
    ByteView view(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());

    std::uint32_t split = crc32_update(crc32(view.sub(0, 4)), view.sub(4));
    EXPECT_EQ(split, crc32(view));
}

TEST(BytesTest, Crc32_Empty) {
    EXPECT_EQ(crc32(ByteView()), 0u);
}

// ==============================================================================
// FILETIME
// ==============================================================================

TEST(FileTimeTest, UnixEpoch) {
    Timestamp ts = timestamp_from_filetime(FILETIME_UNIX_EPOCH);
    EXPECT_EQ(ts.time_since_epoch().count(), 0);
    EXPECT_EQ(timestamp_to_iso8601(ts), "1970-01-01T00:00:00.000000Z");
}

TEST(FileTimeTest, KnownInstant) {
    // 2020-01-01T00:00:00Z
    EXPECT_EQ(filetime_to_iso8601(132223104000000000ULL), "2020-01-01T00:00:00.000000Z");
    // +1.5 секунды
    EXPECT_EQ(filetime_to_iso8601(132223104015000000ULL), "2020-01-01T00:00:01.500000Z");
}

TEST(FileTimeTest, Zero_Is1601) {
    EXPECT_EQ(filetime_to_iso8601(0), "1601-01-01T00:00:00.000000Z");
}

TEST(FileTimeTest, RoundTrip) {
    for (std::uint64_t ft : {0ULL, 1ULL, 116444736000000000ULL, 132223104015000007ULL,
                             133500000000000000ULL}) {
        EXPECT_EQ(filetime_from_timestamp(timestamp_from_filetime(ft)), ft) << ft;
    }
}

TEST(FileTimeTest, MaxValue_Saturates) {
    Timestamp ts = timestamp_from_filetime(std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(ts.time_since_epoch().count(), std::numeric_limits<std::int64_t>::max());
}

TEST(FileTimeTest, BeforeFileTimeEpoch_SaturatesToZero) {
    Timestamp ts = timestamp_from_filetime(0) - FileTimeTicks(1000);
    EXPECT_EQ(filetime_from_timestamp(ts), 0u);
}

TEST(FileTimeTest, ParseIso8601) {
    auto parsed = parse_iso8601("2020-01-01T00:00:01.5Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(filetime_from_timestamp(*parsed), 132223104015000000ULL);

    auto spaced = parse_iso8601("2020-01-01 00:00:01.5000000");
    ASSERT_TRUE(spaced.has_value());
    EXPECT_EQ(*spaced, *parsed);

    auto seconds = parse_iso8601("2020-01-01T00:00:01");
    ASSERT_TRUE(seconds.has_value());
    EXPECT_EQ(filetime_from_timestamp(*seconds), 132223104010000000ULL);
}

TEST(FileTimeTest, ParseIso8601_Invalid) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("2020-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2021-02-29T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2020-01-01T00:00:00.Z").has_value());
    EXPECT_FALSE(parse_iso8601("2020-01-01T00:00:00Zjunk").has_value());
    EXPECT_TRUE(parse_iso8601("2020-02-29T00:00:00Z").has_value());
}

}  // namespace artifacts::test
