// ==============================================================================
// bytes.cpp - Байтовые примитивы EVTX
// ==============================================================================

#include <artifacts/bytes.hpp>
#include <string>
#include <zlib.h>

namespace artifacts {

// ============================================================================
// ByteView
// ============================================================================

ByteView ByteView::sub(std::size_t offset, std::size_t count) const {
    if (offset >= size_) {
        return ByteView(data_ + size_, 0);
    }
    std::size_t available = size_ - offset;
    return ByteView(data_ + offset, count < available ? count : available);
}

ByteView ByteView::sub(std::size_t offset) const {
    return sub(offset, size_);
}

void ByteView::require(std::size_t offset, std::size_t count) const {
    if (offset > size_ || count > size_ - offset) {
        throw std::out_of_range("read of " + std::to_string(count) + " bytes at offset " +
                                std::to_string(offset) + " past end of " +
                                std::to_string(size_) + "-byte buffer");
    }
}

std::uint8_t ByteView::u8_at(std::size_t offset) const {
    require(offset, 1);
    return data_[offset];
}

std::uint16_t ByteView::u16_at(std::size_t offset) const {
    require(offset, 2);
    return static_cast<std::uint16_t>(data_[offset] | (data_[offset + 1] << 8));
}

std::uint32_t ByteView::u32_at(std::size_t offset) const {
    require(offset, 4);
    return static_cast<std::uint32_t>(data_[offset]) |
           (static_cast<std::uint32_t>(data_[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data_[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data_[offset + 3]) << 24);
}

std::uint64_t ByteView::u64_at(std::size_t offset) const {
    require(offset, 8);
    std::uint64_t lo = u32_at(offset);
    std::uint64_t hi = u32_at(offset + 4);
    return lo | (hi << 32);
}

// ============================================================================
// ByteCursor
// ============================================================================

ByteCursor::ByteCursor(ByteView view, std::size_t position, std::size_t limit)
    : view_(view), position_(position), limit_(limit < view.size() ? limit : view.size()) {}

void ByteCursor::require(std::size_t count) const {
    if (position_ > limit_ || count > limit_ - position_) {
        throw std::out_of_range("read of " + std::to_string(count) + " bytes at offset " +
                                std::to_string(position_) + " past limit " +
                                std::to_string(limit_));
    }
}

void ByteCursor::seek(std::size_t position) {
    if (position > limit_) {
        throw std::out_of_range("seek to " + std::to_string(position) + " past limit " +
                                std::to_string(limit_));
    }
    position_ = position;
}

void ByteCursor::skip(std::size_t count) {
    require(count);
    position_ += count;
}

std::uint8_t ByteCursor::peek_u8() const {
    require(1);
    return view_[position_];
}

std::uint8_t ByteCursor::read_u8() {
    require(1);
    return view_[position_++];
}

std::uint16_t ByteCursor::read_u16() {
    require(2);
    std::uint16_t v = view_.u16_at(position_);
    position_ += 2;
    return v;
}

std::uint32_t ByteCursor::read_u32() {
    require(4);
    std::uint32_t v = view_.u32_at(position_);
    position_ += 4;
    return v;
}

std::uint64_t ByteCursor::read_u64() {
    require(8);
    std::uint64_t v = view_.u64_at(position_);
    position_ += 8;
    return v;
}

ByteView ByteCursor::read_bytes(std::size_t count) {
    require(count);
    ByteView result = view_.sub(position_, count);
    position_ += count;
    return result;
}

std::string ByteCursor::read_utf16(std::size_t char_count) {
    if (char_count > remaining() / 2) {
        require(char_count * 2);
    }
    return utf16le_to_utf8(read_bytes(char_count * 2));
}

// ============================================================================
// UTF-16LE → UTF-8
// ============================================================================

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string utf16le_to_utf8(ByteView bytes, bool stop_at_nul) {
    constexpr std::uint32_t REPLACEMENT = 0xFFFD;

    std::string result;
    result.reserve(bytes.size() / 2);

    std::size_t count = bytes.size() / 2;
    for (std::size_t i = 0; i < count; ++i) {
        std::uint32_t unit = bytes.u16_at(i * 2);
        if (unit == 0 && stop_at_nul) {
            break;
        }

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // high surrogate: нужен следующий low surrogate
            if (i + 1 < count) {
                std::uint32_t low = bytes.u16_at((i + 1) * 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    append_utf8(result, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    ++i;
                    continue;
                }
            }
            append_utf8(result, REPLACEMENT);
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            append_utf8(result, REPLACEMENT);
        } else {
            append_utf8(result, unit);
        }
    }

    return result;
}

// ============================================================================
// CRC32
// ============================================================================

std::uint32_t crc32_update(std::uint32_t crc, ByteView bytes) {
    // zlib принимает uInt длину; чанки EVTX (64 KiB) заведомо помещаются
    uLong value = ::crc32(static_cast<uLong>(crc), reinterpret_cast<const Bytef*>(bytes.data()),
                          static_cast<uInt>(bytes.size()));
    return static_cast<std::uint32_t>(value);
}

std::uint32_t crc32(ByteView bytes) {
    return crc32_update(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0)), bytes);
}

}  // namespace artifacts
