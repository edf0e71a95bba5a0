// ==============================================================================
// artifacts/bytes.hpp - Байтовые примитивы EVTX
// ==============================================================================
//
// Назначение:
// - ByteView: невладеющий срез буфера файла (файл, чанк, payload записи)
// - ByteCursor: чтение little-endian значений с проверкой границ
// - UTF-16LE → UTF-8 (включая суррогатные пары)
// - CRC32 (zlib) для заголовков и данных чанков
//
// Все смещения курсора абсолютные относительно начала ByteView, поэтому
// курсор поверх чанка сразу даёт chunk-relative offsets, которыми оперирует
// Binary XML (имена, шаблоны).
//
// ==============================================================================

#ifndef ARTIFACTS_BYTES_HPP
#define ARTIFACTS_BYTES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace artifacts {

// ----------------------------------------------------------------------------
// ByteView
// ----------------------------------------------------------------------------

/// Невладеющий срез байтов (аналог span для C++17)
class ByteView {
public:
    ByteView() = default;
    ByteView(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit ByteView(const std::vector<std::uint8_t>& buffer)
        : data_(buffer.data()), size_(buffer.size()) {}

    const std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::uint8_t operator[](std::size_t index) const { return data_[index]; }

    /// Подсрез [offset, offset + count), обрезается по концу среза
    ByteView sub(std::size_t offset, std::size_t count) const;

    /// Подсрез [offset, size)
    ByteView sub(std::size_t offset) const;

    // Чтение по абсолютному смещению (std::out_of_range за границей)
    std::uint8_t u8_at(std::size_t offset) const;
    std::uint16_t u16_at(std::size_t offset) const;
    std::uint32_t u32_at(std::size_t offset) const;
    std::uint64_t u64_at(std::size_t offset) const;

private:
    void require(std::size_t offset, std::size_t count) const;

    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
};

// ----------------------------------------------------------------------------
// ByteCursor
// ----------------------------------------------------------------------------

/// Последовательное чтение из ByteView в пределах [position, limit)
///
/// Чтение за limit бросает std::out_of_range; вызывающий код (декодер
/// Binary XML) переводит исключение в ошибку уровня записи.
class ByteCursor {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    explicit ByteCursor(ByteView view, std::size_t position = 0, std::size_t limit = npos);

    std::size_t position() const { return position_; }
    std::size_t limit() const { return limit_; }
    std::size_t remaining() const { return position_ < limit_ ? limit_ - position_ : 0; }
    bool eof() const { return position_ >= limit_; }

    /// Перейти на абсолютное смещение (не дальше limit)
    void seek(std::size_t position);

    void skip(std::size_t count);

    std::uint8_t peek_u8() const;
    std::uint8_t read_u8();
    std::uint16_t read_u16();
    std::uint32_t read_u32();
    std::uint64_t read_u64();

    /// Прочитать count байт как срез того же буфера
    ByteView read_bytes(std::size_t count);

    /// Прочитать char_count UTF-16LE символов
    std::string read_utf16(std::size_t char_count);

    ByteView view() const { return view_; }

private:
    void require(std::size_t count) const;

    ByteView view_;
    std::size_t position_ = 0;
    std::size_t limit_ = 0;
};

// ----------------------------------------------------------------------------
// Кодировки
// ----------------------------------------------------------------------------

/// Конвертировать UTF-16LE байты в UTF-8
/// @param stop_at_nul остановиться на первом NUL символе
/// Непарные суррогаты заменяются на U+FFFD
std::string utf16le_to_utf8(ByteView bytes, bool stop_at_nul = false);

/// Дописать code point в UTF-8
void append_utf8(std::string& out, std::uint32_t code_point);

// ----------------------------------------------------------------------------
// CRC32
// ----------------------------------------------------------------------------

/// CRC32 (полином 0xEDB88320, как в zlib)
std::uint32_t crc32(ByteView bytes);

/// Продолжить CRC32 с предыдущего значения
std::uint32_t crc32_update(std::uint32_t crc, ByteView bytes);

}  // namespace artifacts

#endif  // ARTIFACTS_BYTES_HPP
