// ==============================================================================
// artifacts/chunk.hpp - Заголовок файла и чанки EVTX
// ==============================================================================
//
// Назначение:
// - FileHeader: 4096-байтовый заголовок файла ("ElfFile\0")
// - ChunkHeader: 512-байтовый заголовок чанка ("ElfChnk\0")
// - ChunkView: валидированный чанк + его кеши шаблонов и имён
// - ChunkReader: ленивая перезапускаемая последовательность чанков
//
// Повреждённый чанк (магия, CRC32 заголовка, CRC32 данных) пропускается с
// диагностикой ChunkIntegrity; чтение продолжается со следующего чанка.
//
// ==============================================================================

#ifndef ARTIFACTS_CHUNK_HPP
#define ARTIFACTS_CHUNK_HPP

#include <artifacts/bytes.hpp>
#include <artifacts/diagnostics.hpp>
#include <artifacts/error.hpp>
#include <artifacts/template_cache.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace artifacts {

// ----------------------------------------------------------------------------
// Константы формата
// ----------------------------------------------------------------------------

constexpr std::size_t FILE_HEADER_SIZE = 4096;
constexpr std::size_t FILE_HEADER_CHECKSUM_SPAN = 120;
constexpr std::size_t CHUNK_SIZE = 65536;
constexpr std::size_t CHUNK_HEADER_SIZE = 512;
constexpr std::size_t CHUNK_HEADER_CHECKSUM_SPAN = 120;
constexpr std::size_t CHUNK_TABLES_OFFSET = 128;  // string offsets + template pointers

constexpr char FILE_MAGIC[8] = {'E', 'l', 'f', 'F', 'i', 'l', 'e', '\0'};
constexpr char CHUNK_MAGIC[8] = {'E', 'l', 'f', 'C', 'h', 'n', 'k', '\0'};

constexpr std::uint32_t FILE_FLAG_DIRTY = 0x1;
constexpr std::uint32_t FILE_FLAG_FULL = 0x2;

// ----------------------------------------------------------------------------
// FileHeader
// ----------------------------------------------------------------------------

struct FileHeader {
    std::uint64_t first_chunk_number = 0;
    std::uint64_t last_chunk_number = 0;
    std::uint64_t next_record_id = 0;
    std::uint32_t header_size = 0;
    std::uint16_t minor_version = 0;
    std::uint16_t major_version = 0;
    std::uint16_t header_block_size = 0;
    std::uint16_t chunk_count = 0;
    std::uint32_t flags = 0;
    std::uint32_t checksum = 0;
    std::uint32_t computed_checksum = 0;

    bool checksum_valid() const { return checksum == computed_checksum; }
    bool is_dirty() const { return (flags & FILE_FLAG_DIRTY) != 0; }
    bool is_full() const { return (flags & FILE_FLAG_FULL) != 0; }
};

/// Разобрать заголовок файла
///
/// ErrorKind::Format: файл короче заголовка, неверная магия, файл короче
/// 4096 + chunk_count * 65536. Несовпадение CRC32 не является ошибкой
/// (см. FileHeader::checksum_valid).
Result<FileHeader> parse_file_header(ByteView file);

// ----------------------------------------------------------------------------
// ChunkHeader
// ----------------------------------------------------------------------------

struct ChunkHeader {
    std::uint64_t first_record_number = 0;
    std::uint64_t last_record_number = 0;
    std::uint64_t first_record_id = 0;
    std::uint64_t last_record_id = 0;
    std::uint32_t header_size = 0;
    std::uint32_t last_record_offset = 0;
    std::uint32_t free_space_offset = 0;
    std::uint32_t data_checksum = 0;
    std::uint32_t flags = 0;
    std::uint32_t header_checksum = 0;
};

/// Есть ли магия чанка в начале среза
bool has_chunk_magic(ByteView bytes);

/// Разобрать и проверить заголовок чанка (ErrorKind::ChunkIntegrity)
/// @param bytes ровно CHUNK_SIZE байт
Result<ChunkHeader> parse_chunk_header(ByteView bytes, bool validate_checksums = true);

/// CRC32 заголовка: [0, 120) + [128, 512)
std::uint32_t chunk_header_checksum(ByteView bytes);

// ----------------------------------------------------------------------------
// ChunkView
// ----------------------------------------------------------------------------

/// Валидированный чанк: срез буфера файла + кеши декодирования
class ChunkView {
public:
    ChunkView(std::size_t index, std::uint64_t file_offset, const ChunkHeader& header,
              ByteView bytes);

    std::size_t index() const { return index_; }
    std::uint64_t file_offset() const { return file_offset_; }
    const ChunkHeader& header() const { return header_; }
    ByteView bytes() const { return context_.chunk; }

    /// Конец области записей (free space offset)
    std::size_t data_end() const { return header_.free_space_offset; }

    ChunkContext& context() { return context_; }
    const ChunkContext& context() const { return context_; }

private:
    std::size_t index_;
    std::uint64_t file_offset_;
    ChunkHeader header_;
    ChunkContext context_;
};

// ----------------------------------------------------------------------------
// ChunkReader
// ----------------------------------------------------------------------------

class ChunkReader {
public:
    /// @param file весь буфер файла (вместе с заголовком)
    /// @param declared_chunks chunk_count из заголовка файла
    ChunkReader(ByteView file, std::size_t declared_chunks, bool validate_checksums = true,
                Diagnostics* diagnostics = nullptr);

    /// Следующий валидный чанк (std::nullopt: чанки закончились)
    std::optional<ChunkView> next();

    /// Начать заново с первого чанка
    void rewind();

    /// Целых чанков в буфере
    std::size_t available() const { return available_; }

    std::size_t chunks_seen() const { return seen_; }
    std::size_t chunks_corrupt() const { return corrupt_; }

private:
    ByteView file_;
    std::size_t declared_;
    std::size_t available_;
    bool validate_checksums_;
    Diagnostics* diagnostics_;

    std::size_t index_ = 0;
    std::size_t seen_ = 0;
    std::size_t corrupt_ = 0;
};

}  // namespace artifacts

#endif  // ARTIFACTS_CHUNK_HPP
