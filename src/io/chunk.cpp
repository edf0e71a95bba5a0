// ==============================================================================
// chunk.cpp - Заголовок файла и чанки EVTX
// ==============================================================================
//
// Заголовок чанка (512 байт):
//   0   magic "ElfChnk\0"
//   8   first / last record number (u64 x2)
//   24  first / last record id (u64 x2)
//   40  header size u32 (128)
//   44  last record data offset u32
//   48  free space offset u32
//   52  CRC32 данных записей [512, free_space_offset)
//   120 flags u32
//   124 CRC32 заголовка [0,120) + [128,512)
//   128 string offset table, 384 template pointer table
//
// ==============================================================================

#include <artifacts/chunk.hpp>

#include <cstring>
#include <iomanip>
#include <sstream>
#include <string>

namespace artifacts {

namespace {

std::string hex32(std::uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}

}  // namespace

// ============================================================================
// FileHeader
// ============================================================================

Result<FileHeader> parse_file_header(ByteView file) {
    if (file.size() < FILE_HEADER_SIZE) {
        return Result<FileHeader>::failure(
            ErrorKind::Format, "file is " + std::to_string(file.size()) +
                                   " bytes, shorter than the 4096-byte file header");
    }
    if (std::memcmp(file.data(), FILE_MAGIC, sizeof(FILE_MAGIC)) != 0) {
        return Result<FileHeader>::failure(ErrorKind::Format, "missing ElfFile signature");
    }

    FileHeader h;
    h.first_chunk_number = file.u64_at(8);
    h.last_chunk_number = file.u64_at(16);
    h.next_record_id = file.u64_at(24);
    h.header_size = file.u32_at(32);
    h.minor_version = file.u16_at(36);
    h.major_version = file.u16_at(38);
    h.header_block_size = file.u16_at(40);
    h.chunk_count = file.u16_at(42);
    h.flags = file.u32_at(120);
    h.checksum = file.u32_at(124);
    h.computed_checksum = crc32(file.sub(0, FILE_HEADER_CHECKSUM_SPAN));

    std::uint64_t expected = FILE_HEADER_SIZE + static_cast<std::uint64_t>(h.chunk_count) * CHUNK_SIZE;
    if (file.size() < expected) {
        return Result<FileHeader>::failure(
            ErrorKind::Format, "file is " + std::to_string(file.size()) + " bytes, header declares " +
                                   std::to_string(h.chunk_count) + " chunks (" +
                                   std::to_string(expected) + " bytes)");
    }

    return Result<FileHeader>::success(h);
}

// ============================================================================
// ChunkHeader
// ============================================================================

bool has_chunk_magic(ByteView bytes) {
    return bytes.size() >= sizeof(CHUNK_MAGIC) &&
           std::memcmp(bytes.data(), CHUNK_MAGIC, sizeof(CHUNK_MAGIC)) == 0;
}

std::uint32_t chunk_header_checksum(ByteView bytes) {
    std::uint32_t crc = crc32(bytes.sub(0, CHUNK_HEADER_CHECKSUM_SPAN));
    return crc32_update(crc, bytes.sub(CHUNK_TABLES_OFFSET, CHUNK_HEADER_SIZE - CHUNK_TABLES_OFFSET));
}

Result<ChunkHeader> parse_chunk_header(ByteView bytes, bool validate_checksums) {
    using R = Result<ChunkHeader>;

    if (bytes.size() < CHUNK_SIZE) {
        return R::failure(ErrorKind::ChunkIntegrity,
                          "truncated chunk of " + std::to_string(bytes.size()) + " bytes");
    }
    if (!has_chunk_magic(bytes)) {
        return R::failure(ErrorKind::ChunkIntegrity, "missing ElfChnk signature");
    }

    ChunkHeader h;
    h.first_record_number = bytes.u64_at(8);
    h.last_record_number = bytes.u64_at(16);
    h.first_record_id = bytes.u64_at(24);
    h.last_record_id = bytes.u64_at(32);
    h.header_size = bytes.u32_at(40);
    h.last_record_offset = bytes.u32_at(44);
    h.free_space_offset = bytes.u32_at(48);
    h.data_checksum = bytes.u32_at(52);
    h.flags = bytes.u32_at(120);
    h.header_checksum = bytes.u32_at(124);

    if (h.free_space_offset < CHUNK_HEADER_SIZE || h.free_space_offset > CHUNK_SIZE) {
        return R::failure(ErrorKind::ChunkIntegrity,
                          "free space offset " + std::to_string(h.free_space_offset) +
                              " outside [512, 65536]",
                          48);
    }

    if (validate_checksums) {
        std::uint32_t header_crc = chunk_header_checksum(bytes);
        if (header_crc != h.header_checksum) {
            return R::failure(ErrorKind::ChunkIntegrity,
                              "header checksum mismatch (stored " + hex32(h.header_checksum) +
                                  ", computed " + hex32(header_crc) + ")",
                              124);
        }

        std::uint32_t data_crc = crc32(
            bytes.sub(CHUNK_HEADER_SIZE, h.free_space_offset - CHUNK_HEADER_SIZE));
        if (data_crc != h.data_checksum) {
            return R::failure(ErrorKind::ChunkIntegrity,
                              "record data checksum mismatch (stored " + hex32(h.data_checksum) +
                                  ", computed " + hex32(data_crc) + ")",
                              52);
        }
    }

    return R::success(h);
}

// ============================================================================
// ChunkView
// ============================================================================

ChunkView::ChunkView(std::size_t index, std::uint64_t file_offset, const ChunkHeader& header,
                     ByteView bytes)
    : index_(index), file_offset_(file_offset), header_(header), context_(bytes) {}

// ============================================================================
// ChunkReader
// ============================================================================

ChunkReader::ChunkReader(ByteView file, std::size_t declared_chunks, bool validate_checksums,
                         Diagnostics* diagnostics)
    : file_(file),
      declared_(declared_chunks),
      available_(file.size() > FILE_HEADER_SIZE ? (file.size() - FILE_HEADER_SIZE) / CHUNK_SIZE
                                                : 0),
      validate_checksums_(validate_checksums),
      diagnostics_(diagnostics) {}

std::optional<ChunkView> ChunkReader::next() {
    while (index_ < available_) {
        std::size_t index = index_++;
        std::uint64_t offset = FILE_HEADER_SIZE + static_cast<std::uint64_t>(index) * CHUNK_SIZE;
        ByteView bytes = file_.sub(static_cast<std::size_t>(offset), CHUNK_SIZE);

        // Лишний чанк за пределами chunk_count без магии: конец данных
        if (index >= declared_ && !has_chunk_magic(bytes)) {
            index_ = available_;
            break;
        }

        ++seen_;
        auto header = parse_chunk_header(bytes, validate_checksums_);
        if (!header) {
            ++corrupt_;
            if (diagnostics_ != nullptr) {
                EvtxError error = header.error;
                error.message = "chunk " + std::to_string(index) + " skipped: " + error.message;
                error.offset += offset;
                diagnostics_->report(error);
            }
            continue;
        }

        return ChunkView(index, offset, header.value, bytes);
    }
    return std::nullopt;
}

void ChunkReader::rewind() {
    index_ = 0;
    seen_ = 0;
    corrupt_ = 0;
}

}  // namespace artifacts
