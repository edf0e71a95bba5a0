// ==============================================================================
// artifacts/record.hpp - Записи событий в чанке
// ==============================================================================
//
// Назначение:
// - RecordHeader: magic 0x00002a2a, size, record id, timestamp (FILETIME)
// - RawRecord: заголовок + положение BinXML payload в чанке
// - RecordReader: последовательный обход записей от смещения 512 до
//   free space offset с проверкой целостности каждой записи
//
// Нарушение целостности (magic, размер, trailer, порядок идентификаторов):
// - RecoveryPolicy::Stop: остаток чанка пропускается
// - RecoveryPolicy::Scan: поиск следующей самосогласованной записи
// Все записи, прочитанные до нарушения, уже отданы вызывающему.
//
// ==============================================================================

#ifndef ARTIFACTS_RECORD_HPP
#define ARTIFACTS_RECORD_HPP

#include <artifacts/bytes.hpp>
#include <artifacts/chunk.hpp>
#include <artifacts/diagnostics.hpp>
#include <artifacts/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace artifacts {

constexpr std::uint32_t RECORD_MAGIC = 0x00002a2a;
constexpr std::size_t RECORD_HEADER_SIZE = 24;
constexpr std::size_t RECORD_MIN_SIZE = 28;  // заголовок + trailer

/// Политика после RecordIntegrity ошибки
enum class RecoveryPolicy { Stop, Scan };

const char* recovery_policy_to_string(RecoveryPolicy policy);
std::optional<RecoveryPolicy> recovery_policy_from_string(std::string_view name);

struct RecordHeader {
    std::uint32_t magic = 0;
    std::uint32_t size = 0;
    std::uint64_t record_id = 0;
    std::uint64_t timestamp = 0;  // FILETIME
};

struct RawRecord {
    RecordHeader header;
    std::uint32_t offset = 0;          // смещение записи в чанке
    std::uint32_t payload_offset = 0;  // BinXML
    std::uint32_t payload_size = 0;
};

/// Разобрать запись по смещению в чанке и проверить её самосогласованность
/// @param data_end конец области записей (free space offset)
/// @param previous_id идентификатор предыдущей записи (должен быть меньше)
Result<RawRecord> parse_record(ByteView chunk, std::size_t offset, std::size_t data_end,
                               std::optional<std::uint64_t> previous_id = std::nullopt);

class RecordReader {
public:
    explicit RecordReader(const ChunkView& chunk, RecoveryPolicy policy = RecoveryPolicy::Stop,
                          Diagnostics* diagnostics = nullptr);

    /// Следующая запись; false когда чанк исчерпан или обход остановлен
    bool next(RawRecord& out);

    /// Количество нарушений целостности в этом чанке
    std::size_t integrity_failures() const { return failures_; }

    std::size_t records_read() const { return read_; }

private:
    /// Найти следующее смещение с самосогласованной записью
    bool resync();

    void report(const EvtxError& error) const;

    const ChunkView& chunk_;
    RecoveryPolicy policy_;
    Diagnostics* diagnostics_;

    std::size_t offset_ = CHUNK_HEADER_SIZE;
    std::optional<std::uint64_t> previous_id_;
    bool done_ = false;
    std::size_t failures_ = 0;
    std::size_t read_ = 0;
};

}  // namespace artifacts

#endif  // ARTIFACTS_RECORD_HPP
