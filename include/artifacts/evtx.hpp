// ==============================================================================
// artifacts/evtx.hpp - Чтение EVTX: открытие файла и поток событий
// ==============================================================================
//
// Назначение:
// - open(path | bytes): проверка заголовка файла и создание EventStream
// - EventStream: ленивый pull-поток Event (и сырых EvtxRecord)
// - StreamStats: счётчики пропущенных чанков и записей
//
// Цепочка: файл → ChunkReader → ChunkView → RecordReader → BinXmlDecoder
// (кеш шаблонов чанка) → EventExtractor → Event.
//
// Порча обрабатывается на трёх уровнях и не прерывает поток:
// - чанк (магия/CRC32): пропускается целиком
// - запись (magic/size/trailer/порядок id): остаток чанка пропускается
//   (или поиск следующей записи при RecoveryPolicy::Scan)
// - BinXML: пропускается одна запись
//
// Формат EVTX:
// - File header: "ElfFile\0" + metadata (4096 bytes)
// - Chunks: "ElfChnk\0" + records (65536 bytes each)
// - Records: Binary XML data с template substitution
//
// ==============================================================================

#ifndef ARTIFACTS_EVTX_HPP
#define ARTIFACTS_EVTX_HPP

#include <artifacts/binxml.hpp>
#include <artifacts/chunk.hpp>
#include <artifacts/config.hpp>
#include <artifacts/diagnostics.hpp>
#include <artifacts/error.hpp>
#include <artifacts/event.hpp>
#include <artifacts/filetime.hpp>
#include <artifacts/output.hpp>
#include <artifacts/record.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace artifacts {

/// Декодированная запись
struct EvtxRecord {
    std::uint64_t record_id = 0;
    Timestamp timestamp{};     // из заголовка записи
    std::size_t chunk_index = 0;
    BinXmlNode tree;           // Fragment с корневым элементом Event
};

/// Счётчики потока
struct StreamStats {
    std::size_t chunks_total = 0;       // чанков с магией или в пределах chunk_count
    std::size_t chunks_valid = 0;
    std::size_t chunks_corrupt = 0;
    std::size_t records_read = 0;       // прошли проверку целостности
    std::size_t records_dropped = 0;    // ошибка BinXML
    std::size_t records_truncated = 0;  // нарушения целостности записей
    std::size_t records_without_system = 0;
    std::size_t events = 0;
};

struct OpenOptions {
    ReaderConfig config;
    // Журнал диагностик (не владеет). nullptr: поток создаёт свой Writer
    // из config.output
    output::Writer* writer = nullptr;
};

class EventStream;

struct OpenResult {
    bool ok = false;
    std::unique_ptr<EventStream> stream;
    EvtxError error;

    explicit operator bool() const { return ok; }
};

/// Открыть EVTX файл (читается целиком)
OpenResult open(const std::filesystem::path& path, const OpenOptions& options = {});

/// Открыть EVTX из буфера в памяти
OpenResult open(std::vector<std::uint8_t> bytes, const OpenOptions& options = {});

// ----------------------------------------------------------------------------
// EventIterator
// ----------------------------------------------------------------------------

/// Итератор для range-based for
class EventIterator {
public:
    EventIterator(EventStream* stream, bool end = false);

    EventIterator& operator++();
    bool operator!=(const EventIterator& other) const;
    const Event& operator*() const;

private:
    EventStream* stream_;
    bool end_;
    std::optional<Event> current_;

    void advance();
};

// ----------------------------------------------------------------------------
// EventStream
// ----------------------------------------------------------------------------

class EventStream {
public:
    EventStream(std::vector<std::uint8_t> buffer, const FileHeader& header, OpenOptions options,
                std::filesystem::path path = {});

    // Представления чанков ссылаются на buffer_
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Следующее событие; записи без Event/System пропускаются
    bool next(Event& event);

    /// Следующая декодированная запись (без извлечения Event)
    bool next_record(EvtxRecord& record);

    /// Вычитать оставшиеся события и вернуть их количество
    std::size_t count();

    /// Начать сначала (кеши шаблонов строятся заново)
    void rewind();

    EventIterator begin() { return EventIterator(this); }
    EventIterator end() { return EventIterator(this, true); }

    const StreamStats& stats() const { return stats_; }
    const std::vector<EvtxError>& diagnostics() const { return diagnostics_.entries(); }
    std::size_t diagnostics_total() const { return diagnostics_.total(); }

    const FileHeader& header() const { return header_; }
    const std::filesystem::path& path() const { return path_; }
    std::size_t size() const { return buffer_.size(); }

    /// Журнал потока: OpenOptions::writer или собственный Writer
    output::Writer* writer() const { return writer_; }

private:
    bool advance_chunk();
    void finish_chunk();

    std::vector<std::uint8_t> buffer_;
    FileHeader header_;
    OpenOptions options_;
    std::filesystem::path path_;

    std::unique_ptr<output::Writer> own_writer_;
    output::Writer* writer_;

    Diagnostics diagnostics_;
    ChunkReader chunks_;
    EventExtractor extractor_;
    StreamStats stats_;

    std::optional<ChunkView> chunk_;
    std::optional<RecordReader> records_;  // ссылается на *chunk_
};

}  // namespace artifacts

#endif  // ARTIFACTS_EVTX_HPP
