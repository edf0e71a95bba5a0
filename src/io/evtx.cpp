// ==============================================================================
// evtx.cpp - Чтение EVTX: открытие файла и поток событий
// ==============================================================================

#include <artifacts/evtx.hpp>

#include <artifacts/binxml_decoder.hpp>
#include <artifacts/platform.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace artifacts {

// ============================================================================
// open
// ============================================================================

namespace {

OpenResult open_buffer(std::vector<std::uint8_t> bytes, const OpenOptions& options,
                       std::filesystem::path path) {
    OpenResult result;

    auto header = parse_file_header(ByteView(bytes));
    if (!header) {
        result.error = header.error;
        if (!path.empty()) {
            result.error.message = platform::path_to_utf8(path) + ": " + result.error.message;
        }
        return result;
    }

    result.stream = std::make_unique<EventStream>(std::move(bytes), header.value, options,
                                                  std::move(path));
    result.ok = true;

    output::Writer* writer = result.stream->writer();
    const FileHeader& h = result.stream->header();
    const std::filesystem::path& source = result.stream->path();
    std::string name = source.empty() ? std::string("<memory>") : platform::path_to_utf8(source);
    writer->debug("opened " + name + ": " + std::to_string(result.stream->size()) +
                  " bytes, version " + std::to_string(h.major_version) + "." +
                  std::to_string(h.minor_version) + ", " + std::to_string(h.chunk_count) +
                  " chunks" + (h.is_dirty() ? ", dirty" : ""));
    if (!h.checksum_valid()) {
        writer->warn(name + ": file header checksum mismatch");
    }
    return result;
}

std::unique_ptr<output::Writer> make_own_writer(const OpenOptions& options) {
    if (options.writer != nullptr) {
        return nullptr;
    }
    return std::make_unique<output::Writer>(options.config.output);
}

}  // namespace

OpenResult open(const std::filesystem::path& path, const OpenOptions& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        OpenResult result;
        result.error = EvtxError{ErrorKind::Io,
                                 "cannot open " + platform::path_to_utf8(path), 0};
        return result;
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    if (file.bad()) {
        OpenResult result;
        result.error = EvtxError{ErrorKind::Io,
                                 "read error on " + platform::path_to_utf8(path), 0};
        return result;
    }

    return open_buffer(std::move(bytes), options, path);
}

OpenResult open(std::vector<std::uint8_t> bytes, const OpenOptions& options) {
    return open_buffer(std::move(bytes), options, {});
}

// ============================================================================
// EventIterator
// ============================================================================

EventIterator::EventIterator(EventStream* stream, bool end) : stream_(stream), end_(end) {
    if (!end_ && stream_) {
        advance();
    }
}

void EventIterator::advance() {
    Event event;
    if (stream_ && stream_->next(event)) {
        current_ = std::move(event);
    } else {
        current_.reset();
        end_ = true;
    }
}

EventIterator& EventIterator::operator++() {
    advance();
    return *this;
}

bool EventIterator::operator!=(const EventIterator& other) const {
    return end_ != other.end_;
}

const Event& EventIterator::operator*() const {
    return *current_;
}

// ============================================================================
// EventStream
// ============================================================================

EventStream::EventStream(std::vector<std::uint8_t> buffer, const FileHeader& header,
                         OpenOptions options, std::filesystem::path path)
    : buffer_(std::move(buffer)),
      header_(header),
      options_(std::move(options)),
      path_(std::move(path)),
      own_writer_(make_own_writer(options_)),
      writer_(options_.writer != nullptr ? options_.writer : own_writer_.get()),
      diagnostics_(options_.config.max_diagnostics, writer_),
      chunks_(ByteView(buffer_), header_.chunk_count, options_.config.validate_checksums,
              &diagnostics_),
      extractor_(options_.config.extractor_options()) {}

bool EventStream::advance_chunk() {
    chunk_ = chunks_.next();
    stats_.chunks_total = chunks_.chunks_seen();
    stats_.chunks_corrupt = chunks_.chunks_corrupt();
    if (!chunk_) {
        return false;
    }

    ++stats_.chunks_valid;
    const ChunkHeader& h = chunk_->header();
    diagnostics_.trace("chunk " + std::to_string(chunk_->index()) + ": records " +
                       std::to_string(h.first_record_id) + ".." +
                       std::to_string(h.last_record_id) + ", data end " +
                       std::to_string(h.free_space_offset));

    records_.emplace(*chunk_, options_.config.record_recovery, &diagnostics_);
    return true;
}

void EventStream::finish_chunk() {
    if (records_) {
        stats_.records_truncated += records_->integrity_failures();
        records_.reset();
    }
    if (chunk_) {
        const TemplateCache& cache = chunk_->context().templates;
        diagnostics_.trace("chunk " + std::to_string(chunk_->index()) + ": " +
                           std::to_string(cache.size()) + " templates, " +
                           std::to_string(cache.hits()) + " hits, " +
                           std::to_string(cache.misses()) + " misses");
        chunk_.reset();
    }
}

bool EventStream::next_record(EvtxRecord& record) {
    while (true) {
        if (!records_ && !advance_chunk()) {
            return false;
        }

        RawRecord raw;
        if (!records_->next(raw)) {
            finish_chunk();
            continue;
        }
        ++stats_.records_read;

        BinXmlDecoder decoder(chunk_->context());
        auto decoded = decoder.decode(raw.payload_offset, raw.payload_size);
        if (!decoded) {
            ++stats_.records_dropped;
            EvtxError error = decoded.error;
            error.message = "record " + std::to_string(raw.header.record_id) + ": " + error.message;
            error.offset += chunk_->file_offset();
            diagnostics_.report(error);
            continue;
        }

        record.record_id = raw.header.record_id;
        record.timestamp = timestamp_from_filetime(raw.header.timestamp);
        record.chunk_index = chunk_->index();
        record.tree = std::move(decoded.value);
        return true;
    }
}

bool EventStream::next(Event& event) {
    EvtxRecord record;
    while (next_record(record)) {
        auto extracted = extractor_.extract(record.tree, record.record_id, record.timestamp);
        if (!extracted) {
            ++stats_.records_without_system;
            continue;
        }
        ++stats_.events;
        event = std::move(*extracted);
        return true;
    }
    return false;
}

std::size_t EventStream::count() {
    std::size_t n = 0;
    Event event;
    while (next(event)) {
        ++n;
    }
    return n;
}

void EventStream::rewind() {
    records_.reset();
    chunk_.reset();
    chunks_.rewind();
    diagnostics_.clear();
    stats_ = StreamStats{};
}

}  // namespace artifacts
