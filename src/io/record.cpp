// ==============================================================================
// record.cpp - Записи событий в чанке
// ==============================================================================

#include <artifacts/record.hpp>

#include <string>

namespace artifacts {

const char* recovery_policy_to_string(RecoveryPolicy policy) {
    switch (policy) {
    case RecoveryPolicy::Stop:
        return "stop";
    case RecoveryPolicy::Scan:
        return "scan";
    }
    return "stop";
}

std::optional<RecoveryPolicy> recovery_policy_from_string(std::string_view name) {
    if (name == "stop") {
        return RecoveryPolicy::Stop;
    }
    if (name == "scan") {
        return RecoveryPolicy::Scan;
    }
    return std::nullopt;
}

Result<RawRecord> parse_record(ByteView chunk, std::size_t offset, std::size_t data_end,
                               std::optional<std::uint64_t> previous_id) {
    using R = Result<RawRecord>;

    if (data_end > chunk.size()) {
        data_end = chunk.size();
    }
    if (offset + RECORD_HEADER_SIZE > data_end) {
        return R::failure(ErrorKind::RecordIntegrity, "record header truncated by end of data",
                          offset);
    }

    RawRecord record;
    record.offset = static_cast<std::uint32_t>(offset);
    record.header.magic = chunk.u32_at(offset);
    record.header.size = chunk.u32_at(offset + 4);
    record.header.record_id = chunk.u64_at(offset + 8);
    record.header.timestamp = chunk.u64_at(offset + 16);

    if (record.header.magic != RECORD_MAGIC) {
        return R::failure(ErrorKind::RecordIntegrity, "bad record signature", offset);
    }

    std::size_t size = record.header.size;
    if (size < RECORD_MIN_SIZE || size > data_end - offset) {
        return R::failure(ErrorKind::RecordIntegrity,
                          "record size " + std::to_string(size) + " out of range", offset);
    }

    std::uint32_t trailer = chunk.u32_at(offset + size - 4);
    if (trailer != record.header.size) {
        return R::failure(ErrorKind::RecordIntegrity,
                          "record " + std::to_string(record.header.record_id) + " trailing size " +
                              std::to_string(trailer) + " != declared " + std::to_string(size),
                          offset);
    }

    if (previous_id && record.header.record_id <= *previous_id) {
        return R::failure(ErrorKind::RecordIntegrity,
                          "record id " + std::to_string(record.header.record_id) +
                              " does not follow " + std::to_string(*previous_id),
                          offset);
    }

    record.payload_offset = static_cast<std::uint32_t>(offset + RECORD_HEADER_SIZE);
    record.payload_size = static_cast<std::uint32_t>(size - RECORD_MIN_SIZE);
    return R::success(record);
}

// ============================================================================
// RecordReader
// ============================================================================

RecordReader::RecordReader(const ChunkView& chunk, RecoveryPolicy policy, Diagnostics* diagnostics)
    : chunk_(chunk), policy_(policy), diagnostics_(diagnostics) {}

void RecordReader::report(const EvtxError& error) const {
    if (diagnostics_ == nullptr) {
        return;
    }
    EvtxError located = error;
    located.message = "chunk " + std::to_string(chunk_.index()) + ": " + error.message;
    located.offset += chunk_.file_offset();
    diagnostics_->report(located);
}

bool RecordReader::next(RawRecord& out) {
    const std::size_t data_end = chunk_.data_end();

    while (!done_) {
        // Хвост короче заголовка записи: данных больше нет
        if (offset_ + RECORD_HEADER_SIZE > data_end) {
            done_ = true;
            break;
        }

        auto record = parse_record(chunk_.bytes(), offset_, data_end, previous_id_);
        if (record) {
            out = record.value;
            previous_id_ = record.value.header.record_id;
            offset_ += record.value.header.size;
            ++read_;
            return true;
        }

        ++failures_;
        report(record.error);

        if (policy_ == RecoveryPolicy::Scan && resync()) {
            continue;
        }
        done_ = true;
    }
    return false;
}

bool RecordReader::resync() {
    const std::size_t data_end = chunk_.data_end();
    ByteView bytes = chunk_.bytes();

    for (std::size_t pos = offset_ + 1; pos + RECORD_MIN_SIZE <= data_end; ++pos) {
        if (bytes.u32_at(pos) != RECORD_MAGIC) {
            continue;
        }
        if (parse_record(bytes, pos, data_end, previous_id_)) {
            if (diagnostics_ != nullptr) {
                diagnostics_->debug("chunk " + std::to_string(chunk_.index()) +
                                    ": resynchronised at offset " + std::to_string(pos));
            }
            offset_ = pos;
            return true;
        }
    }
    return false;
}

}  // namespace artifacts
