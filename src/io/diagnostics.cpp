// ==============================================================================
// diagnostics.cpp - Диагностики чтения
// ==============================================================================

#include <artifacts/diagnostics.hpp>

namespace artifacts {

Diagnostics::Diagnostics(std::size_t limit, output::Writer* writer)
    : limit_(limit), writer_(writer) {}

void Diagnostics::report(const EvtxError& error) {
    ++total_;
    if (entries_.size() < limit_) {
        entries_.push_back(error);
    }

    if (writer_ == nullptr) {
        return;
    }

    switch (error.kind) {
    case ErrorKind::BinXml:
        writer_->debug("dropped record: " + error.format());
        break;
    case ErrorKind::Io:
        writer_->error(error.format());
        break;
    default:
        writer_->warn(error.format());
        break;
    }
}

void Diagnostics::debug(std::string_view message) const {
    if (writer_ != nullptr) {
        writer_->debug(message);
    }
}

void Diagnostics::trace(std::string_view message) const {
    if (writer_ != nullptr) {
        writer_->trace(message);
    }
}

void Diagnostics::clear() {
    entries_.clear();
    total_ = 0;
}

}  // namespace artifacts
