// ==============================================================================
// error.cpp - Ошибки чтения EVTX
// ==============================================================================

#include <artifacts/error.hpp>
#include <iomanip>
#include <sstream>

namespace artifacts {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Format:
        return "format";
    case ErrorKind::ChunkIntegrity:
        return "chunk integrity";
    case ErrorKind::RecordIntegrity:
        return "record integrity";
    case ErrorKind::BinXml:
        return "binxml";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

std::string EvtxError::format() const {
    std::ostringstream oss;
    oss << error_kind_to_string(kind) << " error at offset 0x" << std::hex << offset << ": "
        << message;
    return oss.str();
}

}  // namespace artifacts
