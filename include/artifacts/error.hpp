// ==============================================================================
// artifacts/error.hpp - Ошибки чтения EVTX
// ==============================================================================
//
// Назначение:
// - ErrorKind: классификация ошибок по уровню (файл, чанк, запись, BinXML)
// - EvtxError: ошибка как значение (kind, message, offset)
// - Result<T>: результат стадии разбора (ok / value / error)
//
// Поток событий никогда не прерывается частичной порчей: ошибки уровня
// чанка и записи превращаются в диагностики, а не в исключения.
//
// ==============================================================================

#ifndef ARTIFACTS_ERROR_HPP
#define ARTIFACTS_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace artifacts {

/// Вид ошибки
enum class ErrorKind {
    Format,           // неверный заголовок файла, файл не выровнен по чанкам
    ChunkIntegrity,   // магия/CRC32 чанка, чанк пропускается
    RecordIntegrity,  // magic/size/trailer/ordering записи, остаток чанка пропускается
    BinXml,           // ошибка декодирования, пропускается одна запись
    Io                // файл не читается
};

/// Строковое имя вида ошибки ("format", "chunk", ...)
const char* error_kind_to_string(ErrorKind kind);

/// Ошибка разбора
struct EvtxError {
    ErrorKind kind = ErrorKind::Format;
    std::string message;
    std::uint64_t offset = 0;  // смещение в файле (или в чанке до привязки к файлу)

    /// Форматировать ошибку для вывода
    std::string format() const;
};

/// Результат стадии разбора
template <typename T>
struct Result {
    bool ok = false;
    T value{};
    EvtxError error;

    explicit operator bool() const { return ok; }

    static Result success(T v) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorKind kind, std::string message, std::uint64_t offset = 0) {
        Result r;
        r.ok = false;
        r.error = EvtxError{kind, std::move(message), offset};
        return r;
    }

    static Result failure(EvtxError error) {
        Result r;
        r.ok = false;
        r.error = std::move(error);
        return r;
    }
};

}  // namespace artifacts

#endif  // ARTIFACTS_ERROR_HPP
