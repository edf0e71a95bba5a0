// ==============================================================================
// artifacts/diagnostics.hpp - Диагностики чтения
// ==============================================================================
//
// Назначение:
// - Ограниченный список пропущенных чанков/записей (side channel потока)
// - Журналирование через output::Writer по уровню ошибки
//
// ==============================================================================

#ifndef ARTIFACTS_DIAGNOSTICS_HPP
#define ARTIFACTS_DIAGNOSTICS_HPP

#include <artifacts/error.hpp>
#include <artifacts/output.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace artifacts {

class Diagnostics {
public:
    explicit Diagnostics(std::size_t limit = 256, output::Writer* writer = nullptr);

    /// Записать ошибку: chunk/record integrity → warn, binxml → debug
    void report(const EvtxError& error);

    void debug(std::string_view message) const;
    void trace(std::string_view message) const;

    /// Сохранённые ошибки (не больше limit)
    const std::vector<EvtxError>& entries() const { return entries_; }

    /// Всего сообщённых ошибок, включая не поместившиеся в список
    std::size_t total() const { return total_; }

    void clear();

    output::Writer* writer() const { return writer_; }

private:
    std::size_t limit_;
    output::Writer* writer_;
    std::vector<EvtxError> entries_;
    std::size_t total_ = 0;
};

}  // namespace artifacts

#endif  // ARTIFACTS_DIAGNOSTICS_HPP
