// ==============================================================================
// artifacts/filetime.hpp - Windows FILETIME и временные метки
// ==============================================================================
//
// Назначение:
// - Timestamp: std::chrono time point с тиками 100 нс на system_clock
// - FILETIME (тики с 1601-01-01 UTC) ↔ Timestamp
// - ISO-8601 форматирование и разбор
//
// Только целочисленная 64-битная арифметика; за пределами диапазона
// значения насыщаются, а не переполняются.
//
// ==============================================================================

#ifndef ARTIFACTS_FILETIME_HPP
#define ARTIFACTS_FILETIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ratio>
#include <string>
#include <string_view>

namespace artifacts {

/// Тик FILETIME: 100 наносекунд
using FileTimeTicks = std::chrono::duration<std::int64_t, std::ratio<1, 10000000>>;

/// Момент времени UTC с точностью FILETIME
using Timestamp = std::chrono::time_point<std::chrono::system_clock, FileTimeTicks>;

/// Разница эпох 1601-01-01 и 1970-01-01 в тиках
constexpr std::uint64_t FILETIME_UNIX_EPOCH = 116444736000000000ULL;

/// FILETIME → Timestamp
Timestamp timestamp_from_filetime(std::uint64_t filetime);

/// Timestamp → FILETIME (до 1601 насыщается в 0)
std::uint64_t filetime_from_timestamp(Timestamp timestamp);

/// Форматировать как "YYYY-MM-DDTHH:MM:SS.ffffffZ"
std::string timestamp_to_iso8601(Timestamp timestamp);

/// FILETIME → ISO-8601
std::string filetime_to_iso8601(std::uint64_t filetime);

/// Разобрать ISO-8601 ("2024-01-15T10:30:00.1234567Z", суффикс Z и дробная
/// часть необязательны)
std::optional<Timestamp> parse_iso8601(std::string_view text);

}  // namespace artifacts

#endif  // ARTIFACTS_FILETIME_HPP
