// ==============================================================================
// artifacts/event.hpp - Нормализованное событие
// ==============================================================================
//
// Назначение:
// - EventLevel и отображение числового Level на уровень
// - Event: event_id, level, timestamp, provider, message (+ record_id,
//   channel, computer)
// - EventExtractor: декодированное дерево → Event
//
// Поля берутся из Event/System:
//   EventID                 → event_id
//   Level                   → level (0:info 1:critical 2:error 3:warning 4:info)
//   TimeCreated@SystemTime  → timestamp (иначе время из заголовка записи)
//   Provider@Name           → provider
// message: тексты EventData/Data через " | " (или листья UserData),
// не длиннее 200 символов.
//
// ==============================================================================

#ifndef ARTIFACTS_EVENT_HPP
#define ARTIFACTS_EVENT_HPP

#include <artifacts/binxml.hpp>
#include <artifacts/filetime.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace artifacts {

enum class EventLevel { Critical, Error, Warning, Info };

/// "critical" / "error" / "warning" / "info"
const char* level_to_string(EventLevel level);

std::optional<EventLevel> level_from_string(std::string_view name);

/// Числовой Level из System/Level (неизвестные значения → Info)
EventLevel level_from_number(std::int64_t value);

constexpr std::size_t DEFAULT_MESSAGE_LIMIT = 200;
constexpr const char* DEFAULT_MESSAGE_SEPARATOR = " | ";

struct Event {
    std::uint32_t event_id = 0;
    EventLevel level = EventLevel::Info;
    Timestamp timestamp{};
    std::string provider;
    std::string message;

    std::uint64_t record_id = 0;
    std::string channel;
    std::string computer;

    bool operator==(const Event& other) const {
        return event_id == other.event_id && level == other.level &&
               timestamp == other.timestamp && provider == other.provider &&
               message == other.message && record_id == other.record_id &&
               channel == other.channel && computer == other.computer;
    }
    bool operator!=(const Event& other) const { return !(*this == other); }
};

struct ExtractorOptions {
    std::string separator = DEFAULT_MESSAGE_SEPARATOR;
    std::size_t message_limit = DEFAULT_MESSAGE_LIMIT;
};

class EventExtractor {
public:
    explicit EventExtractor(ExtractorOptions options = {});

    /// Извлечь событие из дерева записи
    /// @param fallback_time время из заголовка записи
    /// @return std::nullopt если нет Event/System
    std::optional<Event> extract(const BinXmlNode& tree, std::uint64_t record_id = 0,
                                 Timestamp fallback_time = Timestamp{}) const;

    const ExtractorOptions& options() const { return options_; }

private:
    std::string build_message(const BinXmlNode& event) const;

    ExtractorOptions options_;
};

/// Обрезать UTF-8 строку до max_chars code points
std::string truncate_utf8(std::string_view text, std::size_t max_chars);

}  // namespace artifacts

#endif  // ARTIFACTS_EVENT_HPP
