// ==============================================================================
// event.cpp - Нормализованное событие
// ==============================================================================

#include <artifacts/event.hpp>

#include <charconv>
#include <utility>
#include <vector>

namespace artifacts {

namespace {

struct LevelName {
    EventLevel level;
    const char* name;
};

constexpr LevelName LEVEL_NAMES[] = {
    {EventLevel::Critical, "critical"},
    {EventLevel::Error, "error"},
    {EventLevel::Warning, "warning"},
    {EventLevel::Info, "info"},
};

// System/Level → уровень; индекс = числовое значение
constexpr EventLevel LEVEL_BY_NUMBER[] = {
    EventLevel::Info,      // 0 LogAlways
    EventLevel::Critical,  // 1
    EventLevel::Error,     // 2
    EventLevel::Warning,   // 3
    EventLevel::Info,      // 4
};

/// Целое из элемента: типизированное значение или текст
std::optional<std::int64_t> element_integer(const BinXmlNode& element) {
    if (const BinXmlValue* value = element.first_value()) {
        if (auto v = value->as_integer()) {
            return v;
        }
    }

    std::string text = element.text();
    std::size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::size_t end = text.find_last_not_of(" \t\r\n") + 1;

    std::int64_t result = 0;
    const char* first = text.data() + begin;
    const char* last = text.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return result;
}

/// Значение атрибута как текст
std::string attribute_text(const BinXmlNode* element, std::string_view name) {
    if (element == nullptr) {
        return "";
    }
    const BinXmlNode* attr = element->attribute(name);
    return attr ? attr->text() : "";
}

std::optional<Timestamp> time_created(const BinXmlNode* element) {
    if (element == nullptr) {
        return std::nullopt;
    }
    const BinXmlNode* attr = element->attribute("SystemTime");
    if (attr == nullptr) {
        return std::nullopt;
    }
    if (const BinXmlValue* value = attr->first_value()) {
        if (auto filetime = value->as_filetime()) {
            return timestamp_from_filetime(*filetime);
        }
    }
    return parse_iso8601(attr->text());
}

void collect_leaf_texts(const BinXmlNode& element, std::vector<std::string>& out) {
    bool has_child_elements = false;
    for (const auto& child : element.children) {
        if (child.is_element()) {
            has_child_elements = true;
            collect_leaf_texts(child, out);
        }
    }
    if (!has_child_elements) {
        std::string text = element.text();
        if (!text.empty()) {
            out.push_back(std::move(text));
        }
    }
}

}  // namespace

// ============================================================================
// Уровни
// ============================================================================

const char* level_to_string(EventLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

std::optional<EventLevel> level_from_string(std::string_view name) {
    for (const auto& entry : LEVEL_NAMES) {
        if (name == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

EventLevel level_from_number(std::int64_t value) {
    constexpr auto count = static_cast<std::int64_t>(sizeof(LEVEL_BY_NUMBER) / sizeof(LEVEL_BY_NUMBER[0]));
    if (value < 0 || value >= count) {
        return EventLevel::Info;
    }
    return LEVEL_BY_NUMBER[value];
}

std::string truncate_utf8(std::string_view text, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        // Начало code point: не continuation byte (10xxxxxx)
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return std::string(text.substr(0, i));
            }
            ++chars;
        }
    }
    return std::string(text);
}

// ============================================================================
// EventExtractor
// ============================================================================

EventExtractor::EventExtractor(ExtractorOptions options) : options_(std::move(options)) {}

std::optional<Event> EventExtractor::extract(const BinXmlNode& tree, std::uint64_t record_id,
                                             Timestamp fallback_time) const {
    const BinXmlNode* root = tree.root();
    if (root == nullptr || root->name != "Event") {
        return std::nullopt;
    }
    const BinXmlNode* system = root->child("System");
    if (system == nullptr) {
        return std::nullopt;
    }

    Event event;
    event.record_id = record_id;
    event.timestamp = fallback_time;

    if (const BinXmlNode* id = system->child("EventID")) {
        if (auto value = element_integer(*id)) {
            event.event_id = static_cast<std::uint32_t>(*value);
        }
    }

    event.level = EventLevel::Info;
    if (const BinXmlNode* level = system->child("Level")) {
        if (auto value = element_integer(*level)) {
            event.level = level_from_number(*value);
        }
    }

    if (auto created = time_created(system->child("TimeCreated"))) {
        event.timestamp = *created;
    }

    event.provider = attribute_text(system->child("Provider"), "Name");

    if (const BinXmlNode* channel = system->child("Channel")) {
        event.channel = channel->text();
    }
    if (const BinXmlNode* computer = system->child("Computer")) {
        event.computer = computer->text();
    }

    event.message = build_message(*root);
    return event;
}

std::string EventExtractor::build_message(const BinXmlNode& event) const {
    std::vector<std::string> parts;

    if (const BinXmlNode* data = event.child("EventData")) {
        auto items = data->children_named("Data");
        if (items.empty()) {
            std::string text = data->text();
            if (!text.empty()) {
                parts.push_back(std::move(text));
            }
        }
        for (const BinXmlNode* item : items) {
            parts.push_back(item->text());
        }
    } else if (const BinXmlNode* user = event.child("UserData")) {
        collect_leaf_texts(*user, parts);
    }

    std::string message;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            message += options_.separator;
        }
        message += parts[i];
    }
    return truncate_utf8(message, options_.message_limit);
}

}  // namespace artifacts
