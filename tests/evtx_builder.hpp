// ==============================================================================
// evtx_builder.hpp - Построитель синтетических EVTX файлов для тестов
// ==============================================================================
//
// Назначение:
// - ChunkBuilder: запись Binary XML прямо в буфер чанка (смещения абсолютные)
// - Шаблоны определяются inline при первом использовании, далее по смещению
// - finish(): заголовок чанка с CRC32
// - build_file(): заголовок файла + чанки
//
// ==============================================================================

#ifndef ARTIFACTS_TESTS_EVTX_BUILDER_HPP
#define ARTIFACTS_TESTS_EVTX_BUILDER_HPP

#include <artifacts/binxml.hpp>
#include <artifacts/bytes.hpp>
#include <artifacts/chunk.hpp>
#include <artifacts/record.hpp>

#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace artifacts::test {

using Bytes = std::vector<std::uint8_t>;

/// 2020-01-01T00:00:00Z
constexpr std::uint64_t FILETIME_2020 = 132223104000000000ULL;

/// Одна секунда в тиках FILETIME
constexpr std::uint64_t FILETIME_SECOND = 10000000ULL;

constexpr const char* EVENT_XMLNS = "http://schemas.microsoft.com/win/2004/08/events/event";

// ----------------------------------------------------------------------------
// Примитивы записи
// ----------------------------------------------------------------------------

inline void put_u8(Bytes& out, std::uint8_t v) {
    out.push_back(v);
}

inline void put_u16(Bytes& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xff));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

inline void put_u32(Bytes& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xff));
    }
}

inline void put_u64(Bytes& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xff));
    }
}

inline void patch_u32(Bytes& out, std::size_t pos, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out[pos + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xff);
    }
}

inline void patch_u16(Bytes& out, std::size_t pos, std::uint16_t v) {
    out[pos] = static_cast<std::uint8_t>(v & 0xff);
    out[pos + 1] = static_cast<std::uint8_t>(v >> 8);
}

/// UTF-8 → code units UTF-16 (без NUL)
inline std::vector<std::uint16_t> utf16_units(const std::string& text) {
    std::vector<std::uint16_t> units;
    std::size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        std::uint32_t cp = 0;
        std::size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else {
            cp = c & 0x07;
            extra = 3;
        }
        for (std::size_t k = 1; k <= extra && i + k < text.size(); ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        i += extra + 1;

        if (cp >= 0x10000) {
            cp -= 0x10000;
            units.push_back(static_cast<std::uint16_t>(0xD800 | (cp >> 10)));
            units.push_back(static_cast<std::uint16_t>(0xDC00 | (cp & 0x3FF)));
        } else {
            units.push_back(static_cast<std::uint16_t>(cp));
        }
    }
    return units;
}

inline Bytes utf16le(const std::string& text) {
    Bytes out;
    for (std::uint16_t unit : utf16_units(text)) {
        put_u16(out, unit);
    }
    return out;
}

// ----------------------------------------------------------------------------
// Значения подстановок
// ----------------------------------------------------------------------------

class ChunkBuilder;

/// Значение подстановки: готовые байты или BinXML, записываемый на месте
struct Sub {
    std::uint8_t type = 0;
    Bytes data;
    std::function<void(ChunkBuilder&)> writer;
};

inline Sub typed(BinXmlValueType type, Bytes data) {
    Sub s;
    s.type = static_cast<std::uint8_t>(type);
    s.data = std::move(data);
    return s;
}

inline Sub null_value() {
    return typed(BinXmlValueType::Null, {});
}

inline Sub wstring(const std::string& text) {
    return typed(BinXmlValueType::WString, utf16le(text));
}

inline Sub ansi(const std::string& text) {
    return typed(BinXmlValueType::AnsiString, Bytes(text.begin(), text.end()));
}

inline Sub u8_value(std::uint8_t v) {
    return typed(BinXmlValueType::UInt8, {v});
}

inline Sub u16_value(std::uint16_t v) {
    Bytes b;
    put_u16(b, v);
    return typed(BinXmlValueType::UInt16, b);
}

inline Sub u32_value(std::uint32_t v) {
    Bytes b;
    put_u32(b, v);
    return typed(BinXmlValueType::UInt32, b);
}

inline Sub i32_value(std::int32_t v) {
    Bytes b;
    put_u32(b, static_cast<std::uint32_t>(v));
    return typed(BinXmlValueType::Int32, b);
}

inline Sub u64_value(std::uint64_t v) {
    Bytes b;
    put_u64(b, v);
    return typed(BinXmlValueType::UInt64, b);
}

inline Sub hex64_value(std::uint64_t v) {
    Bytes b;
    put_u64(b, v);
    return typed(BinXmlValueType::Hex64, b);
}

inline Sub filetime_value(std::uint64_t v) {
    Bytes b;
    put_u64(b, v);
    return typed(BinXmlValueType::FileTime, b);
}

inline Sub guid_value(const Guid& guid) {
    Bytes b;
    put_u32(b, guid.data1);
    put_u16(b, guid.data2);
    put_u16(b, guid.data3);
    b.insert(b.end(), guid.data4.begin(), guid.data4.end());
    return typed(BinXmlValueType::Guid, b);
}

inline Sub sid_value(std::uint8_t revision, std::uint64_t authority,
                     const std::vector<std::uint32_t>& subs) {
    Bytes b;
    put_u8(b, revision);
    put_u8(b, static_cast<std::uint8_t>(subs.size()));
    for (int i = 5; i >= 0; --i) {
        put_u8(b, static_cast<std::uint8_t>((authority >> (8 * i)) & 0xff));
    }
    for (std::uint32_t s : subs) {
        put_u32(b, s);
    }
    return typed(BinXmlValueType::Sid, b);
}

inline Sub binary_value(Bytes data) {
    return typed(BinXmlValueType::Binary, std::move(data));
}

/// Вложенный BinXML; элементы пишутся без dependency id
inline Sub binxml_value(std::function<void(ChunkBuilder&)> writer) {
    Sub s;
    s.type = static_cast<std::uint8_t>(BinXmlValueType::BinXml);
    s.writer = std::move(writer);
    return s;
}

// ----------------------------------------------------------------------------
// ChunkBuilder
// ----------------------------------------------------------------------------

/// Стандартное событие: Event/System + EventData/Data[@Name]
struct EventFields {
    std::string provider = "Microsoft-Windows-Security-Auditing";
    std::uint16_t event_id = 4624;
    std::optional<std::uint8_t> level = std::uint8_t{4};
    std::uint64_t filetime = FILETIME_2020;
    std::string channel = "Security";
    std::string computer = "WKS-01";
    std::vector<std::pair<std::string, std::string>> data;
};

class ChunkBuilder {
public:
    using BodyWriter = std::function<void(ChunkBuilder&)>;

    ChunkBuilder() : buf_(CHUNK_HEADER_SIZE, 0) {}

    std::size_t pos() const { return buf_.size(); }
    Bytes& buffer() { return buf_; }

    // -------------------------------------------------------------------------
    // Токены Binary XML
    // -------------------------------------------------------------------------

    void fragment_header() {
        put_u8(buf_, 0x0f);
        put_u8(buf_, 1);
        put_u8(buf_, 1);
        put_u8(buf_, 0);
    }

    /// Смещение имени: inline при первом использовании
    void name(const std::string& n) {
        auto it = names_.find(n);
        if (it != names_.end()) {
            put_u32(buf_, it->second);
            return;
        }
        auto offset = static_cast<std::uint32_t>(pos() + 4);
        put_u32(buf_, offset);
        put_u32(buf_, 0);  // next
        put_u16(buf_, 0);  // hash
        auto units = utf16_units(n);
        put_u16(buf_, static_cast<std::uint16_t>(units.size()));
        for (std::uint16_t u : units) {
            put_u16(buf_, u);
        }
        put_u16(buf_, 0);
        names_[n] = offset;
    }

    void open_element(const std::string& n, bool has_attributes = false, bool dependency = true) {
        put_u8(buf_, has_attributes ? 0x41 : 0x01);
        if (dependency) {
            put_u16(buf_, 0xffff);
        }
        Open open;
        open.data_size_at = pos();
        put_u32(buf_, 0);
        name(n);
        if (has_attributes) {
            open.attr_size_at = pos();
            put_u32(buf_, 0);
        }
        open_.push_back(open);
    }

    void attribute(const std::string& n) {
        put_u8(buf_, 0x06);
        name(n);
    }

    void close_start() {
        patch_attributes();
        put_u8(buf_, 0x02);
    }

    void close_empty() {
        patch_attributes();
        put_u8(buf_, 0x03);
        pop_element();
    }

    void close_element() {
        put_u8(buf_, 0x04);
        pop_element();
    }

    void end_of_stream() { put_u8(buf_, 0x00); }

    void text(const std::string& s) {
        auto units = utf16_units(s);
        put_u8(buf_, 0x05);
        put_u8(buf_, static_cast<std::uint8_t>(BinXmlValueType::WString));
        put_u16(buf_, static_cast<std::uint16_t>(units.size()));
        for (std::uint16_t u : units) {
            put_u16(buf_, u);
        }
    }

    void substitution(std::uint16_t index, BinXmlValueType type, bool optional = false) {
        put_u8(buf_, optional ? 0x0e : 0x0d);
        put_u16(buf_, index);
        put_u8(buf_, static_cast<std::uint8_t>(type));
    }

    void raw(const Bytes& bytes) { buf_.insert(buf_.end(), bytes.begin(), bytes.end()); }

    /// <name>{sub}</name>
    void element_with_sub(const std::string& n, std::uint16_t index, BinXmlValueType type,
                          bool optional = false) {
        open_element(n);
        close_start();
        substitution(index, type, optional);
        close_element();
    }

    // -------------------------------------------------------------------------
    // Шаблоны и записи
    // -------------------------------------------------------------------------

    /// TemplateInstance: определение inline при первом использовании ключа
    void template_instance(const std::string& key, const BodyWriter& body,
                           const std::vector<Sub>& subs) {
        put_u8(buf_, 0x0c);
        put_u8(buf_, 0x01);
        auto it = templates_.find(key);
        put_u32(buf_, static_cast<std::uint32_t>(templates_.size() + 1));

        if (it == templates_.end()) {
            auto definition = static_cast<std::uint32_t>(pos() + 4);
            put_u32(buf_, definition);
            put_u32(buf_, 0);  // next template
            for (int i = 0; i < 16; ++i) {
                put_u8(buf_, static_cast<std::uint8_t>(0xA0 + i));
            }
            std::size_t size_at = pos();
            put_u32(buf_, 0);
            std::size_t body_start = pos();
            body(*this);
            patch_u32(buf_, size_at, static_cast<std::uint32_t>(pos() - body_start));
            templates_[key] = definition;
        } else {
            put_u32(buf_, it->second);
        }

        put_u32(buf_, static_cast<std::uint32_t>(subs.size()));
        std::vector<std::size_t> size_at;
        for (const auto& s : subs) {
            size_at.push_back(pos());
            put_u16(buf_, static_cast<std::uint16_t>(s.data.size()));
            put_u8(buf_, s.type);
            put_u8(buf_, 0);
        }
        for (std::size_t i = 0; i < subs.size(); ++i) {
            std::size_t start = pos();
            if (subs[i].writer) {
                subs[i].writer(*this);
            } else {
                raw(subs[i].data);
            }
            patch_u16(buf_, size_at[i], static_cast<std::uint16_t>(pos() - start));
        }
    }

    /// Запись с произвольным содержимым BinXML
    void add_raw_record(std::uint64_t record_id, std::uint64_t filetime, const BodyWriter& payload) {
        std::size_t start = pos();
        put_u32(buf_, RECORD_MAGIC);
        put_u32(buf_, 0);
        put_u64(buf_, record_id);
        put_u64(buf_, filetime);
        payload(*this);
        auto size = static_cast<std::uint32_t>(pos() - start + 4);
        put_u32(buf_, size);
        patch_u32(buf_, start + 4, size);

        records_.push_back({start, size});
        if (!first_id_) {
            first_id_ = record_id;
        }
        last_id_ = record_id;
        last_offset_ = start;
    }

    /// Запись: фрагмент с одним TemplateInstance
    void add_record(std::uint64_t record_id, std::uint64_t filetime, const std::string& key,
                    const BodyWriter& body, const std::vector<Sub>& subs) {
        add_raw_record(record_id, filetime, [&](ChunkBuilder& b) {
            b.fragment_header();
            b.template_instance(key, body, subs);
            b.end_of_stream();
        });
    }

    /// Стандартное событие
    void add_event(std::uint64_t record_id, const EventFields& fields) {
        std::vector<std::string> names;
        std::string key = "event";
        for (const auto& item : fields.data) {
            names.push_back(item.first);
            key += ":" + item.first;
        }

        std::vector<Sub> subs;
        subs.push_back(wstring(fields.provider));
        subs.push_back(u16_value(fields.event_id));
        subs.push_back(fields.level ? u8_value(*fields.level) : null_value());
        subs.push_back(filetime_value(fields.filetime));
        subs.push_back(u64_value(record_id));
        subs.push_back(wstring(fields.channel));
        subs.push_back(wstring(fields.computer));
        for (const auto& item : fields.data) {
            subs.push_back(wstring(item.second));
        }

        add_record(record_id, fields.filetime, key,
                   [names](ChunkBuilder& b) { b.write_event_template(names, true); }, subs);
    }

    /// Событие без System (извлекать нечего)
    void add_event_without_system(std::uint64_t record_id) {
        add_record(record_id, FILETIME_2020, "no-system",
                   [](ChunkBuilder& b) {
                       b.fragment_header();
                       b.open_element("Event");
                       b.close_start();
                       b.element_with_sub("Note", 0, BinXmlValueType::WString);
                       b.close_element();
                       b.end_of_stream();
                   },
                   {wstring("orphan")});
    }

    /// Тело шаблона стандартного события; подстановки 0..6 в System, 7.. в Data
    void write_event_template(const std::vector<std::string>& data_names, bool with_system) {
        fragment_header();
        open_element("Event", true);
        attribute("xmlns");
        text(EVENT_XMLNS);
        close_start();

        if (with_system) {
            open_element("System");
            close_start();

            open_element("Provider", true);
            attribute("Name");
            substitution(0, BinXmlValueType::WString);
            close_empty();

            element_with_sub("EventID", 1, BinXmlValueType::UInt16);
            element_with_sub("Level", 2, BinXmlValueType::UInt8, true);

            open_element("TimeCreated", true);
            attribute("SystemTime");
            substitution(3, BinXmlValueType::FileTime);
            close_empty();

            element_with_sub("EventRecordID", 4, BinXmlValueType::UInt64);
            element_with_sub("Channel", 5, BinXmlValueType::WString);
            element_with_sub("Computer", 6, BinXmlValueType::WString);
            close_element();
        }

        open_element("EventData");
        close_start();
        for (std::size_t i = 0; i < data_names.size(); ++i) {
            open_element("Data", true);
            attribute("Name");
            text(data_names[i]);
            close_start();
            substitution(static_cast<std::uint16_t>(7 + i), BinXmlValueType::WString, true);
            close_element();
        }
        close_element();

        close_element();
        end_of_stream();
    }

    // -------------------------------------------------------------------------
    // Порча и сборка
    // -------------------------------------------------------------------------

    std::size_t record_count() const { return records_.size(); }

    /// Смещение записи в чанке
    std::size_t record_offset(std::size_t index) const { return records_.at(index).first; }

    /// Испортить trailing size записи (CRC чанка останется верным)
    void corrupt_trailer(std::size_t index) {
        const auto& [offset, size] = records_.at(index);
        patch_u32(buf_, offset + size - 4, size + 8);
    }

    /// Заполнить заголовок и CRC, дополнить до 64 КБ
    Bytes finish() {
        if (pos() > CHUNK_SIZE) {
            throw std::length_error("chunk data exceeds 65536 bytes");
        }
        Bytes chunk = buf_;
        auto free_space = static_cast<std::uint32_t>(chunk.size());
        chunk.resize(CHUNK_SIZE, 0);

        std::memcpy(chunk.data(), CHUNK_MAGIC, sizeof(CHUNK_MAGIC));
        patch_u64(chunk, 8, records_.empty() ? 0 : 1);
        patch_u64(chunk, 16, records_.size());
        patch_u64(chunk, 24, first_id_.value_or(0));
        patch_u64(chunk, 32, last_id_);
        patch_u32(chunk, 40, 128);
        patch_u32(chunk, 44, static_cast<std::uint32_t>(last_offset_));
        patch_u32(chunk, 48, free_space);
        patch_u32(chunk, 52, crc32(ByteView(chunk).sub(CHUNK_HEADER_SIZE,
                                                      free_space - CHUNK_HEADER_SIZE)));
        patch_u32(chunk, 124, chunk_header_checksum(ByteView(chunk)));
        return chunk;
    }

private:
    struct Open {
        std::size_t data_size_at = 0;
        std::optional<std::size_t> attr_size_at;
    };

    static void patch_u64(Bytes& out, std::size_t pos, std::uint64_t v) {
        patch_u32(out, pos, static_cast<std::uint32_t>(v & 0xffffffffULL));
        patch_u32(out, pos + 4, static_cast<std::uint32_t>(v >> 32));
    }

    void patch_attributes() {
        if (open_.empty() || !open_.back().attr_size_at) {
            return;
        }
        std::size_t at = *open_.back().attr_size_at;
        patch_u32(buf_, at, static_cast<std::uint32_t>(pos() - at - 4));
        open_.back().attr_size_at.reset();
    }

    void pop_element() {
        if (open_.empty()) {
            return;
        }
        std::size_t at = open_.back().data_size_at;
        patch_u32(buf_, at, static_cast<std::uint32_t>(pos() - at - 4));
        open_.pop_back();
    }

    Bytes buf_;
    std::map<std::string, std::uint32_t> names_;
    std::map<std::string, std::uint32_t> templates_;
    std::vector<Open> open_;
    std::vector<std::pair<std::size_t, std::uint32_t>> records_;
    std::optional<std::uint64_t> first_id_;
    std::uint64_t last_id_ = 0;
    std::size_t last_offset_ = CHUNK_HEADER_SIZE;
};

// ----------------------------------------------------------------------------
// Файл
// ----------------------------------------------------------------------------

/// Заголовок файла (chunk_count по умолчанию = числу чанков) + чанки
inline Bytes build_file(const std::vector<Bytes>& chunks,
                        std::optional<std::uint16_t> declared_chunks = std::nullopt,
                        std::uint32_t flags = 0) {
    Bytes file(FILE_HEADER_SIZE, 0);
    std::memcpy(file.data(), FILE_MAGIC, sizeof(FILE_MAGIC));

    std::uint16_t count = declared_chunks.value_or(static_cast<std::uint16_t>(chunks.size()));
    patch_u32(file, 8, 0);
    patch_u32(file, 16, chunks.empty() ? 0 : static_cast<std::uint32_t>(chunks.size() - 1));
    patch_u32(file, 24, 1);
    patch_u32(file, 32, 128);
    patch_u16(file, 36, 1);
    patch_u16(file, 38, 3);
    patch_u16(file, 40, static_cast<std::uint16_t>(FILE_HEADER_SIZE));
    patch_u16(file, 42, count);
    patch_u32(file, 120, flags);
    patch_u32(file, 124, crc32(ByteView(file).sub(0, FILE_HEADER_CHECKSUM_SPAN)));

    for (const auto& chunk : chunks) {
        file.insert(file.end(), chunk.begin(), chunk.end());
    }
    return file;
}

/// Чанк из n стандартных событий с id first_id, first_id + 1, ...
inline Bytes chunk_of_events(std::uint64_t first_id, std::size_t n) {
    ChunkBuilder builder;
    for (std::size_t i = 0; i < n; ++i) {
        EventFields fields;
        fields.event_id = static_cast<std::uint16_t>(4624 + (i % 3));
        fields.filetime = FILETIME_2020 + i * FILETIME_SECOND;
        fields.data = {{"TargetUserName", "user" + std::to_string(first_id + i)},
                     {"LogonType", "3"}};
        builder.add_event(first_id + i, fields);
    }
    return builder.finish();
}

}  // namespace artifacts::test

#endif  // ARTIFACTS_TESTS_EVTX_BUILDER_HPP
