// ==============================================================================
// binxml_decoder.cpp - Декодер Binary XML
// ==============================================================================
//
// Структуры (все целые little-endian):
//
// OpenStartElement (0x01 | 0x40 если есть атрибуты):
//   [dependency id u16]  отсутствует внутри вложенного BinXML значения
//   data size u32
//   name offset u32      chunk-relative; если равен позиции курсора, имя inline
//   [attribute list size u32]
//
// Имя: next offset u32, hash u16, char count u16, UTF-16LE, NUL u16
//
// TemplateInstance (0x0c):
//   unknown u8, template id u32, definition offset u32
//   [определение inline: next u32, GUID[16], data size u32, тело]
//   substitution count u32, descriptors (size u16, type u8, pad u8), values
//
// ==============================================================================

#include <artifacts/binxml_decoder.hpp>

#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace artifacts {

namespace {

/// Ошибка декодирования с chunk-relative смещением
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& message, std::size_t offset)
        : std::runtime_error(message), offset_(offset) {}

    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

constexpr std::size_t NAME_HEADER_SIZE = 8;

std::string hex_byte(std::uint8_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(value);
    return oss.str();
}

BinXmlToken token_kind(std::uint8_t byte) {
    return static_cast<BinXmlToken>(byte & TOKEN_KIND_MASK);
}

bool is_value_token(BinXmlToken kind) {
    switch (kind) {
    case BinXmlToken::Value:
    case BinXmlToken::CDataSection:
    case BinXmlToken::CharReference:
    case BinXmlToken::EntityReference:
    case BinXmlToken::NormalSubstitution:
    case BinXmlToken::OptionalSubstitution:
        return true;
    default:
        return false;
    }
}

Guid read_guid(ByteCursor& cur) {
    Guid guid;
    guid.data1 = cur.read_u32();
    guid.data2 = cur.read_u16();
    guid.data3 = cur.read_u16();
    for (auto& b : guid.data4) {
        b = cur.read_u8();
    }
    return guid;
}

/// Размер значения фиксированной длины (0 для переменных и неизвестных)
std::size_t fixed_value_size(std::uint8_t type) {
    switch (static_cast<BinXmlValueType>(type)) {
    case BinXmlValueType::Int8:
    case BinXmlValueType::UInt8:
        return 1;
    case BinXmlValueType::Int16:
    case BinXmlValueType::UInt16:
        return 2;
    case BinXmlValueType::Int32:
    case BinXmlValueType::UInt32:
    case BinXmlValueType::Float:
    case BinXmlValueType::Bool:
    case BinXmlValueType::Hex32:
        return 4;
    case BinXmlValueType::Int64:
    case BinXmlValueType::UInt64:
    case BinXmlValueType::Double:
    case BinXmlValueType::FileTime:
    case BinXmlValueType::Hex64:
        return 8;
    case BinXmlValueType::Guid:
    case BinXmlValueType::SystemTime:
        return 16;
    default:
        return 0;
    }
}

std::string ansi_until_nul(ByteView bytes) {
    std::string s;
    for (std::size_t i = 0; i < bytes.size() && bytes[i] != 0; ++i) {
        s.push_back(static_cast<char>(bytes[i]));
    }
    return s;
}

BinXmlValue decode_scalar(std::uint8_t type, ByteView bytes);

/// Массив значений (флаг 0x80): строки разделены NUL, остальное по размеру элемента
BinXmlValue decode_array(std::uint8_t type, ByteView bytes) {
    const std::uint8_t base = type & static_cast<std::uint8_t>(~VALUE_ARRAY_FLAG);
    BinXmlValue::StringArray items;

    if (base == static_cast<std::uint8_t>(BinXmlValueType::WString)) {
        std::size_t units = bytes.size() / 2;
        std::size_t start = 0;
        for (std::size_t i = 0; i < units; ++i) {
            if (bytes.u16_at(i * 2) == 0) {
                items.push_back(utf16le_to_utf8(bytes.sub(start * 2, (i - start) * 2)));
                start = i + 1;
            }
        }
        if (start < units) {
            items.push_back(utf16le_to_utf8(bytes.sub(start * 2, (units - start) * 2)));
        }
    } else if (base == static_cast<std::uint8_t>(BinXmlValueType::AnsiString)) {
        std::string current;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (bytes[i] == 0) {
                items.push_back(current);
                current.clear();
            } else {
                current.push_back(static_cast<char>(bytes[i]));
            }
        }
        if (!current.empty()) {
            items.push_back(current);
        }
    } else {
        std::size_t element = fixed_value_size(base);
        if (element == 0) {
            return BinXmlValue(BinXmlValueType::Binary,
                               BinXmlValue::Bytes(bytes.data(), bytes.data() + bytes.size()));
        }
        if (bytes.size() % element != 0) {
            throw DecodeError("array of " + value_type_name(base) + " has " +
                                  std::to_string(bytes.size()) + " bytes, not a multiple of " +
                                  std::to_string(element),
                              0);
        }
        for (std::size_t pos = 0; pos < bytes.size(); pos += element) {
            items.push_back(decode_scalar(base, bytes.sub(pos, element)).to_string());
        }
    }

    BinXmlValue value;
    value.type = type;
    value.data = std::move(items);
    return value;
}

/// Значение по типу; размер данных задан дескриптором подстановки
BinXmlValue decode_scalar(std::uint8_t type, ByteView bytes) {
    if (type & VALUE_ARRAY_FLAG) {
        return decode_array(type, bytes);
    }

    ByteCursor c(bytes);
    const auto t = static_cast<BinXmlValueType>(type);

    switch (t) {
    case BinXmlValueType::Null:
        return BinXmlValue();

    case BinXmlValueType::WString: {
        std::string s = utf16le_to_utf8(bytes, true);
        return BinXmlValue(t, std::move(s));
    }

    case BinXmlValueType::AnsiString:
        return BinXmlValue(t, ansi_until_nul(bytes));

    case BinXmlValueType::Int8:
        return BinXmlValue(t, static_cast<std::int64_t>(static_cast<std::int8_t>(c.read_u8())));
    case BinXmlValueType::UInt8:
        return BinXmlValue(t, static_cast<std::uint64_t>(c.read_u8()));
    case BinXmlValueType::Int16:
        return BinXmlValue(t, static_cast<std::int64_t>(static_cast<std::int16_t>(c.read_u16())));
    case BinXmlValueType::UInt16:
        return BinXmlValue(t, static_cast<std::uint64_t>(c.read_u16()));
    case BinXmlValueType::Int32:
        return BinXmlValue(t, static_cast<std::int64_t>(static_cast<std::int32_t>(c.read_u32())));
    case BinXmlValueType::UInt32:
        return BinXmlValue(t, static_cast<std::uint64_t>(c.read_u32()));
    case BinXmlValueType::Int64:
        return BinXmlValue(t, static_cast<std::int64_t>(c.read_u64()));
    case BinXmlValueType::UInt64:
        return BinXmlValue(t, static_cast<std::uint64_t>(c.read_u64()));

    case BinXmlValueType::Float: {
        std::uint32_t raw = c.read_u32();
        float f;
        std::memcpy(&f, &raw, sizeof(f));
        return BinXmlValue(t, static_cast<double>(f));
    }

    case BinXmlValueType::Double: {
        std::uint64_t raw = c.read_u64();
        double d;
        std::memcpy(&d, &raw, sizeof(d));
        return BinXmlValue(t, d);
    }

    case BinXmlValueType::Bool:
        return BinXmlValue(t, bytes.size() >= 4 ? c.read_u32() != 0 : c.read_u8() != 0);

    case BinXmlValueType::Binary:
    case BinXmlValueType::EvtXml:
        return BinXmlValue(t, BinXmlValue::Bytes(bytes.data(), bytes.data() + bytes.size()));

    case BinXmlValueType::Guid:
        return BinXmlValue(t, read_guid(c));

    case BinXmlValueType::SizeT:
    case BinXmlValueType::EvtHandle:
        return BinXmlValue(t, bytes.size() == 4 ? static_cast<std::uint64_t>(c.read_u32())
                                                : c.read_u64());

    case BinXmlValueType::FileTime:
        return BinXmlValue(t, c.read_u64());

    case BinXmlValueType::SystemTime: {
        SystemTime st;
        st.year = c.read_u16();
        st.month = c.read_u16();
        st.day_of_week = c.read_u16();
        st.day = c.read_u16();
        st.hour = c.read_u16();
        st.minute = c.read_u16();
        st.second = c.read_u16();
        st.milliseconds = c.read_u16();
        return BinXmlValue(t, st);
    }

    case BinXmlValueType::Sid: {
        // revision u8, count u8, authority (6 байт big-endian), sub-authorities u32
        Sid sid;
        sid.revision = c.read_u8();
        std::uint8_t count = c.read_u8();
        for (int i = 0; i < 6; ++i) {
            sid.authority = (sid.authority << 8) | c.read_u8();
        }
        for (std::uint8_t i = 0; i < count; ++i) {
            sid.sub_authorities.push_back(c.read_u32());
        }
        return BinXmlValue(t, std::move(sid));
    }

    case BinXmlValueType::Hex32:
        return BinXmlValue(t, static_cast<std::uint64_t>(c.read_u32()));
    case BinXmlValueType::Hex64:
        return BinXmlValue(t, c.read_u64());

    default: {
        // Неизвестный тип: размер известен из дескриптора, сохраняем байты
        BinXmlValue value;
        value.type = type;
        value.data = BinXmlValue::Bytes(bytes.data(), bytes.data() + bytes.size());
        return value;
    }
    }
}

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    Parser(ChunkContext& context, std::size_t max_depth) : ctx_(context), max_depth_(max_depth) {}

    /// Последовательность узлов до EndOfStream или конца курсора
    std::vector<BinXmlNode> parse_fragment(ByteCursor& cur, bool in_value) {
        std::vector<BinXmlNode> nodes;
        parse_content(cur, nodes, in_value, false);
        return nodes;
    }

    std::shared_ptr<const BinXmlTemplate> load_template(std::uint32_t offset);

private:
    /// Счётчик вложенности на время разбора узла
    class DepthGuard {
    public:
        DepthGuard(Parser& parser, std::size_t offset) : parser_(parser) {
            if (parser_.depth_ >= parser_.max_depth_) {
                throw DecodeError("nesting deeper than " + std::to_string(parser_.max_depth_) +
                                      " levels",
                                  offset);
            }
            ++parser_.depth_;
        }
        ~DepthGuard() { --parser_.depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser_;
    };

    void parse_content(ByteCursor& cur, std::vector<BinXmlNode>& out, bool in_value,
                       bool inside_element);
    BinXmlNode parse_element(ByteCursor& cur, std::uint8_t token, bool in_value);
    BinXmlNode parse_attribute(ByteCursor& cur);
    BinXmlNode parse_value_token(ByteCursor& cur, std::uint8_t token);
    BinXmlNode parse_processing_instruction(ByteCursor& cur);
    BinXmlValue parse_inline_value(ByteCursor& cur);
    std::vector<BinXmlNode> parse_template_instance(ByteCursor& cur);
    BinXmlValue parse_embedded(std::size_t offset, std::size_t size);
    std::string read_name(ByteCursor& cur, std::uint32_t offset);

    void instantiate(const std::vector<BinXmlNode>& nodes, const std::vector<BinXmlValue>& values,
                     std::size_t offset, std::vector<BinXmlNode>& out) const;

    ChunkContext& ctx_;
    std::size_t max_depth_;
    std::size_t depth_ = 0;
};

void Parser::parse_content(ByteCursor& cur, std::vector<BinXmlNode>& out, bool in_value,
                           bool inside_element) {
    while (true) {
        if (cur.eof()) {
            if (inside_element) {
                throw DecodeError("element not closed before end of data", cur.position());
            }
            return;
        }

        std::size_t token_offset = cur.position();
        std::uint8_t token = cur.read_u8();
        BinXmlToken kind = token_kind(token);

        switch (kind) {
        case BinXmlToken::EndOfStream:
            if (inside_element) {
                throw DecodeError("end of stream inside element", token_offset);
            }
            return;

        case BinXmlToken::FragmentHeader:
            // major version, minor version, flags
            cur.skip(3);
            break;

        case BinXmlToken::OpenStartElement:
            out.push_back(parse_element(cur, token, in_value));
            break;

        case BinXmlToken::CloseElement:
            if (!inside_element) {
                throw DecodeError("close element without open element", token_offset);
            }
            return;

        case BinXmlToken::Value:
        case BinXmlToken::CDataSection:
        case BinXmlToken::CharReference:
        case BinXmlToken::EntityReference:
        case BinXmlToken::NormalSubstitution:
        case BinXmlToken::OptionalSubstitution:
            out.push_back(parse_value_token(cur, token));
            break;

        case BinXmlToken::PITarget:
            out.push_back(parse_processing_instruction(cur));
            break;

        case BinXmlToken::TemplateInstance: {
            std::vector<BinXmlNode> nodes = parse_template_instance(cur);
            for (auto& node : nodes) {
                out.push_back(std::move(node));
            }
            break;
        }

        default:
            if ((token & TOKEN_KIND_MASK) > static_cast<std::uint8_t>(BinXmlToken::FragmentHeader)) {
                throw DecodeError("unknown token " + hex_byte(token), token_offset);
            }
            throw DecodeError("unexpected token " + hex_byte(token), token_offset);
        }
    }
}

BinXmlNode Parser::parse_element(ByteCursor& cur, std::uint8_t token, bool in_value) {
    std::size_t start = cur.position() - 1;
    DepthGuard guard(*this, start);

    BinXmlNode element;
    element.kind = BinXmlNodeKind::Element;

    if (!in_value) {
        cur.read_u16();  // dependency identifier
    }
    cur.read_u32();  // data size
    std::uint32_t name_offset = cur.read_u32();
    element.name = read_name(cur, name_offset);

    if (token & TOKEN_MORE_FLAG) {
        cur.read_u32();  // attribute list size
        while (!cur.eof() && token_kind(cur.peek_u8()) == BinXmlToken::Attribute) {
            cur.read_u8();
            element.attributes.push_back(parse_attribute(cur));
        }
    }

    std::size_t close_offset = cur.position();
    BinXmlToken close = token_kind(cur.read_u8());
    if (close == BinXmlToken::CloseStartElement) {
        parse_content(cur, element.children, in_value, true);
    } else if (close != BinXmlToken::CloseEmptyElement) {
        throw DecodeError("element <" + element.name + "> is not closed", close_offset);
    }

    return element;
}

BinXmlNode Parser::parse_attribute(ByteCursor& cur) {
    BinXmlNode attr;
    attr.kind = BinXmlNodeKind::Attribute;
    std::uint32_t name_offset = cur.read_u32();
    attr.name = read_name(cur, name_offset);

    while (!cur.eof()) {
        std::uint8_t token = cur.peek_u8();
        if (!is_value_token(token_kind(token))) {
            break;
        }
        cur.read_u8();
        attr.children.push_back(parse_value_token(cur, token));
    }
    return attr;
}

BinXmlNode Parser::parse_value_token(ByteCursor& cur, std::uint8_t token) {
    BinXmlNode node;

    switch (token_kind(token)) {
    case BinXmlToken::Value:
        node.kind = BinXmlNodeKind::Value;
        node.value = parse_inline_value(cur);
        break;

    case BinXmlToken::CDataSection: {
        node.kind = BinXmlNodeKind::CData;
        std::uint16_t count = cur.read_u16();
        node.value = BinXmlValue(BinXmlValueType::WString, cur.read_utf16(count));
        break;
    }

    case BinXmlToken::CharReference:
        node.kind = BinXmlNodeKind::CharRef;
        node.value = BinXmlValue(BinXmlValueType::UInt16, static_cast<std::uint64_t>(cur.read_u16()));
        break;

    case BinXmlToken::EntityReference:
        node.kind = BinXmlNodeKind::EntityRef;
        node.name = read_name(cur, cur.read_u32());
        break;

    case BinXmlToken::NormalSubstitution:
    case BinXmlToken::OptionalSubstitution:
        node.kind = BinXmlNodeKind::Substitution;
        node.optional = token_kind(token) == BinXmlToken::OptionalSubstitution;
        node.substitution_index = cur.read_u16();
        node.substitution_type = cur.read_u8();
        break;

    default:
        throw DecodeError("unexpected token " + hex_byte(token), cur.position() - 1);
    }

    return node;
}

BinXmlNode Parser::parse_processing_instruction(ByteCursor& cur) {
    BinXmlNode node;
    node.kind = BinXmlNodeKind::ProcessingInstruction;
    node.name = read_name(cur, cur.read_u32());

    if (!cur.eof() && token_kind(cur.peek_u8()) == BinXmlToken::PIData) {
        cur.read_u8();
        std::uint16_t count = cur.read_u16();
        node.value = BinXmlValue(BinXmlValueType::WString, cur.read_utf16(count));
    }
    return node;
}

BinXmlValue Parser::parse_inline_value(ByteCursor& cur) {
    std::size_t offset = cur.position();
    std::uint8_t type = cur.read_u8();

    if (type == static_cast<std::uint8_t>(BinXmlValueType::WString)) {
        std::uint16_t count = cur.read_u16();
        return decode_scalar(type, cur.read_bytes(static_cast<std::size_t>(count) * 2));
    }
    if (type == static_cast<std::uint8_t>(BinXmlValueType::AnsiString)) {
        std::uint16_t count = cur.read_u16();
        return decode_scalar(type, cur.read_bytes(count));
    }

    std::size_t size = fixed_value_size(type);
    if (size == 0) {
        throw DecodeError("unsupported inline value type " + value_type_name(type), offset);
    }
    return decode_scalar(type, cur.read_bytes(size));
}

std::string Parser::read_name(ByteCursor& cur, std::uint32_t offset) {
    const std::string* cached = ctx_.names.find(offset);

    if (offset == cur.position()) {
        // Имя определено inline: пропустить определение
        cur.skip(6);
        std::uint16_t count = cur.read_u16();
        std::string name = cur.read_utf16(count);
        cur.skip(2);
        if (cached) {
            return *cached;
        }
        ctx_.names.insert(offset, name);
        return name;
    }

    if (cached) {
        return *cached;
    }

    ByteCursor at(ctx_.chunk, offset);
    at.skip(6);
    std::uint16_t count = at.read_u16();
    if (static_cast<std::size_t>(count) * 2 + 2 > at.remaining()) {
        throw DecodeError("name at offset " + std::to_string(offset) + " exceeds chunk", offset);
    }
    std::string name = at.read_utf16(count);
    ctx_.names.insert(offset, name);
    return name;
}

std::shared_ptr<const BinXmlTemplate> Parser::load_template(std::uint32_t offset) {
    if (auto cached = ctx_.templates.find(offset)) {
        return cached;
    }

    DepthGuard guard(*this, offset);

    auto tmpl = std::make_shared<BinXmlTemplate>();
    ByteCursor header(ctx_.chunk, offset);
    tmpl->offset = offset;
    tmpl->next_offset = header.read_u32();
    tmpl->guid = read_guid(header);
    tmpl->data_size = header.read_u32();

    std::size_t body = header.position();
    if (tmpl->data_size > ctx_.chunk.size() - body) {
        throw DecodeError("template data size " + std::to_string(tmpl->data_size) +
                              " exceeds chunk",
                          offset);
    }

    ByteCursor cur(ctx_.chunk, body, body + tmpl->data_size);
    parse_content(cur, tmpl->nodes, false, false);

    ctx_.templates.insert(tmpl);
    return tmpl;
}

std::vector<BinXmlNode> Parser::parse_template_instance(ByteCursor& cur) {
    std::size_t start = cur.position() - 1;
    DepthGuard guard(*this, start);

    cur.read_u8();   // unknown (0x01)
    cur.read_u32();  // short template id
    std::uint32_t definition = cur.read_u32();

    std::shared_ptr<const BinXmlTemplate> tmpl = load_template(definition);
    if (definition == cur.position()) {
        cur.seek(definition + TEMPLATE_HEADER_SIZE + tmpl->data_size);
    }

    std::size_t array_offset = cur.position();
    std::uint32_t count = cur.read_u32();
    if (count > cur.remaining() / 4) {
        throw DecodeError("substitution count " + std::to_string(count) + " exceeds record data",
                          array_offset);
    }

    struct Descriptor {
        std::uint16_t size;
        std::uint8_t type;
    };
    std::vector<Descriptor> descriptors;
    descriptors.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        Descriptor d;
        d.size = cur.read_u16();
        d.type = cur.read_u8();
        cur.skip(1);
        descriptors.push_back(d);
    }

    std::vector<BinXmlValue> values;
    values.reserve(count);
    for (const auto& d : descriptors) {
        std::size_t value_offset = cur.position();
        ByteView bytes = cur.read_bytes(d.size);
        if (d.type == static_cast<std::uint8_t>(BinXmlValueType::BinXml)) {
            values.push_back(parse_embedded(value_offset, d.size));
            continue;
        }
        try {
            values.push_back(decode_scalar(d.type, bytes));
        } catch (const std::out_of_range&) {
            throw DecodeError(value_type_name(d.type) + " value truncated to " +
                                  std::to_string(d.size) + " bytes",
                              value_offset);
        } catch (const DecodeError& e) {
            throw DecodeError(e.what(), value_offset);
        }
    }

    std::vector<BinXmlNode> result;
    instantiate(tmpl->nodes, values, start, result);
    return result;
}

BinXmlValue Parser::parse_embedded(std::size_t offset, std::size_t size) {
    DepthGuard guard(*this, offset);

    auto fragment = std::make_shared<BinXmlNode>();
    fragment->kind = BinXmlNodeKind::Fragment;
    ByteCursor inner(ctx_.chunk, offset, offset + size);
    fragment->children = parse_fragment(inner, true);

    return BinXmlValue(BinXmlValueType::BinXml,
                       BinXmlValue::Fragment(std::move(fragment)));
}

void Parser::instantiate(const std::vector<BinXmlNode>& nodes,
                         const std::vector<BinXmlValue>& values, std::size_t offset,
                         std::vector<BinXmlNode>& out) const {
    for (const auto& node : nodes) {
        switch (node.kind) {
        case BinXmlNodeKind::Substitution: {
            if (node.substitution_index >= values.size()) {
                throw DecodeError("substitution index " + std::to_string(node.substitution_index) +
                                      " out of range (" + std::to_string(values.size()) +
                                      " values)",
                                  offset);
            }
            const BinXmlValue& value = values[node.substitution_index];
            if (value.is_null()) {
                break;
            }
            if (const BinXmlNode* fragment = value.get_fragment()) {
                for (const auto& child : fragment->children) {
                    out.push_back(child);
                }
                break;
            }
            BinXmlNode filled;
            filled.kind = BinXmlNodeKind::Value;
            filled.value = value;
            out.push_back(std::move(filled));
            break;
        }

        case BinXmlNodeKind::Element: {
            BinXmlNode element;
            element.kind = BinXmlNodeKind::Element;
            element.name = node.name;

            for (const auto& attr : node.attributes) {
                BinXmlNode filled;
                filled.kind = BinXmlNodeKind::Attribute;
                filled.name = attr.name;
                instantiate(attr.children, values, offset, filled.children);

                // Атрибут, все части которого были опущенными optional-подстановками
                bool omitted = filled.children.empty() && !attr.children.empty();
                for (const auto& part : attr.children) {
                    if (part.kind != BinXmlNodeKind::Substitution || !part.optional) {
                        omitted = false;
                    }
                }
                if (!omitted) {
                    element.attributes.push_back(std::move(filled));
                }
            }

            instantiate(node.children, values, offset, element.children);
            out.push_back(std::move(element));
            break;
        }

        default:
            out.push_back(node);
            break;
        }
    }
}

}  // namespace

// ============================================================================
// BinXmlDecoder
// ============================================================================

BinXmlDecoder::BinXmlDecoder(ChunkContext& context, std::size_t max_depth)
    : context_(context), max_depth_(max_depth) {}

Result<BinXmlNode> BinXmlDecoder::decode(std::size_t offset, std::size_t size) {
    try {
        Parser parser(context_, max_depth_);
        ByteCursor cur(context_.chunk, offset, offset + size);

        BinXmlNode fragment;
        fragment.kind = BinXmlNodeKind::Fragment;
        fragment.children = parser.parse_fragment(cur, false);
        return Result<BinXmlNode>::success(std::move(fragment));
    } catch (const DecodeError& e) {
        return Result<BinXmlNode>::failure(ErrorKind::BinXml, e.what(), e.offset());
    } catch (const std::out_of_range& e) {
        return Result<BinXmlNode>::failure(ErrorKind::BinXml,
                                           std::string("truncated binxml data: ") + e.what(),
                                           offset);
    }
}

Result<std::shared_ptr<const BinXmlTemplate>> BinXmlDecoder::load_template(std::uint32_t offset) {
    using R = Result<std::shared_ptr<const BinXmlTemplate>>;
    try {
        Parser parser(context_, max_depth_);
        return R::success(parser.load_template(offset));
    } catch (const DecodeError& e) {
        return R::failure(ErrorKind::BinXml, e.what(), e.offset());
    } catch (const std::out_of_range& e) {
        return R::failure(ErrorKind::BinXml, std::string("truncated template: ") + e.what(),
                          offset);
    }
}

Result<BinXmlValue> BinXmlDecoder::decode_value(std::uint8_t type, ByteView bytes) {
    if (type == static_cast<std::uint8_t>(BinXmlValueType::BinXml)) {
        return Result<BinXmlValue>::failure(ErrorKind::BinXml,
                                            "embedded binxml needs a chunk context");
    }
    try {
        return Result<BinXmlValue>::success(decode_scalar(type, bytes));
    } catch (const DecodeError& e) {
        return Result<BinXmlValue>::failure(ErrorKind::BinXml, e.what());
    } catch (const std::out_of_range& e) {
        return Result<BinXmlValue>::failure(
            ErrorKind::BinXml, value_type_name(type) + " value truncated: " + e.what());
    }
}

}  // namespace artifacts
