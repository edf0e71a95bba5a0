// ==============================================================================
// binxml.cpp - Модель Binary XML
// ==============================================================================

#include <artifacts/binxml.hpp>
#include <artifacts/bytes.hpp>
#include <artifacts/filetime.hpp>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace artifacts {

// ============================================================================
// Имена типов
// ============================================================================

std::string value_type_name(std::uint8_t type) {
    std::string name;
    switch (static_cast<BinXmlValueType>(type & static_cast<std::uint8_t>(~VALUE_ARRAY_FLAG))) {
    case BinXmlValueType::Null: name = "Null"; break;
    case BinXmlValueType::WString: name = "WString"; break;
    case BinXmlValueType::AnsiString: name = "AnsiString"; break;
    case BinXmlValueType::Int8: name = "Int8"; break;
    case BinXmlValueType::UInt8: name = "UInt8"; break;
    case BinXmlValueType::Int16: name = "Int16"; break;
    case BinXmlValueType::UInt16: name = "UInt16"; break;
    case BinXmlValueType::Int32: name = "Int32"; break;
    case BinXmlValueType::UInt32: name = "UInt32"; break;
    case BinXmlValueType::Int64: name = "Int64"; break;
    case BinXmlValueType::UInt64: name = "UInt64"; break;
    case BinXmlValueType::Float: name = "Float"; break;
    case BinXmlValueType::Double: name = "Double"; break;
    case BinXmlValueType::Bool: name = "Bool"; break;
    case BinXmlValueType::Binary: name = "Binary"; break;
    case BinXmlValueType::Guid: name = "Guid"; break;
    case BinXmlValueType::SizeT: name = "SizeT"; break;
    case BinXmlValueType::FileTime: name = "FileTime"; break;
    case BinXmlValueType::SystemTime: name = "SystemTime"; break;
    case BinXmlValueType::Sid: name = "Sid"; break;
    case BinXmlValueType::Hex32: name = "Hex32"; break;
    case BinXmlValueType::Hex64: name = "Hex64"; break;
    case BinXmlValueType::EvtHandle: name = "EvtHandle"; break;
    case BinXmlValueType::BinXml: name = "BinXml"; break;
    case BinXmlValueType::EvtXml: name = "EvtXml"; break;
    default: {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(type & static_cast<std::uint8_t>(~VALUE_ARRAY_FLAG));
        name = oss.str();
        break;
    }
    }
    if (type & VALUE_ARRAY_FLAG) {
        name += "[]";
    }
    return name;
}

// ============================================================================
// Составные значения
// ============================================================================

std::string Guid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << data1 << "-"
        << std::setw(4) << data2 << "-" << std::setw(4) << data3 << "-";
    for (std::size_t i = 0; i < 2; ++i) {
        oss << std::setw(2) << static_cast<int>(data4[i]);
    }
    oss << "-";
    for (std::size_t i = 2; i < 8; ++i) {
        oss << std::setw(2) << static_cast<int>(data4[i]);
    }
    return oss.str();
}

std::string Sid::to_string() const {
    std::ostringstream oss;
    oss << "S-" << static_cast<int>(revision) << "-" << authority;
    for (std::uint32_t sub : sub_authorities) {
        oss << "-" << sub;
    }
    return oss.str();
}

std::string SystemTime::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-"
        << std::setw(2) << day << "T" << std::setw(2) << hour << ":" << std::setw(2) << minute
        << ":" << std::setw(2) << second << "." << std::setw(3) << milliseconds << "Z";
    return oss.str();
}

// ============================================================================
// BinXmlValue
// ============================================================================

const BinXmlNode* BinXmlValue::get_fragment() const {
    if (const Fragment* fragment = std::get_if<Fragment>(&data)) {
        return fragment->get();
    }
    return nullptr;
}

std::optional<std::int64_t> BinXmlValue::as_integer() const {
    if (const std::int64_t* v = get_int()) {
        return *v;
    }
    if (const std::uint64_t* v = get_uint()) {
        if (*v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(*v);
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> BinXmlValue::as_filetime() const {
    if (base_type() == BinXmlValueType::FileTime && !is_array()) {
        if (const std::uint64_t* v = get_uint()) {
            return *v;
        }
    }
    return std::nullopt;
}

std::string BinXmlValue::to_string() const {
    struct Visitor {
        const BinXmlValue& self;

        std::string operator()(const std::monostate&) const { return ""; }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(std::int64_t v) const { return std::to_string(v); }

        std::string operator()(std::uint64_t v) const {
            switch (self.base_type()) {
            case BinXmlValueType::Hex32:
            case BinXmlValueType::Hex64: {
                std::ostringstream oss;
                oss << "0x" << std::hex << v;
                return oss.str();
            }
            case BinXmlValueType::FileTime:
                return filetime_to_iso8601(v);
            default:
                return std::to_string(v);
            }
        }

        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << std::setprecision(15) << v;
            return oss.str();
        }

        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(const Guid& g) const { return g.to_string(); }
        std::string operator()(const Sid& s) const { return s.to_string(); }
        std::string operator()(const SystemTime& t) const { return t.to_string(); }

        std::string operator()(const Bytes& bytes) const {
            std::ostringstream oss;
            for (std::uint8_t b : bytes) {
                oss << std::hex << std::uppercase << std::setfill('0') << std::setw(2)
                    << static_cast<int>(b);
            }
            return oss.str();
        }

        std::string operator()(const StringArray& items) const {
            std::string result;
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    result += ",";
                }
                result += items[i];
            }
            return result;
        }

        std::string operator()(const Fragment&) const { return ""; }
    };

    return std::visit(Visitor{*this}, data);
}

// ============================================================================
// BinXmlNode
// ============================================================================

const BinXmlNode* BinXmlNode::child(std::string_view child_name) const {
    for (const auto& node : children) {
        if (node.is_element() && node.name == child_name) {
            return &node;
        }
    }
    return nullptr;
}

std::vector<const BinXmlNode*> BinXmlNode::children_named(std::string_view child_name) const {
    std::vector<const BinXmlNode*> result;
    for (const auto& node : children) {
        if (node.is_element() && node.name == child_name) {
            result.push_back(&node);
        }
    }
    return result;
}

const BinXmlNode* BinXmlNode::attribute(std::string_view attr_name) const {
    for (const auto& attr : attributes) {
        if (attr.name == attr_name) {
            return &attr;
        }
    }
    return nullptr;
}

const BinXmlNode* BinXmlNode::root() const {
    if (is_element()) {
        return this;
    }
    for (const auto& node : children) {
        if (node.is_element()) {
            return &node;
        }
    }
    return nullptr;
}

std::string BinXmlNode::text() const {
    std::string result;
    for (const auto& node : children) {
        switch (node.kind) {
        case BinXmlNodeKind::Value:
        case BinXmlNodeKind::CData:
            result += node.value.to_string();
            break;
        case BinXmlNodeKind::CharRef:
            if (const std::uint64_t* code = node.value.get_uint()) {
                append_utf8(result, static_cast<std::uint32_t>(*code));
            }
            break;
        case BinXmlNodeKind::EntityRef:
            result += resolve_entity(node.name);
            break;
        default:
            break;
        }
    }
    return result;
}

const BinXmlValue* BinXmlNode::first_value() const {
    for (const auto& node : children) {
        if (node.kind == BinXmlNodeKind::Value && !node.value.is_null()) {
            return &node.value;
        }
    }
    return nullptr;
}

// ============================================================================
// BinXmlTemplate
// ============================================================================

namespace {

void collect_slots(const std::vector<BinXmlNode>& nodes, std::size_t& slots) {
    for (const auto& node : nodes) {
        if (node.kind == BinXmlNodeKind::Substitution) {
            slots = std::max<std::size_t>(slots, static_cast<std::size_t>(node.substitution_index) + 1);
        }
        collect_slots(node.attributes, slots);
        collect_slots(node.children, slots);
    }
}

}  // namespace

std::size_t BinXmlTemplate::substitution_slots() const {
    std::size_t slots = 0;
    collect_slots(nodes, slots);
    return slots;
}

std::string resolve_entity(std::string_view name) {
    if (name == "lt") return "<";
    if (name == "gt") return ">";
    if (name == "amp") return "&";
    if (name == "quot") return "\"";
    if (name == "apos") return "'";
    return "&" + std::string(name) + ";";
}

}  // namespace artifacts
