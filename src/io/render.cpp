// ==============================================================================
// render.cpp - Рендеринг дерева записи в XML и JSON
// ==============================================================================

#include <artifacts/render.hpp>

#include <artifacts/bytes.hpp>
#include <artifacts/filetime.hpp>

#include <map>
#include <sstream>
#include <utility>
#include <vector>

#include <pugixml.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace artifacts {

namespace {

// ============================================================================
// XML
// ============================================================================

void append_xml(pugi::xml_node parent, const BinXmlNode& node) {
    switch (node.kind) {
    case BinXmlNodeKind::Fragment:
        for (const auto& child : node.children) {
            append_xml(parent, child);
        }
        break;

    case BinXmlNodeKind::Element: {
        pugi::xml_node element = parent.append_child(node.name.c_str());
        for (const auto& attr : node.attributes) {
            element.append_attribute(attr.name.c_str()).set_value(attr.text().c_str());
        }
        for (const auto& child : node.children) {
            append_xml(element, child);
        }
        break;
    }

    case BinXmlNodeKind::Value:
        if (const BinXmlNode* fragment = node.value.get_fragment()) {
            append_xml(parent, *fragment);
        } else if (!node.value.is_null()) {
            parent.append_child(pugi::node_pcdata).set_value(node.value.to_string().c_str());
        }
        break;

    case BinXmlNodeKind::CData:
        parent.append_child(pugi::node_cdata).set_value(node.value.to_string().c_str());
        break;

    case BinXmlNodeKind::CharRef:
        if (const std::uint64_t* code = node.value.get_uint()) {
            std::string text;
            append_utf8(text, static_cast<std::uint32_t>(*code));
            parent.append_child(pugi::node_pcdata).set_value(text.c_str());
        }
        break;

    case BinXmlNodeKind::EntityRef:
        parent.append_child(pugi::node_pcdata).set_value(resolve_entity(node.name).c_str());
        break;

    case BinXmlNodeKind::ProcessingInstruction: {
        pugi::xml_node pi = parent.append_child(pugi::node_pi);
        pi.set_name(node.name.c_str());
        pi.set_value(node.value.to_string().c_str());
        break;
    }

    case BinXmlNodeKind::Attribute:
    case BinXmlNodeKind::Substitution:
        // Вне элемента / до подстановки не рендерятся
        break;
    }
}

// ============================================================================
// Value
// ============================================================================

bool has_child_elements(const BinXmlNode& element) {
    for (const auto& child : element.children) {
        if (child.is_element()) {
            return true;
        }
    }
    return false;
}

Value attributes_value(const BinXmlNode& element) {
    Value::Object attrs;
    for (const auto& attr : element.attributes) {
        const BinXmlValue* single = nullptr;
        if (attr.children.size() == 1 && attr.children[0].kind == BinXmlNodeKind::Value) {
            single = &attr.children[0].value;
        }
        attrs[attr.name] = single ? binxml_value_to_value(*single) : Value(attr.text());
    }
    return Value(std::move(attrs));
}

Value element_value(const BinXmlNode& element);

/// Собрать поле: одно вхождение → значение, повторы → массив
void add_field(std::map<std::string, std::vector<Value>>& fields, const std::string& name,
               Value value) {
    fields[name].push_back(std::move(value));
}

/// Data с атрибутом Name у всех дочерних элементов EventData
bool is_named_data(const BinXmlNode& element) {
    if (element.name != "EventData") {
        return false;
    }
    bool any = false;
    for (const auto& child : element.children) {
        if (!child.is_element()) {
            continue;
        }
        if (child.name != "Data" || child.attribute("Name") == nullptr) {
            return false;
        }
        any = true;
    }
    return any;
}

Value element_value(const BinXmlNode& element) {
    if (!has_child_elements(element)) {
        if (element.children.size() == 1 && element.children[0].kind == BinXmlNodeKind::Value) {
            return binxml_value_to_value(element.children[0].value);
        }
        std::string text = element.text();
        return text.empty() ? Value() : Value(std::move(text));
    }

    std::map<std::string, std::vector<Value>> fields;
    bool named_data = is_named_data(element);

    for (const auto& child : element.children) {
        if (!child.is_element()) {
            continue;
        }
        if (named_data) {
            add_field(fields, child.attribute("Name")->text(), element_value(child));
            continue;
        }
        add_field(fields, child.name, element_value(child));
        if (!child.attributes.empty()) {
            add_field(fields, child.name + "_attributes", attributes_value(child));
        }
    }

    Value::Object obj;
    for (auto& [name, values] : fields) {
        if (values.size() == 1) {
            obj[name] = std::move(values[0]);
        } else {
            obj[name] = Value(std::move(values));
        }
    }

    std::string text = element.text();
    if (!text.empty()) {
        obj["$text"] = Value(std::move(text));
    }
    return Value(std::move(obj));
}

}  // namespace

// ============================================================================
// Публичные функции
// ============================================================================

std::string to_xml(const BinXmlNode& tree, bool indent) {
    pugi::xml_document doc;
    append_xml(doc, tree);

    unsigned int flags = pugi::format_no_declaration;
    flags |= indent ? pugi::format_indent : pugi::format_raw;

    std::ostringstream out;
    doc.save(out, "  ", flags, pugi::encoding_utf8);
    return out.str();
}

Value binxml_value_to_value(const BinXmlValue& value) {
    if (value.is_null()) {
        return Value();
    }
    if (const std::string* s = value.get_string()) {
        return Value(*s);
    }
    if (const std::int64_t* i = value.get_int()) {
        return Value(*i);
    }
    if (const std::uint64_t* u = value.get_uint()) {
        switch (value.base_type()) {
        case BinXmlValueType::Hex32:
        case BinXmlValueType::Hex64:
        case BinXmlValueType::FileTime:
            return Value(value.to_string());
        default:
            return Value(*u);
        }
    }
    if (const double* d = value.get_double()) {
        return Value(*d);
    }
    if (const bool* b = value.get_bool()) {
        return Value(*b);
    }
    if (const BinXmlValue::StringArray* items = value.get_array()) {
        Value::Array arr;
        arr.reserve(items->size());
        for (const auto& item : *items) {
            arr.emplace_back(item);
        }
        return Value(std::move(arr));
    }
    if (const BinXmlNode* fragment = value.get_fragment()) {
        return to_value(*fragment);
    }
    return Value(value.to_string());
}

Value to_value(const BinXmlNode& tree) {
    const BinXmlNode* root = tree.is_element() ? &tree : tree.root();
    if (root == nullptr) {
        return Value();
    }

    Value::Object doc;
    doc[root->name] = element_value(*root);
    if (!root->attributes.empty()) {
        doc[root->name + "_attributes"] = attributes_value(*root);
    }
    return Value(std::move(doc));
}

std::string to_json(const BinXmlNode& tree) {
    return to_value(tree).to_json_string();
}

Value event_to_value(const Event& event) {
    Value::Object obj;
    obj["timestamp"] = Value(timestamp_to_iso8601(event.timestamp));
    obj["level"] = Value(level_to_string(event.level));
    obj["event_id"] = Value(static_cast<std::uint64_t>(event.event_id));
    obj["provider"] = Value(event.provider);
    obj["message"] = Value(event.message);
    obj["record_id"] = Value(event.record_id);
    obj["channel"] = Value(event.channel);
    obj["computer"] = Value(event.computer);
    return Value(std::move(obj));
}

std::string event_to_json(const Event& event) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    auto string_field = [&writer](const char* key, const std::string& value) {
        writer.Key(key);
        writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
    };

    // Порядок полей строки: timestamp, level, event_id, provider, message
    writer.StartObject();
    string_field("timestamp", timestamp_to_iso8601(event.timestamp));
    writer.Key("level");
    writer.String(level_to_string(event.level));
    writer.Key("event_id");
    writer.Uint64(event.event_id);
    string_field("provider", event.provider);
    string_field("message", event.message);
    writer.Key("record_id");
    writer.Uint64(event.record_id);
    string_field("channel", event.channel);
    string_field("computer", event.computer);
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace artifacts
