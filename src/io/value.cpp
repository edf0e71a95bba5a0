// ==============================================================================
// value.cpp - Документная модель Value
// ==============================================================================

#include <artifacts/value.hpp>

#include <cmath>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace artifacts {

const Value* Value::get(const std::string& key) const {
    if (const Object* obj = get_object()) {
        auto it = obj->find(key);
        if (it != obj->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::size_t Value::size() const {
    if (const Array* arr = get_array()) {
        return arr->size();
    }
    if (const Object* obj = get_object()) {
        return obj->size();
    }
    return 0;
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_object()) {
        return as_object() == other.as_object();
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_int()) {
        return as_int() == other.as_int();
    }
    if (is_uint()) {
        return as_uint() == other.as_uint();
    }
    if (is_double()) {
        return as_double() == other.as_double();
    }
    return as_string() == other.as_string();
}

// ----------------------------------------------------------------------------
// RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out,
                         rapidjson::Document::AllocatorType& alloc) const {
    if (is_bool()) {
        out.SetBool(as_bool());
    } else if (is_int()) {
        out.SetInt64(as_int());
    } else if (is_uint()) {
        out.SetUint64(as_uint());
    } else if (is_double()) {
        double d = as_double();
        if (std::isfinite(d)) {
            out.SetDouble(d);
        } else {
            out.SetNull();
        }
    } else if (is_string()) {
        const std::string& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    } else if (const Array* arr = get_array()) {
        out.SetArray();
        out.Reserve(static_cast<rapidjson::SizeType>(arr->size()), alloc);
        for (const auto& item : *arr) {
            rapidjson::Value v;
            item.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
    } else if (const Object* obj = get_object()) {
        out.SetObject();
        for (const auto& [key, item] : *obj) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            item.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
    } else {
        out.SetNull();
    }
}

std::string Value::to_json_string() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace artifacts
