// ==============================================================================
// artifacts/value.hpp - Документная модель для JSON рендеринга
// ==============================================================================
//
// Назначение:
// - Value: Null / Bool / Int64 / UInt64 / Double / String / Array / Object
// - Конверсия в RapidJSON
// - Сериализация в компактный JSON
//
// Object упорядочен по ключу (std::map), вывод JSON детерминирован.
//
// ==============================================================================

#ifndef ARTIFACTS_VALUE_HPP
#define ARTIFACTS_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 даёт ложные -Wnull-dereference на std::get при высокой оптимизации
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace artifacts {

class Value;

using ValueArray = std::vector<Value>;
using ValueObject = std::map<std::string, Value>;

class Value {
public:
    struct Null {};
    using Array = ValueArray;
    using Object = ValueObject;

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_int() const { return std::holds_alternative<std::int64_t>(data_); }
    bool is_uint() const { return std::holds_alternative<std::uint64_t>(data_); }
    bool is_double() const { return std::holds_alternative<double>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    // Доступ без проверки: тип должен совпадать
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
    std::uint64_t as_uint() const { return std::get<std::uint64_t>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    const std::string* get_string() const { return std::get_if<std::string>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Поле объекта или nullptr
    const Value* get(const std::string& key) const;

    bool has(const std::string& key) const { return get(key) != nullptr; }

    /// Размер массива или объекта (0 для скаляров)
    std::size_t size() const;

    /// Глубокое сравнение
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Нечисловые double (NaN, inf) записываются как null
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Компактный JSON
    std::string to_json_string() const;

private:
    std::variant<Null, bool, std::int64_t, std::uint64_t, double, std::string,
                 std::shared_ptr<Array>, std::shared_ptr<Object>>
        data_;
};

}  // namespace artifacts

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // ARTIFACTS_VALUE_HPP
