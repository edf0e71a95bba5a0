// ==============================================================================
// artifacts/binxml.hpp - Модель Binary XML
// ==============================================================================
//
// Назначение:
// - Токены и типы значений Binary XML (MS-EVEN6)
// - BinXmlValue: типизированное значение подстановки или inline Value
// - BinXmlNode: узел декодированного дерева (элемент, атрибут, значение, ...)
// - BinXmlTemplate: определение шаблона с позициями подстановок
//
// Формат токена:
// - биты 0..5: вид токена
// - бит 6 (0x40): "есть атрибуты/продолжение"
// - бит 7: игнорируется
//
// ==============================================================================

#ifndef ARTIFACTS_BINXML_HPP
#define ARTIFACTS_BINXML_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace artifacts {

// ----------------------------------------------------------------------------
// Токены и типы
// ----------------------------------------------------------------------------

/// Токены Binary XML
enum class BinXmlToken : std::uint8_t {
    EndOfStream = 0x00,
    OpenStartElement = 0x01,
    CloseStartElement = 0x02,
    CloseEmptyElement = 0x03,
    CloseElement = 0x04,
    Value = 0x05,
    Attribute = 0x06,
    CDataSection = 0x07,
    CharReference = 0x08,
    EntityReference = 0x09,
    PITarget = 0x0a,
    PIData = 0x0b,
    TemplateInstance = 0x0c,
    NormalSubstitution = 0x0d,
    OptionalSubstitution = 0x0e,
    FragmentHeader = 0x0f
};

constexpr std::uint8_t TOKEN_KIND_MASK = 0x3f;
constexpr std::uint8_t TOKEN_MORE_FLAG = 0x40;

/// Типы значений Binary XML
enum class BinXmlValueType : std::uint8_t {
    Null = 0x00,
    WString = 0x01,
    AnsiString = 0x02,
    Int8 = 0x03,
    UInt8 = 0x04,
    Int16 = 0x05,
    UInt16 = 0x06,
    Int32 = 0x07,
    UInt32 = 0x08,
    Int64 = 0x09,
    UInt64 = 0x0a,
    Float = 0x0b,
    Double = 0x0c,
    Bool = 0x0d,
    Binary = 0x0e,
    Guid = 0x0f,
    SizeT = 0x10,
    FileTime = 0x11,
    SystemTime = 0x12,
    Sid = 0x13,
    Hex32 = 0x14,
    Hex64 = 0x15,
    EvtHandle = 0x20,
    BinXml = 0x21,
    EvtXml = 0x23
};

/// Флаг массива в типе значения (0x81 = массив WString)
constexpr std::uint8_t VALUE_ARRAY_FLAG = 0x80;

/// Имя типа значения ("WString", "UInt32", ...)
std::string value_type_name(std::uint8_t type);

// ----------------------------------------------------------------------------
// Составные значения
// ----------------------------------------------------------------------------

/// GUID в порядке полей Windows
struct Guid {
    std::uint32_t data1 = 0;
    std::uint16_t data2 = 0;
    std::uint16_t data3 = 0;
    std::array<std::uint8_t, 8> data4{};

    /// "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX" (верхний регистр)
    std::string to_string() const;

    bool operator==(const Guid& other) const {
        return data1 == other.data1 && data2 == other.data2 && data3 == other.data3 &&
               data4 == other.data4;
    }
};

/// Security identifier
struct Sid {
    std::uint8_t revision = 0;
    std::uint64_t authority = 0;
    std::vector<std::uint32_t> sub_authorities;

    /// "S-1-5-21-..."
    std::string to_string() const;

    bool operator==(const Sid& other) const {
        return revision == other.revision && authority == other.authority &&
               sub_authorities == other.sub_authorities;
    }
};

/// Windows SYSTEMTIME
struct SystemTime {
    std::uint16_t year = 0;
    std::uint16_t month = 0;
    std::uint16_t day_of_week = 0;
    std::uint16_t day = 0;
    std::uint16_t hour = 0;
    std::uint16_t minute = 0;
    std::uint16_t second = 0;
    std::uint16_t milliseconds = 0;

    /// "YYYY-MM-DDTHH:MM:SS.mmmZ"
    std::string to_string() const;

    bool operator==(const SystemTime& other) const {
        return year == other.year && month == other.month && day == other.day &&
               hour == other.hour && minute == other.minute && second == other.second &&
               milliseconds == other.milliseconds;
    }
};

struct BinXmlNode;

// ----------------------------------------------------------------------------
// BinXmlValue
// ----------------------------------------------------------------------------

/// Типизированное значение
///
/// Целые со знаком хранятся как int64, без знака (а также Hex32/Hex64,
/// SizeT, FileTime) как uint64. Массивы хранятся текстовыми элементами.
/// Вложенный BinXML (тип 0x21) хранится как фрагмент-дерево.
struct BinXmlValue {
    using Bytes = std::vector<std::uint8_t>;
    using StringArray = std::vector<std::string>;
    using Fragment = std::shared_ptr<const BinXmlNode>;
    using Data = std::variant<std::monostate, std::string, std::int64_t, std::uint64_t, double,
                              bool, Guid, Sid, SystemTime, Bytes, StringArray, Fragment>;

    std::uint8_t type = static_cast<std::uint8_t>(BinXmlValueType::Null);
    Data data;

    BinXmlValue() = default;
    BinXmlValue(BinXmlValueType t, Data d) : type(static_cast<std::uint8_t>(t)), data(std::move(d)) {}

    BinXmlValueType base_type() const {
        return static_cast<BinXmlValueType>(type & static_cast<std::uint8_t>(~VALUE_ARRAY_FLAG));
    }
    bool is_array() const { return (type & VALUE_ARRAY_FLAG) != 0; }
    bool is_null() const { return std::holds_alternative<std::monostate>(data); }

    const std::string* get_string() const { return std::get_if<std::string>(&data); }
    const std::int64_t* get_int() const { return std::get_if<std::int64_t>(&data); }
    const std::uint64_t* get_uint() const { return std::get_if<std::uint64_t>(&data); }
    const double* get_double() const { return std::get_if<double>(&data); }
    const bool* get_bool() const { return std::get_if<bool>(&data); }
    const Guid* get_guid() const { return std::get_if<Guid>(&data); }
    const Sid* get_sid() const { return std::get_if<Sid>(&data); }
    const SystemTime* get_systemtime() const { return std::get_if<SystemTime>(&data); }
    const Bytes* get_bytes() const { return std::get_if<Bytes>(&data); }
    const StringArray* get_array() const { return std::get_if<StringArray>(&data); }
    const BinXmlNode* get_fragment() const;

    /// Целое значение (знаковое или беззнаковое в пределах int64)
    std::optional<std::int64_t> as_integer() const;

    /// FILETIME, если значение имеет тип FileTime
    std::optional<std::uint64_t> as_filetime() const;

    /// Текстовое представление, как в XML рендеринге
    std::string to_string() const;
};

// ----------------------------------------------------------------------------
// BinXmlNode
// ----------------------------------------------------------------------------

enum class BinXmlNodeKind {
    Fragment,
    Element,
    Attribute,
    Value,
    Substitution,
    CData,
    CharRef,
    EntityRef,
    ProcessingInstruction
};

/// Узел декодированного дерева
///
/// - Element: name, attributes (узлы Attribute), children
/// - Attribute: name, children (части значения)
/// - Value: value
/// - Substitution: только внутри шаблона, до подстановки значений
/// - CData / ProcessingInstruction (name = target): value со строкой
/// - CharRef: value с кодом символа; EntityRef: name
struct BinXmlNode {
    BinXmlNodeKind kind = BinXmlNodeKind::Fragment;
    std::string name;
    std::vector<BinXmlNode> attributes;
    std::vector<BinXmlNode> children;
    BinXmlValue value;

    std::uint16_t substitution_index = 0;
    std::uint8_t substitution_type = 0;
    bool optional = false;

    bool is_element() const { return kind == BinXmlNodeKind::Element; }

    /// Первый дочерний элемент с именем name
    const BinXmlNode* child(std::string_view child_name) const;

    /// Все дочерние элементы с именем name
    std::vector<const BinXmlNode*> children_named(std::string_view child_name) const;

    /// Атрибут элемента по имени
    const BinXmlNode* attribute(std::string_view attr_name) const;

    /// Первый элемент фрагмента (корень документа)
    const BinXmlNode* root() const;

    /// Текст прямых нетэговых потомков (значения, CDATA, ссылки)
    std::string text() const;

    /// Первое типизированное значение среди прямых потомков
    const BinXmlValue* first_value() const;
};

// ----------------------------------------------------------------------------
// BinXmlTemplate
// ----------------------------------------------------------------------------

/// Определение шаблона
struct BinXmlTemplate {
    std::uint32_t offset = 0;       // смещение определения в чанке
    std::uint32_t next_offset = 0;  // следующий шаблон в цепочке
    Guid guid;
    std::uint32_t data_size = 0;
    std::vector<BinXmlNode> nodes;  // тело с узлами Substitution

    /// Количество слотов подстановки (максимальный индекс + 1)
    std::size_t substitution_slots() const;
};

/// Разрешить сущность (&lt; &amp; ...) в символ; неизвестные как "&name;"
std::string resolve_entity(std::string_view name);

}  // namespace artifacts

#endif  // ARTIFACTS_BINXML_HPP
