// ==============================================================================
// artifacts/render.hpp - Рендеринг дерева записи в XML и JSON
// ==============================================================================
//
// Назначение:
// - to_xml: XML текст записи (pugixml)
// - to_value / to_json: документ с _attributes семантикой (RapidJSON)
// - event_to_value / event_to_json: нормализованное событие
//
// JSON форма элемента:
// - элемент без дочерних элементов → скаляр (типизированное значение) или null
// - дочерние элементы → поля объекта, повторяющиеся имена → массив
// - атрибуты элемента → поле "<имя>_attributes" рядом с ним
// - текст рядом с дочерними элементами → поле "$text"
// - EventData/Data с атрибутом Name → поле с этим именем
//
//   {"Event": {"System": {"Provider": null,
//                         "Provider_attributes": {"Name": "..."}, ...},
//              "EventData": {"TargetUserName": "..."}},
//    "Event_attributes": {"xmlns": "..."}}
//
// ==============================================================================

#ifndef ARTIFACTS_RENDER_HPP
#define ARTIFACTS_RENDER_HPP

#include <artifacts/binxml.hpp>
#include <artifacts/event.hpp>
#include <artifacts/value.hpp>

#include <string>

namespace artifacts {

/// XML текст дерева (Fragment или Element), без XML декларации
std::string to_xml(const BinXmlNode& tree, bool indent = true);

/// Типизированное значение подстановки как Value
Value binxml_value_to_value(const BinXmlValue& value);

/// Документ записи; пустой фрагмент → null
Value to_value(const BinXmlNode& tree);

/// Компактный JSON документа записи
std::string to_json(const BinXmlNode& tree);

/// {"timestamp", "level", "event_id", "provider", "message",
///  "record_id", "channel", "computer"}; Object упорядочен по ключу
Value event_to_value(const Event& event);

/// Компактный JSON строки события, поля в порядке
/// timestamp, level, event_id, provider, message, record_id, channel, computer
std::string event_to_json(const Event& event);

}  // namespace artifacts

#endif  // ARTIFACTS_RENDER_HPP
