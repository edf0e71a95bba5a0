// ==============================================================================
// artifacts/binxml_decoder.hpp - Декодер Binary XML
// ==============================================================================
//
// Назначение:
// - Декодирование потока токенов Binary XML в дерево BinXmlNode
// - Экземпляры шаблонов: определение из TemplateCache или разбор по
//   смещению, массив подстановок записи, подстановка значений в копию тела
// - Типизированные значения подстановок (строки, целые, GUID, SID, время,
//   вложенный BinXML, массивы)
//
// Любая ошибка (неизвестный токен, индекс подстановки вне диапазона,
// усечённые данные, слишком глубокая вложенность) возвращается как
// ErrorKind::BinXml и отбрасывает только текущую запись.
//
// ==============================================================================

#ifndef ARTIFACTS_BINXML_DECODER_HPP
#define ARTIFACTS_BINXML_DECODER_HPP

#include <artifacts/binxml.hpp>
#include <artifacts/bytes.hpp>
#include <artifacts/error.hpp>
#include <artifacts/template_cache.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace artifacts {

/// Предел вложенности (элементы, шаблоны, вложенный BinXML)
constexpr std::size_t BINXML_MAX_DEPTH = 64;

/// Размер заголовка определения шаблона: next u32, GUID, data size u32
constexpr std::size_t TEMPLATE_HEADER_SIZE = 24;

/// Декодер Binary XML в контексте одного чанка
class BinXmlDecoder {
public:
    explicit BinXmlDecoder(ChunkContext& context, std::size_t max_depth = BINXML_MAX_DEPTH);

    /// Декодировать фрагмент [offset, offset + size) чанка (payload записи)
    /// @return узел Fragment с экземплярами шаблонов, уже заполненными значениями
    Result<BinXmlNode> decode(std::size_t offset, std::size_t size);

    /// Шаблон по смещению определения: из кеша или разбором с записью в кеш
    Result<std::shared_ptr<const BinXmlTemplate>> load_template(std::uint32_t offset);

    /// Декодировать значение подстановки по типу (кроме вложенного BinXML)
    static Result<BinXmlValue> decode_value(std::uint8_t type, ByteView bytes);

private:
    ChunkContext& context_;
    std::size_t max_depth_;
};

}  // namespace artifacts

#endif  // ARTIFACTS_BINXML_DECODER_HPP
