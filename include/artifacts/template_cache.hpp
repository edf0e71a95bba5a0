// ==============================================================================
// artifacts/template_cache.hpp - Кеши шаблонов и имён чанка
// ==============================================================================
//
// Назначение:
// - TemplateCache: смещение определения → декодированный шаблон
// - NameTable: смещение имени → строка имени элемента/атрибута
// - ChunkContext: байты чанка + оба кеша, передаётся в декодер по ссылке
//
// Время жизни кешей совпадает с представлением чанка: шаблоны и имена
// адресуются chunk-relative смещениями и между чанками не разделяются.
//
// ==============================================================================

#ifndef ARTIFACTS_TEMPLATE_CACHE_HPP
#define ARTIFACTS_TEMPLATE_CACHE_HPP

#include <artifacts/binxml.hpp>
#include <artifacts/bytes.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace artifacts {

/// Кеш шаблонов чанка
class TemplateCache {
public:
    /// Найти шаблон по смещению определения (учитывает hit/miss)
    std::shared_ptr<const BinXmlTemplate> find(std::uint32_t offset);

    /// Запомнить шаблон (ключ: tmpl->offset)
    void insert(std::shared_ptr<const BinXmlTemplate> tmpl);

    bool contains(std::uint32_t offset) const { return templates_.count(offset) != 0; }

    std::size_t size() const { return templates_.size(); }
    std::size_t hits() const { return hits_; }
    std::size_t misses() const { return misses_; }

    void clear();

private:
    std::unordered_map<std::uint32_t, std::shared_ptr<const BinXmlTemplate>> templates_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

/// Таблица имён чанка
class NameTable {
public:
    const std::string* find(std::uint32_t offset) const;
    void insert(std::uint32_t offset, std::string name);
    std::size_t size() const { return names_.size(); }
    void clear() { names_.clear(); }

private:
    std::unordered_map<std::uint32_t, std::string> names_;
};

/// Контекст декодирования одного чанка
struct ChunkContext {
    ByteView chunk;  // все 64 KiB чанка
    TemplateCache templates;
    NameTable names;

    ChunkContext() = default;
    explicit ChunkContext(ByteView bytes) : chunk(bytes) {}
};

}  // namespace artifacts

#endif  // ARTIFACTS_TEMPLATE_CACHE_HPP
