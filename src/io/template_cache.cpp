// ==============================================================================
// template_cache.cpp - Кеши шаблонов и имён чанка
// ==============================================================================

#include <artifacts/template_cache.hpp>

#include <utility>

namespace artifacts {

std::shared_ptr<const BinXmlTemplate> TemplateCache::find(std::uint32_t offset) {
    auto it = templates_.find(offset);
    if (it == templates_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    return it->second;
}

void TemplateCache::insert(std::shared_ptr<const BinXmlTemplate> tmpl) {
    if (!tmpl) {
        return;
    }
    std::uint32_t offset = tmpl->offset;
    templates_[offset] = std::move(tmpl);
}

void TemplateCache::clear() {
    templates_.clear();
    hits_ = 0;
    misses_ = 0;
}

const std::string* NameTable::find(std::uint32_t offset) const {
    auto it = names_.find(offset);
    return it == names_.end() ? nullptr : &it->second;
}

void NameTable::insert(std::uint32_t offset, std::string name) {
    names_[offset] = std::move(name);
}

}  // namespace artifacts
