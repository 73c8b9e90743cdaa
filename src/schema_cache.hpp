#pragma once
#include "layout.hpp"
#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bitwise {

/**
 * @brief Least recently used cache of resolved layouts keyed by schema text.
 *
 * The text is the identity: two schemas with the same content share one
 * layout. A miss compiles and resolves; a failing schema is never cached.
 * Layouts are handed out as shared pointers so an evicted entry stays valid
 * for whoever still holds it. Not thread-safe.
 */
class SchemaCache
{
    using Entry = std::pair<std::string, std::shared_ptr<const ResolvedLayout>>;

    size_t capacity_;
    std::list<Entry> entries; // most recently used first
    std::unordered_map<std::string_view, std::list<Entry>::iterator> lookup;

public:
    explicit SchemaCache(size_t capacity = 16);

    SchemaCache(const SchemaCache&) = delete;
    SchemaCache& operator=(const SchemaCache&) = delete;

    std::shared_ptr<const ResolvedLayout> get(std::string_view text, const ResolveOptions& options = {});

    bool contains(std::string_view text) const { return lookup.contains(text); }
    bool evict(std::string_view text);
    void clear();

    size_t size() const { return entries.size(); }
    size_t capacity() const { return capacity_; }
};

} // namespace bitwise
