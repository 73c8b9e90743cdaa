#include "schema_cache.hpp"
#include "errors.hpp"
#include "parser.hpp"

namespace bitwise {

SchemaCache::SchemaCache(size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0)
        throw Error("Schema cache capacity must be at least 1");
}

std::shared_ptr<const ResolvedLayout> SchemaCache::get(std::string_view text, const ResolveOptions& options)
{
    if (auto it = lookup.find(text); it != lookup.end()) {
        entries.splice(entries.begin(), entries, it->second);
        const auto& layout = it->second->second;
        // the entry may have been resolved without a size limit
        if (options.expectedSize && layout->size() > *options.expectedSize) {
            throw LayoutError("", "Layout needs " + std::to_string(layout->size())
                + " bytes but the image holds " + std::to_string(*options.expectedSize));
        }
        return layout;
    }

    // Either step may throw; nothing is inserted until both succeed.
    auto layout = std::make_shared<const ResolvedLayout>(resolve(compile(text), options));

    entries.emplace_front(std::string(text), layout);
    lookup.emplace(entries.front().first, entries.begin());

    while (entries.size() > capacity_) {
        lookup.erase(entries.back().first);
        entries.pop_back();
    }
    return layout;
}

bool SchemaCache::evict(std::string_view text)
{
    auto it = lookup.find(text);
    if (it == lookup.end())
        return false;
    auto entry = it->second;
    lookup.erase(it);
    entries.erase(entry);
    return true;
}

void SchemaCache::clear()
{
    lookup.clear();
    entries.clear();
}

} // namespace bitwise
