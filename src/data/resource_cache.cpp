#include "data/resource_cache.hpp"

#include <spdlog/spdlog.h>

namespace lexis::data {

std::optional<ResourceValue> ResourceCache::get(const std::string& url,
                                                const std::string& format) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(Key{url, format});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool ResourceCache::insert(const std::string& url, const std::string& format,
                           ResourceValue value) {
    if (!is_cacheable(value)) {
        spdlog::debug("Not caching {} ({}): no object identity", url, format);
        return false;
    }
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(Key{url, format}, std::move(value));
    return true;
}

bool ResourceCache::contains(const std::string& url,
                             const std::string& format) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(Key{url, format});
}

void ResourceCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

size_t ResourceCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace lexis::data
