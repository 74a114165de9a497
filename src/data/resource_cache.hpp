#pragma once

#include "data/resource_value.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace lexis::data {

/// Loaded resources keyed by (normalized url, format). Never evicts.
/// All operations are thread-safe.
class ResourceCache {
public:
    std::optional<ResourceValue> get(const std::string& url,
                                     const std::string& format) const;

    /// Store `value`. Returns false, leaving the cache unchanged, when the
    /// value is not cacheable.
    bool insert(const std::string& url, const std::string& format,
                ResourceValue value);

    bool contains(const std::string& url, const std::string& format) const;

    void clear();
    size_t size() const;

private:
    using Key = std::pair<std::string, std::string>;

    mutable std::mutex mutex_;
    std::map<Key, ResourceValue> entries_;
};

} // namespace lexis::data
