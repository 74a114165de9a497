#pragma once

#include "data/loader.hpp"

#include <string>
#include <variant>

namespace lexis::data {

/// A resource that is loaded on first access and kept afterwards.
class LazyResource {
public:
    LazyResource(Loader& loader, std::string url, LoadOptions options = {});

    /// Load on the first call; later calls return the stored value. A failed
    /// load is not remembered.
    Result<ResourceValue> get();

    bool is_loaded() const { return std::holds_alternative<ResourceValue>(state_); }
    const std::string& url() const { return url_; }

private:
    struct Unloaded {};

    Loader& loader_;
    std::string url_;
    LoadOptions options_;
    std::variant<Unloaded, ResourceValue> state_;
};

} // namespace lexis::data
