#include "data/lazy_resource.hpp"

namespace lexis::data {

LazyResource::LazyResource(Loader& loader, std::string url, LoadOptions options)
    : loader_(loader), url_(std::move(url)), options_(std::move(options)) {}

Result<ResourceValue> LazyResource::get() {
    if (auto* loaded = std::get_if<ResourceValue>(&state_)) {
        return *loaded;
    }
    auto value = loader_.load(url_, options_);
    if (value) state_ = value.value();
    return value;
}

} // namespace lexis::data
