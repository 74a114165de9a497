#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace lexis::data {

/// Object produced by an external format parser. The loader never looks
/// inside; callers cast `object` back to the type their parser produced.
struct ParsedObject {
    std::string format;
    std::shared_ptr<const void> object;

    bool operator==(const ParsedObject&) const = default;
};

/// Raw bytes, UTF-8 text, or a parsed object.
using ResourceValue = std::variant<std::vector<char>, std::string, ParsedObject>;

/// Parsed objects without an object have no identity to share and are not
/// cached.
inline bool is_cacheable(const ResourceValue& value) {
    if (const auto* parsed = std::get_if<ParsedObject>(&value)) {
        return parsed->object != nullptr;
    }
    return true;
}

template <typename T>
std::shared_ptr<const T> object_as(const ResourceValue& value) {
    if (const auto* parsed = std::get_if<ParsedObject>(&value)) {
        return std::static_pointer_cast<const T>(parsed->object);
    }
    return nullptr;
}

} // namespace lexis::data
