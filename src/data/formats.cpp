#include "data/formats.hpp"

#include <spdlog/fmt/fmt.h>

namespace lexis::data {

namespace {

struct BuiltinFormat {
    const char* name;
    const char* description;
    FormatKind kind;
    bool inferable;
};

constexpr BuiltinFormat kBuiltinFormats[] = {
    {"pickle", "A serialized object in pickle format.",
     FormatKind::Binary, true},
    {"json", "A serialized object in JSON.",
     FormatKind::Binary, true},
    {"yaml", "A serialized object in YAML.",
     FormatKind::Binary, true},
    {"cfg", "A context free grammar.", FormatKind::Text, true},
    {"pcfg", "A probabilistic CFG.", FormatKind::Text, true},
    {"fcfg", "A feature CFG.", FormatKind::Text, true},
    {"fol", "A list of first order logic expressions.", FormatKind::Text, true},
    {"logic", "A list of logic expressions, parsed with a caller-supplied "
              "logic parser.",
     FormatKind::Text, true},
    {"val", "A semantic valuation.", FormatKind::Text, true},
    {"raw", "The raw (byte string) contents of a file.", FormatKind::Raw, false},
    {"text", "The raw (unicode string) contents of a file.", FormatKind::Text,
     true},
};

} // namespace

FormatRegistry::FormatRegistry() {
    for (const auto& builtin : kBuiltinFormats) {
        formats_[builtin.name] =
            FormatInfo{builtin.name, builtin.description, builtin.kind};
        if (builtin.inferable) extensions_[builtin.name] = builtin.name;
    }
    extensions_["txt"] = "text";
}

const FormatInfo* FormatRegistry::find(std::string_view format) const {
    auto it = formats_.find(format);
    return it == formats_.end() ? nullptr : &it->second;
}

std::optional<std::string> FormatRegistry::infer(std::string_view url) const {
    auto dot = url.rfind('.');
    if (dot == std::string_view::npos) return std::nullopt;

    auto ext = url.substr(dot + 1);
    if (ext == "gz") {
        auto stem = url.substr(0, dot);
        auto prev = stem.rfind('.');
        if (prev == std::string_view::npos) return std::nullopt;
        ext = stem.substr(prev + 1);
    }

    auto it = extensions_.find(ext);
    if (it == extensions_.end()) return std::nullopt;
    return it->second;
}

Result<void> FormatRegistry::register_parser(std::string_view format,
                                             Parser parser) {
    if (!find(format)) {
        return Error(ErrorKind::UnknownFormat,
                     fmt::format("Unknown format type: {}", format));
    }
    parsers_[std::string(format)] = std::move(parser);
    return {};
}

void FormatRegistry::add_format(FormatInfo info,
                                std::optional<std::string> extension) {
    if (extension) extensions_[*extension] = info.name;
    auto name = info.name;
    formats_[name] = std::move(info);
}

const Parser* FormatRegistry::parser(std::string_view format) const {
    auto it = parsers_.find(format);
    return it == parsers_.end() ? nullptr : &it->second;
}

std::vector<FormatInfo> FormatRegistry::formats() const {
    std::vector<FormatInfo> out;
    out.reserve(formats_.size());
    for (const auto& [name, info] : formats_) {
        out.push_back(info);
    }
    return out;
}

} // namespace lexis::data
