#pragma once

#include "core/result.hpp"
#include "data/resource_value.hpp"

#include <any>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::data {

enum class FormatKind {
    Raw,    ///< bytes returned as-is
    Text,   ///< decoded to UTF-8, then parsed (or returned for "text")
    Binary, ///< bytes handed straight to a parser
};

struct FormatInfo {
    std::string name;
    std::string description;
    FormatKind kind = FormatKind::Text;
};

/// Handed to every parser call.
struct ParseContext {
    std::string format;
    std::optional<std::string> encoding; ///< what the caller asked for
    std::any options;                    ///< caller-supplied parser settings
};

/// Parses decoded UTF-8 text (Text formats) or raw bytes (Binary formats).
using Parser =
    std::function<Result<ResourceValue>(std::string_view data, const ParseContext&)>;

/// Known resource formats, the extensions they are inferred from, and the
/// parsers registered for them.
///
/// Built in: raw, text (no parser needed), cfg, pcfg, fcfg, fol, logic,
/// val, pickle, json, yaml.
class FormatRegistry {
public:
    FormatRegistry();

    const FormatInfo* find(std::string_view format) const;

    /// Format for `url` from its extension; a trailing ".gz" is looked past.
    std::optional<std::string> infer(std::string_view url) const;

    /// Attach a parser to a known format. Fails with UnknownFormat otherwise.
    Result<void> register_parser(std::string_view format, Parser parser);

    /// Add (or replace) a format, optionally with an extension for "auto".
    void add_format(FormatInfo info, std::optional<std::string> extension = {});

    /// nullptr if no parser is registered.
    const Parser* parser(std::string_view format) const;

    /// All formats, sorted by name.
    std::vector<FormatInfo> formats() const;

    /// Extension -> format table used by infer().
    const std::map<std::string, std::string, std::less<>>& extensions() const {
        return extensions_;
    }

private:
    std::map<std::string, FormatInfo, std::less<>> formats_;
    std::map<std::string, std::string, std::less<>> extensions_;
    std::map<std::string, Parser, std::less<>> parsers_;
};

} // namespace lexis::data
