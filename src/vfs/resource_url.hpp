#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lexis::vfs {

enum class Protocol {
    File, ///< absolute filesystem path
    Nltk, ///< name searched in the data roots
    Http, ///< http/https, handled by the network opener
    Other,
};

struct ResourceUrl {
    Protocol protocol = Protocol::Nltk;
    std::string scheme; ///< literal scheme for Http/Other, e.g. "https"
    std::string path;   ///< posix-style; directories end in '/'

    /// "file:///abs", "nltk:rel" or "<scheme>://rest".
    std::string to_string() const;

    bool operator==(const ResourceUrl&) const = default;
};

/// Split "<protocol>:<path>". Returns nullopt when there is no ':'.
/// file: paths keep exactly one leading '/'; other non-nltk schemes lose up
/// to two.
std::optional<std::pair<std::string, std::string>> split_resource_url(
    std::string_view url);

/// Normalize a resource URL. A missing protocol means nltk:, and an
/// absolute nltk: path becomes a file: URL.
ResourceUrl normalize_resource_url(std::string_view url);

/// Normalize a posix-style resource name: collapse "//", "." and "..",
/// keep a trailing '/' on directory-like names. With `allow_relative`
/// false the result is made absolute against `relative_path` (or the
/// current directory).
std::string normalize_resource_name(
    std::string_view name, bool allow_relative = true,
    std::optional<std::string_view> relative_path = std::nullopt);

/// posixpath-style normpath: "" -> ".", "a/./b/../c" -> "a/c".
std::string posix_normpath(std::string_view path);

struct ArchiveSplit {
    std::string archive; ///< up to and including the ".zip" segment
    std::string entry;   ///< the rest, possibly empty
};

/// Split a name at its first path segment ending in a recognized archive
/// extension: "corpora/x.zip/x/y" -> {"corpora/x.zip", "x/y"}.
std::optional<ArchiveSplit> split_archive_path(std::string_view name);

/// True if `name` ends in a recognized archive extension.
bool has_archive_extension(std::string_view name);

bool ends_with(std::string_view s, std::string_view suffix);

} // namespace lexis::vfs
