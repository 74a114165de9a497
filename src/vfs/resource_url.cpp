#include "vfs/resource_url.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace lexis::vfs {

namespace {

constexpr std::array<std::string_view, 1> kArchiveExtensions = {".zip"};

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        auto pos = path.find('/', start);
        if (pos == std::string_view::npos) {
            out.push_back(path.substr(start));
            break;
        }
        out.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

} // namespace

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool has_archive_extension(std::string_view name) {
    return std::any_of(kArchiveExtensions.begin(), kArchiveExtensions.end(),
                       [&](std::string_view ext) { return ends_with(name, ext); });
}

std::string ResourceUrl::to_string() const {
    switch (protocol) {
    case Protocol::File: return "file://" + path;
    case Protocol::Nltk: return "nltk:" + path;
    case Protocol::Http:
    case Protocol::Other: return scheme + "://" + path;
    }
    return path;
}

std::string posix_normpath(std::string_view path) {
    if (path.empty()) return ".";

    bool absolute = path.front() == '/';
    std::vector<std::string_view> comps;
    for (auto seg : split_segments(path)) {
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!comps.empty() && comps.back() != "..") {
                comps.pop_back();
            } else if (!absolute) {
                comps.push_back(seg);
            }
            continue;
        }
        comps.push_back(seg);
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < comps.size(); i++) {
        if (i > 0) result += '/';
        result += comps[i];
    }
    if (result.empty()) result = ".";
    return result;
}

std::string normalize_resource_name(std::string_view name, bool allow_relative,
                                    std::optional<std::string_view> relative_path) {
    bool is_dir = !name.empty() &&
                  (name.back() == '/' || name.back() == '\\' || name.back() == '.');

    std::string result(name);

    // Collapse any run of leading slashes into one.
    if (!result.empty() && result[0] == '/') {
        auto first = result.find_first_not_of('/');
        result.erase(0, first == std::string::npos ? result.size() - 1 : first - 1);
    }

    std::replace(result.begin(), result.end(), '\\', '/');

    if (allow_relative) {
        result = posix_normpath(result);
    } else {
        std::string base = relative_path ? std::string(*relative_path)
                                         : fs::current_path().generic_string();
        if (result.empty() || result[0] != '/') {
            result = base + "/" + result;
        }
        result = posix_normpath(result);
    }

    if (is_dir && result.back() != '/') {
        result += '/';
    }
    return result;
}

std::optional<std::pair<std::string, std::string>> split_resource_url(
    std::string_view url) {
    auto colon = url.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    std::string protocol(url.substr(0, colon));
    std::string path(url.substr(colon + 1));

    if (protocol == "nltk") {
        // kept verbatim
    } else if (protocol == "file") {
        if (!path.empty() && path[0] == '/') {
            path.erase(0, path.find_first_not_of('/'));
            path.insert(0, "/");
        }
    } else {
        size_t strip = 0;
        while (strip < 2 && strip < path.size() && path[strip] == '/') strip++;
        path.erase(0, strip);
    }
    return std::make_pair(std::move(protocol), std::move(path));
}

ResourceUrl normalize_resource_url(std::string_view url) {
    std::string protocol = "nltk";
    std::string name(url);
    if (auto split = split_resource_url(url)) {
        protocol = std::move(split->first);
        name = std::move(split->second);
    }

    ResourceUrl result;
    if (protocol == "nltk" && !name.empty() && name[0] == '/') {
        result.protocol = Protocol::File;
        result.path = normalize_resource_name(name, false);
    } else if (protocol == "file") {
        result.protocol = Protocol::File;
        result.path = normalize_resource_name(name, false);
    } else if (protocol == "nltk") {
        result.protocol = Protocol::Nltk;
        result.path = normalize_resource_name(name, true);
    } else {
        result.protocol = (protocol == "http" || protocol == "https")
                              ? Protocol::Http
                              : Protocol::Other;
        result.scheme = std::move(protocol);
        result.path = std::move(name);
    }
    return result;
}

std::optional<ArchiveSplit> split_archive_path(std::string_view name) {
    size_t start = 0;
    while (start <= name.size()) {
        auto slash = name.find('/', start);
        auto end = slash == std::string_view::npos ? name.size() : slash;
        if (has_archive_extension(name.substr(start, end - start))) {
            ArchiveSplit split;
            split.archive = std::string(name.substr(0, end));
            if (end < name.size()) split.entry = std::string(name.substr(end + 1));
            return split;
        }
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return std::nullopt;
}

} // namespace lexis::vfs
