#include "vfs/resolver.hpp"

#include "vfs/resource_url.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <system_error>

namespace lexis::vfs {

namespace {

std::vector<std::string> split_on_slash(std::string_view name) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (true) {
        auto pos = name.find('/', start);
        if (pos == std::string_view::npos) {
            pieces.emplace_back(name.substr(start));
            return pieces;
        }
        pieces.emplace_back(name.substr(start, pos - start));
        start = pos + 1;
    }
}

fs::path under_root(const std::string& root, std::string_view name) {
    if (root.empty()) return fs::path(name);
    return fs::path(root) / fs::path(name);
}

/// One pass over the roots for an already normalized name.
Result<PathPointerPtr> find_in_roots(const std::string& name,
                                     const std::vector<std::string>& roots) {
    auto archive_split = split_archive_path(name);

    for (const auto& root : roots) {
        std::error_code ec;

        if (!root.empty() && has_archive_extension(root) &&
            fs::is_regular_file(root, ec)) {
            auto pointer = ZipEntryPathPointer::create(fs::path(root), name);
            if (pointer) return pointer;
            if (pointer.error().is(ErrorKind::ArchiveConstructFailed)) {
                spdlog::warn("Skipping unreadable archive root {}: {}", root,
                             pointer.error().message);
            } else {
                spdlog::debug("{} not in archive root {}", name, root);
            }
            continue;
        }

        if (!root.empty() && !fs::is_directory(root, ec)) continue;

        if (!archive_split) {
            auto p = under_root(root, name);
            if (fs::exists(p, ec)) {
                if (ends_with(name, ".gz")) {
                    return GzipFileSystemPathPointer::create(p);
                }
                return FileSystemPathPointer::create(p);
            }
        } else {
            auto p = under_root(root, archive_split->archive);
            if (fs::exists(p, ec)) {
                auto pointer = ZipEntryPathPointer::create(p, archive_split->entry);
                if (pointer) return pointer;
                if (pointer.error().is(ErrorKind::ArchiveConstructFailed)) {
                    spdlog::warn("Skipping unreadable archive {}: {}",
                                 p.string(), pointer.error().message);
                }
            }
        }

        spdlog::debug("{} not found under '{}'", name, root);
    }

    Error err(ErrorKind::ResourceNotFound,
              fmt::format("Resource '{}' not found", name));
    err.resource = name;
    err.searched = roots;
    err.package = suggested_package(name);
    return err;
}

} // namespace

Result<PathPointerPtr> find(std::string_view resource_name,
                            const std::vector<std::string>& roots) {
    auto name = normalize_resource_name(resource_name, true);

    auto found = find_in_roots(name, roots);
    if (found || !found.error().is(ErrorKind::ResourceNotFound)) return found;

    // Retry with each segment as a zip archive, unless the name already
    // names one.
    if (!split_archive_path(name)) {
        auto pieces = split_on_slash(name);
        for (size_t i = 0; i < pieces.size(); i++) {
            std::string modified;
            for (size_t j = 0; j < i; j++) modified += pieces[j] + "/";
            modified += pieces[i] + ".zip/";
            for (size_t j = i; j < pieces.size(); j++) {
                if (j > i) modified += "/";
                modified += pieces[j];
            }

            auto retry = find_in_roots(normalize_resource_name(modified, true),
                                       roots);
            if (retry) {
                spdlog::debug("{} resolved through {}", name,
                              retry.value()->to_string());
                return retry;
            }
            if (!retry.error().is(ErrorKind::ResourceNotFound)) return retry;
        }
    }

    return found;
}

std::string suggested_package(std::string_view resource_name) {
    auto pieces = split_on_slash(resource_name);
    std::string package = pieces.size() > 1 ? pieces[1] : pieces[0];
    auto dot = package.rfind('.');
    if (dot != std::string::npos) package.erase(dot);
    return package;
}

std::string format_not_found_message(const Error& error) {
    const std::string rule(70, '*');
    std::string msg = rule + "\n";
    msg += fmt::format("  Resource '{}' not found.\n", error.package);
    msg += fmt::format("  Install the '{}' data package into one of the "
                       "directories below.\n\n",
                       error.package);
    msg += fmt::format("  Attempted to load {}\n\n", error.resource);
    msg += "  Searched in:\n";
    for (const auto& root : error.searched) {
        msg += fmt::format("    - '{}'\n", root);
    }
    msg += rule + "\n";
    return msg;
}

} // namespace lexis::vfs
