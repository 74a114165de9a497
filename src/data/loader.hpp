#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "data/formats.hpp"
#include "data/resource_cache.hpp"
#include "data/resource_value.hpp"
#include "data/search_path.hpp"
#include "io/byte_stream.hpp"
#include "vfs/path_pointer.hpp"
#include "vfs/resource_url.hpp"

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexis::data {

struct LoadOptions {
    /// A registered format name, or "auto" to infer it from the extension.
    std::string format = "auto";
    bool cache = true;
    /// Text encoding. When unset, UTF-8 is tried and Latin-1 is the fallback.
    std::optional<std::string> encoding;
    /// Log progress at info level instead of debug.
    bool verbose = false;
    /// Passed through to the parser in ParseContext::options.
    std::any parser_options;
};

/// Opens resources for URL schemes other than file: and nltk:.
using UrlOpener = std::function<Result<io::ByteStreamPtr>(const vfs::ResourceUrl&)>;

/// Resolves, opens, decodes and parses resources, caching the results.
class Loader {
public:
    Loader(SearchPath& search_path, ResourceCache& cache,
           const FormatRegistry& formats);

    /// Load a resource and return it in the requested format.
    Result<ResourceValue> load(std::string_view url,
                               const LoadOptions& options = {});

    /// Open a resource as a byte stream. nltk: names are searched in the
    /// configured roots and then the current directory; file: names are used
    /// as given; other schemes go to the URL opener.
    Result<io::ByteStreamPtr> open(std::string_view url);

    /// Locate `resource_name` in the configured roots.
    Result<vfs::PathPointerPtr> find(std::string_view resource_name) const;

    /// Copy a resource to a local file. The default filename is the last
    /// segment of the URL (plus ".gz" when compressing). Fails with
    /// AlreadyExists if the target exists. Returns the file written.
    Result<fs::path> retrieve(std::string_view url,
                              std::optional<fs::path> filename = std::nullopt,
                              bool compress = false);

    /// Lines of a text resource, skipping blank lines and lines starting
    /// with `escape`. Never cached.
    Result<std::vector<std::string>> show_cfg(std::string_view url,
                                              std::string_view escape = "##");

    void clear_cache() { cache_.clear(); }

    void set_url_opener(UrlOpener opener) { url_opener_ = std::move(opener); }

    const SearchPath& search_path() const { return search_path_; }
    ResourceCache& cache() { return cache_; }
    const FormatRegistry& formats() const { return formats_; }

private:
    Result<io::ByteStreamPtr> open(const vfs::ResourceUrl& url);

    SearchPath& search_path_;
    ResourceCache& cache_;
    const FormatRegistry& formats_;
    UrlOpener url_opener_;
};

/// Decode `bytes` as `encoding`, or as UTF-8 with a Latin-1 fallback when
/// no encoding is given. Returns UTF-8.
Result<std::string> decode_text(std::string_view bytes,
                                const std::optional<std::string>& encoding);

} // namespace lexis::data
