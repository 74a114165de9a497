#include "data/loader.hpp"

#include "io/buffered_gzip_writer.hpp"
#include "io/codec.hpp"
#include "io/unicode_reader.hpp"
#include "vfs/resolver.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <system_error>

namespace lexis::data {

namespace {

constexpr size_t kCopyBlockSize = 64 * 1024;

Result<std::string> decode_as(std::string_view bytes, std::string_view encoding) {
    auto codec = io::Codec::open(encoding);
    if (!codec) return codec.error();
    auto chars = codec.value().decode_all(bytes);
    if (!chars) return chars.error();
    return io::Codec::to_utf8(chars.value());
}

/// Last URL segment: "nltk:a/b.txt" -> "b.txt", "nltk:b.txt" -> "b.txt".
std::string default_filename(const vfs::ResourceUrl& url) {
    if (url.protocol == vfs::Protocol::File) {
        return fs::path(url.path).filename().string();
    }
    auto text = url.to_string();
    auto slash = text.rfind('/');
    if (slash != std::string::npos) return text.substr(slash + 1);
    auto colon = text.find(':');
    return colon == std::string::npos ? text : text.substr(colon + 1);
}

Result<void> copy_to_file(io::ByteStream& in, const fs::path& target) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error(ErrorKind::IoError,
                     fmt::format("Cannot create '{}'", target.string()));
    }
    while (true) {
        auto block = in.read(kCopyBlockSize);
        if (!block) return block.error();
        if (block.value().empty()) break;
        out.write(block.value().data(),
                  static_cast<std::streamsize>(block.value().size()));
        if (!out) {
            return Error(ErrorKind::IoError,
                         fmt::format("Write to '{}' failed", target.string()));
        }
    }
    return {};
}

Result<void> copy_to_gzip(io::ByteStream& in, const fs::path& target) {
    auto writer = io::BufferedCompressionWriter::open(target);
    if (!writer) return writer.error();
    while (true) {
        auto block = in.read(kCopyBlockSize);
        if (!block) return block.error();
        if (block.value().empty()) break;
        auto written = writer.value()->write(block.value());
        if (!written) return written;
    }
    return writer.value()->close();
}

} // namespace

Result<std::string> decode_text(std::string_view bytes,
                                const std::optional<std::string>& encoding) {
    if (encoding) return decode_as(bytes, *encoding);

    auto utf8 = decode_as(bytes, "utf-8");
    if (utf8 || !utf8.error().is(ErrorKind::DecodeError)) return utf8;
    spdlog::debug("Not valid UTF-8, decoding as Latin-1: {}", utf8.error().message);
    return decode_as(bytes, "latin-1");
}

Loader::Loader(SearchPath& search_path, ResourceCache& cache,
               const FormatRegistry& formats)
    : search_path_(search_path), cache_(cache), formats_(formats) {}

Result<ResourceValue> Loader::load(std::string_view url,
                                   const LoadOptions& options) {
    auto resource = vfs::normalize_resource_url(url);
    auto key = resource.to_string();

    std::string format = options.format;
    if (format == "auto") {
        auto inferred = formats_.infer(key);
        if (!inferred) {
            return Error(ErrorKind::UnknownFormat,
                         fmt::format("Could not determine format for {} based "
                                     "on its file extension; use the \"format\" "
                                     "argument to specify the format explicitly.",
                                     key));
        }
        format = *inferred;
    }

    const FormatInfo* info = formats_.find(format);
    if (!info) {
        return Error(ErrorKind::UnknownFormat,
                     fmt::format("Unknown format type: {}!", format));
    }

    auto level = options.verbose ? spdlog::level::info : spdlog::level::debug;

    if (options.cache) {
        if (auto cached = cache_.get(key, format)) {
            spdlog::log(level, "Using cached copy of {}", key);
            return std::move(*cached);
        }
    }

    spdlog::log(level, "Loading {}", key);

    const Parser* parser = nullptr;
    if (info->kind != FormatKind::Raw && format != "text") {
        parser = formats_.parser(format);
        if (!parser) {
            return Error(ErrorKind::ParserMissing,
                         fmt::format("No parser registered for format '{}'",
                                     format));
        }
    }

    auto stream = open(resource);
    if (!stream) return stream.error();
    auto bytes = stream.value()->read();
    stream.value()->close();
    if (!bytes) return bytes.error();

    ParseContext context{format, options.encoding, options.parser_options};

    Result<ResourceValue> value = ResourceValue{};
    if (info->kind == FormatKind::Raw) {
        value = ResourceValue(std::vector<char>(bytes.value().begin(),
                                                bytes.value().end()));
    } else if (info->kind == FormatKind::Binary) {
        value = (*parser)(bytes.value(), context);
    } else {
        auto text = decode_text(bytes.value(), options.encoding);
        if (!text) return text.error();
        if (parser) {
            value = (*parser)(text.value(), context);
        } else {
            value = ResourceValue(std::move(text.value()));
        }
    }
    if (!value) return value;

    if (options.cache) {
        cache_.insert(key, format, value.value());
    }
    return value;
}

Result<io::ByteStreamPtr> Loader::open(std::string_view url) {
    return open(vfs::normalize_resource_url(url));
}

Result<io::ByteStreamPtr> Loader::open(const vfs::ResourceUrl& url) {
    switch (url.protocol) {
    case vfs::Protocol::Nltk: {
        auto roots = search_path_.roots;
        roots.emplace_back();
        auto pointer = vfs::find(url.path, roots);
        if (!pointer) return pointer.error();
        return pointer.value()->open();
    }
    case vfs::Protocol::File: {
        auto pointer = vfs::find(url.path, {std::string()});
        if (!pointer) return pointer.error();
        return pointer.value()->open();
    }
    case vfs::Protocol::Http:
    case vfs::Protocol::Other:
        if (!url_opener_) {
            return Error(ErrorKind::UnsupportedProtocol,
                         fmt::format("No opener for '{}' URLs: {}", url.scheme,
                                     url.to_string()));
        }
        return url_opener_(url);
    }
    return Error(ErrorKind::UnsupportedProtocol, url.to_string());
}

Result<vfs::PathPointerPtr> Loader::find(std::string_view resource_name) const {
    return vfs::find(resource_name, search_path_.roots);
}

Result<fs::path> Loader::retrieve(std::string_view url,
                                  std::optional<fs::path> filename,
                                  bool compress) {
    auto resource = vfs::normalize_resource_url(url);

    fs::path target;
    if (filename) {
        target = *filename;
    } else {
        auto name = default_filename(resource);
        if (name.empty()) {
            return Error(ErrorKind::InvalidArgument,
                         fmt::format("Cannot derive a filename from {}",
                                     resource.to_string()));
        }
        target = compress ? name + ".gz" : name;
    }

    std::error_code ec;
    if (fs::exists(target, ec)) {
        return Error(ErrorKind::AlreadyExists,
                     fmt::format("File '{}' already exists!",
                                 fs::absolute(target, ec).string()));
    }

    spdlog::info("Retrieving {}, saving to {}", resource.to_string(),
                 target.string());

    auto stream = open(resource);
    if (!stream) return stream.error();

    auto copied = compress ? copy_to_gzip(*stream.value(), target)
                           : copy_to_file(*stream.value(), target);
    stream.value()->close();
    if (!copied) return copied.error();
    return target;
}

Result<std::vector<std::string>> Loader::show_cfg(std::string_view url,
                                                  std::string_view escape) {
    LoadOptions options;
    options.format = "text";
    options.cache = false;
    auto value = load(url, options);
    if (!value) return value.error();

    const auto& text = std::get<std::string>(value.value());
    auto codec = io::Codec::open("utf-8");
    if (!codec) return codec.error();
    auto chars = codec.value().decode_all(text);
    if (!chars) return chars.error();

    std::vector<std::string> lines;
    for (const auto& line : io::split_lines(chars.value(), false)) {
        if (line.empty()) continue;
        auto utf8 = io::Codec::to_utf8(line);
        if (!utf8) return utf8.error();
        if (utf8.value().compare(0, escape.size(), escape) == 0) continue;
        lines.push_back(std::move(utf8.value()));
    }
    return lines;
}

} // namespace lexis::data
