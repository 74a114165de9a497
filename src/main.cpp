#include "core/log.hpp"
#include "core/types.hpp"
#include "data/formats.hpp"
#include "data/loader.hpp"
#include "data/resource_cache.hpp"
#include "data/search_path.hpp"
#include "vfs/resolver.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>
#include <vector>

static void print_usage() {
    std::cout << "lexis v0.1.0\n"
              << "Locate and load linguistic data resources\n\n"
              << "Usage:\n"
              << "  lexis [options] <command> [args]\n\n"
              << "Options:\n"
              << "  --data-dir <path>  Search <path> before the default roots "
                 "(repeatable)\n"
              << "  --verbose          Debug logging\n"
              << "  --log <file>       Also write the log to <file>\n"
              << "  --help             Show this help message\n\n"
              << "Commands:\n"
              << "  find <name>                      Print where <name> resolves to\n"
              << "  cat <url> [--encoding <enc>]     Print a resource as text\n"
              << "  retrieve <url> [<file>] [--gzip] Copy a resource to a local "
                 "file\n"
              << "  show-cfg <url>                   Print a grammar without "
                 "comments\n"
              << "  formats                          List the known formats\n";
}

struct CliConfig {
    std::vector<std::string> data_dirs;
    bool verbose = false;
    lexis::fs::path log_file;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> encoding;
    bool gzip = false;
};

static std::optional<CliConfig> parse_args(int argc, char* argv[]) {
    CliConfig config;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--data-dir") == 0 && i + 1 < argc) {
            config.data_dirs.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--encoding") == 0 && i + 1 < argc) {
            config.encoding = argv[++i];
        } else if (std::strcmp(argv[i], "--gzip") == 0) {
            config.gzip = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return std::nullopt;
        } else if (config.command.empty()) {
            config.command = argv[i];
        } else {
            config.args.push_back(argv[i]);
        }
    }

    if (config.command.empty()) return std::nullopt;
    return config;
}

static int report(const lexis::Error& error) {
    if (error.is(lexis::ErrorKind::ResourceNotFound)) {
        std::cerr << lexis::vfs::format_not_found_message(error);
    } else {
        spdlog::error("{}: {}", lexis::error_kind_name(error.kind), error.message);
    }
    return 1;
}

static int cmd_find(lexis::data::Loader& loader, const CliConfig& config) {
    if (config.args.size() != 1) {
        print_usage();
        return 2;
    }
    auto pointer = loader.find(config.args[0]);
    if (!pointer) return report(pointer.error());
    std::cout << pointer.value()->to_string() << "\n";
    spdlog::debug("{}", pointer.value()->describe());
    return 0;
}

static int cmd_cat(lexis::data::Loader& loader, const CliConfig& config) {
    if (config.args.size() != 1) {
        print_usage();
        return 2;
    }
    lexis::data::LoadOptions options;
    options.format = "text";
    options.cache = false;
    options.encoding = config.encoding;
    options.verbose = config.verbose;

    auto value = loader.load(config.args[0], options);
    if (!value) return report(value.error());
    std::cout << std::get<std::string>(value.value());
    return 0;
}

static int cmd_retrieve(lexis::data::Loader& loader, const CliConfig& config) {
    if (config.args.empty() || config.args.size() > 2) {
        print_usage();
        return 2;
    }
    std::optional<lexis::fs::path> filename;
    if (config.args.size() == 2) filename = config.args[1];

    auto written = loader.retrieve(config.args[0], filename, config.gzip);
    if (!written) return report(written.error());
    std::cout << written.value().string() << "\n";
    return 0;
}

static int cmd_show_cfg(lexis::data::Loader& loader, const CliConfig& config) {
    if (config.args.size() != 1) {
        print_usage();
        return 2;
    }
    auto lines = loader.show_cfg(config.args[0]);
    if (!lines) return report(lines.error());
    for (const auto& line : lines.value()) {
        std::cout << line << "\n";
    }
    return 0;
}

static int cmd_formats(const lexis::data::FormatRegistry& formats) {
    for (const auto& info : formats.formats()) {
        std::cout << "  " << info.name;
        for (size_t pad = info.name.size(); pad < 8; pad++) std::cout << ' ';
        std::cout << info.description << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);
    if (!config) {
        print_usage();
        return 2;
    }

    lexis::log::init(config->log_file);
    lexis::log::set_verbose(config->verbose);

    auto search_path = lexis::data::SearchPath::from_environment();
    for (auto it = config->data_dirs.rbegin(); it != config->data_dirs.rend(); ++it) {
        search_path.prepend(*it);
    }

    lexis::data::ResourceCache cache;
    lexis::data::FormatRegistry formats;
    lexis::data::Loader loader(search_path, cache, formats);

    int rc = 2;
    if (config->command == "find") {
        rc = cmd_find(loader, *config);
    } else if (config->command == "cat") {
        rc = cmd_cat(loader, *config);
    } else if (config->command == "retrieve") {
        rc = cmd_retrieve(loader, *config);
    } else if (config->command == "show-cfg") {
        rc = cmd_show_cfg(loader, *config);
    } else if (config->command == "formats") {
        rc = cmd_formats(formats);
    } else {
        std::cerr << "Unknown command: " << config->command << "\n";
        print_usage();
    }

    lexis::log::shutdown();
    return rc;
}
