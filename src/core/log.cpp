#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace lexis::log {

void init(const std::filesystem::path& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger =
        std::make_shared<spdlog::logger>("lexis", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(logger);
    spdlog::debug("lexis v0.1.0");
}

void set_verbose(bool verbose) {
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void shutdown() {
    spdlog::shutdown();
}

} // namespace lexis::log
