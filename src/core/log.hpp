#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

namespace lexis::log {

/// Initialize logging with a console sink, plus a file sink when
/// `log_file` is non-empty.
void init(const std::filesystem::path& log_file = {});

/// Switch the default logger between info and debug level.
void set_verbose(bool verbose);

/// Flush and shutdown logging.
void shutdown();

} // namespace lexis::log
