#pragma once

#include <string>
#include <vector>

namespace lexis::data {

/// Environment variable holding extra data roots, ':'-separated.
constexpr const char* kDataPathEnv = "NLTK_DATA";

/// Ordered list of roots (directories or zip archives) searched for
/// resources. Earlier roots win.
struct SearchPath {
    std::vector<std::string> roots;

    /// Roots from $NLTK_DATA, then ~/nltk_data, then the system locations.
    static SearchPath from_environment();

    /// The system locations only.
    static std::vector<std::string> system_roots();

    /// Insert `root` ahead of all existing roots.
    void prepend(std::string root);
};

} // namespace lexis::data
