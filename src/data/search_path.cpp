#include "data/search_path.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string_view>

namespace lexis::data {

std::vector<std::string> SearchPath::system_roots() {
    return {
        "/usr/share/nltk_data",
        "/usr/local/share/nltk_data",
        "/usr/lib/nltk_data",
        "/usr/local/lib/nltk_data",
    };
}

SearchPath SearchPath::from_environment() {
    SearchPath search;

    if (const char* env = std::getenv(kDataPathEnv)) {
        std::string_view value(env);
        size_t start = 0;
        while (start <= value.size()) {
            auto colon = value.find(':', start);
            auto end = colon == std::string_view::npos ? value.size() : colon;
            if (end > start) search.roots.emplace_back(value.substr(start, end - start));
            if (colon == std::string_view::npos) break;
            start = colon + 1;
        }
    }

    if (const char* home = std::getenv("HOME"); home && *home) {
        search.roots.push_back(std::string(home) + "/nltk_data");
    }

    for (auto& root : system_roots()) {
        search.roots.push_back(std::move(root));
    }

    spdlog::debug("Search path: {} roots", search.roots.size());
    return search;
}

void SearchPath::prepend(std::string root) {
    roots.insert(roots.begin(), std::move(root));
}

} // namespace lexis::data
