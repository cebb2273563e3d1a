#include "keepsake/core/ListIndex.hh"

#include <algorithm>

namespace keepsake {

std::vector<std::string_view> tokenizeListResponse(std::string_view data) {
    std::vector<std::string_view> tokens;
    size_t start = 0;
    while (true) {
        size_t quote = data.find('"', start);
        if (quote == std::string_view::npos) {
            tokens.push_back(data.substr(start));
            break;
        }
        tokens.push_back(data.substr(start, quote - start));
        start = quote + 1;
    }
    return tokens;
}

bool listContainsKey(std::string_view data, std::string_view key) {
    if (key.empty()) {
        return false;
    }
    auto tokens = tokenizeListResponse(data);
    return std::find(tokens.begin(), tokens.end(), key) != tokens.end();
}

} // namespace keepsake
