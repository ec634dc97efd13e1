/**
 * Sky Mesh Extractor - Selection Parsing Implementation
 */

#include "skymesh/selection.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace skymesh {

static std::optional<size_t> parse_number(const std::string& s) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

static std::vector<std::string> split_tokens(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : input) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) tokens.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

Selection parse_selection(const std::string& input, size_t count) {
    Selection selection;

    std::string lower = input;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    auto tokens = split_tokens(lower);

    if (tokens.size() == 1 && tokens[0] == "q") {
        selection.quit = true;
        return selection;
    }
    if (tokens.size() == 1 && tokens[0] == "all") {
        for (size_t i = 0; i < count; i++) {
            selection.indices.push_back(i);
        }
        return selection;
    }

    for (const auto& token : tokens) {
        size_t dash = token.find('-');
        if (dash != std::string::npos) {
            auto first = parse_number(token.substr(0, dash));
            auto last = parse_number(token.substr(dash + 1));
            if (!first || !last || *first < 1 || *last > count || *first > *last) {
                selection.rejected.push_back(token);
                continue;
            }
            for (size_t i = *first; i <= *last; i++) {
                selection.indices.push_back(i - 1);
            }
        } else {
            auto number = parse_number(token);
            if (!number || *number < 1 || *number > count) {
                selection.rejected.push_back(token);
                continue;
            }
            selection.indices.push_back(*number - 1);
        }
    }

    std::sort(selection.indices.begin(), selection.indices.end());
    selection.indices.erase(std::unique(selection.indices.begin(), selection.indices.end()),
                            selection.indices.end());
    return selection;
}

} // namespace skymesh
