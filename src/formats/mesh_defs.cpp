/**
 * Sky Mesh Extractor - MeshDefs.lua Loader Implementation
 */

#include "skymesh/mesh_defs.hpp"
#include <regex>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace skymesh {

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

static FlagValue parse_value(const std::string& raw) {
    std::string lower = raw;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "true") return true;
    if (lower == "false") return false;

    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return raw.substr(1, raw.size() - 2);
    }

    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), number);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
        return number;
    }
    return raw;
}

static bool truthy(const FlagValue& value) {
    if (auto b = std::get_if<bool>(&value)) return *b;
    if (auto i = std::get_if<int64_t>(&value)) return *i != 0;
    return false;
}

FlagTable parse_mesh_defs(const std::string& text) {
    FlagTable table;

    static const std::regex block_re(R"(resource\s+"Mesh"\s+"([^"]+)"\s*\{([^}]+)\})");

    for (std::sregex_iterator it(text.begin(), text.end(), block_re), end; it != end; ++it) {
        const std::string name = (*it)[1].str();
        const std::string body = (*it)[2].str();

        MeshFlags flags;
        std::stringstream entries(body);
        std::string entry;
        while (std::getline(entries, entry, ',')) {
            size_t eq = entry.find('=');
            if (eq == std::string::npos) continue;

            std::string key = trim(entry.substr(0, eq));
            std::string raw = trim(entry.substr(eq + 1));
            if (key.empty()) continue;

            FlagValue value = parse_value(raw);
            if (key == "compressPositions") {
                flags.compress_positions = truthy(value);
            } else if (key == "compressUvs") {
                flags.compress_uvs = truthy(value);
            } else {
                flags.extra[key] = std::move(value);
            }
        }

        table[name] = std::move(flags);
    }

    return table;
}

Result<FlagTable> load_mesh_defs(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return FlagTable{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open mesh definitions", path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_mesh_defs(ss.str());
}

} // namespace skymesh
