/**
 * Sky Mesh Extractor - File Utilities Implementation
 */

#include "skymesh/files.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace skymesh {

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::file_not_found(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open file", path.string());
    }

    file.seekg(0, std::ios::end);
    auto end = file.tellg();
    file.seekg(0, std::ios::beg);
    if (end < 0) {
        return Error::io_error("Cannot determine file size", path.string());
    }

    std::vector<uint8_t> data(static_cast<size_t>(end));
    if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
        return Error::io_error("Short read", path.string());
    }
    return data;
}

Result<void> write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error::io_error("Cannot create directory: " + ec.message(), path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open file for writing", path.string());
    }
    file << text;
    file.close();
    if (!file) {
        return Error::io_error("Write failed", path.string());
    }
    return Result<void>::success();
}

std::string get_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir, const std::string& extension) {
    std::vector<std::filesystem::path> result;

    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && get_extension(it->path()) == extension) {
            result.push_back(it->path());
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::string format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%zu B", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

} // namespace skymesh
