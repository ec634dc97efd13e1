/**
 * Sky Mesh Extractor - File utilities
 */

#pragma once

#include "result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace skymesh {

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

/**
 * Write text to file, creating parent directories.
 */
Result<void> write_text_file(const std::filesystem::path& path, const std::string& text);

/**
 * Get file extension (lowercase, with dot).
 */
std::string get_extension(const std::filesystem::path& path);

/**
 * Regular files in dir with the given extension, sorted by name. Not recursive.
 */
std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir, const std::string& extension);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace skymesh
