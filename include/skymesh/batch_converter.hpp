/**
 * Sky Mesh Extractor - Batch Converter
 *
 * Converts a list of .mesh files to OBJ, one at a time. A failing file is
 * recorded and the batch moves on.
 */

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "compression.hpp"
#include "mesh_decoder.hpp"
#include "obj_exporter.hpp"
#include "logging.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace skymesh {

/**
 * Outcome of converting one file.
 */
struct ConversionRecord {
    std::filesystem::path file;
    bool success = false;
    size_t vertex_count = 0;
    size_t face_count = 0;
    size_t dropped_faces = 0;
    std::string strategy;
    double seconds = 0.0;
    std::string error;
    std::filesystem::path output;
};

struct BatchSummary {
    std::vector<ConversionRecord> records;

    size_t total() const { return records.size(); }
    size_t succeeded() const;
    size_t failed() const { return total() - succeeded(); }
};

class BatchConverter {
public:
    /**
     * All references must outlive the converter.
     */
    BatchConverter(const AppConfig& config, const FlagTable& flags,
                   const Decompressor& decompressor, Logger& logger);

    /**
     * Read, decode and export one file. Never throws; failures land in the record.
     */
    ConversionRecord convert_file(const std::filesystem::path& path) const;

    /**
     * Convert every file in order. The callback receives (file, index, total)
     * before each file and may return false to stop early.
     */
    BatchSummary convert_all(const std::vector<std::filesystem::path>& files,
                             std::function<bool(const std::string&, size_t, size_t)> callback = nullptr) const;

    /**
     * Human-readable summary: totals, then successes and failures with details.
     */
    static std::string format_summary(const BatchSummary& summary);

    /**
     * Write format_summary() to <output_dir>/conversion_summary_<YYYYMMDD_HHMMSS>.txt.
     */
    Result<std::filesystem::path> write_summary(const BatchSummary& summary) const;

    /**
     * Build the asset for a file, attaching its flag table entry if any.
     */
    RawAsset make_asset(const std::filesystem::path& path, std::vector<uint8_t> data) const;

private:
    const AppConfig& config_;
    const FlagTable& flags_;
    Logger& logger_;
    MeshDecoder decoder_;
    ObjExporter exporter_;
};

} // namespace skymesh
