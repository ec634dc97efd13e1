/**
 * Sky Mesh Extractor - Batch Converter Implementation
 */

#include "skymesh/batch_converter.hpp"
#include "skymesh/files.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace skymesh {

static constexpr const char* TAG = "Batch";

size_t BatchSummary::succeeded() const {
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
                                             [](const ConversionRecord& r) { return r.success; }));
}

BatchConverter::BatchConverter(const AppConfig& config, const FlagTable& flags,
                               const Decompressor& decompressor, Logger& logger)
    : config_(config)
    , flags_(flags)
    , logger_(logger)
    , decoder_(config.decoder, decompressor, logger)
    , exporter_(ExportOptions{config.converter.export_uvs}) {
}

RawAsset BatchConverter::make_asset(const std::filesystem::path& path, std::vector<uint8_t> data) const {
    RawAsset asset;
    asset.data = std::move(data);
    asset.filename = path.string();

    auto it = flags_.find(asset.model_name());
    if (it != flags_.end()) {
        asset.flags = it->second;
    }
    return asset;
}

static void log_bounds(Logger& logger, const DecodedMesh& mesh) {
    if (mesh.vertices.empty() || !logger.is_enabled(LogLevel::Debug)) return;

    glm::vec3 lo = mesh.vertices.front();
    glm::vec3 hi = mesh.vertices.front();
    for (const auto& v : mesh.vertices) {
        lo = glm::min(lo, v);
        hi = glm::max(hi, v);
    }
    LOG_DEBUG(logger, TAG, std::fixed << std::setprecision(3)
              << "Bounds: X[" << lo.x << ", " << hi.x << "] Y[" << lo.y << ", " << hi.y
              << "] Z[" << lo.z << ", " << hi.z << "]");
}

ConversionRecord BatchConverter::convert_file(const std::filesystem::path& path) const {
    ConversionRecord record;
    record.file = path;
    auto start = std::chrono::steady_clock::now();

    auto finish = [&](ConversionRecord& r) -> ConversionRecord& {
        r.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return r;
    };

    auto data = read_file(path);
    if (!data) {
        record.error = data.error().full_message();
        return finish(record);
    }

    LOG_DEBUG(logger_, TAG, path.filename().string() << ": " << format_file_size(data->size()));

    RawAsset asset = make_asset(path, std::move(data.value()));
    auto report = decoder_.decode(asset);
    if (!report) {
        record.error = std::string(error_code_string(report.error().code)) + ": " +
                       report.error().message;
        return finish(record);
    }

    log_bounds(logger_, report->mesh);

    auto written = exporter_.save(report->mesh, config_.converter.output_dir, asset.model_name());
    if (!written) {
        record.error = written.error().full_message();
        return finish(record);
    }

    record.success = true;
    record.vertex_count = report->mesh.vertices.size();
    record.face_count = report->mesh.triangle_count();
    record.dropped_faces = report->sanitize.dropped_triangles;
    record.strategy = strategy_name(report->strategy);
    record.output = written.value();
    return finish(record);
}

BatchSummary BatchConverter::convert_all(const std::vector<std::filesystem::path>& files,
                                         std::function<bool(const std::string&, size_t, size_t)> callback) const {
    BatchSummary summary;
    const size_t total = files.size();

    for (size_t i = 0; i < total; i++) {
        const auto& path = files[i];
        if (callback && !callback(path.string(), i, total)) {
            LOG_WARNING(logger_, TAG, "Batch stopped after " << i << " of " << total << " files");
            break;
        }

        LOG_INFO(logger_, TAG, "[" << (i + 1) << "/" << total << "] " << path.filename().string());

        ConversionRecord record = convert_file(path);
        if (record.success) {
            LOG_INFO(logger_, TAG, "  OK: " << record.vertex_count << " vertices, "
                     << record.face_count << " faces, " << record.strategy << ", "
                     << std::fixed << std::setprecision(2) << record.seconds << "s");
            if (record.dropped_faces > 0) {
                LOG_INFO(logger_, TAG, "  Dropped " << record.dropped_faces << " degenerate faces");
            }
        } else {
            LOG_ERROR(logger_, TAG, "  FAILED: " << record.error << ", "
                      << std::fixed << std::setprecision(2) << record.seconds << "s");
        }
        summary.records.push_back(std::move(record));
    }

    return summary;
}

std::string BatchConverter::format_summary(const BatchSummary& summary) {
    std::ostringstream ss;
    const std::string rule(70, '=');

    ss << rule << "\n";
    ss << "Total: " << summary.total() << ", succeeded: " << summary.succeeded()
       << ", failed: " << summary.failed() << "\n";

    ss << std::fixed << std::setprecision(2);
    if (summary.succeeded() > 0) {
        ss << "\nSucceeded:\n";
        for (const auto& r : summary.records) {
            if (!r.success) continue;
            ss << "  " << r.file.string() << " vertices:" << r.vertex_count
               << " faces:" << r.face_count << " strategy:" << r.strategy
               << " time:" << r.seconds << "s\n";
        }
    }
    if (summary.failed() > 0) {
        ss << "\nFailed:\n";
        for (const auto& r : summary.records) {
            if (r.success) continue;
            ss << "  " << r.file.string() << " error:" << r.error
               << " time:" << r.seconds << "s\n";
        }
    }
    ss << rule << "\n";
    return ss.str();
}

Result<std::filesystem::path> BatchConverter::write_summary(const BatchSummary& summary) const {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif

    std::ostringstream name;
    name << "conversion_summary_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << ".txt";

    const auto path = config_.converter.output_dir / name.str();
    TRY(write_text_file(path, format_summary(summary)));
    return path;
}

} // namespace skymesh
