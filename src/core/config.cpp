/**
 * Sky Mesh Extractor - Configuration Implementation
 */

#include "skymesh/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace skymesh {

std::vector<CompressedCandidate> default_compressed_candidates() {
    return {
        {0x52, 0x56, 0x5A, 4},
        {0x4E, 0x51, 0x56, 2},
        {0x4E, 0x52, 0x56, 2},
        {0x4E, 0x50, 0x56, 2},
        {0x4C, 0x50, 0x56, 2},
    };
}

std::vector<HeuristicCandidate> default_heuristic_candidates() {
    return {
        {0x74, 0x78, 0xB3, 12, 8},
        {0x70, 0x74, 0xB3, 12, 8},
        {0x78, 0x7C, 0xB3, 12, 8},
        {0x80, 0x84, 0xB3, 12, 8},
    };
}

std::optional<DecodeMode> parse_decode_mode(std::string_view name) {
    for (DecodeMode mode : {DecodeMode::Auto, DecodeMode::Container, DecodeMode::Legacy}) {
        if (name == decode_mode_string(mode)) return mode;
    }
    return std::nullopt;
}

static Result<void> apply_decoder(const nlohmann::json& j, DecoderConfig& cfg) {
    if (j.contains("min_header_size")) cfg.min_header_size = j["min_header_size"].get<size_t>();
    if (j.contains("max_vertex_count")) cfg.max_vertex_count = j["max_vertex_count"].get<uint32_t>();
    if (j.contains("max_index_count")) cfg.max_index_count = j["max_index_count"].get<uint32_t>();
    if (j.contains("max_compressed_size")) cfg.max_compressed_size = j["max_compressed_size"].get<uint32_t>();
    if (j.contains("max_uncompressed_size")) cfg.max_uncompressed_size = j["max_uncompressed_size"].get<uint32_t>();
    if (j.contains("index_scan_step")) cfg.index_scan.step = j["index_scan_step"].get<size_t>();
    if (j.contains("index_scan_max_windows")) cfg.index_scan.max_windows = j["index_scan_max_windows"].get<size_t>();
    if (j.contains("mode")) {
        auto name = j["mode"].get<std::string>();
        auto mode = parse_decode_mode(name);
        if (!mode) {
            return Error::config_error("Unknown decoder mode '" + name + "'");
        }
        cfg.mode = *mode;
    }
    if (j.contains("compression_keywords")) {
        cfg.compression_keywords = j["compression_keywords"].get<std::vector<std::string>>();
    }

    if (j.contains("compressed_candidates")) {
        std::vector<CompressedCandidate> list;
        for (const auto& c : j["compressed_candidates"]) {
            CompressedCandidate cand;
            cand.compressed_offset = c.at("compressed_offset").get<size_t>();
            cand.uncompressed_offset = c.at("uncompressed_offset").get<size_t>();
            cand.data_offset = c.at("data_offset").get<size_t>();
            cand.width = c.value("width", 4u);
            if (cand.width != 2 && cand.width != 4) {
                return Error::config_error("compressed_candidates: width must be 2 or 4");
            }
            list.push_back(cand);
        }
        cfg.compressed_candidates = std::move(list);
    }

    if (j.contains("heuristic_candidates")) {
        std::vector<HeuristicCandidate> list;
        for (const auto& c : j["heuristic_candidates"]) {
            HeuristicCandidate cand;
            cand.shared_offset = c.at("shared_offset").get<size_t>();
            cand.total_offset = c.at("total_offset").get<size_t>();
            cand.data_offset = c.at("data_offset").get<size_t>();
            cand.vertex_stride = c.value("vertex_stride", size_t{12});
            cand.uv_stride = c.value("uv_stride", size_t{8});
            if (cand.vertex_stride < 12 || cand.uv_stride < 8) {
                return Error::config_error("heuristic_candidates: strides must hold f32 xyz / f32 uv");
            }
            list.push_back(cand);
        }
        cfg.heuristic_candidates = std::move(list);
    }

    return Result<void>::success();
}

static Result<void> apply_converter(const nlohmann::json& j, ConverterConfig& cfg) {
    if (j.contains("output_dir")) cfg.output_dir = j["output_dir"].get<std::string>();
    if (j.contains("export_uvs")) cfg.export_uvs = j["export_uvs"].get<bool>();
    if (j.contains("write_summary")) cfg.write_summary = j["write_summary"].get<bool>();
    if (j.contains("log_file")) cfg.log_file = j["log_file"].get<std::string>();
    if (j.contains("mesh_defs")) cfg.mesh_defs = j["mesh_defs"].get<std::string>();
    if (j.contains("log_level")) {
        auto name = j["log_level"].get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return Error::config_error("Unknown log_level '" + name + "'");
        }
        cfg.log_level = *level;
    }
    return Result<void>::success();
}

Result<void> apply_config_json(const std::string& text, AppConfig& config) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Error::config_error("Top-level JSON value must be an object");
        }

        // Work on a copy so a failure leaves the caller's config untouched
        AppConfig updated = config;
        if (j.contains("decoder")) {
            TRY(apply_decoder(j["decoder"], updated.decoder));
        }
        if (j.contains("converter")) {
            TRY(apply_converter(j["converter"], updated.converter));
        }
        config = std::move(updated);
        return Result<void>::success();
    } catch (const nlohmann::json::exception& e) {
        return Error::config_error(e.what());
    }
}

Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error::file_not_found(path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    AppConfig config;
    auto applied = apply_config_json(ss.str(), config);
    if (!applied) {
        return Error::config_error(applied.error().message, path.string());
    }
    return config;
}

std::string config_to_json(const AppConfig& config) {
    nlohmann::json j;

    const auto& d = config.decoder;
    j["decoder"]["min_header_size"] = d.min_header_size;
    j["decoder"]["max_vertex_count"] = d.max_vertex_count;
    j["decoder"]["max_index_count"] = d.max_index_count;
    j["decoder"]["max_compressed_size"] = d.max_compressed_size;
    j["decoder"]["max_uncompressed_size"] = d.max_uncompressed_size;
    j["decoder"]["mode"] = decode_mode_string(d.mode);
    j["decoder"]["index_scan_step"] = d.index_scan.step;
    j["decoder"]["index_scan_max_windows"] = d.index_scan.max_windows;
    j["decoder"]["compression_keywords"] = d.compression_keywords;

    auto& cands = j["decoder"]["compressed_candidates"] = nlohmann::json::array();
    for (const auto& c : d.compressed_candidates) {
        cands.push_back({
            {"compressed_offset", c.compressed_offset},
            {"uncompressed_offset", c.uncompressed_offset},
            {"data_offset", c.data_offset},
            {"width", c.width}
        });
    }

    auto& heur = j["decoder"]["heuristic_candidates"] = nlohmann::json::array();
    for (const auto& c : d.heuristic_candidates) {
        heur.push_back({
            {"shared_offset", c.shared_offset},
            {"total_offset", c.total_offset},
            {"data_offset", c.data_offset},
            {"vertex_stride", c.vertex_stride},
            {"uv_stride", c.uv_stride}
        });
    }

    const auto& c = config.converter;
    j["converter"]["output_dir"] = c.output_dir.string();
    j["converter"]["export_uvs"] = c.export_uvs;
    j["converter"]["write_summary"] = c.write_summary;
    j["converter"]["log_level"] = log_level_string(c.log_level);
    j["converter"]["log_file"] = c.log_file.string();
    j["converter"]["mesh_defs"] = c.mesh_defs.string();

    return j.dump(2);
}

} // namespace skymesh
