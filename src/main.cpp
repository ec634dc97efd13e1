/**
 * Sky Mesh Extractor - Entry Point
 *
 * Batch and interactive CLI:
 *   skymesh_cli <file.mesh>... [-o <dir>] [options]    Convert the given files
 *   skymesh_cli [-o <dir>] [options]                   Pick *.mesh files interactively
 *   skymesh_cli --help
 */

#include "skymesh/batch_converter.hpp"
#include "skymesh/config.hpp"
#include "skymesh/compression.hpp"
#include "skymesh/files.hpp"
#include "skymesh/logging.hpp"
#include "skymesh/mesh_defs.hpp"
#include "skymesh/selection.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr const char* TAG = "App";

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool dump_config = false;
    std::vector<std::string> files;
    std::string output_dir;
    std::string config_path;
    std::string defs_path;
    std::string log_path;
    bool no_uv = false;
    bool debug_logging = false;
    std::optional<size_t> max_iter;
    std::optional<skymesh::DecodeMode> mode;
    std::string error;
};

void print_help() {
    std::cout << R"(
Sky Mesh Extractor - .mesh to OBJ converter

Usage:
  skymesh_cli <file.mesh>... [options]   Convert the given files
  skymesh_cli [options]                  List *.mesh in the current directory and pick interactively
  skymesh_cli --help                     Show this help

Options:
  --help, -h             Show this help message
  --output, -o <dir>     Output directory (default: current directory)
  --config, -c <file>    JSON configuration file
  --defs <file>          MeshDefs.lua flag table (default: ./MeshDefs.lua, then next to the executable)
  --no-uv                Do not write UV coordinates
  --max-iter <n>         Maximum index-search windows per attempt
  --mode <mode>          auto (default), fmt (fmt_mesh container only) or legacy (skip fmt_mesh)
  --debug, -d            Enable debug logging
  --log <file>           Also write the log to a file
  --dump-config          Print the effective configuration as JSON and exit

Interactive selection:
  1 2 3    1-5    1,2,3    all    q (quit)

Exit codes:
  0  every file converted
  1  usage or configuration error
  2  at least one file failed

Examples:
  skymesh_cli ZipPos_Rock01.mesh Tree.mesh -o ./obj
  skymesh_cli --debug --log convert.log -o ./obj
)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto need_value = [&](int& i, const std::string& arg, std::string& out) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else {
            args.error = "Missing value for " + arg;
        }
    };

    for (int i = 1; i < argc && args.error.empty(); i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--output" || arg == "-o") {
            need_value(i, arg, args.output_dir);
        }
        else if (arg == "--config" || arg == "-c") {
            need_value(i, arg, args.config_path);
        }
        else if (arg == "--defs") {
            need_value(i, arg, args.defs_path);
        }
        else if (arg == "--log") {
            need_value(i, arg, args.log_path);
        }
        else if (arg == "--max-iter") {
            std::string value;
            need_value(i, arg, value);
            if (!args.error.empty()) break;

            size_t n = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
            if (ec != std::errc() || ptr != value.data() + value.size() || n == 0) {
                args.error = "Invalid --max-iter value '" + value + "'";
            } else {
                args.max_iter = n;
            }
        }
        else if (arg == "--mode") {
            std::string value;
            need_value(i, arg, value);
            if (!args.error.empty()) break;

            args.mode = skymesh::parse_decode_mode(value);
            if (!args.mode) {
                args.error = "Invalid --mode value '" + value + "'";
            }
        }
        else if (arg == "--no-uv") {
            args.no_uv = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else if (arg == "--dump-config") {
            args.dump_config = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            args.error = "Unknown option " + arg;
        }
        else {
            args.files.push_back(arg);
        }
    }

    return args;
}

/**
 * --defs, else ./MeshDefs.lua, else MeshDefs.lua beside the executable.
 */
skymesh::FlagTable load_flag_table(const skymesh::AppConfig& config, const char* argv0,
                                   skymesh::Logger& logger) {
    std::vector<fs::path> candidates;
    if (!config.converter.mesh_defs.empty()) {
        candidates.push_back(config.converter.mesh_defs);
    } else {
        candidates.push_back("MeshDefs.lua");
        std::error_code ec;
        auto exe = fs::absolute(argv0, ec);
        if (!ec) {
            candidates.push_back(exe.parent_path() / "MeshDefs.lua");
        }
    }

    for (const auto& path : candidates) {
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;

        auto table = skymesh::load_mesh_defs(path);
        if (!table) {
            LOG_WARNING(logger, TAG, "Ignoring mesh definitions: " << table.error().full_message());
            continue;
        }
        LOG_INFO(logger, TAG, "Loaded " << path.string() << " (" << table->size() << " entries)");
        return table.value();
    }

    if (!config.converter.mesh_defs.empty()) {
        LOG_WARNING(logger, TAG, "Mesh definitions not found: " << config.converter.mesh_defs.string());
    }
    return {};
}

/**
 * List *.mesh in the working directory and read a selection from stdin.
 * Returns an empty list when the user quits.
 */
std::vector<fs::path> select_interactively(skymesh::Logger& logger) {
    auto all_files = skymesh::list_files(".", ".mesh");
    if (all_files.empty()) {
        std::cout << "No .mesh files in the current directory.\n";
        return {};
    }

    while (true) {
        std::cout << "\nFound .mesh files:\n";
        for (size_t i = 0; i < all_files.size(); i++) {
            std::cout << (i + 1) << ". " << all_files[i].filename().string() << "\n";
        }
        std::cout << "\nSelect files (1 2 3, 1-5, 1,2,3 or all), q to quit: " << std::flush;

        std::string line;
        if (!std::getline(std::cin, line)) {
            return {};
        }

        auto selection = skymesh::parse_selection(line, all_files.size());
        if (selection.quit) {
            return {};
        }
        for (const auto& token : selection.rejected) {
            LOG_WARNING(logger, TAG, "Ignoring selection '" << token << "'");
        }
        if (selection.indices.empty()) {
            std::cout << "No valid files selected, try again.\n";
            continue;
        }

        std::vector<fs::path> chosen;
        for (size_t idx : selection.indices) {
            chosen.push_back(all_files[idx]);
        }
        std::cout << "Selected " << chosen.size() << " file(s).\n";
        return chosen;
    }
}

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        print_help();
        return 1;
    }
    if (args.show_help) {
        print_help();
        return 0;
    }

    skymesh::AppConfig config;
    if (!args.config_path.empty()) {
        auto loaded = skymesh::load_config(args.config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().full_message() << "\n";
            return 1;
        }
        config = std::move(loaded.value());
    }

    // Command-line options override the config file
    if (!args.output_dir.empty()) config.converter.output_dir = args.output_dir;
    if (!args.defs_path.empty()) config.converter.mesh_defs = args.defs_path;
    if (!args.log_path.empty()) config.converter.log_file = args.log_path;
    if (args.no_uv) config.converter.export_uvs = false;
    if (args.debug_logging) config.converter.log_level = skymesh::LogLevel::Debug;
    if (args.max_iter) config.decoder.index_scan.max_windows = *args.max_iter;
    if (args.mode) config.decoder.mode = *args.mode;

    if (args.dump_config) {
        std::cout << skymesh::config_to_json(config) << std::endl;
        return 0;
    }

    skymesh::Logger logger(config.converter.log_level, true);
    if (!config.converter.log_file.empty() && !logger.set_file(config.converter.log_file)) {
        std::cerr << "Warning: cannot open log file " << config.converter.log_file.string() << "\n";
    }
    LOG_DEBUG(logger, TAG, "Debug logging enabled");

    skymesh::FlagTable flags = load_flag_table(config, argv[0], logger);

    std::vector<fs::path> files;
    if (!args.files.empty()) {
        for (const auto& f : args.files) {
            std::error_code ec;
            if (fs::is_regular_file(f, ec)) {
                files.emplace_back(f);
            } else {
                LOG_WARNING(logger, TAG, "Skipping missing file: " << f);
            }
        }
        if (files.empty()) {
            std::cerr << "Error: no valid input files\n";
            return 1;
        }
    } else {
        files = select_interactively(logger);
        if (files.empty()) {
            return 0;
        }
        if (args.output_dir.empty()) {
            std::cout << "Output directory (default: " << config.converter.output_dir.string() << "): "
                      << std::flush;
            std::string line;
            if (std::getline(std::cin, line) && !line.empty()) {
                config.converter.output_dir = line;
            }
        }
    }

    skymesh::DefaultDecompressor decompressor;
    skymesh::BatchConverter converter(config, flags, decompressor, logger);

    auto summary = converter.convert_all(files);
    std::cout << "\n" << skymesh::BatchConverter::format_summary(summary);

    if (config.converter.write_summary) {
        auto written = converter.write_summary(summary);
        if (written) {
            LOG_INFO(logger, TAG, "Summary saved to " << written->string());
        } else {
            LOG_ERROR(logger, TAG, "Cannot save summary: " << written.error().full_message());
        }
    }

    return summary.failed() > 0 ? 2 : 0;
}
