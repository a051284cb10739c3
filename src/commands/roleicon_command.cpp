// roleicon_command.cpp
// MIT License (c) 2026 Pedro

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
namespace fs = std::filesystem;

#include "commands/roleicon_command.h"
#include "core/cli_parse.h"
#include "core/descriptors.h"
#include "core/png_set.h"
#include "core/process_runner.h"
#include "core/tool_config.h"
#include "core/vtf_convert.h"

namespace {
using roleicon::core::to_quoted;

constexpr const char* k_default_output_root = "RoleAddon";
constexpr const char* k_converted_subdir = "converted";

struct Config {
    fs::path image_path;
    std::string name_raw;
    std::string name_short;
    fs::path output_root = k_default_output_root;
    fs::path config_path;
    bool skip_vtf = false;
};

void print_usage() {
    std::cout << "Usage: roleicon --image PATH --nameraw NAME --nameshort NS [OPTIONS]\n"
              << "\n"
              << "Generate TTT role icons, sprites and .vmt materials from one image.\n"
              << "Files are written to <out>/converted/<nameshort>/.\n"
              << "\n"
              << "Options:\n"
              << "  --image PATH       Source icon image (required)\n"
              << "  --nameraw NAME     Display name of the role (required)\n"
              << "  --nameshort NS     Lowercase short name used in file names (required)\n"
              << "  --out DIR          Output root directory (default: " << k_default_output_root << ")\n"
              << "  --no-vtf           Skip VTFCmd conversion\n"
              << "  --config PATH      Read settings from PATH instead of the default lookup\n"
              << "  --help, -h         Show this help message\n";
}

bool load_tool_config(const Config& config,
                      const fs::path& exec_dir,
                      roleicon::core::ToolConfig& out) {
    std::string error;
    if (!config.config_path.empty()) {
        if (!roleicon::core::load_tool_config_from_file(config.config_path, out, error)) {
            std::cerr << "Error: Failed to load config (" << config.config_path << "): " << error << "\n";
            return false;
        }
        return true;
    }

    for (const fs::path& candidate : roleicon::core::default_config_candidates(exec_dir)) {
        std::error_code ec;
        const bool exists = fs::exists(candidate, ec);
        if (ec || !exists) {
            continue;
        }
        if (!roleicon::core::load_tool_config_from_file(candidate, out, error)) {
            std::cerr << "Error: Failed to load config (" << candidate << "): " << error << "\n";
            return false;
        }
        break;
    }
    return true;
}

} // namespace

int run_roleicon(int argc, char** argv) {
    Config config;
    bool has_image = false;
    bool has_name_raw = false;
    bool has_name_short = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--no-vtf") {
            config.skip_vtf = true;
        } else if (arg == "--image" || arg == "--nameraw" || arg == "--nameshort"
                   || arg == "--out" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << "\n";
                print_usage();
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--image") {
                config.image_path = value;
                has_image = true;
            } else if (arg == "--nameraw") {
                config.name_raw = value;
                has_name_raw = true;
            } else if (arg == "--nameshort") {
                config.name_short = value;
                has_name_short = true;
            } else if (arg == "--out") {
                config.output_root = value;
            } else {
                config.config_path = value;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    if (!has_image || !has_name_raw || !has_name_short) {
        std::cerr << "Error: --image, --nameraw and --nameshort are required\n";
        print_usage();
        return 1;
    }

    if (!roleicon::core::is_lowercase_name(config.name_short)) {
        std::cerr << "Error: nameshort must be lowercase\n";
        return 1;
    }

    const fs::path exec_dir = roleicon::core::resolve_executable_dir(argc > 0 ? argv[0] : nullptr);
    roleicon::core::ToolConfig tool_config;
    if (!load_tool_config(config, exec_dir, tool_config)) {
        return 1;
    }

    const fs::path output_dir = config.output_root / k_converted_subdir / config.name_short;
    roleicon::core::PngSetRequest request{
        config.image_path,
        config.name_short,
        output_dir,
        tool_config.template_dir.value_or(exec_dir),
    };

    std::cout << "Generating role assets for " << to_quoted(config.name_raw)
              << " in " << to_quoted(output_dir.string()) << "...\n";

    std::vector<roleicon::core::GeneratedPng> generated;
    std::string error;
    if (!roleicon::core::create_png_set(request, generated, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    for (const auto& png : generated) {
        std::cout << "Wrote " << png.path.filename().string() << " (" << png.size << "x" << png.size
                  << (png.from_template ? ", template" : "") << ")\n";
    }

    roleicon::core::PosixProcessRunner runner;
    roleicon::core::convert_format(output_dir,
                                   config.name_short,
                                   config.skip_vtf,
                                   tool_config.vtfcmd_path.value_or(fs::path(roleicon::core::k_default_vtfcmd_path)),
                                   runner);

    std::vector<fs::path> descriptors;
    if (!roleicon::core::generate_descriptors(output_dir, config.name_short, descriptors, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    for (const fs::path& path : descriptors) {
        std::cout << "Wrote " << path.filename().string() << "\n";
    }

    return 0;
}
