#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace roleicon::core {

constexpr const char* k_config_filename = "roleicon.cfg";
constexpr const char* k_user_config_relpath = ".config/roleicon/roleicon.cfg";

struct ToolConfig {
    std::optional<std::filesystem::path> vtfcmd_path;
    std::optional<std::filesystem::path> template_dir;
};

// key = value lines, '#' and ';' start comments. Relative paths are resolved
// against `base_dir`.
bool parse_tool_config(std::istream& input,
                       const std::filesystem::path& base_dir,
                       ToolConfig& out,
                       std::string& error);

bool load_tool_config_from_file(const std::filesystem::path& path, ToolConfig& out, std::string& error);

std::optional<std::filesystem::path> resolve_user_config_path();

// Directory holding the running binary. Uses /proc/self/exe so a binary found
// through PATH still resolves to its install directory; falls back to
// `argv0` relative to the current directory.
std::filesystem::path resolve_executable_dir(const char* argv0);

// Candidate config files in lookup order: user config, then next to the
// executable.
std::vector<std::filesystem::path> default_config_candidates(const std::filesystem::path& exec_dir);

} // namespace roleicon::core
