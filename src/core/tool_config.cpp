#include "tool_config.h"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include "cli_parse.h"

namespace fs = std::filesystem;

namespace roleicon::core {

namespace {

fs::path resolve_against(const fs::path& base_dir, const std::string& value) {
    fs::path path(value);
    if (path.is_relative() && !base_dir.empty()) {
        path = base_dir / path;
    }
    return path.lexically_normal();
}

} // namespace

bool parse_tool_config(std::istream& input, const fs::path& base_dir, ToolConfig& out, std::string& error) {
    out = ToolConfig{};
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(std::string_view(trimmed).substr(0, equals));
        std::string value = trim_copy(std::string_view(trimmed).substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }

        std::string lower_key = to_lower_copy(key);
        if (lower_key == "vtfcmd") {
            out.vtfcmd_path = resolve_against(base_dir, value);
        } else if (lower_key == "template_dir") {
            out.template_dir = resolve_against(base_dir, value);
        } else {
            error = "unknown key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }
    }
    return true;
}

bool load_tool_config_from_file(const fs::path& path, ToolConfig& out, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_tool_config(input, path.parent_path(), out, error);
}

std::optional<fs::path> resolve_user_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_config_relpath;
}

fs::path resolve_executable_dir(const char* argv0) {
    std::error_code ec;
    const fs::path self_exe = fs::canonical("/proc/self/exe", ec);
    if (!ec && !self_exe.parent_path().empty()) {
        return self_exe.parent_path();
    }

    ec.clear();
    fs::path cwd = fs::current_path(ec);
    fs::path exec_path(argv0 != nullptr ? argv0 : "");
    if (exec_path.is_relative() && !cwd.empty()) {
        exec_path = cwd / exec_path;
    }
    fs::path exec_dir = exec_path.parent_path();
    if (exec_dir.empty()) {
        exec_dir = cwd;
    }
    return exec_dir;
}

std::vector<fs::path> default_config_candidates(const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (std::optional<fs::path> user_config = resolve_user_config_path()) {
        candidates.push_back(*user_config);
    }
    candidates.push_back(exec_dir / k_config_filename);
    return candidates;
}

} // namespace roleicon::core
