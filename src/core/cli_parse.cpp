#include "cli_parse.h"

#include <algorithm>
#include <cctype>

namespace roleicon::core {

std::string trim_copy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

std::string to_lower_copy(std::string value) {
    std::ranges::transform(value, value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_lowercase_name(std::string_view value) {
    bool has_cased = false;
    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        // Multi-byte UTF-8 letters have no case table here; they are
        // rejected so an uppercase one can never slip through.
        if (uc >= 0x80 || std::isupper(uc) != 0) {
            return false;
        }
        if (std::islower(uc) != 0) {
            has_cased = true;
        }
    }
    return has_cased;
}

std::string to_quoted(const std::string& s) {
    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\' ) {
            result += '\\';
        }
        result += c;
    }
    result += "\"";
    return result;
}

} // namespace roleicon::core
