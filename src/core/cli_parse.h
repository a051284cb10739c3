#pragma once

#include <string>
#include <string_view>

namespace roleicon::core {

std::string trim_copy(std::string_view s);
std::string to_lower_copy(std::string value);

// True when `value` has at least one lowercase ASCII letter and no uppercase
// ones. Digits, '_' and other ASCII punctuation are allowed; any non-ASCII
// byte is rejected.
bool is_lowercase_name(std::string_view value);

std::string to_quoted(const std::string& s);

} // namespace roleicon::core
