#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace photo_restore::core {

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// String utilities
bool is_blank(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Removes bytes that are not part of a well-formed UTF-8 sequence.
// Returns the number of bytes dropped.
std::size_t drop_invalid_utf8(std::string& text);

} // namespace photo_restore::core
