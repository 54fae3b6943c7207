#pragma once
#include <string>
#include <cstddef>

namespace qwstream {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Percent-encode a path segment (same unreserved set as encodeURIComponent)
std::string url_encode(const std::string& s);

// First max_chars code points of a UTF-8 string; never splits a sequence
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Remove trailing '/' characters
std::string strip_trailing_slashes(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace qwstream
