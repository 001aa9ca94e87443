#pragma once

#include <cstddef>
#include <locale>
#include <optional>
#include <string>

namespace bookcat {
namespace utils {

// ---- WHITESPACE AND CASE ----
// Returns value without leading and trailing whitespace
std::string trim(const std::string& value);
// UTF-8 aware case conversion; bytes that are not valid UTF-8 fall back to ASCII rules
std::string to_lower(const std::string& value);
std::string to_upper(const std::string& value);
// Unicode case folding used for comparisons
std::string fold_case(const std::string& value);
// UTF-8 locale used by the conversions above, generated on first use
const std::locale& text_locale();


// ---- MATCHING ----
// Case-insensitive substring test, an empty needle matches everything
bool contains_ignore_case(const std::string& haystack, const std::string& needle);


// ---- PARSING ----
// Parses a (trimmed) decimal integer. Returns std::nullopt when the input is
// not entirely a number, so callers can tell "not a number" from "out of range".
// Numbers too large for long saturate to its limits.
std::optional<long> parse_integer(const std::string& value);

// Parses a 1-based menu selection and checks it against [1, count].
// Returns the 0-based position, or std::nullopt if out of range.
std::optional<std::size_t> to_selection(long choice, std::size_t count);

} // namespace utils
} // namespace bookcat
