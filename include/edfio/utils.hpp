#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace edfio {

std::string trim(const std::string& s);
std::string to_lower(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
// Failures throw std::runtime_error.
//
// to_double() parses using the classic "C" locale so that '.' is always the
// decimal separator.
int to_int(const std::string& s);
long long to_long_long(const std::string& s);
double to_double(const std::string& s);

// Return every run of ASCII digits in s, in order, as integers.
//
// Used for the EDF date/time fields, which are nominally "dd.mm.yy" and
// "hh.mm.ss" but are written with other separators by some devices.
std::vector<int> extract_digit_groups(const std::string& s);

// Pad with spaces, or truncate from the right, to exactly width characters.
std::string pad_field(const std::string& s, size_t width);

// Shortest left-justified decimal text for v that fits in width characters.
//
// Tries fixed notation with decreasing precision (trailing zeros stripped).
// A nonzero magnitude below 1 that would print as "0" uses scientific notation
// instead ("1e-07"). Otherwise the rounded integer is used, truncated to width
// if even that does not fit.
std::string format_number_field(double v, size_t width);

// Lowercased extension without the leading dot ("rec.BDF" -> "bdf").
std::string file_extension_lower(const std::string& path);

bool file_exists(const std::string& path);

} // namespace edfio
