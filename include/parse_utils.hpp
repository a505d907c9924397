#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

// Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF).
std::string trim(const std::string& value);

// Split a comma separated list. Items are trimmed and empty items dropped.
std::vector<std::string> split_list(const std::string& value);

// Interpret a config/flag value as a boolean.
// Accepted: "", "1", "true", "yes", "on" -> true; "0", "false", "no", "off" -> false
// (case-insensitive). Anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, K/KB, M/MB, G/GB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Check that @p value is well-formed UTF-8 (no overlong forms, surrogates or
// code points above U+10FFFF). On failure @p bad_offset receives the byte
// offset of the first invalid sequence.
bool is_valid_utf8(const std::string& value, size_t* bad_offset = nullptr);

#endif // PARSE_UTILS_HPP
