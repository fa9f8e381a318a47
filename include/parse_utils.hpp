#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <chrono>

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Longest duration parse_duration accepts.
constexpr std::chrono::seconds kMaxDuration = std::chrono::hours(24 * 366);

// Parse a duration string like "30m" or "2h".
// Format: non-negative integer followed by s, m, h, or d. A bare number means seconds.
// Bounds: at most kMaxDuration.
// Invalid input: parse failure or out-of-range sets ok=false and returns 0s.
std::chrono::seconds parse_duration(const std::string& value, bool& ok);

// Parse milliseconds from a string with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s, or m.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Interpret a config or flag value as a boolean.
// "", "1", "true" and "yes" (case-insensitive) are true; everything else is false.
bool parse_bool_value(const std::string& value);

#endif // PARSE_UTILS_HPP
