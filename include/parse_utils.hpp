#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a byte count with an optional unit suffix (B, K/KB, M/MB, G/GB),
// case-insensitive, binary multiples.
// Bounds: inclusive [min, max] after applying the unit.
// Invalid input: unknown suffix, overflow, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a boolean config value: true/false, yes/no, on/off, 1/0 and the empty
// string (true). Case-insensitive.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
