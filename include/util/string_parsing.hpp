#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Field splitting for the comma-delimited line protocols (timeline file,
   node stdin/stdout, command-line lists)
 - Consistent error handling across the codebase

 Key functions:
 - SafeParseInt / SafeParseInt64: Parse integer with bounds checking
 - SafeParseDouble: Parse finite floating point value with bounds checking
 - IsValidHex: Validate packet payload hex strings
 - SplitFields: Split on a delimiter with an optional field limit
 - Trim: Strip leading/trailing whitespace

 Security:
 - All parse functions validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lorasim {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse a finite decimal number with bounds checking
 *
 * Rejects NaN and infinities, leading whitespace, and trailing characters.
 *
 * Examples:
 *   SafeParseDouble("1.5", 0.0, 10.0) -> 1.5
 *   SafeParseDouble("-0.1", 0.0, 10.0) -> std::nullopt (out of range)
 *   SafeParseDouble("nan", 0.0, 10.0) -> std::nullopt
 */
std::optional<double> SafeParseDouble(const std::string& str, double min, double max);

/**
 * Validate hexadecimal string
 *
 * @return true if non-empty and all characters are hex digits [0-9a-fA-F]
 */
bool IsValidHex(const std::string& str);

/**
 * Split a string on a delimiter
 *
 * @param str Input string
 * @param delim Delimiter character
 * @param max_fields Maximum number of fields (0 = unlimited). When the limit
 *        is reached the last field holds the remainder, delimiters included.
 *
 * Examples:
 *   SplitFields("a,b,c", ',') -> {"a", "b", "c"}
 *   SplitFields("1,ND01,node_update,ND01,5", ',', 3) -> {"1", "ND01", "node_update,ND01,5"}
 *   SplitFields("", ',') -> {""}
 */
std::vector<std::string> SplitFields(const std::string& str, char delim,
                                     size_t max_fields = 0);

/**
 * Remove leading and trailing whitespace (spaces, tabs, CR, LF)
 */
std::string Trim(const std::string& str);

} // namespace util
} // namespace lorasim
