#pragma once

#include <cstdint>
#include <string>

namespace ifc2lbd::ttl {

enum class FloatFormat {
    Scientific,   // 5.840000000000000E-1
    Plain         // 0.584
};

// "scientific" or "plain"; throws ConfigurationError otherwise
FloatFormat parse_float_format(const std::string& name);
const char* float_format_name(FloatFormat format);

// Turtle ECHAR escaping; other control characters become \uXXXX
std::string escape_string(const std::string& value);

// ============================================================================
// Literal formatting (complete object text, quotes and datatype included)
// ============================================================================

std::string format_string(const std::string& value);      // "Oak"
std::string format_integer(std::int64_t value);           // "5"^^xsd:integer
std::string format_boolean(bool value);                   // "true"^^xsd:boolean
std::string format_double(double value, FloatFormat format);

/**
 * Lexical form of a double without quotes or datatype.
 *
 * Scientific: 15 mantissa decimals, exponent without '+' and without leading
 * zeros (0.584 -> 5.840000000000000E-1, 0.0 -> 0.000000000000000E0).
 * Plain: shortest round-trip form, ".0" appended to integral values.
 * Non-finite values map to INF, -INF and NaN in both modes.
 */
std::string double_lexical(double value, FloatFormat format);

} // namespace ifc2lbd::ttl
