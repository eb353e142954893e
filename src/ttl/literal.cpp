#include "ifc2lbd/ttl/literal.hpp"
#include "ifc2lbd/error.hpp"

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace ifc2lbd::ttl {

FloatFormat parse_float_format(const std::string& name) {
    if (name == "scientific") return FloatFormat::Scientific;
    if (name == "plain") return FloatFormat::Plain;
    throw ConfigurationError("Unknown float format '" + name + "'", "parse_float_format",
                             "Available: scientific, plain");
}

const char* float_format_name(FloatFormat format) {
    return format == FloatFormat::Plain ? "plain" : "scientific";
}

std::string escape_string(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04X}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string format_string(const std::string& value) {
    return "\"" + escape_string(value) + "\"";
}

std::string format_integer(std::int64_t value) {
    return "\"" + std::to_string(value) + "\"^^xsd:integer";
}

std::string format_boolean(bool value) {
    return value ? "\"true\"^^xsd:boolean" : "\"false\"^^xsd:boolean";
}

std::string format_double(double value, FloatFormat format) {
    return "\"" + double_lexical(value, format) + "\"^^xsd:double";
}

std::string double_lexical(double value, FloatFormat format) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "INF" : "-INF";

    if (format == FloatFormat::Plain) {
        std::string text = fmt::format("{}", value);
        if (text.find_first_of(".e") == std::string::npos) text += ".0";
        return text;
    }

    std::string text = fmt::format("{:.15E}", value);

    // Normalize the exponent: 5.84E-01 -> 5.84E-1, 1.5E+00 -> 1.5E0
    std::size_t e = text.find('E');
    if (e == std::string::npos) return text;
    std::string mantissa = text.substr(0, e);
    std::size_t pos = e + 1;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    while (pos + 1 < text.size() && text[pos] == '0') ++pos;
    std::string digits = text.substr(pos);
    if (digits == "0") negative = false;

    return mantissa + "E" + (negative ? "-" : "") + digits;
}

} // namespace ifc2lbd::ttl
