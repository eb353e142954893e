#include "ifc2lbd/geometry/guid.hpp"
#include "ifc2lbd/error.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>

namespace ifc2lbd::geometry {

namespace {

constexpr const char* ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz_$";

int digit_value(char c) {
    const char* p = std::strchr(ALPHABET, c);
    return (c && p) ? static_cast<int>(p - ALPHABET) : -1;
}

void append_base64(std::string& out, std::uint32_t value, int digits) {
    char buf[4];
    for (int i = digits - 1; i >= 0; --i) {
        buf[i] = ALPHABET[value % 64];
        value /= 64;
    }
    out.append(buf, static_cast<std::size_t>(digits));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool to_bytes(const std::string& hex, std::uint8_t (&bytes)[16]) {
    std::string digits;
    for (char c : hex) {
        if (c != '-') digits += c;
    }
    if (digits.size() != 32) return false;
    for (std::size_t i = 0; i < 16; ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

} // namespace

std::string compress_guid(const std::string& hex) {
    std::uint8_t bytes[16];
    if (!to_bytes(hex, bytes)) {
        throw InvalidArgumentError("not a 128-bit hex GUID: '" + hex + "'", "compress_guid");
    }

    std::string out;
    out.reserve(22);
    append_base64(out, bytes[0], 2);
    for (std::size_t i = 1; i < 16; i += 3) {
        std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                          (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                          bytes[i + 2];
        append_base64(out, v, 4);
    }
    return out;
}

bool is_compressed_guid(const std::string& text) {
    if (text.size() != 22) return false;
    for (char c : text) {
        if (digit_value(c) < 0) return false;
    }
    // First digit carries only two bits
    return digit_value(text[0]) < 4;
}

std::string expand_guid(const std::string& compressed) {
    if (!is_compressed_guid(compressed)) {
        throw InvalidArgumentError("not a compressed GUID: '" + compressed + "'", "expand_guid");
    }

    auto decode = [&](std::size_t pos, std::size_t len) {
        std::uint32_t v = 0;
        for (std::size_t i = pos; i < pos + len; ++i) {
            v = v * 64 + static_cast<std::uint32_t>(digit_value(compressed[i]));
        }
        return v;
    };

    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(32);

    std::uint32_t first = decode(0, 2);
    out += HEX[(first >> 4) & 0xF];
    out += HEX[first & 0xF];
    for (std::size_t pos = 2; pos < 22; pos += 4) {
        std::uint32_t v = decode(pos, 4);
        for (int shift = 20; shift >= 0; shift -= 4) {
            out += HEX[(v >> shift) & 0xF];
        }
    }
    return out;
}

std::optional<std::string> decode_feature_guid(const std::string& iri) {
    std::size_t slash = iri.rfind('/');
    const std::string name = slash == std::string::npos ? iri : iri.substr(slash + 1);

    std::size_t first = name.find('_');
    std::size_t last = name.rfind('_');
    if (first == std::string::npos || last == first) return std::nullopt;

    std::string hex;
    for (std::size_t i = first + 1; i < last; ++i) {
        if (name[i] != '_') hex += name[i];
    }
    if (hex.size() != 32) return std::nullopt;
    for (char c : hex) {
        if (hex_value(c) < 0) return std::nullopt;
    }
    return compress_guid(hex);
}

} // namespace ifc2lbd::geometry
