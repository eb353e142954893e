#pragma once

#include <optional>
#include <string>

namespace ifc2lbd::geometry {

/**
 * IFC GlobalId codec.
 *
 * The compressed form is 22 characters over "0-9A-Za-z_$": the first character
 * carries the top byte (2 base-64 digits), then five groups of 4 digits each
 * carry 3 bytes, most significant digit first.
 */

// 32 hex digits (dashes allowed, as in a UUID) -> 22 characters.
// Throws InvalidArgumentError on anything else.
std::string compress_guid(const std::string& hex);

// 22 characters -> 32 lowercase hex digits. Throws InvalidArgumentError.
std::string expand_guid(const std::string& compressed);

bool is_compressed_guid(const std::string& text);

/**
 * GUID carried by a geometry feature subject. The name is the text after the
 * last '/' (the whole IRI when it has none), split on '_' with the first and
 * last parts dropped; the rest must join to 32 hex digits, e.g.
 *   http://example.org/product_0a1b2c3d_4e5f_6071_8293_a4b5c6d7e8f9_body
 * Returns nullopt when the name does not have that shape.
 */
std::optional<std::string> decode_feature_guid(const std::string& iri);

} // namespace ifc2lbd::geometry
