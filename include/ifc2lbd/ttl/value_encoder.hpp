// =============================================================================
// value_encoder.hpp - AttributeValue -> Turtle object text + triple count
// =============================================================================
//
// Counting model (per attribute):
//   literal / reference          1
//   typed value                  1 for the owner, plus the auxiliary statement
//                                (1, or the List count when the inner value is
//                                a collection), tracked in auxiliary_triples()
//   SET of n items               n
//   LIST / ARRAY of n items      1 + 2n + 2 * sum(item counts of nested collections)
//   empty collection             1
//
// Collections whose attribute has no schema kind fall back to the converter's
// UnknownCollectionPolicy.
// =============================================================================

#pragma once

#include "ifc2lbd/schema_registry.hpp"
#include "ifc2lbd/ttl/literal.hpp"
#include "ifc2lbd/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ifc2lbd::ttl {

enum class ConverterKind {
    MiniIfcOwlComplete,     // "mini_ifcowl_complete"
    MiniIfcOwlComplete2     // "mini_ifcowl_complete2"
};

// Throws ConfigurationError (UNKNOWN_CONVERTER) listing the available names
ConverterKind parse_converter(const std::string& name);
const char* converter_name(ConverterKind kind);
std::vector<std::string> available_converters();

enum class UnknownCollectionPolicy {
    Heuristic,     // all items are instances (references or typed values) -> SET, else LIST
    AlwaysList
};

struct EncoderOptions {
    std::string model_prefix = "ifc";
    std::string instance_prefix = "inst";
    FloatFormat float_format = FloatFormat::Scientific;
    UnknownCollectionPolicy unknown_policy = UnknownCollectionPolicy::Heuristic;
    std::size_t max_depth = 64;
};

EncoderOptions encoder_options_for(ConverterKind kind);

struct EncodedValue {
    std::string text;
    std::uint64_t triples = 0;
};

/**
 * Per-run encoder. begin_entity() resets the typed-value counter and the
 * auxiliary statement buffer; everything in between belongs to that entity.
 */
class ValueEncoder {
public:
    ValueEncoder(const SchemaRegistry& registry, EncoderOptions options = {});

    void begin_entity(EntityId id, const std::string& type);

    /**
     * Encode one attribute of the current entity.
     * @return nullopt when the value is absent (sparse encoding)
     * @throws EncodingError when nesting exceeds max_depth
     */
    std::optional<EncodedValue> encode_attribute(const std::string& name, const AttributeValue& value);

    // Auxiliary typed-entity statements accumulated for the current entity
    const std::string& auxiliary() const { return auxiliary_; }
    std::uint64_t auxiliary_triples() const { return auxiliary_triples_; }
    std::uint32_t typed_count() const { return typed_counter_; }

    std::string instance_iri(EntityId id) const;
    std::string model_term(const std::string& local) const;

    const EncoderOptions& options() const { return options_; }

private:
    EncodedValue encode_collection(const Collection& collection, CollectionKind kind, std::size_t depth);
    std::string encode_item(const AttributeValue& item, std::size_t depth, std::uint64_t& nested_items);
    std::string encode_nested_list(const Collection& collection, std::size_t depth);
    EncodedValue encode_scalar(const AttributeValue& value) const;
    std::string allocate_typed(const TypedValue& typed, std::size_t depth);
    void check_depth(std::size_t depth) const;

    const SchemaRegistry& registry_;
    EncoderOptions options_;

    EntityId entity_id_ = 0;
    std::string entity_type_;
    std::uint32_t typed_counter_ = 0;
    std::string auxiliary_;
    std::uint64_t auxiliary_triples_ = 0;
};

// Absent values: null, or a typed value wrapping an absent value
bool is_absent(const AttributeValue& value);

} // namespace ifc2lbd::ttl
