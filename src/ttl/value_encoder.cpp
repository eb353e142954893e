#include "ifc2lbd/ttl/value_encoder.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <type_traits>

namespace ifc2lbd::ttl {

// ============================================================================
// Converter registry
// ============================================================================

namespace {

struct ConverterEntry {
    const char* name;
    ConverterKind kind;
};

constexpr ConverterEntry CONVERTERS[] = {
    {"mini_ifcowl_complete", ConverterKind::MiniIfcOwlComplete},
    {"mini_ifcowl_complete2", ConverterKind::MiniIfcOwlComplete2},
};

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

ConverterKind parse_converter(const std::string& name) {
    for (const auto& c : CONVERTERS) {
        if (name == c.name) return c.kind;
    }
    throw ConfigurationError("Unknown converter '" + name + "'", "parse_converter",
                             "Available: " + join(available_converters(), ", "),
                             ErrorCode::UNKNOWN_CONVERTER);
}

const char* converter_name(ConverterKind kind) {
    for (const auto& c : CONVERTERS) {
        if (c.kind == kind) return c.name;
    }
    return CONVERTERS[0].name;
}

std::vector<std::string> available_converters() {
    std::vector<std::string> names;
    for (const auto& c : CONVERTERS) names.emplace_back(c.name);
    return names;
}

EncoderOptions encoder_options_for(ConverterKind kind) {
    EncoderOptions options;
    options.unknown_policy = kind == ConverterKind::MiniIfcOwlComplete2
        ? UnknownCollectionPolicy::AlwaysList
        : UnknownCollectionPolicy::Heuristic;
    return options;
}

bool is_absent(const AttributeValue& value) {
    if (value.is_null()) return true;
    if (const TypedValue* typed = value.as_typed()) {
        return !typed->inner || is_absent(*typed->inner);
    }
    return false;
}

// ============================================================================
// ValueEncoder
// ============================================================================

ValueEncoder::ValueEncoder(const SchemaRegistry& registry, EncoderOptions options)
    : registry_(registry), options_(std::move(options)) {}

void ValueEncoder::begin_entity(EntityId id, const std::string& type) {
    entity_id_ = id;
    entity_type_ = type;
    typed_counter_ = 0;
    auxiliary_.clear();
    auxiliary_triples_ = 0;
}

std::string ValueEncoder::instance_iri(EntityId id) const {
    return options_.instance_prefix + ":ref_" + std::to_string(id);
}

std::string ValueEncoder::model_term(const std::string& local) const {
    return options_.model_prefix + ":" + local;
}

void ValueEncoder::check_depth(std::size_t depth) const {
    if (depth > options_.max_depth) {
        throw EncodingError("value nesting exceeds " + std::to_string(options_.max_depth) + " levels",
                            entity_id_, entity_type_);
    }
}

std::optional<EncodedValue> ValueEncoder::encode_attribute(const std::string& name,
                                                           const AttributeValue& value) {
    if (is_absent(value)) return std::nullopt;

    if (const Collection* collection = value.as_collection()) {
        return encode_collection(*collection, registry_.collection_kind(entity_type_, name), 1);
    }
    if (const TypedValue* typed = value.as_typed()) {
        return EncodedValue{allocate_typed(*typed, 1), 1};
    }
    return encode_scalar(value);
}

EncodedValue ValueEncoder::encode_scalar(const AttributeValue& value) const {
    return std::visit([this](const auto& v) -> EncodedValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return {format_string(v), 1};
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return {format_integer(v), 1};
        } else if constexpr (std::is_same_v<T, double>) {
            return {format_double(v, options_.float_format), 1};
        } else if constexpr (std::is_same_v<T, bool>) {
            return {format_boolean(v), 1};
        } else if constexpr (std::is_same_v<T, Reference>) {
            return {instance_iri(v.id), 1};
        } else {
            // Collections and typed values never reach here
            return {std::string(), 0};
        }
    }, value.value);
}

EncodedValue ValueEncoder::encode_collection(const Collection& collection, CollectionKind kind,
                                             std::size_t depth) {
    check_depth(depth);

    std::vector<std::string> items;
    items.reserve(collection.items.size());
    std::uint64_t nested_total = 0;
    bool all_instances = true;

    for (const auto& item : collection.items) {
        if (is_absent(item)) continue;
        std::uint64_t nested_items = 0;
        items.push_back(encode_item(item, depth, nested_items));
        nested_total += nested_items;
        if (!item.is_reference() && !item.is_typed()) all_instances = false;
    }

    if (items.empty()) return {"()", 1};

    if (kind == CollectionKind::None || kind == CollectionKind::Unknown) {
        bool as_set = options_.unknown_policy == UnknownCollectionPolicy::Heuristic && all_instances;
        LOG_TRACE("entity #{}: no schema kind for collection, encoding as {}",
                  entity_id_, as_set ? "SET" : "LIST");
        kind = as_set ? CollectionKind::Set : CollectionKind::List;
    }

    EncodedValue encoded;
    if (kind == CollectionKind::Set) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) encoded.text += ", ";
            encoded.text += items[i];
        }
        encoded.triples = items.size();
    } else {
        encoded.text = "(";
        for (const auto& item : items) {
            encoded.text += ' ';
            encoded.text += item;
        }
        encoded.text += " )";
        encoded.triples = 1 + 2 * items.size() + 2 * nested_total;
    }
    return encoded;
}

std::string ValueEncoder::encode_item(const AttributeValue& item, std::size_t depth,
                                      std::uint64_t& nested_items) {
    if (const Collection* nested = item.as_collection()) {
        for (const auto& sub : nested->items) {
            if (!is_absent(sub)) ++nested_items;
        }
        return encode_nested_list(*nested, depth + 1);
    }
    if (const TypedValue* typed = item.as_typed()) {
        return allocate_typed(*typed, depth + 1);
    }
    return encode_scalar(item).text;
}

std::string ValueEncoder::encode_nested_list(const Collection& collection, std::size_t depth) {
    check_depth(depth);

    std::string text;
    for (const auto& item : collection.items) {
        if (is_absent(item)) continue;
        std::uint64_t ignored = 0;
        text += ' ';
        text += encode_item(item, depth, ignored);
    }
    return text.empty() ? "()" : "(" + text + " )";
}

std::string ValueEncoder::allocate_typed(const TypedValue& typed, std::size_t depth) {
    check_depth(depth);

    // The id is taken before the inner value is encoded, so nested typed
    // values get higher numbers and their statements come first
    ++typed_counter_;
    std::string typed_id = instance_iri(entity_id_) + "_t" + std::to_string(typed_counter_);

    const AttributeValue& inner = *typed.inner;
    EncodedValue value;
    if (const Collection* collection = inner.as_collection()) {
        value = encode_collection(*collection, CollectionKind::List, depth + 1);
    } else if (const TypedValue* nested = inner.as_typed()) {
        value = {allocate_typed(*nested, depth + 1), 1};
    } else {
        value = encode_scalar(inner);
    }

    auxiliary_ += typed_id + " " + model_term(typed.declared_type) + " " + value.text + " .\n";
    auxiliary_triples_ += value.triples;
    return typed_id;
}

} // namespace ifc2lbd::ttl
