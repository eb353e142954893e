// =============================================================================
// types.hpp - Entity and attribute value model
// =============================================================================
// Values are classified once, when a record is ingested. Everything
// downstream dispatches on the variant alternative instead of inspecting
// the original record shape.
// =============================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ifc2lbd {

using EntityId = std::uint64_t;

// Schema-declared aggregation kind of an attribute. None means scalar or reference.
enum class CollectionKind : std::uint8_t {
    None = 0,
    List,
    Set,
    Array,
    Unknown
};

const char* collection_kind_name(CollectionKind kind);

// Accepts LIST, SET, ARRAY (case-insensitive); anything else yields None
CollectionKind parse_collection_kind(const std::string& name);

struct AttributeValue;

struct Reference {
    EntityId id = 0;

    bool operator==(const Reference& other) const { return id == other.id; }
};

/**
 * A value carrying an explicit declared type (SELECT member), e.g.
 * IfcLabel("Oak"). Materialized in the output as an auxiliary entity.
 */
struct TypedValue {
    std::string declared_type;
    std::shared_ptr<const AttributeValue> inner;
};

struct Collection {
    std::vector<AttributeValue> items;
};

struct AttributeValue {
    using Storage = std::variant<std::monostate,  // absent / null
                                 std::string,
                                 std::int64_t,
                                 double,
                                 bool,
                                 Reference,
                                 TypedValue,
                                 Collection>;

    Storage value;

    AttributeValue() = default;
    AttributeValue(std::string s) : value(std::move(s)) {}
    AttributeValue(const char* s) : value(std::string(s)) {}
    AttributeValue(std::int64_t i) : value(i) {}
    AttributeValue(int i) : value(static_cast<std::int64_t>(i)) {}
    AttributeValue(double d) : value(d) {}
    AttributeValue(bool b) : value(b) {}
    AttributeValue(Reference r) : value(r) {}
    AttributeValue(TypedValue t) : value(std::move(t)) {}
    AttributeValue(Collection c) : value(std::move(c)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value); }
    bool is_reference() const { return std::holds_alternative<Reference>(value); }
    bool is_typed() const { return std::holds_alternative<TypedValue>(value); }
    bool is_collection() const { return std::holds_alternative<Collection>(value); }

    const Reference* as_reference() const { return std::get_if<Reference>(&value); }
    const TypedValue* as_typed() const { return std::get_if<TypedValue>(&value); }
    const Collection* as_collection() const { return std::get_if<Collection>(&value); }
    const std::string* as_string() const { return std::get_if<std::string>(&value); }
};

// Convenience constructors used by readers and tests
AttributeValue make_ref(EntityId id);
AttributeValue make_typed(std::string declared_type, AttributeValue inner);
AttributeValue make_collection(std::vector<AttributeValue> items);

// Appends every entity id referenced by the value (typed inner values and nested items included)
void collect_references(const AttributeValue& value, std::vector<EntityId>& out);

struct Attribute {
    std::string name;
    AttributeValue value;
};

/**
 * One model element as delivered by the source stream. Attribute order is
 * the delivery order and is preserved in the output.
 */
struct Entity {
    EntityId id = 0;
    std::string type;
    std::vector<Attribute> attributes;

    const AttributeValue* find(const std::string& name) const;
    AttributeValue* find(const std::string& name);

    void set(const std::string& name, AttributeValue value);
};

} // namespace ifc2lbd
