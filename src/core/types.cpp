#include "ifc2lbd/types.hpp"

#include <algorithm>
#include <cctype>

namespace ifc2lbd {

const char* collection_kind_name(CollectionKind kind) {
    switch (kind) {
        case CollectionKind::None:    return "NONE";
        case CollectionKind::List:    return "LIST";
        case CollectionKind::Set:     return "SET";
        case CollectionKind::Array:   return "ARRAY";
        case CollectionKind::Unknown: return "UNKNOWN";
    }
    return "NONE";
}

CollectionKind parse_collection_kind(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "LIST") return CollectionKind::List;
    if (upper == "SET") return CollectionKind::Set;
    if (upper == "ARRAY") return CollectionKind::Array;
    return CollectionKind::None;
}

AttributeValue make_ref(EntityId id) {
    return AttributeValue(Reference{id});
}

AttributeValue make_typed(std::string declared_type, AttributeValue inner) {
    TypedValue tv;
    tv.declared_type = std::move(declared_type);
    tv.inner = std::make_shared<const AttributeValue>(std::move(inner));
    return AttributeValue(std::move(tv));
}

AttributeValue make_collection(std::vector<AttributeValue> items) {
    Collection c;
    c.items = std::move(items);
    return AttributeValue(std::move(c));
}

void collect_references(const AttributeValue& value, std::vector<EntityId>& out) {
    // Work list instead of recursion: nesting depth comes from input data
    std::vector<const AttributeValue*> pending{&value};
    while (!pending.empty()) {
        const AttributeValue* v = pending.back();
        pending.pop_back();

        if (const Reference* ref = v->as_reference()) {
            out.push_back(ref->id);
        } else if (const TypedValue* tv = v->as_typed()) {
            if (tv->inner) pending.push_back(tv->inner.get());
        } else if (const Collection* c = v->as_collection()) {
            // Reverse so items are reported in declaration order
            for (auto it = c->items.rbegin(); it != c->items.rend(); ++it) {
                pending.push_back(&*it);
            }
        }
    }
}

const AttributeValue* Entity::find(const std::string& name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) return &attr.value;
    }
    return nullptr;
}

AttributeValue* Entity::find(const std::string& name) {
    for (auto& attr : attributes) {
        if (attr.name == name) return &attr.value;
    }
    return nullptr;
}

void Entity::set(const std::string& name, AttributeValue value) {
    if (AttributeValue* existing = find(name)) {
        *existing = std::move(value);
        return;
    }
    attributes.push_back({name, std::move(value)});
}

} // namespace ifc2lbd
