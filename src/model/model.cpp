#include "ifc2lbd/model/model.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace ifc2lbd::model {

namespace {

bool contains_reference(const AttributeValue& value, EntityId target) {
    std::vector<EntityId> refs;
    collect_references(value, refs);
    return std::find(refs.begin(), refs.end(), target) != refs.end();
}

// Drops references to `target`; returns true when the value itself became null
bool strip_reference(AttributeValue& value, EntityId target) {
    if (const Reference* ref = value.as_reference()) {
        if (ref->id != target) return false;
        value = AttributeValue();
        return true;
    }
    if (const TypedValue* typed = value.as_typed()) {
        if (!typed->inner || !contains_reference(*typed->inner, target)) return false;
        AttributeValue inner = *typed->inner;
        if (strip_reference(inner, target)) {
            value = AttributeValue();
            return true;
        }
        value = make_typed(typed->declared_type, std::move(inner));
        return false;
    }
    if (std::holds_alternative<Collection>(value.value)) {
        auto& items = std::get<Collection>(value.value).items;
        std::vector<AttributeValue> kept;
        kept.reserve(items.size());
        for (auto& item : items) {
            if (!strip_reference(item, target)) kept.push_back(std::move(item));
        }
        items = std::move(kept);
    }
    return false;
}

} // namespace

Model Model::load(stream::EntityStream& input, std::size_t* dropped) {
    Model model(input.schema_id());
    std::size_t skipped = 0;

    Entity entity;
    while (input.next(entity)) {
        if (entity.id == 0 || entity.type.empty()) {
            ++skipped;
            continue;
        }
        if (model.contains(entity.id)) {
            LOG_WARN("Duplicate entity id #{}, later record dropped", entity.id);
            ++skipped;
            continue;
        }
        model.add(std::move(entity));
        entity = Entity();
    }

    if (dropped) *dropped = skipped;
    LOG_DEBUG("Model loaded: {} entities, {} records dropped", model.size(), skipped);
    return model;
}

void Model::add(Entity entity) {
    IFC2LBD_CHECK_ARGUMENT(entity.id != 0, "entity id must be non-zero");
    IFC2LBD_CHECK_ARGUMENT(!entity.type.empty(), "entity type must not be empty");
    if (contains(entity.id)) {
        throw InvalidArgumentError("duplicate entity id #" + std::to_string(entity.id), "Model::add");
    }

    const EntityId id = entity.id;
    for (const auto& attr : entity.attributes) {
        index_references(id, attr.value);
    }
    order_.push_back(id);
    entities_.emplace(id, std::move(entity));
}

const Entity* Model::get(EntityId id) const {
    auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : &it->second;
}

std::vector<EntityId> Model::by_type(const std::string& type, const SchemaRegistry* registry) const {
    std::vector<EntityId> result;
    for (EntityId id : order_) {
        const Entity& e = entities_.at(id);
        if (e.type == type || (registry && registry->is_subtype_of(e.type, type))) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<EntityId> Model::traverse(EntityId start, int max_levels) const {
    std::vector<EntityId> result;
    if (!contains(start)) return result;

    std::unordered_set<EntityId> seen{start};
    std::deque<std::pair<EntityId, int>> queue{{start, 0}};

    while (!queue.empty()) {
        auto [id, level] = queue.front();
        queue.pop_front();
        result.push_back(id);

        if (max_levels >= 0 && level >= max_levels) continue;
        for (EntityId target : references(id)) {
            if (seen.insert(target).second) {
                queue.emplace_back(target, level + 1);
            }
        }
    }
    return result;
}

std::vector<EntityId> Model::references(EntityId id) const {
    std::vector<EntityId> result;
    const Entity* e = get(id);
    if (!e) return result;

    std::vector<EntityId> raw;
    for (const auto& attr : e->attributes) {
        collect_references(attr.value, raw);
    }

    std::unordered_set<EntityId> seen;
    for (EntityId target : raw) {
        if (contains(target) && seen.insert(target).second) result.push_back(target);
    }
    return result;
}

std::vector<EntityId> Model::inverse(EntityId id) const {
    std::vector<EntityId> result;
    auto it = inverse_.find(id);
    if (it == inverse_.end()) return result;
    result.reserve(it->second.size());
    for (const auto& [referencer, count] : it->second) {
        result.push_back(referencer);
    }
    return result;
}

std::vector<EntityId> Model::referencers_via(EntityId target, const std::string& attr) const {
    std::vector<EntityId> result;
    for (EntityId referencer : inverse(target)) {
        const AttributeValue* value = entities_.at(referencer).find(attr);
        if (value && contains_reference(*value, target)) result.push_back(referencer);
    }
    return result;
}

void Model::set_attribute_null(EntityId id, const std::string& attr) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        throw InvalidArgumentError("no entity #" + std::to_string(id), "Model::set_attribute_null");
    }
    AttributeValue* value = it->second.find(attr);
    if (!value || value->is_null()) return;

    unindex_references(id, *value);
    *value = AttributeValue();
}

void Model::remove(EntityId id) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        throw InvalidArgumentError("no entity #" + std::to_string(id), "Model::remove");
    }

    // Detach referencers first; their index entries for `id` go with inverse_[id]
    for (EntityId referencer : inverse(id)) {
        if (referencer == id) continue;
        for (auto& attr : entities_.at(referencer).attributes) {
            if (!contains_reference(attr.value, id)) continue;
            unindex_references(referencer, attr.value);
            strip_reference(attr.value, id);
            index_references(referencer, attr.value);
        }
    }

    for (const auto& attr : it->second.attributes) {
        unindex_references(id, attr.value);
    }
    inverse_.erase(id);
    entities_.erase(it);
    order_.erase(std::find(order_.begin(), order_.end(), id));
}

std::vector<Entity> Model::entities() const {
    std::vector<Entity> result;
    result.reserve(order_.size());
    for (EntityId id : order_) {
        result.push_back(entities_.at(id));
    }
    return result;
}

void Model::index_references(EntityId owner, const AttributeValue& value) {
    std::vector<EntityId> refs;
    collect_references(value, refs);
    for (EntityId target : refs) {
        ++inverse_[target][owner];
    }
}

void Model::unindex_references(EntityId owner, const AttributeValue& value) {
    std::vector<EntityId> refs;
    collect_references(value, refs);
    for (EntityId target : refs) {
        auto it = inverse_.find(target);
        if (it == inverse_.end()) continue;
        auto jt = it->second.find(owner);
        if (jt == it->second.end()) continue;
        if (--jt->second == 0) it->second.erase(jt);
        if (it->second.empty()) inverse_.erase(it);
    }
}

} // namespace ifc2lbd::model
