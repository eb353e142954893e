// =============================================================================
// model.hpp - In-memory entity store with an inverse-reference index
// =============================================================================
// Used where the whole model must be visible at once (geometry dependency
// resolution and pruning). Iteration follows insertion order, which is the
// order of the source stream.
// =============================================================================

#pragma once

#include "ifc2lbd/schema_registry.hpp"
#include "ifc2lbd/stream/entity_stream.hpp"
#include "ifc2lbd/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace ifc2lbd::model {

class Model {
public:
    Model() = default;
    explicit Model(std::string schema_id) : schema_id_(std::move(schema_id)) {}

    /**
     * Read every record of the stream. Records without id or type are
     * dropped and counted in `dropped`; a repeated id replaces nothing and is
     * dropped as well.
     */
    static Model load(stream::EntityStream& input, std::size_t* dropped = nullptr);

    // Throws InvalidArgumentError for id 0, empty type or a duplicate id
    void add(Entity entity);

    const Entity* get(EntityId id) const;
    bool contains(EntityId id) const { return entities_.count(id) != 0; }
    std::size_t size() const { return entities_.size(); }
    const std::string& schema_id() const { return schema_id_; }

    // Ids of entities of `type`, or of any subtype when a registry is given
    std::vector<EntityId> by_type(const std::string& type, const SchemaRegistry* registry = nullptr) const;

    /**
     * Breadth-first closure over forward references, start included.
     * max_levels < 0 means unbounded; 1 gives the start and its direct targets.
     * References to ids not in the model are not followed.
     */
    std::vector<EntityId> traverse(EntityId start, int max_levels = -1) const;

    // Distinct direct targets present in the model, in attribute order
    std::vector<EntityId> references(EntityId id) const;

    // Distinct entities referencing `id`, ascending
    std::vector<EntityId> inverse(EntityId id) const;

    // Entities whose attribute `attr` references `target`
    std::vector<EntityId> referencers_via(EntityId target, const std::string& attr) const;

    // Throws InvalidArgumentError when the entity does not exist
    void set_attribute_null(EntityId id, const std::string& attr);

    /**
     * Remove an entity. Attributes of other entities that pointed at it lose
     * the reference: direct references become null, collection items are
     * dropped.
     */
    void remove(EntityId id);

    // Snapshot in insertion order
    std::vector<Entity> entities() const;

private:
    void index_references(EntityId owner, const AttributeValue& value);
    void unindex_references(EntityId owner, const AttributeValue& value);

    std::string schema_id_;
    std::unordered_map<EntityId, Entity> entities_;
    std::vector<EntityId> order_;
    // target -> (referencer -> number of references)
    std::unordered_map<EntityId, std::map<EntityId, std::size_t>> inverse_;
};

} // namespace ifc2lbd::model
