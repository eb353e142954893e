// =============================================================================
// dependency_resolver.hpp - Which geometry entities become prunable
// =============================================================================
//
// Once shape geometry has been exported to a side channel, the entities that
// described it in the model are dead weight unless something outside the
// geometry still points at them. resolve():
//
//   1. collects the closure of every type-level representation map and every
//      product definition shape (the geometry set),
//   2. severs the two anchor links into that set (type -> representation
//      maps, product -> product definition shape),
//   3. orders the geometry set dependencies-first (Kahn, level by level,
//      ascending ids inside a level; leftover strongly connected components
//      follow in condensation order),
//   4. marks an entity obsolete when all of its remaining referencers lie in
//      the geometry set. A cycle is obsolete only as a whole.
//
// Removal is a separate, explicit prune() call.
// =============================================================================

#pragma once

#include "ifc2lbd/model/model.hpp"
#include "ifc2lbd/schema_registry.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ifc2lbd::geometry {

struct GeometryAnchors {
    std::string type_product = "IfcTypeProduct";
    std::string representation_maps = "RepresentationMaps";
    std::string product_definition_shape = "IfcProductDefinitionShape";
    std::string product_representation = "Representation";
};

struct ResolutionResult {
    std::vector<EntityId> geometry;      // ascending
    std::vector<EntityId> order;         // dependencies first
    std::vector<EntityId> obsolete;      // subsequence of order
    std::size_t severed_links = 0;
    std::size_t cycles = 0;
};

class GeometryDependencyResolver {
public:
    GeometryDependencyResolver(model::Model& model, const SchemaRegistry& registry,
                               GeometryAnchors anchors = {});

    // Severs the anchor links in the model; may be called once
    const ResolutionResult& resolve();

    bool resolved() const { return resolved_; }
    const ResolutionResult& result() const { return result_; }

    // Removes the obsolete entities in order; returns how many were removed
    std::size_t prune();

private:
    std::vector<EntityId> collect_geometry();
    void order_geometry(const std::vector<EntityId>& geometry);
    void mark_obsolete();

    model::Model& model_;
    const SchemaRegistry& registry_;
    GeometryAnchors anchors_;

    ResolutionResult result_;
    // Evaluation units in order: single entities, or whole cycles
    std::vector<std::vector<EntityId>> units_;
    bool resolved_ = false;
    bool pruned_ = false;
};

} // namespace ifc2lbd::geometry
