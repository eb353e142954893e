#include "ifc2lbd/geometry/dependency_resolver.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace ifc2lbd::geometry {

GeometryDependencyResolver::GeometryDependencyResolver(model::Model& model, const SchemaRegistry& registry,
                                                       GeometryAnchors anchors)
    : model_(model), registry_(registry), anchors_(std::move(anchors)) {}

const ResolutionResult& GeometryDependencyResolver::resolve() {
    if (resolved_) return result_;

    std::vector<EntityId> geometry = collect_geometry();
    order_geometry(geometry);
    result_.geometry = std::move(geometry);
    mark_obsolete();
    resolved_ = true;

    LOG_INFO("Geometry resolution: {} geometry entities, {} obsolete, {} anchor links severed",
             result_.geometry.size(), result_.obsolete.size(), result_.severed_links);
    return result_;
}

std::vector<EntityId> GeometryDependencyResolver::collect_geometry() {
    std::set<EntityId> geometry;

    // Type geometry is not kept; drop the maps so they retain nothing
    for (EntityId type_id : model_.by_type(anchors_.type_product, &registry_)) {
        const AttributeValue* maps = model_.get(type_id)->find(anchors_.representation_maps);
        if (!maps || maps->is_null()) continue;

        std::vector<EntityId> roots;
        collect_references(*maps, roots);
        for (EntityId root : roots) {
            for (EntityId id : model_.traverse(root)) geometry.insert(id);
        }
        model_.set_attribute_null(type_id, anchors_.representation_maps);
        ++result_.severed_links;
    }

    for (EntityId shape_id : model_.by_type(anchors_.product_definition_shape, &registry_)) {
        for (EntityId id : model_.traverse(shape_id)) geometry.insert(id);

        // Products lose their in-edge into the shape
        for (EntityId product : model_.referencers_via(shape_id, anchors_.product_representation)) {
            model_.set_attribute_null(product, anchors_.product_representation);
            ++result_.severed_links;
        }
    }

    return std::vector<EntityId>(geometry.begin(), geometry.end());
}

void GeometryDependencyResolver::order_geometry(const std::vector<EntityId>& geometry) {
    const std::unordered_set<EntityId> in_set(geometry.begin(), geometry.end());

    // Depth-1 edges, referencer -> referenced, restricted to the geometry set
    std::unordered_map<EntityId, std::vector<EntityId>> deps;
    std::unordered_map<EntityId, std::vector<EntityId>> dependents;
    std::unordered_map<EntityId, std::size_t> pending;
    for (EntityId id : geometry) {
        auto& d = deps[id];
        for (EntityId target : model_.references(id)) {
            if (in_set.count(target)) {
                d.push_back(target);
                dependents[target].push_back(id);
            }
        }
        pending[id] = d.size();
    }

    // Kahn, one level at a time
    std::vector<EntityId> level;
    for (EntityId id : geometry) {
        if (pending[id] == 0) level.push_back(id);
    }
    std::size_t emitted = 0;
    while (!level.empty()) {
        std::sort(level.begin(), level.end());
        std::vector<EntityId> next;
        for (EntityId id : level) {
            result_.order.push_back(id);
            units_.push_back({id});
            ++emitted;
            for (EntityId dependent : dependents[id]) {
                if (--pending[dependent] == 0) next.push_back(dependent);
            }
        }
        level.swap(next);
    }
    if (emitted == geometry.size()) return;

    // Leftovers sit on or behind a cycle. Iterative Tarjan emits components
    // dependencies-first because edges point at dependencies.
    std::vector<EntityId> leftover;
    for (EntityId id : geometry) {
        if (pending[id] != 0) leftover.push_back(id);
    }
    const std::unordered_set<EntityId> left_set(leftover.begin(), leftover.end());

    std::unordered_map<EntityId, std::size_t> index;
    std::unordered_map<EntityId, std::size_t> lowlink;
    std::unordered_set<EntityId> on_stack;
    std::vector<EntityId> stack;
    std::size_t counter = 0;

    struct Frame {
        EntityId node;
        std::size_t edge;
    };

    for (EntityId start : leftover) {
        if (index.count(start)) continue;

        std::vector<Frame> call{{start, 0}};
        index[start] = lowlink[start] = counter++;
        stack.push_back(start);
        on_stack.insert(start);

        while (!call.empty()) {
            Frame& frame = call.back();
            const auto& edges = deps[frame.node];

            if (frame.edge < edges.size()) {
                EntityId target = edges[frame.edge++];
                if (!left_set.count(target)) continue;
                if (!index.count(target)) {
                    index[target] = lowlink[target] = counter++;
                    stack.push_back(target);
                    on_stack.insert(target);
                    call.push_back({target, 0});
                } else if (on_stack.count(target)) {
                    lowlink[frame.node] = std::min(lowlink[frame.node], index[target]);
                }
                continue;
            }

            EntityId node = frame.node;
            call.pop_back();
            if (!call.empty()) {
                EntityId parent = call.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[node]);
            }

            if (lowlink[node] == index[node]) {
                std::vector<EntityId> component;
                EntityId member;
                do {
                    member = stack.back();
                    stack.pop_back();
                    on_stack.erase(member);
                    component.push_back(member);
                } while (member != node);

                std::sort(component.begin(), component.end());
                result_.order.insert(result_.order.end(), component.begin(), component.end());
                units_.push_back(std::move(component));
            }
        }
    }
}

void GeometryDependencyResolver::mark_obsolete() {
    const std::unordered_set<EntityId> in_set(result_.geometry.begin(), result_.geometry.end());

    auto only_geometry_referencers = [&](EntityId id) {
        for (EntityId referencer : model_.inverse(id)) {
            if (!in_set.count(referencer)) return false;
        }
        return true;
    };

    for (const auto& unit : units_) {
        bool cyclic = unit.size() > 1;
        if (!cyclic) {
            auto refs = model_.references(unit.front());
            cyclic = std::find(refs.begin(), refs.end(), unit.front()) != refs.end();
        }

        bool obsolete = std::all_of(unit.begin(), unit.end(), only_geometry_referencers);

        if (cyclic) {
            ++result_.cycles;
            LOG_WARN("Dependency cycle among {} geometry entities starting at #{} ({})",
                     unit.size(), unit.front(), obsolete ? "obsolete as a whole" : "retained");
        }
        if (obsolete) {
            result_.obsolete.insert(result_.obsolete.end(), unit.begin(), unit.end());
        }
    }
}

std::size_t GeometryDependencyResolver::prune() {
    if (!resolved_) {
        throw Ifc2LbdException(ErrorCode::INVALID_ARGUMENT, "prune() called before resolve()",
                               "GeometryDependencyResolver");
    }
    if (pruned_) return 0;

    std::size_t removed = 0;
    for (EntityId id : result_.obsolete) {
        if (!model_.contains(id)) continue;
        model_.remove(id);
        ++removed;
    }
    pruned_ = true;
    LOG_INFO("Pruned {} obsolete geometry entities", removed);
    return removed;
}

} // namespace ifc2lbd::geometry
