// =============================================================================
// schema_registry.hpp - (entity type, attribute) -> collection kind
// =============================================================================
// Built once from a precomputed schema map and passed by reference to every
// consumer. Inheritance is flattened at construction, so lookups are a pair
// of hash finds. Unknown types and attributes answer CollectionKind::None.
// =============================================================================

#pragma once

#include "ifc2lbd/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ifc2lbd {

struct EntityDeclaration {
    std::string supertype;
    std::vector<std::pair<std::string, CollectionKind>> attributes;
};

class SchemaRegistry {
public:
    SchemaRegistry(std::string schema_id, const std::map<std::string, EntityDeclaration>& declarations);

    /**
     * Load the shipped map for a schema identifier.
     * @param schema_id e.g. "IFC4X3_ADD2", "IFC4", "IFC2X3" (case-insensitive)
     * @param schema_dir directory holding the *.yaml maps
     * @throws ConfigurationError for unknown schemas or unreadable maps
     */
    static SchemaRegistry load(const std::string& schema_id, const std::string& schema_dir);

    // Same YAML layout as the shipped files
    static SchemaRegistry from_yaml_string(const std::string& schema_id, const std::string& yaml);

    // File name of the map serving schema_id; throws ConfigurationError when none does
    static std::string schema_file_for(const std::string& schema_id);

    CollectionKind collection_kind(const std::string& type, const std::string& attr) const;

    // Empty when the type is a root or unknown
    std::string supertype(const std::string& type) const;

    // Reflexive; walks the supertype chain
    bool is_subtype_of(const std::string& type, const std::string& ancestor) const;

    bool knows(const std::string& type) const { return kinds_.count(type) != 0; }
    const std::string& schema_id() const { return schema_id_; }
    std::size_t entity_count() const { return kinds_.size(); }

private:
    std::string schema_id_;
    std::unordered_map<std::string, std::unordered_map<std::string, CollectionKind>> kinds_;
    std::unordered_map<std::string, std::string> supertypes_;
};

} // namespace ifc2lbd
