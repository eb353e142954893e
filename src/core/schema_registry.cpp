#include "ifc2lbd/schema_registry.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

namespace ifc2lbd {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::map<std::string, EntityDeclaration> parse_declarations(const YAML::Node& root,
                                                            const std::string& origin) {
    std::map<std::string, EntityDeclaration> decls;
    const YAML::Node entities = root["entities"];
    if (!entities || !entities.IsMap()) {
        throw ConfigurationError("Schema map has no 'entities' mapping", origin);
    }

    for (const auto& entry : entities) {
        const std::string type = entry.first.as<std::string>();
        const YAML::Node& body = entry.second;
        EntityDeclaration decl;

        if (body && body.IsMap()) {
            if (body["supertype"]) decl.supertype = body["supertype"].as<std::string>();
            if (const YAML::Node attrs = body["attributes"]) {
                for (const auto& a : attrs) {
                    const std::string kind_name = a.second.as<std::string>();
                    CollectionKind kind = parse_collection_kind(kind_name);
                    if (kind == CollectionKind::None) {
                        throw ConfigurationError("Unknown collection kind '" + kind_name + "' for " +
                                                 type + "." + a.first.as<std::string>(), origin);
                    }
                    decl.attributes.emplace_back(a.first.as<std::string>(), kind);
                }
            }
        }
        decls.emplace(type, std::move(decl));
    }
    return decls;
}

} // namespace

SchemaRegistry::SchemaRegistry(std::string schema_id,
                               const std::map<std::string, EntityDeclaration>& declarations)
    : schema_id_(std::move(schema_id)) {
    for (const auto& [type, decl] : declarations) {
        if (!decl.supertype.empty()) supertypes_[type] = decl.supertype;
    }

    // Flatten: walk each chain upwards, the first (closest) declaration of an attribute wins
    for (const auto& [type, decl] : declarations) {
        auto& flat = kinds_[type];
        std::unordered_set<std::string> visited;
        std::string current = type;

        while (!current.empty()) {
            if (!visited.insert(current).second) {
                LOG_WARN("Schema {}: inheritance cycle through {}", schema_id_, current);
                break;
            }
            auto it = declarations.find(current);
            if (it == declarations.end()) break;
            for (const auto& [attr, kind] : it->second.attributes) {
                flat.emplace(attr, kind);
            }
            current = it->second.supertype;
        }
    }

    LOG_DEBUG("Schema registry {} built with {} entity types", schema_id_, kinds_.size());
}

std::string SchemaRegistry::schema_file_for(const std::string& schema_id) {
    const std::string id = to_upper(schema_id);
    if (id.find("4X3") != std::string::npos) return "ifc4x3_add2.yaml";
    if (id.rfind("IFC4", 0) == 0) return "ifc4.yaml";
    if (id.find("2X3") != std::string::npos) return "ifc2x3.yaml";

    throw ConfigurationError("Unknown schema '" + schema_id + "'", "SchemaRegistry::load",
                             "Supported schemas: IFC2X3, IFC4, IFC4X3_ADD2",
                             ErrorCode::UNKNOWN_SCHEMA);
}

SchemaRegistry SchemaRegistry::load(const std::string& schema_id, const std::string& schema_dir) {
    const std::filesystem::path path = std::filesystem::path(schema_dir) / schema_file_for(schema_id);
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("Schema map not found: " + path.string(), schema_id,
                                 "Set conversion.schema_dir or IFC2LBD_SCHEMA_DIR");
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return SchemaRegistry(schema_id, parse_declarations(root, path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed schema map: ") + e.what(), path.string());
    }
}

SchemaRegistry SchemaRegistry::from_yaml_string(const std::string& schema_id, const std::string& yaml) {
    try {
        return SchemaRegistry(schema_id, parse_declarations(YAML::Load(yaml), "<string>"));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed schema map: ") + e.what(), schema_id);
    }
}

CollectionKind SchemaRegistry::collection_kind(const std::string& type, const std::string& attr) const {
    auto it = kinds_.find(type);
    if (it == kinds_.end()) return CollectionKind::None;
    auto jt = it->second.find(attr);
    return jt == it->second.end() ? CollectionKind::None : jt->second;
}

std::string SchemaRegistry::supertype(const std::string& type) const {
    auto it = supertypes_.find(type);
    return it == supertypes_.end() ? std::string() : it->second;
}

bool SchemaRegistry::is_subtype_of(const std::string& type, const std::string& ancestor) const {
    std::string current = type;
    // Bounded by the number of edges so a cyclic map cannot loop forever
    for (std::size_t steps = 0; steps <= supertypes_.size(); ++steps) {
        if (current == ancestor) return true;
        auto it = supertypes_.find(current);
        if (it == supertypes_.end()) return false;
        current = it->second;
    }
    return false;
}

} // namespace ifc2lbd
