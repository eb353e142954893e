#pragma once

#include "ifc2lbd/config.hpp"

#include <string>
#include <vector>

namespace ifc2lbd {

namespace ns {
inline constexpr const char* RDF = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr const char* RDFS = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr const char* XSD = "http://www.w3.org/2001/XMLSchema#";
inline constexpr const char* OWL = "http://www.w3.org/2002/07/owl#";
inline constexpr const char* GEO = "http://www.opengis.net/ont/geosparql#";
inline constexpr const char* DCTERMS = "http://purl.org/dc/terms/";
inline constexpr const char* INSTANCES = "https://lbd-lbd.lbd/ifc/instances#";
inline constexpr const char* DEFAULT_BASE = "http://example.org/base#";
} // namespace ns

// https://mini-ifc.ifc/<SCHEMA>/#
std::string schema_namespace_uri(const std::string& schema_id);

/**
 * Ordered prefix -> namespace table. Order is significant: it is the order of
 * the PREFIX lines in the output header, and the first matching namespace
 * wins when compacting.
 */
class NamespaceTable {
public:
    NamespaceTable() = default;
    explicit NamespaceTable(std::vector<NamespaceEntry> entries);

    // ifc (schema-dependent), inst, rdf, xsd, owl, geo
    static NamespaceTable defaults(const std::string& schema_id,
                                   const std::string& model_prefix = "ifc",
                                   const std::string& instance_prefix = "inst");

    // Replaces the uri of an existing prefix in place, else appends
    void set(const std::string& prefix, const std::string& uri);

    // nullptr when the prefix is not declared
    const std::string* uri_for(const std::string& prefix) const;

    // prefix:local under the first matching namespace, else <iri>
    std::string compact(const std::string& iri) const;

    const std::vector<NamespaceEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<NamespaceEntry> entries_;
};

} // namespace ifc2lbd
