#include "ifc2lbd/namespaces.hpp"

#include <algorithm>
#include <cctype>

namespace ifc2lbd {

namespace {

// Conservative PN_LOCAL check: anything else is written as a full IRI
bool is_safe_local(const std::string& local) {
    if (local.empty()) return true;
    if (local.back() == '.') return false;
    return std::all_of(local.begin(), local.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c >= 0x80;
    });
}

} // namespace

std::string schema_namespace_uri(const std::string& schema_id) {
    return "https://mini-ifc.ifc/" + schema_id + "/#";
}

NamespaceTable::NamespaceTable(std::vector<NamespaceEntry> entries) {
    for (auto& e : entries) set(e.prefix, e.uri);
}

NamespaceTable NamespaceTable::defaults(const std::string& schema_id,
                                        const std::string& model_prefix,
                                        const std::string& instance_prefix) {
    NamespaceTable table;
    table.set(model_prefix, schema_namespace_uri(schema_id));
    table.set(instance_prefix, ns::INSTANCES);
    table.set("rdf", ns::RDF);
    table.set("xsd", ns::XSD);
    table.set("owl", ns::OWL);
    table.set("geo", ns::GEO);
    return table;
}

void NamespaceTable::set(const std::string& prefix, const std::string& uri) {
    for (auto& e : entries_) {
        if (e.prefix == prefix) {
            e.uri = uri;
            return;
        }
    }
    entries_.push_back({prefix, uri});
}

const std::string* NamespaceTable::uri_for(const std::string& prefix) const {
    for (const auto& e : entries_) {
        if (e.prefix == prefix) return &e.uri;
    }
    return nullptr;
}

std::string NamespaceTable::compact(const std::string& iri) const {
    for (const auto& e : entries_) {
        if (e.uri.empty() || iri.compare(0, e.uri.size(), e.uri) != 0) continue;
        std::string local = iri.substr(e.uri.size());
        if (is_safe_local(local)) return e.prefix + ":" + local;
    }
    return "<" + iri + ">";
}

} // namespace ifc2lbd
