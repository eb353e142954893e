// =============================================================================
// subgraph_extractor.hpp - Per-product geometry from a kernel triple buffer
// =============================================================================
//
// The geometry kernel writes one Turtle document for the whole model. Every
// geo:Feature subject in it carries the product GUID in its local name. The
// extractor indexes those features by compressed GUID and replays the
// subgraph below each feature breadth-first, with the feature itself renamed
// to the product's instance IRI.
//
// Walks are lazy: SubgraphWalk::next() produces one rendered statement at a
// time. Each node is expanded once per walk, literals are never expanded, and
// the number of expanded nodes is capped by ExtractorOptions::max_nodes.
// =============================================================================

#pragma once

#include "ifc2lbd/namespaces.hpp"
#include "ifc2lbd/rdf/triple_store.hpp"
#include "ifc2lbd/ttl/streaming_serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ifc2lbd::geometry {

struct ExtractorOptions {
    NamespaceTable namespaces;          // compaction table for rendered terms
    int wkt_precision = 6;
    std::string derived_marker = "body_footprint_geometry";
    std::size_t max_nodes = 1000000;
    std::string guid_attribute = "GlobalId";
    // Annotation predicates left out of every walk
    std::vector<std::string> skipped_predicates = {
        std::string(ns::RDFS) + "label",
        std::string(ns::DCTERMS) + "identifier",
    };
};

struct RenderedTriple {
    std::string subject;
    std::string predicate;
    std::string object;
};

// Rounds every number in a WKT string to `precision` decimals, dropping
// trailing zeros and the point; "-0" becomes "0"
std::string round_wkt_numbers(const std::string& wkt, int precision);

class GuidIndexedSubgraphExtractor;

class SubgraphWalk {
public:
    SubgraphWalk(const GuidIndexedSubgraphExtractor& extractor, rdf::Term root, std::string label);

    // false once the subgraph is exhausted
    bool next(RenderedTriple& out);

    // True when the node ceiling stopped the walk from expanding further
    bool truncated() const { return truncated_; }
    std::size_t visited() const { return visited_.size(); }

private:
    bool advance_node();
    void enqueue(const rdf::Term& node);

    const GuidIndexedSubgraphExtractor& extractor_;
    rdf::Term root_;
    std::string label_;

    std::deque<rdf::Term> queue_;
    std::unordered_set<rdf::Term, rdf::TermHash> visited_;
    const std::vector<std::size_t>* current_ = nullptr;
    std::size_t position_ = 0;
    bool truncated_ = false;
};

class GuidIndexedSubgraphExtractor : public ttl::GeometryBlockProvider {
public:
    GuidIndexedSubgraphExtractor(rdf::TripleStore store, ExtractorOptions options);

    static GuidIndexedSubgraphExtractor from_file(const std::string& path, ExtractorOptions options);
    static GuidIndexedSubgraphExtractor from_string(const std::string& turtle, ExtractorOptions options);

    // Feature subjects for a compressed GUID, buffer order; empty when unknown
    const std::vector<rdf::Term>& features_for(const std::string& guid) const;

    SubgraphWalk walk(const rdf::Term& root, std::string label) const;

    // prefix:local, <iri>, _:label or a literal in Turtle syntax
    std::string render(const rdf::Term& term) const;

    std::size_t feature_count() const { return feature_count_; }
    std::size_t guid_count() const { return index_.size(); }

    const rdf::TripleStore& store() const { return store_; }
    const ExtractorOptions& options() const { return options_; }

    // Emits the subgraphs of every feature matching the entity's GUID attribute
    std::uint64_t write_geometry(const Entity& entity, const std::string& subject,
                                 std::string& out) const override;

private:
    friend class SubgraphWalk;

    void build_index();
    bool skipped(const rdf::Triple& triple) const;

    rdf::TripleStore store_;
    ExtractorOptions options_;
    std::unordered_map<std::string, std::vector<rdf::Term>> index_;
    std::unordered_set<std::string> skipped_predicates_;
    std::size_t feature_count_ = 0;
};

} // namespace ifc2lbd::geometry
