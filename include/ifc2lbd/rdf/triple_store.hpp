#pragma once

#include "ifc2lbd/rdf/term.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ifc2lbd::rdf {

/**
 * Insertion-ordered set of triples with a subject index. Adding a triple
 * that is already present is a no-op, as in an RDF graph.
 */
class TripleStore {
public:
    // false when the triple was already present
    bool add(Triple triple);

    std::size_t size() const { return triples_.size(); }
    const std::vector<Triple>& triples() const { return triples_; }

    // Positions in triples() of the statements about `subject`, insertion order
    const std::vector<std::size_t>& by_subject(const Term& subject) const;

    // Distinct subjects having (predicate, object), first-appearance order
    std::vector<Term> subjects_with(const Term& predicate, const Term& object) const;

    // Shorthand for subjects_with(rdf:type, <type_iri>)
    std::vector<Term> subjects_of_type(const std::string& type_iri) const;

private:
    std::vector<Triple> triples_;
    std::unordered_set<Triple, TripleHash> present_;
    std::unordered_map<Term, std::vector<std::size_t>, TermHash> by_subject_;
};

} // namespace ifc2lbd::rdf
