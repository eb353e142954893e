#include "ifc2lbd/rdf/triple_store.hpp"
#include "ifc2lbd/namespaces.hpp"

namespace ifc2lbd::rdf {

bool TripleStore::add(Triple triple) {
    if (!present_.insert(triple).second) return false;
    by_subject_[triple.subject].push_back(triples_.size());
    triples_.push_back(std::move(triple));
    return true;
}

const std::vector<std::size_t>& TripleStore::by_subject(const Term& subject) const {
    static const std::vector<std::size_t> none;
    auto it = by_subject_.find(subject);
    return it == by_subject_.end() ? none : it->second;
}

std::vector<Term> TripleStore::subjects_with(const Term& predicate, const Term& object) const {
    std::vector<Term> result;
    std::unordered_set<Term, TermHash> seen;
    for (const auto& t : triples_) {
        if (t.predicate == predicate && t.object == object && seen.insert(t.subject).second) {
            result.push_back(t.subject);
        }
    }
    return result;
}

std::vector<Term> TripleStore::subjects_of_type(const std::string& type_iri) const {
    return subjects_with(Term::iri(std::string(ns::RDF) + "type"), Term::iri(type_iri));
}

} // namespace ifc2lbd::rdf
