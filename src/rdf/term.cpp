#include "ifc2lbd/rdf/term.hpp"

namespace ifc2lbd::rdf {

namespace {

inline void hash_combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

Term Term::iri(std::string value) {
    Term t;
    t.kind = Kind::Iri;
    t.value = std::move(value);
    return t;
}

Term Term::blank(std::string label) {
    Term t;
    t.kind = Kind::BlankNode;
    t.value = std::move(label);
    return t;
}

Term Term::literal(std::string lexical, std::string datatype, std::string language) {
    Term t;
    t.kind = Kind::Literal;
    t.value = std::move(lexical);
    t.datatype = std::move(datatype);
    t.language = std::move(language);
    return t;
}

std::size_t TermHash::operator()(const Term& t) const noexcept {
    std::size_t seed = static_cast<std::size_t>(t.kind);
    hash_combine(seed, std::hash<std::string>{}(t.value));
    if (t.kind == Term::Kind::Literal) {
        hash_combine(seed, std::hash<std::string>{}(t.datatype));
        hash_combine(seed, std::hash<std::string>{}(t.language));
    }
    return seed;
}

std::size_t TripleHash::operator()(const Triple& t) const noexcept {
    TermHash h;
    std::size_t seed = h(t.subject);
    hash_combine(seed, h(t.predicate));
    hash_combine(seed, h(t.object));
    return seed;
}

} // namespace ifc2lbd::rdf
