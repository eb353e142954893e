#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace ifc2lbd::rdf {

struct Term {
    enum class Kind { Iri, BlankNode, Literal };

    Kind kind = Kind::Iri;
    std::string value;       // IRI, blank node label (without "_:"), or lexical form
    std::string datatype;    // literals only; empty for plain strings
    std::string language;    // literals only

    static Term iri(std::string value);
    static Term blank(std::string label);
    static Term literal(std::string lexical, std::string datatype = "", std::string language = "");

    bool is_iri() const { return kind == Kind::Iri; }
    bool is_blank() const { return kind == Kind::BlankNode; }
    bool is_literal() const { return kind == Kind::Literal; }
    bool is_resource() const { return kind != Kind::Literal; }

    bool operator==(const Term& other) const {
        return kind == other.kind && value == other.value &&
               datatype == other.datatype && language == other.language;
    }
    bool operator!=(const Term& other) const { return !(*this == other); }
};

struct TermHash {
    std::size_t operator()(const Term& t) const noexcept;
};

struct Triple {
    Term subject;
    Term predicate;
    Term object;

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
};

struct TripleHash {
    std::size_t operator()(const Triple& t) const noexcept;
};

} // namespace ifc2lbd::rdf
