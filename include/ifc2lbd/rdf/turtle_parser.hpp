// =============================================================================
// turtle_parser.hpp - Turtle reader for geometry triple buffers
// =============================================================================
// Thin layer over serd's streaming reader: statements arrive through a sink,
// IRIs and prefixed names are expanded against the document's @base/@prefix
// declarations and the results are added to a TripleStore. Blank node labels
// generated for [ ] and ( ) never collide with labels written in the
// document.
// =============================================================================

#pragma once

#include "ifc2lbd/namespaces.hpp"
#include "ifc2lbd/rdf/term.hpp"
#include "ifc2lbd/rdf/triple_store.hpp"

#include <string>

namespace ifc2lbd::rdf {

class TurtleParser {
public:
    explicit TurtleParser(std::string base_iri = "");

    // Throws ParseError; syntax errors carry the line reported by the reader
    void parse(const std::string& text, TripleStore& store);

    // Throws IOError when the file cannot be read
    void parse_file(const std::string& path, TripleStore& store);

    // Prefixes declared by the documents parsed so far, declaration order
    const NamespaceTable& prefixes() const { return prefixes_; }
    const std::string& base() const { return base_; }

private:
    friend struct ReaderSink;

    std::string base_;
    NamespaceTable prefixes_;
};

} // namespace ifc2lbd::rdf
