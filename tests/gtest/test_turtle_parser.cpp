// =============================================================================
// Turtle Parser Tests
// =============================================================================

#include <gtest/gtest.h>
#include <set>
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/namespaces.hpp"
#include "ifc2lbd/rdf/turtle_parser.hpp"

using namespace ifc2lbd;
using namespace ifc2lbd::rdf;

namespace {

const std::string RDF = ns::RDF;
const std::string XSD = ns::XSD;

} // namespace

class TurtleParserTest : public ::testing::Test {
protected:
    const std::vector<Triple>& parse(const std::string& text) {
        parser_.parse(text, store_);
        return store_.triples();
    }

    TurtleParser parser_;
    TripleStore store_;
};

TEST_F(TurtleParserTest, PrefixedStatements) {
    const auto& t = parse(R"(
@prefix ex: <http://example.org/> .
PREFIX geo: <http://www.opengis.net/ont/geosparql#>

ex:f1 a geo:Feature ;
      ex:label "one" , "uno" .
)");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[0].subject, Term::iri("http://example.org/f1"));
    EXPECT_EQ(t[0].predicate, Term::iri(RDF + "type"));
    EXPECT_EQ(t[0].object, Term::iri("http://www.opengis.net/ont/geosparql#Feature"));
    EXPECT_EQ(t[1].object, Term::literal("one"));
    EXPECT_EQ(t[2].object, Term::literal("uno"));

    ASSERT_NE(parser_.prefixes().uri_for("ex"), nullptr);
    EXPECT_EQ(*parser_.prefixes().uri_for("geo"), "http://www.opengis.net/ont/geosparql#");
}

TEST_F(TurtleParserTest, LiteralForms) {
    const auto& t = parse(R"ttl(
@prefix ex: <http://example.org/> .
@prefix geo: <http://www.opengis.net/ont/geosparql#> .
ex:s ex:a "POINT(1 2)"^^geo:wktLiteral ;
     ex:b "hallo"@de ;
     ex:c 42 ;
     ex:d -1.5 ;
     ex:e 1.0e3 ;
     ex:f true ;
     ex:g """two
lines""" ;
     ex:h 'single' ;
     ex:i "tab\there \u00E9" ;
     ex:j "x"^^<http://example.org/dt> .
)ttl");
    ASSERT_EQ(t.size(), 10u);
    EXPECT_EQ(t[0].object, Term::literal("POINT(1 2)", "http://www.opengis.net/ont/geosparql#wktLiteral"));
    EXPECT_EQ(t[1].object, Term::literal("hallo", "", "de"));
    EXPECT_EQ(t[2].object, Term::literal("42", XSD + "integer"));
    EXPECT_EQ(t[3].object, Term::literal("-1.5", XSD + "decimal"));
    EXPECT_EQ(t[4].object, Term::literal("1.0e3", XSD + "double"));
    EXPECT_EQ(t[5].object, Term::literal("true", XSD + "boolean"));
    EXPECT_EQ(t[6].object, Term::literal("two\nlines"));
    EXPECT_EQ(t[7].object, Term::literal("single"));
    EXPECT_EQ(t[8].object, Term::literal("tab\there \xC3\xA9"));
    EXPECT_EQ(t[9].object, Term::literal("x", "http://example.org/dt"));
}

TEST_F(TurtleParserTest, StatementEndingInNumberOrName) {
    const auto& t = parse("@prefix ex: <http://example.org/> .\nex:s ex:n 7.\nex:s ex:o ex:t.\n");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0].object, Term::literal("7", XSD + "integer"));
    EXPECT_EQ(t[1].object, Term::iri("http://example.org/t"));
}

TEST_F(TurtleParserTest, BlankNodes) {
    const auto& t = parse(R"ttl(
@prefix ex: <http://example.org/> .
ex:s ex:geom _:g1 .
_:g1 ex:wkt "POINT(0 0)" .
ex:s ex:anon [ ex:p ex:o ] .
[ ex:q "free" ] .
)ttl");
    ASSERT_EQ(t.size(), 5u);
    EXPECT_EQ(t[0].object, Term::blank("g1"));
    EXPECT_EQ(t[1].subject, Term::blank("g1"));

    // [ ] allocates a fresh node; the enclosing statement comes first
    EXPECT_EQ(t[2].predicate, Term::iri("http://example.org/anon"));
    EXPECT_TRUE(t[2].object.is_blank());
    EXPECT_EQ(t[3].subject, t[2].object);
    EXPECT_EQ(t[3].predicate, Term::iri("http://example.org/p"));
    EXPECT_TRUE(t[4].subject.is_blank());
    EXPECT_NE(t[4].subject, t[2].object);
    EXPECT_NE(t[4].subject, Term::blank("g1"));
}

TEST_F(TurtleParserTest, GeneratedBlankNodesNeverReuseDocumentLabels) {
    const auto& t = parse(R"(
@prefix e: <http://example.org/> .
_:genid0 e:p "user" .
e:a e:q [ e:r "anon" ] .
)");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[0].subject, Term::blank("genid0"));
    EXPECT_NE(t[2].subject, t[0].subject);
    EXPECT_NE(t[2].subject, t[1].subject);
    EXPECT_EQ(store_.by_subject(t[0].subject).size(), 1u);
    EXPECT_EQ(store_.by_subject(t[2].subject).size(), 1u);
}

TEST_F(TurtleParserTest, DocumentLabelsShapedLikeGeneratedOnesStayDistinct) {
    const auto& t = parse(R"(
@prefix e: <http://example.org/> .
_:b1 e:p "user" .
e:a e:q [ e:r "anon" ] , [ e:r "other" ] .
)");
    ASSERT_EQ(t.size(), 5u);
    std::set<std::string> blanks;
    for (const auto& triple : t) {
        if (triple.subject.is_blank()) blanks.insert(triple.subject.value);
    }
    EXPECT_EQ(blanks.size(), 3u);
    EXPECT_EQ(store_.by_subject(t[0].subject).size(), 1u);
}

TEST_F(TurtleParserTest, Collections) {
    const auto& t = parse(R"(
@prefix ex: <http://example.org/> .
ex:s ex:list ( 1 ex:b ) ;
     ex:empty ( ) .
)");
    ASSERT_EQ(t.size(), 6u);
    const Term first = Term::iri(RDF + "first");
    const Term rest = Term::iri(RDF + "rest");
    const Term nil = Term::iri(RDF + "nil");

    EXPECT_EQ(t[0].subject, Term::iri("http://example.org/s"));
    EXPECT_TRUE(t[0].object.is_blank());
    EXPECT_EQ(t[1].subject, t[0].object);
    EXPECT_EQ(t[1].predicate, first);
    EXPECT_EQ(t[1].object, Term::literal("1", XSD + "integer"));
    EXPECT_EQ(t[2].predicate, rest);
    EXPECT_EQ(t[3].subject, t[2].object);
    EXPECT_EQ(t[3].object, Term::iri("http://example.org/b"));
    EXPECT_EQ(t[4].predicate, rest);
    EXPECT_EQ(t[4].object, nil);
    EXPECT_EQ(t[5].predicate, Term::iri("http://example.org/empty"));
    EXPECT_EQ(t[5].object, nil);
}

TEST_F(TurtleParserTest, BaseResolution) {
    const auto& t = parse(R"(
@base <http://example.org/dir/doc> .
<#frag> <p> <../up> .
BASE <http://other.org/x/>
<y> <http://example.org/abs> <z> .
)");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0].subject, Term::iri("http://example.org/dir/doc#frag"));
    EXPECT_EQ(t[0].predicate, Term::iri("http://example.org/dir/p"));
    EXPECT_EQ(t[1].subject, Term::iri("http://other.org/x/y"));
    EXPECT_EQ(t[1].predicate, Term::iri("http://example.org/abs"));
    EXPECT_EQ(parser_.base(), "http://other.org/x/");
}

TEST_F(TurtleParserTest, CommentsAndDuplicates) {
    const auto& t = parse(R"(
# leading comment
@prefix ex: <http://example.org/> .   # trailing comment
ex:s ex:p ex:o .
ex:s ex:p ex:o .
ex:s ex:p ex:o ;
     ex:q "#not a comment" ;
     .
)");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[1].object, Term::literal("#not a comment"));
}

TEST_F(TurtleParserTest, SubjectIndex) {
    parse(R"(
@prefix ex: <http://example.org/> .
@prefix geo: <http://www.opengis.net/ont/geosparql#> .
ex:f1 a geo:Feature ; ex:n 1 .
ex:f2 a geo:Feature .
ex:f1 ex:m 2 .
)");
    EXPECT_EQ(store_.by_subject(Term::iri("http://example.org/f1")), (std::vector<std::size_t>{0, 1, 3}));
    EXPECT_TRUE(store_.by_subject(Term::iri("http://example.org/none")).empty());

    auto features = store_.subjects_of_type("http://www.opengis.net/ont/geosparql#Feature");
    ASSERT_EQ(features.size(), 2u);
    EXPECT_EQ(features[0], Term::iri("http://example.org/f1"));
    EXPECT_EQ(features[1], Term::iri("http://example.org/f2"));
}

TEST_F(TurtleParserTest, UnknownPrefixIsRejected) {
    try {
        parse("@prefix ex: <http://example.org/> .\n\nex:s ex:p missing:o .\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(e.message().find("unknown prefix 'missing'"), std::string::npos);
    }
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(TurtleParserTest, SyntaxErrorsCarryLineNumbers) {
    try {
        parse("@prefix ex: <http://example.org/> .\n\nex:s ex:p ^ .\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 3u);
    }
}

TEST_F(TurtleParserTest, MalformedDocuments) {
    EXPECT_THROW(parse("<http://a> <http://b> \"open"), ParseError);
    EXPECT_THROW(parse("<http://a> <http://b> <http://c d> ."), ParseError);
    EXPECT_THROW(parse("@prefix ex <http://example.org/> ."), ParseError);
    EXPECT_THROW(parse("@unknown <x> ."), ParseError);
    EXPECT_THROW(parse("<http://a> \"lit\" <http://c> ."), ParseError);
    EXPECT_THROW(parse("<http://a> <http://b> ( 1 2"), ParseError);
    EXPECT_THROW(parse("<http://a> <http://b> ^ ."), ParseError);
}

TEST_F(TurtleParserTest, MissingFileIsIOError) {
    EXPECT_THROW(parser_.parse_file("/nonexistent/ifc2lbd/geometry.ttl", store_), IOError);
}
