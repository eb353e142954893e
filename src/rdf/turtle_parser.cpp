#include "ifc2lbd/rdf/turtle_parser.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

#include <serd/serd.h>

namespace ifc2lbd::rdf {

namespace {

std::string node_text(const SerdNode* node) {
    return std::string(reinterpret_cast<const char*>(node->buf), node->n_bytes);
}

const uint8_t* to_utf8(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.c_str());
}

} // namespace

// ============================================================================
// ReaderSink - receives serd callbacks for one document
// ============================================================================

struct ReaderSink {
    ReaderSink(TurtleParser& parser, TripleStore& store, std::string origin)
        : parser(parser), store(store), origin(std::move(origin)) {
        SerdNode base = serd_node_from_string(SERD_URI, to_utf8(parser.base_));
        env = serd_env_new(parser.base_.empty() ? nullptr : &base);
        for (const auto& entry : parser.prefixes_.entries()) {
            SerdNode name = serd_node_from_string(SERD_LITERAL, to_utf8(entry.prefix));
            SerdNode uri = serd_node_from_string(SERD_URI, to_utf8(entry.uri));
            serd_env_set_prefix(env, &name, &uri);
        }
    }

    ~ReaderSink() { serd_env_free(env); }

    ReaderSink(const ReaderSink&) = delete;
    ReaderSink& operator=(const ReaderSink&) = delete;

    // Expands a URI or CURIE node; false when a prefix is undeclared
    bool expand(const SerdNode* node, std::string& out) {
        SerdNode expanded = serd_env_expand_node(env, node);
        if (!expanded.buf) {
            const std::string curie = node_text(node);
            fail("unknown prefix '" + curie.substr(0, curie.find(':')) + "' in " + curie, 0);
            return false;
        }
        out = node_text(&expanded);
        serd_node_free(&expanded);
        return true;
    }

    bool to_term(const SerdNode* node, const SerdNode* datatype, const SerdNode* lang, Term& out) {
        switch (node->type) {
            case SERD_BLANK:
                out = Term::blank(node_text(node));
                return true;
            case SERD_URI:
            case SERD_CURIE: {
                std::string iri;
                if (!expand(node, iri)) return false;
                out = Term::iri(std::move(iri));
                return true;
            }
            case SERD_LITERAL: {
                std::string dt;
                if (datatype && datatype->buf && !expand(datatype, dt)) return false;
                out = Term::literal(node_text(node), std::move(dt), lang && lang->buf ? node_text(lang) : "");
                return true;
            }
            default:
                fail("unexpected node type", 0);
                return false;
        }
    }

    void set_base(std::string iri) { parser.base_ = std::move(iri); }
    void add_prefix(const std::string& name, const std::string& uri) { parser.prefixes_.set(name, uri); }

    void fail(std::string message, std::size_t line) {
        if (failed) return;
        failed = true;
        error = std::move(message);
        error_line = line;
    }

    TurtleParser& parser;
    TripleStore& store;
    std::string origin;
    SerdEnv* env = nullptr;

    bool failed = false;
    std::string error;
    std::size_t error_line = 0;
    std::size_t added = 0;
};

namespace {

SerdStatus on_base(void* handle, const SerdNode* uri) {
    auto* sink = static_cast<ReaderSink*>(handle);
    if (sink->failed) return SERD_FAILURE;

    SerdStatus st = serd_env_set_base_uri(sink->env, uri);
    if (st != SERD_SUCCESS) {
        sink->fail("invalid base IRI <" + node_text(uri) + ">", 0);
        return st;
    }
    sink->set_base(node_text(serd_env_get_base_uri(sink->env, nullptr)));
    return SERD_SUCCESS;
}

SerdStatus on_prefix(void* handle, const SerdNode* name, const SerdNode* uri) {
    auto* sink = static_cast<ReaderSink*>(handle);
    if (sink->failed) return SERD_FAILURE;

    SerdStatus st = serd_env_set_prefix(sink->env, name, uri);
    if (st != SERD_SUCCESS) {
        sink->fail("invalid namespace IRI <" + node_text(uri) + "> for prefix '" + node_text(name) + "'", 0);
        return st;
    }
    std::string resolved;
    if (!sink->expand(uri, resolved)) return SERD_FAILURE;
    sink->add_prefix(node_text(name), resolved);
    return SERD_SUCCESS;
}

SerdStatus on_statement(void* handle, SerdStatementFlags /*flags*/, const SerdNode* /*graph*/,
                        const SerdNode* subject, const SerdNode* predicate, const SerdNode* object,
                        const SerdNode* object_datatype, const SerdNode* object_lang) {
    auto* sink = static_cast<ReaderSink*>(handle);
    if (sink->failed) return SERD_FAILURE;

    Triple triple;
    if (!sink->to_term(subject, nullptr, nullptr, triple.subject) ||
        !sink->to_term(predicate, nullptr, nullptr, triple.predicate) ||
        !sink->to_term(object, object_datatype, object_lang, triple.object)) {
        return SERD_ERR_BAD_CURIE;
    }
    if (sink->store.add(std::move(triple))) ++sink->added;
    return SERD_SUCCESS;
}

SerdStatus on_error(void* handle, const SerdError* error) {
    auto* sink = static_cast<ReaderSink*>(handle);

    char message[512];
    va_list args;
    va_copy(args, *error->args);
    std::vsnprintf(message, sizeof(message), error->fmt, args);
    va_end(args);

    std::string text(message);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    sink->fail(std::move(text), error->line);
    return SERD_SUCCESS;
}

struct ReaderDeleter {
    void operator()(SerdReader* reader) const { serd_reader_free(reader); }
};

using ReaderPtr = std::unique_ptr<SerdReader, ReaderDeleter>;

ReaderPtr make_reader(ReaderSink& sink) {
    ReaderPtr reader(serd_reader_new(SERD_TURTLE, &sink, nullptr, on_base, on_prefix, on_statement, nullptr));
    if (!reader) {
        throw Ifc2LbdException(ErrorCode::INTERNAL_ERROR, "Cannot create Turtle reader", sink.origin);
    }
    serd_reader_set_strict(reader.get(), true);
    serd_reader_set_error_sink(reader.get(), on_error, &sink);
    return reader;
}

void finish(ReaderSink& sink, SerdStatus status) {
    if (sink.failed) {
        throw ParseError(sink.error, sink.error_line, sink.origin);
    }
    if (status != SERD_SUCCESS) {
        throw ParseError(std::string("Turtle reader failed: ") +
                         reinterpret_cast<const char*>(serd_strerror(status)), 0, sink.origin);
    }
    LOG_DEBUG("{}: {} triples read", sink.origin, sink.added);
}

} // namespace

// ============================================================================
// TurtleParser
// ============================================================================

TurtleParser::TurtleParser(std::string base_iri)
    : base_(std::move(base_iri)) {}

void TurtleParser::parse(const std::string& text, TripleStore& store) {
    ReaderSink sink(*this, store, "<string>");
    ReaderPtr reader = make_reader(sink);
    finish(sink, serd_reader_read_string(reader.get(), to_utf8(text)));
}

void TurtleParser::parse_file(const std::string& path, TripleStore& store) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IOError("Cannot open Turtle file", path, "Check geometry.buffer");
    }

    ReaderSink sink(*this, store, path);
    ReaderPtr reader = make_reader(sink);
    SerdStatus status = serd_reader_read_file(reader.get(), to_utf8(path));
    if (status == SERD_ERR_UNKNOWN && !sink.failed) {
        throw IOError("Cannot read Turtle file", path, "", ErrorCode::READ_FAILED);
    }
    finish(sink, status);
}

} // namespace ifc2lbd::rdf
