#include "ifc2lbd/geometry/subgraph_extractor.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/geometry/guid.hpp"
#include "ifc2lbd/logging.hpp"
#include "ifc2lbd/rdf/turtle_parser.hpp"
#include "ifc2lbd/ttl/literal.hpp"

#include <cstdio>
#include <regex>
#include <stdexcept>

namespace ifc2lbd::geometry {

namespace {

const std::string RDF_TYPE = std::string(ns::RDF) + "type";
const std::string GEO_FEATURE = std::string(ns::GEO) + "Feature";
const std::string WKT_LITERAL = std::string(ns::GEO) + "wktLiteral";

std::string round_number(const std::string& number, int precision) {
    double value = 0.0;
    try {
        value = std::stod(number);
    } catch (const std::out_of_range&) {
        return number;   // not representable; left as written
    }
    int size = std::snprintf(nullptr, 0, "%.*f", precision, value);
    std::string s(static_cast<std::size_t>(size) + 1, '\0');
    std::snprintf(s.data(), s.size(), "%.*f", precision, value);
    s.resize(static_cast<std::size_t>(size));
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s.empty() || s == "-0") return "0";
    return s;
}

} // namespace

std::string round_wkt_numbers(const std::string& wkt, int precision) {
    static const std::regex number(R"([-+]?(?:\d+(?:\.\d*)?|\.\d+)(?:[eE][-+]?\d+)?)");

    std::string out;
    out.reserve(wkt.size());
    auto last = wkt.cbegin();
    for (std::sregex_iterator it(wkt.begin(), wkt.end(), number), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        out += round_number(m.str(), precision);
        last = m[0].second;
    }
    out.append(last, wkt.cend());
    return out;
}

// ============================================================================
// SubgraphWalk
// ============================================================================

SubgraphWalk::SubgraphWalk(const GuidIndexedSubgraphExtractor& extractor, rdf::Term root, std::string label)
    : extractor_(extractor), root_(std::move(root)), label_(std::move(label)) {
    enqueue(root_);
}

void SubgraphWalk::enqueue(const rdf::Term& node) {
    if (visited_.count(node)) return;
    if (visited_.size() >= extractor_.options_.max_nodes) {
        if (!truncated_) {
            LOG_WARN("Geometry walk from {} hit the node ceiling ({}); subgraph truncated",
                     root_.value, extractor_.options_.max_nodes);
        }
        truncated_ = true;
        return;
    }
    visited_.insert(node);
    queue_.push_back(node);
}

bool SubgraphWalk::advance_node() {
    if (queue_.empty()) return false;
    current_ = &extractor_.store_.by_subject(queue_.front());
    queue_.pop_front();
    position_ = 0;
    return true;
}

bool SubgraphWalk::next(RenderedTriple& out) {
    const auto& triples = extractor_.store_.triples();
    while (true) {
        if (!current_ || position_ >= current_->size()) {
            if (!advance_node()) return false;
            continue;
        }

        const rdf::Triple& t = triples[(*current_)[position_++]];
        if (extractor_.skipped(t)) continue;

        if (t.object.is_resource()) enqueue(t.object);

        out.subject = t.subject == root_ ? label_ : extractor_.render(t.subject);
        out.predicate = t.predicate.value == RDF_TYPE ? "a" : extractor_.render(t.predicate);
        if (t.object.is_literal() && t.object.datatype == WKT_LITERAL) {
            rdf::Term rounded = t.object;
            rounded.value = round_wkt_numbers(t.object.value, extractor_.options_.wkt_precision);
            out.object = extractor_.render(rounded);
        } else {
            out.object = extractor_.render(t.object);
        }
        return true;
    }
}

// ============================================================================
// GuidIndexedSubgraphExtractor
// ============================================================================

GuidIndexedSubgraphExtractor::GuidIndexedSubgraphExtractor(rdf::TripleStore store, ExtractorOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    IFC2LBD_CHECK_ARGUMENT(options_.wkt_precision >= 0, "wkt precision must not be negative");
    IFC2LBD_CHECK_ARGUMENT(options_.max_nodes > 0, "node ceiling must be positive");
    skipped_predicates_.insert(options_.skipped_predicates.begin(), options_.skipped_predicates.end());
    build_index();
}

GuidIndexedSubgraphExtractor GuidIndexedSubgraphExtractor::from_file(const std::string& path,
                                                                     ExtractorOptions options) {
    rdf::TripleStore store;
    rdf::TurtleParser parser;
    parser.parse_file(path, store);
    LOG_DEBUG("Geometry buffer {}: {} triples", path, store.size());
    return GuidIndexedSubgraphExtractor(std::move(store), std::move(options));
}

GuidIndexedSubgraphExtractor GuidIndexedSubgraphExtractor::from_string(const std::string& turtle,
                                                                       ExtractorOptions options) {
    rdf::TripleStore store;
    rdf::TurtleParser parser;
    parser.parse(turtle, store);
    return GuidIndexedSubgraphExtractor(std::move(store), std::move(options));
}

void GuidIndexedSubgraphExtractor::build_index() {
    for (const rdf::Term& feature : store_.subjects_of_type(GEO_FEATURE)) {
        if (!feature.is_iri()) continue;
        auto guid = decode_feature_guid(feature.value);
        if (!guid) {
            LOG_DEBUG("Feature {} carries no decodable GUID, skipped", feature.value);
            continue;
        }
        index_[*guid].push_back(feature);
        ++feature_count_;
    }
    LOG_DEBUG("Geometry index: {} features under {} GUIDs", feature_count_, index_.size());
}

bool GuidIndexedSubgraphExtractor::skipped(const rdf::Triple& triple) const {
    if (skipped_predicates_.count(triple.predicate.value)) return true;
    return !options_.derived_marker.empty() &&
           triple.object.value.find(options_.derived_marker) != std::string::npos;
}

const std::vector<rdf::Term>& GuidIndexedSubgraphExtractor::features_for(const std::string& guid) const {
    static const std::vector<rdf::Term> none;
    auto it = index_.find(guid);
    return it == index_.end() ? none : it->second;
}

SubgraphWalk GuidIndexedSubgraphExtractor::walk(const rdf::Term& root, std::string label) const {
    return SubgraphWalk(*this, root, std::move(label));
}

std::string GuidIndexedSubgraphExtractor::render(const rdf::Term& term) const {
    switch (term.kind) {
        case rdf::Term::Kind::Iri:
            return options_.namespaces.compact(term.value);
        case rdf::Term::Kind::BlankNode:
            return "_:" + term.value;
        case rdf::Term::Kind::Literal:
            break;
    }

    std::string text = "\"" + ttl::escape_string(term.value) + "\"";
    if (!term.language.empty()) {
        text += "@" + term.language;
    } else if (!term.datatype.empty()) {
        text += "^^" + options_.namespaces.compact(term.datatype);
    }
    return text;
}

std::uint64_t GuidIndexedSubgraphExtractor::write_geometry(const Entity& entity, const std::string& subject,
                                                           std::string& out) const {
    const AttributeValue* value = entity.find(options_.guid_attribute);
    if (value && value->is_typed() && value->as_typed()->inner) value = value->as_typed()->inner.get();
    const std::string* guid = value ? value->as_string() : nullptr;
    if (!guid) return 0;

    std::uint64_t written = 0;
    RenderedTriple t;
    for (const rdf::Term& feature : features_for(*guid)) {
        SubgraphWalk w = walk(feature, subject);
        while (w.next(t)) {
            out += t.subject;
            out += ' ';
            out += t.predicate;
            out += ' ';
            out += t.object;
            out += " .\n";
            ++written;
        }
    }
    if (written) out += '\n';
    return written;
}

} // namespace ifc2lbd::geometry
