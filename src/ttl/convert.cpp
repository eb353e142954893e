#include "ifc2lbd/convert.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/geometry/dependency_resolver.hpp"
#include "ifc2lbd/geometry/subgraph_extractor.hpp"
#include "ifc2lbd/logging.hpp"
#include "ifc2lbd/model/model.hpp"
#include "ifc2lbd/namespaces.hpp"
#include "ifc2lbd/schema_registry.hpp"
#include "ifc2lbd/stream/entity_stream.hpp"

#include <chrono>
#include <fstream>
#include <memory>
#include <optional>

namespace ifc2lbd {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

struct GeometryPass {
    std::unique_ptr<stream::MemoryEntityStream> entities;
    std::optional<geometry::GuidIndexedSubgraphExtractor> extractor;
};

GeometryPass run_geometry_pass(stream::EntityStream& input, const SchemaRegistry& registry,
                               const Config& config, const ttl::SerializerOptions& options,
                               ConversionMetrics& metrics) {
    std::size_t dropped = 0;
    model::Model model = model::Model::load(input, &dropped);
    metrics.records_dropped += dropped;

    geometry::GeometryDependencyResolver resolver(model, registry);
    const auto& result = resolver.resolve();
    metrics.geometry = true;
    metrics.geometry_entities = result.geometry.size();
    metrics.obsolete_entities = result.obsolete.size();
    metrics.dependency_cycles = result.cycles;
    if (config.geometry.prune) {
        metrics.pruned_entities = resolver.prune();
    }

    geometry::ExtractorOptions extractor_options;
    extractor_options.namespaces = options.namespaces;
    extractor_options.wkt_precision = config.geometry.wkt_precision;
    extractor_options.derived_marker = config.geometry.derived_marker;
    extractor_options.max_nodes = config.geometry.max_nodes;
    extractor_options.guid_attribute = config.geometry.guid_attribute;

    GeometryPass pass;
    pass.extractor.emplace(geometry::GuidIndexedSubgraphExtractor::from_file(config.geometry.buffer,
                                                                             std::move(extractor_options)));
    pass.entities = std::make_unique<stream::MemoryEntityStream>(model.entities(), model.schema_id());
    LOG_INFO("Geometry buffer indexed: {} features under {} GUIDs",
             pass.extractor->feature_count(), pass.extractor->guid_count());
    return pass;
}

} // namespace

std::string resolve_schema_id(const std::string& requested, const std::string& from_stream) {
    if (!requested.empty()) return requested;
    if (!from_stream.empty()) return from_stream;
    return DEFAULT_SCHEMA;
}

ttl::SerializerOptions serializer_options(const Config& config, const std::string& schema_id) {
    const auto& conv = config.conversion;

    ttl::SerializerOptions options;
    options.encoder = ttl::encoder_options_for(ttl::parse_converter(conv.converter));
    options.encoder.float_format = ttl::parse_float_format(conv.float_format);
    options.encoder.model_prefix = conv.model_prefix;
    options.encoder.instance_prefix = conv.instance_prefix;
    options.base_uri = conv.base_uri;
    options.buffer_size = conv.buffer_size;
    options.namespaces = config.namespaces.empty()
        ? NamespaceTable::defaults(schema_id, conv.model_prefix, conv.instance_prefix)
        : NamespaceTable(config.namespaces);
    return options;
}

ConversionMetrics convert_file(const ConversionRequest& request) {
    const Config& config = request.config;
    validate_config(config);
    if (!config.conversion.schema.empty()) {
        SchemaRegistry::schema_file_for(config.conversion.schema);   // throws on unknown schema
    }

    ConversionMetrics metrics;
    metrics.input_file = request.input;
    metrics.output_file = request.output;
    metrics.converter = config.conversion.converter;

    LOG_INFO("Converting {} -> {} ({})", request.input, request.output, config.conversion.converter);
    const auto start_total = Clock::now();

    // Load: open the stream, pick the schema, build the registry
    const auto start_load = Clock::now();
    stream::JsonLinesEntityStream input(request.input);
    const std::string schema_id = resolve_schema_id(config.conversion.schema, input.schema_id());
    metrics.schema = schema_id;

    const std::string schema_dir = config.conversion.schema_dir.empty()
        ? default_schema_dir() : config.conversion.schema_dir;
    const SchemaRegistry registry = SchemaRegistry::load(schema_id, schema_dir);

    ttl::SerializerOptions options = serializer_options(config, schema_id);
    options.generated_at = request.timestamp;

    GeometryPass geometry;
    if (!config.geometry.buffer.empty()) {
        geometry = run_geometry_pass(input, registry, config, options, metrics);
    }
    metrics.load_time = seconds_since(start_load);

    std::ofstream out(request.output, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Cannot open output file", request.output, "Check that the directory exists and is writable",
                      ErrorCode::WRITE_FAILED);
    }

    // Write
    const auto start_write = Clock::now();
    ttl::StreamingSerializer serializer(registry, std::move(options));
    if (geometry.extractor) serializer.set_geometry_provider(&*geometry.extractor);

    stream::EntityStream& source = geometry.entities
        ? static_cast<stream::EntityStream&>(*geometry.entities)
        : static_cast<stream::EntityStream&>(input);
    const ttl::SerializationMetrics written = serializer.run(source, out);
    metrics.write_time = seconds_since(start_write);

    metrics.entities_processed = written.entities_processed;
    metrics.triples_written = written.triples_written;
    metrics.records_dropped += written.records_dropped;
    metrics.auxiliary_triples = written.auxiliary_triples;
    metrics.geometry_blocks = written.geometry_blocks;
    metrics.geometry_triples = written.geometry_triples;
    metrics.unsupported_values = input.unsupported_values();
    metrics.total_time = seconds_since(start_total);

    if (input.malformed_lines()) {
        LOG_INFO("{} input lines could not be parsed", input.malformed_lines());
    }
    LOG_INFO("Wrote {}: {} entities, {} triples in {:.3f}s",
             request.output, metrics.entities_processed, metrics.triples_written, metrics.total_time);
    return metrics;
}

} // namespace ifc2lbd
