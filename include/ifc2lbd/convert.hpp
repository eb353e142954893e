// =============================================================================
// convert.hpp - One input file -> one Turtle file
// =============================================================================

#pragma once

#include "ifc2lbd/config.hpp"
#include "ifc2lbd/ttl/streaming_serializer.hpp"

#include <cstdint>
#include <string>

namespace ifc2lbd {

// Schema used when neither the request nor the input names one
inline constexpr const char* DEFAULT_SCHEMA = "IFC4X3_ADD2";

struct ConversionRequest {
    std::string input;
    std::string output;
    Config config;
    std::string timestamp;      // header timestamp; empty: local time
};

struct ConversionMetrics {
    std::string input_file;
    std::string output_file;
    std::string converter;
    std::string schema;

    std::uint64_t entities_processed = 0;
    std::uint64_t triples_written = 0;
    std::uint64_t records_dropped = 0;
    std::uint64_t auxiliary_triples = 0;
    std::uint64_t unsupported_values = 0;

    // Seconds
    double load_time = 0.0;
    double write_time = 0.0;
    double total_time = 0.0;

    // Geometry pass
    bool geometry = false;
    std::uint64_t geometry_entities = 0;
    std::uint64_t obsolete_entities = 0;
    std::uint64_t pruned_entities = 0;
    std::uint64_t dependency_cycles = 0;
    std::uint64_t geometry_blocks = 0;
    std::uint64_t geometry_triples = 0;
};

/**
 * Converts one JSON-lines entity stream to Turtle.
 *
 * The configuration is validated before any file is touched. Schema
 * resolution order: config override, the stream's header record,
 * DEFAULT_SCHEMA. When a geometry buffer is configured the whole model is
 * loaded first so geometry dependencies can be resolved.
 *
 * @throws ConfigurationError  bad converter, float format, schema
 * @throws IOError             input missing, output not writable
 * @throws EncodingError       an entity could not be formatted (names the id)
 */
ConversionMetrics convert_file(const ConversionRequest& request);

// "request > stream > IFC4X3_ADD2"
std::string resolve_schema_id(const std::string& requested, const std::string& from_stream);

// Serializer options for a validated configuration and a resolved schema
ttl::SerializerOptions serializer_options(const Config& config, const std::string& schema_id);

} // namespace ifc2lbd
