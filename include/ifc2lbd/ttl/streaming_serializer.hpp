// =============================================================================
// streaming_serializer.hpp - Entity stream -> Turtle document
// =============================================================================
// Single pass: header, then one block per entity in stream order, each block
// followed by its auxiliary typed-entity statements and, when a geometry
// provider is attached, its geometry statements. Buffering only batches
// writes; the bytes produced do not depend on the buffer size.
// =============================================================================

#pragma once

#include "ifc2lbd/namespaces.hpp"
#include "ifc2lbd/schema_registry.hpp"
#include "ifc2lbd/stream/entity_stream.hpp"
#include "ifc2lbd/ttl/value_encoder.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace ifc2lbd::ttl {

/**
 * Source of per-entity geometry statements. Implementations append fully
 * rendered statements ("s p o .\n") to `out` and return how many were added.
 */
class GeometryBlockProvider {
public:
    virtual ~GeometryBlockProvider() = default;

    virtual std::uint64_t write_geometry(const Entity& entity, const std::string& subject,
                                         std::string& out) const = 0;
};

struct SerializerOptions {
    NamespaceTable namespaces;
    std::string base_uri = ns::DEFAULT_BASE;
    std::size_t buffer_size = 100000;     // entities per flush
    std::string generated_at;             // empty: local time at header write
    std::string banner = "ifc2lbd streaming writer.";
    EncoderOptions encoder;
};

struct SerializationMetrics {
    std::uint64_t entities_processed = 0;
    std::uint64_t triples_written = 0;
    std::uint64_t records_dropped = 0;
    std::uint64_t auxiliary_triples = 0;
    std::uint64_t geometry_blocks = 0;
    std::uint64_t geometry_triples = 0;
};

class StreamingSerializer {
public:
    enum class State { HeaderPending, Streaming, Done };

    // Triples contributed by the header's ontology statement
    static constexpr std::uint64_t HEADER_TRIPLES = 2;

    StreamingSerializer(const SchemaRegistry& registry, SerializerOptions options);

    // Not owned; must outlive the run
    void set_geometry_provider(const GeometryBlockProvider* provider) { geometry_ = provider; }

    /**
     * Serialize the whole stream to `out`.
     * @throws EncodingError naming the entity when one cannot be formatted
     * @throws IOError when the sink rejects a write
     */
    SerializationMetrics run(stream::EntityStream& input, std::ostream& out);

    // Incremental interface used by run()
    void write_header(std::ostream& out);
    void write_entity(const Entity& entity, std::ostream& out);
    void finish(std::ostream& out);

    std::string header_text() const;
    State state() const { return state_; }
    const SerializationMetrics& metrics() const { return metrics_; }

    // ISO-8601 local time with microseconds, e.g. 2024-05-01T12:30:00.123456
    static std::string current_timestamp();

private:
    void encode_entity(const Entity& entity);
    void flush(std::ostream& out);

    const SchemaRegistry& registry_;
    SerializerOptions options_;
    ValueEncoder encoder_;
    const GeometryBlockProvider* geometry_ = nullptr;

    State state_ = State::HeaderPending;
    SerializationMetrics metrics_;
    std::string buffer_;
    std::size_t buffered_entities_ = 0;
};

} // namespace ifc2lbd::ttl
