#include "ifc2lbd/ttl/streaming_serializer.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace ifc2lbd::ttl {

StreamingSerializer::StreamingSerializer(const SchemaRegistry& registry, SerializerOptions options)
    : registry_(registry)
    , options_(std::move(options))
    , encoder_(registry, options_.encoder) {
    IFC2LBD_CHECK_ARGUMENT(options_.buffer_size > 0, "buffer size must be positive");
    if (options_.namespaces.empty()) {
        options_.namespaces = NamespaceTable::defaults(registry_.schema_id(),
                                                       options_.encoder.model_prefix,
                                                       options_.encoder.instance_prefix);
    }
}

std::string StreamingSerializer::current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local{};
    localtime_r(&t, &local);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(micros));
    return std::string(date) + frac;
}

std::string StreamingSerializer::header_text() const {
    const std::string* model_uri = options_.namespaces.uri_for(options_.encoder.model_prefix);
    const std::string generated = options_.generated_at.empty() ? current_timestamp() : options_.generated_at;

    std::string header;
    header += "# Turtle TTL output generated by " + options_.banner + "\n";
    header += "# Generated on: " + generated + "\n";
    header += "# baseURI: " + options_.base_uri + "\n";
    header += "# imports: " + (model_uri ? *model_uri : std::string()) + "\n";
    header += "\n";
    header += "BASE <" + options_.base_uri + ">\n";
    for (const auto& entry : options_.namespaces.entries()) {
        header += "PREFIX " + entry.prefix + ": <" + entry.uri + ">\n";
    }
    header += "\n";
    header += options_.encoder.instance_prefix + ":\ta\towl:Ontology ;\n";
    header += "\towl:imports\t" + options_.encoder.model_prefix + ": .\n\n";
    return header;
}

void StreamingSerializer::write_header(std::ostream& out) {
    if (state_ != State::HeaderPending) {
        throw Ifc2LbdException(ErrorCode::INTERNAL_ERROR, "header already written", "StreamingSerializer");
    }
    buffer_ = header_text();
    metrics_.triples_written += HEADER_TRIPLES;
    flush(out);
    state_ = State::Streaming;
}

void StreamingSerializer::write_entity(const Entity& entity, std::ostream& out) {
    if (state_ != State::Streaming) {
        throw Ifc2LbdException(ErrorCode::INTERNAL_ERROR, "write_entity outside of streaming state",
                               "StreamingSerializer");
    }

    if (entity.id == 0 || entity.type.empty()) {
        ++metrics_.records_dropped;
        LOG_DEBUG("Dropping malformed record (id {}, type '{}')", entity.id, entity.type);
        return;
    }

    try {
        encode_entity(entity);
    } catch (const EncodingError& e) {
        LOG_ERROR("Encoding failed for entity #{}: {}", entity.id, e.message());
        throw;
    } catch (const Ifc2LbdException& e) {
        LOG_ERROR("Conversion failed at entity #{} ({}): {}", entity.id, entity.type, e.message());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Encoding failed for entity #{}: {}", entity.id, e.what());
        throw EncodingError(e.what(), entity.id, entity.type);
    }

    if (++buffered_entities_ >= options_.buffer_size) {
        flush(out);
    }
}

void StreamingSerializer::encode_entity(const Entity& entity) {
    encoder_.begin_entity(entity.id, entity.type);

    const std::string subject = encoder_.instance_iri(entity.id);
    std::string block = subject + " a " + encoder_.model_term(entity.type);
    std::uint64_t triples = 1;

    for (const auto& attr : entity.attributes) {
        auto encoded = encoder_.encode_attribute(attr.name, attr.value);
        if (!encoded) continue;
        block += " ;\n\t";
        block += encoder_.model_term(attr.name);
        block += ' ';
        block += encoded->text;
        triples += encoded->triples;
    }
    block += " .\n\n";
    block += encoder_.auxiliary();
    triples += encoder_.auxiliary_triples();

    if (geometry_) {
        std::uint64_t geometry_triples = geometry_->write_geometry(entity, subject, block);
        if (geometry_triples) {
            ++metrics_.geometry_blocks;
            metrics_.geometry_triples += geometry_triples;
            triples += geometry_triples;
        }
    }

    // Committed only once the whole entity is encoded
    buffer_ += block;
    metrics_.triples_written += triples;
    metrics_.auxiliary_triples += encoder_.auxiliary_triples();
    ++metrics_.entities_processed;
}

void StreamingSerializer::flush(std::ostream& out) {
    if (!buffer_.empty()) {
        out.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        if (!out) {
            throw IOError("Write to output failed", "StreamingSerializer", "", ErrorCode::WRITE_FAILED);
        }
        buffer_.clear();
    }
    buffered_entities_ = 0;
}

void StreamingSerializer::finish(std::ostream& out) {
    if (state_ == State::HeaderPending) write_header(out);
    flush(out);
    out.flush();
    if (!out) {
        throw IOError("Write to output failed", "StreamingSerializer", "", ErrorCode::WRITE_FAILED);
    }
    state_ = State::Done;
    LOG_DEBUG("Serializer done: {} entities, {} triples, {} records dropped",
              metrics_.entities_processed, metrics_.triples_written, metrics_.records_dropped);
}

SerializationMetrics StreamingSerializer::run(stream::EntityStream& input, std::ostream& out) {
    write_header(out);

    Entity entity;
    while (input.next(entity)) {
        write_entity(entity, out);
    }

    finish(out);
    if (metrics_.records_dropped) {
        LOG_INFO("Dropped {} malformed records", metrics_.records_dropped);
    }
    return metrics_;
}

} // namespace ifc2lbd::ttl
