#include "ifc2lbd/stream/entity_stream.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"

#include <fstream>

namespace ifc2lbd::stream {

// ============================================================================
// Record conversion
// ============================================================================

boost::json::value parse_record(const std::string& text, std::size_t line) {
    boost::json::parse_options options;
    options.max_depth = 256;

    boost::system::error_code ec;
    boost::json::value record = boost::json::parse(text, ec, {}, options);
    if (ec) {
        throw ParseError("Malformed JSON record: " + ec.message(), line);
    }
    return record;
}

AttributeValue value_from_json(const boost::json::value& value, std::size_t& unsupported) {
    switch (value.kind()) {
        case boost::json::kind::null:    return AttributeValue();
        case boost::json::kind::bool_:   return AttributeValue(value.get_bool());
        case boost::json::kind::int64:   return AttributeValue(value.get_int64());
        case boost::json::kind::uint64:  return AttributeValue(static_cast<double>(value.get_uint64()));
        case boost::json::kind::double_: return AttributeValue(value.get_double());
        case boost::json::kind::string:  return AttributeValue(std::string(value.get_string()));
        case boost::json::kind::array: {
            const boost::json::array& array = value.get_array();
            std::vector<AttributeValue> items;
            items.reserve(array.size());
            for (const auto& item : array) {
                items.push_back(value_from_json(item, unsupported));
            }
            return make_collection(std::move(items));
        }
        case boost::json::kind::object:
            break;
    }

    const boost::json::object& object = value.get_object();
    if (const boost::json::value* ref = object.if_contains("ref")) {
        if (ref->is_int64() && ref->get_int64() == 0) {
            return AttributeValue();   // unset reference
        }
        if (ref->is_int64() && ref->get_int64() > 0) {
            return make_ref(static_cast<EntityId>(ref->get_int64()));
        }
    } else {
        const boost::json::value* type = object.if_contains("type");
        const boost::json::value* inner = object.if_contains("value");
        if (type && inner && type->is_string() && !type->get_string().empty()) {
            return make_typed(std::string(type->get_string()), value_from_json(*inner, unsupported));
        }
    }

    ++unsupported;
    return AttributeValue();
}

Entity entity_from_json(const boost::json::value& record, std::size_t& unsupported) {
    Entity entity;
    if (!record.is_object()) return entity;

    for (const auto& member : record.get_object()) {
        const std::string name(member.key());
        const boost::json::value& value = member.value();
        if (name == "id") {
            if (value.is_int64() && value.get_int64() > 0) {
                entity.id = static_cast<EntityId>(value.get_int64());
            }
        } else if (name == "type") {
            if (value.is_string()) entity.type = std::string(value.get_string());
        } else {
            std::size_t before = unsupported;
            AttributeValue converted = value_from_json(value, unsupported);
            if (unsupported != before) {
                LOG_DEBUG("entity #{}: unsupported value shape for '{}', omitted", entity.id, name);
            }
            entity.attributes.push_back({name, std::move(converted)});
        }
    }
    return entity;
}

// ============================================================================
// JsonLinesEntityStream
// ============================================================================

JsonLinesEntityStream::JsonLinesEntityStream(const std::string& path)
    : origin_(path) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        throw IOError("Cannot open input file", path, "Check that the file exists and is readable");
    }
    input_ = std::move(file);
    read_header();
}

JsonLinesEntityStream::JsonLinesEntityStream(std::unique_ptr<std::istream> input, std::string origin)
    : input_(std::move(input)), origin_(std::move(origin)) {
    IFC2LBD_CHECK_ARGUMENT(input_ != nullptr, "input stream must not be null");
    read_header();
}

bool JsonLinesEntityStream::read_line(std::string& out) {
    while (std::getline(*input_, out)) {
        ++line_;
        if (!out.empty() && out.back() == '\r') out.pop_back();
        if (out.find_first_not_of(" \t\r") != std::string::npos) return true;
    }
    if (input_->bad()) {
        throw IOError("Read failed", origin_ + ":" + std::to_string(line_), "", ErrorCode::READ_FAILED);
    }
    return false;
}

void JsonLinesEntityStream::read_header() {
    std::string first;
    if (!read_line(first)) return;

    try {
        boost::json::value record = parse_record(first, line_);
        const boost::json::object* object = record.if_object();
        const boost::json::value* schema = object ? object->if_contains("schema") : nullptr;
        if (schema && schema->is_string() && !object->contains("id") && !object->contains("type")) {
            schema_id_ = std::string(schema->get_string());
            LOG_DEBUG("{}: schema {}", origin_, schema_id_);
            return;
        }
    } catch (const ParseError&) {
        // Delivered (and reported) as a malformed record by next()
    }
    pending_ = std::move(first);
    pending_line_ = line_;
    has_pending_ = true;
}

bool JsonLinesEntityStream::next(Entity& entity) {
    std::string text;
    std::size_t line_no = 0;
    if (has_pending_) {
        text = std::move(pending_);
        line_no = pending_line_;
        has_pending_ = false;
    } else {
        if (!read_line(text)) return false;
        line_no = line_;
    }

    try {
        entity = entity_from_json(parse_record(text, line_no), unsupported_values_);
    } catch (const ParseError& e) {
        ++malformed_lines_;
        LOG_DEBUG("{}: {}", origin_, e.message());
        entity = Entity();
    }
    return true;
}

// ============================================================================
// MemoryEntityStream
// ============================================================================

MemoryEntityStream::MemoryEntityStream(std::vector<Entity> entities, std::string schema_id)
    : entities_(std::move(entities)), schema_id_(std::move(schema_id)) {}

bool MemoryEntityStream::next(Entity& entity) {
    if (position_ >= entities_.size()) return false;
    entity = entities_[position_++];
    return true;
}

} // namespace ifc2lbd::stream
