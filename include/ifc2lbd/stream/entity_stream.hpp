#pragma once

#include "ifc2lbd/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace ifc2lbd::stream {

/**
 * Pull-based source of entity records, consumed exactly once.
 *
 * A record that cannot be understood is still delivered, with id 0 or an
 * empty type, so that the consumer decides how malformed records are
 * accounted for.
 */
class EntityStream {
public:
    virtual ~EntityStream() = default;

    // Schema identifier announced by the source; empty when unknown
    virtual const std::string& schema_id() const = 0;

    // false at end of stream
    virtual bool next(Entity& entity) = 0;
};

// ============================================================================
// JSON Lines source
// ============================================================================

/**
 * One JSON object per line:
 *   {"schema": "IFC4"}                                  optional first line
 *   {"id": 42, "type": "IfcWall", "Name": "W1", "OwnerHistory": {"ref": 7}}
 *
 * Value shapes: {"ref": n} reference, {"type": t, "value": v} typed value,
 * arrays are collections, null and {"ref": 0} are absent. Other objects are
 * unsupported and read as absent.
 */
class JsonLinesEntityStream : public EntityStream {
public:
    // Throws IOError when the file cannot be opened
    explicit JsonLinesEntityStream(const std::string& path);
    JsonLinesEntityStream(std::unique_ptr<std::istream> input, std::string origin);

    const std::string& schema_id() const override { return schema_id_; }
    bool next(Entity& entity) override;

    std::size_t line() const { return line_; }
    std::size_t malformed_lines() const { return malformed_lines_; }
    std::size_t unsupported_values() const { return unsupported_values_; }

private:
    void read_header();
    bool read_line(std::string& out);

    std::unique_ptr<std::istream> input_;
    std::string origin_;
    std::string schema_id_;
    std::string pending_;
    bool has_pending_ = false;
    std::size_t pending_line_ = 0;
    std::size_t line_ = 0;
    std::size_t malformed_lines_ = 0;
    std::size_t unsupported_values_ = 0;
};

// ============================================================================
// In-memory source
// ============================================================================

class MemoryEntityStream : public EntityStream {
public:
    explicit MemoryEntityStream(std::vector<Entity> entities, std::string schema_id = "");

    const std::string& schema_id() const override { return schema_id_; }
    bool next(Entity& entity) override;

    void rewind() { position_ = 0; }
    std::size_t size() const { return entities_.size(); }

private:
    std::vector<Entity> entities_;
    std::string schema_id_;
    std::size_t position_ = 0;
};

// ============================================================================
// Record conversion (shared by readers and tests)
// ============================================================================

/**
 * Parse one record line.
 * @param line reported in ParseError messages (0: unknown)
 * @throws ParseError on malformed input, trailing content or nesting deeper than 256
 */
boost::json::value parse_record(const std::string& text, std::size_t line = 0);

// Unsupported shapes read as absent and bump `unsupported`
AttributeValue value_from_json(const boost::json::value& value, std::size_t& unsupported);

// id and type are taken out of the member list; a bad id or type yields 0 / ""
Entity entity_from_json(const boost::json::value& record, std::size_t& unsupported);

} // namespace ifc2lbd::stream
