#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ifc2lbd {

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct ConversionConfig {
    std::string converter = "mini_ifcowl_complete";
    std::string float_format = "scientific";
    std::size_t buffer_size = 100000;
    std::string schema;             // empty: take it from the input stream
    std::string schema_dir;
    std::string model_prefix = "ifc";
    std::string instance_prefix = "inst";
    std::string base_uri = "http://example.org/base#";
};

struct GeometryConfig {
    std::string buffer;             // Turtle file produced by the geometry kernel
    bool prune = false;
    int wkt_precision = 6;
    std::string derived_marker = "body_footprint_geometry";
    std::size_t max_nodes = 1000000;
    std::string guid_attribute = "GlobalId";
};

struct NamespaceEntry {
    std::string prefix;
    std::string uri;
};

struct Config {
    LoggingConfig logging;
    ConversionConfig conversion;
    GeometryConfig geometry;
    // Ordered; empty means the built-in table for the detected schema
    std::vector<NamespaceEntry> namespaces;
    std::string config_file;
};

/**
 * Load configuration.
 *
 * Defaults are applied first, then the YAML file (when named), then the
 * IFC2LBD_* environment overrides. Throws ConfigurationError when the named
 * file is missing or malformed. The result is not validated: callers layer
 * their own overrides on top and then call validate_config once.
 */
Config load_config(const std::string& config_file = "");

// Throws ConfigurationError on unknown converter, float format, zero buffer size
// or negative precision
void validate_config(const Config& config);

// Directory holding the schema maps, honoring IFC2LBD_SCHEMA_DIR
std::string default_schema_dir();

} // namespace ifc2lbd
