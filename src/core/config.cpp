#include "ifc2lbd/config.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"
#include "ifc2lbd/ttl/literal.hpp"
#include "ifc2lbd/ttl/value_encoder.hpp"

#include <cstdlib>
#include <filesystem>

#include <yaml-cpp/yaml.h>

#ifndef IFC2LBD_DEFAULT_SCHEMA_DIR
#define IFC2LBD_DEFAULT_SCHEMA_DIR "resources/schemas"
#endif

namespace ifc2lbd {

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void load_from_yaml(const YAML::Node& yaml, Config& config) {
    if (yaml["logging"]) {
        const auto& log = yaml["logging"];
        if (log["level"]) config.logging.level = log["level"].as<std::string>();
        if (log["file"]) config.logging.file = log["file"].as<std::string>();
    }

    if (yaml["conversion"]) {
        const auto& conv = yaml["conversion"];
        if (conv["converter"]) config.conversion.converter = conv["converter"].as<std::string>();
        if (conv["float_format"]) config.conversion.float_format = conv["float_format"].as<std::string>();
        if (conv["buffer_size"]) {
            long long size = conv["buffer_size"].as<long long>();
            if (size <= 0) {
                throw ConfigurationError("conversion.buffer_size must be positive",
                                         config.config_file);
            }
            config.conversion.buffer_size = static_cast<std::size_t>(size);
        }
        if (conv["schema"]) config.conversion.schema = conv["schema"].as<std::string>();
        if (conv["schema_dir"]) config.conversion.schema_dir = conv["schema_dir"].as<std::string>();
        if (conv["model_prefix"]) config.conversion.model_prefix = conv["model_prefix"].as<std::string>();
        if (conv["instance_prefix"]) config.conversion.instance_prefix = conv["instance_prefix"].as<std::string>();
        if (conv["base_uri"]) config.conversion.base_uri = conv["base_uri"].as<std::string>();
    }

    if (yaml["geometry"]) {
        const auto& geo = yaml["geometry"];
        if (geo["buffer"]) config.geometry.buffer = geo["buffer"].as<std::string>();
        if (geo["prune"]) config.geometry.prune = geo["prune"].as<bool>();
        if (geo["wkt_precision"]) config.geometry.wkt_precision = geo["wkt_precision"].as<int>();
        if (geo["derived_marker"]) config.geometry.derived_marker = geo["derived_marker"].as<std::string>();
        if (geo["max_nodes"]) config.geometry.max_nodes = geo["max_nodes"].as<std::size_t>();
        if (geo["guid_attribute"]) config.geometry.guid_attribute = geo["guid_attribute"].as<std::string>();
    }

    if (yaml["namespaces"]) {
        const auto& list = yaml["namespaces"];
        if (!list.IsSequence()) {
            throw ConfigurationError("namespaces must be a sequence of {prefix, uri} entries",
                                     config.config_file);
        }
        for (const auto& item : list) {
            if (!item["prefix"] || !item["uri"]) {
                throw ConfigurationError("namespace entry without prefix or uri",
                                         config.config_file);
            }
            config.namespaces.push_back({item["prefix"].as<std::string>(),
                                         item["uri"].as<std::string>()});
        }
    }
}

void load_from_env(Config& config) {
    if (const char* v = env_value("IFC2LBD_LOG_LEVEL")) config.logging.level = v;
    if (const char* v = env_value("IFC2LBD_LOG_FILE")) config.logging.file = v;
    if (const char* v = env_value("IFC2LBD_SCHEMA_DIR")) config.conversion.schema_dir = v;
    if (const char* v = env_value("IFC2LBD_BUFFER_SIZE")) {
        char* end = nullptr;
        long long size = std::strtoll(v, &end, 10);
        if (end == v || *end != '\0' || size <= 0) {
            throw ConfigurationError("IFC2LBD_BUFFER_SIZE must be a positive integer", v);
        }
        config.conversion.buffer_size = static_cast<std::size_t>(size);
    }
}

} // namespace

std::string default_schema_dir() {
    if (const char* v = env_value("IFC2LBD_SCHEMA_DIR")) return v;
    return IFC2LBD_DEFAULT_SCHEMA_DIR;
}

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;
    config.conversion.schema_dir = IFC2LBD_DEFAULT_SCHEMA_DIR;

    if (!config_file.empty()) {
        if (!std::filesystem::exists(config_file)) {
            throw ConfigurationError("Config file not found", config_file,
                                     "Check the --config path");
        }
        try {
            load_from_yaml(YAML::LoadFile(config_file), config);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::string("Malformed config file: ") + e.what(), config_file);
        }
        LOG_DEBUG("Loaded configuration from {}", config_file);
    }

    load_from_env(config);
    return config;
}

void validate_config(const Config& config) {
    ttl::parse_converter(config.conversion.converter);
    ttl::parse_float_format(config.conversion.float_format);

    LogLevel level;
    if (!parse_log_level(config.logging.level, level)) {
        throw ConfigurationError("Unknown log level '" + config.logging.level + "'",
                                 config.config_file,
                                 "Use trace, debug, info, warn, error or critical");
    }
    if (config.conversion.buffer_size == 0) {
        throw ConfigurationError("Buffer size must be positive", config.config_file);
    }
    if (config.geometry.wkt_precision < 0) {
        throw ConfigurationError("geometry.wkt_precision must not be negative", config.config_file);
    }
    if (config.geometry.max_nodes == 0) {
        throw ConfigurationError("geometry.max_nodes must be positive", config.config_file);
    }
    for (const auto& ns : config.namespaces) {
        if (ns.prefix.empty() || ns.uri.empty()) {
            throw ConfigurationError("Namespace entries need a prefix and a uri", config.config_file);
        }
    }
}

} // namespace ifc2lbd
