// =============================================================================
// ifc2lbd CLI - Entity stream to Linked Building Data Turtle
// =============================================================================
//
// Usage:
//   ifc2lbd <command> [options]
//
// Commands:
//   convert     Convert JSON-lines entity streams to Turtle
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   ifc2lbd convert -i model.jsonl -o model.ttl
//   ifc2lbd convert -i a.jsonl b.jsonl -o a.ttl b.ttl --converter mini_ifcowl_complete2
//   ifc2lbd convert -i model.jsonl -o model.ttl --geometry shapes.ttl --prune-geometry
//
// =============================================================================

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "ifc2lbd/config.hpp"
#include "ifc2lbd/convert.hpp"
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/logging.hpp"
#include "ifc2lbd/ttl/value_encoder.hpp"

namespace ifc2lbd::cli {
    int cmd_convert(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define IFC2LBD_VERSION_MAJOR 1
#define IFC2LBD_VERSION_MINOR 0
#define IFC2LBD_VERSION_PATCH 0
#define IFC2LBD_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"convert", "Convert JSON-lines entity streams to Turtle", ifc2lbd::cli::cmd_convert},
    {"version", "Show version information", ifc2lbd::cli::cmd_version},
    {"help",    "Show this help message", ifc2lbd::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Convert Options
// =============================================================================

struct ConvertOptions {
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    std::string config_file;
    std::string schema;
    std::string converter;
    std::string float_format;
    std::string buffer_size;
    std::string geometry;
    std::string timestamp;
    bool prune_geometry = false;
    bool benchmark = false;
    bool verbose = false;
    bool quiet = false;
};

namespace ifc2lbd::cli {

namespace {

// Consumes values up to the next option
void take_values(int argc, char* argv[], int& i, std::vector<std::string>& out) {
    while (i + 1 < argc && argv[i + 1][0] != '-') {
        out.emplace_back(argv[++i]);
    }
}

bool parse_convert_options(int argc, char* argv[], ConvertOptions& opts) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-i" || arg == "--inputs") {
            take_values(argc, argv, i, opts.inputs);
        } else if (arg == "-o" || arg == "--outputs") {
            take_values(argc, argv, i, opts.outputs);
        } else if ((arg == "--config") && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if ((arg == "--schema") && i + 1 < argc) {
            opts.schema = argv[++i];
        } else if ((arg == "-c" || arg == "--converter") && i + 1 < argc) {
            opts.converter = argv[++i];
        } else if ((arg == "--float-format") && i + 1 < argc) {
            opts.float_format = argv[++i];
        } else if ((arg == "--buffer-size") && i + 1 < argc) {
            opts.buffer_size = argv[++i];
        } else if ((arg == "--geometry") && i + 1 < argc) {
            opts.geometry = argv[++i];
        } else if ((arg == "--timestamp") && i + 1 < argc) {
            opts.timestamp = argv[++i];
        } else if (arg == "--prune-geometry") {
            opts.prune_geometry = true;
        } else if (arg == "-b" || arg == "--benchmark") {
            opts.benchmark = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void apply_overrides(const ConvertOptions& opts, Config& config) {
    if (!opts.schema.empty()) config.conversion.schema = opts.schema;
    if (!opts.converter.empty()) config.conversion.converter = opts.converter;
    if (!opts.float_format.empty()) config.conversion.float_format = opts.float_format;
    if (!opts.buffer_size.empty()) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(opts.buffer_size.c_str(), &end, 10);
        if (!end || *end != '\0' || opts.buffer_size[0] == '-') {
            throw ConfigurationError("--buffer-size expects a positive integer, got '" + opts.buffer_size + "'");
        }
        config.conversion.buffer_size = static_cast<std::size_t>(n);
    }
    if (!opts.geometry.empty()) config.geometry.buffer = opts.geometry;
    if (opts.prune_geometry) config.geometry.prune = true;
}

void setup_logging(const ConvertOptions& opts, const Config& config) {
    LogLevel level = LogLevel::INFO;
    if (!parse_log_level(config.logging.level, level)) level = LogLevel::INFO;
    if (opts.verbose) level = LogLevel::DEBUG;
    if (opts.quiet) level = LogLevel::WARN;
    set_log_level(level);

    if (!config.logging.file.empty() && !Logger::getInstance().set_output_file(config.logging.file)) {
        LOG_WARN("Cannot open log file {}, logging to stderr only", config.logging.file);
    }
}

void print_benchmark(const std::vector<ConversionMetrics>& all) {
    std::cout << "\n" << std::string(80, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(80, '=') << "\n";
    for (const auto& m : all) {
        std::cout << "\nFile: " << m.input_file << "\n";
        std::cout << "  Schema: " << m.schema << " (" << m.converter << ")\n";
        std::cout << "  Entities processed: " << m.entities_processed << "\n";
        std::cout << "  Triples written: " << m.triples_written << "\n";
        if (m.records_dropped) std::cout << "  Records dropped: " << m.records_dropped << "\n";
        if (m.geometry) {
            std::cout << "  Geometry entities: " << m.geometry_entities
                      << " (" << m.obsolete_entities << " obsolete, " << m.pruned_entities << " pruned)\n";
            std::cout << "  Geometry triples: " << m.geometry_triples
                      << " in " << m.geometry_blocks << " blocks\n";
        }
        std::printf("  Load time: %.3fs\n", m.load_time);
        std::printf("  Write time: %.3fs\n", m.write_time);
        std::printf("  Total time: %.3fs\n", m.total_time);
        if (m.triples_written && m.total_time > 0.0) {
            std::printf("  Throughput: %.0f triples/second\n",
                        static_cast<double>(m.triples_written) / m.total_time);
        }
    }
    std::cout << std::string(80, '=') << "\n";
}

} // namespace

// =============================================================================
// Convert Command
// =============================================================================

int cmd_convert(int argc, char* argv[]) {
    ConvertOptions opts;
    if (!parse_convert_options(argc, argv, opts)) {
        std::cerr << "Run 'ifc2lbd help' for usage.\n";
        return 1;
    }
    if (opts.inputs.empty()) {
        std::cerr << "Error: at least one input is required (-i <file>...)\n";
        return 1;
    }
    if (opts.inputs.size() != opts.outputs.size()) {
        std::cerr << "Error: Number of inputs (" << opts.inputs.size()
                  << ") must match number of outputs (" << opts.outputs.size() << ")\n";
        return 1;
    }

    Config config;
    try {
        config = load_config(opts.config_file);
        apply_overrides(opts, config);
        validate_config(config);
    } catch (const Ifc2LbdException& e) {
        std::cerr << "Error: " << e.message() << "\n";
        if (!e.suggestion().empty()) std::cerr << "Suggestion: " << e.suggestion() << "\n";
        return 1;
    }
    setup_logging(opts, config);

    LOG_INFO("Processing {} file(s) with converter {}", opts.inputs.size(), config.conversion.converter);

    std::size_t succeeded = 0;
    std::vector<ConversionMetrics> all_metrics;
    for (std::size_t idx = 0; idx < opts.inputs.size(); ++idx) {
        const std::string& input = opts.inputs[idx];
        const std::string& output = opts.outputs[idx];
        LOG_INFO("[{}/{}] Converting '{}' -> '{}'", idx + 1, opts.inputs.size(), input, output);

        ConversionRequest request;
        request.input = input;
        request.output = output;
        request.config = config;
        request.timestamp = opts.timestamp;

        try {
            all_metrics.push_back(convert_file(request));
            ++succeeded;
        } catch (const Ifc2LbdException& e) {
            std::cerr << "Error converting '" << input << "': " << e.message() << "\n";
            if (!e.context().empty()) LOG_DEBUG("Context: {}", e.context());
        } catch (const std::exception& e) {
            std::cerr << "Error converting '" << input << "': " << e.what() << "\n";
        }
    }

    if (opts.benchmark && !all_metrics.empty()) {
        print_benchmark(all_metrics);
    }

    LOG_INFO("Conversion complete: {}/{} successful", succeeded, opts.inputs.size());
    return succeeded == opts.inputs.size() ? 0 : 1;
}

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "ifc2lbd - Building model entities to Linked Building Data Turtle\n";
    std::cout << "Version " << IFC2LBD_VERSION_STRING << "\n\n";
    std::cout << "Usage: ifc2lbd <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nConvert Options:\n";
    std::cout << "  -i, --inputs <file>...      Input JSON-lines entity streams\n";
    std::cout << "  -o, --outputs <file>...     Output Turtle files (one per input)\n";
    std::cout << "  --config <file.yaml>        Configuration file\n";
    std::cout << "  --schema <id>               Schema override (IFC2X3, IFC4, IFC4X3_ADD2)\n";
    std::cout << "  -c, --converter <name>      ";
    const auto converters = ttl::available_converters();
    for (size_t i = 0; i < converters.size(); ++i) {
        std::cout << (i ? " | " : "") << converters[i];
    }
    std::cout << "\n";
    std::cout << "  --float-format <mode>       scientific (default) | plain\n";
    std::cout << "  --buffer-size <n>           Entities per output flush (default: 100000)\n";
    std::cout << "  --geometry <file.ttl>       Geometry triple buffer to attach per product\n";
    std::cout << "  --prune-geometry            Drop geometry entities nothing else references\n";
    std::cout << "  --timestamp <text>          Fixed header timestamp\n";
    std::cout << "  -b, --benchmark             Print per-file metrics\n";
    std::cout << "  -v, --verbose               Debug logging\n";
    std::cout << "  -q, --quiet                 Warnings and errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  IFC2LBD_LOG_LEVEL           trace | debug | info | warn | error | critical\n";
    std::cout << "  IFC2LBD_LOG_FILE            Additional log file\n";
    std::cout << "  IFC2LBD_SCHEMA_DIR          Directory of schema collection maps\n";
    std::cout << "  IFC2LBD_BUFFER_SIZE         Default flush threshold\n";
    std::cout << "\nExamples:\n";
    std::cout << "  ifc2lbd convert -i model.jsonl -o model.ttl\n";
    std::cout << "  ifc2lbd convert -i a.jsonl b.jsonl -o a.ttl b.ttl --benchmark\n";
    std::cout << "  ifc2lbd convert -i model.jsonl -o model.ttl --geometry shapes.ttl --prune-geometry\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "ifc2lbd " << IFC2LBD_VERSION_STRING << "\n";
    std::cout << "Converters: ";
    const auto converters = ttl::available_converters();
    for (size_t i = 0; i < converters.size(); ++i) {
        std::cout << (i ? ", " : "") << converters[i];
    }
    std::cout << "\n";
    std::cout << "Default schema: " << DEFAULT_SCHEMA << "\n";
    std::cout << "Schema maps: " << default_schema_dir() << "\n";
    return 0;
}

}  // namespace ifc2lbd::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        ifc2lbd::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[1];
    argc -= 2;
    argv += 2;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'ifc2lbd help' for usage.\n";
    return 1;
}
