#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

// Third-party includes
#include <CLI/CLI.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

// Project includes
#include "cqlgen/config.hpp"
#include "cqlgen/config/spec_loader.hpp"
#include "cqlgen/generator/generator.hpp"
#include "cqlgen/version.hpp"
#include "utils/logger.hpp"

// ============================================================================
// Configuration Structure
// ============================================================================
struct AppConfig {
    std::vector<std::string> inputs;
    std::string config_file = "";
    std::string output = "";

    // Logging settings
    std::string log_file = "";
    std::string log_level = "warn";

    // Run settings
    bool dry_run = false;
    bool fail_fast = false;

    // Load from file
    bool load_from_file(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            return false;
        }

        std::ifstream file(path);
        std::string line;

        while (std::getline(file, line)) {
            boost::trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = boost::trim_copy(line.substr(0, pos));
            std::string value = boost::trim_copy(line.substr(pos + 1));

            if (key == "log_level") log_level = value;
            else if (key == "log_file") log_file = value;
            else if (key == "output") output = value;
            else if (key == "fail_fast") fail_fast = boost::to_lower_copy(value) == "true";
        }

        return true;
    }
};

// ============================================================================
// Utility Functions
// ============================================================================
void setup_logging(const AppConfig& config) {
    auto level = cqlgen::parse_log_level(config.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.log_level << "', using warn" << std::endl;
        level = cqlgen::LogLevel::WARN;
    }
    cqlgen::Logger::init(config.log_file, *level);
}

// ============================================================================
// Main Application Logic
// ============================================================================
int run_application(const AppConfig& config) {
    cqlgen::Logger::info("Starting cqlgen v{}", CQLGEN_VERSION);
    cqlgen::Logger::debug("Build: {} with {}", CQLGEN_BUILD_TYPE, CQLGEN_COMPILER);

    std::ofstream file_out;
    if (!config.output.empty() && !config.dry_run) {
        file_out.open(config.output, std::ios::out | std::ios::trunc);
        if (!file_out) {
            cqlgen::Logger::critical("Cannot open output file {}", config.output);
            std::cerr << "cannot open output file " << config.output << std::endl;
            return EXIT_FAILURE;
        }
    }
    std::ostream& out = file_out.is_open() ? static_cast<std::ostream&>(file_out) : std::cout;

    cqlgen::config::SpecLoader loader;
    std::size_t generated = 0;
    std::size_t failures = 0;

    for (const auto& input : config.inputs) {
        auto specs = loader.load_file(input);
        if (!specs) {
            cqlgen::Logger::error("{}", specs.error().to_string());
            std::cerr << specs.error().to_string() << std::endl;
            ++failures;
            if (config.fail_fast) break;
            continue;
        }

        for (const auto& spec : specs.value()) {
            auto cql = cqlgen::generator::to_cql(spec);
            if (!cql) {
                std::cerr << input << ": " << cql.error().to_string() << std::endl;
                ++failures;
                if (config.fail_fast) break;
                continue;
            }
            ++generated;
            if (!config.dry_run) {
                out << cql.value() << '\n';
            }
        }

        if (failures > 0 && config.fail_fast) break;
    }

    out.flush();
    cqlgen::Logger::info("Generated {} statements, {} failures", generated, failures);
    cqlgen::Logger::shutdown();

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    AppConfig config;

    // Parse command line
    CLI::App app{"cqlgen - CQL schema statement generator"};

    app.add_option("files", config.inputs,
        "JSON specification documents")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-c,--config", config.config_file,
        "Configuration file path")
        ->envname("CQLGEN_CONFIG");

    app.add_option("-o,--output", config.output,
        "Write statements to this file instead of stdout");

    // Logging options
    app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error/critical/off)")
        ->envname("CQLGEN_LOG_LEVEL");

    app.add_option("--log-file", config.log_file,
        "Log file path")
        ->envname("CQLGEN_LOG_FILE");

    // Run options
    app.add_flag("--dry-run", config.dry_run,
        "Validate specifications without printing statements");

    app.add_flag("--fail-fast", config.fail_fast,
        "Stop at the first failing specification");

    // Version flag
    app.add_flag_callback("--version", []() {
        std::cout << "cqlgen version " << CQLGEN_VERSION << std::endl;
        std::cout << "Build type: " << CQLGEN_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << CQLGEN_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    // Parse
    CLI11_PARSE(app, argc, argv);

    // Load config file; command line values given explicitly win
    if (!config.config_file.empty()) {
        AppConfig file_config = config;
        if (!file_config.load_from_file(config.config_file)) {
            std::cerr << "Failed to load config: " << config.config_file << std::endl;
            return EXIT_FAILURE;
        }
        if (app.count("--log-level") == 0) config.log_level = file_config.log_level;
        if (app.count("--log-file") == 0) config.log_file = file_config.log_file;
        if (app.count("--output") == 0) config.output = file_config.output;
        if (app.count("--fail-fast") == 0) config.fail_fast = file_config.fail_fast;
    }

    // Setup logging
    setup_logging(config);

    // Run
    try {
        return run_application(config);
    } catch (const std::exception& e) {
        cqlgen::Logger::critical("Fatal error: {}", e.what());
        std::cerr << "fatal: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
