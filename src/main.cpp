#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "case_config.hpp"
#include "case_runner.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "table_provider.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::vector<std::string> case_paths;
    std::string tables_config_path;
    std::string tables_dir;
    std::string output_path;
    std::string parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_json = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LossCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Case input options:\n";
    std::cerr << "  --case <path>               JSON case configuration (repeatable)\n\n";
    std::cerr << "Reference table options:\n";
    std::cerr << "  --tables-config <path>      JSON file naming each table file and its source label\n";
    std::cerr << "  --tables-dir <dir>          Directory holding life_table.csv, worklife_default.csv,\n";
    std::cerr << "                              wage_growth.csv and discount_treasury_1y.csv\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Present-value schedule as Parquet (requires Arrow)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to this file\n";
    std::cerr << "  --log-json                  Emit log lines as JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Single case with the bundled tables:\n";
    std::cerr << "     " << program_name << " --case data/sample_case.json \\\n";
    std::cerr << "         --tables-config data/tables.json \\\n";
    std::cerr << "         --output result.json\n\n";
    std::cerr << "  2. Batch of cases with JSON logs:\n";
    std::cerr << "     " << program_name << " --case a.json --case b.json \\\n";
    std::cerr << "         --tables-dir data --log-json --log-level DEBUG\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--case" && i + 1 < argc) {
            args.case_paths.push_back(argv[++i]);
        } else if (arg == "--tables-config" && i + 1 < argc) {
            args.tables_config_path = argv[++i];
        } else if (arg == "--tables-dir" && i + 1 < argc) {
            args.tables_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = to_upper(argv[++i]);
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-json") {
            args.log_json = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.case_paths.empty()) {
        std::cerr << "Error: at least one --case is required\n";
        valid = false;
    }
    for (const auto& path : args.case_paths) {
        if (!file_exists(path)) {
            std::cerr << "Error: Case file not found: " << path << "\n";
            valid = false;
        }
    }

    bool has_config = !args.tables_config_path.empty();
    bool has_dir = !args.tables_dir.empty();
    if (!has_config && !has_dir) {
        std::cerr << "Error: Must provide either --tables-config OR --tables-dir\n";
        valid = false;
    } else if (has_config && has_dir) {
        std::cerr << "Error: --tables-config and --tables-dir cannot be combined\n";
        valid = false;
    } else if (has_config && !file_exists(args.tables_config_path)) {
        std::cerr << "Error: Tables config file not found: " << args.tables_config_path << "\n";
        valid = false;
    }

    if (!args.parquet_path.empty() && !losscalc::ParquetWriter::available()) {
        std::cerr << "Error: --parquet requires a build with Apache Arrow\n";
        valid = false;
    }

    const std::string& level = args.log_level;
    if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

void configure_logging(const CLIArgs& args) {
    losscalc::LoggerConfig config;
    config.min_level = losscalc::string_to_level(args.log_level);
    config.enable_json = args.log_json;
    if (!args.log_file.empty()) {
        config.enable_file = true;
        config.log_file_path = args.log_file;
    }
    losscalc::Logger::get_instance().configure(config);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    configure_logging(args);

    try {
        // Load reference tables
        losscalc::TableSources sources = args.tables_config_path.empty()
            ? losscalc::TableSources::from_directory(args.tables_dir)
            : losscalc::parse_table_sources_from_file(args.tables_config_path);

        auto tables = losscalc::TableCache::instance().get(sources);

        // Parse cases
        std::vector<losscalc::CaseConfig> configs;
        configs.reserve(args.case_paths.size());
        for (const auto& path : args.case_paths) {
            configs.push_back(losscalc::parse_case_config_from_file(path));
        }

        losscalc::CaseRunner runner(tables);
        std::vector<losscalc::CaseResult> results;
        int exit_code = 0;

        if (configs.size() == 1) {
            losscalc::CaseResult result = runner.run(configs.front());

            if (args.output_path.empty()) {
                losscalc::io::write_case_result_json(std::cout, result);
            } else {
                losscalc::io::write_case_result_json(args.output_path, result);
                std::cerr << "Output written to: " << args.output_path << "\n";
            }

            std::cerr << "Total economic loss (" << result.config.case_id << "): "
                      << std::fixed << std::setprecision(2) << result.total_economic_loss() << "\n";
            results.push_back(std::move(result));
        } else {
            std::vector<losscalc::CaseOutcome> outcomes = runner.run_batch(configs);

            if (args.output_path.empty()) {
                losscalc::io::write_batch_json(std::cout, outcomes);
            } else {
                losscalc::io::write_batch_json(args.output_path, outcomes);
                std::cerr << "Output written to: " << args.output_path << "\n";
            }

            for (auto& outcome : outcomes) {
                if (outcome.success) {
                    results.push_back(std::move(*outcome.result));
                } else {
                    std::cerr << "Error: " << outcome.case_id << ": " << outcome.error_message << "\n";
                    exit_code = 1;
                }
            }
        }

        if (!args.parquet_path.empty()) {
            losscalc::ParquetWriter::write_present_values(results, args.parquet_path);
            std::cerr << "Parquet written to: " << args.parquet_path << "\n";
        }

        losscalc::Logger::get_instance().flush();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
