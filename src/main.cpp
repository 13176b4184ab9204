#include "lotmatch/calculator.hpp"
#include "lotmatch/config.hpp"
#include "lotmatch/csv_table.hpp"
#include "lotmatch/errors.hpp"
#include "lotmatch/result_writer.hpp"
#include "lotmatch/util.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr std::size_t kSampleRows = 5;
constexpr const char* kDefaultOutput = "fifo_results.csv";

struct CliOptions {
    std::string config_path;
    std::string input_path;
    std::string output_path = kDefaultOutput;
    std::optional<std::string> json_path;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " --config <config.json> --input <transactions.csv>"
              << " [--output <results.csv>] [--json <results.jsonl>]" << std::endl;
    std::cerr << "  --output defaults to " << kDefaultOutput << std::endl;
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return std::nullopt;
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--input") {
            options.input_path = value;
        } else if (arg == "--output") {
            options.output_path = value;
        } else if (arg == "--json") {
            options.json_path = value;
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (options.config_path.empty() || options.input_path.empty()) {
        return std::nullopt;
    }
    return options;
}

void print_sample(const lotmatch::RawTable& table) {
    std::cout << "[Loader] " << table.row_count() << " row(s), columns: "
              << lotmatch::join(table.header, ", ") << std::endl;
    const auto shown = std::min(kSampleRows, table.row_count());
    for (std::size_t r = 0; r < shown; ++r) {
        std::cout << "[Loader]   ";
        for (std::size_t c = 0; c < table.column_count(); ++c) {
            if (c != 0) {
                std::cout << " | ";
            }
            const auto& cell = table.cell(r, c);
            std::cout << (cell ? *cell : "");
        }
        std::cout << std::endl;
    }
}

void report_diagnostics(const lotmatch::RunDiagnostics& diagnostics) {
    const auto missing = diagnostics.count(lotmatch::RowIssueKind::MissingValue);
    if (missing > 0) {
        std::cerr << "[Calculator] Warning: " << missing
                  << " row(s) have missing values in the selected columns and were skipped." << std::endl;
    }
    for (const auto& issue : diagnostics.skipped_rows) {
        if (issue.kind == lotmatch::RowIssueKind::InvalidNumber) {
            std::cerr << "[Calculator] Skipping row " << issue.row_index + 1
                      << " due to invalid data: " << issue.message << std::endl;
        }
    }
    for (const auto& issue : diagnostics.date_warnings) {
        std::cerr << "[Calculator] Row " << issue.row_index + 1 << ": " << issue.message
                  << "; its date is reported as Invalid Date" << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        const auto config = lotmatch::load_config(options->config_path);
        std::cout << "[Config] Loaded " << options->config_path
                  << " (round gains: " << (config.calculator.round_gains ? "yes" : "no") << ")" << std::endl;

        const auto table = lotmatch::load_csv(options->input_path);
        print_sample(table);

        const auto result = lotmatch::calculate(table, config);
        report_diagnostics(result.diagnostics);
        std::cout << "[Calculator] " << result.sales.size() << " sale(s), "
                  << result.rows.size() << " matched lot row(s), "
                  << result.diagnostics.skipped_rows.size() << " skipped, "
                  << result.diagnostics.ignored_rows << " ignored, total gain/loss "
                  << lotmatch::to_display_string(result.total_gain()) << std::endl;

        std::ofstream output(options->output_path, std::ios::trunc);
        if (!output.good()) {
            throw lotmatch::FileLoadError("Failed to open " + options->output_path + " for writing",
                                          options->output_path);
        }
        lotmatch::write_csv(output, result.columns, result.rows);
        std::cout << "[Export] Wrote " << options->output_path << std::endl;

        if (options->json_path) {
            lotmatch::write_json_lines(*options->json_path, result.rows);
            std::cout << "[Export] Wrote " << *options->json_path << std::endl;
        }
        return 0;
    } catch (const lotmatch::SchemaError& ex) {
        std::cerr << "[Loader] " << ex.what() << std::endl;
    } catch (const lotmatch::ConfigError& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
    } catch (const lotmatch::FileLoadError& ex) {
        std::cerr << "[Loader] Failed to load file: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Calculator] An error occurred during FIFO calculation: " << ex.what() << std::endl;
    }
    return 1;
}
