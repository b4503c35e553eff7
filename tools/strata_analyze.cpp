#include <strata/runtime/analyzer.hpp>
#include <strata/runtime/report.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace {

auto trim(std::string_view input) -> std::string_view {
    auto start = input.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

auto split_columns(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> columns;
    std::size_t pos = 0;
    while (pos <= list.size()) {
        std::size_t comma = list.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = list.size();
        }
        auto name = trim(list.substr(pos, comma - pos));
        if (!name.empty()) {
            columns.emplace_back(name);
        }
        pos = comma + 1;
    }
    return columns;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"strata: per-column statistics for CSV files"};
    app.set_version_flag("--version", "strata_analyze 0.1.0");

    std::string input_path;
    std::string output_path;
    std::string group_by;
    bool verbose = false;
    strata::runtime::AnalysisConfig config;

    app.add_option("input", input_path, "Source CSV file")->required();
    app.add_option("output", output_path, "Destination JSON file")->required();
    app.add_option("-g,--group-by", group_by,
                   "Comma-separated grouping columns (default: overall analysis)");
    app.add_option("--sample-size", config.detector.sample_size,
                   "Rows sampled for column type detection")
        ->check(CLI::PositiveNumber);
    app.add_option("--top-k", config.top_k, "Entries in most_common for discrete columns")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--threads", config.threads, "Worker threads (0 = all cores)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--batch-rows", config.batch_rows, "Records read into memory at a time")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    config.group_by = split_columns(group_by);

    try {
        auto result = strata::runtime::analyze_csv(input_path, config);
        if (!result) {
            spdlog::error("{}", result.error().format());
            return 1;
        }
        auto written = strata::runtime::write_report(*result, output_path);
        if (!written) {
            spdlog::error("{}", written.error().format());
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("unexpected failure: {}", e.what());
        return 1;
    }
    return 0;
}
