#include <strata/core/accumulator.hpp>
#include <strata/runtime/analyzer.hpp>
#include <strata/runtime/report.hpp>

#include <fmt/core.h>

auto main() -> int {
    // Accumulate a numeric column by hand
    strata::core::NumericAccumulator spend;
    for (const char* raw : {"10", "20", "30", "bad"}) {
        spend.ingest(raw);
    }
    auto stats = spend.finalize();

    fmt::print("=== Numeric accumulator ===\n");
    fmt::print("count={} mean={} min={} max={} stdev={}\n", stats.count, stats.mean, stats.min,
               stats.max, stats.stdev);

    // Group a small in-memory table
    fmt::print("\n=== Grouped analysis ===\n");

    strata::runtime::Header header{"country", "spend", "platforms"};
    std::vector<strata::runtime::Row> rows{
        {"US", "5", "['facebook', 'instagram']"},
        {"US", "15", "['facebook']"},
        {"FR", "100", "['messenger']"},
    };

    strata::runtime::AnalysisConfig config;
    config.group_by = {"country"};

    auto result = strata::runtime::analyze_rows(header, rows, config);
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return 1;
    }
    fmt::print("{}\n", strata::runtime::to_json_text(*result));

    return 0;
}
