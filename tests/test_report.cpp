#include <strata/runtime/report.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace strata;
using runtime::AnalysisConfig;
using runtime::GroupKey;

namespace {

auto grouped_result() -> runtime::AnalysisResult {
    AnalysisConfig config;
    config.group_by = {"country"};
    std::vector<runtime::Row> rows{{"US", "5", "a"}, {"US", "15", "a"}, {"FR", "100", "b"}};
    auto result = runtime::analyze_rows({"country", "spend", "tag"}, rows, config);
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST_CASE("Group keys render as tuples", "[runtime][report]") {
    REQUIRE(runtime::format_group_key(GroupKey{"US"}) == "('US',)");
    REQUIRE(runtime::format_group_key(GroupKey{"US", "web"}) == "('US', 'web')");
    REQUIRE(runtime::format_group_key(GroupKey{}) == "()");
    REQUIRE(runtime::format_group_key(GroupKey{""}) == "('',)");
}

TEST_CASE("Quoting switches style and escapes control characters", "[runtime][report]") {
    REQUIRE(runtime::quote_value("O'Neil") == "\"O'Neil\"");
    REQUIRE(runtime::quote_value("say \"hi\"") == "'say \"hi\"'");
    REQUIRE(runtime::quote_value("both ' and \"") == "'both \\' and \"'");
    REQUIRE(runtime::quote_value("a\\b") == "'a\\\\b'");
    REQUIRE(runtime::quote_value("line\nbreak\t") == "'line\\nbreak\\t'");
    REQUIRE(runtime::quote_value(std::string("\x01", 1)) == "'\\x01'");
}

TEST_CASE("Non-printable code points are escaped like Python repr", "[runtime][report]") {
    // U+00A0 no-break space, U+0085 next line, U+200B zero width space.
    REQUIRE(runtime::quote_value("a\u00a0b") == "'a\\xa0b'");
    REQUIRE(runtime::quote_value("\u0085") == "'\\x85'");
    REQUIRE(runtime::quote_value("x\u200by") == "'x\\u200by'");
    REQUIRE(runtime::format_group_key(GroupKey{"US\u00a0"}) == "('US\\xa0',)");

    // Printable non-ASCII text passes through unchanged.
    REQUIRE(runtime::quote_value("caf\u00e9") == "'caf\u00e9'");
    REQUIRE(runtime::quote_value("\u65e5\u672c") == "'\u65e5\u672c'");
    REQUIRE(runtime::quote_value("\U0001F600") == "'\U0001F600'");

    // Bytes that are not UTF-8 are left to the JSON writer.
    REQUIRE(runtime::quote_value(std::string("\xff", 1)) == std::string("'\xff'"));
}

TEST_CASE("Overall report layout", "[runtime][report]") {
    std::vector<runtime::Row> rows{{"10", "a"}, {"20", "a"}, {"30", "b"}};
    auto result = runtime::analyze_rows({"price", "tag"}, rows, {});
    REQUIRE(result.has_value());

    auto doc = runtime::to_json(*result);
    REQUIRE(doc["analysis_metadata"]["total_rows_processed"] == 3);
    REQUIRE(doc["analysis_metadata"]["analysis_type"] == "overall");
    REQUIRE_FALSE(doc["analysis_metadata"].contains("grouped_by"));
    REQUIRE_FALSE(doc.contains("grouped_analysis"));

    const auto& price = doc["overall_analysis"]["price"];
    REQUIRE(price["count"] == 3);
    REQUIRE(price["mean"] == 20.0);
    REQUIRE(price["min"] == 10.0);
    REQUIRE(price["max"] == 30.0);
    REQUIRE(price["stdev"].get<double>() == Catch::Approx(10.0));

    const auto& tag = doc["overall_analysis"]["tag"];
    REQUIRE(tag["count"] == 3);
    REQUIRE(tag["unique_count"] == 2);
    REQUIRE(tag["most_common"].size() == 2);
    REQUIRE(tag["most_common"][0][0] == "a");
    REQUIRE(tag["most_common"][0][1] == 2);

    // Columns keep header order.
    std::vector<std::string> keys;
    for (const auto& [key, value] : doc["overall_analysis"].items()) {
        keys.push_back(key);
    }
    REQUIRE(keys == std::vector<std::string>{"price", "tag"});
}

TEST_CASE("Grouped report layout", "[runtime][report]") {
    auto doc = runtime::to_json(grouped_result());
    REQUIRE(doc["analysis_metadata"]["analysis_type"] == "grouped");
    REQUIRE(doc["analysis_metadata"]["grouped_by"] == nlohmann::ordered_json::array({"country"}));
    REQUIRE_FALSE(doc.contains("overall_analysis"));

    const auto& groups = doc["grouped_analysis"];
    REQUIRE(groups.size() == 2);
    REQUIRE(groups.begin().key() == "('US',)");
    REQUIRE(groups["('US',)"]["spend"]["count"] == 2);
    REQUIRE(groups["('US',)"]["spend"]["mean"] == 10.0);
    REQUIRE(groups["('FR',)"]["spend"]["mean"] == 100.0);
    REQUIRE_FALSE(groups["('US',)"].contains("country"));
}

TEST_CASE("Non-finite numbers use string placeholders", "[runtime][report]") {
    runtime::AnalysisResult result;
    result.total_rows_processed = 2;
    runtime::GroupResult group;
    group.columns.push_back(runtime::ColumnResult{
        .name = "x",
        .type = core::ColumnType::Numeric,
        .stats = core::NumericStats{.count = 2,
                                    .mean = std::numeric_limits<double>::quiet_NaN(),
                                    .min = -std::numeric_limits<double>::infinity(),
                                    .max = std::numeric_limits<double>::infinity(),
                                    .stdev = std::numeric_limits<double>::quiet_NaN()},
    });
    result.groups.push_back(std::move(group));

    auto doc = runtime::to_json(result);
    const auto& x = doc["overall_analysis"]["x"];
    REQUIRE(x["mean"] == "NaN");
    REQUIRE(x["min"] == "-Infinity");
    REQUIRE(x["max"] == "Infinity");

    auto text = runtime::to_json_text(result);
    REQUIRE(text.find("null") == std::string::npos);
}

TEST_CASE("Reports are written atomically", "[runtime][report]") {
    auto dir = std::filesystem::temp_directory_path() / "strata_test_report";
    std::filesystem::create_directories(dir);
    auto path = dir / "out.json";
    std::filesystem::remove(path);

    auto result = grouped_result();
    auto written = runtime::write_report(result, path.string());
    REQUIRE(written.has_value());
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(dir / "out.json.tmp"));

    auto parsed = nlohmann::ordered_json::parse(read_file(path));
    REQUIRE(parsed == runtime::to_json(result));

    // Overwrites an existing report in place.
    REQUIRE(runtime::write_report(result, path.string()).has_value());
    REQUIRE(std::filesystem::exists(path));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Unwritable destinations are a write failure", "[runtime][report]") {
    auto written = runtime::write_report(grouped_result(), "/nonexistent/strata/dir/out.json");
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().kind == runtime::ErrorKind::WriteFailure);
    REQUIRE_FALSE(std::filesystem::exists("/nonexistent/strata/dir/out.json.tmp"));
}
