#pragma once

#include <strata/runtime/analyzer.hpp>
#include <strata/runtime/error.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace strata::runtime {

/// Render a group key as tuple text: `('US',)`, `('US', 'web')`, `()`.
[[nodiscard]] auto format_group_key(const GroupKey& key) -> std::string;

/// Quote one value the way format_group_key does.
[[nodiscard]] auto quote_value(std::string_view value) -> std::string;

/// Build the report document:
///
///   { "analysis_metadata": { "total_rows_processed", "analysis_type", "grouped_by"? },
///     "overall_analysis" | "grouped_analysis": { ... } }
///
/// Non-finite numbers become the strings "NaN", "Infinity" and "-Infinity".
[[nodiscard]] auto to_json(const AnalysisResult& result) -> nlohmann::ordered_json;

/// Serialize with 4-space indentation. Invalid UTF-8 is replaced, not rejected.
[[nodiscard]] auto to_json_text(const AnalysisResult& result) -> std::string;

/// Write the report atomically: the text goes to a sibling temporary file
/// which is renamed over `path` only after a complete write.
[[nodiscard]] auto write_report(const AnalysisResult& result, std::string_view path)
    -> std::expected<void, AnalysisError>;

}  // namespace strata::runtime
