#pragma once

#include <strata/core/accumulator.hpp>
#include <strata/runtime/csv.hpp>
#include <strata/runtime/error.hpp>
#include <strata/runtime/group_router.hpp>
#include <strata/runtime/row.hpp>
#include <strata/runtime/type_detector.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace strata::runtime {

/// Options for one analysis run.
struct AnalysisConfig {
    /// Grouping column names; empty means one implicit group over all rows.
    std::vector<std::string> group_by;
    DetectorOptions detector;
    /// Length of `most_common` for discrete columns.
    std::size_t top_k = 5;
    /// Worker threads for analyze_rows_parallel / analyze_csv. 0 = hardware concurrency.
    std::size_t threads = 1;
    /// Records analyze_csv holds in memory at once (at least the sample).
    std::size_t batch_rows = kDefaultBatchRows;
};

struct ColumnResult {
    std::string name;
    core::ColumnType type = core::ColumnType::Categorical;
    core::ColumnStats stats;
};

struct GroupResult {
    GroupKey key;
    std::vector<ColumnResult> columns;
};

/// Finalized statistics for every (group, measured column), groups in first-seen order.
struct AnalysisResult {
    std::uint64_t total_rows_processed = 0;
    std::uint64_t rows_skipped = 0;
    std::vector<std::string> grouped_by;
    ColumnTypes types;
    std::vector<GroupResult> groups;
    /// True when a stop was requested before the input was exhausted.
    bool stopped_early = false;

    [[nodiscard]] auto grouped() const noexcept -> bool { return !grouped_by.empty(); }
    [[nodiscard]] auto find_group(const GroupKey& key) const -> const GroupResult*;
    /// Stats of `column` in the implicit or given group, or nullptr.
    [[nodiscard]] auto find_column(const std::string& column, const GroupKey& key = {}) const
        -> const ColumnResult*;
};

enum class AnalyzerState : std::uint8_t {
    Uninitialized,
    TypesDetected,
    Accumulating,
    Finalized,
};

[[nodiscard]] auto to_string(AnalyzerState state) noexcept -> std::string_view;

/// Single-pass accumulation over a row stream.
///
/// Lifecycle: create() -> detect_types()/set_types() -> consume()* -> finish().
/// Transitions only move forward; calling an operation in the wrong state
/// throws std::logic_error.
class Analyzer {
   public:
    /// Resolve the grouping columns against `header`.
    [[nodiscard]] static auto create(Header header, AnalysisConfig config)
        -> std::expected<Analyzer, AnalysisError>;

    /// Classify columns from the leading rows of `sample`.
    void detect_types(std::span<const Row> sample);

    /// Adopt an existing classification, e.g. one shared by parallel workers.
    void set_types(ColumnTypes types);

    /// Accumulate one row. Rows shorter than the header are skipped and
    /// false is returned.
    auto consume(const Row& row) -> bool;

    /// Fold another analyzer's partial state into this one. Both must share
    /// header, grouping and column types, and neither may be finalized.
    void merge(const Analyzer& other);

    /// Finalize every accumulator and build the result.
    [[nodiscard]] auto finish(bool stopped_early = false) -> AnalysisResult;

    [[nodiscard]] auto state() const noexcept -> AnalyzerState { return state_; }
    [[nodiscard]] auto header() const noexcept -> const Header& { return header_; }
    [[nodiscard]] auto config() const noexcept -> const AnalysisConfig& { return config_; }
    [[nodiscard]] auto types() const -> const ColumnTypes&;
    [[nodiscard]] auto rows_processed() const noexcept -> std::uint64_t { return rows_processed_; }
    [[nodiscard]] auto rows_skipped() const noexcept -> std::uint64_t { return rows_skipped_; }
    [[nodiscard]] auto router() const -> const GroupRouter&;

   private:
    Analyzer(Header header, AnalysisConfig config, std::vector<std::size_t> group_indices);

    void require(AnalyzerState lo, AnalyzerState hi, std::string_view op) const;

    Header header_;
    AnalysisConfig config_;
    std::vector<std::size_t> group_indices_;
    std::optional<ColumnTypes> types_;
    std::optional<GroupRouter> router_;
    AnalyzerState state_ = AnalyzerState::Uninitialized;
    std::uint64_t rows_processed_ = 0;
    std::uint64_t rows_skipped_ = 0;
};

/// Detect on the leading rows, accumulate all rows sequentially, finalize.
[[nodiscard]] auto analyze_rows(const Header& header, std::span<const Row> rows,
                                const AnalysisConfig& config, std::stop_token stop = {})
    -> std::expected<AnalysisResult, AnalysisError>;

/// Like analyze_rows, but rows are split into contiguous chunks accumulated
/// on `config.threads` workers and merged in chunk order.
[[nodiscard]] auto analyze_rows_parallel(const Header& header, std::span<const Row> rows,
                                         const AnalysisConfig& config, std::stop_token stop = {})
    -> std::expected<AnalysisResult, AnalysisError>;

/// Stream `path` through an Analyzer in batches of `config.batch_rows`
/// records. Only the detection sample and the current batch are held in
/// memory; each batch is accumulated like analyze_rows_parallel.
[[nodiscard]] auto analyze_csv(std::string_view path, const AnalysisConfig& config,
                               std::stop_token stop = {})
    -> std::expected<AnalysisResult, AnalysisError>;

}  // namespace strata::runtime
