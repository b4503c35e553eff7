#pragma once

#include <strata/core/column_type.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace strata::core {

/// Finalized moments of a numeric column.
struct NumericStats {
    std::uint64_t count = 0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stdev = 0.0;
};

/// Finalized frequency summary of a categorical or list-valued column.
struct FrequencyStats {
    std::uint64_t count = 0;
    std::uint64_t unique_count = 0;
    std::vector<std::pair<std::string, std::uint64_t>> most_common;
};

using ColumnStats = std::variant<NumericStats, FrequencyStats>;

/// Running count/sum/sum-of-squares/min/max over the parseable values of a column.
class NumericAccumulator {
   public:
    /// Ingest a raw cell; values that do not parse as a number are ignored.
    void ingest(std::string_view raw);

    void add(double value) noexcept;

    void merge(const NumericAccumulator& other) noexcept;

    [[nodiscard]] auto finalize() const -> NumericStats;

    [[nodiscard]] auto count() const noexcept -> std::uint64_t { return count_; }
    [[nodiscard]] auto sum() const noexcept -> double { return sum_; }
    [[nodiscard]] auto sum_sq() const noexcept -> double { return sum_sq_; }
    [[nodiscard]] auto min() const noexcept -> double { return min_; }
    [[nodiscard]] auto max() const noexcept -> double { return max_; }

   private:
    std::uint64_t count_ = 0;
    double sum_ = 0.0;
    double sum_sq_ = 0.0;
    double min_ = std::numeric_limits<double>::infinity();
    double max_ = -std::numeric_limits<double>::infinity();
};

/// Token -> count table that remembers first-insertion order.
///
/// Memory grows with the number of distinct tokens; there is no cap.
class FrequencyTable {
   public:
    using entry_type = std::pair<std::string, std::uint64_t>;

    void add(std::string_view token, std::uint64_t n = 1);

    /// Add every count of `other`; tokens new to this table are appended in
    /// `other`'s insertion order.
    void merge(const FrequencyTable& other);

    [[nodiscard]] auto count_of(std::string_view token) const -> std::uint64_t;
    [[nodiscard]] auto total() const noexcept -> std::uint64_t { return total_; }
    [[nodiscard]] auto unique() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto entries() const noexcept -> const std::vector<entry_type>& {
        return entries_;
    }

    /// The `k` most frequent tokens, ties resolved by first insertion.
    [[nodiscard]] auto top(std::size_t k) const -> std::vector<entry_type>;

    [[nodiscard]] auto finalize(std::size_t top_k) const -> FrequencyStats;

   private:
    std::vector<entry_type> entries_;
    robin_hood::unordered_flat_map<std::string, std::size_t> index_;
    std::uint64_t total_ = 0;
};

/// Counts each distinct raw cell value.
class CategoricalAccumulator {
   public:
    void ingest(std::string_view raw) { table_.add(raw); }
    void merge(const CategoricalAccumulator& other) { table_.merge(other.table_); }
    [[nodiscard]] auto finalize(std::size_t top_k) const -> FrequencyStats {
        return table_.finalize(top_k);
    }
    [[nodiscard]] auto table() const noexcept -> const FrequencyTable& { return table_; }

   private:
    FrequencyTable table_;
};

/// Explodes list/mapping literals into one count per element.
///
/// A cell that fails to parse is counted as a single token holding the
/// whole raw text.
class ListAccumulator {
   public:
    void ingest(std::string_view raw);
    void merge(const ListAccumulator& other);
    [[nodiscard]] auto finalize(std::size_t top_k) const -> FrequencyStats {
        return table_.finalize(top_k);
    }
    [[nodiscard]] auto table() const noexcept -> const FrequencyTable& { return table_; }
    /// Cells that did not parse and were counted whole.
    [[nodiscard]] auto fallbacks() const noexcept -> std::uint64_t { return fallbacks_; }

   private:
    FrequencyTable table_;
    std::uint64_t fallbacks_ = 0;
};

using ColumnAccumulator = std::variant<NumericAccumulator, CategoricalAccumulator, ListAccumulator>;

[[nodiscard]] auto make_accumulator(ColumnType type) -> ColumnAccumulator;

[[nodiscard]] auto type_of(const ColumnAccumulator& acc) noexcept -> ColumnType;

void ingest(ColumnAccumulator& acc, std::string_view raw);

/// Merge `other` into `acc`. Throws std::logic_error if the variants differ.
void merge(ColumnAccumulator& acc, const ColumnAccumulator& other);

[[nodiscard]] auto finalize(const ColumnAccumulator& acc, std::size_t top_k = 5) -> ColumnStats;

}  // namespace strata::core
