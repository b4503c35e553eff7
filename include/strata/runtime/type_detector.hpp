#pragma once

#include <strata/core/column_type.hpp>
#include <strata/runtime/row.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace strata::runtime {

struct DetectorOptions {
    /// Number of leading data rows inspected.
    std::size_t sample_size = 100;
    /// Minimum share of non-empty sampled values that must match a type.
    double threshold = 0.8;
};

/// Column name -> detected type, in header order.
class ColumnTypes {
   public:
    ColumnTypes() = default;
    ColumnTypes(Header names, std::vector<core::ColumnType> types);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }
    [[nodiscard]] auto name(std::size_t idx) const -> const std::string& { return names_.at(idx); }
    [[nodiscard]] auto type(std::size_t idx) const -> core::ColumnType { return types_.at(idx); }
    [[nodiscard]] auto find(const std::string& name) const -> std::optional<core::ColumnType>;
    [[nodiscard]] auto names() const noexcept -> const Header& { return names_; }

    auto operator==(const ColumnTypes&) const -> bool = default;

   private:
    Header names_;
    std::vector<core::ColumnType> types_;
};

/// Classify one column from its sampled cell values.
[[nodiscard]] auto classify_column(std::span<const Row> sample, std::size_t column,
                                   double threshold) -> core::ColumnType;

/// Classify every header column from the first `options.sample_size` rows of `sample`.
///
/// Empty cells and rows too short to reach a column are left out of that
/// column's denominator. A column with nothing to look at is Categorical.
[[nodiscard]] auto detect_column_types(const Header& header, std::span<const Row> sample,
                                       const DetectorOptions& options = {}) -> ColumnTypes;

}  // namespace strata::runtime
