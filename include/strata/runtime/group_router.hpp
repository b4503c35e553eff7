#pragma once

#include <strata/core/accumulator.hpp>
#include <strata/runtime/type_detector.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <string>
#include <vector>

namespace strata::runtime {

/// Values of the grouping columns for one row, in grouping order.
/// The ungrouped analysis uses the empty key.
using GroupKey = std::vector<std::string>;

struct GroupKeyHash {
    auto operator()(const GroupKey& key) const noexcept -> std::size_t;
};

/// One accumulator per measured column, aligned with GroupRouter::measured_columns().
using AccumulatorSet = std::vector<core::ColumnAccumulator>;

struct Group {
    GroupKey key;
    AccumulatorSet accumulators;
};

/// Maps group keys to lazily created accumulator sets.
///
/// Groups are kept in first-seen order. Memory is one accumulator per
/// (group, measured column); frequency accumulators additionally grow with
/// the number of distinct tokens they see.
class GroupRouter {
   public:
    /// `group_columns` are header indices excluded from measurement.
    GroupRouter(const ColumnTypes& types, std::vector<std::size_t> group_columns);

    /// Accumulators for `key`, created on first use. The reference stays
    /// valid until the next call that creates a group.
    [[nodiscard]] auto route(const GroupKey& key) -> AccumulatorSet&;

    [[nodiscard]] auto find(const GroupKey& key) const -> const AccumulatorSet*;

    /// Union of keys; sets present on both sides are merged column by column.
    /// Groups new to this router are appended in `other`'s order.
    void merge(const GroupRouter& other);

    [[nodiscard]] auto groups() const noexcept -> const std::vector<Group>& { return groups_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return groups_.size(); }

    /// Header indices of measured (non-grouping) columns.
    [[nodiscard]] auto measured_columns() const noexcept -> const std::vector<std::size_t>& {
        return measured_;
    }
    [[nodiscard]] auto group_columns() const noexcept -> const std::vector<std::size_t>& {
        return group_columns_;
    }

   private:
    auto make_set() const -> AccumulatorSet;

    std::vector<std::size_t> group_columns_;
    std::vector<std::size_t> measured_;
    std::vector<core::ColumnType> measured_types_;
    std::vector<Group> groups_;
    robin_hood::unordered_flat_map<GroupKey, std::size_t, GroupKeyHash> index_;
};

}  // namespace strata::runtime
