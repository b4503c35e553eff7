#include <strata/runtime/group_router.hpp>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <string_view>

namespace strata::runtime {

auto GroupKeyHash::operator()(const GroupKey& key) const noexcept -> std::size_t {
    std::size_t seed = key.size();
    auto hash_combine = [&](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    for (const auto& value : key) {
        hash_combine(std::hash<std::string_view>{}(value));
    }
    return seed;
}

GroupRouter::GroupRouter(const ColumnTypes& types, std::vector<std::size_t> group_columns)
    : group_columns_(std::move(group_columns)) {
    for (auto col : group_columns_) {
        if (col >= types.size()) {
            throw std::out_of_range("group column index outside header");
        }
    }
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (std::ranges::find(group_columns_, i) != group_columns_.end()) {
            continue;
        }
        measured_.push_back(i);
        measured_types_.push_back(types.type(i));
    }
}

auto GroupRouter::make_set() const -> AccumulatorSet {
    AccumulatorSet set;
    set.reserve(measured_types_.size());
    for (auto type : measured_types_) {
        set.push_back(core::make_accumulator(type));
    }
    return set;
}

auto GroupRouter::route(const GroupKey& key) -> AccumulatorSet& {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return groups_[it->second].accumulators;
    }
    index_.emplace(key, groups_.size());
    groups_.push_back(Group{.key = key, .accumulators = make_set()});
    return groups_.back().accumulators;
}

auto GroupRouter::find(const GroupKey& key) const -> const AccumulatorSet* {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &groups_[it->second].accumulators;
}

void GroupRouter::merge(const GroupRouter& other) {
    if (other.measured_ != measured_ || other.measured_types_ != measured_types_) {
        throw std::logic_error("cannot merge routers with different column layouts");
    }
    for (const auto& group : other.groups_) {
        auto& target = route(group.key);
        for (std::size_t i = 0; i < target.size(); ++i) {
            core::merge(target[i], group.accumulators[i]);
        }
    }
}

}  // namespace strata::runtime
