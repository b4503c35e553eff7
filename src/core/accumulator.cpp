#include <strata/core/accumulator.hpp>
#include <strata/parser/literal.hpp>

#include <algorithm>
#include <cmath>
#include <charconv>
#include <system_error>
#include <numeric>
#include <stdexcept>
#include <type_traits>

namespace strata::core {

auto parse_number(std::string_view text) -> std::optional<double> {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    auto end = text.find_last_not_of(" \t\r\n");
    text = text.substr(begin, end - begin + 1);
    // from_chars takes no leading '+'.
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-' || text.front() == '+') {
            return std::nullopt;
        }
    }
    // "nan(...)" payloads are a C extension.
    if (text.find('(') != std::string_view::npos) {
        return std::nullopt;
    }
    double value = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value,
                                  std::chars_format::general);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// ─── NumericAccumulator ───────────────────────────────────────────────────────

void NumericAccumulator::ingest(std::string_view raw) {
    if (auto value = parse_number(raw)) {
        add(*value);
    }
}

void NumericAccumulator::add(double value) noexcept {
    ++count_;
    sum_ += value;
    sum_sq_ += value * value;
    if (value < min_) {
        min_ = value;
    }
    if (value > max_) {
        max_ = value;
    }
}

void NumericAccumulator::merge(const NumericAccumulator& other) noexcept {
    count_ += other.count_;
    sum_ += other.sum_;
    sum_sq_ += other.sum_sq_;
    min_ = std::min(min_, other.min_);
    max_ = std::max(max_, other.max_);
}

auto NumericAccumulator::finalize() const -> NumericStats {
    NumericStats stats;
    if (count_ == 0) {
        return stats;
    }
    const auto n = static_cast<double>(count_);
    stats.count = count_;
    stats.min = std::isinf(min_) && min_ > 0 ? 0.0 : min_;
    stats.max = std::isinf(max_) && max_ < 0 ? 0.0 : max_;
    // sum / n can round just outside the observed range.
    stats.mean = sum_ / n;
    if (stats.mean < stats.min) {
        stats.mean = stats.min;
    } else if (stats.mean > stats.max) {
        stats.mean = stats.max;
    }
    if (count_ > 1 && min_ != max_) {
        // Population variance clamped at zero, then Bessel-corrected.
        double variance = std::max(0.0, sum_sq_ / n - stats.mean * stats.mean);
        stats.stdev = std::sqrt(variance * (n / (n - 1.0)));
    }
    return stats;
}

// ─── FrequencyTable ───────────────────────────────────────────────────────────

void FrequencyTable::add(std::string_view token, std::uint64_t n) {
    auto it = index_.find(std::string(token));
    if (it != index_.end()) {
        entries_[it->second].second += n;
    } else {
        index_.emplace(std::string(token), entries_.size());
        entries_.emplace_back(std::string(token), n);
    }
    total_ += n;
}

void FrequencyTable::merge(const FrequencyTable& other) {
    for (const auto& [token, n] : other.entries_) {
        add(token, n);
    }
}

auto FrequencyTable::count_of(std::string_view token) const -> std::uint64_t {
    auto it = index_.find(std::string(token));
    return it == index_.end() ? 0 : entries_[it->second].second;
}

auto FrequencyTable::top(std::size_t k) const -> std::vector<entry_type> {
    std::vector<std::size_t> order(entries_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    // Stable sort keeps insertion order among equal counts.
    std::ranges::stable_sort(order, [this](std::size_t a, std::size_t b) {
        return entries_[a].second > entries_[b].second;
    });
    const std::size_t n = std::min(k, order.size());
    std::vector<entry_type> result;
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(entries_[order[i]]);
    }
    return result;
}

auto FrequencyTable::finalize(std::size_t top_k) const -> FrequencyStats {
    return FrequencyStats{
        .count = total_,
        .unique_count = static_cast<std::uint64_t>(entries_.size()),
        .most_common = top(top_k),
    };
}

// ─── ListAccumulator ──────────────────────────────────────────────────────────

void ListAccumulator::ingest(std::string_view raw) {
    auto tokens = parser::parse_tokens(raw);
    if (!tokens) {
        ++fallbacks_;
        table_.add(raw);
        return;
    }
    for (const auto& token : *tokens) {
        table_.add(token);
    }
}

void ListAccumulator::merge(const ListAccumulator& other) {
    table_.merge(other.table_);
    fallbacks_ += other.fallbacks_;
}

// ─── Variant dispatch ─────────────────────────────────────────────────────────

auto make_accumulator(ColumnType type) -> ColumnAccumulator {
    switch (type) {
        case ColumnType::Numeric:
            return NumericAccumulator{};
        case ColumnType::ListValued:
            return ListAccumulator{};
        case ColumnType::Categorical:
            break;
    }
    return CategoricalAccumulator{};
}

auto type_of(const ColumnAccumulator& acc) noexcept -> ColumnType {
    if (std::holds_alternative<NumericAccumulator>(acc)) {
        return ColumnType::Numeric;
    }
    if (std::holds_alternative<ListAccumulator>(acc)) {
        return ColumnType::ListValued;
    }
    return ColumnType::Categorical;
}

void ingest(ColumnAccumulator& acc, std::string_view raw) {
    std::visit([raw](auto& a) { a.ingest(raw); }, acc);
}

void merge(ColumnAccumulator& acc, const ColumnAccumulator& other) {
    if (acc.index() != other.index()) {
        throw std::logic_error("cannot merge accumulators of different column types");
    }
    std::visit(
        [&other](auto& a) {
            using T = std::decay_t<decltype(a)>;
            a.merge(std::get<T>(other));
        },
        acc);
}

auto finalize(const ColumnAccumulator& acc, std::size_t top_k) -> ColumnStats {
    return std::visit(
        [top_k](const auto& a) -> ColumnStats {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, NumericAccumulator>) {
                return a.finalize();
            } else {
                return a.finalize(top_k);
            }
        },
        acc);
}

}  // namespace strata::core
