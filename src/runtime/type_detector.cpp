#include <strata/parser/literal.hpp>
#include <strata/runtime/type_detector.hpp>

#include <algorithm>
#include <stdexcept>

namespace strata::runtime {

ColumnTypes::ColumnTypes(Header names, std::vector<core::ColumnType> types)
    : names_(std::move(names)), types_(std::move(types)) {
    if (names_.size() != types_.size()) {
        throw std::invalid_argument("column name and type counts differ");
    }
}

auto ColumnTypes::find(const std::string& name) const -> std::optional<core::ColumnType> {
    auto it = std::ranges::find(names_, name);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return types_[static_cast<std::size_t>(it - names_.begin())];
}

auto classify_column(std::span<const Row> sample, std::size_t column, double threshold)
    -> core::ColumnType {
    std::size_t non_empty = 0;
    std::size_t numeric = 0;
    std::size_t structured = 0;
    for (const auto& row : sample) {
        if (row.size() <= column) {
            continue;
        }
        const auto& value = row[column];
        if (value.empty()) {
            continue;
        }
        ++non_empty;
        if (core::parse_number(value).has_value()) {
            ++numeric;
            continue;
        }
        if (parser::is_container_literal(value)) {
            ++structured;
        }
    }
    if (non_empty == 0) {
        return core::ColumnType::Categorical;
    }
    const auto share = [non_empty](std::size_t hits) {
        return static_cast<double>(hits) / static_cast<double>(non_empty);
    };
    if (share(numeric) >= threshold) {
        return core::ColumnType::Numeric;
    }
    if (share(structured) >= threshold) {
        return core::ColumnType::ListValued;
    }
    return core::ColumnType::Categorical;
}

auto detect_column_types(const Header& header, std::span<const Row> sample,
                         const DetectorOptions& options) -> ColumnTypes {
    auto bounded = sample.first(std::min(sample.size(), options.sample_size));
    std::vector<core::ColumnType> types;
    types.reserve(header.size());
    for (std::size_t i = 0; i < header.size(); ++i) {
        types.push_back(classify_column(bounded, i, options.threshold));
    }
    return ColumnTypes{header, std::move(types)};
}

}  // namespace strata::runtime
