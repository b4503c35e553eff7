#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace strata::core {

/// Statistical kind of a CSV column, assigned once per dataset.
enum class ColumnType : std::uint8_t {
    Numeric,
    Categorical,
    ListValued,
};

[[nodiscard]] constexpr auto to_string(ColumnType type) noexcept -> std::string_view {
    switch (type) {
        case ColumnType::Numeric:
            return "numeric";
        case ColumnType::Categorical:
            return "categorical";
        case ColumnType::ListValued:
            return "list";
    }
    return "categorical";
}

/// Parse a CSV cell as a double.
///
/// Decimal and exponent forms plus "inf", "infinity" and "nan" in any case,
/// optionally signed, with surrounding whitespace trimmed. Hexadecimal is
/// rejected. Returns nullopt unless the whole cell is consumed.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

}  // namespace strata::core
