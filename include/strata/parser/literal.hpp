#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::parser {

enum class LiteralKind : std::uint8_t {
    String,
    Number,
    Bool,
    Null,
    List,
    Tuple,
    Set,
    Mapping,
};

/// A parsed container or scalar literal as it appears inside a CSV cell,
/// e.g. `['facebook', 'instagram']` or `{"a": 1}`.
struct Literal {
    LiteralKind kind = LiteralKind::Null;
    /// Unquoted text for strings; source spelling for numbers, bools and null.
    std::string text;
    /// Elements of List/Tuple/Set.
    std::vector<Literal> items;
    /// Key/value pairs of Mapping, in source order.
    std::vector<std::pair<Literal, Literal>> entries;

    [[nodiscard]] auto is_container() const noexcept -> bool {
        return kind == LiteralKind::List || kind == LiteralKind::Tuple ||
               kind == LiteralKind::Set || kind == LiteralKind::Mapping;
    }

    /// Canonical text rendering, used when a nested container becomes a token.
    [[nodiscard]] auto to_text() const -> std::string;
};

/// Literal parse error with byte offset into the input.
struct LiteralError {
    std::string message;
    std::size_t offset = 0;

    [[nodiscard]] auto format() const -> std::string;
};

using LiteralResult = std::expected<Literal, LiteralError>;

/// Parse a single literal. The whole input (modulo surrounding whitespace)
/// must be consumed.
[[nodiscard]] auto parse_literal(std::string_view text) -> LiteralResult;

/// True if `text` is a bracketed list `[...]` or braced mapping/set `{...}`
/// that parses cleanly.
[[nodiscard]] auto is_container_literal(std::string_view text) -> bool;

/// Flatten one level of a container into frequency tokens.
///
/// Lists, tuples and sets yield their elements; mappings yield their keys.
/// A scalar yields itself.
[[nodiscard]] auto explode(const Literal& literal) -> std::vector<std::string>;

/// Parse a container literal and explode it.
[[nodiscard]] auto parse_tokens(std::string_view text)
    -> std::expected<std::vector<std::string>, LiteralError>;

}  // namespace strata::parser
