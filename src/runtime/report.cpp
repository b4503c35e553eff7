#include <strata/runtime/report.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <utility>

namespace strata::runtime {

namespace {

using json = nlohmann::ordered_json;

auto number(double value) -> json {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    return value;
}

auto stats_to_json(const core::ColumnStats& stats) -> json {
    return std::visit(
        [](const auto& s) -> json {
            using T = std::decay_t<decltype(s)>;
            json out = json::object();
            if constexpr (std::is_same_v<T, core::NumericStats>) {
                out["count"] = s.count;
                out["mean"] = number(s.mean);
                out["min"] = number(s.min);
                out["max"] = number(s.max);
                out["stdev"] = number(s.stdev);
            } else {
                out["count"] = s.count;
                out["unique_count"] = s.unique_count;
                json pairs = json::array();
                for (const auto& [token, n] : s.most_common) {
                    pairs.push_back(json::array({token, n}));
                }
                out["most_common"] = std::move(pairs);
            }
            return out;
        },
        stats);
}

// Non-ASCII code points that str.isprintable() rejects: C1 controls,
// separators other than ' ' (Zs, Zl, Zp), format characters (Cf),
// surrogates, private use and noncharacters. Unassigned code points are
// not tracked.
constexpr std::array<std::pair<char32_t, char32_t>, 28> kNonPrintable = {{
    {0x80, 0xA0},       {0xAD, 0xAD},       {0x600, 0x605},     {0x61C, 0x61C},
    {0x6DD, 0x6DD},     {0x70F, 0x70F},     {0x890, 0x891},     {0x8E2, 0x8E2},
    {0x1680, 0x1680},   {0x180E, 0x180E},   {0x2000, 0x200F},   {0x2028, 0x202F},
    {0x205F, 0x2064},   {0x2066, 0x206F},   {0x3000, 0x3000},   {0xD800, 0xF8FF},
    {0xFDD0, 0xFDEF},   {0xFEFF, 0xFEFF},   {0xFFF9, 0xFFFB},   {0xFFFE, 0xFFFF},
    {0x110BD, 0x110BD}, {0x110CD, 0x110CD}, {0x13430, 0x1343F}, {0x1BCA0, 0x1BCA3},
    {0x1D173, 0x1D17A}, {0xE0001, 0xE0001}, {0xE0020, 0xE007F}, {0xF0000, 0x10FFFF},
}};

auto is_printable(char32_t code) -> bool {
    return std::ranges::none_of(kNonPrintable, [code](const auto& range) {
        return code >= range.first && code <= range.second;
    });
}

void append_escape(std::string& out, char32_t code) {
    const auto value = static_cast<std::uint32_t>(code);
    if (value < 0x100) {
        out.append(fmt::format("\\x{:02x}", value));
    } else if (value < 0x10000) {
        out.append(fmt::format("\\u{:04x}", value));
    } else {
        out.append(fmt::format("\\U{:08x}", value));
    }
}

// Length of the UTF-8 sequence starting `text`, or 0 if it is malformed.
auto decode_utf8(std::string_view text, char32_t& code) -> std::size_t {
    const auto lead = static_cast<unsigned char>(text[0]);
    std::size_t len = 0;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
        code = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        code = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        code = lead & 0x07;
    } else {
        return 0;
    }
    if (text.size() < len) {
        return 0;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) {
            return 0;
        }
        code = (code << 6) | (byte & 0x3F);
    }
    constexpr std::array<char32_t, 5> kMinimum = {0, 0, 0x80, 0x800, 0x10000};
    if (code < kMinimum[len] || code > 0x10FFFF) {
        return 0;
    }
    return len;
}

auto columns_to_json(const GroupResult& group) -> json {
    json out = json::object();
    for (const auto& column : group.columns) {
        out[column.name] = stats_to_json(column.stats);
    }
    return out;
}

}  // namespace

auto quote_value(std::string_view value) -> std::string {
    // Prefer single quotes; switch to double quotes only to avoid escaping.
    const bool has_single = value.find('\'') != std::string_view::npos;
    const bool has_double = value.find('"') != std::string_view::npos;
    const char quote = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back(quote);
    std::size_t i = 0;
    while (i < value.size()) {
        const char ch = value[i];
        if (static_cast<unsigned char>(ch) >= 0x80) {
            char32_t code = 0;
            const std::size_t len = decode_utf8(value.substr(i), code);
            if (len == 0) {
                // Not UTF-8; the JSON writer replaces it.
                out.push_back(ch);
                ++i;
            } else if (is_printable(code)) {
                out.append(value.substr(i, len));
                i += len;
            } else {
                append_escape(out, code);
                i += len;
            }
            continue;
        }
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (ch == quote) {
                    out.push_back('\\');
                    out.push_back(ch);
                } else if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f) {
                    append_escape(out, static_cast<unsigned char>(ch));
                } else {
                    out.push_back(ch);
                }
                break;
        }
        ++i;
    }
    out.push_back(quote);
    return out;
}

auto format_group_key(const GroupKey& key) -> std::string {
    std::string out = "(";
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(quote_value(key[i]));
    }
    if (key.size() == 1) {
        out.push_back(',');
    }
    out.push_back(')');
    return out;
}

auto to_json(const AnalysisResult& result) -> nlohmann::ordered_json {
    json doc = json::object();
    json metadata = json::object();
    metadata["total_rows_processed"] = result.total_rows_processed;
    metadata["analysis_type"] = result.grouped() ? "grouped" : "overall";
    if (result.grouped()) {
        metadata["grouped_by"] = result.grouped_by;
    }
    doc["analysis_metadata"] = std::move(metadata);

    if (result.grouped()) {
        json groups = json::object();
        for (const auto& group : result.groups) {
            groups[format_group_key(group.key)] = columns_to_json(group);
        }
        doc["grouped_analysis"] = std::move(groups);
    } else {
        doc["overall_analysis"] =
            result.groups.empty() ? json::object() : columns_to_json(result.groups.front());
    }
    return doc;
}

auto to_json_text(const AnalysisResult& result) -> std::string {
    return to_json(result).dump(4, ' ', false, json::error_handler_t::replace);
}

auto write_report(const AnalysisResult& result, std::string_view path)
    -> std::expected<void, AnalysisError> {
    const std::filesystem::path target{std::string(path)};
    std::filesystem::path temp = target;
    temp += ".tmp";

    auto fail = [&](std::string message) -> std::unexpected<AnalysisError> {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return std::unexpected(
            AnalysisError{.kind = ErrorKind::WriteFailure, .message = std::move(message)});
    };

    std::string text;
    try {
        text = to_json_text(result);
    } catch (const std::exception& e) {
        return fail(fmt::format("failed to serialize report: {}", e.what()));
    }

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail(fmt::format("cannot write to '{}'", temp.string()));
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            return fail(fmt::format("write to '{}' failed", temp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return fail(fmt::format("cannot move report into place at '{}': {}", target.string(),
                                ec.message()));
    }
    spdlog::info("results written to '{}'", target.string());
    return {};
}

}  // namespace strata::runtime
