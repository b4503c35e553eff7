#pragma once
// gen_ad_data: synthetic ad-library rows for strata benchmarks.
//
// Columns: country (categorical), spend (numeric), impressions (numeric),
// currency (categorical), publisher_platforms (list literal).

#include <strata/runtime/row.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

inline auto gen_ad_header() -> strata::runtime::Header {
    return {"country", "spend", "impressions", "currency", "publisher_platforms"};
}

inline auto gen_ad_rows(std::int64_t n) -> std::vector<strata::runtime::Row> {
    if (n < 0)
        throw std::invalid_argument("gen_ad_rows: n must be non-negative");
    static constexpr std::array<const char*, 6> kCountries = {"US", "FR", "DE", "BR", "JP", "IN"};
    static constexpr std::array<const char*, 3> kCurrencies = {"USD", "EUR", "BRL"};
    static constexpr std::array<const char*, 4> kPlatforms = {
        "['facebook', 'instagram']", "['facebook']", "['instagram', 'messenger']",
        "['facebook', 'audience_network', 'messenger']"};

    auto rows = static_cast<std::size_t>(n);
    std::vector<strata::runtime::Row> out;
    out.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        out.push_back({
            kCountries[i % kCountries.size()],
            fmt::format("{}", 10.0 + static_cast<double>(i % 997) * 0.5),
            fmt::format("{}", 1000 + (i * 7919) % 100000),
            kCurrencies[i % kCurrencies.size()],
            kPlatforms[(i / 3) % kPlatforms.size()],
        });
    }
    return out;
}
