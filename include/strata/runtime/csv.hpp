#pragma once

#include <strata/runtime/error.hpp>
#include <strata/runtime/row.hpp>

#include <cstddef>
#include <expected>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata::runtime {

inline constexpr std::size_t kDefaultBatchRows = 65536;

/// Header plus raw data records of a CSV document.
///
/// Records keep whatever width they were written with; short records are
/// filtered later by the analyzer, not here.
struct CsvData {
    Header header;
    std::vector<Row> rows;
};

/// Incremental CSV reader: comma separated, RFC 4180 quoting (quoted line
/// breaks included), blank lines skipped.
///
/// Records are split on unquoted line breaks and handed to rapidcsv in
/// batches of at most `batch_rows`, so memory is bounded by one batch.
class CsvReader {
   public:
    [[nodiscard]] static auto open(std::string_view path,
                                   std::size_t batch_rows = kDefaultBatchRows)
        -> std::expected<CsvReader, AnalysisError>;

    [[nodiscard]] static auto from_text(std::string text,
                                        std::size_t batch_rows = kDefaultBatchRows)
        -> std::expected<CsvReader, AnalysisError>;

    [[nodiscard]] auto header() const noexcept -> const Header& { return header_; }

    /// Next batch of records; an empty batch means the input is exhausted.
    [[nodiscard]] auto next_batch() -> std::expected<std::vector<Row>, AnalysisError>;

    [[nodiscard]] auto records_read() const noexcept -> std::size_t { return records_read_; }

   private:
    CsvReader(std::unique_ptr<std::istream> in, std::size_t batch_rows);

    auto read_header() -> std::expected<void, AnalysisError>;
    auto next_record(std::string& record) -> bool;

    std::unique_ptr<std::istream> in_;
    std::size_t batch_rows_;
    Header header_;
    std::size_t records_read_ = 0;
};

/// Read a whole comma-separated file into memory.
[[nodiscard]] auto read_csv(std::string_view path) -> std::expected<CsvData, AnalysisError>;

/// Same as read_csv, from in-memory text.
[[nodiscard]] auto parse_csv(std::string_view text) -> std::expected<CsvData, AnalysisError>;

}  // namespace strata::runtime
