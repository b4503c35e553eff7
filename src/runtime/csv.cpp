#include <strata/runtime/csv.hpp>

#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>

namespace strata::runtime {

namespace {

auto separator_params() -> rapidcsv::SeparatorParams {
    // ',' separator, no trimming, quoted line breaks allowed (RFC 4180).
    return rapidcsv::SeparatorParams(',', false, rapidcsv::sPlatformHasCR, true, true);
}

auto line_reader_params() -> rapidcsv::LineReaderParams {
    return rapidcsv::LineReaderParams(false, '#', true);
}

// Cells of every record in `text`; the reader has already dropped blank lines.
auto parse_records(const std::string& text) -> std::vector<Row> {
    std::istringstream stream(text);
    rapidcsv::Document doc(stream, rapidcsv::LabelParams(-1, -1), separator_params(),
                           rapidcsv::ConverterParams(), line_reader_params());
    std::vector<Row> rows;
    const std::size_t count = doc.GetRowCount();
    rows.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        rows.push_back(doc.GetRow<std::string>(i));
    }
    return rows;
}

auto read_failure(std::string_view what) -> std::unexpected<AnalysisError> {
    return std::unexpected(AnalysisError{.kind = ErrorKind::ReadFailure,
                                         .message = "failed to parse csv: " + std::string(what)});
}

auto collect(CsvReader& reader) -> std::expected<CsvData, AnalysisError> {
    CsvData data;
    data.header = reader.header();
    while (true) {
        auto batch = reader.next_batch();
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (batch->empty()) {
            break;
        }
        std::ranges::move(*batch, std::back_inserter(data.rows));
    }
    return data;
}

}  // namespace

CsvReader::CsvReader(std::unique_ptr<std::istream> in, std::size_t batch_rows)
    : in_(std::move(in)), batch_rows_(std::max<std::size_t>(1, batch_rows)) {}

auto CsvReader::open(std::string_view path, std::size_t batch_rows)
    -> std::expected<CsvReader, AnalysisError> {
    const std::filesystem::path fs_path{std::string(path)};
    std::error_code ec;
    if (!std::filesystem::is_regular_file(fs_path, ec)) {
        return std::unexpected(AnalysisError{.kind = ErrorKind::InputNotFound,
                                             .message = "no such file: " + std::string(path)});
    }
    auto in = std::make_unique<std::ifstream>(fs_path, std::ios::binary);
    if (!*in) {
        return std::unexpected(AnalysisError{
            .kind = ErrorKind::ReadFailure, .message = "cannot open '" + std::string(path) + "'"});
    }
    CsvReader reader(std::move(in), batch_rows);
    if (auto header = reader.read_header(); !header) {
        return std::unexpected(header.error());
    }
    return reader;
}

auto CsvReader::from_text(std::string text, std::size_t batch_rows)
    -> std::expected<CsvReader, AnalysisError> {
    CsvReader reader(std::make_unique<std::istringstream>(std::move(text)), batch_rows);
    if (auto header = reader.read_header(); !header) {
        return std::unexpected(header.error());
    }
    return reader;
}

auto CsvReader::next_record(std::string& record) -> bool {
    record.clear();
    std::string line;
    bool in_quotes = false;
    bool any = false;
    while (std::getline(*in_, line)) {
        any = true;
        // A doubled quote toggles twice, so escaped quotes need no special case.
        in_quotes = (std::ranges::count(line, '"') % 2 == 1) != in_quotes;
        record.append(line);
        if (!in_quotes) {
            if (!record.empty() && record.back() == '\r') {
                record.pop_back();
            }
            return true;
        }
        record.push_back('\n');
    }
    // Unterminated quote at end of input; rapidcsv decides what it means.
    return any;
}

auto CsvReader::read_header() -> std::expected<void, AnalysisError> {
    std::string record;
    while (next_record(record)) {
        if (record.empty()) {
            continue;
        }
        try {
            auto rows = parse_records(record + '\n');
            if (!rows.empty()) {
                header_ = std::move(rows.front());
            }
        } catch (const std::exception& e) {
            return read_failure(e.what());
        }
        break;
    }
    if (header_.empty()) {
        return std::unexpected(
            AnalysisError{.kind = ErrorKind::EmptyInput, .message = "csv has no header row"});
    }
    spdlog::debug("csv: {} columns", header_.size());
    return {};
}

auto CsvReader::next_batch() -> std::expected<std::vector<Row>, AnalysisError> {
    std::string text;
    std::string record;
    std::size_t pending = 0;
    while (pending < batch_rows_ && next_record(record)) {
        if (record.empty()) {
            continue;
        }
        text.append(record);
        text.push_back('\n');
        ++pending;
    }
    if (pending == 0) {
        if (in_->bad()) {
            return read_failure("i/o error while reading input");
        }
        return std::vector<Row>{};
    }
    try {
        auto rows = parse_records(text);
        records_read_ += rows.size();
        spdlog::debug("csv: batch of {} records ({} so far)", rows.size(), records_read_);
        return rows;
    } catch (const std::exception& e) {
        return read_failure(e.what());
    }
}

auto read_csv(std::string_view path) -> std::expected<CsvData, AnalysisError> {
    auto reader = CsvReader::open(path);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return collect(*reader);
}

auto parse_csv(std::string_view text) -> std::expected<CsvData, AnalysisError> {
    auto reader = CsvReader::from_text(std::string(text));
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return collect(*reader);
}

}  // namespace strata::runtime
