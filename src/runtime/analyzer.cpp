#include <strata/runtime/analyzer.hpp>
#include <strata/runtime/csv.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <thread>

namespace strata::runtime {

auto to_string(AnalyzerState state) noexcept -> std::string_view {
    switch (state) {
        case AnalyzerState::Uninitialized:
            return "uninitialized";
        case AnalyzerState::TypesDetected:
            return "types-detected";
        case AnalyzerState::Accumulating:
            return "accumulating";
        case AnalyzerState::Finalized:
            return "finalized";
    }
    return "unknown";
}

auto AnalysisResult::find_group(const GroupKey& key) const -> const GroupResult* {
    auto it = std::ranges::find(groups, key, &GroupResult::key);
    return it == groups.end() ? nullptr : &*it;
}

auto AnalysisResult::find_column(const std::string& column, const GroupKey& key) const
    -> const ColumnResult* {
    const auto* group = find_group(key);
    if (group == nullptr) {
        return nullptr;
    }
    auto it = std::ranges::find(group->columns, column, &ColumnResult::name);
    return it == group->columns.end() ? nullptr : &*it;
}

// ─── Analyzer ─────────────────────────────────────────────────────────────────

Analyzer::Analyzer(Header header, AnalysisConfig config, std::vector<std::size_t> group_indices)
    : header_(std::move(header)),
      config_(std::move(config)),
      group_indices_(std::move(group_indices)) {}

auto Analyzer::create(Header header, AnalysisConfig config)
    -> std::expected<Analyzer, AnalysisError> {
    std::vector<std::size_t> indices;
    indices.reserve(config.group_by.size());
    for (const auto& name : config.group_by) {
        auto it = std::ranges::find(header, name);
        if (it == header.end()) {
            return std::unexpected(AnalysisError{
                .kind = ErrorKind::UnknownGroupColumn,
                .message = fmt::format("group-by column '{}' not found in header (columns: {})",
                                       name, fmt::join(header, ", "))});
        }
        indices.push_back(static_cast<std::size_t>(it - header.begin()));
    }
    return Analyzer(std::move(header), std::move(config), std::move(indices));
}

void Analyzer::require(AnalyzerState lo, AnalyzerState hi, std::string_view op) const {
    if (state_ < lo || state_ > hi) {
        throw std::logic_error(
            fmt::format("Analyzer::{} is not allowed in state '{}'", op, to_string(state_)));
    }
}

void Analyzer::detect_types(std::span<const Row> sample) {
    const std::size_t n = std::min(sample.size(), config_.detector.sample_size);
    spdlog::info("detecting column types from {} sample rows", n);
    auto types = detect_column_types(header_, sample, config_.detector);
    std::vector<std::string> summary;
    summary.reserve(types.size());
    for (std::size_t i = 0; i < types.size(); ++i) {
        summary.push_back(fmt::format("{}={}", types.name(i), core::to_string(types.type(i))));
    }
    spdlog::info("column types: {}", fmt::join(summary, ", "));
    set_types(std::move(types));
}

void Analyzer::set_types(ColumnTypes types) {
    require(AnalyzerState::Uninitialized, AnalyzerState::Uninitialized, "set_types");
    if (types.names() != header_) {
        throw std::invalid_argument("column types do not match the header");
    }
    router_.emplace(types, group_indices_);
    types_ = std::move(types);
    state_ = AnalyzerState::TypesDetected;
}

auto Analyzer::types() const -> const ColumnTypes& {
    require(AnalyzerState::TypesDetected, AnalyzerState::Finalized, "types");
    return *types_;
}

auto Analyzer::router() const -> const GroupRouter& {
    require(AnalyzerState::TypesDetected, AnalyzerState::Finalized, "router");
    return *router_;
}

auto Analyzer::consume(const Row& row) -> bool {
    require(AnalyzerState::TypesDetected, AnalyzerState::Accumulating, "consume");
    state_ = AnalyzerState::Accumulating;
    if (row.size() < header_.size()) {
        ++rows_skipped_;
        spdlog::debug("skipping malformed row: {} fields, expected {}", row.size(),
                      header_.size());
        return false;
    }
    ++rows_processed_;

    GroupKey key;
    key.reserve(group_indices_.size());
    for (auto idx : group_indices_) {
        key.push_back(row[idx]);
    }
    auto& accumulators = router_->route(key);
    const auto& measured = router_->measured_columns();
    for (std::size_t i = 0; i < measured.size(); ++i) {
        const auto& value = row[measured[i]];
        if (value.empty()) {
            continue;
        }
        core::ingest(accumulators[i], value);
    }
    return true;
}

void Analyzer::merge(const Analyzer& other) {
    require(AnalyzerState::TypesDetected, AnalyzerState::Accumulating, "merge");
    other.require(AnalyzerState::TypesDetected, AnalyzerState::Accumulating, "merge");
    if (other.header_ != header_ || other.group_indices_ != group_indices_ ||
        *other.types_ != *types_) {
        throw std::logic_error("cannot merge analyzers over different inputs");
    }
    router_->merge(*other.router_);
    rows_processed_ += other.rows_processed_;
    rows_skipped_ += other.rows_skipped_;
    state_ = AnalyzerState::Accumulating;
}

auto Analyzer::finish(bool stopped_early) -> AnalysisResult {
    require(AnalyzerState::TypesDetected, AnalyzerState::Accumulating, "finish");
    if (group_indices_.empty() && router_->size() == 0) {
        // The overall analysis always reports every column, even on empty input.
        static_cast<void>(router_->route(GroupKey{}));
    }

    AnalysisResult result;
    result.total_rows_processed = rows_processed_;
    result.rows_skipped = rows_skipped_;
    result.grouped_by = config_.group_by;
    result.types = *types_;
    result.stopped_early = stopped_early;
    result.groups.reserve(router_->size());

    const auto& measured = router_->measured_columns();
    for (const auto& group : router_->groups()) {
        GroupResult out;
        out.key = group.key;
        out.columns.reserve(measured.size());
        for (std::size_t i = 0; i < measured.size(); ++i) {
            out.columns.push_back(ColumnResult{
                .name = header_[measured[i]],
                .type = types_->type(measured[i]),
                .stats = core::finalize(group.accumulators[i], config_.top_k),
            });
        }
        result.groups.push_back(std::move(out));
    }
    state_ = AnalyzerState::Finalized;
    return result;
}

// ─── Drivers ──────────────────────────────────────────────────────────────────

namespace {

void log_mode(const AnalysisConfig& config) {
    if (config.group_by.empty()) {
        spdlog::info("performing overall analysis (no grouping)");
    } else {
        spdlog::info("performing grouped analysis by: {}", fmt::join(config.group_by, ", "));
    }
}

void log_done(const AnalysisResult& result) {
    if (result.stopped_early) {
        spdlog::warn("stop requested before end of input; results cover {} accumulated rows",
                     result.total_rows_processed);
    }
    spdlog::info("processed {} rows ({} malformed rows skipped), {} group(s)",
                 result.total_rows_processed, result.rows_skipped, result.groups.size());
}

}  // namespace

auto analyze_rows(const Header& header, std::span<const Row> rows, const AnalysisConfig& config,
                  std::stop_token stop) -> std::expected<AnalysisResult, AnalysisError> {
    auto analyzer = Analyzer::create(header, config);
    if (!analyzer) {
        return std::unexpected(analyzer.error());
    }
    log_mode(config);
    analyzer->detect_types(rows);

    bool stopped = false;
    for (const auto& row : rows) {
        if (stop.stop_requested()) {
            stopped = true;
            break;
        }
        static_cast<void>(analyzer->consume(row));
    }
    auto result = analyzer->finish(stopped);
    log_done(result);
    return result;
}

namespace {

auto resolve_threads(std::size_t requested) -> std::size_t {
    if (requested == 0) {
        return std::max<unsigned>(1, std::thread::hardware_concurrency());
    }
    return requested;
}

/// Accumulate `rows` into `into`, one contiguous chunk per worker. Partials
/// are merged in chunk order, which keeps group and token first-seen order
/// identical to a sequential scan. Returns true if a stop was observed.
auto accumulate(Analyzer& into, std::span<const Row> rows, std::size_t threads,
                const std::stop_token& stop) -> bool {
    threads = std::min(threads, std::max<std::size_t>(1, rows.size()));
    if (threads <= 1) {
        for (const auto& row : rows) {
            if (stop.stop_requested()) {
                return true;
            }
            static_cast<void>(into.consume(row));
        }
        return false;
    }

    // Every worker starts from the same typed, empty state.
    auto seed = Analyzer::create(into.header(), into.config());
    if (!seed) {
        throw std::logic_error(seed.error().format());
    }
    seed->set_types(into.types());
    std::vector<Analyzer> partials(threads, *seed);
    std::vector<std::exception_ptr> failures(threads);
    std::atomic<bool> stopped{false};
    const std::size_t chunk = (rows.size() + threads - 1) / threads;
    spdlog::debug("accumulating {} rows on {} workers ({} rows per chunk)", rows.size(), threads,
                  chunk);

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        const std::size_t start = std::min(rows.size(), t * chunk);
        const std::size_t end = std::min(rows.size(), start + chunk);
        workers.emplace_back([&, t, start, end] {
            try {
                for (std::size_t r = start; r < end; ++r) {
                    if (stop.stop_requested()) {
                        stopped.store(true, std::memory_order_relaxed);
                        break;
                    }
                    static_cast<void>(partials[t].consume(rows[r]));
                }
            } catch (...) {
                failures[t] = std::current_exception();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    for (const auto& partial : partials) {
        into.merge(partial);
    }
    return stopped.load();
}

}  // namespace

auto analyze_rows_parallel(const Header& header, std::span<const Row> rows,
                           const AnalysisConfig& config, std::stop_token stop)
    -> std::expected<AnalysisResult, AnalysisError> {
    const std::size_t threads = resolve_threads(config.threads);
    if (std::min(threads, rows.size()) <= 1) {
        return analyze_rows(header, rows, config, stop);
    }

    auto analyzer = Analyzer::create(header, config);
    if (!analyzer) {
        return std::unexpected(analyzer.error());
    }
    log_mode(config);
    analyzer->detect_types(rows);

    const bool stopped = accumulate(*analyzer, rows, threads, stop);
    auto result = analyzer->finish(stopped);
    log_done(result);
    return result;
}

auto analyze_csv(std::string_view path, const AnalysisConfig& config, std::stop_token stop)
    -> std::expected<AnalysisResult, AnalysisError> {
    spdlog::info("reading {}", path);
    const std::size_t batch_rows = std::max<std::size_t>(1, config.batch_rows);
    auto reader = CsvReader::open(path, batch_rows);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    auto analyzer = Analyzer::create(reader->header(), config);
    if (!analyzer) {
        return std::unexpected(analyzer.error());
    }
    log_mode(config);
    const std::size_t threads = resolve_threads(config.threads);

    // Buffer just enough leading records to detect types, then stream.
    std::vector<Row> pending;
    while (pending.size() < config.detector.sample_size) {
        auto batch = reader->next_batch();
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (batch->empty()) {
            break;
        }
        std::ranges::move(*batch, std::back_inserter(pending));
    }
    analyzer->detect_types(pending);

    bool stopped = accumulate(*analyzer, pending, threads, stop);
    pending = {};
    while (!stopped) {
        auto batch = reader->next_batch();
        if (!batch) {
            return std::unexpected(batch.error());
        }
        if (batch->empty()) {
            break;
        }
        stopped = accumulate(*analyzer, *batch, threads, stop);
    }
    auto result = analyzer->finish(stopped);
    log_done(result);
    return result;
}

}  // namespace strata::runtime
