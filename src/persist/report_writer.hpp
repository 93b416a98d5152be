#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "core/match_outcome.hpp"
#include "persist/file_sink.hpp"

namespace persist {

inline constexpr std::string_view report_header =
    "Match_Quality,Bank_Date,Bank_Desc,Bank_Amt,Ledger_Date,Ledger_Desc,Ledger_Amt,Difference";

struct ReportWriteStats {
    std::size_t rows_written{0};
    std::size_t bytes_written{0};
};

// Quotes a field when it holds a comma, quote or line break.
std::string escape_csv_field(std::string_view field);

// One CSV line (no terminator). Absent records and differences are empty cells.
std::string format_report_row(const core::MatchOutcome& outcome);

// Header plus one line per outcome, each terminated by '\n'.
std::string format_report_csv(const core::MatchReport& report);

class ReportWriter {
public:
    explicit ReportWriter(std::unique_ptr<IFileSink> sink = nullptr) noexcept;

    ReportWriter(const ReportWriter&) = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;

    // Replaces `path` with the formatted report. The body goes to
    // `<path>.tmp` and is renamed over `path` after a clean close; on any I/O
    // failure the staging file is removed, `path` is left as it was, and
    // `error` is filled.
    bool write(const std::filesystem::path& path,
               const core::MatchReport& report,
               ReportWriteStats& stats,
               std::string& error) noexcept;

private:
    bool writev_fully(const struct iovec* iov, int iovcnt, std::size_t& total, std::string& error) noexcept;

    std::unique_ptr<IFileSink> sink_;
};

} // namespace persist
