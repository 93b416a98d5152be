#include "persist/report_writer.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include "core/amount.hpp"
#include "core/civil_date.hpp"
#include "util/log.hpp"

namespace persist {
namespace {

void append_record_cells(std::string& line, const std::optional<core::TxnRecord>& rec) {
    if (!rec) {
        line += ",,,";
        return;
    }
    line += core::format_date(rec->date);
    line.push_back(',');
    line += escape_csv_field(rec->description);
    line.push_back(',');
    line += core::format_amount(rec->signed_amount());
    line.push_back(',');
}

} // namespace

std::string escape_csv_field(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_report_row(const core::MatchOutcome& outcome) {
    std::string line = core::match_quality_label(outcome.quality);
    line.push_back(',');
    append_record_cells(line, outcome.bank);
    append_record_cells(line, outcome.ledger);
    if (outcome.difference) {
        line += core::format_amount(*outcome.difference);
    }
    return line;
}

std::string format_report_csv(const core::MatchReport& report) {
    std::string out(report_header);
    out.push_back('\n');
    for (const auto& outcome : report.outcomes) {
        out += format_report_row(outcome);
        out.push_back('\n');
    }
    return out;
}

ReportWriter::ReportWriter(std::unique_ptr<IFileSink> sink) noexcept
    : sink_(sink ? std::move(sink) : std::make_unique<PosixFileSink>()) {}

bool ReportWriter::writev_fully(const struct iovec* iov, int iovcnt, std::size_t& total,
                                std::string& error) noexcept {
    std::vector<struct iovec> cur(iov, iov + iovcnt);
    std::size_t first = 0;
    while (first < cur.size()) {
        std::size_t bytes_written = 0;
        const auto res = sink_->writev(cur.data() + first, static_cast<int>(cur.size() - first), bytes_written);
        if (!res.ok) {
            if (res.error_code == EINTR) {
                continue;
            }
            error = std::string("write failed: ") + std::strerror(res.error_code);
            return false;
        }
        if (bytes_written == 0) {
            error = "write made no progress";
            return false;
        }
        total += bytes_written;
        // Advance past fully written buffers, then into a partially written one.
        while (first < cur.size() && bytes_written >= cur[first].iov_len) {
            bytes_written -= cur[first].iov_len;
            ++first;
        }
        if (first < cur.size() && bytes_written > 0) {
            cur[first].iov_base = static_cast<char*>(cur[first].iov_base) + bytes_written;
            cur[first].iov_len -= bytes_written;
        }
    }
    return true;
}

bool ReportWriter::write(const std::filesystem::path& path,
                         const core::MatchReport& report,
                         ReportWriteStats& stats,
                         std::string& error) noexcept {
    stats = ReportWriteStats{};

    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "failed to create " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    // Staged beside `path`; `path` itself only changes through the final rename.
    auto staging = path;
    staging += ".tmp";
    auto discard_staging = [&] {
        std::error_code rm_ec;
        std::filesystem::remove(staging, rm_ec);
    };

    const auto open_res = sink_->open(staging.string());
    if (!open_res.ok) {
        error = "failed to open " + staging.string() + ": " + std::strerror(open_res.error_code);
        return false;
    }

    std::string body = format_report_csv(report);
    struct iovec iov {};
    iov.iov_base = body.data();
    iov.iov_len = body.size();

    std::size_t total = 0;
    if (!writev_fully(&iov, 1, total, error)) {
        error += " (" + staging.string() + ")";
        const auto close_res = sink_->close();
        if (!close_res.ok) {
            LOG_SLOW_WARN("close after failed write: %s", std::strerror(close_res.error_code));
        }
        discard_staging();
        return false;
    }

    const auto close_res = sink_->close();
    if (!close_res.ok) {
        error = "failed to close " + staging.string() + ": " + std::strerror(close_res.error_code);
        discard_staging();
        return false;
    }

    std::filesystem::rename(staging, path, ec);
    if (ec) {
        error = "failed to replace " + path.string() + ": " + ec.message();
        discard_staging();
        return false;
    }

    stats.rows_written = report.outcomes.size();
    stats.bytes_written = total;
    LOG_SLOW_DEBUG("report written path=%s rows=%zu bytes=%zu", path.string().c_str(), stats.rows_written,
                   stats.bytes_written);
    return true;
}

} // namespace persist
