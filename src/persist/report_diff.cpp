#include "persist/report_diff.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace persist {
namespace {

constexpr std::size_t kMaxReportMismatches = 10;

bool next_line(std::ifstream& in, std::string& line) {
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

} // namespace

DiffResult diff_reports(const std::filesystem::path& expected_path,
                        const std::filesystem::path& actual_path,
                        DiffStats& stats,
                        std::string& out_report) noexcept {
    stats = DiffStats{};
    out_report.clear();

    std::ifstream expected(expected_path, std::ios::binary);
    if (!expected.is_open()) {
        out_report = "failed to open expected report: " + expected_path.string();
        return DiffResult::IoError;
    }
    std::ifstream actual(actual_path, std::ios::binary);
    if (!actual.is_open()) {
        out_report = "failed to open actual report: " + actual_path.string();
        return DiffResult::IoError;
    }

    std::ostringstream oss;
    std::size_t reported = 0;
    std::size_t line_no = 0;
    std::string exp_line;
    std::string act_line;
    auto note = [&](const std::string& text) {
        if (reported < kMaxReportMismatches) {
            oss << text;
        }
        ++reported;
    };

    while (true) {
        const bool have_exp = next_line(expected, exp_line);
        const bool have_act = next_line(actual, act_line);
        if (!have_exp && !have_act) {
            break;
        }
        ++line_no;
        if (have_exp && have_act) {
            ++stats.lines_compared;
            if (exp_line != act_line) {
                ++stats.mismatches;
                note("line " + std::to_string(line_no) + " differs\n  expected: " + exp_line +
                     "\n  actual:   " + act_line + "\n");
            }
        } else if (have_exp) {
            ++stats.missing_lines;
            note("line " + std::to_string(line_no) + " missing from actual: " + exp_line + "\n");
        } else {
            ++stats.extra_lines;
            note("line " + std::to_string(line_no) + " only in actual: " + act_line + "\n");
        }
    }

    if (expected.bad() || actual.bad()) {
        out_report = "read error while comparing reports";
        return DiffResult::IoError;
    }
    if (reported == 0) {
        return DiffResult::Match;
    }
    if (reported > kMaxReportMismatches) {
        oss << "... " << (reported - kMaxReportMismatches) << " more difference(s)\n";
    }
    out_report = oss.str();
    return DiffResult::Mismatch;
}

} // namespace persist
