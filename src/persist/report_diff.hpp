#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace persist {

struct DiffStats {
    std::size_t lines_compared{0};
    std::size_t mismatches{0};
    std::size_t missing_lines{0};  // present in expected only
    std::size_t extra_lines{0};    // present in actual only
};

enum class DiffResult {
    Match,
    Mismatch,
    IoError
};

inline const char* diff_result_name(DiffResult r) noexcept {
    switch (r) {
    case DiffResult::Match: return "match";
    case DiffResult::Mismatch: return "mismatch";
    case DiffResult::IoError: return "io_error";
    }
    return "unknown";
}

// Line-by-line comparison of two report files. CRLF and LF line ends compare
// equal. `out_report` lists at most the first ten differing lines.
DiffResult diff_reports(const std::filesystem::path& expected_path,
                        const std::filesystem::path& actual_path,
                        DiffStats& stats,
                        std::string& out_report) noexcept;

} // namespace persist
