#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/recon_error.hpp"
#include "core/txn_record.hpp"

namespace ingest {

// Canonical column names produced by the upstream normalization step.
inline constexpr std::string_view date_column = "std_date";
inline constexpr std::string_view desc_column = "std_desc";
inline constexpr std::string_view amount_column = "std_amt";

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

// RFC-4180 style reader: comma separated, double-quote quoting with ""
// escapes, LF or CRLF line ends. Blank lines are skipped and a leading UTF-8
// BOM is dropped. Returns false with `error` set on malformed quoting.
bool parse_csv(std::string_view text, CsvTable& out, std::string& error) noexcept;

// Maps a canonical CSV document onto transaction records for one side.
//   ReadError   - malformed CSV, no header, or a canonical column is absent
//   EmptyInput  - header present but no data rows
//   SchemaError - a row lacks a field, or its date/amount does not parse
// On failure `out` is left empty.
bool parse_transactions(std::string_view text,
                        core::Origin origin,
                        std::vector<core::TxnRecord>& out,
                        core::ReconError& err) noexcept;

// As parse_transactions, reading from a file. An unreadable file is a ReadError.
bool read_transactions(const std::filesystem::path& path,
                       core::Origin origin,
                       std::vector<core::TxnRecord>& out,
                       core::ReconError& err) noexcept;

} // namespace ingest
