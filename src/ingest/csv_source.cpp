#include "ingest/csv_source.hpp"

#include <fstream>
#include <optional>
#include <utility>

#include "core/amount.hpp"
#include "core/civil_date.hpp"
#include "util/log.hpp"

namespace ingest {
namespace {

class CsvCursor {
public:
    explicit CsvCursor(std::string_view s) : src_(s) {
        if (src_.substr(0, 3) == "\xEF\xBB\xBF") {
            pos_ = 3;
        }
    }

    bool eof() const noexcept { return pos_ >= src_.size(); }

    // Consumes one line terminator if present.
    bool consume_eol() noexcept {
        if (pos_ < src_.size() && src_[pos_] == '\r') {
            ++pos_;
            if (pos_ < src_.size() && src_[pos_] == '\n') {
                ++pos_;
            }
            ++line_;
            return true;
        }
        if (pos_ < src_.size() && src_[pos_] == '\n') {
            ++pos_;
            ++line_;
            return true;
        }
        return false;
    }

    bool at_eol() const noexcept {
        return pos_ < src_.size() && (src_[pos_] == '\r' || src_[pos_] == '\n');
    }

    // Reads one record; `blank` is set when the line held nothing at all.
    bool parse_record(std::vector<std::string>& fields, bool& blank, std::string& err) {
        fields.clear();
        blank = false;
        if (at_eol()) {
            blank = true;
            consume_eol();
            return true;
        }
        while (true) {
            auto field = parse_field(err);
            if (!field) {
                return false;
            }
            fields.push_back(std::move(*field));
            if (pos_ < src_.size() && src_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (eof() || consume_eol()) {
                return true;
            }
            err = "Unexpected character after quoted field";
            return false;
        }
    }

    std::size_t line() const noexcept { return line_; }

private:
    std::optional<std::string> parse_field(std::string& err) {
        std::string out;
        if (pos_ < src_.size() && src_[pos_] == '"') {
            ++pos_; // skip opening quote
            while (pos_ < src_.size()) {
                const char c = src_[pos_++];
                if (c == '"') {
                    if (pos_ < src_.size() && src_[pos_] == '"') {
                        out.push_back('"');
                        ++pos_;
                        continue;
                    }
                    return out;
                }
                if (c == '\n') {
                    ++line_;
                }
                out.push_back(c);
            }
            err = "Unterminated quoted field";
            return std::nullopt;
        }
        while (pos_ < src_.size() && src_[pos_] != ',' && src_[pos_] != '\r' && src_[pos_] != '\n') {
            out.push_back(src_[pos_++]);
        }
        return out;
    }

    std::size_t pos_{0};
    std::size_t line_{1};
    std::string_view src_;
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::size_t> find_column(const std::vector<std::string>& header, std::string_view name) noexcept {
    std::optional<std::size_t> found;
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (trim(header[i]) == name) {
            if (found) {
                return std::nullopt;
            }
            found = i;
        }
    }
    return found;
}

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace

bool parse_csv(std::string_view text, CsvTable& out, std::string& error) noexcept {
    out = CsvTable{};
    CsvCursor cur(text);
    bool have_header = false;
    std::vector<std::string> fields;
    while (!cur.eof()) {
        bool blank = false;
        if (!cur.parse_record(fields, blank, error)) {
            error += " near line " + std::to_string(cur.line());
            return false;
        }
        if (blank) {
            continue;
        }
        if (!have_header) {
            out.header = fields;
            have_header = true;
        } else {
            out.rows.push_back(fields);
        }
    }
    return true;
}

bool parse_transactions(std::string_view text,
                        core::Origin origin,
                        std::vector<core::TxnRecord>& out,
                        core::ReconError& err) noexcept {
    using core::ReconErrorKind;
    out.clear();

    CsvTable table;
    std::string csv_err;
    if (!parse_csv(text, table, csv_err)) {
        err = core::make_error(ReconErrorKind::ReadError, origin, 0, csv_err);
        return false;
    }
    if (table.header.empty()) {
        err = core::make_error(ReconErrorKind::ReadError, origin, 0, "missing header row");
        return false;
    }

    const auto date_idx = find_column(table.header, date_column);
    const auto desc_idx = find_column(table.header, desc_column);
    const auto amt_idx = find_column(table.header, amount_column);
    for (const auto& [idx, name] : {std::pair{date_idx, date_column},
                                    std::pair{desc_idx, desc_column},
                                    std::pair{amt_idx, amount_column}}) {
        if (!idx) {
            err = core::make_error(ReconErrorKind::ReadError, origin, 0,
                                   "header must contain exactly one '" + std::string(name) + "' column");
            return false;
        }
    }

    if (table.rows.empty()) {
        err = core::make_error(ReconErrorKind::EmptyInput, origin, 0, "no data rows after header");
        return false;
    }

    std::vector<core::TxnRecord> records;
    records.reserve(table.rows.size());
    for (std::size_t i = 0; i < table.rows.size(); ++i) {
        const auto& row = table.rows[i];
        const std::size_t row_no = i + 1;
        auto missing = [&](std::string_view name) {
            err = core::make_error(ReconErrorKind::SchemaError, origin, row_no,
                                   "missing field '" + std::string(name) + "'");
            return false;
        };
        if (*date_idx >= row.size()) return missing(date_column);
        if (*desc_idx >= row.size()) return missing(desc_column);
        if (*amt_idx >= row.size()) return missing(amount_column);

        const auto date_text = trim(row[*date_idx]);
        const auto amt_text = trim(row[*amt_idx]);
        if (date_text.empty()) return missing(date_column);
        if (amt_text.empty()) return missing(amount_column);

        core::CivilDate date{};
        if (!core::parse_date(date_text, date)) {
            err = core::make_error(ReconErrorKind::SchemaError, origin, row_no,
                                   "invalid date '" + std::string(date_text) + "'");
            return false;
        }
        core::Micros amount = 0;
        if (!core::parse_amount(amt_text, amount)) {
            err = core::make_error(ReconErrorKind::SchemaError, origin, row_no,
                                   "invalid amount '" + std::string(amt_text) + "'");
            return false;
        }
        records.emplace_back(origin, i, date, row[*desc_idx], amount);
    }

    out = std::move(records);
    err = core::ReconError{};
    return true;
}

bool read_transactions(const std::filesystem::path& path,
                       core::Origin origin,
                       std::vector<core::TxnRecord>& out,
                       core::ReconError& err) noexcept {
    out.clear();
    std::string contents;
    std::string io_err;
    if (!load_file(path, contents, io_err)) {
        err = core::make_error(core::ReconErrorKind::ReadError, origin, 0, io_err);
        return false;
    }
    if (!parse_transactions(contents, origin, out, err)) {
        err.message += " (" + path.string() + ")";
        return false;
    }
    LOG_SLOW_DEBUG("loaded %zu %s records from %s", out.size(), core::origin_name(origin), path.string().c_str());
    return true;
}

} // namespace ingest
