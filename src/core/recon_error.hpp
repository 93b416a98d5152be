#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "core/txn_record.hpp"

namespace core {

enum class ReconErrorKind : std::uint8_t {
    None,
    ReadError,    // source could not be parsed into the canonical schema
    EmptyInput,   // parsed source holds zero records
    SchemaError,  // a record lacks a required field or violates the record contract
    ConfigError   // match thresholds out of range; not tied to either input
};

inline const char* error_kind_name(ReconErrorKind k) noexcept {
    switch (k) {
    case ReconErrorKind::None: return "None";
    case ReconErrorKind::ReadError: return "ReadError";
    case ReconErrorKind::EmptyInput: return "EmptyInputError";
    case ReconErrorKind::SchemaError: return "SchemaError";
    case ReconErrorKind::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

struct ReconError {
    ReconErrorKind kind{ReconErrorKind::None};
    Origin side{Origin::Ledger};
    std::size_t row{0}; // 1-based data row, 0 when not row-specific
    std::string message;

    bool ok() const noexcept { return kind == ReconErrorKind::None; }
    explicit operator bool() const noexcept { return !ok(); }

    // "<kind> in <side> input[ row N]: <message>", or "ConfigError: <message>"
    std::string describe() const {
        std::string out = error_kind_name(kind);
        if (kind == ReconErrorKind::ConfigError) {
            return out + ": " + message;
        }
        out += " in ";
        out += origin_name(side);
        out += " input";
        if (row != 0) {
            out += " row ";
            out += std::to_string(row);
        }
        out += ": ";
        out += message;
        return out;
    }
};

inline ReconError make_error(ReconErrorKind kind, Origin side, std::size_t row, std::string message) {
    ReconError err;
    err.kind = kind;
    err.side = side;
    err.row = row;
    err.message = std::move(message);
    return err;
}

} // namespace core
