#pragma once

#include <cstdint>

#include "core/amount.hpp"
#include "core/recon_config.hpp"
#include "core/txn_record.hpp"

namespace core {

inline constexpr std::int64_t basis_points = 10'000;

inline bool within_date_window(const TxnRecord& ledger, const TxnRecord& bank,
                               const MatchConfig& cfg) noexcept {
    return abs_days_between(ledger.date, bank.date) <= cfg.date_window_days;
}

inline bool amounts_agree(const TxnRecord& ledger, const TxnRecord& bank,
                          const MatchConfig& cfg) noexcept {
    return abs_micros(ledger.unsigned_amount() - bank.unsigned_amount()) <= cfg.amount_tolerance;
}

// bank * 10000 > ledger * floor_bp, evaluated without overflow for any
// non-negative amounts and floor_bp in [0, 10000]; validate_match_config
// enforces that range before any pass runs.
inline bool above_fee_floor(Micros bank, Micros ledger, std::int64_t floor_bp) noexcept {
    const Micros q = ledger / basis_points;
    const Micros r = ledger % basis_points;
    const Micros t = bank - q * floor_bp;
    if (t <= 0) {
        return false;
    }
    if (t > basis_points) {
        return true;
    }
    return t * basis_points > r * floor_bp;
}

inline bool is_exact_candidate(const TxnRecord& ledger, const TxnRecord& bank,
                               const MatchConfig& cfg) noexcept {
    return amounts_agree(ledger, bank, cfg) && within_date_window(ledger, bank, cfg);
}

// Requires ledger.unsigned_amount() > 0; the fee pass filters that first.
inline bool is_fee_candidate(const TxnRecord& ledger, const TxnRecord& bank,
                             const MatchConfig& cfg) noexcept {
    const Micros l = ledger.unsigned_amount();
    const Micros b = bank.unsigned_amount();
    return b < l && above_fee_floor(b, l, cfg.fee_floor_bp) && within_date_window(ledger, bank, cfg);
}

} // namespace core
