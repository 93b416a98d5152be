#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

#include "core/amount.hpp"

namespace core {

// Matching thresholds. Amounts are in micro-units, windows in calendar days.
struct MatchConfig {
    // Exact pass: |ledger - bank| <= amount_tolerance
    Micros amount_tolerance{10'000};  // 0.01

    // Both passes: |days between ledger and bank| <= date_window_days
    std::int32_t date_window_days{5};

    // Fee pass: bank must be strictly above this share of the ledger amount
    // (basis points) and strictly below the ledger amount.
    std::int64_t fee_floor_bp{9'600};  // 96%

    bool enable_fee_pass{true};
};

static_assert(std::is_trivially_copyable_v<MatchConfig>, "MatchConfig must be trivially copyable");

[[nodiscard]] inline constexpr MatchConfig default_match_config() noexcept {
    return MatchConfig{};
}

// Rejects negative thresholds and a fee floor outside [0, 10000] basis
// points, the range the fee-floor arithmetic is exact for.
inline bool validate_match_config(const MatchConfig& cfg, std::string& error) {
    if (cfg.amount_tolerance < 0) {
        error = "amount_tolerance must not be negative";
        return false;
    }
    if (cfg.date_window_days < 0) {
        error = "date_window_days must not be negative";
        return false;
    }
    if (cfg.fee_floor_bp < 0 || cfg.fee_floor_bp > 10'000) {
        error = "fee_floor_bp must be within [0, 10000], got " + std::to_string(cfg.fee_floor_bp);
        return false;
    }
    return true;
}

} // namespace core
