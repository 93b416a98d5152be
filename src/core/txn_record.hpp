#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "core/amount.hpp"
#include "core/civil_date.hpp"

namespace core {

enum class Origin : std::uint8_t { Ledger = 0, Bank = 1 };
enum class MatchState : std::uint8_t { Unclaimed = 0, Claimed = 1 };

inline const char* origin_name(Origin o) noexcept {
    switch (o) {
    case Origin::Ledger: return "ledger";
    case Origin::Bank: return "bank";
    }
    return "unknown";
}

// The only legal transition is Unclaimed -> Claimed.
inline constexpr bool is_valid_claim(MatchState current) noexcept {
    return current == MatchState::Unclaimed;
}

// One observed cash-affecting entry from either source.
class TxnRecord {
public:
    TxnRecord() = default;
    TxnRecord(Origin origin, std::size_t row_index, CivilDate date, std::string description,
              Micros signed_amount) noexcept
        : date(date),
          description(std::move(description)),
          row_index(row_index),
          origin_(origin) {
        set_signed_amount(signed_amount);
    }

    CivilDate date{};
    std::string description;
    std::size_t row_index{0}; // 0-based position within its source

    Origin origin() const noexcept { return origin_; }
    Micros signed_amount() const noexcept { return signed_amount_; }
    Micros unsigned_amount() const noexcept { return unsigned_amount_; }
    MatchState match_state() const noexcept { return match_state_; }
    bool claimed() const noexcept { return match_state_ == MatchState::Claimed; }

    void set_signed_amount(Micros v) noexcept {
        signed_amount_ = v;
        unsigned_amount_ = abs_micros(v);
    }

    // Returns false if the record was already claimed; state is unchanged then.
    bool claim() noexcept {
        if (!is_valid_claim(match_state_)) {
            return false;
        }
        match_state_ = MatchState::Claimed;
        return true;
    }

private:
    Micros signed_amount_{0};
    Micros unsigned_amount_{0};
    Origin origin_{Origin::Ledger};
    MatchState match_state_{MatchState::Unclaimed};
};

inline TxnRecord make_ledger_record(std::size_t row_index, CivilDate date, std::string_view desc,
                                    Micros signed_amount) {
    return TxnRecord(Origin::Ledger, row_index, date, std::string(desc), signed_amount);
}

inline TxnRecord make_bank_record(std::size_t row_index, CivilDate date, std::string_view desc,
                                  Micros signed_amount) {
    return TxnRecord(Origin::Bank, row_index, date, std::string(desc), signed_amount);
}

} // namespace core
