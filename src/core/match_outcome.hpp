#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/amount.hpp"
#include "core/txn_record.hpp"

namespace core {

enum class MatchQuality : std::uint8_t {
    ExactMatch,       // amounts agree within tolerance, dates within window
    PartialMatchFee,  // bank amount is a fee-reduced share of the ledger amount
    UnmatchedBank,    // bank record with no ledger counterpart
    UnmatchedLedger   // ledger record with no bank counterpart
};

inline const char* match_quality_label(MatchQuality q) noexcept {
    switch (q) {
    case MatchQuality::ExactMatch: return "Exact Match";
    case MatchQuality::PartialMatchFee: return "Partial Match (Fee)";
    case MatchQuality::UnmatchedBank: return "Unmatched Bank";
    case MatchQuality::UnmatchedLedger: return "Unmatched Ledger";
    }
    return "Unknown";
}

// One report row. Records are snapshots taken at binding time.
struct MatchOutcome {
    MatchQuality quality{MatchQuality::UnmatchedLedger};
    std::optional<TxnRecord> bank;
    std::optional<TxnRecord> ledger;
    std::optional<Micros> difference; // present only when both records are
};

inline MatchOutcome make_exact_outcome(const TxnRecord& ledger, const TxnRecord& bank) {
    MatchOutcome out;
    out.quality = MatchQuality::ExactMatch;
    out.bank = bank;
    out.ledger = ledger;
    out.difference = Micros{0};
    return out;
}

inline MatchOutcome make_fee_outcome(const TxnRecord& ledger, const TxnRecord& bank) {
    MatchOutcome out;
    out.quality = MatchQuality::PartialMatchFee;
    out.bank = bank;
    out.ledger = ledger;
    out.difference = round_to_cents(bank.unsigned_amount() - ledger.unsigned_amount());
    return out;
}

inline MatchOutcome make_unmatched_outcome(const TxnRecord& rec) {
    MatchOutcome out;
    if (rec.origin() == Origin::Bank) {
        out.quality = MatchQuality::UnmatchedBank;
        out.bank = rec;
    } else {
        out.quality = MatchQuality::UnmatchedLedger;
        out.ledger = rec;
    }
    return out;
}

struct MatchCounters {
    std::uint64_t ledger_records{0};
    std::uint64_t bank_records{0};

    std::uint64_t exact_matches{0};
    std::uint64_t fee_matches{0};
    std::uint64_t unmatched_bank{0};
    std::uint64_t unmatched_ledger{0};

    std::uint64_t exact_rejected_by_date{0};  // amount agreed, dates outside window
    std::uint64_t fee_pairs_scanned{0};  // unclaimed (ledger, bank) pairs tested by the fee pass
};

struct MatchReport {
    std::vector<MatchOutcome> outcomes;
    MatchCounters counters{};

    bool empty() const noexcept { return outcomes.empty(); }
    std::size_t size() const noexcept { return outcomes.size(); }
};

} // namespace core
