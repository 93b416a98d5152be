#include "core/matcher.hpp"

#include <string>
#include <utility>

#include "core/match_rules.hpp"
#include "util/log.hpp"

namespace core {

namespace {

bool check_side(const std::vector<TxnRecord>& records, Origin side, ReconError& err) {
    if (records.empty()) {
        err = make_error(ReconErrorKind::EmptyInput, side, 0,
                         std::string(origin_name(side)) + " collection contains no records");
        return false;
    }
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& rec = records[i];
        if (rec.origin() != side) {
            err = make_error(ReconErrorKind::SchemaError, side, i + 1,
                             std::string("record originates from ") + origin_name(rec.origin()));
            return false;
        }
        if (rec.claimed()) {
            err = make_error(ReconErrorKind::SchemaError, side, i + 1, "record is already claimed");
            return false;
        }
    }
    return true;
}

} // namespace

bool validate_inputs(const std::vector<TxnRecord>& ledger,
                     const std::vector<TxnRecord>& bank,
                     ReconError& err) {
    return check_side(ledger, Origin::Ledger, err) && check_side(bank, Origin::Bank, err);
}

Matcher::Matcher(const MatchConfig& config) noexcept : config_(config) {}

void Matcher::append(MatchReport& out, MatchOutcome&& outcome) {
    switch (outcome.quality) {
    case MatchQuality::ExactMatch:
        ++out.counters.exact_matches;
        break;
    case MatchQuality::PartialMatchFee:
        ++out.counters.fee_matches;
        break;
    case MatchQuality::UnmatchedBank:
        ++out.counters.unmatched_bank;
        break;
    case MatchQuality::UnmatchedLedger:
        ++out.counters.unmatched_ledger;
        break;
    }
    out.outcomes.push_back(std::move(outcome));
}

void Matcher::exact_pass(std::vector<TxnRecord>& ledger, std::vector<TxnRecord>& bank, MatchReport& out) {
    for (auto& l : ledger) {
        if (l.claimed()) {
            continue;
        }
        for (auto& b : bank) {
            if (b.claimed()) {
                continue;
            }
            if (!amounts_agree(l, b, config_)) {
                continue;
            }
            if (!within_date_window(l, b, config_)) {
                ++out.counters.exact_rejected_by_date;
                continue;
            }
            l.claim();
            b.claim();
            LOG_SLOW_DEBUG("exact match ledger_row=%zu bank_row=%zu amount=%s",
                           l.row_index + 1, b.row_index + 1, format_amount(l.unsigned_amount()).c_str());
            append(out, make_exact_outcome(l, b));
            break;
        }
    }
}

void Matcher::fee_pass(std::vector<TxnRecord>& ledger, std::vector<TxnRecord>& bank, MatchReport& out) {
    for (auto& l : ledger) {
        if (l.claimed() || l.unsigned_amount() <= 0) {
            continue;
        }
        for (auto& b : bank) {
            if (b.claimed()) {
                continue;
            }
            ++out.counters.fee_pairs_scanned;
            if (!is_fee_candidate(l, b, config_)) {
                continue;
            }
            l.claim();
            b.claim();
            auto outcome = make_fee_outcome(l, b);
            LOG_SLOW_DEBUG("fee match ledger_row=%zu bank_row=%zu difference=%s",
                           l.row_index + 1, b.row_index + 1, format_amount(*outcome.difference).c_str());
            append(out, std::move(outcome));
            break;
        }
    }
}

void Matcher::report_residuals(const std::vector<TxnRecord>& ledger,
                               const std::vector<TxnRecord>& bank,
                               MatchReport& out) {
    for (const auto& b : bank) {
        if (!b.claimed()) {
            append(out, make_unmatched_outcome(b));
        }
    }
    for (const auto& l : ledger) {
        if (!l.claimed()) {
            append(out, make_unmatched_outcome(l));
        }
    }
}

bool Matcher::run(std::vector<TxnRecord>& ledger,
                  std::vector<TxnRecord>& bank,
                  MatchReport& out,
                  ReconError& err) {
    out = MatchReport{};
    err = ReconError{};

    std::string cfg_err;
    if (!validate_match_config(config_, cfg_err)) {
        err = make_error(ReconErrorKind::ConfigError, Origin::Ledger, 0, cfg_err);
        LOG_SLOW_ERROR("reconciliation aborted: %s", err.describe().c_str());
        return false;
    }
    if (!validate_inputs(ledger, bank, err)) {
        LOG_SLOW_ERROR("reconciliation aborted: %s", err.describe().c_str());
        return false;
    }

    out.counters.ledger_records = ledger.size();
    out.counters.bank_records = bank.size();
    out.outcomes.reserve(ledger.size() + bank.size());

    LOG_SLOW_INFO("matching %zu ledger records against %zu bank records", ledger.size(), bank.size());

    exact_pass(ledger, bank, out);
    LOG_SLOW_INFO("exact pass: %llu matches (%llu amount hits outside date window)",
                  static_cast<unsigned long long>(out.counters.exact_matches),
                  static_cast<unsigned long long>(out.counters.exact_rejected_by_date));

    if (config_.enable_fee_pass) {
        fee_pass(ledger, bank, out);
        LOG_SLOW_INFO("fee pass: %llu matches",
                      static_cast<unsigned long long>(out.counters.fee_matches));
    }

    report_residuals(ledger, bank, out);
    LOG_SLOW_INFO("unmatched bank=%llu ledger=%llu outcomes=%zu",
                  static_cast<unsigned long long>(out.counters.unmatched_bank),
                  static_cast<unsigned long long>(out.counters.unmatched_ledger),
                  out.outcomes.size());
    return true;
}

} // namespace core
