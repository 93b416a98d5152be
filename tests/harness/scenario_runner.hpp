#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "core/match_outcome.hpp"
#include "core/matcher.hpp"
#include "core/recon_config.hpp"
#include "core/recon_error.hpp"
#include "tests/harness/scenario_builder.hpp"

namespace test {

struct ScenarioResult {
    bool ok{false};
    core::MatchReport report;
    core::ReconError error;
    std::vector<core::TxnRecord> ledger;  // post-run, claim state visible
    std::vector<core::TxnRecord> bank;
};

inline ScenarioResult run_scenario(const ReconScenarioBuilder& scenario,
                                   const core::MatchConfig& config = core::default_match_config()) {
    ScenarioResult result;
    result.ledger = scenario.build_ledger();
    result.bank = scenario.build_bank();
    core::Matcher matcher(config);
    result.ok = matcher.run(result.ledger, result.bank, result.report, result.error);
    return result;
}

// Every input record appears in exactly one outcome, and no record is bound
// twice.
inline bool check_partition(const ScenarioResult& result) {
    std::multiset<std::size_t> ledger_seen;
    std::multiset<std::size_t> bank_seen;
    for (const auto& o : result.report.outcomes) {
        if (o.ledger) {
            ledger_seen.insert(o.ledger->row_index);
        }
        if (o.bank) {
            bank_seen.insert(o.bank->row_index);
        }
    }
    if (ledger_seen.size() != result.ledger.size() || bank_seen.size() != result.bank.size()) {
        return false;
    }
    for (std::size_t i = 0; i < result.ledger.size(); ++i) {
        if (ledger_seen.count(i) != 1) {
            return false;
        }
    }
    for (std::size_t i = 0; i < result.bank.size(); ++i) {
        if (bank_seen.count(i) != 1) {
            return false;
        }
    }
    return true;
}

inline bool same_outcome(const core::MatchOutcome& a, const core::MatchOutcome& b) {
    auto same_rec = [](const std::optional<core::TxnRecord>& x, const std::optional<core::TxnRecord>& y) {
        if (x.has_value() != y.has_value()) {
            return false;
        }
        if (!x) {
            return true;
        }
        return x->row_index == y->row_index && x->date == y->date &&
               x->signed_amount() == y->signed_amount() && x->description == y->description;
    };
    return a.quality == b.quality && a.difference == b.difference && same_rec(a.bank, b.bank) &&
           same_rec(a.ledger, b.ledger);
}

// Runs twice on fresh copies and compares outcome order and content.
inline bool check_determinism(const ReconScenarioBuilder& scenario,
                              const core::MatchConfig& config = core::default_match_config()) {
    const auto r1 = run_scenario(scenario, config);
    const auto r2 = run_scenario(scenario, config);
    if (r1.ok != r2.ok || r1.report.outcomes.size() != r2.report.outcomes.size()) {
        return false;
    }
    for (std::size_t i = 0; i < r1.report.outcomes.size(); ++i) {
        if (!same_outcome(r1.report.outcomes[i], r2.report.outcomes[i])) {
            return false;
        }
    }
    return true;
}

} // namespace test
