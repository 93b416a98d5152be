#pragma once

#include <cstddef>
#include <vector>

#include "core/match_outcome.hpp"
#include "core/recon_config.hpp"
#include "core/recon_error.hpp"
#include "core/txn_record.hpp"

namespace core {

// Rejects empty collections, records on the wrong side and records that are
// already claimed. Ledger is checked before bank.
bool validate_inputs(const std::vector<TxnRecord>& ledger,
                     const std::vector<TxnRecord>& bank,
                     ReconError& err);

// Greedy first-fit matcher. Each ledger record is bound to at most one bank
// record and vice versa; candidates are taken in bank input order, not by
// closeness. The exact pass completes before the fee pass starts.
//
// Output order: exact and fee outcomes in binding order, then unmatched bank
// records, then unmatched ledger records, each in input order.
class Matcher {
public:
    explicit Matcher(const MatchConfig& config = default_match_config()) noexcept;

    // Validates the config (ConfigError), then the inputs, then runs all
    // passes. Only match_state of the records is modified. On failure returns false, leaves `out` empty and fills `err`;
    // no record is claimed in that case.
    bool run(std::vector<TxnRecord>& ledger,
             std::vector<TxnRecord>& bank,
             MatchReport& out,
             ReconError& err);

    const MatchConfig& config() const noexcept { return config_; }

private:
    void exact_pass(std::vector<TxnRecord>& ledger, std::vector<TxnRecord>& bank, MatchReport& out);
    void fee_pass(std::vector<TxnRecord>& ledger, std::vector<TxnRecord>& bank, MatchReport& out);
    void report_residuals(const std::vector<TxnRecord>& ledger,
                          const std::vector<TxnRecord>& bank,
                          MatchReport& out);
    void append(MatchReport& out, MatchOutcome&& outcome);

    MatchConfig config_;
};

} // namespace core
