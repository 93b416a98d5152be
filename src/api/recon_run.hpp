#pragma once

#include <filesystem>
#include <vector>

#include "core/match_outcome.hpp"
#include "core/recon_config.hpp"
#include "core/recon_error.hpp"

namespace api {

inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitInput = 2;
inline constexpr int kExitWrite = 3;
inline constexpr int kExitVerify = 4;

struct ReconRunConfig {
    std::filesystem::path ledger_path{};
    std::filesystem::path bank_path{};
    std::filesystem::path output_path{"Reconciliation_Report.csv"};
    std::filesystem::path verify_against{};

    core::MatchConfig match{core::default_match_config()};

    bool quiet{false};
    bool verbose{false};
};

// Checks `match_cfg` (ConfigError), then loads both canonical sources and
// matches them. Either both load and the
// report is produced, or `err` names the first failing input and `out` stays
// empty. The ledger is read and checked before the bank.
bool reconcile_files(const std::filesystem::path& ledger_path,
                     const std::filesystem::path& bank_path,
                     const core::MatchConfig& match_cfg,
                     core::MatchReport& out,
                     core::ReconError& err);

// Full pipeline: load, match, write the CSV report, optionally verify it
// against a golden copy. Returns one of the kExit* codes; a rejected match
// config maps to kExitUsage.
int run_reconciliation(const ReconRunConfig& cfg);

} // namespace api
