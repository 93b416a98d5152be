#include "api/recon_run.hpp"

#include <iostream>
#include <string>

#include "core/matcher.hpp"
#include "core/txn_record.hpp"
#include "ingest/csv_source.hpp"
#include "persist/report_diff.hpp"
#include "persist/report_writer.hpp"
#include "util/log.hpp"

namespace api {

namespace {

void apply_verbosity(const ReconRunConfig& cfg) noexcept {
    if (cfg.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (cfg.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    } else {
        util::set_log_level(util::LogLevel::Info);
    }
}

} // namespace

bool reconcile_files(const std::filesystem::path& ledger_path,
                     const std::filesystem::path& bank_path,
                     const core::MatchConfig& match_cfg,
                     core::MatchReport& out,
                     core::ReconError& err) {
    out = core::MatchReport{};

    std::string cfg_err;
    if (!core::validate_match_config(match_cfg, cfg_err)) {
        err = core::make_error(core::ReconErrorKind::ConfigError, core::Origin::Ledger, 0, cfg_err);
        return false;
    }

    std::vector<core::TxnRecord> ledger;
    std::vector<core::TxnRecord> bank;
    if (!ingest::read_transactions(ledger_path, core::Origin::Ledger, ledger, err)) {
        return false;
    }
    if (!ingest::read_transactions(bank_path, core::Origin::Bank, bank, err)) {
        return false;
    }

    core::Matcher matcher(match_cfg);
    return matcher.run(ledger, bank, out, err);
}

int run_reconciliation(const ReconRunConfig& cfg) {
    apply_verbosity(cfg);

    if (cfg.ledger_path.empty() || cfg.bank_path.empty()) {
        util::log(util::LogLevel::Error, "Both --ledger and --bank inputs are required");
        return kExitUsage;
    }
    if (cfg.output_path.empty()) {
        util::log(util::LogLevel::Error, "Empty output path");
        return kExitUsage;
    }

    LOG_SLOW_INFO("Reading ledger=%s bank=%s", cfg.ledger_path.string().c_str(), cfg.bank_path.string().c_str());

    core::MatchReport report;
    core::ReconError err;
    if (!reconcile_files(cfg.ledger_path, cfg.bank_path, cfg.match, report, err)) {
        LOG_SLOW_ERROR("%s", err.describe().c_str());
        std::cout << "ERROR: " << err.describe() << "\n";
        return err.kind == core::ReconErrorKind::ConfigError ? kExitUsage : kExitInput;
    }

    persist::ReportWriter writer;
    persist::ReportWriteStats write_stats;
    std::string write_err;
    if (!writer.write(cfg.output_path, report, write_stats, write_err)) {
        LOG_SLOW_ERROR("Report write failed: %s", write_err.c_str());
        return kExitWrite;
    }

    if (!cfg.verify_against.empty()) {
        persist::DiffStats diff_stats;
        std::string diff_report;
        const auto res = persist::diff_reports(cfg.verify_against, cfg.output_path, diff_stats, diff_report);
        if (res != persist::DiffResult::Match) {
            LOG_SLOW_ERROR("Verification against %s failed (%s):\n%s", cfg.verify_against.string().c_str(),
                           persist::diff_result_name(res), diff_report.c_str());
            return kExitVerify;
        }
        LOG_SLOW_INFO("Verified against %s (%zu lines)", cfg.verify_against.string().c_str(),
                      diff_stats.lines_compared);
    }

    const auto& c = report.counters;
    LOG_SLOW_INFO("Reconciled ledger=%llu bank=%llu exact=%llu fee=%llu unmatched_bank=%llu unmatched_ledger=%llu",
                  static_cast<unsigned long long>(c.ledger_records),
                  static_cast<unsigned long long>(c.bank_records),
                  static_cast<unsigned long long>(c.exact_matches),
                  static_cast<unsigned long long>(c.fee_matches),
                  static_cast<unsigned long long>(c.unmatched_bank),
                  static_cast<unsigned long long>(c.unmatched_ledger));

    std::cout << "SUCCESS: Report generated at " << cfg.output_path.string() << " with "
              << write_stats.rows_written << " rows.\n";
    return kExitOk;
}

} // namespace api
