#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "api/recon_run.hpp"
#include "persist/report_writer.hpp"

namespace {

std::filesystem::path make_temp_dir(const std::string& name) {
    auto base = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(base, ec);
    std::filesystem::create_directories(base);
    return base;
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

const std::string kLedgerCsv =
    "std_date,std_desc,std_amt\n"
    "2025-01-10,Invoice 500,500.00\n"
    "2025-01-11,Client retainer,1250.00\n"
    "2025-01-20,Outstanding cheque,-75.00\n";

const std::string kBankCsv =
    "std_date,std_desc,std_amt,bank_ref\n"
    "2025-01-12,DEP 500,500.00,r1\n"
    "2025-01-13,WIRE IN retainer,1213.45,r2\n"
    "2025-01-15,\"Service charge, Jan\",-12.00,r3\n";

const std::string kExpectedReport =
    std::string(persist::report_header) + "\n" +
    "Exact Match,2025-01-12,DEP 500,500.00,2025-01-10,Invoice 500,500.00,0.00\n"
    "Partial Match (Fee),2025-01-13,WIRE IN retainer,1213.45,2025-01-11,Client retainer,1250.00,-36.55\n"
    "Unmatched Bank,2025-01-15,\"Service charge, Jan\",-12.00,,,,\n"
    "Unmatched Ledger,,,,2025-01-20,Outstanding cheque,-75.00,\n";

api::ReconRunConfig base_config(const std::filesystem::path& dir) {
    api::ReconRunConfig cfg;
    cfg.ledger_path = dir / "ledger.csv";
    cfg.bank_path = dir / "bank.csv";
    cfg.output_path = dir / "out" / "Reconciliation_Report.csv";
    cfg.quiet = true;
    return cfg;
}

TEST(ReconRunIntegrationTest, WritesFullReport) {
    const auto dir = make_temp_dir("recon_run_full");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", kBankCsv);

    const auto cfg = base_config(dir);
    ASSERT_EQ(api::run_reconciliation(cfg), api::kExitOk);
    EXPECT_EQ(read_file(cfg.output_path), kExpectedReport);
}

TEST(ReconRunIntegrationTest, FeePassCanBeDisabled) {
    const auto dir = make_temp_dir("recon_run_no_fee");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", kBankCsv);

    auto cfg = base_config(dir);
    cfg.match.enable_fee_pass = false;
    ASSERT_EQ(api::run_reconciliation(cfg), api::kExitOk);

    const auto report = read_file(cfg.output_path);
    EXPECT_EQ(report.find("Partial Match (Fee)"), std::string::npos);
    EXPECT_NE(report.find("Unmatched Bank,2025-01-13,WIRE IN retainer,1213.45,,,,"), std::string::npos);
    EXPECT_NE(report.find("Unmatched Ledger,,,,2025-01-11,Client retainer,1250.00,"), std::string::npos);
}

TEST(ReconRunIntegrationTest, VerifiesAgainstGoldenCopy) {
    const auto dir = make_temp_dir("recon_run_verify");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", kBankCsv);
    write_file(dir / "golden.csv", kExpectedReport);

    auto cfg = base_config(dir);
    cfg.verify_against = dir / "golden.csv";
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitOk);

    write_file(dir / "golden.csv", std::string(persist::report_header) + "\n");
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitVerify);
}

TEST(ReconRunIntegrationTest, EmptyBankAbortsWithoutReport) {
    const auto dir = make_temp_dir("recon_run_empty");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", "std_date,std_desc,std_amt\n");

    const auto cfg = base_config(dir);
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitInput);
    EXPECT_FALSE(std::filesystem::exists(cfg.output_path));
}

TEST(ReconRunIntegrationTest, BadLedgerRowAbortsBeforeBankIsRead) {
    const auto dir = make_temp_dir("recon_run_bad_ledger");
    write_file(dir / "ledger.csv", "std_date,std_desc,std_amt\n2025-01-10,x,oops\n");

    core::MatchReport report;
    core::ReconError err;
    EXPECT_FALSE(api::reconcile_files(dir / "ledger.csv", dir / "missing_bank.csv", core::default_match_config(),
                                      report, err));
    EXPECT_EQ(err.kind, core::ReconErrorKind::SchemaError);
    EXPECT_EQ(err.side, core::Origin::Ledger);
    EXPECT_TRUE(report.outcomes.empty());

    const auto cfg = base_config(dir);
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitInput);
}

TEST(ReconRunIntegrationTest, MissingInputPathIsUsageError) {
    api::ReconRunConfig cfg;
    cfg.quiet = true;
    cfg.ledger_path = "ledger.csv";
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitUsage);
}

TEST(ReconRunIntegrationTest, BadMatchConfigIsUsageError) {
    const auto dir = make_temp_dir("recon_run_bad_config");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", kBankCsv);

    auto cfg = base_config(dir);
    cfg.match.fee_floor_bp = 10'001;
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitUsage);
    EXPECT_FALSE(std::filesystem::exists(cfg.output_path));

    core::MatchReport report;
    core::ReconError err;
    EXPECT_FALSE(api::reconcile_files(cfg.ledger_path, cfg.bank_path, cfg.match, report, err));
    EXPECT_EQ(err.kind, core::ReconErrorKind::ConfigError);
}

TEST(ReconRunIntegrationTest, FailedWriteKeepsPreviousReport) {
    const auto dir = make_temp_dir("recon_run_keep_previous");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", kBankCsv);

    auto cfg = base_config(dir);
    cfg.output_path = dir / "Reconciliation_Report.csv";
    ASSERT_EQ(api::run_reconciliation(cfg), api::kExitOk);

    // A directory squatting on the staging name makes the open fail.
    std::filesystem::create_directories(dir / "Reconciliation_Report.csv.tmp" / "blocker");
    write_file(dir / "bank.csv", "std_date,std_desc,std_amt\n2025-01-12,DEP 500,500.00\n");
    EXPECT_EQ(api::run_reconciliation(cfg), api::kExitWrite);
    EXPECT_EQ(read_file(cfg.output_path), kExpectedReport);
}

TEST(ReconRunIntegrationTest, ReconcileFilesFillsCounters) {
    const auto dir = make_temp_dir("recon_run_counters");
    write_file(dir / "ledger.csv", kLedgerCsv);
    write_file(dir / "bank.csv", kBankCsv);

    core::MatchReport report;
    core::ReconError err;
    ASSERT_TRUE(api::reconcile_files(dir / "ledger.csv", dir / "bank.csv", core::default_match_config(), report,
                                     err))
        << err.describe();
    EXPECT_EQ(report.counters.ledger_records, 3u);
    EXPECT_EQ(report.counters.bank_records, 3u);
    EXPECT_EQ(report.counters.exact_matches, 1u);
    EXPECT_EQ(report.counters.fee_matches, 1u);
    EXPECT_EQ(report.counters.unmatched_bank, 1u);
    EXPECT_EQ(report.counters.unmatched_ledger, 1u);
    EXPECT_EQ(report.outcomes.size(), 4u);
}

} // namespace
