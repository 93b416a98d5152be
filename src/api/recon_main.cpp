#include <filesystem>
#include <iostream>
#include <string>

#include "api/recon_run.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --ledger <csv> --bank <csv> [options]\n"
              << "Inputs must carry the columns std_date, std_desc, std_amt.\n"
              << "Options:\n"
              << "  --out <path>            Report output (default Reconciliation_Report.csv)\n"
              << "  --verify-against <csv>  Compare the report against a golden copy\n"
              << "  --no-fee-pass           Skip fee-adjusted matching\n"
              << "  --quiet                 Suppress non-error logs\n"
              << "  --verbose               Log every binding\n";
}

} // namespace

int main(int argc, char** argv) {
    api::ReconRunConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--ledger" && i + 1 < argc) {
            cfg.ledger_path = argv[++i];
        } else if (arg == "--bank" && i + 1 < argc) {
            cfg.bank_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            cfg.output_path = argv[++i];
        } else if (arg == "--verify-against" && i + 1 < argc) {
            cfg.verify_against = argv[++i];
        } else if (arg == "--no-fee-pass") {
            cfg.match.enable_fee_pass = false;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return api::kExitOk;
        } else {
            print_usage(argv[0]);
            return api::kExitUsage;
        }
    }

    if (cfg.ledger_path.empty() || cfg.bank_path.empty()) {
        print_usage(argv[0]);
        return api::kExitUsage;
    }

    return api::run_reconciliation(cfg);
}
