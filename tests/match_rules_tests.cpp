#include <gtest/gtest.h>

#include "core/match_rules.hpp"
#include "core/txn_record.hpp"

namespace {

core::TxnRecord ledger_at(std::int32_t day, core::Micros amount) {
    return core::make_ledger_record(0, core::CivilDate{day}, "l", amount);
}

core::TxnRecord bank_at(std::int32_t day, core::Micros amount) {
    return core::make_bank_record(0, core::CivilDate{day}, "b", amount);
}

const core::MatchConfig cfg = core::default_match_config();

TEST(MatchRulesTest, ExactToleranceIsInclusive) {
    EXPECT_TRUE(core::is_exact_candidate(ledger_at(0, 100'000'000), bank_at(0, 100'010'000), cfg));
    EXPECT_TRUE(core::is_exact_candidate(ledger_at(0, 100'010'000), bank_at(0, 100'000'000), cfg));
    EXPECT_FALSE(core::is_exact_candidate(ledger_at(0, 100'000'000), bank_at(0, 100'011'000), cfg));
}

TEST(MatchRulesTest, DateWindowIsInclusiveBothDirections) {
    EXPECT_TRUE(core::is_exact_candidate(ledger_at(10, 5'000'000), bank_at(15, 5'000'000), cfg));
    EXPECT_TRUE(core::is_exact_candidate(ledger_at(10, 5'000'000), bank_at(5, 5'000'000), cfg));
    EXPECT_FALSE(core::is_exact_candidate(ledger_at(10, 5'000'000), bank_at(16, 5'000'000), cfg));
    EXPECT_FALSE(core::is_exact_candidate(ledger_at(10, 5'000'000), bank_at(4, 5'000'000), cfg));
}

TEST(MatchRulesTest, ExactUsesUnsignedAmounts) {
    EXPECT_TRUE(core::is_exact_candidate(ledger_at(0, -75'000'000), bank_at(0, 75'000'000), cfg));
}

TEST(MatchRulesTest, FeeWindowBounds) {
    const auto ledger = ledger_at(0, 1'000'000'000);  // 1000.00
    EXPECT_FALSE(core::is_fee_candidate(ledger, bank_at(0, 960'000'000), cfg));  // exactly 96%
    EXPECT_TRUE(core::is_fee_candidate(ledger, bank_at(0, 960'100'000), cfg));   // 96.01%
    EXPECT_TRUE(core::is_fee_candidate(ledger, bank_at(0, 999'990'000), cfg));
    EXPECT_FALSE(core::is_fee_candidate(ledger, bank_at(0, 1'000'000'000), cfg)); // not strictly below
    EXPECT_FALSE(core::is_fee_candidate(ledger, bank_at(0, 950'000'000), cfg));
}

TEST(MatchRulesTest, FeeWindowIgnoresSigns) {
    EXPECT_TRUE(core::is_fee_candidate(ledger_at(0, 1'250'000'000), bank_at(0, -1'213'450'000), cfg));
}

TEST(MatchRulesTest, FeeFloorExactInIntegerArithmetic) {
    // floor is 96% of 1.23 = 1.1808 -> 1'180'800 micros
    EXPECT_FALSE(core::above_fee_floor(1'180'800, 1'230'000, 9'600));
    EXPECT_TRUE(core::above_fee_floor(1'180'801, 1'230'000, 9'600));
    // remainder path: ledger not a multiple of 10'000 micros
    EXPECT_FALSE(core::above_fee_floor(9'600, 10'001, 9'600));   // 9600.96 floor
    EXPECT_TRUE(core::above_fee_floor(9'601, 10'001, 9'600));
}

TEST(MatchRulesTest, FeeFloorHandlesLargeAmounts) {
    const core::Micros ledger = 9'000'000'000'000'000'000;  // 9e12 units
    EXPECT_FALSE(core::above_fee_floor(ledger / 100 * 96, ledger, 9'600));
    EXPECT_TRUE(core::above_fee_floor(ledger / 100 * 96 + 1, ledger, 9'600));
}

TEST(MatchRulesTest, CustomFeeFloor) {
    core::MatchConfig custom = cfg;
    custom.fee_floor_bp = 9'000;
    const auto ledger = ledger_at(0, 100'000'000);
    EXPECT_TRUE(core::is_fee_candidate(ledger, bank_at(0, 91'000'000), custom));
    EXPECT_FALSE(core::is_fee_candidate(ledger, bank_at(0, 91'000'000), cfg));
}

} // namespace
