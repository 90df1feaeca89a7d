// Lend Core - Credit Record and Scoring Tests

#include <catch2/catch_test_macros.hpp>
#include "support.hpp"

using namespace lend;
using lend::test::D;

namespace {

Loan open_loan(LoanId id, const char* principal) {
    Loan loan;
    loan.loan_id = id;
    loan.borrower_id = 1;
    loan.holder_id = 1;
    loan.principal_x18 = D(principal);
    loan.origination_balance_x18 = D(principal);
    return loan;
}

// Repays down to `remaining` and runs the scorer
uint32_t repay_to(const CreditScorer& scorer, CreditRecord& record, Loan& loan,
                  const char* remaining) {
    I128 interest = 0;
    I128 principal = 0;
    loan.apply_repayment(loan.debt_x18() - D(remaining), interest, principal);
    return scorer.on_repayment(record, loan);
}

} // namespace

TEST_CASE("CreditRecord collateral balances", "[credit]") {
    CreditRecord record(1, "alice", 100);
    record.add_collateral(2, D("100"));

    REQUIRE(record.lock_collateral(2, D("60")) == errors::OK);
    REQUIRE(record.posted_collateral(2) == D("100"));
    REQUIRE(record.locked(2) == D("60"));
    REQUIRE(record.free_collateral(2) == D("40"));

    SECTION("Cannot lock more than free") {
        REQUIRE(record.lock_collateral(2, D("41")) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(record.locked(2) == D("60"));
    }

    SECTION("Only free collateral can be removed") {
        REQUIRE(record.remove_collateral(2, D("41")) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(record.remove_collateral(2, D("40")) == errors::OK);
        REQUIRE(record.posted_collateral(2) == D("60"));
        REQUIRE(record.free_collateral(2) == 0);
    }

    SECTION("Seizure removes locked collateral outright") {
        record.seize_collateral(2, D("10"));
        REQUIRE(record.posted_collateral(2) == D("90"));
        REQUIRE(record.locked(2) == D("50"));
        REQUIRE(record.free_collateral(2) == D("40"));
    }

    SECTION("Unlock returns collateral to free") {
        record.unlock_collateral(2, D("60"));
        REQUIRE(record.locked(2) == 0);
        REQUIRE(record.free_collateral(2) == D("100"));
        REQUIRE(record.locked_collateral().count(2) == 0);
    }
}

TEST_CASE("CreditRecord deposits and loans", "[credit]") {
    CreditRecord record(7, "bob", 100);
    REQUIRE(record.user_id() == 7);
    REQUIRE(record.account() == "bob");
    REQUIRE(record.credit_score() == 0);

    record.add_deposit(1, D("500"));
    REQUIRE(record.remove_deposit(1, D("501")) == errors::INSUFFICIENT_BALANCE);
    REQUIRE(record.remove_deposit(1, D("500")) == errors::OK);
    REQUIRE(record.deposits().empty());

    record.open_loan(3);
    record.open_loan(4);
    record.close_loan(3);
    REQUIRE(record.loan_ids().count(3) == 0);
    REQUIRE(record.loan_ids().count(4) == 1);
    REQUIRE(record.closed_loan_ids().count(3) == 1);

    // Closing an unknown loan is a no-op
    record.close_loan(99);
    REQUIRE(record.closed_loan_ids().size() == 1);
}

TEST_CASE("CreditScorer awards tiers once per loan", "[credit]") {
    CreditScorer scorer;
    CreditRecord record(1, "alice", 100);
    Loan loan = open_loan(1, "1000");

    REQUIRE(repay_to(scorer, record, loan, "800") == 0);
    REQUIRE(record.credit_score() == 0);

    REQUIRE(repay_to(scorer, record, loan, "750") == 5);
    REQUIRE(record.credit_score() == 5);

    // Same tier again awards nothing
    REQUIRE(repay_to(scorer, record, loan, "740") == 0);

    // Crossing two tiers at once awards both
    REQUIRE(repay_to(scorer, record, loan, "200") == 10);
    REQUIRE(record.credit_score() == 15);

    REQUIRE(repay_to(scorer, record, loan, "0") == 5);
    REQUIRE(record.credit_score() == 20);
    REQUIRE(loan.credit_tiers_awarded == 0xF);

    REQUIRE(scorer.on_repayment(record, loan) == 0);
    REQUIRE(record.credit_score() == 20);

    SECTION("A new loan can score the same tiers again") {
        Loan next = open_loan(2, "100");
        REQUIRE(repay_to(scorer, record, next, "0") == 20);
        REQUIRE(record.credit_score() == 40);
    }
}

TEST_CASE("CreditScorer final tier requires zero debt", "[credit]") {
    CreditScorer scorer;
    CreditRecord record(1, "alice", 100);
    Loan loan = open_loan(1, "1000000");

    // Remaining fraction is negligible but debt is still outstanding
    REQUIRE(repay_to(scorer, record, loan, "0.000000000001") == 15);
    REQUIRE((loan.credit_tiers_awarded & 0x8) == 0);
}

TEST_CASE("CreditScorer respects the ceiling", "[credit]") {
    CreditScoreTable table;
    table.score_ceiling = 12;
    CreditScorer scorer(table);
    CreditRecord record(1, "alice", 100);

    Loan loan = open_loan(1, "1000");
    REQUIRE(repay_to(scorer, record, loan, "0") == 12);
    REQUIRE(record.credit_score() == 12);

    Loan next = open_loan(2, "1000");
    REQUIRE(repay_to(scorer, record, next, "0") == 0);
    REQUIRE(record.credit_score() == 12);
}

TEST_CASE("CreditScoreTable validation", "[credit]") {
    CreditScoreTable table;
    REQUIRE(table.validate());

    SECTION("Thresholds must be strictly descending") {
        table.tiers = {{X18_HALF, 5}, {X18_HALF, 5}};
        REQUIRE_FALSE(table.validate());
        table.tiers = {{X18_ONE / 4, 5}, {X18_HALF, 5}};
        REQUIRE_FALSE(table.validate());
    }

    SECTION("Thresholds must lie in [0, 1]") {
        table.tiers = {{D("1.5"), 5}};
        REQUIRE_FALSE(table.validate());
    }

    SECTION("At most 32 tiers") {
        table.tiers.clear();
        for (int i = 0; i < 33; ++i) {
            table.tiers.push_back({X18_ONE - i * (X18_ONE / 64), 1});
        }
        REQUIRE_FALSE(table.validate());
        table.tiers.pop_back();
        REQUIRE(table.validate());
    }
}
