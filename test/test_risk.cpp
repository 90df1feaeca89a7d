// Lend Core - Risk Engine Tests

#include <catch2/catch_test_macros.hpp>
#include "support.hpp"

using namespace lend;
using lend::test::D;

namespace {

Loan position(const char* collateral, const char* debt) {
    Loan loan;
    loan.loan_id = 1;
    loan.borrower_id = 1;
    loan.holder_id = 1;
    loan.collateral_amount_x18 = D(collateral);
    loan.principal_x18 = D(debt);
    loan.origination_balance_x18 = D(debt);
    return loan;
}

} // namespace

TEST_CASE("RiskEngine health factor", "[risk]") {
    RiskEngine engine;

    SECTION("Collateral value times threshold over debt value") {
        REQUIRE(RiskEngine::health_factor_x18(D("10000"), D("8000"), D("0.8")) == X18_ONE);
        REQUIRE(RiskEngine::health_factor_x18(D("500"), D("1000"), D("0.8")) == D("0.4"));
    }

    SECTION("Zero debt is infinitely healthy") {
        LoanRisk risk = engine.assess(position("100", "0"), X18_ONE, X18_ONE, 0);
        REQUIRE(risk.health_factor_x18 == X18_INFINITY);
        REQUIRE_FALSE(risk.liquidatable);
        REQUIRE(risk.max_liquidatable_x18 == 0);
    }

    SECTION("Prices scale both sides") {
        LoanRisk risk = engine.assess(position("2", "2000"), D("2000"), X18_ONE, 0);
        REQUIRE(risk.collateral_value_x18 == D("4000"));
        REQUIRE(risk.debt_value_x18 == D("2000"));
        REQUIRE(risk.health_factor_x18 == D("1.6"));
    }

    SECTION("Closed loans are never liquidatable") {
        Loan loan = position("100", "1000");
        loan.status = LoanStatus::CLOSED;
        REQUIRE_FALSE(engine.assess(loan, X18_ONE, X18_ONE, 0).liquidatable);
    }
}

TEST_CASE("RiskEngine boundary health is liquidatable", "[risk]") {
    RiskParams params;
    params.liquidation_threshold_x18 = D("0.9");
    params.max_loan_to_value_x18 = D("0.85");
    params.credit_discounts.clear();
    RiskEngine engine(params);

    LoanRisk risk = engine.assess(position("10000", "9000"), X18_ONE, X18_ONE, 0);
    REQUIRE(risk.health_factor_x18 == X18_ONE);
    REQUIRE(risk.liquidatable);
    REQUIRE(risk.max_liquidatable_x18 == D("4500"));
}

TEST_CASE("RiskEngine borrow gating", "[risk]") {
    RiskEngine engine;

    REQUIRE(engine.check_borrow(D("10000"), X18_ONE, D("7500"), X18_ONE, 0) == errors::OK);
    REQUIRE(engine.check_borrow(D("10000"), X18_ONE, D("7501"), X18_ONE, 0) == errors::EXCEEDS_MAX_BORROW);

    REQUIRE(engine.max_borrow_x18(D("10000"), X18_ONE, 0, X18_ONE, 0) == D("7500"));
    REQUIRE(engine.max_borrow_x18(D("10000"), X18_ONE, D("7500"), X18_ONE, 0) == 0);
    REQUIRE(engine.max_borrow_x18(D("10000"), X18_ONE, D("9000"), X18_ONE, 0) == 0);

    // 5 ETH at $2000 against USDC
    REQUIRE(engine.max_borrow_x18(D("5"), D("2000"), D("1000"), X18_ONE, 0) == D("6500"));
}

TEST_CASE("RiskEngine liquidation caps", "[risk]") {
    RiskEngine engine;
    const I128 debt = D("1000");

    REQUIRE(engine.max_liquidatable_x18(X18_ONE + 1, debt) == 0);
    REQUIRE(engine.max_liquidatable_x18(X18_ONE, debt) == D("500"));
    REQUIRE(engine.max_liquidatable_x18(D("0.9"), debt) == D("500"));
    REQUIRE(engine.max_liquidatable_x18(X18_HALF + 1, debt) == D("500"));
    REQUIRE(engine.max_liquidatable_x18(X18_HALF, debt) == debt);
    REQUIRE(engine.max_liquidatable_x18(D("0.4"), debt) == debt);

    LoanRisk risk = engine.assess(position("500", "1000"), X18_ONE, X18_ONE, 0);
    REQUIRE(risk.health_factor_x18 == D("0.4"));
    REQUIRE(risk.max_liquidatable_x18 == debt);
}

TEST_CASE("RiskEngine seizure amount", "[risk]") {
    RiskEngine engine;
    REQUIRE(engine.collateral_to_seize_x18(D("1000"), X18_ONE, X18_ONE) == D("1050"));
    REQUIRE(engine.collateral_to_seize_x18(D("1"), D("2000"), X18_ONE) == D("2100"));
    REQUIRE(engine.collateral_to_seize_x18(D("2100"), X18_ONE, D("2000")) == D("1.1025"));
}

TEST_CASE("RiskEngine credit discounts", "[risk]") {
    RiskEngine engine;

    SECTION("Threshold and LTV relax with score") {
        REQUIRE(engine.liquidation_threshold_x18(0) == D("0.8"));
        REQUIRE(engine.liquidation_threshold_x18(99) == D("0.8"));
        REQUIRE(engine.liquidation_threshold_x18(100) == D("0.85"));
        REQUIRE(engine.liquidation_threshold_x18(200) == D("0.9"));
        REQUIRE(engine.liquidation_threshold_x18(1000) == D("0.95"));
        REQUIRE(engine.max_loan_to_value_x18(200) == D("0.85"));
    }

    SECTION("Interest discount floors at zero") {
        REQUIRE(engine.loan_rate_x18(D("0.10"), 0) == D("0.10"));
        REQUIRE(engine.loan_rate_x18(D("0.10"), 200) == D("0.08"));
        REQUIRE(engine.loan_rate_x18(D("0.01"), 300) == 0);
    }

    SECTION("Higher score raises health of the same loan") {
        Loan loan = position("10000", "9000");
        LoanRisk plain = engine.assess(loan, X18_ONE, X18_ONE, 0);
        LoanRisk scored = engine.assess(loan, X18_ONE, X18_ONE, 200);
        REQUIRE(plain.liquidatable);
        REQUIRE(scored.liquidation_threshold_x18 - plain.liquidation_threshold_x18 == D("0.1"));
        REQUIRE(scored.health_factor_x18 == X18_ONE);
    }

    SECTION("LTV never exceeds the threshold") {
        RiskParams params;
        params.max_loan_to_value_x18 = D("0.8");
        params.credit_discounts = {{100, D("0.5"), 0}};
        params.liquidation_bonus_x18 = 0;
        RiskEngine capped(params);
        REQUIRE(capped.liquidation_threshold_x18(100) == X18_ONE);
        REQUIRE(capped.max_loan_to_value_x18(100) == X18_ONE);
    }
}

TEST_CASE("RiskParams validation", "[risk]") {
    RiskParams params;
    REQUIRE(params.validate());

    SECTION("Bonus that cannot improve health at the boundary") {
        params.liquidation_bonus_x18 = D("0.3");
        REQUIRE_FALSE(params.validate());
    }

    SECTION("Relaxed tiers are checked too") {
        params.credit_discounts = {{100, D("0.2"), 0}};
        REQUIRE_FALSE(params.validate());
    }

    SECTION("LTV above threshold") {
        params.max_loan_to_value_x18 = D("0.85");
        REQUIRE_FALSE(params.validate());
    }

    SECTION("Discount tiers must ascend by score") {
        params.credit_discounts = {{200, D("0.1"), 0}, {100, D("0.05"), 0}};
        REQUIRE_FALSE(params.validate());
    }

    SECTION("Close factor within (0, 1]") {
        params.close_factor_x18 = 0;
        REQUIRE_FALSE(params.validate());
    }
}
