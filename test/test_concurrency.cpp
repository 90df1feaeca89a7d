// Lend Core - Concurrent Operation Tests

#include <catch2/catch_test_macros.hpp>
#include "support.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace lend;
using namespace lend::test;

TEST_CASE("Concurrent deposits are all counted", "[concurrency]") {
    Harness h;
    constexpr int kThreads = 8;
    constexpr int kRounds = 50;

    std::vector<UserId> users;
    for (int i = 0; i < kThreads; ++i) {
        users.push_back(h.funded("user" + std::to_string(i), USDC, "5000"));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            for (int r = 0; r < kRounds; ++r) {
                if (h.p().deposit(users[i], USDC, D("100")) != errors::OK) ++failures;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(failures.load() == 0);
    REQUIRE(*h.p().get_total_supply(USDC) == D("40000"));
    for (UserId user : users) {
        REQUIRE(*h.p().get_deposit_balance(user, USDC) == D("5000"));
        REQUIRE(h.custody.balance_of(user, USDC) == 0);
    }
    REQUIRE(h.custody.balance_of(PROTOCOL_ACCOUNT, USDC) == D("40000"));
}

TEST_CASE("Cross-asset borrowers do not deadlock", "[concurrency]") {
    Harness h;
    UserId usdc_supplier = h.funded("usdc-supplier", USDC, "1000000");
    UserId xrd_supplier = h.funded("xrd-supplier", XRD, "1000000");
    REQUIRE(h.p().deposit(usdc_supplier, USDC, D("1000000")) == errors::OK);
    REQUIRE(h.p().deposit(xrd_supplier, XRD, D("1000000")) == errors::OK);

    // Half borrow USDC against XRD, half the reverse, so every pair of
    // operations touches the same two pools in opposite roles.
    constexpr int kThreads = 8;
    constexpr int kRounds = 40;
    std::vector<UserId> users;
    for (int i = 0; i < kThreads; ++i) {
        AssetId collateral = i % 2 == 0 ? XRD : USDC;
        UserId user = h.funded("borrower" + std::to_string(i), collateral, "100000");
        REQUIRE(h.p().deposit_collateral(user, collateral, D("100000")) == errors::OK);
        users.push_back(user);
    }

    std::atomic<int> failures{0};
    std::atomic<bool> running{true};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            AssetId collateral = i % 2 == 0 ? XRD : USDC;
            AssetId debt = i % 2 == 0 ? USDC : XRD;
            for (int r = 0; r < kRounds; ++r) {
                int64_t id = h.p().borrow(users[i], collateral, D("1000"), debt, D("500"));
                if (id <= 0) {
                    ++failures;
                    continue;
                }
                LoanId loan = static_cast<LoanId>(id);
                if (h.p().add_collateral(users[i], loan, D("10")) != errors::OK) ++failures;
                if (r % 2 == 0) {
                    if (h.p().repay(users[i], loan, D("500")).code != errors::OK) ++failures;
                }
            }
        });
    }

    // Reader sampling the pools while writers run
    std::atomic<int> violations{0};
    std::thread reader([&] {
        while (running) {
            for (AssetId asset : {USDC, XRD}) {
                auto pool = h.p().get_pool_state(asset);
                if (!pool || pool->total_borrowed_x18 > pool->total_supply_x18) ++violations;
            }
            for (LoanId loan : h.p().find_bad_loans()) {
                (void)loan;
                ++violations;
            }
        }
    });

    for (auto& t : threads) t.join();
    running = false;
    reader.join();

    REQUIRE(failures.load() == 0);
    REQUIRE(violations.load() == 0);

    // Half of every borrower's loans are still open at 500 each
    const I128 outstanding = D("500") * (kRounds / 2) * (kThreads / 2);
    REQUIRE(*h.p().get_total_borrowed(USDC) == outstanding);
    REQUIRE(*h.p().get_total_borrowed(XRD) == outstanding);

    ProtocolStats stats = h.p().get_stats();
    REQUIRE(stats.loans_opened == kThreads * kRounds);
    REQUIRE(stats.loans_closed == kThreads * kRounds / 2);

    for (int i = 0; i < kThreads; ++i) {
        auto record = h.p().get_credit_record(users[i]);
        REQUIRE(record->loan_ids().size() == kRounds / 2);
        REQUIRE(record->closed_loan_ids().size() == kRounds / 2);
    }
}

TEST_CASE("Competing liquidators never over-liquidate", "[concurrency]") {
    Harness h;
    UserId supplier = h.funded("supplier", USDC, "10000");
    UserId borrower = h.funded("borrower", XRD, "10000");
    REQUIRE(h.p().deposit(supplier, USDC, D("10000")) == errors::OK);
    REQUIRE(h.p().deposit_collateral(borrower, XRD, D("10000")) == errors::OK);
    int64_t id = h.p().borrow(borrower, XRD, D("10000"), USDC, D("7500"));
    REQUIRE(id > 0);
    const LoanId loan = static_cast<LoanId>(id);

    REQUIRE(h.feed.set_price(XRD, D("0.9"), h.now) == errors::OK);

    constexpr int kLiquidators = 6;
    std::vector<UserId> liquidators;
    for (int i = 0; i < kLiquidators; ++i) {
        liquidators.push_back(h.funded("liquidator" + std::to_string(i), USDC, "10000"));
    }

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kLiquidators; ++i) {
        threads.emplace_back([&, i] {
            LiquidationResult r = h.p().liquidate(loan, D("3750"), liquidators[i]);
            if (r.committed()) ++succeeded;
        });
    }
    for (auto& t : threads) t.join();

    // The first liquidation restores health; the rest find nothing to do
    REQUIRE(succeeded.load() == 1);
    REQUIRE(h.p().get_loan(loan)->debt_x18() == D("3750"));
    REQUIRE(h.p().get_stats().liquidations == 1);
}
