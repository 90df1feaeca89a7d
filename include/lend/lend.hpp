#ifndef LEND_LEND_HPP
#define LEND_LEND_HPP

// =============================================================================
// lend - Collateralized Lending Core
//
//   InterestRateModel  utilization -> borrow/supply rate
//   Pool               per-asset supply/borrow ledger
//   Loan               single borrow position
//   CreditRecord       per-user credit report, scored by CreditScorer
//   RiskEngine         health factor, borrow gating, liquidation caps
//   LiquidationEngine  repay-and-seize execution
//   LendingProtocol    operations, queries, bad-loan scan
//
// =============================================================================

#include "types.hpp"
#include "interest.hpp"
#include "pool.hpp"
#include "loan.hpp"
#include "credit.hpp"
#include "risk.hpp"
#include "liquidation.hpp"
#include "feed.hpp"
#include "custody.hpp"
#include "listener.hpp"
#include "config.hpp"
#include "protocol.hpp"
#include "json.hpp"

#endif // LEND_LEND_HPP
