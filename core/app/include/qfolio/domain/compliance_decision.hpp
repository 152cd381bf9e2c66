#pragma once

#include "qfolio/domain/order.hpp"

#include <string>
#include <vector>

namespace qfolio {
namespace domain {

// -----------------------------------------------------------------------------
// ComplianceRule — anti-wash-trading rules, in evaluation order
// -----------------------------------------------------------------------------
// The numeric order of the enumerators is the order in which the
// WashComplianceEngine evaluates them; the first failing rule is the one
// reported as the block reason.
// -----------------------------------------------------------------------------
enum class ComplianceRule {
  None,
  MinHoldTime,
  MinNetProfit,
  AssetDailyTradeCap,
  GlobalDailyTradeCap,
  MinTradeValue,
  PostSellCooldown,
};

enum class ComplianceVerdict {
  Approve,
  Block,
};

// -----------------------------------------------------------------------------
// ComplianceDecision
// -----------------------------------------------------------------------------
//
// @brief  Verdict on one proposed trade. Ephemeral: produced per proposal,
//         audited, then discarded.
//
// @details
//   rule        — first failing rule (None when approved). Its reason code
//                 (complianceRuleCode) is what the audit trail keys on.
//   reason      — human-readable explanation including the numbers compared.
//   violations  — every failing rule in evaluation order. rule equals
//                 violations.front() when blocked.
// -----------------------------------------------------------------------------
struct ComplianceDecision {
  std::string asset;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  ComplianceVerdict verdict{ComplianceVerdict::Approve};
  ComplianceRule rule{ComplianceRule::None};
  std::string reason;
  std::vector<ComplianceRule> violations;

  bool approved() const { return verdict == ComplianceVerdict::Approve; }
};

// Stable, upper-case reason code for logs and audit records.
inline const char* complianceRuleCode(ComplianceRule rule) {
  switch (rule) {
    case ComplianceRule::None:                return "NONE";
    case ComplianceRule::MinHoldTime:         return "MIN_HOLD_TIME";
    case ComplianceRule::MinNetProfit:        return "MIN_NET_PROFIT";
    case ComplianceRule::AssetDailyTradeCap:  return "MAX_DAILY_TRADES_PER_ASSET";
    case ComplianceRule::GlobalDailyTradeCap: return "MAX_DAILY_TOTAL_TRADES";
    case ComplianceRule::MinTradeValue:       return "MIN_TRADE_VALUE";
    case ComplianceRule::PostSellCooldown:    return "COOLDOWN_AFTER_SELL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace qfolio
