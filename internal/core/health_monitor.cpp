#include "health_monitor.hpp"

#include "internal/chain/address.hpp"
#include "internal/chain/units.hpp"
#include "internal/observability/logging.hpp"

namespace faucet::core {

HealthMonitor::HealthMonitor(std::shared_ptr<chain::ChainClient> chain,
                             std::optional<chain::Address>       funding_address,
                             chain::U256                         min_balance,
                             std::string                         credential_error)
    : chain_(std::move(chain)),
      funding_address_(funding_address),
      min_balance_(min_balance),
      credential_error_(std::move(credential_error)) {
}

HealthReport HealthMonitor::Check() const {
  HealthReport report;
  report.credential_valid = funding_address_.has_value();

  if (!funding_address_) {
    report.detail = "funding credential invalid: " + credential_error_;
    // Reachability is still worth reporting without an account to look at.
    try {
      chain_->GetChainId();
      report.chain_reachable = true;
    } catch (const chain::ChainError& e) {
      report.detail += "; chain unreachable: " + std::string(e.what());
    }
    return report;
  }

  report.funding_address = chain::ToChecksumAddress(*funding_address_);
  try {
    const auto balance             = chain_->GetBalance(*funding_address_);
    report.chain_reachable         = true;
    report.balance                 = balance;
    report.balance_above_threshold = balance >= min_balance_;
    if (!report.balance_above_threshold) {
      report.detail = "balance " + chain::FormatEther(balance) + " below minimum " + chain::FormatEther(min_balance_);
    }
  } catch (const chain::ChainError& e) {
    report.detail = std::string("chain unreachable: ") + e.what();
  }

  if (!report.healthy()) {
    FAUCET_LOG_WARN("health check failed", {observability::StringField("detail", report.detail)});
  }
  return report;
}

} // namespace faucet::core
