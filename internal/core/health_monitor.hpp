#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/chain/chain_client.hpp"

namespace faucet::core {

struct HealthReport {
  bool                       chain_reachable         = false;
  bool                       balance_above_threshold = false;
  bool                       credential_valid        = false;
  std::optional<chain::U256> balance;
  std::string                funding_address;
  std::size_t                queue_depth = 0;
  std::string                detail;

  bool healthy() const {
    return chain_reachable && balance_above_threshold && credential_valid;
  }
};

/*
  Live health check of the funding account. Each Check queries the chain, so the
  answer never depends on how busy the dispatch queue is.
*/
class HealthMonitor {
 public:
  // funding_address is empty when the credential could not be loaded.
  HealthMonitor(std::shared_ptr<chain::ChainClient> chain,
                std::optional<chain::Address>       funding_address,
                chain::U256                         min_balance,
                std::string                         credential_error = {});

  HealthReport Check() const;

 private:
  std::shared_ptr<chain::ChainClient> chain_;
  std::optional<chain::Address>       funding_address_;
  chain::U256                         min_balance_;
  std::string                         credential_error_;
};

} // namespace faucet::core
