#pragma once

#include <cstdint>

#include "internal/chain/chain_error.hpp"
#include "internal/chain/transaction.hpp"
#include "internal/chain/types.hpp"

namespace faucet::chain {

/*
  The faucet's view of the chain node.

  Every call blocks for at most the implementation's per-call timeout and
  reports failures as ChainError.
*/
class ChainClient {
 public:
  virtual ~ChainClient() = default;

  virtual uint64_t GetChainId() = 0;

  // Account sequence including transactions still in the node's pool.
  virtual uint64_t GetTransactionCount(const Address& account) = 0;

  virtual U256 GetBalance(const Address& account) = 0;

  virtual FeeQuote EstimateFees() = 0;

  // Returns the transaction hash accepted by the node.
  virtual Hash SubmitTransaction(const SignedTransaction& tx) = 0;

  virtual TxStatus GetTransactionStatus(const Hash& hash) = 0;
};

} // namespace faucet::chain
