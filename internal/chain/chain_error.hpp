#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace faucet::chain {

/*
  How a failed chain call must be handled by the submitter.

  kFeeTooLow      - underpriced; bump the fee and retry
  kNonceTooLow    - sequence already used on chain; reconcile and retry
  kNonceConflict  - sequence collides with another pending transaction or leaves a gap
  kAlreadyKnown   - the exact payload is already in the node's pool
  kUnavailable    - the request never reached the node; safe to retry as-is
  kTimeout        - the request was sent but no answer arrived; outcome ambiguous
  kRejected       - permanent rejection (insufficient funds, invalid transaction)
*/
enum class ChainErrorKind : uint8_t {
  kFeeTooLow     = 0,
  kNonceTooLow   = 1,
  kNonceConflict = 2,
  kAlreadyKnown  = 3,
  kUnavailable   = 4,
  kTimeout       = 5,
  kRejected      = 6,
};

const char* ToString(ChainErrorKind kind);

class ChainError : public std::runtime_error {
 public:
  ChainError(ChainErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ChainErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ChainErrorKind kind_;
};

// Maps a JSON-RPC error object from eth_sendRawTransaction to a kind.
ChainErrorKind ClassifyRpcError(int64_t code, std::string_view message);

} // namespace faucet::chain
